//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Constructors, conversions and formatting for runtime values.
//
//===----------------------------------------------------------------------===//

#include "vm/Value.hpp"
#include "vm/Object.hpp"
#include "vm/RuntimeTypes.hpp"

#include <cstdio>

namespace hotswap::vm
{

Value Value::i32(int32_t v)
{
    Value out;
    out.kind = ValueKind::I32;
    out.i = v;
    return out;
}

Value Value::i64(int64_t v)
{
    Value out;
    out.kind = ValueKind::I64;
    out.i = v;
    return out;
}

Value Value::float32(float v)
{
    Value out;
    out.kind = ValueKind::F32;
    out.f32 = v;
    return out;
}

Value Value::float64(double v)
{
    Value out;
    out.kind = ValueKind::F64;
    out.f64 = v;
    return out;
}

Value Value::string(std::string s)
{
    Value out;
    out.kind = ValueKind::Str;
    out.str = std::make_shared<const std::string>(std::move(s));
    return out;
}

Value Value::object(std::shared_ptr<Object> o)
{
    if (!o)
        return null();
    Value out;
    out.kind = ValueKind::Obj;
    out.obj = std::move(o);
    return out;
}

Value Value::handle(RuntimeMethod *m)
{
    if (!m)
        return null();
    Value out;
    out.kind = ValueKind::Method;
    out.method = m;
    return out;
}

Value Value::reference(Value *target, std::shared_ptr<void> owner)
{
    Value out;
    out.kind = ValueKind::Ref;
    out.ref = target;
    out.refOwner = std::move(owner);
    return out;
}

bool Value::truthy() const
{
    switch (kind)
    {
        case ValueKind::Null:
            return false;
        case ValueKind::I32:
        case ValueKind::I64:
            return i != 0;
        case ValueKind::F32:
            return f32 != 0.0f;
        case ValueKind::F64:
            return f64 != 0.0;
        default:
            return true;
    }
}

int64_t Value::asInt() const
{
    switch (kind)
    {
        case ValueKind::F32:
            return static_cast<int64_t>(f32);
        case ValueKind::F64:
            return static_cast<int64_t>(f64);
        default:
            return i;
    }
}

double Value::asDouble() const
{
    switch (kind)
    {
        case ValueKind::F32:
            return f32;
        case ValueKind::F64:
            return f64;
        default:
            return static_cast<double>(i);
    }
}

std::string Value::toString() const
{
    char buf[64];
    switch (kind)
    {
        case ValueKind::Null:
            return "null";
        case ValueKind::I32:
        case ValueKind::I64:
            return std::to_string(i);
        case ValueKind::F32:
            std::snprintf(buf, sizeof(buf), "%g", static_cast<double>(f32));
            return buf;
        case ValueKind::F64:
            std::snprintf(buf, sizeof(buf), "%g", f64);
            return buf;
        case ValueKind::Str:
            return *str;
        case ValueKind::Obj:
            return obj->type ? obj->type->name : "object";
        case ValueKind::Method:
            return method->signature;
        case ValueKind::Ref:
            return ref ? ref->toString() : "null";
    }
    return {};
}

bool Value::equals(const Value &other) const
{
    const bool lhsNum = kind == ValueKind::I32 || kind == ValueKind::I64 ||
                        kind == ValueKind::F32 || kind == ValueKind::F64;
    const bool rhsNum = other.kind == ValueKind::I32 || other.kind == ValueKind::I64 ||
                        other.kind == ValueKind::F32 || other.kind == ValueKind::F64;
    if (lhsNum && rhsNum)
    {
        if ((kind == ValueKind::I32 || kind == ValueKind::I64) &&
            (other.kind == ValueKind::I32 || other.kind == ValueKind::I64))
            return i == other.i;
        return asDouble() == other.asDouble();
    }
    if (kind != other.kind)
        return false;
    switch (kind)
    {
        case ValueKind::Null:
            return true;
        case ValueKind::Str:
            return *str == *other.str;
        case ValueKind::Obj:
            return obj == other.obj;
        case ValueKind::Method:
            return method == other.method;
        case ValueKind::Ref:
            return ref == other.ref;
        default:
            return false;
    }
}

Value defaultValueFor(const std::string &typeName)
{
    if (typeName == "int32" || typeName == "bool")
        return Value::i32(0);
    if (typeName == "int64")
        return Value::i64(0);
    if (typeName == "float32")
        return Value::float32(0.0f);
    if (typeName == "float64")
        return Value::float64(0.0);
    return Value::null();
}

} // namespace hotswap::vm
