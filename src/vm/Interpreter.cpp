//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// The interpreter loop.  One C++ stack frame per managed call; managed
// exceptions unwind as ManagedException and are matched against the
// method's handler table at the instruction that raised them.  Traps are not
// catchable by managed code.
//
//===----------------------------------------------------------------------===//

#include "vm/Object.hpp"
#include "vm/Runtime.hpp"
#include "vm/Trap.hpp"
#include "vm/VMConfig.hpp"

#include <cmath>
#include <limits>

namespace hotswap::vm
{

using hotswap::core::ExceptionHandler;
using hotswap::core::Instr;
using hotswap::core::MethodDef;
using hotswap::core::MethodRef;
using hotswap::core::Opcode;
using hotswap::core::TypeRef;

/// @brief Activation record of one managed call.
struct Frame
{
    RuntimeMethod *method;
    LoadedModule *module;
    std::vector<Value> &args;
    std::vector<Value> locals;
    std::vector<Value> stack;
    size_t pc = 0;

    Value pop()
    {
        if (stack.empty())
            raise(TrapKind::InvalidOperation, "evaluation stack underflow", method->signature);
        Value v = std::move(stack.back());
        stack.pop_back();
        return v;
    }

    void push(Value v)
    {
        stack.push_back(std::move(v));
    }

    std::vector<Value> popArgs(size_t n)
    {
        if (stack.size() < n)
            raise(TrapKind::InvalidOperation, "evaluation stack underflow", method->signature);
        std::vector<Value> out(std::make_move_iterator(stack.end() - static_cast<long>(n)),
                               std::make_move_iterator(stack.end()));
        stack.resize(stack.size() - n);
        return out;
    }
};

namespace
{

thread_local int tlsDepth = 0;

/// @brief Bounds managed recursion on the calling thread.
struct DepthGuard
{
    explicit DepthGuard(const RuntimeMethod *m)
    {
        if (++tlsDepth > HOTSWAP_VM_MAX_CALL_DEPTH)
        {
            --tlsDepth;
            raise(TrapKind::StackOverflow, "call depth exceeded", m->signature);
        }
    }

    ~DepthGuard()
    {
        --tlsDepth;
    }
};

bool isInt(const Value &v)
{
    return v.kind == ValueKind::I32 || v.kind == ValueKind::I64;
}

bool isNumeric(const Value &v)
{
    return isInt(v) || v.kind == ValueKind::F32 || v.kind == ValueKind::F64;
}

Value arithmetic(Opcode op, const Value &a, const Value &b, const std::string &where)
{
    if (op == Opcode::Add && (a.kind == ValueKind::Str || b.kind == ValueKind::Str))
        return Value::string(a.toString() + b.toString());

    if (isInt(a) && isInt(b))
    {
        const bool wide = a.kind == ValueKind::I64 || b.kind == ValueKind::I64;
        const int64_t x = a.i;
        const int64_t y = b.i;
        int64_t r = 0;
        switch (op)
        {
            case Opcode::Add:
                r = static_cast<int64_t>(static_cast<uint64_t>(x) + static_cast<uint64_t>(y));
                break;
            case Opcode::Sub:
                r = static_cast<int64_t>(static_cast<uint64_t>(x) - static_cast<uint64_t>(y));
                break;
            case Opcode::Mul:
                r = static_cast<int64_t>(static_cast<uint64_t>(x) * static_cast<uint64_t>(y));
                break;
            case Opcode::Div:
                if (y == 0)
                    raise(TrapKind::DivideByZero, "integer division by zero", where);
                r = y == -1 ? static_cast<int64_t>(0 - static_cast<uint64_t>(x)) : x / y;
                break;
            case Opcode::Rem:
                if (y == 0)
                    raise(TrapKind::DivideByZero, "integer remainder by zero", where);
                r = y == -1 ? 0 : x % y;
                break;
            case Opcode::And:
                r = x & y;
                break;
            case Opcode::Or:
                r = x | y;
                break;
            default:
                break;
        }
        if (wide)
            return Value::i64(r);
        return Value::i32(static_cast<int32_t>(static_cast<uint32_t>(static_cast<uint64_t>(r))));
    }

    if (isNumeric(a) && isNumeric(b) && op != Opcode::And && op != Opcode::Or)
    {
        const bool single = (a.kind == ValueKind::F32 || b.kind == ValueKind::F32) &&
                            a.kind != ValueKind::F64 && b.kind != ValueKind::F64;
        const double x = a.asDouble();
        const double y = b.asDouble();
        double r = 0.0;
        switch (op)
        {
            case Opcode::Add:
                r = x + y;
                break;
            case Opcode::Sub:
                r = x - y;
                break;
            case Opcode::Mul:
                r = x * y;
                break;
            case Opcode::Div:
                r = x / y;
                break;
            case Opcode::Rem:
                r = std::fmod(x, y);
                break;
            default:
                break;
        }
        if (single)
            return Value::float32(static_cast<float>(r));
        return Value::float64(r);
    }
    raise(TrapKind::InvalidCast,
          "operands of '" + std::string(hotswap::core::toString(op)) + "' have incompatible kinds",
          where);
}

Value compare(Opcode op, const Value &a, const Value &b, const std::string &where)
{
    if (op == Opcode::Ceq)
        return Value::i32(a.equals(b) ? 1 : 0);
    int order = 0;
    if (isInt(a) && isInt(b))
        order = a.i < b.i ? -1 : (a.i > b.i ? 1 : 0);
    else if (isNumeric(a) && isNumeric(b))
        order = a.asDouble() < b.asDouble() ? -1 : (a.asDouble() > b.asDouble() ? 1 : 0);
    else if (a.kind == ValueKind::Str && b.kind == ValueKind::Str)
        order = a.str->compare(*b.str) < 0 ? -1 : (a.str->compare(*b.str) > 0 ? 1 : 0);
    else
        raise(TrapKind::InvalidCast,
              "operands of '" + std::string(hotswap::core::toString(op)) + "' are not ordered",
              where);
    return Value::i32((op == Opcode::Cgt ? order > 0 : order < 0) ? 1 : 0);
}

int64_t toInteger(const Value &v, double lo, double hi, const std::string &where)
{
    if (isInt(v))
        return v.i;
    if (!isNumeric(v))
        raise(TrapKind::InvalidCast, "conversion of non-numeric value", where);
    const double d = v.asDouble();
    if (!std::isfinite(d) || d < lo || d > hi)
        raise(TrapKind::InvalidCast, "floating value out of integer range", where);
    return static_cast<int64_t>(d);
}

Value convert(Opcode op, const Value &v, const std::string &where)
{
    switch (op)
    {
        case Opcode::ConvI4:
            return Value::i32(static_cast<int32_t>(static_cast<uint32_t>(
                toInteger(v, std::numeric_limits<int32_t>::min(),
                          std::numeric_limits<int32_t>::max(), where))));
        case Opcode::ConvI8:
            return Value::i64(toInteger(v, -9.2233720368547758e18, 9.2233720368547748e18, where));
        case Opcode::ConvR4:
            if (!isNumeric(v))
                raise(TrapKind::InvalidCast, "conversion of non-numeric value", where);
            return Value::float32(static_cast<float>(v.asDouble()));
        default:
            if (!isNumeric(v))
                raise(TrapKind::InvalidCast, "conversion of non-numeric value", where);
            return Value::float64(v.asDouble());
    }
}

/// @brief Runtime type test used by isinst, castclass and catch clauses.
bool matchesType(const Value &v, const TypeRef &t)
{
    const std::string &n = t.name;
    if (n == "object")
        return !v.isNull();
    if (n == "int32" || n == "bool")
        return v.kind == ValueKind::I32;
    if (n == "int64")
        return v.kind == ValueKind::I64;
    if (n == "float32")
        return v.kind == ValueKind::F32;
    if (n == "float64")
        return v.kind == ValueKind::F64;
    if (n == "string")
        return v.kind == ValueKind::Str;
    if (n == "method")
        return v.kind == ValueKind::Method;
    return v.kind == ValueKind::Obj && v.obj->type->isAssignableTo(n);
}

const ExceptionHandler *findHandler(const MethodDef &def, size_t pc, const Value &ex)
{
    for (const auto &h : def.handlers)
    {
        if (pc >= h.tryStart && pc < h.tryEnd && matchesType(ex, h.catchType))
            return &h;
    }
    return nullptr;
}

Object &requireObject(const Value &v, const std::string &what, const std::string &where)
{
    if (v.kind != ValueKind::Obj)
        raise(TrapKind::NullReference, what + " on a null or non-object value", where);
    return *v.obj;
}

Value *requireSlot(std::vector<Value> &slots, int64_t index, const char *what, const std::string &where)
{
    if (index < 0 || static_cast<size_t>(index) >= slots.size())
        raise(TrapKind::InvalidOperation, std::string(what) + " index out of range", where);
    return &slots[static_cast<size_t>(index)];
}

} // namespace

Value Runtime::execute(RuntimeMethod *m, std::vector<Value> &args)
{
    DepthGuard depth(m);
    const MethodDef &def = *m->def;
    const std::string &where = m->signature;
    Frame fr{m, m->owner->module, args, {}, {}, 0};
    fr.locals.reserve(def.locals.size());
    for (const auto &t : def.locals)
        fr.locals.push_back(defaultValueFor(t.name));

    const auto &body = def.body;
    while (fr.pc < body.size())
    {
        const Instr &in = body[fr.pc];
        size_t next = fr.pc + 1;
        HOTSWAP_VM_DISPATCH_BEFORE(fr, in);
        try
        {
            switch (in.op)
            {
                case Opcode::Nop:
                    break;
                case Opcode::LdcI4:
                    fr.push(Value::i32(static_cast<int32_t>(in.operand.i64)));
                    break;
                case Opcode::LdcI8:
                    fr.push(Value::i64(in.operand.i64));
                    break;
                case Opcode::LdcR4:
                    fr.push(Value::float32(in.operand.f32));
                    break;
                case Opcode::LdcR8:
                    fr.push(Value::float64(in.operand.f64));
                    break;
                case Opcode::Ldstr:
                    fr.push(Value::string(in.operand.str));
                    break;
                case Opcode::Ldnull:
                    fr.push(Value::null());
                    break;
                case Opcode::Ldarg:
                    fr.push(*requireSlot(fr.args, in.operand.i64, "argument", where));
                    break;
                case Opcode::Starg:
                    *requireSlot(fr.args, in.operand.i64, "argument", where) = fr.pop();
                    break;
                case Opcode::Ldloc:
                    fr.push(*requireSlot(fr.locals, in.operand.i64, "local", where));
                    break;
                case Opcode::Stloc:
                    *requireSlot(fr.locals, in.operand.i64, "local", where) = fr.pop();
                    break;
                case Opcode::Ldloca:
                    fr.push(Value::reference(requireSlot(fr.locals, in.operand.i64, "local", where)));
                    break;
                case Opcode::Dup:
                {
                    Value v = fr.pop();
                    fr.push(v);
                    fr.push(std::move(v));
                    break;
                }
                case Opcode::Pop:
                    fr.pop();
                    break;
                case Opcode::Add:
                case Opcode::Sub:
                case Opcode::Mul:
                case Opcode::Div:
                case Opcode::Rem:
                case Opcode::And:
                case Opcode::Or:
                {
                    Value b = fr.pop();
                    Value a = fr.pop();
                    fr.push(arithmetic(in.op, a, b, where));
                    break;
                }
                case Opcode::Neg:
                {
                    Value a = fr.pop();
                    if (a.kind == ValueKind::F32)
                        fr.push(Value::float32(-a.f32));
                    else if (a.kind == ValueKind::F64)
                        fr.push(Value::float64(-a.f64));
                    else
                        fr.push(arithmetic(Opcode::Sub,
                                           a.kind == ValueKind::I64 ? Value::i64(0) : Value::i32(0),
                                           a, where));
                    break;
                }
                case Opcode::Ceq:
                case Opcode::Cgt:
                case Opcode::Clt:
                {
                    Value b = fr.pop();
                    Value a = fr.pop();
                    fr.push(compare(in.op, a, b, where));
                    break;
                }
                case Opcode::ConvI4:
                case Opcode::ConvI8:
                case Opcode::ConvR4:
                case Opcode::ConvR8:
                    fr.push(convert(in.op, fr.pop(), where));
                    break;
                case Opcode::Br:
                    next = static_cast<size_t>(in.operand.i64);
                    break;
                case Opcode::Brtrue:
                    if (fr.pop().truthy())
                        next = static_cast<size_t>(in.operand.i64);
                    break;
                case Opcode::Brfalse:
                    if (!fr.pop().truthy())
                        next = static_cast<size_t>(in.operand.i64);
                    break;
                case Opcode::Leave:
                    fr.stack.clear();
                    next = static_cast<size_t>(in.operand.i64);
                    break;
                case Opcode::Switch:
                {
                    const Value sel = fr.pop();
                    if (isInt(sel) && sel.i >= 0 &&
                        static_cast<size_t>(sel.i) < in.operand.targets.size())
                        next = in.operand.targets[static_cast<size_t>(sel.i)];
                    break;
                }
                case Opcode::Call:
                case Opcode::Callvirt:
                {
                    const MethodRef &ref = *in.operand.method;
                    RuntimeMethod *target = resolveMethod(in, *fr.module);
                    checkAccess(m, target->owner, target->visibility, target->signature);
                    auto callArgs = fr.popArgs(ref.paramTypes.size() + (ref.hasThis ? 1 : 0));
                    if (in.op == Opcode::Callvirt && ref.hasThis)
                    {
                        const Value &recv = callArgs.front();
                        if (recv.isNull())
                            raise(TrapKind::NullReference,
                                  "callvirt of " + ref.fullName() + " on null", where);
                        if (recv.kind == ValueKind::Obj)
                        {
                            if (RuntimeMethod *o = recv.obj->type->findSlot(ref.slotKey()))
                                target = o;
                        }
                    }
                    Value result = call(target, callArgs, ref);
                    if (!ref.returnType.isVoid())
                        fr.push(std::move(result));
                    break;
                }
                case Opcode::Newobj:
                {
                    const MethodRef &ref = *in.operand.method;
                    RuntimeMethod *ctor = resolveMethod(in, *fr.module);
                    checkAccess(m, ctor->owner, ctor->visibility, ctor->signature);
                    auto callArgs = fr.popArgs(ref.paramTypes.size());
                    auto obj = std::make_shared<Object>(ctor->owner);
                    callArgs.insert(callArgs.begin(), Value::object(obj));
                    call(ctor, callArgs, ref);
                    fr.push(Value::object(std::move(obj)));
                    break;
                }
                case Opcode::Ldftn:
                {
                    RuntimeMethod *target = resolveMethod(in, *fr.module);
                    checkAccess(m, target->owner, target->visibility, target->signature);
                    fr.push(Value::handle(target));
                    break;
                }
                case Opcode::Ret:
                    if (def.returnType.isVoid())
                        return Value::null();
                    return fr.pop();
                case Opcode::Ldfld:
                case Opcode::Stfld:
                case Opcode::Ldflda:
                {
                    const FieldBinding fb = resolveField(in, *fr.module);
                    checkAccess(m, fb.owner, fb.visibility, in.operand.field->fullName());
                    Value v;
                    if (in.op == Opcode::Stfld)
                        v = fr.pop();
                    Value self = fr.pop();
                    Object &o = requireObject(self, "access to " + in.operand.field->name, where);
                    if (fb.index >= o.fields.size())
                        raise(TrapKind::InvalidCast,
                              "instance of '" + o.type->name + "' has no field " +
                                  in.operand.field->fullName(),
                              where);
                    if (in.op == Opcode::Ldfld)
                        fr.push(o.fields[fb.index]);
                    else if (in.op == Opcode::Stfld)
                        o.fields[fb.index] = std::move(v);
                    else
                        fr.push(Value::reference(&o.fields[fb.index], self.obj));
                    break;
                }
                case Opcode::Ldsfld:
                case Opcode::Stsfld:
                case Opcode::Ldsflda:
                {
                    const FieldBinding fb = resolveField(in, *fr.module);
                    checkAccess(m, fb.owner, fb.visibility, in.operand.field->fullName());
                    Value &slot = fb.owner->statics[fb.index];
                    if (in.op == Opcode::Ldsfld)
                        fr.push(slot);
                    else if (in.op == Opcode::Stsfld)
                        slot = fr.pop();
                    else
                        fr.push(Value::reference(&slot));
                    break;
                }
                case Opcode::Ldind:
                {
                    Value r = fr.pop();
                    if (r.kind != ValueKind::Ref || !r.ref)
                        raise(TrapKind::NullReference, "ldind through a non-reference", where);
                    fr.push(*r.ref);
                    break;
                }
                case Opcode::Stind:
                {
                    Value v = fr.pop();
                    Value r = fr.pop();
                    if (r.kind != ValueKind::Ref || !r.ref)
                        raise(TrapKind::NullReference, "stind through a non-reference", where);
                    *r.ref = std::move(v);
                    break;
                }
                case Opcode::Isinst:
                {
                    Value v = fr.pop();
                    fr.push(matchesType(v, *in.operand.type) ? std::move(v) : Value::null());
                    break;
                }
                case Opcode::Castclass:
                {
                    Value v = fr.pop();
                    if (!v.isNull() && !matchesType(v, *in.operand.type))
                        raise(TrapKind::InvalidCast,
                              "cannot cast " + v.toString() + " to " + in.operand.type->fullName(),
                              where);
                    fr.push(std::move(v));
                    break;
                }
                case Opcode::Box:
                case Opcode::Unbox:
                    break;
                case Opcode::Throw:
                {
                    Value v = fr.pop();
                    if (v.isNull())
                        raise(TrapKind::NullReference, "throw of null", where);
                    throw ManagedException{std::move(v)};
                }
                case Opcode::Count:
                    raise(TrapKind::InvalidOperation, "invalid opcode", where);
            }
        }
        catch (const ManagedException &ex)
        {
            const ExceptionHandler *h = findHandler(def, fr.pc, ex.value);
            if (!h)
                throw;
            fr.stack.clear();
            fr.push(ex.value);
            next = h->handlerStart;
        }
        fr.pc = next;
    }
    raise(TrapKind::InvalidOperation, "execution ran past the end of the method", where);
}

} // namespace hotswap::vm
