//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Operand factory helpers.  Each factory engages exactly the payload member
// that matches its kind and leaves the rest value-initialized.
//
//===----------------------------------------------------------------------===//

#include "il/core/Instr.hpp"

namespace hotswap::core
{

Operand Operand::none()
{
    return Operand{};
}

Operand Operand::int32(int32_t v)
{
    Operand o;
    o.kind = OperandKind::Int32;
    o.i64 = v;
    return o;
}

Operand Operand::int64(int64_t v)
{
    Operand o;
    o.kind = OperandKind::Int64;
    o.i64 = v;
    return o;
}

Operand Operand::float32(float v)
{
    Operand o;
    o.kind = OperandKind::Float32;
    o.f32 = v;
    return o;
}

Operand Operand::float64(double v)
{
    Operand o;
    o.kind = OperandKind::Float64;
    o.f64 = v;
    return o;
}

Operand Operand::string(std::string s)
{
    Operand o;
    o.kind = OperandKind::String;
    o.str = std::move(s);
    return o;
}

Operand Operand::typeRef(TypeRef t)
{
    Operand o;
    o.kind = OperandKind::Type;
    o.type = std::make_shared<const TypeRef>(std::move(t));
    return o;
}

Operand Operand::methodRef(MethodRef m)
{
    Operand o;
    o.kind = OperandKind::Method;
    o.method = std::make_shared<const MethodRef>(std::move(m));
    return o;
}

Operand Operand::fieldRef(FieldRef f)
{
    Operand o;
    o.kind = OperandKind::Field;
    o.field = std::make_shared<const FieldRef>(std::move(f));
    return o;
}

Operand Operand::target(uint32_t index)
{
    Operand o;
    o.kind = OperandKind::Target;
    o.i64 = index;
    return o;
}

Operand Operand::targetList(std::vector<uint32_t> indices)
{
    Operand o;
    o.kind = OperandKind::Targets;
    o.targets = std::move(indices);
    return o;
}

Operand Operand::index(uint32_t slot)
{
    Operand o;
    o.kind = OperandKind::Index;
    o.i64 = slot;
    return o;
}

} // namespace hotswap::core
