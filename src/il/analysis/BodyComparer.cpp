//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements structural body equality.  Recursion into compiler-generated
// callees is guarded by the set of method pairs currently being compared, so
// mutually recursive closures terminate; a pair met again while in progress
// is assumed equal and the outer comparison decides.
//
//===----------------------------------------------------------------------===//

#include "il/analysis/BodyComparer.hpp"

#include <cmath>

namespace hotswap::analysis
{

using hotswap::core::Instr;
using hotswap::core::MethodDef;
using hotswap::core::MethodRef;
using hotswap::core::Module;
using hotswap::core::OperandKind;
using hotswap::core::TypeDef;
using hotswap::core::TypeRef;

const TypeDef *localType(const Module &module, const TypeRef &ref)
{
    if (!ref.scope.empty() && ref.scope != module.name)
        return nullptr;
    return module.findType(ref.name);
}

bool BodyComparer::equal(const MethodDef &a, const MethodDef &b)
{
    if (a.locals.size() != b.locals.size() || a.handlers.size() != b.handlers.size() ||
        a.body.size() != b.body.size())
        return false;

    // Handler bounds are instruction offsets, like branch targets.
    for (size_t i = 0; i < a.handlers.size(); ++i)
    {
        if (a.handlers[i].catchType.scopedName() != b.handlers[i].catchType.scopedName())
            return false;
    }
    for (size_t i = 0; i < a.locals.size(); ++i)
    {
        if (a.locals[i].scopedName() != b.locals[i].scopedName())
            return false;
    }

    const auto key = std::make_pair(&a, &b);
    if (!inProgress_.insert(key).second)
        return true;

    bool same = true;
    for (size_t i = 0; i < a.body.size() && same; ++i)
    {
        same = a.body[i].op == b.body[i].op && equalOperands(a.body[i], b.body[i]);
    }
    inProgress_.erase(key);
    return same;
}

bool BodyComparer::equalOperands(const Instr &a, const Instr &b)
{
    const auto &x = a.operand;
    const auto &y = b.operand;
    if (x.kind != y.kind)
        return false;
    switch (x.kind)
    {
        case OperandKind::None:
        case OperandKind::Target:
            return true;
        case OperandKind::Targets:
            return x.targets.size() == y.targets.size();
        case OperandKind::Int32:
        case OperandKind::Int64:
        case OperandKind::Index:
            return x.i64 == y.i64;
        case OperandKind::Float32:
            return x.f32 == y.f32 || (std::isnan(x.f32) && std::isnan(y.f32));
        case OperandKind::Float64:
            return x.f64 == y.f64 || (std::isnan(x.f64) && std::isnan(y.f64));
        case OperandKind::String:
            return x.str == y.str;
        case OperandKind::Type:
            return x.type->scopedName() == y.type->scopedName();
        case OperandKind::Field:
            return x.field->scopedName() == y.field->scopedName();
        case OperandKind::Method:
            return equalMethodRefs(*x.method, *y.method);
    }
    return false;
}

bool BodyComparer::equalMethodRefs(const MethodRef &a, const MethodRef &b)
{
    if (a.hasThis != b.hasThis || a.scopedName() != b.scopedName())
        return false;
    for (size_t i = 0; i < a.genericArgs.size(); ++i)
    {
        if (!equalStateMachines(a.genericArgs[i], b.genericArgs[i]))
            return false;
    }
    return equalGeneratedCallees(a, b);
}

bool BodyComparer::equalGeneratedCallees(const MethodRef &a, const MethodRef &b)
{
    const TypeDef *ta = localType(old_, a.declaringType);
    const TypeDef *tb = localType(new_, b.declaringType);
    if (!ta || !tb || !ta->compilerGenerated || !tb->compilerGenerated)
        return true;
    const MethodDef *ma = ta->findMethod(a.elementSignature());
    const MethodDef *mb = tb->findMethod(b.elementSignature());
    if (!ma || !mb)
        return ma == mb;
    return equal(*ma, *mb);
}

bool BodyComparer::equalStateMachines(const TypeRef &a, const TypeRef &b)
{
    const TypeDef *ta = localType(old_, a);
    const TypeDef *tb = localType(new_, b);
    if (!ta || !tb || !ta->isStateMachine() || !tb->isStateMachine())
        return true;
    const MethodDef *stepA = ta->findMethodByName(hotswap::core::kStateMachineStep);
    const MethodDef *stepB = tb->findMethodByName(hotswap::core::kStateMachineStep);
    if (!stepA || !stepB)
        return stepA == stepB;
    return equal(*stepA, *stepB);
}

} // namespace hotswap::analysis
