//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Name formatting for symbolic references.  These strings are the identity of
// a member everywhere in the engine: snapshot tables, diff keys, call graph
// edges, hook records and runtime symbol lookup all use them, so the format
// must stay stable.
//
//===----------------------------------------------------------------------===//

#include "il/core/References.hpp"

#include <array>

namespace hotswap::core
{

namespace
{
constexpr std::array<const char *, 9> kPrimitiveNames = {
    "void", "bool", "int32", "int64", "float32", "float64", "string", "object", "method"};

void appendTypeList(std::string &out, const std::vector<TypeRef> &types, bool scoped)
{
    for (size_t i = 0; i < types.size(); ++i)
    {
        if (i)
            out += ',';
        out += scoped ? types[i].scopedName() : types[i].fullName();
    }
}
} // namespace

bool isPrimitiveType(const std::string &name)
{
    for (const char *prim : kPrimitiveNames)
    {
        if (name == prim)
            return true;
    }
    return false;
}

std::string TypeRef::fullName() const
{
    std::string out = name;
    if (!args.empty())
    {
        out += '<';
        appendTypeList(out, args, false);
        out += '>';
    }
    return out;
}

std::string TypeRef::scopedName() const
{
    std::string out;
    if (!scope.empty())
        out += "[" + scope + "]";
    out += name;
    if (!args.empty())
    {
        out += '<';
        appendTypeList(out, args, true);
        out += '>';
    }
    return out;
}

std::string TypeRef::outermost() const
{
    const auto slash = name.find('/');
    return slash == std::string::npos ? name : name.substr(0, slash);
}

bool TypeRef::operator==(const TypeRef &other) const
{
    return scope == other.scope && name == other.name && args == other.args;
}

std::string formatMethodSignature(const TypeRef &ret,
                                  const std::string &declaringType,
                                  const std::string &name,
                                  const std::vector<std::string> &genericNames,
                                  const std::vector<TypeRef> &params)
{
    std::string out = ret.fullName();
    out += ' ';
    out += declaringType;
    out += "::";
    out += name;
    if (!genericNames.empty())
    {
        out += '<';
        for (size_t i = 0; i < genericNames.size(); ++i)
        {
            if (i)
                out += ',';
            out += genericNames[i];
        }
        out += '>';
    }
    out += '(';
    appendTypeList(out, params, false);
    out += ')';
    return out;
}

std::string formatSlotKey(const std::string &name, const std::vector<TypeRef> &params)
{
    std::string out = name;
    out += '(';
    appendTypeList(out, params, false);
    out += ')';
    return out;
}

std::string MethodRef::elementSignature() const
{
    return formatMethodSignature(
        returnType, declaringType.fullName(), name, genericParams, paramTypes);
}

std::string MethodRef::fullName() const
{
    if (genericArgs.empty())
        return elementSignature();
    std::vector<std::string> args;
    args.reserve(genericArgs.size());
    for (const auto &arg : genericArgs)
        args.push_back(arg.fullName());
    return formatMethodSignature(returnType, declaringType.fullName(), name, args, paramTypes);
}

std::string MethodRef::scopedName() const
{
    if (declaringType.scope.empty())
        return fullName();
    std::string out = "[" + declaringType.scope + "]";
    out += fullName();
    return out;
}

std::string MethodRef::slotKey() const
{
    return formatSlotKey(name, paramTypes);
}

std::string FieldRef::fullName() const
{
    return type.fullName() + " " + declaringType.fullName() + "::" + name;
}

std::string FieldRef::scopedName() const
{
    if (declaringType.scope.empty())
        return fullName();
    return "[" + declaringType.scope + "]" + fullName();
}

} // namespace hotswap::core
