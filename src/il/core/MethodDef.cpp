//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Method definition helpers: classification predicates used by the diff
// engine and signature formatting shared with MethodRef.
//
//===----------------------------------------------------------------------===//

#include "il/core/MethodDef.hpp"

namespace hotswap::core
{

std::string_view toString(Visibility v)
{
    switch (v)
    {
        case Visibility::Private:
            return "private";
        case Visibility::Internal:
            return "internal";
        case Visibility::Protected:
            return "protected";
        case Visibility::Public:
            return "public";
    }
    return "public";
}

bool parseVisibility(std::string_view text, Visibility &out)
{
    if (text == "private")
        out = Visibility::Private;
    else if (text == "internal")
        out = Visibility::Internal;
    else if (text == "protected")
        out = Visibility::Protected;
    else if (text == "public")
        out = Visibility::Public;
    else
        return false;
    return true;
}

bool MethodDef::isConstructor() const
{
    return name == ".ctor" || name == ".cctor";
}

bool MethodDef::isTypeInitializer() const
{
    return name == ".cctor" && isStatic;
}

bool MethodDef::isAccessor() const
{
    return specialName && (name.rfind("get_", 0) == 0 || name.rfind("set_", 0) == 0);
}

std::vector<TypeRef> MethodDef::paramTypes() const
{
    std::vector<TypeRef> types;
    types.reserve(params.size());
    for (const auto &p : params)
        types.push_back(p.type);
    return types;
}

std::string MethodDef::signature(const std::string &declaringType) const
{
    return formatMethodSignature(returnType, declaringType, name, genericParams, paramTypes());
}

std::string MethodDef::slotKey() const
{
    return formatSlotKey(name, paramTypes());
}

MethodRef MethodDef::makeRef(const TypeRef &declaringType) const
{
    MethodRef ref;
    ref.declaringType = declaringType;
    ref.name = name;
    ref.returnType = returnType;
    ref.paramTypes = paramTypes();
    ref.hasThis = !isStatic;
    ref.genericParams = genericParams;
    return ref;
}

} // namespace hotswap::core
