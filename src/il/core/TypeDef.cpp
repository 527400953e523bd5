//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Lookup helpers on type definitions.  Member tables are small vectors, so the
// lookups are linear scans keyed by the same signature strings the diff engine
// uses.
//
//===----------------------------------------------------------------------===//

#include "il/core/TypeDef.hpp"

namespace hotswap::core
{

std::string FieldDef::signature(const std::string &declaringType) const
{
    return type.fullName() + " " + declaringType + "::" + name;
}

std::string TypeDef::simpleName() const
{
    const auto slash = name.rfind('/');
    return slash == std::string::npos ? name : name.substr(slash + 1);
}

bool TypeDef::isStateMachine() const
{
    for (const auto &iface : interfaces)
    {
        if (iface.name == kStateMachineInterface)
            return true;
    }
    return false;
}

const MethodDef *TypeDef::findMethod(const std::string &signature) const
{
    for (const auto &m : methods)
    {
        if (m.signature(name) == signature)
            return &m;
    }
    return nullptr;
}

MethodDef *TypeDef::findMethod(const std::string &signature)
{
    for (auto &m : methods)
    {
        if (m.signature(name) == signature)
            return &m;
    }
    return nullptr;
}

const MethodDef *TypeDef::findMethodByName(const std::string &methodName) const
{
    for (const auto &m : methods)
    {
        if (m.name == methodName)
            return &m;
    }
    return nullptr;
}

const FieldDef *TypeDef::findField(const std::string &fieldName) const
{
    for (const auto &f : fields)
    {
        if (f.name == fieldName)
            return &f;
    }
    return nullptr;
}

const TypeDef *TypeDef::findNested(const std::string &fullName) const
{
    for (const auto &t : nested)
    {
        if (t.name == fullName)
            return &t;
    }
    return nullptr;
}

} // namespace hotswap::core
