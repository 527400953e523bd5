//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Module-level lookups.  Nested names are resolved by walking from the
// outermost type down, one `/` component at a time.
//
//===----------------------------------------------------------------------===//

#include "il/core/Module.hpp"

namespace hotswap::core
{

namespace
{
template <class TypeT, class Vec> TypeT *findIn(Vec &types, const std::string &fullName)
{
    for (auto &t : types)
    {
        if (t.name == fullName)
            return &t;
        if (fullName.size() > t.name.size() && fullName.compare(0, t.name.size(), t.name) == 0 &&
            fullName[t.name.size()] == '/')
        {
            if (TypeT *found = findIn<TypeT>(t.nested, fullName))
                return found;
        }
    }
    return nullptr;
}

void visit(const TypeDef &t, const std::function<void(const TypeDef &)> &fn)
{
    fn(t);
    for (const auto &n : t.nested)
        visit(n, fn);
}
} // namespace

const TypeDef *Module::findType(const std::string &fullName) const
{
    return findIn<const TypeDef>(types, fullName);
}

TypeDef *Module::findType(const std::string &fullName)
{
    return findIn<TypeDef>(types, fullName);
}

void Module::forEachType(const std::function<void(const TypeDef &)> &fn) const
{
    for (const auto &t : types)
        visit(t, fn);
}

} // namespace hotswap::core
