//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Member lookup over loaded types.  Built-in types match natives by name and
// argument count when no exact signature is registered, so a single native
// such as Console::WriteLine serves every overload a module may reference.
//
//===----------------------------------------------------------------------===//

#include "vm/RuntimeTypes.hpp"

#include <algorithm>

namespace hotswap::vm
{

using hotswap::core::MethodRef;

std::string RuntimeMethod::name() const
{
    const auto colons = signature.find("::");
    if (colons == std::string::npos)
        return signature;
    const auto start = colons + 2;
    const auto stop = signature.find_first_of("<(", start);
    return signature.substr(start, stop == std::string::npos ? std::string::npos : stop - start);
}

bool RuntimeType::isAssignableTo(const std::string &other) const
{
    for (const RuntimeType *t = this; t; t = t->base)
    {
        if (t->name == other)
            return true;
        if (std::find(t->interfaces.begin(), t->interfaces.end(), other) != t->interfaces.end())
            return true;
    }
    return false;
}

RuntimeMethod *RuntimeType::findSlot(const std::string &slotKey) const
{
    for (const RuntimeType *t = this; t; t = t->base)
    {
        auto it = t->slots.find(slotKey);
        if (it != t->slots.end())
            return it->second;
    }
    return nullptr;
}

RuntimeMethod *RuntimeType::findMethod(const MethodRef &ref) const
{
    const int argc = static_cast<int>(ref.paramTypes.size()) + (ref.hasThis ? 1 : 0);
    for (const RuntimeType *t = this; t; t = t->base)
    {
        const std::string sig = hotswap::core::formatMethodSignature(
            ref.returnType, t->name, ref.name, ref.genericParams, ref.paramTypes);
        auto it = t->methods.find(sig);
        if (it != t->methods.end())
            return it->second;
        if (t->def)
            continue;
        for (const auto &[key, m] : t->methods)
        {
            if (m->name() == ref.name && (m->arity < 0 || m->arity == argc))
                return m;
        }
    }
    return nullptr;
}

} // namespace hotswap::vm
