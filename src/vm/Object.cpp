//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Instance allocation and lazy added-field storage.  The bag pointer is
// published with a compare-exchange so concurrent first accesses agree on a
// single bag; the losing thread discards its candidate before any slot exists.
//
//===----------------------------------------------------------------------===//

#include "vm/Object.hpp"
#include "vm/FieldResolver.hpp"
#include "vm/RuntimeTypes.hpp"

#include <memory>

namespace hotswap::vm
{

Object::Object(RuntimeType *t) : type(t)
{
    if (t)
        fields = t->fieldDefaults;
}

Object::~Object()
{
    delete added_.load(std::memory_order_acquire);
}

AddedFieldBag &Object::addedFields()
{
    AddedFieldBag *current = added_.load(std::memory_order_acquire);
    if (current)
        return *current;
    auto fresh = std::make_unique<AddedFieldBag>();
    if (added_.compare_exchange_strong(current, fresh.get(), std::memory_order_acq_rel))
        return *fresh.release();
    return *current;
}

} // namespace hotswap::vm
