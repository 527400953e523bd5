//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Object.hpp
// Purpose: Heap instance of a runtime type.
// Key invariants: fields.size() equals the instance field count of type,
//                 base-class fields first.  The added-field bag is created at
//                 most once per instance.
// Ownership/Lifetime: Shared by every Value that refers to it.  The added
//                     field bag is owned by the instance and dies with it.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "vm/Value.hpp"

#include <atomic>
#include <vector>

namespace hotswap::vm
{

struct RuntimeType;
class AddedFieldBag;

/// @brief Instance of a loaded or built-in type.
struct Object
{
    /// @brief Allocate an instance of @p t with its fields at their defaults.
    explicit Object(RuntimeType *t);
    ~Object();

    Object(const Object &) = delete;
    Object &operator=(const Object &) = delete;

    RuntimeType *type;
    std::vector<Value> fields;

    /// @brief Side storage for fields the loaded type does not declare,
    ///        created on first use.
    AddedFieldBag &addedFields();

    /// @brief Existing side storage, or null when none was ever created.
    AddedFieldBag *addedFieldsIfAny() const
    {
        return added_.load(std::memory_order_acquire);
    }

  private:
    std::atomic<AddedFieldBag *> added_{nullptr};
};

} // namespace hotswap::vm
