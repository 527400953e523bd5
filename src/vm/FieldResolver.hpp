//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/FieldResolver.hpp
// Purpose: Storage for fields that exist in patched source but not in the
//          layout of the already-loaded type.
// Key invariants: One slot per (instance, owner, field) and per (owner, field)
//                 for statics, created exactly once even under concurrent
//                 first access.  A slot's address never changes while any
//                 reference to it is alive.
// Ownership/Lifetime: Instance slots live in the instance's AddedFieldBag;
//                     static slots and initializers are owned by the
//                     resolver, which lives as long as its Runtime.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Field indirection table used by patched code.
/// @details A patched method cannot store an added field in the instance
///          because the loaded type's layout is fixed.  The patch synthesizer
///          rewrites `ldfld`/`stfld`/`ldflda` on such fields into calls to the
///          `core.FieldResolver` natives, which land here.

#pragma once

#include "vm/Value.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace hotswap::vm
{

struct Object;

/// @brief Boxed storage for one added field.
class FieldSlot
{
  public:
    explicit FieldSlot(Value initial) : value_(std::move(initial)) {}

    Value load() const;
    void store(Value v);

    /// @brief Stable address of the boxed value.
    Value *address()
    {
        return &value_;
    }

  private:
    mutable std::mutex mutex_;
    Value value_;
};

/// @brief Per-instance map from `Owner::name` to its slot.
class AddedFieldBag
{
  public:
    /// @brief Return the slot for @p key, creating it with @p initial when
    ///        absent.  Creation happens under the bag lock.
    std::shared_ptr<FieldSlot> getOrCreate(const std::string &key, const Value &initial);

    std::vector<std::string> keys() const;
    bool empty() const;
    void clear();

  private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FieldSlot>> slots_;
};

/// @brief Resolves added fields to their slots.
class FieldResolver
{
  public:
    /// @brief Value of instance field @p name on @p instance.
    Value get(const std::string &owner, Object &instance, const std::string &name);

    void store(const std::string &owner, Object &instance, const std::string &name, Value v);

    /// @brief Managed reference into the slot of @p name on @p instance.
    Value ref(const std::string &owner, Object &instance, const std::string &name);

    Value getStatic(const std::string &owner, const std::string &name);
    void storeStatic(const std::string &owner, const std::string &name, Value v);
    Value staticRef(const std::string &owner, const std::string &name);

    /// @brief Value a slot of (@p owner, @p name) starts with when first
    ///        touched without a prior store.  Later registrations win for
    ///        slots created afterwards; existing slots keep their value.
    void registerInitializer(const std::string &owner, const std::string &name, Value value);

    /// @brief True when @p instance has touched at least one added field.
    static bool hasDynamicFields(const Object &instance);

    /// @brief `Owner::name` keys of the slots attached to @p instance.
    static std::vector<std::string> dynamicFieldNames(const Object &instance);

    /// @brief Drop every slot attached to @p instance.
    static void clearDynamicFields(Object &instance);

    /// @brief Drop static slots and registered initializers.
    void clear();

  private:
    std::shared_ptr<FieldSlot> instanceSlot(const std::string &owner,
                                            Object &instance,
                                            const std::string &name);
    std::shared_ptr<FieldSlot> staticSlot(const std::string &owner, const std::string &name);
    Value initialValue(const std::string &key) const;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Value> initializers_;
    std::unordered_map<std::string, std::shared_ptr<FieldSlot>> statics_;
};

} // namespace hotswap::vm
