//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the added-field side tables.  Lock order is resolver, then bag,
// then slot; no path takes them in another order.  Managed references handed
// out by ref() keep the slot alive through Value::refOwner, so clearing a bag
// never leaves a dangling reference.
//
//===----------------------------------------------------------------------===//

#include "vm/FieldResolver.hpp"
#include "vm/Object.hpp"

namespace hotswap::vm
{

namespace
{

std::string slotKey(const std::string &owner, const std::string &name)
{
    return owner + "::" + name;
}

} // namespace

Value FieldSlot::load() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return value_;
}

void FieldSlot::store(Value v)
{
    std::lock_guard<std::mutex> lock(mutex_);
    value_ = std::move(v);
}

std::shared_ptr<FieldSlot> AddedFieldBag::getOrCreate(const std::string &key, const Value &initial)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it != slots_.end())
        return it->second;
    auto slot = std::make_shared<FieldSlot>(initial);
    slots_.emplace(key, slot);
    return slot;
}

std::vector<std::string> AddedFieldBag::keys() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(slots_.size());
    for (const auto &[key, slot] : slots_)
        out.push_back(key);
    return out;
}

bool AddedFieldBag::empty() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.empty();
}

void AddedFieldBag::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    slots_.clear();
}

Value FieldResolver::initialValue(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = initializers_.find(key);
    return it == initializers_.end() ? Value::null() : it->second;
}

std::shared_ptr<FieldSlot> FieldResolver::instanceSlot(const std::string &owner,
                                                       Object &instance,
                                                       const std::string &name)
{
    const std::string key = slotKey(owner, name);
    return instance.addedFields().getOrCreate(key, initialValue(key));
}

std::shared_ptr<FieldSlot> FieldResolver::staticSlot(const std::string &owner,
                                                     const std::string &name)
{
    const std::string key = slotKey(owner, name);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = statics_.find(key);
    if (it != statics_.end())
        return it->second;
    auto init = initializers_.find(key);
    auto slot =
        std::make_shared<FieldSlot>(init == initializers_.end() ? Value::null() : init->second);
    statics_.emplace(key, slot);
    return slot;
}

Value FieldResolver::get(const std::string &owner, Object &instance, const std::string &name)
{
    return instanceSlot(owner, instance, name)->load();
}

void FieldResolver::store(const std::string &owner,
                          Object &instance,
                          const std::string &name,
                          Value v)
{
    instanceSlot(owner, instance, name)->store(std::move(v));
}

Value FieldResolver::ref(const std::string &owner, Object &instance, const std::string &name)
{
    auto slot = instanceSlot(owner, instance, name);
    Value *target = slot->address();
    return Value::reference(target, std::move(slot));
}

Value FieldResolver::getStatic(const std::string &owner, const std::string &name)
{
    return staticSlot(owner, name)->load();
}

void FieldResolver::storeStatic(const std::string &owner, const std::string &name, Value v)
{
    staticSlot(owner, name)->store(std::move(v));
}

Value FieldResolver::staticRef(const std::string &owner, const std::string &name)
{
    auto slot = staticSlot(owner, name);
    Value *target = slot->address();
    return Value::reference(target, std::move(slot));
}

void FieldResolver::registerInitializer(const std::string &owner,
                                        const std::string &name,
                                        Value value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    initializers_.insert_or_assign(slotKey(owner, name), std::move(value));
}

bool FieldResolver::hasDynamicFields(const Object &instance)
{
    const AddedFieldBag *bag = instance.addedFieldsIfAny();
    return bag && !bag->empty();
}

std::vector<std::string> FieldResolver::dynamicFieldNames(const Object &instance)
{
    const AddedFieldBag *bag = instance.addedFieldsIfAny();
    return bag ? bag->keys() : std::vector<std::string>{};
}

void FieldResolver::clearDynamicFields(Object &instance)
{
    if (AddedFieldBag *bag = instance.addedFieldsIfAny())
        bag->clear();
}

void FieldResolver::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    initializers_.clear();
    statics_.clear();
}

} // namespace hotswap::vm
