//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/RuntimeTypes.hpp
// Purpose: Loaded representation of modules, types and methods.
// Key invariants: A RuntimeMethod's entry is either null (execute self) or
//                 another method of identical arity.  Runtime objects are
//                 never freed while their Runtime is alive, so raw pointers
//                 between them stay valid.
// Ownership/Lifetime: Owned by Runtime.  Definitions point into the
//                     shared_ptr<const Module> each LoadedModule holds.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"
#include "vm/Value.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace hotswap::vm
{

class Runtime;
struct LoadedModule;
struct RuntimeType;

/// @brief Native implementation of a built-in method.
/// @param site Call-site reference, carrying generic arguments.
/// @param args Receiver first for instance methods.
using NativeFn =
    std::function<Value(Runtime &rt, const hotswap::core::MethodRef &site, std::vector<Value> &args)>;

/// @brief Executable method with a redirectable entry point.
struct RuntimeMethod
{
    uint32_t id = 0;
    std::string signature;
    RuntimeType *owner = nullptr;
    const hotswap::core::MethodDef *def = nullptr; ///< Null for natives
    NativeFn native;
    hotswap::core::Visibility visibility = hotswap::core::Visibility::Public;
    bool isStatic = false;
    bool isAbstract = false;
    /// Parameter count including the receiver; natives with a negative
    /// arity accept any count.
    int arity = 0;

    /// Redirect target; null executes this method's own body.
    std::atomic<RuntimeMethod *> entry{nullptr};
    /// When set, the method may access members it could not normally see.
    std::atomic<bool> skipVisibility{false};

    bool isNative() const
    {
        return static_cast<bool>(native);
    }

    /// @brief Name component of the signature's method part.
    std::string name() const;
};

/// @brief Loaded type: layout, statics and method tables.
struct RuntimeType
{
    std::string name;
    LoadedModule *module = nullptr;
    RuntimeType *base = nullptr;
    const hotswap::core::TypeDef *def = nullptr; ///< Null for built-ins
    std::vector<std::string> interfaces;

    /// Instance field name to slot, including inherited fields.
    std::unordered_map<std::string, uint32_t> fieldIndex;
    std::unordered_map<std::string, hotswap::core::Visibility> fieldVisibility;
    uint32_t fieldCount = 0;
    /// Initial instance field values, indexed like fieldIndex.
    std::vector<Value> fieldDefaults;

    std::unordered_map<std::string, uint32_t> staticIndex;
    std::vector<Value> statics;

    /// Declared methods by signature.
    std::unordered_map<std::string, RuntimeMethod *> methods;
    /// Declared instance methods by slot key, for virtual dispatch.
    std::unordered_map<std::string, RuntimeMethod *> slots;

    /// @brief True when this type is @p other, derives from it, or implements
    ///        an interface named like it.
    bool isAssignableTo(const std::string &other) const;

    /// @brief Most derived implementation of @p slotKey, walking base types.
    RuntimeMethod *findSlot(const std::string &slotKey) const;

    /// @brief Method matching @p ref declared here or on a base type.
    RuntimeMethod *findMethod(const hotswap::core::MethodRef &ref) const;
};

/// @brief Module registered with the runtime.
struct LoadedModule
{
    std::string name;
    std::string path; ///< File the module was loaded from, if any
    std::shared_ptr<const hotswap::core::Module> module;
    std::unordered_map<std::string, RuntimeType *> types;
    /// Every method of the module by full signature.
    std::unordered_map<std::string, RuntimeMethod *> methods;
    bool builtin = false;
};

} // namespace hotswap::vm
