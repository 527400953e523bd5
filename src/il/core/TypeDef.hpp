//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/TypeDef.hpp
// Purpose: Type and field definitions of the managed object model.
// Key invariants: name is always the full name (`Ns.Outer/Inner`); nested
//                 types are owned by their enclosing type.
// Ownership/Lifetime: Owns fields, methods and nested types by value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/MethodDef.hpp"
#include "il/core/References.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hotswap::core
{

/// @brief Interface implemented by compiler-generated suspended computations.
inline constexpr const char *kStateMachineInterface = "core.IStateMachine";

/// @brief Step method of a state machine type.
inline constexpr const char *kStateMachineStep = "MoveNext";

/// @brief Field definition.
struct FieldDef
{
    std::string name;
    TypeRef type;
    bool isStatic = false;
    Visibility visibility = Visibility::Private;

    /// @brief `int32 Game.Player::score`.
    std::string signature(const std::string &declaringType) const;
};

/// @brief Type definition.
struct TypeDef
{
    std::string name;
    std::optional<TypeRef> base;
    std::vector<TypeRef> interfaces;
    Visibility visibility = Visibility::Public;
    bool compilerGenerated = false;
    bool isAbstract = false;
    std::string sourceFile; ///< File that declared the type; empty for nested types
    std::vector<FieldDef> fields;
    std::vector<MethodDef> methods;
    std::vector<TypeDef> nested;

    bool isNested() const
    {
        return name.find('/') != std::string::npos;
    }

    /// @brief Last `/`-separated component of the name.
    std::string simpleName() const;

    /// @brief Implements kStateMachineInterface.
    bool isStateMachine() const;

    /// @brief Reference to this type from inside its own module.
    TypeRef ref() const
    {
        return TypeRef{name};
    }

    const MethodDef *findMethod(const std::string &signature) const;
    MethodDef *findMethod(const std::string &signature);

    /// @brief First method named @p methodName, regardless of signature.
    const MethodDef *findMethodByName(const std::string &methodName) const;

    const FieldDef *findField(const std::string &fieldName) const;

    /// @brief Direct nested type with full name @p fullName.
    const TypeDef *findNested(const std::string &fullName) const;
};

} // namespace hotswap::core
