//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/References.hpp
// Purpose: Symbolic references to types, methods and fields embedded in
//          bytecode operands.
// Key invariants: References are resolved by name only; an empty scope means
//                 the module containing the reference.
// Ownership/Lifetime: Plain value types; copies are independent.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <vector>

namespace hotswap::core
{

/// @brief Reference to a type by name.
/// @details Primitive types use their keyword (`int32`, `string`, `object`),
///          generic parameters use their parameter name, nested types are
///          spelled `Outer/Inner`.
struct TypeRef
{
    std::string scope;          ///< Owning module, empty for the current module
    std::string name;           ///< Namespace-qualified name
    std::vector<TypeRef> args;  ///< Generic arguments of a constructed type

    TypeRef() = default;

    TypeRef(std::string n) : name(std::move(n)) {}

    TypeRef(std::string s, std::string n) : scope(std::move(s)), name(std::move(n)) {}

    /// @brief Name with generic arguments, without scope: `List<int32>`.
    std::string fullName() const;

    /// @brief Name prefixed by its scope: `[Game]Game.Player`.
    std::string scopedName() const;

    /// @brief True for `void`.
    bool isVoid() const
    {
        return scope.empty() && name == "void" && args.empty();
    }

    /// @brief Name of the outermost enclosing type (`A` for `A/B/C`).
    std::string outermost() const;

    bool operator==(const TypeRef &other) const;

    bool operator!=(const TypeRef &other) const
    {
        return !(*this == other);
    }
};

/// @brief True when @p name is a built-in primitive keyword.
bool isPrimitiveType(const std::string &name);

/// @brief Reference to a method, optionally a generic instantiation.
struct MethodRef
{
    TypeRef declaringType;
    std::string name;
    TypeRef returnType{"void"};
    std::vector<TypeRef> paramTypes;
    bool hasThis = false;                  ///< Instance method (implicit receiver)
    std::vector<std::string> genericParams; ///< Parameter names of the definition
    std::vector<TypeRef> genericArgs;       ///< Instantiation, empty for definitions

    /// @brief True when the reference instantiates a generic method.
    bool isGenericInstance() const
    {
        return !genericArgs.empty();
    }

    /// @brief Signature of the referenced definition, generic parameters by name:
    ///        `T Game.Util::Id<T>(T)`.
    std::string elementSignature() const;

    /// @brief Signature with instantiation arguments when present:
    ///        `T Game.Util::Id<int32>(T)`.
    std::string fullName() const;

    /// @brief fullName() qualified by the declaring type's scope.
    std::string scopedName() const;

    /// @brief Key used for virtual slot lookup: `Name(p1,p2)`.
    std::string slotKey() const;
};

/// @brief Reference to a field.
struct FieldRef
{
    TypeRef declaringType;
    std::string name;
    TypeRef type;
    bool isStatic = false;

    /// @brief `int32 Game.Player::score`.
    std::string fullName() const;

    /// @brief fullName() qualified by the declaring type's scope.
    std::string scopedName() const;
};

/// @brief Format a method signature from its parts.
std::string formatMethodSignature(const TypeRef &ret,
                                  const std::string &declaringType,
                                  const std::string &name,
                                  const std::vector<std::string> &genericNames,
                                  const std::vector<TypeRef> &params);

/// @brief Format a virtual slot key from a method name and parameter types.
std::string formatSlotKey(const std::string &name, const std::vector<TypeRef> &params);

} // namespace hotswap::core
