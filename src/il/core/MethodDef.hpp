//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/MethodDef.hpp
// Purpose: Method definition with signature, flags, locals, exception
//          handlers and a linear instruction body.
// Key invariants: Branch targets and handler bounds are indices into body and
//                 may equal body.size() only for handler end markers.
// Ownership/Lifetime: Owns its instructions; copied by value into snapshots,
//                     diffs and patch modules.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Instr.hpp"
#include "il/core/References.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace hotswap::core
{

/// @brief Member accessibility.
enum class Visibility
{
    Private,
    Internal,
    Protected,
    Public
};

/// @brief Keyword spelling of @p v.
std::string_view toString(Visibility v);

/// @brief Parse a visibility keyword; returns false when @p text is not one.
bool parseVisibility(std::string_view text, Visibility &out);

/// @brief Named method parameter.
struct Param
{
    std::string name;
    TypeRef type;
};

/// @brief Protected region with a typed catch handler.
struct ExceptionHandler
{
    uint32_t tryStart = 0;
    uint32_t tryEnd = 0;
    uint32_t handlerStart = 0;
    uint32_t handlerEnd = 0;
    TypeRef catchType{"object"};
};

/// @brief Method definition.
struct MethodDef
{
    std::string name;
    TypeRef returnType{"void"};
    std::vector<Param> params;
    std::vector<std::string> genericParams;
    Visibility visibility = Visibility::Public;
    bool isStatic = false;
    bool isVirtual = false;
    bool isAbstract = false;
    bool specialName = false; ///< Property accessor and other runtime-named members
    bool noInline = false;
    std::vector<TypeRef> locals;
    std::vector<ExceptionHandler> handlers;
    std::vector<Instr> body;

    /// @brief `.ctor` or `.cctor`.
    bool isConstructor() const;

    /// @brief Static type initializer `.cctor`.
    bool isTypeInitializer() const;

    /// @brief Special-named `get_`/`set_` property accessor.
    bool isAccessor() const;

    bool isGenericDefinition() const
    {
        return !genericParams.empty();
    }

    /// @brief Parameter types in declaration order.
    std::vector<TypeRef> paramTypes() const;

    /// @brief Signature within @p declaringType, e.g. `int32 Game.Player::F(int32)`.
    std::string signature(const std::string &declaringType) const;

    /// @brief Name plus parameter types, the key for virtual dispatch.
    std::string slotKey() const;

    /// @brief Reference to this definition as seen from its own module.
    MethodRef makeRef(const TypeRef &declaringType) const;
};

} // namespace hotswap::core
