//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Module.hpp
// Purpose: Top-level container of a compiled module: its name, the modules it
//          references and its type definitions.
// Key invariants: Type full names are unique within a module.
// Ownership/Lifetime: Owns all contained definitions by value. Snapshots share
//                     modules as std::shared_ptr<const Module>.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/TypeDef.hpp"

#include <functional>
#include <string>
#include <vector>

namespace hotswap::core
{

/// @brief Compiled unit of types.
struct Module
{
    /// @brief Module name; the scope other modules use to reference it.
    std::string name;

    /// @brief Names of referenced modules.
    std::vector<std::string> references;

    /// @brief Top-level type definitions in declaration order.
    std::vector<TypeDef> types;

    /// @brief Locate a type by full name, searching nested types.
    const TypeDef *findType(const std::string &fullName) const;
    TypeDef *findType(const std::string &fullName);

    /// @brief Visit every type, top-level types before their nested types.
    void forEachType(const std::function<void(const TypeDef &)> &fn) const;
};

} // namespace hotswap::core
