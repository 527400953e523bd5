//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/fwd.hpp
// Purpose: Forward declarations of the IR core aggregates.
// Key invariants: None.
// Ownership/Lifetime: Not applicable.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

namespace hotswap::core
{
struct Module;
struct TypeDef;
struct FieldDef;
struct MethodDef;
struct Instr;
struct Operand;
struct TypeRef;
struct MethodRef;
struct FieldRef;
} // namespace hotswap::core
