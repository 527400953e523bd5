//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Opcode.hpp
// Purpose: Enumerates bytecode opcodes and the operand kind each one carries.
// Key invariants: Enumeration order matches Opcode.def.
// Ownership/Lifetime: Not applicable.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace hotswap::core
{

/// @brief Shape of the single immediate operand an opcode takes.
enum class OperandKind
{
    None,    ///< No operand
    Int32,   ///< 32-bit integer literal
    Int64,   ///< 64-bit integer literal
    Float32, ///< Single-precision literal
    Float64, ///< Double-precision literal
    String,  ///< String literal
    Type,    ///< Type reference
    Method,  ///< Method reference
    Field,   ///< Field reference
    Target,  ///< Branch target (instruction index)
    Targets, ///< Branch target table
    Index    ///< Argument or local slot index
};

/// @brief All instruction opcodes.
enum class Opcode
{
#define HS_OPCODE(NAME, ...) NAME,
#include "il/core/Opcode.def"
#undef HS_OPCODE
    Count
};

/// @brief Total number of opcodes.
constexpr size_t kNumOpcodes = static_cast<size_t>(Opcode::Count);

/// @brief Mnemonic spelling of @p op, e.g. "ldc.i4".
std::string_view toString(Opcode op);

/// @brief Operand shape expected by @p op.
OperandKind operandKind(Opcode op);

/// @brief Look up an opcode by mnemonic.
std::optional<Opcode> opcodeFromMnemonic(std::string_view mnemonic);

/// @brief True for opcodes whose operand is a branch target or table.
bool isBranch(Opcode op);

/// @brief True for call, callvirt and newobj.
bool isCallLike(Opcode op);

} // namespace hotswap::core
