//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/core/Instr.hpp
// Purpose: Bytecode instruction: an opcode plus at most one tagged operand.
// Key invariants: operand.kind matches operandKind(op) for well-formed code.
// Ownership/Lifetime: Operands hold reference payloads through shared,
//                     immutable pointers so copying a method body is cheap;
//                     rewriting replaces a payload, never mutates it.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Opcode.hpp"
#include "il/core/References.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace hotswap::core
{

/// @brief Tagged immediate operand of an instruction.
struct Operand
{
    OperandKind kind = OperandKind::None;

    /// Int32, Int64, Target and Index payload.
    int64_t i64 = 0;

    /// Float32 payload, stored at its own precision.
    float f32 = 0.0f;

    /// Float64 payload.
    double f64 = 0.0;

    /// String payload.
    std::string str;

    /// Switch table payload.
    std::vector<uint32_t> targets;

    std::shared_ptr<const TypeRef> type;
    std::shared_ptr<const MethodRef> method;
    std::shared_ptr<const FieldRef> field;

    static Operand none();
    static Operand int32(int32_t v);
    static Operand int64(int64_t v);
    static Operand float32(float v);
    static Operand float64(double v);
    static Operand string(std::string s);
    static Operand typeRef(TypeRef t);
    static Operand methodRef(MethodRef m);
    static Operand fieldRef(FieldRef f);
    static Operand target(uint32_t index);
    static Operand targetList(std::vector<uint32_t> indices);
    static Operand index(uint32_t slot);
};

/// @brief Single bytecode instruction.
struct Instr
{
    Opcode op = Opcode::Nop;
    Operand operand;

    Instr() = default;

    Instr(Opcode o, Operand v = Operand::none()) : op(o), operand(std::move(v)) {}
};

} // namespace hotswap::core
