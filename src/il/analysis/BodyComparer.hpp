//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/analysis/BodyComparer.hpp
// Purpose: Structural equality of method bodies across two independently
//          compiled modules.
// Key invariants: Equality is reflexive and symmetric; branch targets never
//                 affect the result.
// Ownership/Lifetime: Borrows both modules for the comparer's lifetime.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Decides whether an edit changed what a method does.
/// @details Two bodies are equal when they have the same number of locals,
///          handlers and instructions, and every instruction pair has the
///          same opcode and an equal operand:
///          - integer and index operands by value;
///          - floating operands by exact value at their own precision, NaN
///            equal to NaN;
///          - strings by content;
///          - type, method and field references by scoped full name;
///          - branch targets always equal.
///          A referenced method declared by a compiler-generated type of the
///          same module (closure, state machine) is compared by body as well,
///          and so is the `MoveNext` step of every state machine passed as a
///          generic argument, since their code is part of the caller's source.

#pragma once

#include "il/core/Module.hpp"

#include <set>
#include <string>
#include <utility>

namespace hotswap::analysis
{

class BodyComparer
{
  public:
    BodyComparer(const hotswap::core::Module &oldModule, const hotswap::core::Module &newModule)
        : old_(oldModule), new_(newModule)
    {
    }

    /// @brief Structural equality of @p a (from the old module) and @p b
    ///        (from the new module).
    bool equal(const hotswap::core::MethodDef &a, const hotswap::core::MethodDef &b);

    /// @brief Operand equality for two instructions of the same opcode.
    bool equalOperands(const hotswap::core::Instr &a, const hotswap::core::Instr &b);

  private:
    bool equalMethodRefs(const hotswap::core::MethodRef &a, const hotswap::core::MethodRef &b);
    bool equalGeneratedCallees(const hotswap::core::MethodRef &a,
                               const hotswap::core::MethodRef &b);
    bool equalStateMachines(const hotswap::core::TypeRef &a, const hotswap::core::TypeRef &b);

    const hotswap::core::Module &old_;
    const hotswap::core::Module &new_;
    std::set<std::pair<const hotswap::core::MethodDef *, const hotswap::core::MethodDef *>>
        inProgress_;
};

/// @brief Type of @p module named by @p ref, when @p ref points into it.
const hotswap::core::TypeDef *localType(const hotswap::core::Module &module,
                                        const hotswap::core::TypeRef &ref);

} // namespace hotswap::analysis
