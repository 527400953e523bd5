//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/io/TypeParser.hpp
// Purpose: Parse type, method and field references from a cursor.
// Key invariants: On failure the cursor position is unspecified.
// Ownership/Lifetime: Results are returned by value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/References.hpp"
#include "il/io/Cursor.hpp"
#include "support/diag_expected.hpp"

namespace hotswap::io::detail
{

struct ParserState;

/// @brief Parse `[scope]Name<Arg,...>`.
hotswap::support::Expected<hotswap::core::TypeRef> parseTypeRef(Cursor &c, const ParserState &st);

/// @brief Parse `[instance] Ret Decl::Name<P:Arg,...>(T1, T2)`.
hotswap::support::Expected<hotswap::core::MethodRef> parseMethodRef(Cursor &c,
                                                                   const ParserState &st);

/// @brief Parse `Type Decl::name`.
hotswap::support::Expected<hotswap::core::FieldRef> parseFieldRef(Cursor &c,
                                                                 const ParserState &st,
                                                                 bool isStatic);

} // namespace hotswap::io::detail
