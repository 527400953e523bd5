//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/io/ParserState.hpp
// Purpose: Shared state and helpers for the IR text sub-parsers.
// Key invariants: lineNo is the 1-based number of the most recently read line.
// Ownership/Lifetime: Borrows the module being populated and the input stream.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"
#include "support/diag_expected.hpp"

#include <istream>
#include <string>
#include <string_view>

namespace hotswap::io::detail
{

/// @brief Mutable parser context threaded through the sub-parsers.
struct ParserState
{
    hotswap::core::Module &m;
    std::istream &is;
    uint32_t fileId = 0;
    unsigned lineNo = 0;

    /// @brief Read the next significant line: comments stripped, blanks skipped.
    /// @return False at end of input.
    bool nextLine(std::string &out);

    /// @brief Diagnostic for the current line.
    hotswap::support::Diag error(std::string_view message) const;

    /// @brief Diagnostic for an explicit line number.
    hotswap::support::Diag errorAt(unsigned line, std::string_view message) const;
};

/// @brief Remove a `//` comment that is not inside a string literal.
std::string stripComment(std::string_view line);

/// @brief Parse a class block whose header is @p header.
/// @param outer Full name of the enclosing type, empty for top-level types.
hotswap::support::Expected<hotswap::core::TypeDef> parseClass(const std::string &header,
                                                             const std::string &outer,
                                                             ParserState &st);

/// @brief Parse a method block whose header is @p header.
hotswap::support::Expected<hotswap::core::MethodDef> parseMethod(const std::string &header,
                                                                ParserState &st);

} // namespace hotswap::io::detail
