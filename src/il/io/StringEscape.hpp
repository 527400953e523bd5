//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/io/StringEscape.hpp
// Purpose: C-style escaping of string literals in IR text.
// Key invariants: decode(encode(s)) == s for every byte string s.
// Ownership/Lifetime: Functions return new strings.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace hotswap::io
{

/// @brief Decode `\n`, `\t`, `\r`, `\\`, `\"`, `\0` and `\xNN` escapes.
/// @param error Optional pointer receiving a message on failure.
/// @return False when @p input contains a malformed escape sequence.
bool decodeEscapedString(std::string_view input, std::string &output, std::string *error = nullptr);

/// @brief Escape quotes, backslashes and control characters in @p input.
std::string encodeEscapedString(std::string_view input);

} // namespace hotswap::io
