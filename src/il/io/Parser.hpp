//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/io/Parser.hpp
// Purpose: Parses textual IR into a Module.
//
// The parser is a hand-written, line-oriented recursive descent over the
// grammar printed by Serializer:
//
//   module <name>
//   reference <name>
//   class <vis> [abstract] [compilergenerated] <name> [extends T]
//         [implements T, ...] [source "<file>"]
//     field <vis> [static] <type> <name>
//     method <vis> [static] [virtual] [abstract] [specialname] [noinline]
//            <ret> <name>[<T,...>](<type> <param>, ...)
//       locals <type>, ...
//       try <label> <label> catch <type> <label> <label>
//       [<label>:] <mnemonic> [operand]
//     end
//     class ... end
//   end
//
// `//` starts a comment.  Parse errors are reported through Expected with the
// offending line; parsing stops at the first error.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"
#include "support/diag_expected.hpp"

#include <cstdint>
#include <istream>
#include <string_view>

namespace hotswap::io
{

/// @brief Hand-rolled parser for textual IR.
class Parser
{
  public:
    /// @brief Parse IR from stream into module @p m.
    /// @param fileId SourceManager id used for diagnostic locations, or 0.
    [[nodiscard]] static hotswap::support::Expected<void> parse(std::istream &is,
                                                                hotswap::core::Module &m,
                                                                uint32_t fileId = 0);

    /// @brief Convenience overload parsing an in-memory string.
    [[nodiscard]] static hotswap::support::Expected<hotswap::core::Module> parseText(
        std::string_view text);
};

} // namespace hotswap::io
