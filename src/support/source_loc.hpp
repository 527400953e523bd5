//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_loc.hpp
// Purpose: Lightweight file/line/column triple attached to diagnostics.
// Key invariants: file_id 0 means "no file"; line and column are 1-based.
// Ownership/Lifetime: Trivially copyable value type.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace hotswap::support
{

/// @brief Location of a construct inside a file registered with SourceManager.
struct SourceLoc
{
    /// Identifier assigned by SourceManager; 0 indicates an invalid location.
    uint32_t file_id = 0;

    /// 1-based line number within the file; 0 if unknown.
    uint32_t line = 0;

    /// 1-based column number within the line; 0 if unknown.
    uint32_t column = 0;

    /// @brief Whether this location refers to a tracked file.
    [[nodiscard]] bool isValid() const
    {
        return file_id != 0;
    }
};

} // namespace hotswap::support
