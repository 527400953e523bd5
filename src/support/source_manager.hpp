//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/source_manager.hpp
// Purpose: Maps numeric file identifiers to normalized source paths.
// Key invariants: File id 0 is invalid; ids are stable for the manager's life.
// Ownership/Lifetime: Owns stored path strings.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_loc.hpp"

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace hotswap::support
{

/// Maintains the mapping between numeric file identifiers and their
/// corresponding filesystem paths. Registering the same path twice returns the
/// identifier handed out the first time.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id, or an empty view when unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    mutable std::mutex mutex_;

    /// Index corresponds to file identifier - 1; deque keeps references stable.
    std::deque<std::string> files_;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};

} // namespace hotswap::support
