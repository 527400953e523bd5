//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/SnapshotStore.hpp
// Purpose: Per-module baseline and latest compiled snapshots plus the index
//          from source files to the types they declare.
// Key invariants: Snapshots are immutable once stored; commit() replaces the
//                 latest snapshot wholesale and rebuilds its file index.
// Ownership/Lifetime: Owns every snapshot through shared_ptr<const Module>;
//                     readers keep a snapshot alive after it is replaced.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hotswap::reload
{

/// @brief Holds the compiled state of every module under reload.
/// @details The baseline is what the live process loaded and never changes
///          after initialize().  The latest snapshot is the most recent
///          successfully diffed compile.  A member present in the latest
///          snapshot but absent from the baseline was introduced by an
///          earlier patch.
class SnapshotStore
{
  public:
    using ModulePtr = std::shared_ptr<const hotswap::core::Module>;

    /// @brief Register @p module with its baseline and first snapshot.
    /// @param sources Source files owned by the module, including files
    ///        that declare no types.
    void initialize(const std::string &module,
                    hotswap::core::Module baseline,
                    hotswap::core::Module latest,
                    const std::vector<std::string> &sources = {});

    ModulePtr baseline(const std::string &module) const;
    ModulePtr latest(const std::string &module) const;

    /// @brief Replace the latest snapshot of @p module.
    void commit(const std::string &module, ModulePtr next);

    /// @brief Full names of the top-level types declared by @p files in the
    ///        latest snapshot of @p module.  Unknown files contribute nothing.
    std::set<std::string> typesInFiles(const std::string &module,
                                       const std::vector<std::string> &files) const;

    /// @brief Module owning @p file, if any.
    std::optional<std::string> moduleForFile(const std::string &file) const;

    bool contains(const std::string &module) const;
    std::vector<std::string> modules() const;

    void clear();

  private:
    struct Entry
    {
        ModulePtr baseline;
        ModulePtr latest;
        std::map<std::string, std::set<std::string>> typesByFile;
        std::set<std::string> sources;
    };

    static void indexFiles(Entry &e);

    std::map<std::string, Entry> entries_;
    std::map<std::string, std::string> fileOwner_;
    mutable std::mutex mutex_;
};

} // namespace hotswap::reload
