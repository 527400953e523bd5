//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/DiffEngine.hpp
// Purpose: Compute the member diff between a candidate compile and the
//          latest snapshot of the same module.
// Key invariants: Compiling identical sources twice yields no diff.  The call
//                 graph holds the candidate's body of every changed method
//                 once diff() returns.
// Ownership/Lifetime: Stateless between calls; module state is passed in.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/analysis/CallGraphIndex.hpp"
#include "reload/Diff.hpp"
#include "reload/SnapshotStore.hpp"
#include "support/log.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hotswap::reload
{

class DiffEngine
{
  public:
    explicit DiffEngine(hotswap::support::LogSink &log) : log_(log) {}

    /// @brief Diff the types declared by @p changedFiles.
    /// @details Types are taken from the latest snapshot's file index and
    ///          from the candidate's own source stamps, so files that gained
    ///          their first type are covered.  Modified generic definitions
    ///          cascade to their callers through @p graph.
    /// @return std::nullopt when no declared member changed.
    std::optional<DiffResult> diff(const std::string &module,
                                   std::shared_ptr<const hotswap::core::Module> candidate,
                                   const std::vector<std::string> &changedFiles,
                                   const SnapshotStore &store,
                                   hotswap::analysis::CallGraphIndex &graph);

  private:
    void diffType(const hotswap::core::TypeDef &next,
                  const hotswap::core::Module &latest,
                  const hotswap::core::Module &baseline,
                  const hotswap::core::Module &candidate,
                  DiffResult &out);
    void cascade(DiffResult &out, hotswap::analysis::CallGraphIndex &graph);

    hotswap::support::LogSink &log_;
};

} // namespace hotswap::reload
