//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/ReloadEngine.hpp
// Purpose: The reload service: initialize, compile and diff, synthesize and
//          write, apply hooks, and whole cycles over changed files.
// Key invariants: Operations on one module never interleave.  Different
//                 modules proceed concurrently.  A cycle that fails before
//                 hook application leaves no hook state behind.
// Ownership/Lifetime: Owns snapshots, call graphs and hook records.  Borrows
//                     the runtime, which must outlive the engine.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/analysis/CallGraphIndex.hpp"
#include "reload/DiffEngine.hpp"
#include "reload/Frontend.hpp"
#include "reload/HookApplier.hpp"
#include "reload/PatchSynthesizer.hpp"
#include "reload/ReloadConfig.hpp"
#include "reload/SnapshotStore.hpp"
#include "support/diag_expected.hpp"
#include "support/log.hpp"
#include "support/serial_queue.hpp"
#include "vm/Runtime.hpp"

#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace hotswap::reload
{

struct InitializeResult
{
    std::vector<std::string> modules; ///< Modules with an established baseline
    HookRecordSet records;            ///< Persisted by an earlier session
};

/// @brief Outcome of one reload cycle for one module.
struct CycleResult
{
    std::string module;
    bool success = false; ///< The cycle ran to completion
    bool changed = false; ///< A diff was found
    double elapsedMs = 0.0;
    std::string error;
    std::string patchPath;
    std::vector<std::string> applied;
    std::vector<MemberFailure> failures;
};

class ReloadEngine
{
  public:
    ReloadEngine(ReloadConfig config,
                 hotswap::vm::Runtime &rt,
                 std::shared_ptr<Frontend> frontend);
    ~ReloadEngine();

    ReloadEngine(const ReloadEngine &) = delete;
    ReloadEngine &operator=(const ReloadEngine &) = delete;

    /// @brief Compile every module, record its baseline and index its calls.
    /// @details The baseline is the module the runtime has loaded under the
    ///          context's name, else the compiled module.  Persisted hook
    ///          records are returned, not applied.
    hotswap::support::Expected<InitializeResult> initialize(
        const std::vector<ModuleContext> &modules, const std::vector<std::string> &defines);

    /// @brief Recompile @p module and diff the types declared by @p files.
    /// @details The latest snapshot only advances here when nothing needs
    ///          patching; otherwise call commit() once the patch is applied.
    /// @return std::nullopt when nothing needs patching.
    hotswap::support::Expected<std::optional<DiffResult>> compileAndDiff(
        const std::string &module, const std::vector<std::string> &files);

    /// @brief Synthesize the patch module for @p diff and write it to the
    ///        output directory.  Empty patches are not written.
    hotswap::support::Expected<PatchResult> synthesizeAndWritePatch(const DiffResult &diff);

    /// @brief Make the candidate of @p diff the latest snapshot.
    void commit(const DiffResult &diff);

    HookReport applyHooks(const PatchResult &patch);
    HookReport applyHooks(const HookRecordSet &records);

    /// @brief Run one cycle per module owning any of @p files.  Files no
    ///        module owns are ignored.
    std::vector<CycleResult> reload(const std::vector<std::string> &files);

    /// @brief Queue the cycles of reload() on each module's serial queue.
    std::vector<std::future<CycleResult>> submit(const std::vector<std::string> &files);

    bool isInitialized() const;
    HookRecordSet hookRecords() const;

    const SnapshotStore &snapshots() const
    {
        return store_;
    }

    const ReloadConfig &config() const
    {
        return config_;
    }

    hotswap::support::LogSink &log()
    {
        return log_;
    }

    /// @brief Drop snapshots, call graphs, records and the persisted state.
    ///        Installed hooks stay live.
    void clear();

  private:
    struct ModuleState
    {
        ModuleState(ModuleContext ctx, std::vector<std::string> builtins)
            : context(std::move(ctx)), graph(std::move(builtins))
        {
        }

        ModuleContext context;
        hotswap::analysis::CallGraphIndex graph;
        std::recursive_mutex mutex;
        hotswap::support::SerialQueue queue; ///< Destroyed first; drains queued cycles
    };

    ModuleState *state(const std::string &module) const;
    std::map<std::string, std::vector<std::string>> groupByModule(
        const std::vector<std::string> &files);
    CycleResult runCycle(const std::string &module, const std::vector<std::string> &files);
    void persist();

    ReloadConfig config_;
    hotswap::vm::Runtime &rt_;
    std::shared_ptr<Frontend> frontend_;
    hotswap::support::LogSink log_;
    std::vector<std::string> defines_;
    SnapshotStore store_;
    DiffEngine diff_;
    PatchSynthesizer synth_;
    PatchWriter writer_;
    HookApplier hooks_;
    std::map<std::string, std::unique_ptr<ModuleState>> modules_;
    std::set<std::string> reservedNames_;
    bool initialized_ = false;
    mutable std::mutex mutex_;
    std::mutex persistMutex_;
};

} // namespace hotswap::reload
