//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/HookApplier.hpp
// Purpose: Loads patch modules into the live runtime and redirects entry
//          points to their wrappers.
// Key invariants: Every wrapper ever issued for a member executes that
//                 member's newest body once a batch completes.  Batches never
//                 interleave.  A member whose redirect fails keeps its records
//                 unchanged.
// Ownership/Lifetime: Owns the hook records; borrows the runtime and the log.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "reload/HookRecords.hpp"
#include "reload/PatchSynthesizer.hpp"
#include "support/log.hpp"
#include "vm/Runtime.hpp"

#include <mutex>
#include <string>
#include <vector>

namespace hotswap::reload
{

/// @brief Outcome of one hook batch.
struct HookReport
{
    std::vector<std::string> applied; ///< Member signatures now hooked
    std::vector<MemberFailure> failures;

    bool ok() const
    {
        return failures.empty();
    }
};

class HookApplier
{
  public:
    HookApplier(hotswap::vm::Runtime &rt, hotswap::support::LogSink &log) : rt_(rt), log_(log) {}

    /// @brief Load @p patch and hook every member it carries.
    /// @details Modified members redirect the original entry point; every
    ///          wrapper previously issued for the member is redirected as
    ///          well, so chains built by earlier batches end at the newest
    ///          body.  Added fields register their initializer before any
    ///          wrapper can run.
    HookReport apply(const PatchResult &patch);

    /// @brief Re-establish @p records in a runtime that has only loaded the
    ///        baseline modules, then adopt them.
    HookReport applyRecords(const HookRecordSet &records);

    /// @brief Snapshot of the records accumulated so far.
    HookRecordSet records() const;

    /// @brief Forget all records.  Hooks already installed stay live.
    void reset();

  private:
    hotswap::support::Expected<hotswap::vm::LoadedModule *> loadPatch(const std::string &module,
                                                                       const std::string &path);
    hotswap::vm::RuntimeMethod *resolve(const WrapperRef &w) const;
    hotswap::support::Expected<void> hook(const std::string &typeModule,
                                          const MemberRecord &rec,
                                          hotswap::vm::RuntimeMethod *target);
    void registerField(const std::string &type, const FieldRecord &field);

    hotswap::vm::Runtime &rt_;
    hotswap::support::LogSink &log_;
    HookRecordSet records_;
    mutable std::mutex mutex_;
};

} // namespace hotswap::reload
