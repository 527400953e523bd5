//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/PatchSynthesizer.hpp
// Purpose: Turn a member diff into a patch module that loads beside the
//          running module and reaches back into it.
// Key invariants: Every reference in the patch resolves against the loaded
//                 module, an earlier patch module, the runtime library or the
//                 patch itself, never against the freshly compiled shadow.
//                 A member whose code cannot be expressed that way is reported
//                 as a failure and left out; the rest of the patch stands.
// Ownership/Lifetime: The synthesizer is stateless; results are values.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Patch synthesis and the on-disk patch writer.
/// @details Per diffed type T the patch holds a holder type `T$Patch` with one
///          public static non-inlinable wrapper per added or modified method.
///          Instance methods take the receiver as an explicit first `self`
///          parameter typed as the loaded T.  Types the compile introduced
///          are copied into the patch whole; their own methods are the first
///          wrappers of their members.  Closures and state machines the
///          wrappers use are copied in on first reference.

#pragma once

#include "reload/Diff.hpp"
#include "reload/HookRecords.hpp"
#include "reload/ReloadConfig.hpp"
#include "support/diag_expected.hpp"
#include "support/log.hpp"

#include <functional>
#include <string>
#include <vector>

namespace hotswap::reload
{

/// @brief A member that received a wrapper.
struct PatchedMember
{
    std::string type;
    std::string member;
    MemberState state = MemberState::Modified;
    WrapperRef wrapper;
};

/// @brief An added field routed through the field indirection table.
struct PatchedField
{
    std::string type;
    FieldRecord record;
};

/// @brief A member left out of the patch, with the reason.
struct MemberFailure
{
    std::string type;
    std::string member;
    std::string reason;
};

struct PatchResult
{
    std::string sourceModule; ///< Module the diff was taken from
    std::string moduleName;   ///< Name of the patch module
    std::string path;         ///< Set once written
    hotswap::core::Module patch;
    std::vector<PatchedMember> members;
    std::vector<PatchedField> fields;
    std::vector<IntroducedType> introduced;
    std::vector<MemberFailure> failures;

    /// @brief Nothing to load or register.
    bool empty() const
    {
        return members.empty() && fields.empty() && introduced.empty();
    }
};

class PatchSynthesizer
{
  public:
    PatchSynthesizer(const ReloadConfig &config, hotswap::support::LogSink &log)
        : config_(config), log_(log)
    {
    }

    /// @brief Build the patch module named @p patchModule for @p diff.
    /// @param records Hooks applied so far; members added by earlier patches
    ///        are reached through their current wrappers.
    PatchResult synthesize(const DiffResult &diff,
                           const HookRecordSet &records,
                           const std::string &patchModule) const;

    /// @brief Holder type receiving the wrappers of @p type.
    static std::string holderName(const std::string &type);

    /// @brief Name of the wrapper of method @p name.
    static std::string wrapperName(const std::string &name);

  private:
    const ReloadConfig &config_;
    hotswap::support::LogSink &log_;
};

/// @brief Persists patch modules under one output directory.
class PatchWriter
{
  public:
    explicit PatchWriter(std::string outputDir) : dir_(std::move(outputDir)) {}

    /// @brief First `<module>.patch.NNNN` name with no file on disk for
    ///        which @p inUse returns false.
    std::string nextModuleName(const std::string &module,
                               const std::function<bool(const std::string &)> &inUse) const;

    /// @brief Serialize @p patch to `<dir>/<moduleName>.hsil` and stamp the
    ///        path onto every wrapper and introduced type.
    [[nodiscard]] hotswap::support::Expected<void> write(PatchResult &patch) const;

    const std::string &outputDir() const
    {
        return dir_;
    }

  private:
    std::string dir_;
};

} // namespace hotswap::reload
