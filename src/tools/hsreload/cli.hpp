//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/hsreload/cli.hpp
// Purpose: Command-line surface of hsreload.
// Key invariants: parseArgs never touches the file system.
// Ownership/Lifetime: Options own copies of every argument.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diag_expected.hpp"
#include "support/log.hpp"
#include "tools/common/ArgvView.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace hotswap::tools
{

struct ReloadOptions
{
    std::string manifest;
    std::vector<std::string> defines;
    std::optional<hotswap::support::LogConfig::Level> logLevel;
    std::vector<std::string> entries; ///< `Type::Method` invoked around the reload
    std::vector<std::string> files;
    bool restoreHooks = true;
    bool help = false;
};

/// @brief Parse the arguments following the program name.
hotswap::support::Expected<ReloadOptions> parseArgs(ArgvView args);

void printUsage(std::ostream &os);

/// @brief Load the manifest's modules, run one reload cycle and report.
/// @return Process exit status.
int runReload(const ReloadOptions &opts, std::ostream &out, std::ostream &err);

} // namespace hotswap::tools
