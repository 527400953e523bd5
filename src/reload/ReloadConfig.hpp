//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/ReloadConfig.hpp
// Purpose: Engine configuration and the project manifest that produces it.
// Key invariants: After parseManifest succeeds every module has a name and
//                 every source path is absolute.
// Ownership/Lifetime: Plain values owned by the caller.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "reload/Frontend.hpp"
#include "support/diag_expected.hpp"
#include "support/log.hpp"

#include <string>
#include <vector>

namespace hotswap::reload
{

/// @brief Engine settings.
struct ReloadConfig
{
    /// @brief Project name; names the temporary directory.
    std::string projectName{"default"};
    /// @brief Per-project temporary directory; derived from the system temp
    ///        directory and projectName when empty.
    std::string tempRoot;
    /// @brief Namespace prefixes of the runtime library, never hot reloaded.
    std::vector<std::string> builtinNamespaces{"core."};
    /// @brief Log verbosity and destination.
    hotswap::support::LogConfig log;
    /// @brief Save hook records after each applied batch.
    bool persistHooks{true};

    /// @brief tempRoot, or `<system temp>/hotswap/<projectName>`.
    std::string resolvedTempRoot() const;
    /// @brief Directory receiving synthesized patch modules.
    std::string outputDir() const;
    /// @brief File holding persisted hook records.
    std::string stateFile() const;
};

/// @brief Arguments of Initialize.
struct InitializeRequest
{
    ReloadConfig config;
    std::vector<ModuleContext> modules;
    std::vector<std::string> defines; ///< Global compile defines
};

/// @brief Parse a project manifest.
///
/// Line-oriented `directive value` pairs, `#` comments:
/// @code
///   project Game
///   define DEBUG
///   temp /tmp/game-reload
///   log debug
///   persist off
///   module Game
///     source src/Player.hsil
///     reference core
///     output build/Game.hsil
///     define FAST
///     unsafe on
///   end
/// @endcode
/// Relative paths are resolved against the manifest's directory.
hotswap::support::Expected<InitializeRequest> parseManifest(const std::string &manifestPath);

} // namespace hotswap::reload
