//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/Frontend.hpp
// Purpose: Boundary to the compiler that turns a module's sources into IR.
// Key invariants: A successful compile stamps every top-level type with the
//                 normalized path of the file that declared it.
// Ownership/Lifetime: Frontends are stateless from the engine's point of view
//                     and may be shared across modules.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"

#include <string>
#include <vector>

namespace hotswap::reload
{

/// @brief Everything needed to compile one module of the host program.
struct ModuleContext
{
    std::string name;
    std::vector<std::string> sources;    ///< Source files, normalized
    std::vector<std::string> references; ///< Referenced module names
    std::string outputPath;              ///< Module file the host loaded, if any
    std::vector<std::string> defines;    ///< Module-specific compile defines
    bool allowUnsafe = false;
};

/// @brief Absolute, lexically normal form of @p path used for file lookups.
std::string normalizeSourcePath(const std::string &path);

/// @brief Compiler front end.
class Frontend
{
  public:
    virtual ~Frontend() = default;

    /// @brief Compile @p ctx with the global @p defines plus its own.
    virtual hotswap::support::Expected<hotswap::core::Module> compile(
        const ModuleContext &ctx, const std::vector<std::string> &defines) = 0;
};

/// @brief Front end for textual IR sources.
/// @details Each source file holds `module <name>` followed by classes.  Lines
///          between `#if NAME`, `#else` and `#endif` are kept or blanked
///          against the active defines, so diagnostics keep their line
///          numbers.  Conditionals nest.
class AssemblerFrontend : public Frontend
{
  public:
    hotswap::support::Expected<hotswap::core::Module> compile(
        const ModuleContext &ctx, const std::vector<std::string> &defines) override;

    /// @brief Apply conditional compilation to @p text.
    static hotswap::support::Expected<std::string> preprocess(
        const std::string &text, const std::vector<std::string> &defines);

  private:
    hotswap::support::SourceManager sm_;
};

} // namespace hotswap::reload
