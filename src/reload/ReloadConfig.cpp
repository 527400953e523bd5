//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/ReloadConfig.cpp
// Purpose: Default paths of the engine and project manifest parsing.
//
//===----------------------------------------------------------------------===//

#include "reload/ReloadConfig.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace hotswap::reload
{

using hotswap::support::Diag;
using hotswap::support::Expected;

namespace
{

/// @brief Make a diagnostic error with a message.
Diag makeErr(const std::string &msg)
{
    return hotswap::support::makeError({}, msg);
}

/// @brief Make a diagnostic error with file:line context.
Diag makeManifestErr(const std::string &path, int line, const std::string &msg)
{
    return hotswap::support::makeError({}, path + ":" + std::to_string(line) + ": " + msg);
}

/// @brief Parse an on/off boolean value.
Expected<bool> parseBool(const std::string &val,
                         const std::string &manifestPath,
                         int line,
                         const std::string &directive)
{
    if (val == "on" || val == "true" || val == "yes")
        return true;
    if (val == "off" || val == "false" || val == "no")
        return false;
    return makeManifestErr(manifestPath, line,
                           "invalid value '" + val + "' for " + directive + "; expected on or off");
}

} // namespace

std::string ReloadConfig::resolvedTempRoot() const
{
    if (!tempRoot.empty())
        return tempRoot;
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec)
        base = fs::path("/tmp");
    return (base / "hotswap" / projectName).string();
}

std::string ReloadConfig::outputDir() const
{
    return (fs::path(resolvedTempRoot()) / "Output").string();
}

std::string ReloadConfig::stateFile() const
{
    return (fs::path(resolvedTempRoot()) / "hooks.state").string();
}

Expected<InitializeRequest> parseManifest(const std::string &manifestPath)
{
    std::ifstream file(manifestPath);
    if (!file.is_open())
        return makeErr("cannot open manifest: " + manifestPath);

    fs::path manifestDir = fs::path(manifestPath).parent_path();
    if (manifestDir.empty())
        manifestDir = fs::current_path();
    manifestDir = fs::absolute(manifestDir).lexically_normal();

    InitializeRequest req;
    req.config.projectName = manifestDir.filename().string();

    bool hasProject = false;
    bool hasTemp = false;
    bool hasLog = false;
    bool hasPersist = false;
    ModuleContext *current = nullptr;

    std::string line;
    int lineNum = 0;
    while (std::getline(file, line))
    {
        ++lineNum;

        // Strip leading/trailing whitespace
        auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos)
            continue;
        line = line.substr(start);
        auto end = line.find_last_not_of(" \t\r\n");
        if (end != std::string::npos)
            line = line.substr(0, end + 1);

        if (line.empty() || line[0] == '#')
            continue;

        if (line == "end")
        {
            if (!current)
                return makeManifestErr(manifestPath, lineNum, "'end' outside a module block");
            current = nullptr;
            continue;
        }

        auto spacePos = line.find_first_of(" \t");
        if (spacePos == std::string::npos)
            return makeManifestErr(manifestPath, lineNum, "directive missing value: '" + line + "'");

        std::string directive = line.substr(0, spacePos);
        std::string value = line.substr(line.find_first_not_of(" \t", spacePos));

        if (current)
        {
            if (directive == "source")
                current->sources.push_back(normalizeSourcePath((manifestDir / value).string()));
            else if (directive == "reference")
                current->references.push_back(value);
            else if (directive == "output")
            {
                if (!current->outputPath.empty())
                    return makeManifestErr(manifestPath, lineNum, "duplicate directive 'output'");
                current->outputPath = (manifestDir / value).lexically_normal().string();
            }
            else if (directive == "define")
                current->defines.push_back(value);
            else if (directive == "unsafe")
            {
                auto b = parseBool(value, manifestPath, lineNum, "unsafe");
                if (!b)
                    return b.error();
                current->allowUnsafe = b.value();
            }
            else
                return makeManifestErr(manifestPath, lineNum,
                                       "unknown module directive '" + directive + "'");
            continue;
        }

        if (directive == "project")
        {
            if (hasProject)
                return makeManifestErr(manifestPath, lineNum, "duplicate directive 'project'");
            hasProject = true;
            req.config.projectName = value;
        }
        else if (directive == "define")
        {
            req.defines.push_back(value);
        }
        else if (directive == "temp")
        {
            if (hasTemp)
                return makeManifestErr(manifestPath, lineNum, "duplicate directive 'temp'");
            hasTemp = true;
            req.config.tempRoot = (manifestDir / value).lexically_normal().string();
        }
        else if (directive == "log")
        {
            if (hasLog)
                return makeManifestErr(manifestPath, lineNum, "duplicate directive 'log'");
            hasLog = true;
            if (!hotswap::support::parseLogLevel(value, req.config.log.level))
                return makeManifestErr(manifestPath, lineNum,
                                       "invalid log level '" + value +
                                           "'; expected off, error, info or debug");
        }
        else if (directive == "persist")
        {
            if (hasPersist)
                return makeManifestErr(manifestPath, lineNum, "duplicate directive 'persist'");
            hasPersist = true;
            auto b = parseBool(value, manifestPath, lineNum, "persist");
            if (!b)
                return b.error();
            req.config.persistHooks = b.value();
        }
        else if (directive == "module")
        {
            for (const auto &m : req.modules)
            {
                if (m.name == value)
                    return makeManifestErr(manifestPath, lineNum,
                                           "duplicate module '" + value + "'");
            }
            req.modules.emplace_back();
            current = &req.modules.back();
            current->name = value;
        }
        else
        {
            return makeManifestErr(manifestPath, lineNum,
                                   "unknown directive '" + directive + "'");
        }
    }

    if (current)
        return makeManifestErr(manifestPath, lineNum,
                               "missing 'end' for module '" + current->name + "'");
    if (req.modules.empty())
        return makeErr(manifestPath + ": no modules declared");
    return req;
}

} // namespace hotswap::reload
