//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Assembles a module from textual IR files.  Files are parsed one at a time
// into scratch modules and merged; the first diagnostic aborts the compile.
//
//===----------------------------------------------------------------------===//

#include "il/io/Parser.hpp"
#include "reload/Frontend.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace hotswap::reload
{

using hotswap::core::Module;
using hotswap::support::Expected;
using hotswap::support::makeError;

std::string normalizeSourcePath(const std::string &path)
{
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec)
        abs = fs::path(path);
    return abs.lexically_normal().string();
}

Expected<std::string> AssemblerFrontend::preprocess(const std::string &text,
                                                    const std::vector<std::string> &defines)
{
    struct Branch
    {
        bool parentActive;
        bool taken;
        bool inElse;
    };
    std::vector<Branch> stack;
    bool active = true;
    std::istringstream is(text);
    std::ostringstream out;
    std::string line;
    unsigned lineNo = 0;
    while (std::getline(is, line))
    {
        ++lineNo;
        const auto start = line.find_first_not_of(" \t");
        const std::string body = start == std::string::npos ? std::string() : line.substr(start);
        if (body.rfind("#if ", 0) == 0)
        {
            std::string name = body.substr(4);
            name.erase(name.find_last_not_of(" \t\r") + 1);
            const bool cond =
                std::find(defines.begin(), defines.end(), name) != defines.end();
            stack.push_back(Branch{active, cond, false});
            active = active && cond;
            out << '\n';
            continue;
        }
        if (body.rfind("#else", 0) == 0)
        {
            if (stack.empty() || stack.back().inElse)
                return makeError({}, "line " + std::to_string(lineNo) + ": unexpected #else");
            stack.back().inElse = true;
            active = stack.back().parentActive && !stack.back().taken;
            out << '\n';
            continue;
        }
        if (body.rfind("#endif", 0) == 0)
        {
            if (stack.empty())
                return makeError({}, "line " + std::to_string(lineNo) + ": unexpected #endif");
            active = stack.back().parentActive;
            stack.pop_back();
            out << '\n';
            continue;
        }
        out << (active ? line : std::string()) << '\n';
    }
    if (!stack.empty())
        return makeError({}, "unterminated #if");
    return out.str();
}

Expected<Module> AssemblerFrontend::compile(const ModuleContext &ctx,
                                            const std::vector<std::string> &defines)
{
    std::vector<std::string> active = defines;
    active.insert(active.end(), ctx.defines.begin(), ctx.defines.end());

    Module merged;
    merged.name = ctx.name;
    std::set<std::string> refs(ctx.references.begin(), ctx.references.end());

    for (const auto &src : ctx.sources)
    {
        const std::string path = normalizeSourcePath(src);
        std::ifstream file(path);
        if (!file)
            return makeError({}, "cannot open source file '" + path + "'");
        std::stringstream buf;
        buf << file.rdbuf();

        auto text = preprocess(buf.str(), active);
        if (!text)
            return makeError({}, path + ": " + text.error().message);

        std::istringstream is(text.value());
        Module part;
        const uint32_t fileId = sm_.addFile(path);
        if (auto ok = hotswap::io::Parser::parse(is, part, fileId); !ok)
            return makeError({}, hotswap::support::formatDiag(ok.error(), &sm_));
        if (part.name != ctx.name)
            return makeError({}, path + ": declares module '" + part.name + "', expected '" +
                                     ctx.name + "'");
        refs.insert(part.references.begin(), part.references.end());
        for (auto &t : part.types)
        {
            if (merged.findType(t.name))
                return makeError({}, path + ": class '" + t.name +
                                         "' is already declared in another file");
            t.sourceFile = path;
            merged.types.push_back(std::move(t));
        }
    }
    merged.references.assign(refs.begin(), refs.end());
    return merged;
}

} // namespace hotswap::reload
