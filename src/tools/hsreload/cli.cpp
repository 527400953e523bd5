//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// hsreload: loads a project's modules into a fresh runtime the way a host
// would, restores persisted hooks, reloads the named files once and prints
// what changed.  Entry methods given with --run execute before and after the
// reload so the effect is visible.
//
//===----------------------------------------------------------------------===//

#include "tools/hsreload/cli.hpp"

#include "reload/Frontend.hpp"
#include "reload/ReloadConfig.hpp"
#include "reload/ReloadEngine.hpp"
#include "vm/Runtime.hpp"

#include <filesystem>
#include <memory>

namespace hotswap::tools
{

using hotswap::reload::ModuleContext;
using hotswap::support::Expected;
using hotswap::support::makeError;

namespace
{

hotswap::vm::RuntimeMethod *findEntry(hotswap::vm::Runtime &rt,
                                      const std::vector<ModuleContext> &modules,
                                      const std::string &entry)
{
    const auto colons = entry.rfind("::");
    if (colons == std::string::npos)
        return nullptr;
    const std::string type = entry.substr(0, colons);
    const std::string method = entry.substr(colons + 2);
    for (const auto &ctx : modules)
    {
        hotswap::vm::RuntimeType *t = rt.findType(ctx.name, type);
        if (!t)
            continue;
        for (const auto &[sig, m] : t->methods)
        {
            if (m->isStatic && m->arity == 0 && m->name() == method)
                return m;
        }
    }
    return nullptr;
}

void runEntries(hotswap::vm::Runtime &rt,
                const std::vector<ModuleContext> &modules,
                const std::vector<std::string> &entries,
                const char *phase,
                std::ostream &out,
                std::ostream &err)
{
    for (const auto &entry : entries)
    {
        hotswap::vm::RuntimeMethod *m = findEntry(rt, modules, entry);
        if (!m)
        {
            err << "hsreload: no static parameterless method " << entry << "\n";
            continue;
        }
        auto v = rt.invoke(m, {});
        if (!v)
        {
            err << "hsreload: " << entry << " (" << phase << "): " << v.error().message << "\n";
            continue;
        }
        out << phase << ": " << entry << " = " << v.value().toString() << "\n";
    }
}

Expected<void> loadBaseline(hotswap::vm::Runtime &rt,
                            hotswap::reload::Frontend &frontend,
                            const ModuleContext &ctx,
                            const std::vector<std::string> &defines)
{
    std::error_code ec;
    if (!ctx.outputPath.empty() && std::filesystem::exists(ctx.outputPath, ec))
    {
        auto lm = rt.loadFile(ctx.outputPath);
        if (!lm)
            return lm.error();
        return {};
    }
    auto compiled = frontend.compile(ctx, defines);
    if (!compiled)
        return makeError({}, "module '" + ctx.name + "': " + compiled.error().message);
    auto lm = rt.load(std::move(compiled.value()));
    if (!lm)
        return lm.error();
    return {};
}

} // namespace

void printUsage(std::ostream &os)
{
    os << "Usage: hsreload <project.manifest> [options] <changed files...>\n"
       << "\n"
       << "Options:\n"
       << "  -D, --define NAME      Add a compile define\n"
       << "  --trace                Log every diff, synthesis and hook decision\n"
       << "  --log LEVEL            off, error, info or debug\n"
       << "  --run Type::Method     Invoke a static entry method before and after\n"
       << "  --no-restore           Ignore hooks persisted by an earlier session\n"
       << "  -h, --help             Show this help message\n";
}

Expected<ReloadOptions> parseArgs(ArgvView args)
{
    ReloadOptions opts;
    std::string_view arg;
    while (args.take(arg))
    {
        auto value = [&](std::string &into) -> bool
        {
            std::string_view v;
            if (!args.take(v))
                return false;
            into = std::string(v);
            return true;
        };

        if (arg == "-h" || arg == "--help")
        {
            opts.help = true;
            continue;
        }
        if (arg == "-D" || arg == "--define")
        {
            std::string name;
            if (!value(name))
                return makeError({}, std::string(arg) + " requires a name");
            opts.defines.push_back(std::move(name));
            continue;
        }
        if (arg == "--trace")
        {
            opts.logLevel = hotswap::support::LogConfig::Debug;
            continue;
        }
        if (arg == "--log")
        {
            std::string text;
            hotswap::support::LogConfig::Level level;
            if (!value(text) || !hotswap::support::parseLogLevel(text, level))
                return makeError({}, "--log expects off, error, info or debug");
            opts.logLevel = level;
            continue;
        }
        if (arg == "--run")
        {
            std::string entry;
            if (!value(entry) || entry.find("::") == std::string::npos)
                return makeError({}, "--run expects Type::Method");
            opts.entries.push_back(std::move(entry));
            continue;
        }
        if (arg == "--no-restore")
        {
            opts.restoreHooks = false;
            continue;
        }
        if (arg.size() > 1 && arg.front() == '-')
            return makeError({}, "unknown option '" + std::string(arg) + "'");
        if (opts.manifest.empty())
            opts.manifest = std::string(arg);
        else
            opts.files.emplace_back(arg);
    }
    if (!opts.help && opts.manifest.empty())
        return makeError({}, "missing project manifest");
    return opts;
}

int runReload(const ReloadOptions &opts, std::ostream &out, std::ostream &err)
{
    auto request = hotswap::reload::parseManifest(opts.manifest);
    if (!request)
    {
        hotswap::support::printDiag(request.error(), err);
        return 1;
    }
    auto &req = request.value();
    req.defines.insert(req.defines.end(), opts.defines.begin(), opts.defines.end());
    if (opts.logLevel)
        req.config.log.level = *opts.logLevel;
    req.config.log.stream = &err;

    hotswap::vm::Runtime rt(&out);
    auto frontend = std::make_shared<hotswap::reload::AssemblerFrontend>();
    for (const auto &ctx : req.modules)
    {
        if (auto ok = loadBaseline(rt, *frontend, ctx, req.defines); !ok)
        {
            hotswap::support::printDiag(ok.error(), err);
            return 1;
        }
    }

    hotswap::reload::ReloadEngine engine(req.config, rt, frontend);
    auto init = engine.initialize(req.modules, req.defines);
    if (!init)
    {
        hotswap::support::printDiag(init.error(), err);
        return 1;
    }
    if (opts.restoreHooks && !init.value().records.empty())
    {
        auto restored = engine.applyHooks(init.value().records);
        out << "restored " << restored.applied.size() << " hooks\n";
        for (const auto &f : restored.failures)
            err << "hsreload: " << f.member << ": " << f.reason << "\n";
    }

    runEntries(rt, req.modules, opts.entries, "before", out, err);

    int status = 0;
    for (const auto &r : engine.reload(opts.files))
    {
        if (!r.success)
        {
            err << "hsreload: " << r.module << ": " << r.error << "\n";
            status = 1;
            continue;
        }
        if (!r.changed)
        {
            out << r.module << ": no changes\n";
            continue;
        }
        out << r.module << ": " << r.patchPath << " (" << static_cast<long>(r.elapsedMs)
            << " ms)\n";
        for (const auto &m : r.applied)
            out << "  hooked " << m << "\n";
        for (const auto &f : r.failures)
        {
            out << "  failed " << f.member << ": " << f.reason << "\n";
            status = 1;
        }
    }

    runEntries(rt, req.modules, opts.entries, "after", out, err);
    return status;
}

} // namespace hotswap::tools
