//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Reload service.  Each module carries a recursive mutex held by every
// operation on it, so a whole cycle (compile, diff, synthesize, write, hook)
// runs as one unit while the individual operations stay callable on their
// own.  submit() hands cycles to the module's serial queue.
//
//===----------------------------------------------------------------------===//

#include "reload/ReloadEngine.hpp"

#include <chrono>
#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace hotswap::reload
{

using hotswap::core::Module;
using hotswap::support::Expected;
using hotswap::support::makeError;

ReloadEngine::ReloadEngine(ReloadConfig config,
                           hotswap::vm::Runtime &rt,
                           std::shared_ptr<Frontend> frontend)
    : config_(std::move(config)), rt_(rt), frontend_(std::move(frontend)), log_(config_.log),
      diff_(log_), synth_(config_, log_), writer_(config_.outputDir()), hooks_(rt_, log_)
{
}

ReloadEngine::~ReloadEngine() = default;

namespace
{
/// Copy of @p loaded whose types name the files that declare them in
/// @p compiled, for builds that were written without source attributes.
Module withSourceFiles(const Module &loaded, const Module &compiled)
{
    Module out = loaded;
    for (auto &t : out.types)
    {
        if (!t.sourceFile.empty())
            continue;
        if (const auto *c = compiled.findType(t.name))
            t.sourceFile = c->sourceFile;
    }
    return out;
}
} // namespace

ReloadEngine::ModuleState *ReloadEngine::state(const std::string &module) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = modules_.find(module);
    return it == modules_.end() ? nullptr : it->second.get();
}

Expected<InitializeResult> ReloadEngine::initialize(const std::vector<ModuleContext> &modules,
                                                    const std::vector<std::string> &defines)
{
    if (!frontend_)
        return makeError({}, "no front end configured");

    InitializeResult result;
    const std::string stateFile = config_.stateFile();
    std::error_code ec;
    if (config_.persistHooks && fs::exists(stateFile, ec))
    {
        auto records = HookRecordSet::load(stateFile);
        if (records)
            result.records = std::move(records.value());
        else
            log_.error("reload", "ignoring hook state: " + records.error().message);
    }
    // Patch modules are named `<module>.patch.NNNN`.
    std::set<std::string> hooked;
    for (const auto &[patch, path] : result.records.patchModules())
    {
        if (auto pos = patch.rfind(".patch."); pos != std::string::npos)
            hooked.insert(patch.substr(0, pos));
    }

    std::map<std::string, std::unique_ptr<ModuleState>> states;
    for (const auto &ctx : modules)
    {
        if (states.count(ctx.name))
            return makeError({}, "module '" + ctx.name + "' is declared twice");
        auto compiled = frontend_->compile(ctx, defines);
        if (!compiled)
            return makeError({}, "module '" + ctx.name +
                                     "': compile failed: " + compiled.error().message);

        auto st = std::make_unique<ModuleState>(ctx, config_.builtinNamespaces);
        st->graph.index(compiled.value());

        // Persisted hooks were produced from the sources, so with records the
        // compile is current.  Without them the loaded build is, and the
        // first edit is diffed against it.
        Module baseline;
        Module latest;
        if (const hotswap::vm::LoadedModule *lm = rt_.findModule(ctx.name))
        {
            baseline = *lm->module;
            if (hooked.count(ctx.name))
                latest = std::move(compiled.value());
            else
                latest = withSourceFiles(baseline, compiled.value());
        }
        else
        {
            baseline = compiled.value();
            latest = std::move(compiled.value());
        }

        std::vector<std::string> sources;
        for (const auto &s : ctx.sources)
            sources.push_back(normalizeSourcePath(s));
        store_.initialize(ctx.name, std::move(baseline), std::move(latest), sources);
        log_.debug("reload", ctx.name + ": indexed " + std::to_string(st->graph.calleeCount()) +
                                 " generic callees");
        result.modules.push_back(ctx.name);
        states.emplace(ctx.name, std::move(st));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        modules_ = std::move(states);
        defines_ = defines;
        initialized_ = true;
    }

    log_.info("reload", "initialized " + std::to_string(result.modules.size()) + " modules, " +
                            std::to_string(result.records.memberCount()) + " persisted hooks");
    return result;
}

Expected<std::optional<DiffResult>> ReloadEngine::compileAndDiff(
    const std::string &module, const std::vector<std::string> &files)
{
    ModuleState *st = state(module);
    if (!st)
        return makeError({}, "module '" + module + "' is not initialized");
    std::lock_guard<std::recursive_mutex> lock(st->mutex);

    std::vector<std::string> defines;
    {
        std::lock_guard<std::mutex> g(mutex_);
        defines = defines_;
    }
    auto compiled = frontend_->compile(st->context, defines);
    if (!compiled)
    {
        log_.error("reload", module + ": compile failed: " + compiled.error().message);
        return makeError({}, "compile failed: " + compiled.error().message);
    }

    std::vector<std::string> changed;
    for (const auto &f : files)
        changed.push_back(normalizeSourcePath(f));

    auto candidate = std::make_shared<const Module>(std::move(compiled.value()));
    std::optional<DiffResult> result = diff_.diff(module, candidate, changed, store_, st->graph);
    if (!result)
    {
        store_.commit(module, candidate);
        log_.info("reload", module + ": no changes");
    }
    else
        log_.info("reload", module + ": " + std::to_string(result->memberCount()) +
                                " changed members in " + std::to_string(result->types.size()) +
                                " types");
    return result;
}

Expected<PatchResult> ReloadEngine::synthesizeAndWritePatch(const DiffResult &diff)
{
    ModuleState *st = state(diff.module);
    if (!st)
        return makeError({}, "module '" + diff.module + "' is not initialized");
    std::lock_guard<std::recursive_mutex> lock(st->mutex);

    std::string name;
    {
        std::lock_guard<std::mutex> g(mutex_);
        name = writer_.nextModuleName(diff.module, [&](const std::string &n)
                                      { return reservedNames_.count(n) || rt_.findModule(n); });
        reservedNames_.insert(name);
    }

    PatchResult patch = synth_.synthesize(diff, hooks_.records(), name);
    if (patch.empty())
    {
        log_.info("reload", diff.module + ": nothing to write");
        return patch;
    }
    if (auto ok = writer_.write(patch); !ok)
        return ok.error();
    log_.info("reload", "wrote " + patch.path);
    return patch;
}

void ReloadEngine::commit(const DiffResult &diff)
{
    ModuleState *st = state(diff.module);
    if (!st)
        return;
    std::lock_guard<std::recursive_mutex> lock(st->mutex);
    store_.commit(diff.module, diff.candidate);
    log_.debug("reload", diff.module + ": snapshot advanced");
}

HookReport ReloadEngine::applyHooks(const PatchResult &patch)
{
    if (patch.empty())
        return {};
    HookReport report = hooks_.apply(patch);
    persist();
    return report;
}

HookReport ReloadEngine::applyHooks(const HookRecordSet &records)
{
    HookReport report = hooks_.applyRecords(records);
    persist();
    return report;
}

void ReloadEngine::persist()
{
    if (!config_.persistHooks)
        return;
    std::lock_guard<std::mutex> lock(persistMutex_);
    if (auto ok = hooks_.records().save(config_.stateFile()); !ok)
        log_.error("reload", "cannot save hook state: " + ok.error().message);
}

std::map<std::string, std::vector<std::string>> ReloadEngine::groupByModule(
    const std::vector<std::string> &files)
{
    std::map<std::string, std::vector<std::string>> groups;
    for (const auto &f : files)
    {
        const std::string path = normalizeSourcePath(f);
        if (auto owner = store_.moduleForFile(path))
            groups[*owner].push_back(path);
        else
            log_.debug("reload", "ignoring " + path + ": not part of any module");
    }
    return groups;
}

CycleResult ReloadEngine::runCycle(const std::string &module, const std::vector<std::string> &files)
{
    const auto start = std::chrono::steady_clock::now();
    CycleResult result;
    result.module = module;
    auto finish = [&]()
    {
        result.elapsedMs =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
                .count();
        return result;
    };

    ModuleState *st = state(module);
    if (!st)
    {
        result.error = "module '" + module + "' is not initialized";
        return finish();
    }
    std::lock_guard<std::recursive_mutex> lock(st->mutex);

    auto diff = compileAndDiff(module, files);
    if (!diff)
    {
        result.error = diff.error().message;
        return finish();
    }
    if (!diff.value())
    {
        result.success = true;
        return finish();
    }
    result.changed = true;

    auto patch = synthesizeAndWritePatch(*diff.value());
    if (!patch)
    {
        result.error = patch.error().message;
        log_.error("reload", module + ": " + result.error);
        return finish();
    }
    result.patchPath = patch.value().path;
    result.failures = patch.value().failures;

    HookReport report = applyHooks(patch.value());
    // A patch that could not be loaded hooks nothing; keep the snapshot so
    // the next save of the same edit is diffed again.
    if (!report.applied.empty() || report.failures.empty())
        commit(*diff.value());
    result.applied = std::move(report.applied);
    result.failures.insert(result.failures.end(), report.failures.begin(), report.failures.end());
    result.success = true;
    finish();
    log_.info("reload", module + ": " + std::to_string(result.applied.size()) + " hooked, " +
                            std::to_string(result.failures.size()) + " failed in " +
                            std::to_string(static_cast<long>(result.elapsedMs)) + " ms");
    return result;
}

std::vector<CycleResult> ReloadEngine::reload(const std::vector<std::string> &files)
{
    std::vector<CycleResult> results;
    for (const auto &[module, group] : groupByModule(files))
        results.push_back(runCycle(module, group));
    return results;
}

std::vector<std::future<CycleResult>> ReloadEngine::submit(const std::vector<std::string> &files)
{
    std::vector<std::future<CycleResult>> futures;
    for (auto &[module, group] : groupByModule(files))
    {
        ModuleState *st = state(module);
        if (!st)
            continue;
        futures.push_back(st->queue.submit([this, module = module, group = std::move(group)]()
                                           { return runCycle(module, group); }));
    }
    return futures;
}

bool ReloadEngine::isInitialized() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

HookRecordSet ReloadEngine::hookRecords() const
{
    return hooks_.records();
}

void ReloadEngine::clear()
{
    std::map<std::string, std::unique_ptr<ModuleState>> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped.swap(modules_);
        reservedNames_.clear();
        defines_.clear();
        initialized_ = false;
    }
    // Queued cycles drain here and find their module gone.
    dropped.clear();
    store_.clear();
    hooks_.reset();
    std::error_code ec;
    fs::remove(config_.stateFile(), ec);
    log_.info("reload", "cleared");
}

} // namespace hotswap::reload
