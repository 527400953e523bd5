//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Hook application.  A member's record lists every wrapper issued for it, in
// order; hooking a new wrapper redirects the original entry point (modified
// members) and each listed wrapper to it, then appends it.  Re-applying
// persisted records replays the same edges with the last listed wrapper as
// the target.
//
//===----------------------------------------------------------------------===//

#include "reload/HookApplier.hpp"

#include <map>

namespace hotswap::reload
{

using hotswap::support::Expected;
using hotswap::support::makeError;
using hotswap::vm::LoadedModule;
using hotswap::vm::RuntimeMethod;
using hotswap::vm::Value;

Expected<LoadedModule *> HookApplier::loadPatch(const std::string &module, const std::string &path)
{
    if (LoadedModule *lm = rt_.findModule(module))
        return lm;
    if (path.empty())
        return makeError({}, "patch module '" + module + "' has not been written");
    auto lm = rt_.loadFile(path);
    if (!lm)
        return lm.error();
    for (const auto &[sig, m] : lm.value()->methods)
        rt_.disableVisibilityChecks(m);
    log_.debug("hook", "loaded " + module + " from " + path);
    return lm;
}

RuntimeMethod *HookApplier::resolve(const WrapperRef &w) const
{
    return rt_.findMethod(w.module, w.signature);
}

Expected<void> HookApplier::hook(const std::string &typeModule,
                                 const MemberRecord &rec,
                                 RuntimeMethod *target)
{
    RuntimeMethod *original = nullptr;
    if (rec.state == MemberState::Modified)
    {
        original = rt_.findMethod(typeModule, rec.member);
        if (!original)
            return makeError({}, "original method is not loaded in module '" + typeModule + "'");
    }
    for (const auto &w : rec.history)
    {
        RuntimeMethod *earlier = resolve(w);
        if (earlier == target)
            continue;
        if (!earlier)
            return makeError({}, "wrapper " + w.signature + " is missing from " + w.module);
        if (auto ok = rt_.redirect(earlier, target); !ok)
            return makeError({}, "wrapper in " + w.module + ": " + ok.error().message);
    }
    // The original switches last: until then callers keep the body its
    // record names.
    if (original)
    {
        if (auto ok = rt_.redirect(original, target); !ok)
            return ok;
    }
    return {};
}

void HookApplier::registerField(const std::string &type, const FieldRecord &field)
{
    Value initial = hotswap::vm::defaultValueFor(field.typeName);
    if (field.hasInitializer())
    {
        auto v = rt_.invoke(field.initModule, field.initSignature, {});
        if (v)
            initial = std::move(v.value());
        else
            log_.error("hook", field.field + ": initializer failed: " + v.error().message);
    }
    rt_.fields().registerInitializer(type, field.name, std::move(initial));
    log_.debug("hook", "field " + field.field);
}

HookReport HookApplier::apply(const PatchResult &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    HookReport report;

    auto lm = loadPatch(patch.moduleName, patch.path);
    if (!lm)
    {
        for (const auto &m : patch.members)
            report.failures.push_back(MemberFailure{m.type, m.member, lm.error().message});
        for (const auto &f : patch.fields)
            report.failures.push_back(MemberFailure{f.type, f.record.field, lm.error().message});
        log_.error("hook", patch.moduleName + ": " + lm.error().message);
        return report;
    }

    for (const auto &it : patch.introduced)
        records_.introduced.insert_or_assign(it.name, it);

    for (const auto &f : patch.fields)
    {
        registerField(f.type, f.record);
        TypeRecord &tr = records_.types[f.type];
        if (tr.module.empty())
            tr.module = patch.sourceModule;
        tr.fields.insert_or_assign(f.record.field, f.record);
    }

    for (const auto &m : patch.members)
    {
        const IntroducedType *intro = records_.findIntroduced(m.type);
        const std::string typeModule = intro ? intro->module : patch.sourceModule;

        RuntimeMethod *target = resolve(m.wrapper);
        if (!target)
        {
            const std::string reason =
                "wrapper " + m.wrapper.signature + " not found in " + m.wrapper.module;
            report.failures.push_back(MemberFailure{m.type, m.member, reason});
            log_.error("hook", m.member + ": " + reason);
            continue;
        }

        const MemberRecord *existing = records_.findMember(m.type, m.member);
        MemberRecord pending = existing ? *existing : MemberRecord{m.member, m.state, {}};
        if (auto ok = hook(typeModule, pending, target); !ok)
        {
            report.failures.push_back(MemberFailure{m.type, m.member, ok.error().message});
            log_.error("hook", m.member + ": " + ok.error().message);
            continue;
        }
        records_.member(typeModule, m.type, m.member, m.state).history.push_back(m.wrapper);
        report.applied.push_back(m.member);
        log_.debug("hook", std::string(toString(pending.state)) + " " + m.member + " -> " +
                               m.wrapper.module);
    }
    return report;
}

HookReport HookApplier::applyRecords(const HookRecordSet &records)
{
    std::lock_guard<std::mutex> lock(mutex_);
    HookReport report;

    // A patch may reference patches of other modules that sort after it;
    // retry until a pass loads nothing new.
    std::map<std::string, std::string> pending = records.patchModules();
    std::map<std::string, std::string> broken;
    for (bool progress = true; progress && !pending.empty();)
    {
        progress = false;
        broken.clear();
        for (auto it = pending.begin(); it != pending.end();)
        {
            auto lm = loadPatch(it->first, it->second);
            if (lm)
            {
                it = pending.erase(it);
                progress = true;
                continue;
            }
            broken.insert_or_assign(it->first, lm.error().message);
            ++it;
        }
    }
    for (const auto &[module, reason] : broken)
        log_.error("hook", module + ": " + reason);

    for (const auto &[name, t] : records.types)
    {
        for (const auto &[sig, f] : t.fields)
        {
            if (f.hasInitializer() && broken.count(f.initModule))
            {
                report.failures.push_back(MemberFailure{name, sig, broken.at(f.initModule)});
                continue;
            }
            registerField(name, f);
        }
        for (const auto &[sig, rec] : t.members)
        {
            const WrapperRef *cur = rec.current();
            if (!cur)
                continue;
            if (auto b = broken.find(cur->module); b != broken.end())
            {
                report.failures.push_back(MemberFailure{name, sig, b->second});
                continue;
            }
            RuntimeMethod *target = resolve(*cur);
            if (!target)
            {
                report.failures.push_back(
                    MemberFailure{name, sig, "wrapper " + cur->signature + " not found in " +
                                                 cur->module});
                continue;
            }
            if (auto ok = hook(t.module, rec, target); !ok)
            {
                report.failures.push_back(MemberFailure{name, sig, ok.error().message});
                log_.error("hook", sig + ": " + ok.error().message);
                continue;
            }
            report.applied.push_back(sig);
        }
    }
    records_ = records;
    log_.info("hook", "restored " + std::to_string(report.applied.size()) + " hooks, " +
                          std::to_string(report.failures.size()) + " failed");
    return report;
}

HookRecordSet HookApplier::records() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

void HookApplier::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    records_ = HookRecordSet{};
}

} // namespace hotswap::reload
