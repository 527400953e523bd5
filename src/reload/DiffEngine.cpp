//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/DiffEngine.cpp
// Purpose: Per-type member diffing and the generic caller cascade.
//
// A member's state is decided against the baseline: anything the live
// process loaded is Modified, anything else is Added.  Whether a member
// changed at all is decided against the latest snapshot, falling back to the
// baseline for a type that vanished from the latest compile.
//
//===----------------------------------------------------------------------===//

#include "reload/DiffEngine.hpp"

#include "il/analysis/BodyComparer.hpp"
#include "reload/Frontend.hpp"

#include <set>

namespace hotswap::reload
{

using hotswap::analysis::BodyComparer;
using hotswap::analysis::CallGraphIndex;
using hotswap::analysis::IndexedMethod;
using hotswap::core::FieldDef;
using hotswap::core::MethodDef;
using hotswap::core::Module;
using hotswap::core::TypeDef;

namespace
{

/// @brief Collect @p t and its nested types that are not compiler generated.
void collectDeclared(const TypeDef &t, std::vector<const TypeDef *> &out)
{
    if (t.compilerGenerated)
        return;
    out.push_back(&t);
    for (const auto &n : t.nested)
        collectDeclared(n, out);
}

bool hasMethod(const TypeDef *t, const std::string &sig)
{
    return t && t->findMethod(sig) != nullptr;
}

} // namespace

std::optional<DiffResult> DiffEngine::diff(const std::string &module,
                                           std::shared_ptr<const Module> candidate,
                                           const std::vector<std::string> &changedFiles,
                                           const SnapshotStore &store,
                                           CallGraphIndex &graph)
{
    auto latest = store.latest(module);
    auto baseline = store.baseline(module);
    if (!candidate || !latest || !baseline)
        return std::nullopt;

    std::set<std::string> touched = store.typesInFiles(module, changedFiles);
    std::set<std::string> files;
    for (const auto &f : changedFiles)
        files.insert(normalizeSourcePath(f));
    for (const auto &t : candidate->types)
    {
        if (!t.sourceFile.empty() && files.count(normalizeSourcePath(t.sourceFile)))
            touched.insert(t.name);
    }

    DiffResult out;
    out.module = module;
    out.candidate = candidate;
    out.baseline = baseline;

    for (const auto &name : touched)
    {
        const TypeDef *top = candidate->findType(name);
        if (!top)
        {
            log_.debug("diff", "type " + name + " was removed; its members stay as loaded");
            continue;
        }
        std::vector<const TypeDef *> declared;
        collectDeclared(*top, declared);
        for (const TypeDef *t : declared)
            diffType(*t, *latest, *baseline, *candidate, out);
    }

    std::vector<IndexedMethod> changed;
    for (const auto &[type, d] : out.types)
    {
        for (const auto &[sig, m] : d.addedMethods)
            changed.push_back(IndexedMethod{type, m});
        for (const auto &[sig, m] : d.modifiedMethods)
            changed.push_back(IndexedMethod{type, m});
    }
    graph.update(changed);
    cascade(out, graph);

    for (auto it = out.types.begin(); it != out.types.end();)
    {
        if (it->second.empty())
            it = out.types.erase(it);
        else
            ++it;
    }
    if (out.types.empty())
        return std::nullopt;
    return out;
}

void DiffEngine::diffType(const TypeDef &next,
                          const Module &latest,
                          const Module &baseline,
                          const Module &candidate,
                          DiffResult &out)
{
    const TypeDef *loaded = baseline.findType(next.name);
    const TypeDef *prev = latest.findType(next.name);
    if (!prev)
        prev = loaded;

    MemberDiff d;
    if (!prev)
    {
        d.introduced = true;
        for (const auto &f : next.fields)
            d.addedFields.emplace(f.signature(next.name), f);
        for (const auto &m : next.methods)
        {
            if (m.isConstructor() || m.isAccessor() || m.isAbstract)
                continue;
            d.addedMethods.emplace(m.signature(next.name), m);
        }
        log_.debug("diff", "introduced type " + next.name);
        out.types[next.name] = std::move(d);
        return;
    }

    BodyComparer cmp(latest.findType(next.name) ? latest : baseline, candidate);
    for (const auto &m : next.methods)
    {
        if (m.isTypeInitializer() || m.isAbstract)
            continue;
        const std::string sig = m.signature(next.name);
        const MethodDef *old = prev->findMethod(sig);
        if (old && cmp.equal(*old, m))
            continue;
        if (hasMethod(loaded, sig))
        {
            d.modifiedMethods.emplace(sig, m);
            log_.debug("diff", "modified " + sig);
        }
        else
        {
            d.addedMethods.emplace(sig, m);
            log_.debug("diff", "added " + sig);
        }
    }
    for (const auto &f : next.fields)
    {
        if (prev->findField(f.name))
            continue;
        const std::string sig = f.signature(next.name);
        d.addedFields.emplace(sig, f);
        log_.debug("diff", "added field " + sig);
    }
    if (!d.empty())
        out.types[next.name] = std::move(d);
}

void DiffEngine::cascade(DiffResult &out, CallGraphIndex &graph)
{
    std::vector<std::string> work;
    std::set<std::string> seen;
    for (const auto &[type, d] : out.types)
    {
        for (const auto *methods : {&d.addedMethods, &d.modifiedMethods})
        {
            for (const auto &[sig, m] : *methods)
            {
                if (m.isGenericDefinition() && seen.insert(sig).second)
                    work.push_back(sig);
            }
        }
    }

    while (!work.empty())
    {
        const std::string callee = work.back();
        work.pop_back();
        for (const auto &[callerSig, caller] : graph.callersOf(callee))
        {
            if (!seen.insert(callerSig).second)
                continue;
            const TypeDef *owner = out.candidate->findType(caller.declaringType);
            if (!owner)
                continue;
            if (owner->compilerGenerated)
            {
                log_.debug("diff", "caller " + callerSig + " of " + callee +
                                       " lives in a compiler-generated type; not cascaded");
                continue;
            }
            MemberDiff &d = out.types[caller.declaringType];
            if (d.addedMethods.count(callerSig) || d.modifiedMethods.count(callerSig))
                continue;
            if (hasMethod(out.baseline->findType(caller.declaringType), callerSig))
                d.modifiedMethods.emplace(callerSig, caller.method);
            else
                d.addedMethods.emplace(callerSig, caller.method);
            log_.debug("diff", "cascaded " + callerSig + " (calls " + callee + ")");
            if (caller.method.isGenericDefinition())
                work.push_back(callerSig);
        }
    }
}

} // namespace hotswap::reload
