//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the reverse call graph.  Edges are keyed by the callee's element
// signature so every instantiation of one generic definition lands on the
// same key.  A forward map from caller to callees makes stale-edge removal
// proportional to the caller's own call sites.
//
//===----------------------------------------------------------------------===//

#include "il/analysis/CallGraphIndex.hpp"

#include "il/core/Module.hpp"

namespace hotswap::analysis
{

using hotswap::core::MethodRef;
using hotswap::core::Module;
using hotswap::core::OperandKind;
using hotswap::core::TypeDef;

CallGraphIndex::CallGraphIndex(std::vector<std::string> builtinNamespaces)
    : builtins_(std::move(builtinNamespaces))
{
}

bool CallGraphIndex::isBuiltin(const MethodRef &ref) const
{
    for (const auto &prefix : builtins_)
    {
        if (ref.declaringType.name.rfind(prefix, 0) == 0)
            return true;
        if (!prefix.empty() && prefix.back() == '.' &&
            ref.declaringType.scope == prefix.substr(0, prefix.size() - 1))
            return true;
    }
    return false;
}

void CallGraphIndex::index(const Module &module)
{
    std::vector<IndexedMethod> all;
    module.forEachType(
        [&](const TypeDef &t)
        {
            for (const auto &m : t.methods)
                all.push_back(IndexedMethod{t.name, m});
        });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        callers_.clear();
        outgoing_.clear();
    }
    update(all);
}

void CallGraphIndex::update(const std::vector<IndexedMethod> &changed)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &m : changed)
    {
        removeOutgoing(m.signature());
        scan(m);
    }
}

void CallGraphIndex::removeOutgoing(const std::string &callerSig)
{
    auto it = outgoing_.find(callerSig);
    if (it == outgoing_.end())
        return;
    for (const auto &callee : it->second)
    {
        auto cit = callers_.find(callee);
        if (cit == callers_.end())
            continue;
        cit->second.erase(callerSig);
        if (cit->second.empty())
            callers_.erase(cit);
    }
    outgoing_.erase(it);
}

void CallGraphIndex::scan(const IndexedMethod &caller)
{
    const std::string callerSig = caller.signature();
    for (const auto &in : caller.method.body)
    {
        if (!hotswap::core::isCallLike(in.op) || in.operand.kind != OperandKind::Method)
            continue;
        const MethodRef &callee = *in.operand.method;
        if (!callee.isGenericInstance() || isBuiltin(callee))
            continue;
        const std::string calleeSig = callee.elementSignature();
        callers_[calleeSig].insert_or_assign(callerSig, caller);
        outgoing_[callerSig].insert(calleeSig);
    }
}

std::map<std::string, IndexedMethod> CallGraphIndex::callersOf(const std::string &callee) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = callers_.find(callee);
    if (it == callers_.end())
        return {};
    return it->second;
}

std::set<std::string> CallGraphIndex::calleesOf(const std::string &caller) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = outgoing_.find(caller);
    if (it == outgoing_.end())
        return {};
    return it->second;
}

size_t CallGraphIndex::calleeCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return callers_.size();
}

void CallGraphIndex::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    callers_.clear();
    outgoing_.clear();
}

} // namespace hotswap::analysis
