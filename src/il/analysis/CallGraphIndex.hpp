//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/analysis/CallGraphIndex.hpp
// Purpose: Callee-to-caller index over generic-instantiated call sites.
// Key invariants: After update(), the index reflects the most recently
//                 supplied body of every method it has seen; no edge survives
//                 from a body that has since been replaced.
// Ownership/Lifetime: Owns copies of caller bodies.  One index per module.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Reverse call graph used to cascade edits of generic methods.
/// @details Only call sites that instantiate a generic method are indexed:
///          ordinary calls keep working once the callee's entry point is
///          redirected, but a caller of `M<int32>` embeds the instantiation
///          and must itself be regenerated when `M<T>` changes.  Calls into
///          the runtime's built-in namespaces are never indexed.

#pragma once

#include "il/core/MethodDef.hpp"
#include "il/core/fwd.hpp"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace hotswap::analysis
{

/// @brief A method together with the full name of its declaring type.
struct IndexedMethod
{
    std::string declaringType;
    hotswap::core::MethodDef method;

    /// @brief Signature key, e.g. `int32 Game.Player::F()`.
    std::string signature() const
    {
        return method.signature(declaringType);
    }
};

/// @brief Incrementally maintained map<callee, map<caller, body>>.
class CallGraphIndex
{
  public:
    /// @param builtinNamespaces Namespace prefixes of runtime libraries whose
    ///        members are never indexed (e.g. "core.").
    explicit CallGraphIndex(std::vector<std::string> builtinNamespaces = {"core."});

    /// @brief Discard all edges and index every method of @p module.
    void index(const hotswap::core::Module &module);

    /// @brief Re-index @p changed: drop each method's outgoing edges, then
    ///        rescan its new body.
    void update(const std::vector<IndexedMethod> &changed);

    /// @brief Callers of the generic definition with signature @p callee.
    std::map<std::string, IndexedMethod> callersOf(const std::string &callee) const;

    /// @brief Callees reached from @p caller; empty for unknown callers.
    std::set<std::string> calleesOf(const std::string &caller) const;

    /// @brief Number of distinct callee keys.
    size_t calleeCount() const;

    void clear();

    /// @brief True when @p ref targets a built-in runtime namespace.
    bool isBuiltin(const hotswap::core::MethodRef &ref) const;

  private:
    void removeOutgoing(const std::string &callerSig);
    void scan(const IndexedMethod &caller);

    std::vector<std::string> builtins_;
    std::unordered_map<std::string, std::map<std::string, IndexedMethod>> callers_;
    std::unordered_map<std::string, std::set<std::string>> outgoing_;
    mutable std::mutex mutex_;
};

} // namespace hotswap::analysis
