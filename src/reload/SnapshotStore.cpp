//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/SnapshotStore.cpp
// Purpose: Snapshot bookkeeping and the file -> type index.
//
//===----------------------------------------------------------------------===//

#include "reload/SnapshotStore.hpp"

#include "reload/Frontend.hpp"

namespace hotswap::reload
{

using hotswap::core::Module;

void SnapshotStore::indexFiles(Entry &e)
{
    e.typesByFile.clear();
    for (const auto &t : e.latest->types)
    {
        if (!t.sourceFile.empty())
            e.typesByFile[normalizeSourcePath(t.sourceFile)].insert(t.name);
    }
}

void SnapshotStore::initialize(const std::string &module,
                               Module baseline,
                               Module latest,
                               const std::vector<std::string> &sources)
{
    Entry e;
    e.baseline = std::make_shared<const Module>(std::move(baseline));
    e.latest = std::make_shared<const Module>(std::move(latest));
    for (const auto &s : sources)
        e.sources.insert(normalizeSourcePath(s));
    indexFiles(e);

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = fileOwner_.begin(); it != fileOwner_.end();)
    {
        if (it->second == module)
            it = fileOwner_.erase(it);
        else
            ++it;
    }
    for (const auto &s : e.sources)
        fileOwner_[s] = module;
    for (const auto &[file, types] : e.typesByFile)
        fileOwner_[file] = module;
    entries_[module] = std::move(e);
}

SnapshotStore::ModulePtr SnapshotStore::baseline(const std::string &module) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(module);
    return it == entries_.end() ? nullptr : it->second.baseline;
}

SnapshotStore::ModulePtr SnapshotStore::latest(const std::string &module) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(module);
    return it == entries_.end() ? nullptr : it->second.latest;
}

void SnapshotStore::commit(const std::string &module, ModulePtr next)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(module);
    if (it == entries_.end() || !next)
        return;
    it->second.latest = std::move(next);
    indexFiles(it->second);
    for (const auto &[file, types] : it->second.typesByFile)
        fileOwner_[file] = module;
}

std::set<std::string> SnapshotStore::typesInFiles(const std::string &module,
                                                  const std::vector<std::string> &files) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> out;
    auto it = entries_.find(module);
    if (it == entries_.end())
        return out;
    for (const auto &f : files)
    {
        auto types = it->second.typesByFile.find(normalizeSourcePath(f));
        if (types != it->second.typesByFile.end())
            out.insert(types->second.begin(), types->second.end());
    }
    return out;
}

std::optional<std::string> SnapshotStore::moduleForFile(const std::string &file) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fileOwner_.find(normalizeSourcePath(file));
    if (it == fileOwner_.end())
        return std::nullopt;
    return it->second;
}

bool SnapshotStore::contains(const std::string &module) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(module) != 0;
}

std::vector<std::string> SnapshotStore::modules() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    for (const auto &[name, e] : entries_)
        out.push_back(name);
    return out;
}

void SnapshotStore::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    fileOwner_.clear();
}

} // namespace hotswap::reload
