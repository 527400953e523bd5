//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager used by the IR text parser and the assembler
// front end.  Paths are normalized lexically before registration so that the
// same file reached through different spellings shares one identifier.
//
//===----------------------------------------------------------------------===//

#include "support/source_manager.hpp"

#include <filesystem>
#include <limits>

namespace hotswap::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (files_.size() >= std::numeric_limits<uint32_t>::max())
        return 0;

    files_.push_back(std::move(normalized));
    const auto id = static_cast<uint32_t>(files_.size());
    path_to_id_.emplace(files_.back(), id);
    return id;
}

std::string_view SourceManager::getPath(uint32_t file_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

} // namespace hotswap::support
