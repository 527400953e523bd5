//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/Diff.cpp
// Purpose: Helpers for the diff value types.
//
//===----------------------------------------------------------------------===//

#include "reload/Diff.hpp"

namespace hotswap::reload
{

std::string_view toString(MemberState s)
{
    return s == MemberState::Added ? "added" : "modified";
}

bool parseMemberState(std::string_view text, MemberState &out)
{
    if (text == "added")
        out = MemberState::Added;
    else if (text == "modified")
        out = MemberState::Modified;
    else
        return false;
    return true;
}

size_t DiffResult::memberCount() const
{
    size_t n = 0;
    for (const auto &[name, d] : types)
        n += d.addedFields.size() + d.addedMethods.size() + d.modifiedMethods.size();
    return n;
}

} // namespace hotswap::reload
