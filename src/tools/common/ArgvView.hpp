//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/ArgvView.hpp
// Purpose: Non-owning cursor over argv-style argument arrays.
// Key invariants: Never modifies or owns the underlying argument storage.
// Ownership/Lifetime: Borrows pointers from the C runtime; callers must ensure
//                     validity through the view's lifetime.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>

namespace hotswap::tools
{

/// @brief Argument count and pointer pair, consumed front to back.
struct ArgvView
{
    int argc;
    char **argv;

    [[nodiscard]] bool empty() const
    {
        return argc <= 0 || argv == nullptr;
    }

    /// @brief First remaining argument, or an empty view.
    [[nodiscard]] std::string_view front() const
    {
        return empty() ? std::string_view{} : std::string_view(argv[0]);
    }

    /// @brief Suffix view without the first @p count entries.
    [[nodiscard]] ArgvView drop_front(int count = 1) const
    {
        if (count >= argc)
            return ArgvView{0, nullptr};
        return ArgvView{argc - count, argv + count};
    }

    /// @brief Pop the front argument into @p out.
    /// @return False when no argument is left.
    bool take(std::string_view &out)
    {
        if (empty())
            return false;
        out = front();
        *this = drop_front();
        return true;
    }
};

} // namespace hotswap::tools
