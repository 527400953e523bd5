//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/Diff.hpp
// Purpose: Value types describing what changed between two compiles.
// Key invariants: A MemberDiff never lists one signature as both added and
//                 modified.  DiffResult::types holds no empty MemberDiff.
// Ownership/Lifetime: Pure values; the result shares ownership of both
//                     modules it was computed from.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "il/core/Module.hpp"

#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace hotswap::reload
{

/// @brief How a member relates to what the live process loaded.
enum class MemberState
{
    Added,   ///< Absent from the loaded module; reached only through wrappers
    Modified ///< Present in the loaded module; its entry point is redirected
};

std::string_view toString(MemberState s);
bool parseMemberState(std::string_view text, MemberState &out);

/// @brief Changes to one declared type, keyed by member full name.
struct MemberDiff
{
    std::map<std::string, hotswap::core::FieldDef> addedFields;
    std::map<std::string, hotswap::core::MethodDef> addedMethods;
    std::map<std::string, hotswap::core::MethodDef> modifiedMethods;

    /// @brief The type itself is new in this compile.
    bool introduced = false;

    bool empty() const
    {
        return addedFields.empty() && addedMethods.empty() && modifiedMethods.empty() &&
               !introduced;
    }
};

/// @brief Result of CompileAndDiff for one module.
struct DiffResult
{
    std::string module;
    std::map<std::string, MemberDiff> types;

    /// @brief The freshly compiled module the diff was taken from.
    std::shared_ptr<const hotswap::core::Module> candidate;
    /// @brief What the live process loaded.
    std::shared_ptr<const hotswap::core::Module> baseline;

    /// @brief Number of added fields plus added and modified methods.
    size_t memberCount() const;
};

} // namespace hotswap::reload
