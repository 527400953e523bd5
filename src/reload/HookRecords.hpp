//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/HookRecords.hpp
// Purpose: Lineage of every hooked member and added field, and its
//          persisted text form.
// Key invariants: A member's history is ordered oldest first; its last entry
//                 is the wrapper currently executing for the member.
// Ownership/Lifetime: Value type; the hook applier owns the live copy.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "reload/Diff.hpp"
#include "support/diag_expected.hpp"

#include <istream>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace hotswap::reload
{

/// @brief Where a synthesized wrapper lives.
struct WrapperRef
{
    std::string module;        ///< Patch module name
    std::string path;          ///< Patch module file
    std::string declaringType; ///< Holder type inside the patch module
    std::string signature;     ///< Full signature of the wrapper
    bool selfParam = false;    ///< First parameter is the receiver
};

struct MemberRecord
{
    std::string member; ///< Full signature of the source member
    MemberState state = MemberState::Modified;
    std::vector<WrapperRef> history;

    const WrapperRef *current() const
    {
        return history.empty() ? nullptr : &history.back();
    }
};

/// @brief A field that lives in the field indirection table.
struct FieldRecord
{
    std::string field;    ///< Full name, `int32 Game.Player::score`
    std::string name;
    std::string typeName; ///< Declared field type
    bool isStatic = false;
    std::string initModule;    ///< Patch module holding the initializer
    std::string initSignature; ///< Initializer method, empty when none

    bool hasInitializer() const
    {
        return !initSignature.empty();
    }
};

/// @brief Records of one source type.
struct TypeRecord
{
    std::string module; ///< Module that declares the type
    std::map<std::string, MemberRecord> members;
    std::map<std::string, FieldRecord> fields;
};

/// @brief A type that first appeared in a patch module.
struct IntroducedType
{
    std::string name;
    std::string module; ///< Patch module that defines it
    std::string path;
    std::vector<std::string> fields; ///< Fields with physical storage
};

class HookRecordSet
{
  public:
    std::map<std::string, TypeRecord> types;
    std::map<std::string, IntroducedType> introduced;

    const MemberRecord *findMember(const std::string &type, const std::string &signature) const;

    /// @brief Record for @p signature of @p type, created on first use.
    MemberRecord &member(const std::string &module,
                         const std::string &type,
                         const std::string &signature,
                         MemberState state);

    /// @brief True when @p type has an indirected field named @p name.
    bool hasField(const std::string &type, const std::string &name) const;

    const IntroducedType *findIntroduced(const std::string &type) const;

    bool empty() const
    {
        return types.empty() && introduced.empty();
    }

    /// @brief Number of member records.
    size_t memberCount() const;

    /// @brief Every patch module referenced by a record, ordered by name.
    std::map<std::string, std::string> patchModules() const;

    void write(std::ostream &os) const;

    /// @param origin Name used in diagnostics.
    static hotswap::support::Expected<HookRecordSet> read(std::istream &is,
                                                          const std::string &origin);

    [[nodiscard]] hotswap::support::Expected<void> save(const std::string &path) const;
    static hotswap::support::Expected<HookRecordSet> load(const std::string &path);
};

} // namespace hotswap::reload
