//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/HookRecords.cpp
// Purpose: Hook record lookups and the `hooks.state` format.
//
// The state file is line oriented with tab separated columns, since member
// signatures contain spaces:
//
//   hotswap-hooks 1
//   type      <module> <type>
//   member    <signature> <added|modified>
//   wrapper   <module> <path> <holder> <signature> <self 0|1>
//   field     <field> <name> <type> <static 0|1> <init module> <init sig>
//   introduced <type> <module> <path> <field,field,...>
//
// `member` and `field` lines belong to the preceding `type`; `wrapper` lines
// belong to the preceding `member`.
//
//===----------------------------------------------------------------------===//

#include "reload/HookRecords.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace hotswap::reload
{

using hotswap::support::Diag;
using hotswap::support::Expected;
using hotswap::support::makeError;

namespace
{

constexpr const char *kHeader = "hotswap-hooks 1";

std::vector<std::string> splitTabs(const std::string &line)
{
    std::vector<std::string> cols;
    std::string cur;
    std::istringstream ss(line);
    while (std::getline(ss, cur, '\t'))
        cols.push_back(cur);
    if (!line.empty() && line.back() == '\t')
        cols.emplace_back();
    return cols;
}

std::vector<std::string> splitCommas(const std::string &text)
{
    std::vector<std::string> out;
    std::string cur;
    std::istringstream ss(text);
    while (std::getline(ss, cur, ','))
    {
        if (!cur.empty())
            out.push_back(cur);
    }
    return out;
}

Diag stateError(const std::string &origin, int line, const std::string &msg)
{
    return makeError({}, origin + ":" + std::to_string(line) + ": " + msg);
}

} // namespace

const MemberRecord *HookRecordSet::findMember(const std::string &type,
                                              const std::string &signature) const
{
    auto t = types.find(type);
    if (t == types.end())
        return nullptr;
    auto m = t->second.members.find(signature);
    return m == t->second.members.end() ? nullptr : &m->second;
}

MemberRecord &HookRecordSet::member(const std::string &module,
                                    const std::string &type,
                                    const std::string &signature,
                                    MemberState state)
{
    TypeRecord &tr = types[type];
    if (tr.module.empty())
        tr.module = module;
    auto [it, inserted] = tr.members.try_emplace(signature);
    if (inserted)
    {
        it->second.member = signature;
        it->second.state = state;
    }
    return it->second;
}

bool HookRecordSet::hasField(const std::string &type, const std::string &name) const
{
    auto t = types.find(type);
    if (t == types.end())
        return false;
    for (const auto &[sig, f] : t->second.fields)
    {
        if (f.name == name)
            return true;
    }
    return false;
}

const IntroducedType *HookRecordSet::findIntroduced(const std::string &type) const
{
    auto it = introduced.find(type);
    return it == introduced.end() ? nullptr : &it->second;
}

size_t HookRecordSet::memberCount() const
{
    size_t n = 0;
    for (const auto &[name, t] : types)
        n += t.members.size();
    return n;
}

std::map<std::string, std::string> HookRecordSet::patchModules() const
{
    std::map<std::string, std::string> out;
    for (const auto &[name, t] : types)
    {
        for (const auto &[sig, m] : t.members)
        {
            for (const auto &w : m.history)
                out.emplace(w.module, w.path);
        }
    }
    for (const auto &[name, it] : introduced)
        out.emplace(it.module, it.path);
    return out;
}

void HookRecordSet::write(std::ostream &os) const
{
    os << kHeader << '\n';
    for (const auto &[name, t] : types)
    {
        os << "type\t" << t.module << '\t' << name << '\n';
        for (const auto &[sig, m] : t.members)
        {
            os << "member\t" << sig << '\t' << toString(m.state) << '\n';
            for (const auto &w : m.history)
            {
                os << "wrapper\t" << w.module << '\t' << w.path << '\t' << w.declaringType << '\t'
                   << w.signature << '\t' << (w.selfParam ? 1 : 0) << '\n';
            }
        }
        for (const auto &[sig, f] : t.fields)
        {
            os << "field\t" << sig << '\t' << f.name << '\t' << f.typeName << '\t'
               << (f.isStatic ? 1 : 0) << '\t' << f.initModule << '\t' << f.initSignature
               << '\n';
        }
    }
    for (const auto &[name, it] : introduced)
    {
        os << "introduced\t" << name << '\t' << it.module << '\t' << it.path << '\t';
        for (size_t i = 0; i < it.fields.size(); ++i)
            os << (i ? "," : "") << it.fields[i];
        os << '\n';
    }
}

Expected<HookRecordSet> HookRecordSet::read(std::istream &is, const std::string &origin)
{
    HookRecordSet set;
    std::string line;
    int lineNo = 0;
    if (!std::getline(is, line) || line != kHeader)
        return stateError(origin, 1, "missing '" + std::string(kHeader) + "' header");
    ++lineNo;

    TypeRecord *type = nullptr;
    MemberRecord *member = nullptr;
    while (std::getline(is, line))
    {
        ++lineNo;
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        if (line.empty())
            continue;
        const auto cols = splitTabs(line);
        const std::string &kind = cols[0];
        if (kind == "type")
        {
            if (cols.size() != 3)
                return stateError(origin, lineNo, "malformed type record");
            type = &set.types[cols[2]];
            type->module = cols[1];
            member = nullptr;
        }
        else if (kind == "member")
        {
            if (!type || cols.size() != 3)
                return stateError(origin, lineNo, "member record outside a type");
            MemberState state;
            if (!parseMemberState(cols[2], state))
                return stateError(origin, lineNo, "unknown member state '" + cols[2] + "'");
            member = &type->members[cols[1]];
            member->member = cols[1];
            member->state = state;
        }
        else if (kind == "wrapper")
        {
            if (!member || cols.size() != 6)
                return stateError(origin, lineNo, "wrapper record outside a member");
            member->history.push_back(WrapperRef{cols[1], cols[2], cols[3], cols[4], cols[5] == "1"});
        }
        else if (kind == "field")
        {
            if (!type || cols.size() != 7)
                return stateError(origin, lineNo, "malformed field record");
            FieldRecord f;
            f.field = cols[1];
            f.name = cols[2];
            f.typeName = cols[3];
            f.isStatic = cols[4] == "1";
            f.initModule = cols[5];
            f.initSignature = cols[6];
            type->fields[f.field] = std::move(f);
        }
        else if (kind == "introduced")
        {
            if (cols.size() != 5)
                return stateError(origin, lineNo, "malformed introduced record");
            set.introduced[cols[1]] = IntroducedType{cols[1], cols[2], cols[3], splitCommas(cols[4])};
        }
        else
        {
            return stateError(origin, lineNo, "unknown record '" + kind + "'");
        }
    }
    return set;
}

Expected<void> HookRecordSet::save(const std::string &path) const
{
    std::error_code ec;
    const auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
        std::filesystem::create_directories(dir, ec);
    if (ec)
        return makeError({}, "cannot create directory '" + dir.string() + "': " + ec.message());

    // Written beside the target, then renamed over it.
    const std::string tmp = path + ".tmp";
    {
        std::ofstream os(tmp, std::ios::trunc);
        if (!os)
            return makeError({}, "cannot write hook records to '" + tmp + "'");
        write(os);
        if (!os)
            return makeError({}, "failed writing hook records to '" + tmp + "'");
    }
    std::filesystem::rename(tmp, path, ec);
    if (ec)
        return makeError({}, "cannot replace '" + path + "': " + ec.message());
    return {};
}

Expected<HookRecordSet> HookRecordSet::load(const std::string &path)
{
    std::ifstream is(path);
    if (!is)
        return makeError({}, "cannot open hook records '" + path + "'");
    return read(is, path);
}

} // namespace hotswap::reload
