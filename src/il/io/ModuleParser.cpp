//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements parsing of module-level directives (`module`, `reference`) and of
// class blocks with their fields, methods and nested classes.  Each helper
// consumes lines from ParserState and reports the first malformed construct
// with the line it appeared on.
//
//===----------------------------------------------------------------------===//

#include "il/io/ParserState.hpp"
#include "il/io/Cursor.hpp"
#include "il/io/StringEscape.hpp"
#include "il/io/TypeParser.hpp"

#include <sstream>

namespace hotswap::io::detail
{

using hotswap::core::FieldDef;
using hotswap::core::TypeDef;
using hotswap::support::Diag;
using hotswap::support::Expected;
using hotswap::support::makeError;

std::string stripComment(std::string_view line)
{
    bool inString = false;
    for (size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];
        if (inString)
        {
            if (c == '\\')
                ++i;
            else if (c == '"')
                inString = false;
            continue;
        }
        if (c == '"')
            inString = true;
        else if (c == '/' && i + 1 < line.size() && line[i + 1] == '/')
            return std::string(line.substr(0, i));
    }
    return std::string(line);
}

bool ParserState::nextLine(std::string &out)
{
    std::string raw;
    while (std::getline(is, raw))
    {
        ++lineNo;
        out = trim(stripComment(raw));
        if (!out.empty())
            return true;
    }
    return false;
}

Diag ParserState::error(std::string_view message) const
{
    return errorAt(lineNo, message);
}

Diag ParserState::errorAt(unsigned line, std::string_view message) const
{
    if (fileId != 0)
        return makeError({fileId, line, 0}, std::string(message));
    std::ostringstream oss;
    oss << "line " << line << ": " << message;
    return makeError({}, oss.str());
}

namespace
{

Expected<FieldDef> parseField(Cursor &c, const ParserState &st)
{
    FieldDef f;
    std::string_view vis;
    if (!c.consumeIdent(vis) || !hotswap::core::parseVisibility(vis, f.visibility))
        return st.error("expected field visibility");
    f.isStatic = c.consumeKeyword("static");
    auto type = parseTypeRef(c, st);
    if (!type)
        return type.error();
    f.type = std::move(type.value());
    std::string_view name;
    if (!c.consumeIdent(name))
        return st.error("expected field name");
    f.name = std::string(name);
    if (!c.atEndIgnoringWs())
        return st.error("unexpected text after field '" + f.name + "'");
    return f;
}

Expected<void> parseClassHeader(Cursor &c, const std::string &outer, TypeDef &t, const ParserState &st)
{
    std::string_view vis;
    if (!c.consumeIdent(vis) || !hotswap::core::parseVisibility(vis, t.visibility))
        return st.error("expected class visibility");
    for (;;)
    {
        if (c.consumeKeyword("abstract"))
            t.isAbstract = true;
        else if (c.consumeKeyword("compilergenerated"))
            t.compilerGenerated = true;
        else
            break;
    }
    std::string_view name;
    if (!c.consumeIdent(name))
        return st.error("expected class name");
    if (!outer.empty() && name.find('/') != std::string_view::npos)
        return st.error("nested class name must not contain '/'");
    t.name = outer.empty() ? std::string(name) : outer + "/" + std::string(name);

    if (c.consumeKeyword("extends"))
    {
        auto base = parseTypeRef(c, st);
        if (!base)
            return base.error();
        t.base = std::move(base.value());
    }
    if (c.consumeKeyword("implements"))
    {
        do
        {
            auto iface = parseTypeRef(c, st);
            if (!iface)
                return iface.error();
            t.interfaces.push_back(std::move(iface.value()));
        } while (c.consumeIf(','));
    }
    if (c.consumeKeyword("source"))
    {
        std::string_view raw;
        std::string err;
        if (!c.consumeQuoted(raw))
            return st.error("expected quoted source path");
        if (!decodeEscapedString(raw, t.sourceFile, &err))
            return st.error(err);
    }
    if (!c.atEndIgnoringWs())
        return st.error("unexpected text in class header of '" + t.name + "'");
    return {};
}

} // namespace

Expected<TypeDef> parseClass(const std::string &header, const std::string &outer, ParserState &st)
{
    TypeDef t;
    const unsigned startLine = st.lineNo;
    Cursor hc(header, st.lineNo);
    hc.consumeKeyword("class");
    if (auto ok = parseClassHeader(hc, outer, t, st); !ok)
        return ok.error();

    std::string line;
    while (st.nextLine(line))
    {
        Cursor c(line, st.lineNo);
        if (c.consumeKeyword("end"))
        {
            if (!c.atEndIgnoringWs())
                return st.error("unexpected text after 'end'");
            return t;
        }
        if (c.consumeKeyword("field"))
        {
            auto f = parseField(c, st);
            if (!f)
                return f.error();
            if (t.findField(f.value().name))
                return st.error("duplicate field '" + f.value().name + "' in '" + t.name + "'");
            t.fields.push_back(std::move(f.value()));
            continue;
        }
        if (c.consumeKeyword("method"))
        {
            auto m = parseMethod(line, st);
            if (!m)
                return m.error();
            const std::string sig = m.value().signature(t.name);
            if (t.findMethod(sig))
                return st.error("duplicate method '" + sig + "'");
            t.methods.push_back(std::move(m.value()));
            continue;
        }
        if (c.consumeKeyword("class"))
        {
            auto nested = parseClass(line, t.name, st);
            if (!nested)
                return nested.error();
            t.nested.push_back(std::move(nested.value()));
            continue;
        }
        return st.error("unexpected line in class '" + t.name + "': " + line);
    }
    return st.errorAt(startLine, "missing 'end' for class '" + t.name + "'");
}

} // namespace hotswap::io::detail
