//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Top-level parser driver.  Dispatches module directives and hands class
// blocks to the class parser; enforces that `module` appears exactly once and
// before any class.
//
//===----------------------------------------------------------------------===//

#include "il/io/Parser.hpp"
#include "il/io/Cursor.hpp"
#include "il/io/ParserState.hpp"

#include <sstream>

namespace hotswap::io
{

using hotswap::core::Module;
using hotswap::support::Expected;

Expected<void> Parser::parse(std::istream &is, Module &m, uint32_t fileId)
{
    detail::ParserState st{m, is, fileId};
    bool sawModule = false;
    std::string line;
    while (st.nextLine(line))
    {
        Cursor c(line, st.lineNo);
        if (c.consumeKeyword("module"))
        {
            std::string_view name;
            if (sawModule)
                return st.error("duplicate 'module' directive");
            if (!c.consumeIdent(name) || !c.atEndIgnoringWs())
                return st.error("expected module name");
            m.name = std::string(name);
            sawModule = true;
            continue;
        }
        if (!sawModule)
            return st.error("missing 'module' directive");
        if (c.consumeKeyword("reference"))
        {
            std::string_view name;
            if (!c.consumeIdent(name) || !c.atEndIgnoringWs())
                return st.error("expected referenced module name");
            m.references.emplace_back(name);
            continue;
        }
        if (c.consumeKeyword("class"))
        {
            auto t = detail::parseClass(line, "", st);
            if (!t)
                return t.error();
            if (m.findType(t.value().name))
                return st.error("duplicate class '" + t.value().name + "'");
            m.types.push_back(std::move(t.value()));
            continue;
        }
        return st.error("unexpected line: " + line);
    }
    if (!sawModule)
        return st.error("missing 'module' directive");
    return {};
}

Expected<Module> Parser::parseText(std::string_view text)
{
    std::istringstream is{std::string(text)};
    Module m;
    if (auto ok = parse(is, m); !ok)
        return ok.error();
    return m;
}

} // namespace hotswap::io
