//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Reference parsing.  Generic argument lists must follow a name without
// intervening blanks (`List<int32>`), which keeps them distinct from the
// comma-separated lists that surround references in headers.
//
//===----------------------------------------------------------------------===//

#include "il/io/TypeParser.hpp"
#include "il/io/ParserState.hpp"

namespace hotswap::io::detail
{

using hotswap::core::FieldRef;
using hotswap::core::MethodRef;
using hotswap::core::TypeRef;
using hotswap::support::Expected;

Expected<TypeRef> parseTypeRef(Cursor &c, const ParserState &st)
{
    TypeRef t;
    c.skipWs();
    if (c.consumeIf('['))
    {
        std::string_view scope;
        if (!c.consumeIdent(scope) || !c.consumeIf(']'))
            return st.error("malformed type scope");
        t.scope = std::string(scope);
    }
    std::string_view name;
    if (!c.consumeIdent(name))
        return st.error("expected type name");
    t.name = std::string(name);
    if (c.peek() == '<')
    {
        c.consumeIf('<');
        do
        {
            auto arg = parseTypeRef(c, st);
            if (!arg)
                return arg.error();
            t.args.push_back(std::move(arg.value()));
        } while (c.consumeIf(','));
        if (!c.consumeIf('>'))
            return st.error("missing '>' in generic arguments of '" + t.name + "'");
    }
    return t;
}

Expected<MethodRef> parseMethodRef(Cursor &c, const ParserState &st)
{
    MethodRef ref;
    ref.hasThis = c.consumeKeyword("instance");

    auto ret = parseTypeRef(c, st);
    if (!ret)
        return ret.error();
    ref.returnType = std::move(ret.value());

    auto decl = parseTypeRef(c, st);
    if (!decl)
        return decl.error();
    ref.declaringType = std::move(decl.value());

    if (!c.consumeIf(':') || !c.consumeIf(':'))
        return st.error("expected '::' in method reference");

    std::string_view name;
    if (!c.consumeIdent(name))
        return st.error("expected method name");
    ref.name = std::string(name);

    if (c.peek() == '<')
    {
        c.consumeIf('<');
        do
        {
            std::string_view param;
            if (!c.consumeIdent(param))
                return st.error("expected generic parameter name");
            ref.genericParams.emplace_back(param);
            if (c.consumeIf(':'))
            {
                auto arg = parseTypeRef(c, st);
                if (!arg)
                    return arg.error();
                ref.genericArgs.push_back(std::move(arg.value()));
            }
        } while (c.consumeIf(','));
        if (!c.consumeIf('>'))
            return st.error("missing '>' after generic parameters");
        if (!ref.genericArgs.empty() && ref.genericArgs.size() != ref.genericParams.size())
            return st.error("generic instantiation of '" + ref.name +
                            "' must bind every parameter");
    }

    if (!c.consumeIf('('))
        return st.error("expected '(' in method reference");
    if (!c.consumeIf(')'))
    {
        do
        {
            auto p = parseTypeRef(c, st);
            if (!p)
                return p.error();
            ref.paramTypes.push_back(std::move(p.value()));
        } while (c.consumeIf(','));
        if (!c.consumeIf(')'))
            return st.error("missing ')' in method reference");
    }
    return ref;
}

Expected<FieldRef> parseFieldRef(Cursor &c, const ParserState &st, bool isStatic)
{
    FieldRef ref;
    ref.isStatic = isStatic;
    auto type = parseTypeRef(c, st);
    if (!type)
        return type.error();
    ref.type = std::move(type.value());
    auto decl = parseTypeRef(c, st);
    if (!decl)
        return decl.error();
    ref.declaringType = std::move(decl.value());
    if (!c.consumeIf(':') || !c.consumeIf(':'))
        return st.error("expected '::' in field reference");
    std::string_view name;
    if (!c.consumeIdent(name))
        return st.error("expected field name");
    ref.name = std::string(name);
    return ref;
}

} // namespace hotswap::io::detail
