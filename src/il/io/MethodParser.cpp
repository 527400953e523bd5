//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements parsing of method blocks: the signature header, `locals` and
// `try` directives, and the labelled instruction stream.  Labels may be used
// before they are defined; branch operands and handler bounds are recorded as
// fixups and patched to instruction indices once the closing `end` is read.
//
//===----------------------------------------------------------------------===//

#include "il/io/ParserState.hpp"
#include "il/io/Cursor.hpp"
#include "il/io/StringEscape.hpp"
#include "il/io/TypeParser.hpp"

#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <unordered_map>

namespace hotswap::io::detail
{

using hotswap::core::ExceptionHandler;
using hotswap::core::Instr;
using hotswap::core::MethodDef;
using hotswap::core::Opcode;
using hotswap::core::Operand;
using hotswap::core::OperandKind;
using hotswap::core::Param;
using hotswap::support::Expected;

namespace
{

/// @brief Unresolved label use.
struct LabelFixup
{
    std::string label;
    unsigned line = 0;
    size_t instr = 0;      ///< Instruction index, or handler index for handler fixups
    size_t slot = 0;       ///< Position in a switch table, or handler bound 0..3
    bool handler = false;
};

struct MethodBuilder
{
    MethodDef m;
    std::unordered_map<std::string, uint32_t> labels;
    std::vector<LabelFixup> fixups;
};

bool parseInteger(std::string_view token, long long &out)
{
    std::string text(token);
    errno = 0;
    char *end = nullptr;
    out = std::strtoll(text.c_str(), &end, 10);
    return errno == 0 && end && *end == '\0' && !text.empty();
}

Expected<void> parseHeader(Cursor &c, MethodDef &m, const ParserState &st)
{
    std::string_view vis;
    if (!c.consumeIdent(vis) || !hotswap::core::parseVisibility(vis, m.visibility))
        return st.error("expected method visibility");
    for (;;)
    {
        if (c.consumeKeyword("static"))
            m.isStatic = true;
        else if (c.consumeKeyword("virtual"))
            m.isVirtual = true;
        else if (c.consumeKeyword("abstract"))
            m.isAbstract = true;
        else if (c.consumeKeyword("specialname"))
            m.specialName = true;
        else if (c.consumeKeyword("noinline"))
            m.noInline = true;
        else
            break;
    }
    auto ret = parseTypeRef(c, st);
    if (!ret)
        return ret.error();
    m.returnType = std::move(ret.value());

    std::string_view name;
    if (!c.consumeIdent(name))
        return st.error("expected method name");
    m.name = std::string(name);

    if (c.peek() == '<')
    {
        c.consumeIf('<');
        do
        {
            std::string_view gp;
            if (!c.consumeIdent(gp))
                return st.error("expected generic parameter name");
            m.genericParams.emplace_back(gp);
        } while (c.consumeIf(','));
        if (!c.consumeIf('>'))
            return st.error("missing '>' after generic parameters of '" + m.name + "'");
    }

    if (!c.consumeIf('('))
        return st.error("expected '(' after method name '" + m.name + "'");
    if (!c.consumeIf(')'))
    {
        do
        {
            auto type = parseTypeRef(c, st);
            if (!type)
                return type.error();
            std::string_view pname;
            if (!c.consumeIdent(pname))
                return st.error("expected parameter name in '" + m.name + "'");
            m.params.push_back(Param{std::string(pname), std::move(type.value())});
        } while (c.consumeIf(','));
        if (!c.consumeIf(')'))
            return st.error("missing ')' in parameter list of '" + m.name + "'");
    }
    if (!c.atEndIgnoringWs())
        return st.error("unexpected text after signature of '" + m.name + "'");
    return {};
}

Expected<void> parseHandler(Cursor &c, MethodBuilder &b, const ParserState &st)
{
    std::string_view bounds[4];
    if (!c.consumeIdent(bounds[0]) || !c.consumeIdent(bounds[1]) || !c.consumeKeyword("catch"))
        return st.error("expected 'try <start> <end> catch <type> <start> <end>'");
    auto type = parseTypeRef(c, st);
    if (!type)
        return type.error();
    if (!c.consumeIdent(bounds[2]) || !c.consumeIdent(bounds[3]) || !c.atEndIgnoringWs())
        return st.error("expected handler bounds after catch type");
    ExceptionHandler h;
    h.catchType = std::move(type.value());
    const size_t index = b.m.handlers.size();
    b.m.handlers.push_back(std::move(h));
    for (size_t i = 0; i < 4; ++i)
        b.fixups.push_back(LabelFixup{std::string(bounds[i]), st.lineNo, index, i, true});
    return {};
}

Expected<void> parseOperand(Cursor &c, Opcode op, MethodBuilder &b, const ParserState &st)
{
    const OperandKind kind = hotswap::core::operandKind(op);
    Instr in(op);
    const size_t instrIndex = b.m.body.size();
    switch (kind)
    {
        case OperandKind::None:
            break;
        case OperandKind::Int32:
        case OperandKind::Int64:
        case OperandKind::Index:
        {
            std::string_view tok;
            long long v = 0;
            if (!c.consumeNumber(tok) || !parseInteger(tok, v))
                return st.error("expected integer operand for '" + std::string(toString(op)) + "'");
            if (kind == OperandKind::Int32 && (v < INT32_MIN || v > INT32_MAX))
                return st.error("integer operand out of range for 'ldc.i4'");
            if (kind == OperandKind::Index && (v < 0 || v > UINT16_MAX))
                return st.error("slot index out of range");
            if (kind == OperandKind::Int32)
                in.operand = Operand::int32(static_cast<int32_t>(v));
            else if (kind == OperandKind::Int64)
                in.operand = Operand::int64(v);
            else
                in.operand = Operand::index(static_cast<uint32_t>(v));
            break;
        }
        case OperandKind::Float32:
        case OperandKind::Float64:
        {
            std::string_view tok;
            if (!c.consumeNumber(tok))
                return st.error("expected floating operand");
            std::string text(tok);
            char *end = nullptr;
            if (kind == OperandKind::Float32)
                in.operand = Operand::float32(std::strtof(text.c_str(), &end));
            else
                in.operand = Operand::float64(std::strtod(text.c_str(), &end));
            if (!end || *end != '\0')
                return st.error("malformed floating literal '" + text + "'");
            break;
        }
        case OperandKind::String:
        {
            std::string_view raw;
            if (!c.consumeQuoted(raw))
                return st.error("expected string literal");
            std::string decoded;
            std::string err;
            if (!decodeEscapedString(raw, decoded, &err))
                return st.error(err);
            in.operand = Operand::string(std::move(decoded));
            break;
        }
        case OperandKind::Type:
        {
            auto t = parseTypeRef(c, st);
            if (!t)
                return t.error();
            in.operand = Operand::typeRef(std::move(t.value()));
            break;
        }
        case OperandKind::Method:
        {
            auto m = parseMethodRef(c, st);
            if (!m)
                return m.error();
            in.operand = Operand::methodRef(std::move(m.value()));
            break;
        }
        case OperandKind::Field:
        {
            const bool isStatic =
                op == Opcode::Ldsfld || op == Opcode::Stsfld || op == Opcode::Ldsflda;
            auto f = parseFieldRef(c, st, isStatic);
            if (!f)
                return f.error();
            in.operand = Operand::fieldRef(std::move(f.value()));
            break;
        }
        case OperandKind::Target:
        {
            std::string_view label;
            if (!c.consumeIdent(label))
                return st.error("expected branch label");
            in.operand = Operand::target(0);
            b.fixups.push_back(LabelFixup{std::string(label), st.lineNo, instrIndex, 0, false});
            break;
        }
        case OperandKind::Targets:
        {
            if (!c.consumeIf('('))
                return st.error("expected '(' before switch table");
            std::vector<uint32_t> table;
            do
            {
                std::string_view label;
                if (!c.consumeIdent(label))
                    return st.error("expected label in switch table");
                b.fixups.push_back(
                    LabelFixup{std::string(label), st.lineNo, instrIndex, table.size(), false});
                table.push_back(0);
            } while (c.consumeIf(','));
            if (!c.consumeIf(')'))
                return st.error("missing ')' after switch table");
            in.operand = Operand::targetList(std::move(table));
            break;
        }
    }
    if (!c.atEndIgnoringWs())
        return st.error("unexpected text after '" + std::string(toString(op)) + "' operand");
    b.m.body.push_back(std::move(in));
    return {};
}

Expected<void> parseBodyLine(const std::string &line, MethodBuilder &b, const ParserState &st)
{
    Cursor c(line, st.lineNo);
    if (c.consumeKeyword("locals"))
    {
        do
        {
            auto t = parseTypeRef(c, st);
            if (!t)
                return t.error();
            b.m.locals.push_back(std::move(t.value()));
        } while (c.consumeIf(','));
        if (!c.atEndIgnoringWs())
            return st.error("unexpected text after locals");
        return {};
    }
    if (c.consumeKeyword("try"))
        return parseHandler(c, b, st);

    std::string_view word;
    if (!c.consumeIdent(word))
        return st.error("expected instruction");
    if (c.peek() == ':' && c.peekAt(1) != ':')
    {
        c.consumeIf(':');
        const std::string label(word);
        if (!b.labels.emplace(label, static_cast<uint32_t>(b.m.body.size())).second)
            return st.error("duplicate label '" + label + "'");
        if (c.atEndIgnoringWs())
            return {};
        if (!c.consumeIdent(word))
            return st.error("expected instruction after label");
    }
    auto op = hotswap::core::opcodeFromMnemonic(word);
    if (!op)
        return st.error("unknown opcode '" + std::string(word) + "'");
    return parseOperand(c, *op, b, st);
}

Expected<void> resolveLabels(MethodBuilder &b, const ParserState &st)
{
    for (const auto &fx : b.fixups)
    {
        auto it = b.labels.find(fx.label);
        if (it == b.labels.end())
            return st.errorAt(fx.line, "unknown label '" + fx.label + "'");
        const uint32_t target = it->second;
        if (fx.handler)
        {
            auto &h = b.m.handlers[fx.instr];
            uint32_t *bounds[4] = {&h.tryStart, &h.tryEnd, &h.handlerStart, &h.handlerEnd};
            *bounds[fx.slot] = target;
            continue;
        }
        if (target >= b.m.body.size())
            return st.errorAt(fx.line, "branch to label '" + fx.label + "' past end of method");
        auto &operand = b.m.body[fx.instr].operand;
        if (operand.kind == OperandKind::Targets)
            operand.targets[fx.slot] = target;
        else
            operand.i64 = target;
    }
    return {};
}

} // namespace

Expected<MethodDef> parseMethod(const std::string &header, ParserState &st)
{
    MethodBuilder b;
    const unsigned startLine = st.lineNo;
    Cursor hc(header, st.lineNo);
    hc.consumeKeyword("method");
    if (auto ok = parseHeader(hc, b.m, st); !ok)
        return ok.error();

    std::string line;
    while (st.nextLine(line))
    {
        Cursor c(line, st.lineNo);
        if (c.consumeKeyword("end") && c.atEndIgnoringWs())
        {
            if (auto ok = resolveLabels(b, st); !ok)
                return ok.error();
            if (b.m.isAbstract && !b.m.body.empty())
                return st.errorAt(startLine, "abstract method '" + b.m.name + "' has a body");
            return std::move(b.m);
        }
        if (auto ok = parseBodyLine(line, b, st); !ok)
            return ok.error();
    }
    return st.errorAt(startLine, "missing 'end' for method '" + b.m.name + "'");
}

} // namespace hotswap::io::detail
