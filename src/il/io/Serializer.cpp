//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the textual serializer for modules.  The serializer prints
// deterministic output that mirrors the parser grammar so modules round trip
// through the textual form, which is how patch modules travel from the
// synthesizer to the hook applier.
//
//===----------------------------------------------------------------------===//

#include "il/io/Serializer.hpp"
#include "il/core/Module.hpp"
#include "il/io/StringEscape.hpp"

#include <cstdio>
#include <set>
#include <sstream>

namespace hotswap::io
{

using namespace hotswap::core;

namespace
{

std::string labelFor(uint32_t index)
{
    char buf[24];
    std::snprintf(buf, sizeof(buf), "IL_%04u", index);
    return buf;
}

std::string formatFloat32(float v)
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.9g", static_cast<double>(v));
    return buf;
}

std::string formatFloat64(double v)
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.17g", v);
    return buf;
}

/// @brief Collect every instruction index that needs a label.
std::set<uint32_t> collectLabels(const MethodDef &m)
{
    std::set<uint32_t> labels;
    for (const auto &in : m.body)
    {
        if (in.operand.kind == OperandKind::Target)
            labels.insert(static_cast<uint32_t>(in.operand.i64));
        else if (in.operand.kind == OperandKind::Targets)
            labels.insert(in.operand.targets.begin(), in.operand.targets.end());
    }
    for (const auto &h : m.handlers)
    {
        labels.insert(h.tryStart);
        labels.insert(h.tryEnd);
        labels.insert(h.handlerStart);
        labels.insert(h.handlerEnd);
    }
    return labels;
}

void printOperand(std::ostream &os, const Operand &op)
{
    switch (op.kind)
    {
        case OperandKind::None:
            return;
        case OperandKind::Int32:
        case OperandKind::Int64:
        case OperandKind::Index:
            os << ' ' << op.i64;
            return;
        case OperandKind::Float32:
            os << ' ' << formatFloat32(op.f32);
            return;
        case OperandKind::Float64:
            os << ' ' << formatFloat64(op.f64);
            return;
        case OperandKind::String:
            os << " \"" << encodeEscapedString(op.str) << '"';
            return;
        case OperandKind::Type:
            os << ' ' << Serializer::formatType(*op.type);
            return;
        case OperandKind::Method:
            os << ' ' << Serializer::formatMethod(*op.method);
            return;
        case OperandKind::Field:
            os << ' ' << Serializer::formatField(*op.field);
            return;
        case OperandKind::Target:
            os << ' ' << labelFor(static_cast<uint32_t>(op.i64));
            return;
        case OperandKind::Targets:
        {
            os << " (";
            for (size_t i = 0; i < op.targets.size(); ++i)
            {
                if (i)
                    os << ", ";
                os << labelFor(op.targets[i]);
            }
            os << ')';
            return;
        }
    }
}

void printMethod(std::ostream &os, const MethodDef &m, const std::string &indent)
{
    os << indent << "method " << toString(m.visibility);
    if (m.isStatic)
        os << " static";
    if (m.isVirtual)
        os << " virtual";
    if (m.isAbstract)
        os << " abstract";
    if (m.specialName)
        os << " specialname";
    if (m.noInline)
        os << " noinline";
    os << ' ' << Serializer::formatType(m.returnType) << ' ' << m.name;
    if (!m.genericParams.empty())
    {
        os << '<';
        for (size_t i = 0; i < m.genericParams.size(); ++i)
            os << (i ? "," : "") << m.genericParams[i];
        os << '>';
    }
    os << '(';
    for (size_t i = 0; i < m.params.size(); ++i)
    {
        if (i)
            os << ", ";
        os << Serializer::formatType(m.params[i].type) << ' ';
        if (m.params[i].name.empty())
            os << 'a' << i;
        else
            os << m.params[i].name;
    }
    os << ")\n";

    const std::string bodyIndent = indent + "  ";
    if (!m.locals.empty())
    {
        os << bodyIndent << "locals ";
        for (size_t i = 0; i < m.locals.size(); ++i)
            os << (i ? ", " : "") << Serializer::formatType(m.locals[i]);
        os << '\n';
    }
    for (const auto &h : m.handlers)
    {
        os << bodyIndent << "try " << labelFor(h.tryStart) << ' ' << labelFor(h.tryEnd) << " catch "
           << Serializer::formatType(h.catchType) << ' ' << labelFor(h.handlerStart) << ' '
           << labelFor(h.handlerEnd) << '\n';
    }

    const auto labels = collectLabels(m);
    for (size_t i = 0; i < m.body.size(); ++i)
    {
        const auto &in = m.body[i];
        os << bodyIndent;
        if (labels.count(static_cast<uint32_t>(i)))
            os << labelFor(static_cast<uint32_t>(i)) << ": ";
        os << toString(in.op);
        printOperand(os, in.operand);
        os << '\n';
    }
    if (labels.count(static_cast<uint32_t>(m.body.size())))
        os << bodyIndent << labelFor(static_cast<uint32_t>(m.body.size())) << ":\n";
    os << indent << "end\n";
}

void printType(std::ostream &os, const TypeDef &t, const std::string &indent)
{
    os << indent << "class " << toString(t.visibility);
    if (t.isAbstract)
        os << " abstract";
    if (t.compilerGenerated)
        os << " compilergenerated";
    // Top-level types print their full name, which may contain '/' for
    // nested types hoisted out of their declaring type.
    os << ' ' << (indent.empty() ? t.name : t.simpleName());
    if (t.base)
        os << " extends " << Serializer::formatType(*t.base);
    if (!t.interfaces.empty())
    {
        os << " implements ";
        for (size_t i = 0; i < t.interfaces.size(); ++i)
            os << (i ? ", " : "") << Serializer::formatType(t.interfaces[i]);
    }
    if (!t.sourceFile.empty())
        os << " source \"" << encodeEscapedString(t.sourceFile) << '"';
    os << '\n';

    const std::string inner = indent + "  ";
    for (const auto &f : t.fields)
    {
        os << inner << "field " << toString(f.visibility);
        if (f.isStatic)
            os << " static";
        os << ' ' << Serializer::formatType(f.type) << ' ' << f.name << '\n';
    }
    for (const auto &m : t.methods)
        printMethod(os, m, inner);
    for (const auto &n : t.nested)
        printType(os, n, inner);
    os << indent << "end\n";
}

} // namespace

std::string Serializer::formatType(const TypeRef &t)
{
    return t.scopedName();
}

std::string Serializer::formatMethod(const MethodRef &m)
{
    std::string out;
    if (m.hasThis)
        out += "instance ";
    out += formatType(m.returnType);
    out += ' ';
    out += formatType(m.declaringType);
    out += "::";
    out += m.name;
    if (!m.genericParams.empty())
    {
        out += '<';
        for (size_t i = 0; i < m.genericParams.size(); ++i)
        {
            if (i)
                out += ',';
            out += m.genericParams[i];
            if (i < m.genericArgs.size())
            {
                out += ':';
                out += formatType(m.genericArgs[i]);
            }
        }
        out += '>';
    }
    out += '(';
    for (size_t i = 0; i < m.paramTypes.size(); ++i)
    {
        if (i)
            out += ", ";
        out += formatType(m.paramTypes[i]);
    }
    out += ')';
    return out;
}

std::string Serializer::formatField(const FieldRef &f)
{
    return formatType(f.type) + " " + formatType(f.declaringType) + "::" + f.name;
}

void Serializer::write(const Module &m, std::ostream &os)
{
    os << "module " << m.name << '\n';
    for (const auto &ref : m.references)
        os << "reference " << ref << '\n';
    for (const auto &t : m.types)
    {
        os << '\n';
        printType(os, t, "");
    }
}

std::string Serializer::toString(const Module &m)
{
    std::ostringstream os;
    write(m, os);
    return os.str();
}

} // namespace hotswap::io
