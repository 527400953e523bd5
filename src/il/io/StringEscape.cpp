//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// String literal escaping for the IR text format.  Non-printable bytes are
// written as two-digit hex escapes so serialized modules stay ASCII-clean.
//
//===----------------------------------------------------------------------===//

#include "il/io/StringEscape.hpp"

#include <cctype>
#include <cstdio>

namespace hotswap::io
{
namespace
{
unsigned hexValue(char c)
{
    if (c >= '0' && c <= '9')
        return static_cast<unsigned>(c - '0');
    if (c >= 'a' && c <= 'f')
        return static_cast<unsigned>(10 + (c - 'a'));
    if (c >= 'A' && c <= 'F')
        return static_cast<unsigned>(10 + (c - 'A'));
    return 0u;
}

bool isHex(char c)
{
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}
} // namespace

bool decodeEscapedString(std::string_view input, std::string &output, std::string *error)
{
    output.clear();
    for (std::size_t i = 0; i < input.size(); ++i)
    {
        const char c = input[i];
        if (c != '\\')
        {
            output.push_back(c);
            continue;
        }
        if (i + 1 >= input.size())
        {
            if (error)
                *error = "unterminated escape sequence";
            return false;
        }
        const char next = input[++i];
        switch (next)
        {
            case '\\':
            case '"':
                output.push_back(next);
                break;
            case 'n':
                output.push_back('\n');
                break;
            case 'r':
                output.push_back('\r');
                break;
            case 't':
                output.push_back('\t');
                break;
            case '0':
                output.push_back('\0');
                break;
            case 'x':
            {
                if (i + 2 >= input.size() || !isHex(input[i + 1]) || !isHex(input[i + 2]))
                {
                    if (error)
                        *error = "invalid hex escape";
                    return false;
                }
                output.push_back(static_cast<char>((hexValue(input[i + 1]) << 4) | hexValue(input[i + 2])));
                i += 2;
                break;
            }
            default:
                if (error)
                    *error = std::string("unknown escape sequence \\") + next;
                return false;
        }
    }
    return true;
}

std::string encodeEscapedString(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input)
    {
        switch (c)
        {
            case '\\':
                out.append("\\\\");
                break;
            case '"':
                out.append("\\\"");
                break;
            case '\n':
                out.append("\\n");
                break;
            case '\r':
                out.append("\\r");
                break;
            case '\t':
                out.append("\\t");
                break;
            case '\0':
                out.append("\\0");
                break;
            default:
                if (c < 0x20 || c == 0x7F)
                {
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\x%02X", c);
                    out.append(buf);
                }
                else
                {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}

} // namespace hotswap::io
