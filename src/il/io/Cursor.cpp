//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the IR text cursor.  Every consume helper skips leading blanks
// first, so callers can chain them without caring about spacing.
//
//===----------------------------------------------------------------------===//

#include "il/io/Cursor.hpp"

#include <cctype>

namespace hotswap::io
{

bool isIdentChar(char c) noexcept
{
    const auto uc = static_cast<unsigned char>(c);
    return std::isalnum(uc) || c == '_' || c == '.' || c == '$' || c == '/' || c == '`';
}

void Cursor::skipWs() noexcept
{
    while (!atEnd() && std::isspace(static_cast<unsigned char>(peek())))
        ++index_;
}

bool Cursor::consumeIf(char c) noexcept
{
    skipWs();
    if (peek() != c)
        return false;
    ++index_;
    return true;
}

bool Cursor::consumeIdent(std::string_view &out) noexcept
{
    skipWs();
    out = consumeWhile([](char c) { return isIdentChar(c); });
    return !out.empty();
}

bool Cursor::consumeNumber(std::string_view &out) noexcept
{
    skipWs();
    const std::size_t begin = index_;
    if (peek() == '-' || peek() == '+')
        ++index_;
    consumeWhile(
        [](char c)
        {
            const auto uc = static_cast<unsigned char>(c);
            return std::isalnum(uc) || c == '.' || c == '-' || c == '+';
        });
    out = text_.substr(begin, index_ - begin);
    return !out.empty() && out != "-" && out != "+";
}

bool Cursor::consumeKeyword(std::string_view kw) noexcept
{
    skipWs();
    if (remaining().substr(0, kw.size()) != kw)
        return false;
    const std::size_t end = index_ + kw.size();
    if (end < text_.size() && isIdentChar(text_[end]))
        return false;
    index_ = end;
    return true;
}

bool Cursor::consumeQuoted(std::string_view &out) noexcept
{
    skipWs();
    if (peek() != '"')
        return false;
    const std::size_t begin = ++index_;
    while (!atEnd())
    {
        const char c = peek();
        if (c == '\\')
        {
            index_ += 2;
            continue;
        }
        if (c == '"')
        {
            out = text_.substr(begin, index_ - begin);
            ++index_;
            return true;
        }
        ++index_;
    }
    return false;
}

std::string trim(std::string_view text)
{
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])))
        ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])))
        --end;
    return std::string{text.substr(begin, end - begin)};
}

} // namespace hotswap::io
