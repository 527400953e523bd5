//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/il/io/Cursor.hpp
// Purpose: Declare a lightweight text cursor for IR text parsing.
// Key invariants: Operates on a string_view without owning storage.
// Ownership/Lifetime: Views a line owned by the caller.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Zero-allocation scanning primitives shared by the module, method and
///        operand parsers.  A cursor walks one source line and remembers the
///        line number so diagnostics can point at it.

#pragma once

#include <concepts>
#include <cstddef>
#include <string>
#include <string_view>

namespace hotswap::io
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief True for characters allowed in IR identifiers: letters, digits and
///        `_ . $ / \``.
bool isIdentChar(char c) noexcept;

/// @brief Lightweight cursor over one line of IR text.
class Cursor
{
  public:
    Cursor(std::string_view text, unsigned line) noexcept : text_(text), line_(line) {}

    [[nodiscard]] std::string_view remaining() const noexcept
    {
        return text_.substr(index_);
    }

    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= text_.size();
    }

    /// @brief True when only whitespace remains.
    [[nodiscard]] bool atEndIgnoringWs() noexcept
    {
        skipWs();
        return atEnd();
    }

    [[nodiscard]] char peek() const noexcept
    {
        return atEnd() ? '\0' : text_[index_];
    }

    [[nodiscard]] char peekAt(std::size_t ahead) const noexcept
    {
        return index_ + ahead < text_.size() ? text_[index_ + ahead] : '\0';
    }

    [[nodiscard]] unsigned line() const noexcept
    {
        return line_;
    }

    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    void skipWs() noexcept;

    /// @brief Skip whitespace, then consume @p c if present.
    bool consumeIf(char c) noexcept;

    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t begin = index_;
        while (!atEnd() && pred(peek()))
            ++index_;
        return text_.substr(begin, index_ - begin);
    }

    /// @brief Skip whitespace, then consume an identifier.
    bool consumeIdent(std::string_view &out) noexcept;

    /// @brief Skip whitespace, then consume a signed numeric token.
    bool consumeNumber(std::string_view &out) noexcept;

    /// @brief Consume @p kw when it appears as a whole word.
    bool consumeKeyword(std::string_view kw) noexcept;

    /// @brief Consume a double-quoted literal, returning the raw (escaped) body.
    bool consumeQuoted(std::string_view &out) noexcept;

    void seek(std::size_t offset) noexcept
    {
        index_ = offset < text_.size() ? offset : text_.size();
    }

  private:
    std::string_view text_;
    std::size_t index_ = 0;
    unsigned line_ = 0;
};

/// @brief Remove leading and trailing whitespace from @p text.
std::string trim(std::string_view text);

} // namespace hotswap::io
