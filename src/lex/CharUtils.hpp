//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/CharUtils.hpp
// Purpose: C character classes shared by the tokenizers.
//
// These inline helpers spell out the character sets of the C lexical grammar
// that the source, argument and format tokenizers all rely on.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "fmtlint/parse/Cursor.hpp"
#include "support/source_location.hpp"

namespace fmtlint::lex::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character is a hex digit (0-9, A-F, a-f).
[[nodiscard]] constexpr bool isHexDigit(char c) noexcept
{
    return isDigit(c) || (c >= 'A' && c <= 'F') || (c >= 'a' && c <= 'f');
}

/// @brief Check if character is a binary digit (0-1).
[[nodiscard]] constexpr bool isBinaryDigit(char c) noexcept
{
    return c == '0' || c == '1';
}

/// @brief Check if character can start a C identifier.
/// @details Accepts '$' as GCC and Clang do.
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return isLetter(c) || c == '_' || c == '$';
}

/// @brief Check if character can continue a C identifier.
[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isIdentifierStart(c) || isDigit(c);
}

/// @brief Check if character is C whitespace (space, \t, \v, \r, \n, \f).
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\v' || c == '\r' || c == '\n' || c == '\f';
}

/// @brief Check if byte continues a multi-byte UTF-8 sequence.
[[nodiscard]] constexpr bool isUtf8Continuation(char c) noexcept
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/// @brief Consume one code point so spans never split a UTF-8 sequence.
inline void advanceCodePoint(parse::Cursor &cur) noexcept
{
    cur.advance();
    while (!cur.atEnd() && isUtf8Continuation(cur.peek()))
        cur.advance();
}

/// @brief Consume a quoted literal body after its opening @p quote.
/// @details A backslash escapes the following character, so an escaped quote
///          or an escaped newline does not end the literal. An unescaped
///          newline or end of input leaves the literal unterminated.
/// @return True when the closing quote was consumed.
inline bool consumeQuotedBody(parse::Cursor &cur, char quote) noexcept
{
    while (!cur.atEnd())
    {
        char c = cur.peek();
        if (c == quote)
        {
            cur.advance();
            return true;
        }
        if (c == '\n')
            return false;
        if (c == '\\')
        {
            cur.advance();
            if (cur.atEnd())
                return false;
            if (cur.peek() == '\r' && cur.peek(1) == '\n')
                cur.advance();
        }
        cur.advance();
    }
    return false;
}

/// @brief Length of the string or character literal prefix at the cursor.
/// @details Recognises `u8`, `u`, `U` and `L` when directly followed by
///          @p quote; `u8` only applies to string literals.
/// @return Prefix length in bytes, or 0 when there is no prefix.
inline std::size_t literalPrefixLength(const parse::Cursor &cur, char quote) noexcept
{
    char c = cur.peek();
    if (quote == '"' && c == 'u' && cur.peek(1) == '8' && cur.peek(2) == quote)
        return 2;
    if ((c == 'u' || c == 'U' || c == 'L') && cur.peek(1) == quote)
        return 1;
    return 0;
}

/// @brief Consume one or more adjacent string literals.
/// @details Literals separated only by whitespace form a single literal that
///          ends at the last closing quote. @p content receives the bytes
///          between the first opening quote and the last closing quote, so
///          inner quotes of concatenated pieces are kept.
/// @return False when the first literal is unterminated; the cursor is then
///         back where it started.
inline bool consumeStringLiterals(parse::Cursor &cur, support::Span &content) noexcept
{
    std::size_t end = cur.offset();
    bool any = false;
    for (;;)
    {
        std::size_t prefix = literalPrefixLength(cur, '"');
        if (cur.peek(prefix) != '"')
            break;
        cur.advance(prefix + 1);
        if (!any)
            content.begin = cur.offset();
        if (!consumeQuotedBody(cur, '"'))
            break;
        any = true;
        end = cur.offset();
        content.end = end - 1;
        cur.consumeWhile(isWhitespace);
    }
    cur.seek(end);
    return any;
}

} // namespace fmtlint::lex::char_utils
