//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/ArgLexer.cpp
// Purpose: Implements the argument-list tokenizer.
// Key invariants: Longest match wins; casts beat a bare '('.
// Ownership/Lifetime: Lexer borrows source buffer.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "lex/ArgLexer.hpp"
#include "lex/CharUtils.hpp"

#include <algorithm>
#include <array>

namespace fmtlint::lex
{

using namespace char_utils;

//===----------------------------------------------------------------------===//
// Punctuator and cast tables
//===----------------------------------------------------------------------===//

namespace
{

struct CastEntry
{
    std::string_view spelling;
    PrimitiveType type;
};

constexpr std::array<CastEntry, 3> kCastTable = {{
    {"(int)", PrimitiveType::Integer},
    {"(float)", PrimitiveType::Float},
    {"(char*)", PrimitiveType::String},
}};

// Longest spellings first so the first match is the longest.
constexpr std::array<std::string_view, 38> kPunctuators = {
    "...", ">>=", "<<=",
    "+=",  "-=",  "*=",  "/=",  "%=", "&=", "^=", "|=", ">>", "<<", "++", "--", "->",
    "&&",  "||",  "<=",  ">=",  "==", "!=", "<%", "%>", "<:", ":>",
    ";",   "{",   "}",   ":",   "=",  "[",  "]",  ".",  "&",  "!",  "~",  "-",
};

constexpr std::string_view kSingleSymbols = "+*/%<>^|?\\#";

} // anonymous namespace

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

ArgLexer::ArgLexer(std::string_view source, std::size_t start) : cur_(source, start) {}

std::optional<ArgToken> ArgLexer::next()
{
    cur_.consumeWhile(isWhitespace);
    if (cur_.atEnd())
        return std::nullopt;

    const std::size_t begin = cur_.offset();
    auto finish = [&](ArgTokenKind kind)
    {
        span_ = Span{begin, cur_.offset()};
        ArgToken tok;
        tok.kind = kind;
        tok.span = span_;
        tok.text = span_.slice(cur_.view());
        tok.textSpan = span_;
        return tok;
    };

    char c = cur_.peek();

    // Comments
    if (c == '/' && cur_.peek(1) == '/')
    {
        cur_.consumeWhile([](char ch) { return ch != '\n' && ch != '\r'; });
        return finish(ArgTokenKind::Comment);
    }
    if (c == '/' && cur_.peek(1) == '*')
    {
        std::size_t close = cur_.view().find("*/", begin + 2);
        if (close == std::string_view::npos)
        {
            cur_.advance(2);
            return finish(ArgTokenKind::Unknown);
        }
        cur_.seek(close + 2);
        return finish(ArgTokenKind::Comment);
    }

    // Casts, then plain parentheses and commas
    if (c == '(')
    {
        for (const auto &entry : kCastTable)
        {
            if (cur_.consumeLiteral(entry.spelling))
            {
                ArgToken tok = finish(ArgTokenKind::TypeCast);
                tok.castType = entry.type;
                return tok;
            }
        }
        cur_.advance();
        return finish(ArgTokenKind::LParen);
    }
    if (c == ')')
    {
        cur_.advance();
        return finish(ArgTokenKind::RParen);
    }
    if (c == ',')
    {
        cur_.advance();
        return finish(ArgTokenKind::Comma);
    }

    // String literals carry their unquoted content
    if (c == '"' || literalPrefixLength(cur_, '"') != 0)
    {
        Span content;
        if (consumeStringLiterals(cur_, content))
        {
            ArgToken tok = finish(ArgTokenKind::String);
            tok.text = content.slice(cur_.view());
            tok.textSpan = content;
            return tok;
        }
        cur_.seek(begin);
        if (c == '"')
        {
            cur_.advance();
            return finish(ArgTokenKind::Unknown);
        }
    }

    if (std::size_t prefix = literalPrefixLength(cur_, '\''); prefix != 0 || c == '\'')
    {
        cur_.advance(prefix + 1);
        if (consumeQuotedBody(cur_, '\''))
            return finish(ArgTokenKind::Char);
        cur_.seek(begin + prefix + 1);
        return finish(ArgTokenKind::Unknown);
    }

    if (isDigit(c) || (c == '.' && isDigit(cur_.peek(1))))
    {
        ArgToken tok = lexNumber();
        span_ = tok.span;
        return tok;
    }

    if (isIdentifierStart(c))
    {
        cur_.consumeWhile(isIdentifierContinue);
        return finish(ArgTokenKind::Identifier);
    }

    ArgToken tok = lexSymbol();
    span_ = tok.span;
    return tok;
}

/// @brief Lex an integer or floating literal.
/// @details Covers hexadecimal, binary, octal and decimal integers with
///          `u`/`l`/`ll` suffixes, and decimal or hexadecimal floating
///          literals with exponents and `f`/`l` suffixes.
ArgToken ArgLexer::lexNumber()
{
    const std::size_t begin = cur_.offset();
    bool isFloat = false;

    auto exponent = [&](char lower, auto digit)
    {
        char e = cur_.peek();
        if (e != lower && e != lower - ('a' - 'A'))
            return false;
        std::size_t signLen = (cur_.peek(1) == '+' || cur_.peek(1) == '-') ? 1 : 0;
        if (!isDigit(cur_.peek(1 + signLen)))
            return false;
        cur_.advance(1 + signLen);
        cur_.consumeWhile(digit);
        return true;
    };

    char c0 = cur_.peek();
    char c1 = cur_.peek(1);
    if (c0 == '0' && (c1 == 'x' || c1 == 'X') &&
        (isHexDigit(cur_.peek(2)) || (cur_.peek(2) == '.' && isHexDigit(cur_.peek(3)))))
    {
        cur_.advance(2);
        cur_.consumeWhile(isHexDigit);
        if (cur_.peek() == '.')
        {
            isFloat = true;
            cur_.advance();
            cur_.consumeWhile(isHexDigit);
        }
        if (exponent('p', isDigit))
            isFloat = true;
    }
    else if (c0 == '0' && (c1 == 'b' || c1 == 'B') && isBinaryDigit(cur_.peek(2)))
    {
        cur_.advance(2);
        cur_.consumeWhile(isBinaryDigit);
    }
    else
    {
        cur_.consumeWhile(isDigit);
        if (cur_.peek() == '.')
        {
            isFloat = true;
            cur_.advance();
            cur_.consumeWhile(isDigit);
        }
        if (exponent('e', isDigit))
            isFloat = true;
    }

    if (isFloat)
    {
        char s = cur_.peek();
        if (s == 'f' || s == 'F' || s == 'l' || s == 'L')
            cur_.advance();
    }
    else
    {
        cur_.consumeWhile([](char ch) { return ch == 'u' || ch == 'U' || ch == 'l' || ch == 'L'; });
    }

    ArgToken tok;
    tok.kind = isFloat ? ArgTokenKind::Float : ArgTokenKind::Int;
    tok.span = Span{begin, cur_.offset()};
    tok.text = tok.span.slice(cur_.view());
    tok.textSpan = tok.span;
    return tok;
}

/// @brief Lex a punctuator, or a single unknown code point.
ArgToken ArgLexer::lexSymbol()
{
    const std::size_t begin = cur_.offset();
    ArgTokenKind kind = ArgTokenKind::Symbol;

    auto it = std::find_if(kPunctuators.begin(),
                           kPunctuators.end(),
                           [&](std::string_view p) { return cur_.startsWith(p); });
    if (it != kPunctuators.end())
    {
        cur_.advance(it->size());
    }
    else if (kSingleSymbols.find(cur_.peek()) != std::string_view::npos)
    {
        cur_.advance();
    }
    else
    {
        advanceCodePoint(cur_);
        kind = ArgTokenKind::Unknown;
    }

    ArgToken tok;
    tok.kind = kind;
    tok.span = Span{begin, cur_.offset()};
    tok.text = tok.span.slice(cur_.view());
    tok.textSpan = tok.span;
    return tok;
}

} // namespace fmtlint::lex
