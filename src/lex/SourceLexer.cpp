//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/SourceLexer.cpp
// Purpose: Implements the whole-file tokenizer.
// Key invariants: Every produced span lies on code point boundaries.
// Ownership/Lifetime: Lexer borrows source buffer.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "lex/SourceLexer.hpp"
#include "lex/CharUtils.hpp"

namespace fmtlint::lex
{

using namespace char_utils;

SourceLexer::SourceLexer(std::string_view source) : cur_(source) {}

std::optional<SourceToken> SourceLexer::next()
{
    std::optional<SourceToken> tok;
    if (peeked_)
    {
        tok = *peeked_;
        peeked_.reset();
    }
    else
    {
        tok = lex();
    }

    if (tok)
    {
        span_ = tok->span;
        consumed_ = tok->span.end;
    }
    else
    {
        consumed_ = cur_.offset();
    }
    return tok;
}

const std::optional<SourceToken> &SourceLexer::peek()
{
    if (!peeked_)
        peeked_ = lex();
    return *peeked_;
}

void SourceLexer::seek(std::size_t offset) noexcept
{
    peeked_.reset();
    cur_.seek(offset);
    consumed_ = cur_.offset();
}

std::optional<SourceToken> SourceLexer::lex()
{
    cur_.consumeWhile(isWhitespace);
    if (cur_.atEnd())
        return std::nullopt;

    const std::size_t begin = cur_.offset();
    auto make = [&](SourceTokenKind kind) { return SourceToken{kind, Span{begin, cur_.offset()}}; };

    char c = cur_.peek();
    if (c == '/' && cur_.peek(1) == '/')
    {
        cur_.consumeWhile([](char ch) { return ch != '\n' && ch != '\r'; });
        return make(SourceTokenKind::Comment);
    }
    if (c == '/' && cur_.peek(1) == '*')
    {
        // An unterminated block comment is not a comment: only "/*" is consumed.
        return make(lexBlockComment() ? SourceTokenKind::Comment : SourceTokenKind::Other);
    }
    if (c == '(')
    {
        cur_.advance();
        return make(SourceTokenKind::LParen);
    }
    if (c == ')')
    {
        cur_.advance();
        return make(SourceTokenKind::RParen);
    }
    if (literalPrefixLength(cur_, '"') != 0 || c == '"')
    {
        Span content;
        if (consumeStringLiterals(cur_, content))
            return make(SourceTokenKind::String);
        cur_.seek(begin);
        if (c == '"')
        {
            cur_.advance();
            return make(SourceTokenKind::Other);
        }
    }
    if (std::size_t prefix = literalPrefixLength(cur_, '\''); prefix != 0 || c == '\'')
    {
        cur_.advance(prefix + 1);
        if (!consumeQuotedBody(cur_, '\''))
            cur_.seek(begin + prefix + 1);
        return make(SourceTokenKind::Other);
    }
    if (isIdentifierStart(c))
        return lexIdentifier();
    if (isDigit(c))
    {
        cur_.consumeWhile([](char ch) { return isIdentifierContinue(ch) || ch == '.'; });
        return make(SourceTokenKind::Other);
    }

    advanceCodePoint(cur_);
    return make(SourceTokenKind::Other);
}

SourceToken SourceLexer::lexIdentifier()
{
    const std::size_t begin = cur_.offset();
    std::string_view ident = cur_.consumeWhile(isIdentifierContinue);
    Span span{begin, cur_.offset()};

    if (ident == "printf")
        return SourceToken{SourceTokenKind::Printf, span};
    if (ident == "sprintf")
        return SourceToken{SourceTokenKind::Sprintf, span};
    if (ident == "snprintf")
        return SourceToken{SourceTokenKind::Snprintf, span};
    return SourceToken{SourceTokenKind::Other, span};
}

/// @brief Consume a block comment up to and including its "*/".
/// @return False when the input ends first; the cursor is then just past "/*".
bool SourceLexer::lexBlockComment()
{
    const std::size_t begin = cur_.offset();
    std::size_t close = cur_.view().find("*/", begin + 2);
    if (close == std::string_view::npos)
    {
        cur_.seek(begin + 2);
        return false;
    }
    cur_.seek(close + 2);
    return true;
}

} // namespace fmtlint::lex
