//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/FormatLexer.cpp
// Purpose: Implements the format-string tokenizer.
// Key invariants: Unrecognised conversions stay literal text.
// Ownership/Lifetime: Lexer borrows the format text.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "lex/FormatLexer.hpp"
#include "lex/CharUtils.hpp"

namespace fmtlint::lex
{

using namespace char_utils;

FormatLexer::FormatLexer(std::string_view format) : cur_(format) {}

std::optional<FormatToken> FormatLexer::next()
{
    if (cur_.atEnd())
        return std::nullopt;

    const std::size_t begin = cur_.offset();
    FormatToken tok;

    if (cur_.peek() == '%' && lexSpecifier(tok))
    {
        tok.kind = FormatTokenKind::Specifier;
    }
    else
    {
        tok.kind = FormatTokenKind::Normal;
        if (cur_.startsWith("%%"))
            cur_.advance(2);
        else if (cur_.peek() == '\\' && cur_.peek(1) != '\0')
        {
            cur_.advance();
            advanceCodePoint(cur_);
        }
        else
            advanceCodePoint(cur_);
    }

    tok.span = Span{begin, cur_.offset()};
    span_ = tok.span;
    return tok;
}

/// @brief Try to consume a specifier at the current '%'.
/// @return True with @p tok filled in, or false with the cursor untouched.
bool FormatLexer::lexSpecifier(FormatToken &tok)
{
    const std::size_t begin = cur_.offset();
    cur_.advance(); // '%'
    const std::size_t optionsBegin = cur_.offset();

    std::size_t sign = (cur_.peek() == '+' || cur_.peek() == '-') ? 1 : 0;
    if (isDigit(cur_.peek(sign)))
    {
        cur_.advance(sign);
        cur_.consumeWhile(isDigit);
        if (cur_.consumeIf('.'))
            cur_.consumeWhile(isDigit);
    }
    else if (cur_.peek(sign) == '.' && isDigit(cur_.peek(sign + 1)))
    {
        cur_.advance(sign + 1);
        cur_.consumeWhile(isDigit);
    }

    const std::size_t optionsEnd = cur_.offset();
    switch (cur_.peek())
    {
        case 'd':
        case 'i':
            tok.type = PrimitiveType::Integer;
            break;
        case 's':
            tok.type = PrimitiveType::String;
            break;
        case 'f':
            tok.type = PrimitiveType::Float;
            break;
        default:
            cur_.seek(begin);
            return false;
    }
    cur_.advance();
    tok.options = cur_.view().substr(optionsBegin, optionsEnd - optionsBegin);
    return true;
}

} // namespace fmtlint::lex
