//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Args.cpp
// Purpose: Implements top-level argument splitting.
// Key invariants: Comments are skipped; they neither extend spans nor count
//                 toward the single-token classification.
// Ownership/Lifetime: See Args.hpp.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "check/Args.hpp"

namespace fmtlint::check
{

using lex::ArgTokenKind;

Args::Args(lex::SourceLexer &source)
    : source_(source),
      lex_(source.source(), source.span().end),
      start_(source.span().end),
      end_(source.span().end)
{
}

std::optional<Arg> Args::next()
{
    if (!hasRemaining_)
        return std::nullopt;

    Arg arg;
    std::optional<Span> span;
    std::size_t depth = 0;
    std::size_t tokens = 0;
    bool seenContent = false;

    auto countToken = [&](const lex::ArgToken &tok)
    {
        if (tokens++ == 0)
            arg.singleToken = tok;
        else
            arg.singleToken.reset();
    };

    while (std::optional<lex::ArgToken> tok = lex_.next())
    {
        switch (tok->kind)
        {
            case ArgTokenKind::Comment:
                continue;

            case ArgTokenKind::Comma:
                if (depth == 0)
                {
                    arg.span = span.value_or(Span{tok->span.begin, tok->span.begin});
                    return arg;
                }
                countToken(*tok);
                break;

            case ArgTokenKind::LParen:
                ++depth;
                break;

            case ArgTokenKind::RParen:
                if (depth == 0)
                {
                    // Closing parenthesis of the call itself.
                    hasRemaining_ = false;
                    end_ = tok->span.begin;
                    source_.seek(tok->span.end);
                    if (!span)
                        return std::nullopt;
                    arg.span = *span;
                    return arg;
                }
                --depth;
                break;

            case ArgTokenKind::TypeCast:
                if (!seenContent)
                    arg.cast = Cast{tok->castType, tok->span};
                else
                    countToken(*tok);
                break;

            default:
                countToken(*tok);
                break;
        }

        seenContent = true;
        span = span ? span->merge(tok->span) : tok->span;
        end_ = tok->span.end;
    }

    // End of input inside the list: the call is unterminated.
    hasRemaining_ = false;
    return std::nullopt;
}

std::pair<std::size_t, Span> Args::shortCircuit()
{
    std::size_t remaining = 0;
    while (next())
        ++remaining;
    return {remaining, span()};
}

support::Result<FormatString, Error> Args::nextFormatString()
{
    std::optional<Arg> arg = next();
    if (!arg)
        return support::Result<FormatString, Error>::failure(Error::missingFunctionArgs(span()));

    if (arg->singleToken && arg->singleToken->kind == ArgTokenKind::String)
    {
        const lex::ArgToken &tok = *arg->singleToken;
        return support::Result<FormatString, Error>::success(
            FormatString{tok.text, arg->span, tok.textSpan.begin});
    }

    Error error = Error::nonliteral(*arg);
    shortCircuit();
    return support::Result<FormatString, Error>::failure(std::move(error));
}

} // namespace fmtlint::check
