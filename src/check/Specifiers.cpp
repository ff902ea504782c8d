//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Specifiers.cpp
// Purpose: Folds literal format tokens into the text around each specifier.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "check/Specifiers.hpp"

namespace fmtlint::check
{

Specifiers::Specifiers(std::string_view format) : lex_(format), remainder_(format) {}

std::optional<Specifier> Specifiers::next()
{
    std::optional<support::Span> literal;
    while (std::optional<lex::FormatToken> tok = lex_.next())
    {
        if (tok->kind == lex::FormatTokenKind::Specifier)
        {
            before_ = literal ? literal->slice(lex_.source()) : std::string_view{};
            remainder_ = lex_.remainder();
            return Specifier{tok->options, tok->type};
        }
        literal = literal ? literal->merge(tok->span) : tok->span;
    }
    return std::nullopt;
}

std::size_t Specifiers::count()
{
    std::size_t n = 0;
    while (next())
        ++n;
    return n;
}

} // namespace fmtlint::check
