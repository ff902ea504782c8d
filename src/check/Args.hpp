//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Args.hpp
// Purpose: Splits a call's argument list into top-level arguments.
// Key invariants: Commas split only at paren depth zero; the unmatched ')'
//                 ends the list and moves the source lexer past it.
// Ownership/Lifetime: Borrows the source lexer and, through it, the source text.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "check/Error.hpp"
#include "lex/ArgLexer.hpp"
#include "lex/SourceLexer.hpp"
#include "support/result.hpp"

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

namespace fmtlint::check
{

/// @brief Explicit cast written in front of an argument.
struct Cast
{
    PrimitiveType type{PrimitiveType::Integer};
    Span span;
};

/// @brief One top-level argument of a call.
struct Arg
{
    /// The argument's only token, when it has exactly one besides comments
    /// and a leading cast.
    std::optional<lex::ArgToken> singleToken;

    /// Bytes from the first to the last token of the argument.
    Span span;

    /// Cast found before any other content of the argument.
    std::optional<Cast> cast;
};

/// @brief Format-string argument of a call.
struct FormatString
{
    std::string_view text;     ///< Bytes between the first and last quote
    Span span;                 ///< The whole argument
    std::size_t contentOffset; ///< Absolute offset of @ref text
};

/// @brief Pull-based sequence of the arguments of one call.
/// @details Construct right after the source lexer returned the call's '('.
///          Once the list ends at its closing ')', the source lexer resumes
///          just past that parenthesis. Reaching end of input first leaves the
///          source lexer where it was.
class Args
{
  public:
    explicit Args(lex::SourceLexer &source);

    /// @brief Next argument, or nothing once the list is exhausted.
    std::optional<Arg> next();

    /// @brief Drain the remaining arguments.
    /// @return The number drained and the span of everything consumed since
    ///         the opening parenthesis.
    std::pair<std::size_t, Span> shortCircuit();

    /// @brief Read the next argument as a string-literal format.
    /// @details A non-literal argument drains the rest of the list before the
    ///          error is returned.
    support::Result<FormatString, Error> nextFormatString();

    /// @brief Source text covered by @p span.
    [[nodiscard]] std::string_view source(Span span) const
    {
        return span.slice(source_.source());
    }

    /// @brief Span from the opening parenthesis to the last token consumed.
    [[nodiscard]] Span span() const noexcept
    {
        return Span{start_, end_};
    }

  private:
    lex::SourceLexer &source_;
    lex::ArgLexer lex_;
    bool hasRemaining_ = true;
    std::size_t start_;
    std::size_t end_;
};

} // namespace fmtlint::check
