//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/ArgLexer.hpp
// Purpose: Declares the tokenizer for the text inside a call's parentheses.
// Key invariants: Spans are absolute offsets into the whole source buffer.
// Ownership/Lifetime: Lexer borrows the source buffer, which must outlive it.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fmtlint/parse/Cursor.hpp"
#include "lex/Token.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace fmtlint::lex
{

/// @brief Tokenizes C expressions well enough to split an argument list.
/// @details Recognises the C punctuator set, numeric, character and string
///          literals, identifiers, comments and the three cast spellings
///          `(int)`, `(float)` and `(char*)`. Whitespace is skipped.
class ArgLexer
{
  public:
    /// @brief Lex @p source starting at byte @p start.
    ArgLexer(std::string_view source, std::size_t start);

    /// @brief Produce the next token, or nothing at end of input.
    std::optional<ArgToken> next();

    /// @brief Span of the token most recently returned by next().
    [[nodiscard]] Span span() const noexcept
    {
        return span_;
    }

    [[nodiscard]] std::string_view source() const noexcept
    {
        return cur_.view();
    }

  private:
    ArgToken lexNumber();
    ArgToken lexSymbol();

    parse::Cursor cur_;
    Span span_{};
};

} // namespace fmtlint::lex
