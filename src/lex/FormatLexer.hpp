//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/FormatLexer.hpp
// Purpose: Declares the tokenizer for the contents of a format string.
// Key invariants: Spans are relative to the format text, not the source file.
// Ownership/Lifetime: Lexer borrows the format text.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "fmtlint/parse/Cursor.hpp"
#include "lex/Token.hpp"

#include <optional>
#include <string_view>

namespace fmtlint::lex
{

/// @brief Splits format-string text into specifiers and literal runs.
/// @details A specifier is `%`, optional options matching
///          `[+-]?([0-9]+(\.[0-9]*)?|\.[0-9]+)`, then one of `d`, `i`, `s`,
///          `f`. `%%`, backslash escapes and every other byte are Normal.
class FormatLexer
{
  public:
    explicit FormatLexer(std::string_view format);

    std::optional<FormatToken> next();

    /// @brief Span of the token most recently returned by next().
    [[nodiscard]] Span span() const noexcept
    {
        return span_;
    }

    /// @brief Text after the token most recently returned by next().
    [[nodiscard]] std::string_view remainder() const noexcept
    {
        return cur_.remaining();
    }

    [[nodiscard]] std::string_view source() const noexcept
    {
        return cur_.view();
    }

  private:
    bool lexSpecifier(FormatToken &tok);

    parse::Cursor cur_;
    Span span_{};
};

} // namespace fmtlint::lex
