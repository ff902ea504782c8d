//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/SourceLexer.hpp
// Purpose: Declares the whole-file tokenizer that locates tracked call names.
// Key invariants: Tracked names are whole identifiers; comments and literals are opaque.
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

/// @brief Tokenizes C source text at the coarsest grain needed to find calls.
/// @details Call next() repeatedly until it returns an empty optional. The
///          argument splitter repositions this lexer with seek() once it has
///          consumed a call's argument list.
class SourceLexer
{
  public:
    explicit SourceLexer(std::string_view source);

    /// @brief Produce the next token, or nothing at end of input.
    std::optional<SourceToken> next();

    /// @brief Look at the next token without consuming it.
    const std::optional<SourceToken> &peek();

    /// @brief Span of the token most recently returned by next().
    [[nodiscard]] Span span() const noexcept
    {
        return span_;
    }

    /// @brief Offset just past everything consumed so far.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return consumed_;
    }

    [[nodiscard]] std::string_view source() const noexcept
    {
        return cur_.view();
    }

    /// @brief Text after everything consumed so far.
    [[nodiscard]] std::string_view remainder() const noexcept
    {
        return source().substr(consumed_);
    }

    /// @brief Resume tokenizing at byte @p offset, dropping any lookahead.
    void seek(std::size_t offset) noexcept;

  private:
    std::optional<SourceToken> lex();
    SourceToken lexIdentifier();
    bool lexBlockComment();

    parse::Cursor cur_;
    Span span_{};
    std::size_t consumed_ = 0;
    std::optional<std::optional<SourceToken>> peeked_;
};

} // namespace fmtlint::lex
