//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Specifiers.hpp
// Purpose: Sequence of the recognised specifiers of one format string.
// Key invariants: before() and remainder() partition the literal text around
//                 the specifier most recently returned.
// Ownership/Lifetime: Borrows the format text.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lex/FormatLexer.hpp"
#include "lex/PrimitiveType.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace fmtlint::check
{

/// @brief One recognised conversion such as `%-2.3f`.
struct Specifier
{
    std::string_view options; ///< The `-2.3` of `%-2.3f`
    lex::PrimitiveType type{lex::PrimitiveType::Integer};

    bool operator==(const Specifier &) const = default;
};

class Specifiers
{
  public:
    explicit Specifiers(std::string_view format);

    /// @brief Next specifier, or nothing when the format text is exhausted.
    std::optional<Specifier> next();

    /// @brief Literal text between the previous specifier and the current one.
    [[nodiscard]] std::string_view before() const noexcept
    {
        return before_;
    }

    /// @brief Literal text after the specifier most recently returned.
    [[nodiscard]] std::string_view remainder() const noexcept
    {
        return remainder_;
    }

    /// @brief Span of the most recent specifier, shifted by @p formatOffset.
    [[nodiscard]] support::Span span(std::size_t formatOffset) const noexcept
    {
        const support::Span rel = lex_.span();
        return support::Span{formatOffset + rel.begin, formatOffset + rel.end};
    }

    /// @brief Drain the sequence and return how many specifiers were left.
    std::size_t count();

  private:
    lex::FormatLexer lex_;
    std::string_view before_;
    std::string_view remainder_;
};

} // namespace fmtlint::check
