//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares byte spans and resolved line/column locations for diagnostics.
// Key invariants: Span::begin <= Span::end; file_id == 0 denotes an invalid location.
// Ownership/Lifetime: Value types with no dynamic ownership.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace fmtlint::support
{

/// @brief Half-open byte range [begin, end) into a source buffer.
/// @invariant begin <= end once constructed by a tokenizer.
/// @ownership Value type; the buffer it indexes is owned elsewhere.
struct Span
{
    std::size_t begin = 0; ///< Offset of the first byte.
    std::size_t end = 0;   ///< Offset one past the last byte.

    /// @brief Number of bytes covered by the span.
    [[nodiscard]] constexpr std::size_t length() const noexcept
    {
        return end - begin;
    }

    [[nodiscard]] constexpr bool empty() const noexcept
    {
        return begin == end;
    }

    /// @brief Extend this span so it also ends where @p other ends.
    /// @details Tokens arrive in source order, so the union keeps the earlier
    ///          begin and takes the later end.
    [[nodiscard]] constexpr Span merge(Span other) const noexcept
    {
        return Span{begin, other.end};
    }

    /// @brief Check the ordering invariant.
    [[nodiscard]] bool isValid() const;

    /// @brief Slice @p text by this span.
    [[nodiscard]] std::string_view slice(std::string_view text) const
    {
        return text.substr(begin, end - begin);
    }

    bool operator==(const Span &) const = default;
};

/// @brief Represents a resolved position within a source file.
/// @invariant file_id == 0 indicates an unknown location.
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a valid file entry.
    [[nodiscard]] bool isValid() const;

    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }

    [[nodiscard]] bool hasColumn() const
    {
        return column != 0;
    }
};

} // namespace fmtlint::support
