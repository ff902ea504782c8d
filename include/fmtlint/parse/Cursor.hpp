//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/fmtlint/parse/Cursor.hpp
// Purpose: Declare a lightweight byte cursor shared by the tokenizers.
// Key invariants: Operates on a string_view without allocating or owning storage.
// Ownership/Lifetime: Views textual buffers owned by the caller; no allocations.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Defines the reusable cursor helper for the source, argument and
///        format tokenizers.
/// @details Every tokenizer owns one cursor over the same underlying buffer.
///          Offsets reported by the cursor are absolute within that buffer,
///          which is what lets spans from different grammar tiers line up.

#pragma once

#include <concepts>
#include <cstddef>
#include <string_view>

namespace fmtlint::parse
{

template <class Predicate>
concept CursorPredicate = requires(Predicate pred, char ch) {
    { pred(ch) } -> std::convertible_to<bool>;
};

/// @brief Lightweight cursor for scanning text by byte offset.
class Cursor
{
  public:
    /// @brief Construct a cursor over @p text starting at byte @p start.
    explicit Cursor(std::string_view text, std::size_t start = 0) noexcept;

    /// @brief Return the backing view observed by the cursor.
    [[nodiscard]] std::string_view view() const noexcept
    {
        return text_;
    }

    /// @brief View the unconsumed suffix.
    [[nodiscard]] std::string_view remaining() const noexcept
    {
        return text_.substr(index_);
    }

    /// @brief Query whether the cursor has reached the end of the buffer.
    [[nodiscard]] bool atEnd() const noexcept
    {
        return index_ >= text_.size();
    }

    /// @brief Inspect the current character without consuming it.
    /// @return Current character, or '\0' at end.
    [[nodiscard]] char peek() const noexcept;

    /// @brief Inspect the character @p ahead bytes past the current one.
    [[nodiscard]] char peek(std::size_t ahead) const noexcept;

    /// @brief Retrieve the absolute byte offset within the buffer.
    [[nodiscard]] std::size_t offset() const noexcept
    {
        return index_;
    }

    /// @brief Check whether the unconsumed text begins with @p prefix.
    [[nodiscard]] bool startsWith(std::string_view prefix) const noexcept
    {
        return remaining().starts_with(prefix);
    }

    /// @brief Consume @p c if present at the cursor.
    bool consumeIf(char c) noexcept;

    /// @brief Consume @p literal if the unconsumed text begins with it.
    bool consumeLiteral(std::string_view literal) noexcept;

    /// @brief Consume characters while @p pred returns true.
    template <CursorPredicate Predicate> std::string_view consumeWhile(Predicate pred) noexcept
    {
        const std::size_t begin = index_;
        while (!atEnd() && pred(peek()))
            advance();
        return text_.substr(begin, index_ - begin);
    }

    /// @brief Advance by a single character if not already at end.
    void advance() noexcept;

    /// @brief Advance by @p count characters, stopping at end.
    void advance(std::size_t count) noexcept;

    /// @brief Move to @p offset within the buffer, clamped to its size.
    void seek(std::size_t offset) noexcept;

  private:
    std::string_view text_;
    std::size_t index_ = 0;
};

} // namespace fmtlint::parse
