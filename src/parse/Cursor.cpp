//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/parse/Cursor.cpp
// Purpose: Provide out-of-line helpers for the parse::Cursor utility.
// Key invariants: The index never exceeds the size of the viewed buffer.
// Ownership/Lifetime: Operates on caller-owned string_view buffers.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the byte cursor shared by the tokenizers.

#include "fmtlint/parse/Cursor.hpp"

namespace fmtlint::parse
{

/// @brief Construct a cursor over the provided source buffer.
/// @param text Source text to traverse.
/// @param start Initial byte offset; clamped to the buffer size.
Cursor::Cursor(std::string_view text, std::size_t start) noexcept
    : text_(text), index_(start < text.size() ? start : text.size())
{
}

/// @brief Inspect the current character without advancing.
/// @details Returns '\0' when the cursor is at the end to simplify callers that
///          expect a sentinel terminator.
char Cursor::peek() const noexcept
{
    return atEnd() ? '\0' : text_[index_];
}

char Cursor::peek(std::size_t ahead) const noexcept
{
    const std::size_t idx = index_ + ahead;
    return idx < text_.size() ? text_[idx] : '\0';
}

/// @brief Consume the current character.
/// @details Safely returns when already at end-of-input.
void Cursor::advance() noexcept
{
    if (atEnd())
        return;
    ++index_;
}

void Cursor::advance(std::size_t count) noexcept
{
    seek(index_ + count);
}

/// @brief Conditionally consume @p c and report success.
/// @param c Character to consume.
/// @return True when @p c was consumed.
bool Cursor::consumeIf(char c) noexcept
{
    if (!atEnd() && peek() == c)
    {
        advance();
        return true;
    }
    return false;
}

/// @brief Consume a fixed spelling.
/// @param literal Text that must appear verbatim at the cursor.
/// @return True when the literal was consumed; the cursor is untouched otherwise.
bool Cursor::consumeLiteral(std::string_view literal) noexcept
{
    if (literal.empty() || !startsWith(literal))
        return false;
    index_ += literal.size();
    return true;
}

/// @brief Move the cursor to @p offset within the source buffer.
/// @param offset Zero-based index into the source buffer.
void Cursor::seek(std::size_t offset) noexcept
{
    index_ = offset < text_.size() ? offset : text_.size();
}

} // namespace fmtlint::parse
