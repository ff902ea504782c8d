//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/Token.hpp
// Purpose: Token kinds for the source, argument and format grammars.
// Key invariants: Spans are absolute offsets into the buffer the lexer views.
// Ownership/Lifetime: Tokens borrow their text from the lexed buffer.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lex/PrimitiveType.hpp"
#include "support/source_location.hpp"

#include <string_view>

namespace fmtlint::lex
{

using support::Span;

/// @brief Token kinds of the whole-file grammar.
/// @details Whitespace is skipped and never produced.
enum class SourceTokenKind
{
    Comment,  ///< // line or /* block */ comment
    String,   ///< String literal, adjacent literals merged
    LParen,   ///< (
    RParen,   ///< )
    Printf,   ///< printf
    Sprintf,  ///< sprintf
    Snprintf, ///< snprintf
    Other,    ///< Anything else: identifiers, numbers, punctuation, char literals
};

struct SourceToken
{
    SourceTokenKind kind{SourceTokenKind::Other};
    Span span;
};

/// @brief Token kinds of the grammar inside a call's argument list.
enum class ArgTokenKind
{
    Comment,    ///< Comment; ignored for single-token classification
    Symbol,     ///< Operator or punctuator other than parentheses and comma
    LParen,     ///< (
    RParen,     ///< )
    Comma,      ///< ,
    Char,       ///< Character literal
    String,     ///< String literal; text holds the unquoted content
    Int,        ///< Integer literal
    Float,      ///< Floating literal
    TypeCast,   ///< (int), (float) or (char*)
    Identifier, ///< Identifier or keyword
    Unknown,    ///< Byte sequence outside the grammar
};

struct ArgToken
{
    ArgTokenKind kind{ArgTokenKind::Unknown};
    Span span;             ///< Whole token
    std::string_view text; ///< Spelling; for String, the bytes between the outer quotes
    Span textSpan;         ///< Location of @ref text
    PrimitiveType castType{PrimitiveType::Integer}; ///< Valid for TypeCast only
};

/// @brief Token kinds of the grammar inside a format string.
enum class FormatTokenKind
{
    Specifier, ///< %d, %i, %s or %f with optional options
    Normal,    ///< Literal text, including unrecognised %-sequences
};

struct FormatToken
{
    FormatTokenKind kind{FormatTokenKind::Normal};
    Span span;                ///< Offsets relative to the format text
    std::string_view options; ///< Text between '%' and the letter
    PrimitiveType type{PrimitiveType::Integer}; ///< Valid for Specifier only
};

} // namespace fmtlint::lex
