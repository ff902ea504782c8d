//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: lex/PrimitiveType.hpp
// Purpose: The closed set of C value types that format specifiers and casts name.
// Key invariants: Total mapping: every type has a letter, a C spelling and a formatter.
// Ownership/Lifetime: Returned views point to static storage.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string_view>

namespace fmtlint::lex
{

/// @brief C types that can be formatted.
enum class PrimitiveType
{
    Integer, ///< int
    Float,   ///< float
    String,  ///< char*
};

/// @brief Conversion letter used in a format string, e.g. 'd' for Integer.
[[nodiscard]] char specifierChar(PrimitiveType type) noexcept;

/// @brief Name of the runtime formatter used by the optimize rendering.
[[nodiscard]] std::string_view formatFunction(PrimitiveType type) noexcept;

/// @brief C spelling of the type as written in a cast, e.g. "char*".
[[nodiscard]] std::string_view typeName(PrimitiveType type) noexcept;

std::ostream &operator<<(std::ostream &os, PrimitiveType type);

} // namespace fmtlint::lex
