//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Matcher.hpp
// Purpose: Pairs the specifiers of a format string with the call's arguments.
// Key invariants: A count mismatch ends matching at once; a cast mismatch only
//                 stops pairs from being recorded while matching continues.
// Ownership/Lifetime: The returned interpolation borrows the source text.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "check/Args.hpp"
#include "check/Error.hpp"
#include "check/Interpolation.hpp"
#include "check/Specifiers.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace fmtlint::check
{

/// @brief A specifier together with the argument text it formats.
struct FormatValue
{
    std::string_view arg;     ///< Argument source text, e.g. `name`
    bool typeChecked = false; ///< The argument's cast matches the specifier
    Specifier specifier;
};

/// @brief Walk @p specifiers and @p args in lock step.
/// @param format Format string the specifiers were read from.
/// @param errors Receives every defect found.
/// @return The format's interpolation, or nothing when any error was found.
std::optional<Interpolation<FormatValue>> matchFormat(Specifiers &specifiers,
                                                      Args &args,
                                                      const FormatString &format,
                                                      std::vector<Error> &errors);

} // namespace fmtlint::check
