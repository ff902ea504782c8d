//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Interpolation.hpp
// Purpose: Literal text interleaved with values.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string_view>
#include <utility>
#include <vector>

namespace fmtlint::check
{

/// @brief Chunks of literal text, each followed by a value, then a tail.
/// @details Reading every pair's chunk and value in order and then @ref last
///          covers the interpolated text exactly once.
template <typename T> struct Interpolation
{
    std::vector<std::pair<std::string_view, T>> pairs;
    std::string_view last;
};

} // namespace fmtlint::check
