//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/IR.hpp
// Purpose: Validated whole-file representation: literal code interleaved with
//          printf-family call sites.
// Key invariants: Only constructed when every call site in the file validated.
// Ownership/Lifetime: Every string_view borrows the parsed source text, which
//                     must outlive the representation and its views.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "check/Error.hpp"
#include "check/Interpolation.hpp"
#include "check/Matcher.hpp"
#include "check/Render.hpp"
#include "support/result.hpp"

#include <string_view>
#include <variant>
#include <vector>

namespace fmtlint::check
{

struct PrintfSite
{
    Interpolation<FormatValue> format;
};

struct SprintfSite
{
    std::string_view buffer;
    Interpolation<FormatValue> format;
};

struct SnprintfSite
{
    std::string_view buffer;
    std::string_view bufsz;
    Interpolation<FormatValue> format;
};

/// @brief One validated call.
using Site = std::variant<PrintfSite, SprintfSite, SnprintfSite>;

/// @brief Format interpolation of any site.
const Interpolation<FormatValue> &siteFormat(const Site &site);

class IntermediateRepresentation
{
  public:
    using ParseResult = support::Result<IntermediateRepresentation, std::vector<Error>>;

    /// @brief Scan @p source once and validate every printf-family call.
    /// @details Scanning continues past a failing call so that one pass
    ///          reports the defects of every call in the file.
    /// @return The representation, or every error found, in source order.
    static ParseResult parse(std::string_view source);

    [[nodiscard]] const Interpolation<Site> &interpolation() const noexcept
    {
        return body_;
    }

    /// @brief Validated call sites, each with the code preceding it.
    [[nodiscard]] const std::vector<std::pair<std::string_view, Site>> &sites() const noexcept
    {
        return body_.pairs;
    }

    /// @brief Code after the last call site.
    [[nodiscard]] std::string_view last() const noexcept
    {
        return body_.last;
    }

    [[nodiscard]] OptimizedView displayOptimize() const
    {
        return OptimizedView(*this);
    }

    [[nodiscard]] TypecastView displayTypecast() const
    {
        return TypecastView(*this);
    }

  private:
    explicit IntermediateRepresentation(Interpolation<Site> body);

    Interpolation<Site> body_;
};

} // namespace fmtlint::check
