//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Error.hpp
// Purpose: Closed taxonomy of call-site defects and their diagnostic rendering.
// Key invariants: Every error carries at least one span into the analysed source.
// Ownership/Lifetime: Errors own their help text; spans index caller-owned text.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "lex/PrimitiveType.hpp"
#include "lex/Token.hpp"
#include "support/diagnostics.hpp"
#include "support/source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace fmtlint::check
{

using lex::PrimitiveType;
using support::Span;

struct Arg;

/// @brief Discriminant of an Error.
enum class ErrorKind
{
    MissingFunctionArgs,   ///< Fewer arguments than the function requires
    NonliteralFormat,      ///< Format argument is not a string literal
    SpecifierCastMismatch, ///< Specifier type disagrees with an explicit cast
    ExcessSpecifiers,      ///< More specifiers than arguments
    ExcessArgs,            ///< More arguments than specifiers
};

/// @brief Stable diagnostic code for @p kind, e.g. "F0003".
[[nodiscard]] std::string_view errorCode(ErrorKind kind) noexcept;

/// @brief One defect found at a call site.
/// @details Only the fields relevant to @ref kind are meaningful; use the
///          named constructors rather than filling the struct by hand.
struct Error
{
    ErrorKind kind{ErrorKind::MissingFunctionArgs};

    /// Primary location: the argument region, the format argument, or the
    /// specifier, depending on @ref kind.
    Span span;

    /// Secondary location: the argument list for excess errors, the cast for
    /// SpecifierCastMismatch.
    Span secondary;

    /// Unmet specifiers or unconsumed arguments for the excess kinds.
    std::size_t count = 0;

    PrimitiveType specifierType{PrimitiveType::Integer};
    PrimitiveType castType{PrimitiveType::Integer};

    /// Help text for NonliteralFormat, which depends on the argument.
    std::string help;

    static Error missingFunctionArgs(Span args);

    /// @brief Non-literal format argument; a lone identifier gets a tailored hint.
    static Error nonliteral(const Arg &arg);

    static Error specifierCastMismatch(Span specifier,
                                       PrimitiveType specifierType,
                                       Span cast,
                                       PrimitiveType castType);

    static Error excessSpecifiers(Span format, Span args, std::size_t additional);

    static Error excessArgs(Span format, Span args, std::size_t additional);

    /// @brief Headline sentence describing the kind of defect.
    [[nodiscard]] std::string message() const;

    /// @brief Located captions, primary location first.
    [[nodiscard]] std::vector<support::Label> labels() const;

    /// @brief Remediation text.
    [[nodiscard]] std::string helpText() const;

    /// @brief Package this error as a diagnostic against file @p fileId.
    [[nodiscard]] support::Diagnostic toDiagnostic(uint32_t fileId = 0) const;

    bool operator==(const Error &) const = default;
};

/// @brief Everything a presentation layer needs to report a failed file.
/// @details Bundles the file name, its full text and the ordered errors so
///          spans can be resolved without any other state.
class SourceErrors
{
  public:
    SourceErrors(std::string filename, std::string source, std::vector<Error> errors);

    [[nodiscard]] const std::string &filename() const noexcept
    {
        return filename_;
    }

    [[nodiscard]] const std::string &source() const noexcept
    {
        return source_;
    }

    [[nodiscard]] const std::vector<Error> &errors() const noexcept
    {
        return errors_;
    }

    /// @brief Headline for the whole bundle.
    [[nodiscard]] static std::string_view message() noexcept
    {
        return "Source code contains errors.";
    }

    /// @brief Report every error to @p engine, located in this file.
    void report(support::DiagnosticEngine &engine, uint32_t fileId) const;

    /// @brief Print the headline and every error with line/column locations.
    void print(std::ostream &os) const;

  private:
    std::string filename_;
    std::string source_;
    std::vector<Error> errors_;
};

} // namespace fmtlint::check
