//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares span-labelled diagnostics and the engine that collects them.
// Key invariants: Labels keep the order in which they were attached.
// Ownership/Lifetime: Engine owns collected diagnostics; spans index caller-owned text.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

/// @brief Records diagnostics and prints them later.
/// @invariant Counts reflect reported diagnostics.
/// @ownership Owns stored diagnostic messages.
namespace fmtlint::support
{

class SourceManager;

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Text attached to a byte span of the source.
struct Label
{
    Span span;        ///< Highlighted bytes
    std::string text; ///< Caption shown next to the span
};

/// @brief Single diagnostic message with labelled spans.
struct Diagnostic
{
    Severity severity;         ///< Message severity
    std::string message;       ///< Human-readable headline
    uint32_t fileId = 0;       ///< SourceManager id the label spans refer to
    std::string code;          ///< Stable identifier such as "F0003"
    std::vector<Label> labels; ///< Located captions, primary first
    std::string help;          ///< Remediation text; empty when absent
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    /// @param os Output stream.
    /// @param sm Optional source manager for location info.
    void printAll(std::ostream &os, const SourceManager *sm = nullptr) const;

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

    const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an unlocated error diagnostic with @p msg.
Diagnostic makeError(std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @param diag Diagnostic to format.
/// @param os Output stream receiving the text.
/// @param sm Optional source manager to resolve paths and line/column pairs.
void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm = nullptr);

} // namespace fmtlint::support
