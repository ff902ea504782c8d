/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine and the plain-text printer.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     The diagnostic engine aggregates messages emitted by the tool and keeps
 *     track of severity counts. Diagnostics are stored until callers
 *     explicitly print or inspect them. Byte spans are resolved to line and
 *     column only here, at print time.
 */

#include "diagnostics.hpp"
#include "source_manager.hpp"

namespace fmtlint::support
{
namespace
{
/// @brief Write "<path>:<line>:<col>: " for @p offset when it can be resolved.
void printLocation(std::ostream &os, const SourceManager *sm, uint32_t fileId, std::size_t offset)
{
    if (!sm || fileId == 0)
        return;
    auto path = sm->getPath(fileId);
    if (path.empty())
        return;
    SourceLoc loc = sm->locate(fileId, offset);
    os << path;
    if (loc.hasLine())
    {
        os << ':' << loc.line;
        if (loc.hasColumn())
            os << ':' << loc.column;
    }
    os << ": ";
}
} // namespace

/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * @param os Output stream that receives the formatted diagnostics.
 * @param sm Optional source manager used to translate spans.
 */
void DiagnosticEngine::printAll(std::ostream &os, const SourceManager *sm) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os, sm);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}

namespace detail
{
const char *diagSeverityToString(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace detail

Diagnostic makeError(std::string msg)
{
    return Diagnostic{Severity::Error, std::move(msg)};
}

/**
 * @brief Print a diagnostic to the provided output stream.
 *
 * The headline is located at the first label, when there is one, following the
 * common "<path>:<line>:<column>: severity: message" compiler style. Each label
 * then gets an indented note line at its own location, and the help text, if
 * any, closes the block.
 *
 * @param diag Diagnostic to render.
 * @param os Output stream receiving the textual representation.
 * @param sm Optional source manager for mapping spans to paths and lines.
 */
void printDiag(const Diagnostic &diag, std::ostream &os, const SourceManager *sm)
{
    if (!diag.labels.empty())
        printLocation(os, sm, diag.fileId, diag.labels.front().span.begin);
    else if (sm && diag.fileId != 0 && !sm->getPath(diag.fileId).empty())
        os << sm->getPath(diag.fileId) << ": ";

    os << detail::diagSeverityToString(diag.severity);
    if (!diag.code.empty())
        os << '[' << diag.code << ']';
    os << ": " << diag.message << '\n';

    for (const auto &label : diag.labels)
    {
        os << "  ";
        printLocation(os, sm, diag.fileId, label.span.begin);
        os << "note: " << label.text << '\n';
    }

    if (!diag.help.empty())
        os << "  help: " << diag.help << '\n';
}
} // namespace fmtlint::support
