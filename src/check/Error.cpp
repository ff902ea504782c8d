//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Error.cpp
// Purpose: Messages, labels and help text for each call-site defect.
// Key invariants: Wording depends only on the error's own fields.
// Ownership/Lifetime: Returned strings are owned by the caller.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "check/Error.hpp"
#include "check/Args.hpp"
#include "support/source_manager.hpp"

#include <sstream>
#include <utility>

namespace fmtlint::check
{
namespace
{
std::string helpExcessArgs(std::size_t count)
{
    if (count == 1)
        return "Add a specifier or remove an argument.";
    std::ostringstream os;
    os << "Add " << count << " specifiers or remove " << count << " arguments.";
    return os.str();
}

std::string helpExcessSpecifiers(std::size_t count)
{
    if (count == 1)
        return "Add an argument or remove a specifier.";
    std::ostringstream os;
    os << "Add " << count << " arguments or remove " << count << " specifiers.";
    return os.str();
}
} // namespace

std::string_view errorCode(ErrorKind kind) noexcept
{
    switch (kind)
    {
        case ErrorKind::MissingFunctionArgs:
            return "F0001";
        case ErrorKind::NonliteralFormat:
            return "F0002";
        case ErrorKind::SpecifierCastMismatch:
            return "F0003";
        case ErrorKind::ExcessSpecifiers:
            return "F0004";
        case ErrorKind::ExcessArgs:
            return "F0005";
    }
    return {};
}

Error Error::missingFunctionArgs(Span args)
{
    Error e;
    e.kind = ErrorKind::MissingFunctionArgs;
    e.span = args;
    return e;
}

Error Error::nonliteral(const Arg &arg)
{
    Error e;
    e.kind = ErrorKind::NonliteralFormat;
    e.span = arg.span;
    if (arg.singleToken && arg.singleToken->kind == lex::ArgTokenKind::Identifier)
    {
        e.help = "To safely print a string, use `printf(\"%s\", ";
        e.help.append(arg.singleToken->text);
        e.help += ")` instead.";
    }
    else
    {
        e.help = "Use a string literal as the first argument, like `printf(\"hello\")`.";
    }
    return e;
}

Error Error::specifierCastMismatch(Span specifier,
                                   PrimitiveType specifierType,
                                   Span cast,
                                   PrimitiveType castType)
{
    Error e;
    e.kind = ErrorKind::SpecifierCastMismatch;
    e.span = specifier;
    e.secondary = cast;
    e.specifierType = specifierType;
    e.castType = castType;
    return e;
}

Error Error::excessSpecifiers(Span format, Span args, std::size_t additional)
{
    Error e;
    e.kind = ErrorKind::ExcessSpecifiers;
    e.span = format;
    e.secondary = args;
    e.count = additional;
    return e;
}

Error Error::excessArgs(Span format, Span args, std::size_t additional)
{
    Error e;
    e.kind = ErrorKind::ExcessArgs;
    e.span = format;
    e.secondary = args;
    e.count = additional;
    return e;
}

std::string Error::message() const
{
    switch (kind)
    {
        case ErrorKind::MissingFunctionArgs:
            return "Missing function arguments.";
        case ErrorKind::NonliteralFormat:
            return "Format string isn't a string literal, this is potentially an overflow "
                   "vulnerability!";
        case ErrorKind::SpecifierCastMismatch:
            return "Incorrect specifier for type casted argument.";
        case ErrorKind::ExcessSpecifiers:
            return "Excess specifiers, this will read arbitrary data off the stack!";
        case ErrorKind::ExcessArgs:
            return "Excess arguments.";
    }
    return {};
}

std::vector<support::Label> Error::labels() const
{
    std::ostringstream os;
    switch (kind)
    {
        case ErrorKind::MissingFunctionArgs:
            return {{span, "not enough arguments in function call"}};
        case ErrorKind::NonliteralFormat:
            return {{span, "not a string literal"}};
        case ErrorKind::SpecifierCastMismatch:
        {
            os << "format string expects `" << specifierType << "` value";
            std::string expects = os.str();
            os.str({});
            os << "argument is casted as `" << castType << '`';
            return {{span, std::move(expects)}, {secondary, os.str()}};
        }
        case ErrorKind::ExcessSpecifiers:
            os << count << " too many specifiers";
            return {{span, os.str()}, {secondary, "not enough arguments"}};
        case ErrorKind::ExcessArgs:
            os << count << " too many arguments";
            return {{span, "not enough specifiers"}, {secondary, os.str()}};
    }
    return {};
}

std::string Error::helpText() const
{
    switch (kind)
    {
        case ErrorKind::MissingFunctionArgs:
            return "Supply enough arguments for the function call.";
        case ErrorKind::NonliteralFormat:
            return help;
        case ErrorKind::SpecifierCastMismatch:
        {
            std::ostringstream os;
            os << "Change the specifier to `%" << lex::specifierChar(castType)
               << "`, or change the cast to `(" << specifierType << ")`.";
            return os.str();
        }
        case ErrorKind::ExcessSpecifiers:
            return helpExcessSpecifiers(count);
        case ErrorKind::ExcessArgs:
            return helpExcessArgs(count);
    }
    return {};
}

support::Diagnostic Error::toDiagnostic(uint32_t fileId) const
{
    support::Diagnostic diag{support::Severity::Error, message()};
    diag.fileId = fileId;
    diag.code = std::string(errorCode(kind));
    diag.labels = labels();
    diag.help = helpText();
    return diag;
}

SourceErrors::SourceErrors(std::string filename, std::string source, std::vector<Error> errors)
    : filename_(std::move(filename)), source_(std::move(source)), errors_(std::move(errors))
{
}

void SourceErrors::report(support::DiagnosticEngine &engine, uint32_t fileId) const
{
    for (const auto &error : errors_)
        engine.report(error.toDiagnostic(fileId));
}

void SourceErrors::print(std::ostream &os) const
{
    support::SourceManager sm;
    const uint32_t fileId = sm.addFile(filename_, source_);
    os << message() << '\n';
    for (const auto &error : errors_)
        support::printDiag(error.toDiagnostic(fileId), os, &sm);
}

} // namespace fmtlint::check
