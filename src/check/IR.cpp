//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/IR.cpp
// Purpose: Call-site scanner building the whole-file representation.
// Key invariants: Code between call sites is sliced by offset, so whitespace
//                 and comments survive exactly.
// Ownership/Lifetime: See IR.hpp.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "check/IR.hpp"
#include "check/Args.hpp"
#include "check/Specifiers.hpp"
#include "lex/SourceLexer.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <utility>

namespace fmtlint::check
{
namespace
{

template <std::size_t PreArgs> struct ParsedArgs
{
    std::array<std::string_view, PreArgs> pre{};
    Interpolation<FormatValue> format;
};

/// @brief Parse the arguments of one call, @p PreArgs of them ahead of the
///        format string (0 for printf, 2 for snprintf).
/// @details Expects the source lexer to have just returned the call's '('.
///          Unless input ends inside the call, the lexer is left past the
///          closing ')' whether or not the call validates.
template <std::size_t PreArgs>
std::optional<ParsedArgs<PreArgs>> parseArgs(lex::SourceLexer &lexer, std::vector<Error> &errors)
{
    Args args(lexer);
    ParsedArgs<PreArgs> parsed;

    for (std::string_view &slot : parsed.pre)
    {
        std::optional<Arg> arg = args.next();
        if (!arg)
        {
            errors.push_back(Error::missingFunctionArgs(args.shortCircuit().second));
            return std::nullopt;
        }
        slot = args.source(arg->span);
    }

    auto format = args.nextFormatString();
    if (!format)
    {
        errors.push_back(format.error());
        return std::nullopt;
    }

    Specifiers specifiers(format.value().text);
    std::optional<Interpolation<FormatValue>> matched =
        matchFormat(specifiers, args, format.value(), errors);
    if (!matched)
        return std::nullopt;
    parsed.format = std::move(*matched);
    return parsed;
}

std::optional<Site> parseSite(lex::SourceTokenKind kind,
                              lex::SourceLexer &lexer,
                              std::vector<Error> &errors)
{
    switch (kind)
    {
        case lex::SourceTokenKind::Printf:
            if (auto parsed = parseArgs<0>(lexer, errors))
                return Site{PrintfSite{std::move(parsed->format)}};
            break;
        case lex::SourceTokenKind::Sprintf:
            if (auto parsed = parseArgs<1>(lexer, errors))
                return Site{SprintfSite{parsed->pre[0], std::move(parsed->format)}};
            break;
        case lex::SourceTokenKind::Snprintf:
            if (auto parsed = parseArgs<2>(lexer, errors))
                return Site{
                    SnprintfSite{parsed->pre[0], parsed->pre[1], std::move(parsed->format)}};
            break;
        default:
            break;
    }
    return std::nullopt;
}

bool isTrackedCall(lex::SourceTokenKind kind)
{
    return kind == lex::SourceTokenKind::Printf || kind == lex::SourceTokenKind::Sprintf ||
           kind == lex::SourceTokenKind::Snprintf;
}

} // namespace

const Interpolation<FormatValue> &siteFormat(const Site &site)
{
    return std::visit([](const auto &s) -> const Interpolation<FormatValue> & { return s.format; },
                      site);
}

IntermediateRepresentation::IntermediateRepresentation(Interpolation<Site> body)
    : body_(std::move(body))
{
}

IntermediateRepresentation::ParseResult IntermediateRepresentation::parse(std::string_view source)
{
    lex::SourceLexer lexer(source);
    std::vector<Error> errors;
    Interpolation<Site> body;
    bool valid = true;
    std::size_t chunkBegin = 0;

    while (std::optional<lex::SourceToken> tok = lexer.next())
    {
        if (!isTrackedCall(tok->kind))
            continue;

        // A tracked name not followed by '(' is ordinary code.
        const std::optional<lex::SourceToken> &following = lexer.peek();
        if (!following || following->kind != lex::SourceTokenKind::LParen)
            continue;

        const std::string_view before = source.substr(chunkBegin, tok->span.begin - chunkBegin);
        lexer.next();

        std::optional<Site> site = parseSite(tok->kind, lexer, errors);
        chunkBegin = lexer.offset();
        if (!site)
        {
            valid = false;
            continue;
        }
        if (valid)
            body.pairs.emplace_back(before, std::move(*site));
    }

    if (!valid)
        return ParseResult::failure(std::move(errors));

    body.last = source.substr(chunkBegin);
    return ParseResult::success(IntermediateRepresentation(std::move(body)));
}

} // namespace fmtlint::check
