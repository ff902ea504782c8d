//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Matcher.cpp
// Purpose: Lock-step specifier/argument matching.
// Key invariants: Specifiers are pulled before arguments on every step.
// Ownership/Lifetime: See Matcher.hpp.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#include "check/Matcher.hpp"

#include <utility>

namespace fmtlint::check
{
namespace
{

/// @brief Which of the two sequences produced an item this step.
enum class Step
{
    Both,
    SpecifierOnly,
    ArgumentOnly,
    Neither,
};

Step classify(const std::optional<Specifier> &spec, const std::optional<Arg> &arg)
{
    if (spec && arg)
        return Step::Both;
    if (spec)
        return Step::SpecifierOnly;
    if (arg)
        return Step::ArgumentOnly;
    return Step::Neither;
}

} // namespace

std::optional<Interpolation<FormatValue>> matchFormat(Specifiers &specifiers,
                                                      Args &args,
                                                      const FormatString &format,
                                                      std::vector<Error> &errors)
{
    using Pairs = std::vector<std::pair<std::string_view, FormatValue>>;

    // Disengaged once a cast mismatch is found; later steps only look for
    // further mismatches.
    std::optional<Pairs> pairs{std::in_place};

    for (;;)
    {
        std::optional<Specifier> spec = specifiers.next();
        std::optional<Arg> arg = args.next();

        switch (classify(spec, arg))
        {
            case Step::Both:
            {
                if (!arg->cast)
                {
                    if (pairs)
                        pairs->emplace_back(specifiers.before(),
                                            FormatValue{args.source(arg->span), false, *spec});
                    break;
                }
                if (arg->cast->type != spec->type)
                {
                    errors.push_back(Error::specifierCastMismatch(
                        specifiers.span(format.contentOffset), spec->type, arg->cast->span,
                        arg->cast->type));
                    pairs.reset();
                    break;
                }
                if (pairs)
                    pairs->emplace_back(specifiers.before(),
                                        FormatValue{args.source(arg->span), true, *spec});
                break;
            }

            case Step::SpecifierOnly:
            {
                const Span argsSpan = args.shortCircuit().second;
                errors.push_back(
                    Error::excessSpecifiers(format.span, argsSpan, specifiers.count() + 1));
                return std::nullopt;
            }

            case Step::ArgumentOnly:
            {
                auto [remaining, argsSpan] = args.shortCircuit();
                errors.push_back(Error::excessArgs(format.span, argsSpan, remaining + 1));
                return std::nullopt;
            }

            case Step::Neither:
                if (!pairs)
                    return std::nullopt;
                return Interpolation<FormatValue>{std::move(*pairs), specifiers.remainder()};
        }
    }
}

} // namespace fmtlint::check
