//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements command-line parsing for the fmtlint driver. Options are matched
// by exact spelling; `--optimize` and `--typecast` take the following argument
// or an `=`-joined value.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Parses fmtlint command-line options.

#include "cli.hpp"

#include <string_view>

namespace fmtlint::tools
{
namespace
{

/// @brief Match an option that takes a value, in `--name VALUE` or
///        `--name=VALUE` form.
/// @return False when @p arg is not this option; @p ok is cleared when the
///         option matched but its value is missing or was already given.
bool parseValueOption(std::string_view name,
                      ArgvView args,
                      int &index,
                      std::string &value,
                      bool &ok)
{
    const std::string_view arg = args.at(index);
    if (arg == name)
    {
        if (index + 1 >= args.size() || !value.empty())
        {
            ok = false;
            return true;
        }
        value = std::string(args.at(++index));
        ok = !value.empty();
        return true;
    }
    if (arg.size() > name.size() && arg.substr(0, name.size()) == name &&
        arg[name.size()] == '=')
    {
        if (!value.empty())
        {
            ok = false;
            return true;
        }
        value = std::string(arg.substr(name.size() + 1));
        ok = !value.empty();
        return true;
    }
    return false;
}

} // namespace

CliParseResult parseCli(ArgvView args, CliOptions &opts)
{
    for (int i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args.at(i);
        bool ok = true;

        if (arg == "-h" || arg == "--help")
        {
            opts.showHelp = true;
            continue;
        }
        if (arg == "--version")
        {
            opts.showVersion = true;
            continue;
        }
        if (parseValueOption("--optimize", args, i, opts.optimizePath, ok) ||
            parseValueOption("--typecast", args, i, opts.typecastPath, ok))
        {
            if (!ok)
                return CliParseResult::Error;
            continue;
        }
        if (arg.size() > 1 && arg.front() == '-')
        {
            return CliParseResult::Error;
        }
        if (!opts.inputPath.empty())
        {
            return CliParseResult::Error;
        }
        opts.inputPath = std::string(arg);
    }

    if (opts.showHelp || opts.showVersion)
        return CliParseResult::Parsed;
    return opts.inputPath.empty() ? CliParseResult::Error : CliParseResult::Parsed;
}

} // namespace fmtlint::tools
