//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the fmtlint command-line tool.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `fmtlint` CLI tool.

#include "cli.hpp"
#include "driver.hpp"
#include "usage.hpp"

#include <iostream>

/// @brief Parse the command line and run the validation pipeline.
/// @return 0 on success or help/version output, 1 on usage or analysis errors.
int main(int argc, char **argv)
{
    using namespace fmtlint::tools;

    CliOptions opts;
    if (parseCli(ArgvView{argc, argv}.drop_front(), opts) != CliParseResult::Parsed)
    {
        printUsage();
        return 1;
    }
    if (opts.showHelp)
    {
        printUsage();
        return 0;
    }
    if (opts.showVersion)
    {
        printVersion();
        return 0;
    }
    return runPipeline(opts, std::cerr);
}
