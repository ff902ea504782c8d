//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements usage and version output for the `fmtlint` CLI tool.

#include "usage.hpp"
#include "fmtlint/version.hpp"

#include <iostream>

namespace fmtlint::tools
{

void printVersion()
{
    std::cout << "fmtlint v" << FMTLINT_VERSION_STR << "\n";
}

/// @brief Print usage information for the `fmtlint` command.
/// @details Writes the synopsis, option descriptions and examples to stderr.
void printUsage()
{
    std::cerr << "fmtlint v" << FMTLINT_VERSION_STR << " - printf format validator\n"
              << "\n"
              << "Usage: fmtlint [options] <file.c>\n"
              << "\n"
              << "Options:\n"
              << "  --optimize FILE   Write the file with safe_* formatting calls to FILE\n"
              << "  --typecast FILE   Write the file with casts on every format argument to FILE\n"
              << "  -h, --help        Show this help\n"
              << "  --version         Show version information\n"
              << "\n"
              << "Output files must not exist yet; they are never overwritten.\n"
              << "\n"
              << "Examples:\n"
              << "  fmtlint main.c                          Validate printf calls\n"
              << "  fmtlint main.c --typecast main.cast.c   Validate and add casts\n";
}

} // namespace fmtlint::tools
