//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the pipeline behind the `fmtlint` executable. It is kept apart from
// main() so tests can run it with their own streams.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Exposes the reusable validation pipeline behind `fmtlint`.

#pragma once

#include "cli.hpp"

#include <iosfwd>

namespace fmtlint::tools
{

/// @brief Validate the input named by @p opts and write any requested renderings.
///
/// @param opts Parsed command-line options; inputPath must be set.
/// @param err Stream receiving I/O and analysis diagnostics.
/// @return 0 when the file validated and every output was written, 1 otherwise.
int runPipeline(const CliOptions &opts, std::ostream &err);

} // namespace fmtlint::tools
