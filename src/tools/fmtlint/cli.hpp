//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/fmtlint/cli.hpp
// Purpose: Command-line options of the fmtlint tool.
// Key invariants: None.
// Ownership/Lifetime: Options own copies of every path.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tools/common/ArgvView.hpp"

#include <string>

namespace fmtlint::tools
{

struct CliOptions
{
    /// @brief C source file to validate.
    std::string inputPath{};

    /// @brief Destination of the optimize rendering; empty when not requested.
    std::string optimizePath{};

    /// @brief Destination of the typecast rendering; empty when not requested.
    std::string typecastPath{};

    bool showHelp = false;
    bool showVersion = false;
};

/// @brief Result of parsing the command line.
enum class CliParseResult
{
    Parsed, ///< Options are complete and consistent.
    Error   ///< Unknown option, missing value, or missing/duplicate input.
};

/// @brief Parse the arguments that follow the program name.
///
/// @param args Arguments without argv[0].
/// @param opts Receives parsed option values.
/// @return Parsed, unless the command line is malformed. `-h`, `--help` and
///         `--version` parse successfully without an input file.
CliParseResult parseCli(ArgvView args, CliOptions &opts);

} // namespace fmtlint::tools
