//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/fmtlint/usage.hpp
// Purpose: Declarations for fmtlint help and version text.
// Key invariants: None.
// Ownership/Lifetime: N/A.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

namespace fmtlint::tools
{

/// @brief Print usage information to stderr.
void printUsage();

/// @brief Print version information to stdout.
void printVersion();

} // namespace fmtlint::tools
