//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/source_loader.hpp
// Purpose: File input and output helpers for the command-line tool.
// Key invariants: Output files are created, never overwritten.
// Ownership/Lifetime: The caller owns returned buffers.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"
#include "support/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fmtlint::tools
{

/// @brief Load a source file into memory.
///
/// Opens @p path in binary mode and reads the whole file so byte offsets in the
/// buffer match the file exactly.
///
/// @param path Filesystem path to the source file.
/// @return File contents on success; otherwise a diagnostic describing the I/O failure.
support::Result<std::string, support::Diagnostic> loadSourceFile(const std::string &path);

/// @brief Create @p path and write @p text followed by a newline.
///
/// @param path File to create; it must not exist yet.
/// @param text Contents to write.
/// @param what Option name used in messages, e.g. "optimize".
/// @return A diagnostic when the file exists or cannot be written.
std::optional<support::Diagnostic> writeNewFile(const std::string &path,
                                                std::string_view text,
                                                std::string_view what);

} // namespace fmtlint::tools
