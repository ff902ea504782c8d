//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps file identifiers to paths and byte offsets to line/column pairs.
// Key invariants: File id 0 is invalid; line tables are built once per file.
// Ownership/Lifetime: Owns path strings and line tables, never the source text.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "source_location.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/// @brief Tracks mapping from file ids to paths and source locations.
/// @invariant File id 0 is invalid.
/// @ownership Owns stored file path strings.
namespace fmtlint::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Maintains the mapping between numeric file identifiers and their
/// filesystem paths, plus a table of line starts so byte spans can be turned
/// into 1-based line/column pairs when diagnostics are printed.
class SourceManager
{
  public:
    /// @brief Register file @p path whose contents are @p text.
    /// @param path File system path.
    /// @param text Contents used to build the line table; not retained.
    /// @return New file identifier (>0 on success, 0 on overflow).
    uint32_t addFile(std::string path, std::string_view text = {});

    /// @brief Retrieve path for @p file_id.
    /// @return File path string view, empty for unknown ids.
    std::string_view getPath(uint32_t file_id) const;

    /// @brief Resolve byte @p offset in @p file_id to a line and column.
    /// @details Columns count bytes from the start of the line. Offsets past
    ///          the end of the file clamp to the last line.
    SourceLoc locate(uint32_t file_id, std::size_t offset) const;

  private:
    struct FileEntry
    {
        std::string path;
        std::vector<std::size_t> lineStarts; ///< Offset of each line's first byte.
    };

    std::deque<FileEntry> files_;
    uint64_t next_file_id_ = 1;
    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace fmtlint::support
