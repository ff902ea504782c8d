//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager utility responsible for tracking the files
// referenced by diagnostics. The manager assigns stable numeric identifiers to
// file paths and resolves byte offsets back to line/column pairs when the
// diagnostics are printed.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Provides the backing store for file identifiers used in diagnostics.

#include "source_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <limits>

namespace fmtlint::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}

std::vector<std::size_t> buildLineStarts(std::string_view text)
{
    std::vector<std::size_t> starts{0};
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        if (text[i] == '\n')
            starts.push_back(i + 1);
    }
    return starts;
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
///
/// @details The path is normalized into a generic string so diagnostics print
///          platform independent output. Identifiers start at one, leaving
///          zero to represent an unknown location. Registering the same path
///          twice returns the original identifier and rebuilds its line table.
///
/// @param path Filesystem path to normalize and store.
/// @param text File contents used to compute line starts.
/// @return Identifier (>0) representing the stored path, or 0 on overflow.
uint32_t SourceManager::addFile(std::string path, std::string_view text)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
    {
        files_[it->second - 1].lineStarts = buildLineStarts(text);
        return it->second;
    }

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
        return 0;

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(FileEntry{normalized, buildLineStarts(text)});
    path_to_id_.emplace(std::move(normalized), file_id);
    return file_id;
}

/// @brief Retrieve the canonical path associated with a file identifier.
/// @param file_id 1-based identifier previously returned by addFile().
/// @return Stored path, or empty string view if @p file_id is invalid.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1].path;
}

/// @brief Translate a byte offset into a 1-based line/column location.
///
/// @details Performs a binary search over the line-start table: the line is
///          the last start not greater than @p offset.
///
/// @param file_id Identifier previously returned by addFile().
/// @param offset Byte offset into the registered text.
/// @return Resolved location, or an invalid location for unknown ids.
SourceLoc SourceManager::locate(uint32_t file_id, std::size_t offset) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};

    const auto &starts = files_[file_id - 1].lineStarts;
    auto it = std::upper_bound(starts.begin(), starts.end(), offset);
    const auto lineIndex = static_cast<std::size_t>(std::distance(starts.begin(), it)) - 1;
    const std::size_t column = offset - starts[lineIndex];
    return SourceLoc{file_id, static_cast<uint32_t>(lineIndex + 1), static_cast<uint32_t>(column + 1)};
}
} // namespace fmtlint::support
