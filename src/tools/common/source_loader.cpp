//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/source_loader.cpp
// Purpose: Read input sources and create rendering outputs.
// Key invariants: The loaded buffer contains the complete file contents.
// Ownership/Lifetime: Returned buffers are owned by the caller.
// Links: src/tools/common/source_loader.hpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Provides file loading and output helpers for the fmtlint CLI.

#include "tools/common/source_loader.hpp"

#include <filesystem>
#include <fstream>
#include <new>
#include <sstream>
#include <system_error>

namespace fmtlint::tools
{

using support::Diagnostic;
using support::makeError;

support::Result<std::string, Diagnostic> loadSourceFile(const std::string &path)
{
    using LoadResult = support::Result<std::string, Diagnostic>;

    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return LoadResult::failure(makeError("failed reading input at " + path));
    }

    // Check file size before reading to avoid OOM on huge files.
    in.seekg(0, std::ios::end);
    auto fileSize = in.tellg();
    in.seekg(0, std::ios::beg);
    constexpr auto kMaxSourceSize = static_cast<std::streamoff>(256ULL * 1024 * 1024);
    if (fileSize < 0 || fileSize > kMaxSourceSize)
    {
        return LoadResult::failure(
            makeError("source file too large: " + path + " (limit: 256 MB)"));
    }

    try
    {
        std::ostringstream ss;
        ss << in.rdbuf();
        return LoadResult::success(ss.str());
    }
    catch (const std::bad_alloc &)
    {
        return LoadResult::failure(makeError("out of memory reading " + path));
    }
}

std::optional<Diagnostic> writeNewFile(const std::string &path,
                                       std::string_view text,
                                       std::string_view what)
{
    const std::string option = "--" + std::string(what);

    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec)
    {
        return makeError("Failed creating output for " + option + ": " + path + ": " +
                         ec.message());
    }
    if (exists)
    {
        return makeError("Failed creating output for " + option + ": " + path +
                         " already exists");
    }

    std::ofstream out(path, std::ios::binary);
    if (!out)
    {
        return makeError("Failed creating output for " + option + ": " + path);
    }

    out << text << '\n';
    out.flush();
    if (!out)
    {
        return makeError("Failed writing to file for " + option);
    }
    return std::nullopt;
}

} // namespace fmtlint::tools
