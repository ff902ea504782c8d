//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity queries for Span and SourceLoc. Spans are produced by
// the tokenizers directly from cursor offsets and are never recomputed from
// content, so the only thing worth checking is that they are not inverted.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements validity queries for `Span` and `SourceLoc`.

#include "support/source_location.hpp"

namespace fmtlint::support
{

/// @brief Determine whether the span is well formed.
/// @return True when @ref Span::begin does not exceed @ref Span::end.
bool Span::isValid() const
{
    return begin <= end;
}

/// @brief Determine whether the location carries a real source attachment.
///
/// @details SourceManager dispenses monotonically increasing identifiers for
///          every file it tracks. The default-constructed location uses zero
///          to mark "unknown", which lets printers elide the path prefix.
///
/// @return True when the location originated from a tracked source file.
bool SourceLoc::isValid() const
{
    return file_id != 0;
}

} // namespace fmtlint::support
