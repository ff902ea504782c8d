//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/fmtlint/version.hpp
// Purpose: Release version of the fmtlint tool.
//
//===----------------------------------------------------------------------===//

#pragma once

#define FMTLINT_VERSION_MAJOR 0
#define FMTLINT_VERSION_MINOR 1
#define FMTLINT_VERSION_PATCH 0
#define FMTLINT_VERSION_STR "0.1.0"
