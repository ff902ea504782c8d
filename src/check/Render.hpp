//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: check/Render.hpp
// Purpose: Text renderings of a validated file.
// Key invariants: Rendering never modifies the representation; literal code
//                 outside call sites is copied byte for byte.
// Ownership/Lifetime: Views borrow the representation, which must outlive them.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string>

namespace fmtlint::check
{

class IntermediateRepresentation;

/// @brief Rendering that calls the fixed-arity safe_* family.
/// @details Each call becomes `safe_printf(N, "chunk", (void*) &(arg), fmt_int, ..., "tail")`
///          where N is three times the number of values plus one.
class OptimizedView
{
  public:
    explicit OptimizedView(const IntermediateRepresentation &ir) : ir_(ir) {}

    void print(std::ostream &os) const;

    [[nodiscard]] std::string str() const;

  private:
    const IntermediateRepresentation &ir_;
};

/// @brief Rendering that keeps the original calls but casts every argument
///        that was not already cast to its specifier's type.
class TypecastView
{
  public:
    explicit TypecastView(const IntermediateRepresentation &ir) : ir_(ir) {}

    void print(std::ostream &os) const;

    [[nodiscard]] std::string str() const;

  private:
    const IntermediateRepresentation &ir_;
};

std::ostream &operator<<(std::ostream &os, const OptimizedView &view);
std::ostream &operator<<(std::ostream &os, const TypecastView &view);

} // namespace fmtlint::check
