//===----------------------------------------------------------------------===//
//
// Part of the fmtlint project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/result.hpp
// Purpose: Value-or-error container returned by analysis and file loading.
// Key invariants: Exactly one of value or error is engaged, chosen at
//                 construction and never changed.
// Ownership/Lifetime: The Result owns whichever payload it holds.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace fmtlint::support
{

/// @brief Minimal expected-like container.
/// @details Built only through @ref success and @ref failure so the engaged
///          alternative is always explicit at the call site, even when @p T
///          and @p E are the same type.
template <typename T, typename E = std::string> class Result
{
  public:
    /// @brief Result holding @p value.
    template <typename U = T> static Result success(U &&value)
    {
        return Result(std::in_place_index<0>, std::forward<U>(value));
    }

    /// @brief Result holding @p error.
    static Result failure(E error)
    {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// @brief True when a value is held; @c value() is then valid.
    bool isOk() const
    {
        return storage_.index() == 0;
    }

    explicit operator bool() const
    {
        return isOk();
    }

    /// @pre @c isOk()
    T &value()
    {
        return std::get<0>(storage_);
    }

    /// @pre @c isOk()
    const T &value() const
    {
        return std::get<0>(storage_);
    }

    /// @pre @c !isOk()
    const E &error() const
    {
        return std::get<1>(storage_);
    }

  private:
    template <std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> tag, Args &&...args)
        : storage_(tag, std::forward<Args>(args)...)
    {
    }

    std::variant<T, E> storage_;
};

} // namespace fmtlint::support
