//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/expected.hpp
// Purpose: Provides a lightweight Expected container pairing a value with a typed error.
// Key invariants: Exactly one of value or error is engaged at any time.
// Ownership/Lifetime: Expected owns the contained value or error by value.
// Links: circuit/Solver.hpp, ucvm/Vm.hpp, debug/DebugError.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <type_traits>
#include <utility>

namespace strata::support
{

/// @brief Expected-style container pairing a value with an error on failure.
/// @tparam T Stored value type when the operation succeeds.
/// @tparam E Error payload type describing a failure.
/// @note Mirrors a subset of std::expected; T and E must be distinct types.
template <class T, class E> class Expected
{
    static_assert(!std::is_same_v<std::decay_t<T>, std::decay_t<E>>,
                  "Expected requires distinct value and error types");

  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Enabled only when the provided value does not decay to E to
    ///          avoid colliding with the error constructor below.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, E> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Check whether a value is present.
    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the stored value; requires hasValue().
    T &value()
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const
    {
        return *value_;
    }

    /// @brief Access the error describing the failure; requires !hasValue().
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<E> error_;
};

/// @brief Expected specialization for operations that produce no payload.
template <class E> class Expected<void, E>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<E> error_;
};

} // namespace strata::support
