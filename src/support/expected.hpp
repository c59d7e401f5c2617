//===----------------------------------------------------------------------===//
//
// Part of the Pixart project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/expected.hpp
// Purpose: Lightweight Expected container pairing a value with a typed error.
// Key invariants: Exactly one of value or error is engaged at any time.
// Ownership/Lifetime: Expected owns its contained value or error.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <type_traits>
#include <utility>

namespace pixart::support
{

/// @brief Expected-style container holding either a value or an error.
/// @tparam T Stored value type when the operation succeeds.
/// @tparam E Error payload type describing a failure.
/// @note Mirrors a subset of std::expected so callers can migrate once the
///       standard type is universally available on our toolchains.
template <class T, class E> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Disabled when the argument decays to @p E so errors always
    ///          take the dedicated constructor below, and for Expected itself
    ///          so copies use the implicit copy constructor.
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
    T &value() &
    {
        return *value_;
    }

    /// @brief Access the stored value; requires hasValue().
    const T &value() const &
    {
        return *value_;
    }

    /// @brief Move the stored value out; requires hasValue().
    T &&value() &&
    {
        return std::move(*value_);
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

/// @brief Expected specialization for operations that produce no value.
template <class E> class Expected<void, E>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding @p error.
    Expected(E error) : error_(std::move(error)) {}

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const
    {
        return !error_.has_value();
    }

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const
    {
        return hasValue();
    }

    /// @brief Access the error describing the failure; requires !hasValue().
    const E &error() const &
    {
        return *error_;
    }

  private:
    std::optional<E> error_;
};

} // namespace pixart::support
