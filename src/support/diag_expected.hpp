//===----------------------------------------------------------------------===//
//
// Part of the Eqtab project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container.
// Key invariants: An Expected holds exactly one of a value or a diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>

namespace eqtab::support
{
using Diag = Diagnostic;

template <class T> class Expected;

namespace detail
{
template <class U> struct IsExpected : std::false_type
{
};

template <class U> struct IsExpected<Expected<U>> : std::true_type
{
};
} // namespace detail

/// @brief Expected-style container pairing a value with a diagnostic on error.
/// @tparam T Stored value type when the operation succeeds.
/// @note Mirrors a subset of std::expected. The value is always constructed in
///       place, so T may itself be an std::optional and still be returned
///       "empty but successful".
template <class T> class Expected
{
  public:
    /// @brief Construct a successful result containing @p value.
    /// @details Disabled for Diag and Expected arguments so the diagnostic and
    ///          copy constructors are always selected for those.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !detail::IsExpected<std::decay_t<U>>::value>>
    Expected(U &&value) : value_(std::in_place, std::forward<U>(value))
    {
    }

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag) : error_(std::move(diag)) {}

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

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

/// @brief Expected specialization for void success type.
template <> class Expected<void>
{
  public:
    /// @brief Construct a successful result with no payload.
    Expected() = default;

    /// @brief Construct an error result holding diagnostic @p diag.
    Expected(Diag diag);

    /// @brief Check whether the Expected represents success.
    [[nodiscard]] bool hasValue() const;

    /// @brief Allow use in boolean contexts to test success.
    explicit operator bool() const;

    /// @brief Access the diagnostic describing the failure.
    const Diag &error() const &;

  private:
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Convert diagnostic severity to lowercase string.
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic with classification @p code.
Diag makeError(ErrorCode code, std::string msg);

/// @brief Shorthand for a storage-failure diagnostic.
Diag makeStorageError(std::string msg);

/// @brief Print a single diagnostic to the provided stream.
/// @details Format: `<severity>[<code>]: <message>` followed by a newline; the
///          bracketed code is omitted for ErrorCode::None.
void printDiag(const Diag &diag, std::ostream &os);
} // namespace eqtab::support
