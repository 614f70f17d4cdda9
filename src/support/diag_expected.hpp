//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diag_expected.hpp
// Purpose: Provides diagnostic helpers and a lightweight Expected container for CLI code.
// Key invariants: An Expected holds either a value or exactly one diagnostic.
// Ownership/Lifetime: Expected owns its value or diagnostic.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/diagnostics.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace novella::support
{
using Diag = Diagnostic;

/// @brief Result of a parse step: either a value or the diagnostic that ended it.
/// @tparam T Value produced on success.
/// @note Parser failures travel as values; only the launcher's usage-error path
///       turns one into process termination.
template <class T> class Expected
{
  public:
    /// @brief Wrap a successful @p value.
    /// @details Disabled for Diag and for Expected itself so that diagnostics
    ///          and copies pick the dedicated constructors.
    template <class U = T,
              class = std::enable_if_t<!std::is_same_v<std::decay_t<U>, Diag> &&
                                       !std::is_same_v<std::decay_t<U>, Expected>>>
    Expected(U &&value) : value_(std::forward<U>(value))
    {
    }

    Expected(Diag diag) : error_(std::move(diag)) {}

    [[nodiscard]] bool hasValue() const
    {
        return value_.has_value();
    }

    explicit operator bool() const
    {
        return hasValue();
    }

    /// @pre hasValue()
    T &value()
    {
        return *value_;
    }

    /// @pre hasValue()
    const T &value() const
    {
        return *value_;
    }

    /// @pre !hasValue()
    const Diag &error() const &
    {
        return *error_;
    }

  private:
    std::optional<T> value_;
    std::optional<Diag> error_;
};

namespace detail
{
/// @brief Lowercase severity label (`note`, `warning`, `error`).
const char *diagSeverityToString(Severity severity);
} // namespace detail

/// @brief Create an error diagnostic carrying @p msg.
Diag makeError(std::string msg);

/// @brief Create a note diagnostic carrying @p msg.
Diag makeNote(std::string msg);

/// @brief Write @p diag as one `[prefix: ]severity: message` line.
/// @details The launcher passes the program label as @p prefix for usage
///          errors, giving `novella: error: ...`.
void printDiag(const Diag &diag, std::ostream &os, std::string_view prefix = {});
} // namespace novella::support
