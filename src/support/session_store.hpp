//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/session_store.hpp
// Purpose: Declares the per-process session key-value store.
// Key invariants: Keys are unique; a stored value is either a boolean or a string.
// Ownership/Lifetime: The store owns its values and outlives a single launch.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <variant>

namespace novella::support
{

/// @brief Key-value store that survives engine reloads within one process.
/// @details Values are either booleans or strings.  Reads of a missing key
///          fall back to a caller-supplied default.
class SessionStore
{
  public:
    using Value = std::variant<bool, std::string>;

    /// @brief Store @p value under @p key, replacing any previous value.
    void set(std::string key, Value value);

    /// @brief Interpret the value under @p key as a truth value.
    /// @details Booleans are returned as-is; strings are true when non-empty.
    /// @param key Key to look up.
    /// @param fallback Value returned when the key is absent.
    [[nodiscard]] bool getFlag(std::string_view key, bool fallback = false) const;

  private:
    std::map<std::string, Value, std::less<>> values_;
};

} // namespace novella::support
