//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/LauncherSanitizer.hpp
// Purpose: Removes arguments injected by store launchers and the macOS loader.
// Key invariants: Runs once per process, before any parse pass; the program name
//                 is never removed.
// Ownership/Lifetime: Mutates the caller's ArgVector in place.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/ArgVector.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace novella::cli
{

/// @brief Prefix of the arguments the Epic Games Store launcher appends.
inline constexpr std::string_view kEpicLauncherMarker = "-epicapp=";

/// @brief Prefix of the process serial number macOS passes to quarantined apps.
inline constexpr std::string_view kQuarantineMarker = "-psn";

/// @brief What the sanitizer did to the argument vector.
enum class SanitizeAction
{
    None,                 ///< No marker found; vector untouched.
    LauncherArgsPreserved, ///< Launcher marker found; tail moved to the side channel.
    QuarantineArgsDropped  ///< Quarantine marker found; tail discarded.
};

/// @brief Report whether any token after the program name starts with @p marker.
/// @details The comparison lowercases each token and matches @p marker as a
///          prefix; @p marker itself must already be lowercase.
[[nodiscard]] bool hasMarker(const std::vector<std::string> &tokens, std::string_view marker);

/// @brief Strip foreign launcher and quarantine arguments from @p args.
/// @details The launcher check runs first.  When it matches, the tail is kept
///          in @ref ArgVector::launcherArguments and the vector is truncated to
///          the program name.  Otherwise a quarantine match truncates the vector
///          and discards the tail.  Nothing is printed.
/// @return The action taken.
SanitizeAction sanitizeLauncherArguments(ArgVector &args);

/// @brief Human-readable summary of @p action for trace notes.
[[nodiscard]] const char *describeSanitizeAction(SanitizeAction action);

} // namespace novella::cli
