//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/Bootstrap.hpp
// Purpose: Early, tolerant parse that runs before any command is registered.
// Key invariants: Never fails on unknown tokens; sanitization happens first.
// Ownership/Lifetime: Mutates the caller's ArgVector; returns results by value.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/ArgVector.hpp"
#include "cli/LauncherSanitizer.hpp"
#include "cli/LaunchContext.hpp"
#include "cli/ParsedArgs.hpp"

#include <string>
#include <vector>

namespace novella::cli
{

/// @brief Provisional arguments recovered by the bootstrap pass.
struct BootstrapResult
{
    ParsedArgs args;

    /// @brief Tokens left for the strict pass to judge.
    std::vector<std::string> unrecognized;

    SanitizeAction sanitized = SanitizeAction::None;
};

/// @brief Force the lint flag when the command itself is "lint".
/// @details Keeps `novella <dir> lint` and `novella <dir> --lint` equivalent.
///          Applied after the bootstrap parse and again after every strict
///          parse, since the strict result replaces the bootstrap one.
void applyBootstrapOverrides(ParsedArgs &args);

/// @brief Parse an already sanitized @p argv with the lenient grammar.
/// @details Malformed known options (a missing value, a non-integer trace
///          level) still exit through the usage error path, as does
///          `--version` through the version path.  The result's
///          `sanitized` field is left at None.
BootstrapResult parseProvisional(const ArgVector &argv, const SessionMarkers &markers);

/// @brief Sanitize @p argv, then run @ref parseProvisional on it.
BootstrapResult bootstrap(ArgVector &argv, const SessionMarkers &markers);

} // namespace novella::cli
