//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/LaunchContext.hpp
// Purpose: State threaded from the bootstrap pass into dispatch.
// Key invariants: Session markers are read once at bootstrap; only the warp
//                 marker is produced by the launcher itself.
// Ownership/Lifetime: Owned by the Launcher for the duration of one launch.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/ParsedArgs.hpp"
#include "support/diagnostics.hpp"
#include "support/session_store.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace novella::cli
{

/// @brief Session key set while the engine reloads itself.
inline constexpr std::string_view kReloadMarker = "_reload";

/// @brief Session key requesting a full script compile.
inline constexpr std::string_view kCompileMarker = "compile";

/// @brief Session key recording that the warp target was already applied.
inline constexpr std::string_view kWarpedMarker = "_warped";

/// @brief Cross-pass flags mirrored from the session store.
struct SessionMarkers
{
    bool reload = false;
    bool compileRequested = false;
    bool warped = false;
};

/// @brief Snapshot the launcher-relevant markers from @p store.
SessionMarkers readSessionMarkers(const support::SessionStore &store);

/// @brief Persist markers the launcher produces back into @p store.
/// @details Only the warp marker is written; reload and compile requests are
///          owned by whoever set them.
void writeSessionMarkers(const SessionMarkers &markers, support::SessionStore &store);

/// @brief Everything the dispatch phase inherits from bootstrap.
struct LaunchContext
{
    SessionMarkers markers;

    /// @brief Provisional arguments after bootstrap; replaced by the command's
    ///        strict parse during dispatch.
    ParsedArgs args;

    /// @brief Tokens the bootstrap grammar did not recognise.
    std::vector<std::string> bootstrapUnrecognized;

    /// @brief Notes describing sanitization and command resolution.
    support::DiagnosticEngine notes;

    /// @brief Process exit status requested by a stopping command.
    int exitStatus = 0;
};

} // namespace novella::cli
