//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/novella/version.hpp
// Purpose: Centralized version information for the Novella launcher.
// Key invariants: Update version numbers here only when releasing.
//
//===----------------------------------------------------------------------===//

#pragma once

#define NOVELLA_VERSION_MAJOR 8
#define NOVELLA_VERSION_MINOR 4
#define NOVELLA_VERSION_PATCH 0

#define NOVELLA_VERSION_STR "8.4.0"
#define NOVELLA_VERSION_NAME "Novella 8.4.0"

namespace novella
{

/// @brief Version banner printed by `--version`.
/// @return Pointer to a string with static storage duration.
inline const char *versionString() noexcept
{
    return NOVELLA_VERSION_NAME;
}

} // namespace novella
