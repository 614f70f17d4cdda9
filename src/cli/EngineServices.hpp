//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/EngineServices.hpp
// Purpose: Narrow interface through which built-in commands reach the engine.
// Key invariants: Implementations do not parse arguments; commands hand them
//                 already-validated values.
// Ownership/Lifetime: The embedder owns the implementation and keeps it alive
//                     until dispatch returns.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/ParsedArgs.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace novella::cli
{

/// @brief Parameters of a lint run.
struct LintRequest
{
    /// @brief Project root being checked.
    std::string basedir;

    /// @brief File receiving the report; nullopt writes to stdout.
    std::optional<std::string> reportPath;
};

/// @brief Engine collaborators invoked by the built-in commands.
class EngineServices
{
  public:
    virtual ~EngineServices() = default;

    /// @brief Arrange for startup to warp to @p spec (`file:line`).
    virtual void setWarpSpec(const std::string &spec) = 0;

    /// @brief Enable reporting of screen draw times.
    virtual void setProfileDisplay(bool enabled) = 0;

    /// @brief Enable logging of image cache contents.
    virtual void setDebugImageCache(bool enabled) = 0;

    /// @brief Check the project's scripts.
    /// @return Number of problems found.
    virtual std::size_t runLint(const LintRequest &request) = 0;

    /// @brief Delete the persistent data selected by @p args.
    /// @return False when the data exists but could not be removed.
    virtual bool unlinkPersistent(const ParsedArgs &args) = 0;

    /// @brief Control whether persistent data is written at shutdown.
    virtual void setShouldSavePersistent(bool enabled) = 0;
};

} // namespace novella::cli
