//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/Launcher.hpp
// Purpose: Drives sanitize -> bootstrap -> registration -> dispatch in order.
// Key invariants: Phases only move forward; calling an operation in the wrong
//                 phase is a programming error caught by assertion.
// Ownership/Lifetime: Owns the argument vector, launch context and registry;
//                     borrows the session store, engine services and environment.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/ArgVector.hpp"
#include "cli/CommandRegistry.hpp"
#include "cli/EngineServices.hpp"
#include "cli/LaunchContext.hpp"
#include "cli/ParsedArgs.hpp"
#include "support/environment.hpp"
#include "support/session_store.hpp"

#include <string>

namespace novella::cli
{

/// @brief Progress of one launch.
enum class LaunchPhase
{
    Unparsed,
    Sanitized,
    Bootstrapped,
    Registered,
    Resolved,
    Dispatched
};

/// @brief Decision returned by the dispatched command.
enum class LaunchOutcome
{
    Continue, ///< Proceed with normal engine startup.
    Stop      ///< Terminate; the command has done its work.
};

/// @brief Owner of the two-phase argument protocol.
class Launcher
{
  public:
    Launcher(ArgVector argv,
             support::SessionStore &session,
             EngineServices &services,
             support::Environment &environment);

    /// @brief Sanitize the vector and run the lenient pass.
    /// @return The provisional arguments.
    const ParsedArgs &bootstrap();

    /// @brief Registry to populate between @ref bootstrap and
    ///        @ref finishRegistration.
    CommandRegistry &registry();

    /// @brief Convenience forwarder to the registry.
    void registerCommand(std::string name, CommandHandler handler, bool needsDisplay = false);

    /// @brief Seal the registry; no further commands may be registered.
    void finishRegistration();

    /// @brief Resolve and run the command, then persist session markers.
    LaunchOutcome dispatch();

    [[nodiscard]] LaunchPhase phase() const
    {
        return phase_;
    }

    [[nodiscard]] const LaunchContext &context() const
    {
        return launch_;
    }

    [[nodiscard]] const ArgVector &arguments() const
    {
        return argv_;
    }

    /// @brief Exit status requested by a stopping command (0 by default).
    [[nodiscard]] int exitStatus() const
    {
        return launch_.exitStatus;
    }

  private:
    ArgVector argv_;
    support::SessionStore &session_;
    EngineServices &services_;
    support::Environment &environment_;
    LaunchContext launch_;
    CommandRegistry registry_;
    LaunchPhase phase_ = LaunchPhase::Unparsed;
};

/// @brief Name of @p phase for diagnostics.
[[nodiscard]] const char *phaseName(LaunchPhase phase);

} // namespace novella::cli
