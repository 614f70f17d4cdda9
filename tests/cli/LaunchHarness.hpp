// File: tests/cli/LaunchHarness.hpp
// Purpose: Drive a full launch with the built-in commands against test doubles.
// Key invariants: The session store survives between launches so markers carry over.
// Ownership/Lifetime: Owns the launcher of the most recent launch.

#pragma once

#include "FakeEngineServices.hpp"

#include "cli/BuiltinCommands.hpp"
#include "cli/Launcher.hpp"
#include "support/environment.hpp"
#include "support/session_store.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace novella::test
{

struct LaunchHarness
{
    /// @brief Run sanitize, bootstrap, built-in registration and dispatch.
    cli::LaunchOutcome launch(std::vector<std::string> tokens)
    {
        launcher = std::make_unique<cli::Launcher>(
            cli::ArgVector(std::move(tokens)), session, services, environment);
        launcher->bootstrap();
        cli::registerBuiltinCommands(launcher->registry());
        launcher->finishRegistration();
        return launcher->dispatch();
    }

    const cli::ParsedArgs &args() const
    {
        return launcher->context().args;
    }

    support::SessionStore session;
    FakeEngineServices services;
    support::MapEnvironment environment;
    std::unique_ptr<cli::Launcher> launcher;
};

} // namespace novella::test
