//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the launch sequence.  The engine's own initialization runs
// between bootstrap and registration; the launcher only guarantees that the
// argument protocol steps happen once each and in order.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Phase-checked orchestration of bootstrap and dispatch.

#include "cli/Launcher.hpp"
#include "cli/Bootstrap.hpp"
#include "cli/Dispatcher.hpp"
#include "cli/LauncherSanitizer.hpp"

#include <cassert>
#include <utility>

namespace novella::cli
{

Launcher::Launcher(ArgVector argv,
                   support::SessionStore &session,
                   EngineServices &services,
                   support::Environment &environment)
    : argv_(std::move(argv)), session_(session), services_(services), environment_(environment)
{
}

/// @brief Run the bootstrap pass.
///
/// @details Session markers are captured here and travel with the launch
///          context until dispatch writes the warp marker back.
const ParsedArgs &Launcher::bootstrap()
{
    assert(phase_ == LaunchPhase::Unparsed && "bootstrap must run exactly once");

    const SanitizeAction sanitized = sanitizeLauncherArguments(argv_);
    phase_ = LaunchPhase::Sanitized;
    if (sanitized != SanitizeAction::None)
        launch_.notes.note(describeSanitizeAction(sanitized));

    launch_.markers = readSessionMarkers(session_);
    BootstrapResult result = parseProvisional(argv_, launch_.markers);
    for (const auto &token : result.unrecognized)
        launch_.notes.note("deferring unrecognized argument '" + token + "' to the command");

    launch_.args = std::move(result.args);
    launch_.bootstrapUnrecognized = std::move(result.unrecognized);
    phase_ = LaunchPhase::Bootstrapped;
    return launch_.args;
}

CommandRegistry &Launcher::registry()
{
    assert(phase_ == LaunchPhase::Bootstrapped && "commands are registered after bootstrap");
    return registry_;
}

void Launcher::registerCommand(std::string name, CommandHandler handler, bool needsDisplay)
{
    registry().registerCommand(std::move(name), std::move(handler), needsDisplay);
}

void Launcher::finishRegistration()
{
    assert(phase_ == LaunchPhase::Bootstrapped && "registration finished out of order");
    registry_.seal();
    phase_ = LaunchPhase::Registered;
}

LaunchOutcome Launcher::dispatch()
{
    assert(phase_ == LaunchPhase::Registered && "dispatch requires a completed registration");

    Dispatcher dispatcher(registry_, argv_, launch_, services_, environment_);
    const ResolvedCommand command = dispatcher.resolve();
    phase_ = LaunchPhase::Resolved;
    const bool proceed = dispatcher.invoke(command);
    phase_ = LaunchPhase::Dispatched;

    writeSessionMarkers(launch_.markers, session_);
    return proceed ? LaunchOutcome::Continue : LaunchOutcome::Stop;
}

const char *phaseName(LaunchPhase phase)
{
    switch (phase)
    {
        case LaunchPhase::Unparsed:
            return "unparsed";
        case LaunchPhase::Sanitized:
            return "sanitized";
        case LaunchPhase::Bootstrapped:
            return "bootstrapped";
        case LaunchPhase::Registered:
            return "registered";
        case LaunchPhase::Resolved:
            return "resolved";
        case LaunchPhase::Dispatched:
            return "dispatched";
    }
    return "";
}

} // namespace novella::cli
