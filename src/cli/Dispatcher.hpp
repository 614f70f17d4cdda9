//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/Dispatcher.hpp
// Purpose: Resolves the effective command and invokes its handler.
// Key invariants: Runs once, after registration is sealed; an unknown command
//                 exits with a usage error and no handler runs.
// Ownership/Lifetime: Borrows every collaborator; holds no state of its own
//                     beyond the references.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/ArgVector.hpp"
#include "cli/CommandRegistry.hpp"
#include "cli/EngineServices.hpp"
#include "cli/LaunchContext.hpp"
#include "cli/ParsedArgs.hpp"
#include "support/environment.hpp"

#include <string>
#include <string_view>

namespace novella::cli
{

/// @brief Audio driver variable overridden for headless commands.
inline constexpr std::string_view kAudioDriverVariable = "SDL_AUDIODRIVER";

/// @brief Video driver variable overridden for headless commands.
inline constexpr std::string_view kVideoDriverVariable = "SDL_VIDEODRIVER";

/// @brief Driver name selecting the dummy backends.
inline constexpr std::string_view kHeadlessDriver = "dummy";

/// @brief Registry entry selected for the effective command.
struct ResolvedCommand
{
    std::string name;
    const CommandEntry *entry = nullptr;
};

/// @brief Second phase of argument handling.
class Dispatcher
{
  public:
    Dispatcher(const CommandRegistry &registry,
               const ArgVector &argv,
               LaunchContext &launch,
               EngineServices &services,
               support::Environment &environment);

    /// @brief Apply the redirect rule to the provisional command.
    /// @details `run` combined with the lint flag becomes `lint`; every other
    ///          command is returned unchanged.
    [[nodiscard]] static std::string resolveCommand(const ParsedArgs &provisional);

    /// @brief Find the registry entry for the effective command.
    /// @details An unknown command exits through the usage error path, so
    ///          the returned entry is never null.
    [[nodiscard]] ResolvedCommand resolve() const;

    /// @brief Prepare the environment and invoke the handler of @p command.
    /// @return The handler's continue (true) / stop (false) decision.
    bool invoke(const ResolvedCommand &command);

    /// @brief @ref resolve followed by @ref invoke.
    bool dispatch();

  private:
    [[noreturn]] void failUnknownCommand(const std::string &command) const;

    const CommandRegistry &registry_;
    const ArgVector &argv_;
    LaunchContext &launch_;
    EngineServices &services_;
    support::Environment &environment_;
};

/// @brief Select headless drivers unless the operator already chose some.
void applyHeadlessDrivers(support::Environment &environment);

} // namespace novella::cli
