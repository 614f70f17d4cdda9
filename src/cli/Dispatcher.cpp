//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements command dispatch.  The registry arrives through the constructor,
// so a dispatcher can only exist once the caller has a populated registry in
// hand; dispatching against an unsealed registry is a programming error.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Final command resolution and handler invocation.

#include "cli/Dispatcher.hpp"
#include "cli/CommandContext.hpp"
#include "cli/Grammar.hpp"
#include "cli/UsageExit.hpp"
#include "cli/UsageFormatter.hpp"

#include <cassert>

namespace novella::cli
{

Dispatcher::Dispatcher(const CommandRegistry &registry,
                       const ArgVector &argv,
                       LaunchContext &launch,
                       EngineServices &services,
                       support::Environment &environment)
    : registry_(registry), argv_(argv), launch_(launch), services_(services),
      environment_(environment)
{
}

std::string Dispatcher::resolveCommand(const ParsedArgs &provisional)
{
    if (provisional.command == "run" && provisional.lint)
        return "lint";
    return provisional.command;
}

void applyHeadlessDrivers(support::Environment &environment)
{
    const std::string headless(kHeadlessDriver);
    environment.setDefault(std::string(kAudioDriverVariable), headless);
    environment.setDefault(std::string(kVideoDriverVariable), headless);
}

/// @brief Report an unknown command through the strict usage error path.
void Dispatcher::failUnknownCommand(const std::string &command) const
{
    CommandScope scope;
    scope.command = command;
    const Grammar grammar = buildStrictGrammar(scope, registry_.names());
    exitWithUsageError(grammar,
                       programLabel(argv_.programName()),
                       support::makeError("Command " + command + " is unknown."));
}

/// @brief Dispatch the resolved command.
///
/// @details Step-by-step summary:
///          1. Resolve the effective command from the provisional arguments.
///          2. Exit with a usage error when the registry lacks it.
///          3. Select headless drivers for commands without a display.
///          4. Invoke the handler and return its decision.
ResolvedCommand Dispatcher::resolve() const
{
    assert(registry_.sealed() && "dispatch requested before command registration completed");

    ResolvedCommand resolved;
    resolved.name = resolveCommand(launch_.args);
    resolved.entry = registry_.lookup(resolved.name);
    if (resolved.entry == nullptr)
    {
        failUnknownCommand(resolved.name);
    }
    return resolved;
}

bool Dispatcher::invoke(const ResolvedCommand &command)
{
    assert(command.entry != nullptr && "invoke requires a resolved command");
    launch_.notes.note("dispatching command '" + command.name + "'");

    if (!command.entry->needsDisplay)
    {
        applyHeadlessDrivers(environment_);
    }

    CommandContext context(argv_, registry_, launch_, services_, command.name);
    return command.entry->handler(context);
}

bool Dispatcher::dispatch()
{
    return invoke(resolve());
}

} // namespace novella::cli
