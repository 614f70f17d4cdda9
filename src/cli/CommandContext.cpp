//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the handler-facing side of the dispatch pass.  The strict parse
// run here is the second and final parse of the command line; it sees the
// sanitized vector and the full command list.
//
//===----------------------------------------------------------------------===//

#include "cli/CommandContext.hpp"
#include "cli/Bootstrap.hpp"
#include "cli/UsageExit.hpp"
#include "cli/UsageFormatter.hpp"

#include <utility>

namespace novella::cli
{

CommandContext::CommandContext(const ArgVector &argv,
                               const CommandRegistry &registry,
                               LaunchContext &launch,
                               EngineServices &services,
                               std::string command)
    : argv_(argv), registry_(registry), launch_(launch), services_(services),
      command_(std::move(command)), prog_(programLabel(argv.programName()))
{
}

Grammar CommandContext::grammarFor(CommandScope scope) const
{
    if (scope.command.empty())
        scope.command = command_;
    return buildStrictGrammar(scope, registry_.names());
}

/// @brief Run the strict pass for the current command.
///
/// @details The provisional arguments from bootstrap are discarded; fields the
///          bootstrap forced (the lint flag for the lint command) are applied
///          again to the fresh result.
const ParsedArgs &CommandContext::parse(CommandScope scope)
{
    const Grammar grammar = grammarFor(std::move(scope));
    ParseResult result = parseOrExit(grammar, argv_.tail(), launch_.markers, prog_);
    applyBootstrapOverrides(result.args);
    launch_.args = std::move(result.args);
    return launch_.args;
}

void CommandContext::takesNoArguments(std::string description)
{
    CommandScope scope;
    scope.command = command_;
    scope.description = std::move(description);
    parse(std::move(scope));
}

void CommandContext::note(std::string message)
{
    launch_.notes.note(std::move(message));
}

} // namespace novella::cli
