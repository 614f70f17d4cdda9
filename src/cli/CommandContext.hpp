//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: cli/CommandContext.hpp
// Purpose: What a command handler sees while it runs.
// Key invariants: A strict parse replaces the provisional arguments rather than
//                 merging into them; forced bootstrap flags are re-applied.
// Ownership/Lifetime: Borrows the argument vector, registry, launch context and
//                     engine services from the dispatcher for one invocation.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "cli/ArgVector.hpp"
#include "cli/CommandRegistry.hpp"
#include "cli/EngineServices.hpp"
#include "cli/Grammar.hpp"
#include "cli/LaunchContext.hpp"
#include "cli/ParsedArgs.hpp"

#include <string>
#include <string_view>

namespace novella::cli
{

/// @brief Handle passed to every command handler.
/// @details Handlers re-parse the command line strictly through @ref parse
///          (when they declare their own flags) or @ref takesNoArguments
///          (when they accept none).  Either path terminates the process on a
///          usage error, so a handler only continues with valid arguments.
class CommandContext
{
  public:
    CommandContext(const ArgVector &argv,
                   const CommandRegistry &registry,
                   LaunchContext &launch,
                   EngineServices &services,
                   std::string command);

    /// @brief Effective command name being dispatched.
    [[nodiscard]] const std::string &command() const
    {
        return command_;
    }

    /// @brief Current arguments: provisional until @ref parse runs.
    [[nodiscard]] const ParsedArgs &args() const
    {
        return launch_.args;
    }

    /// @brief Build the strict grammar for @p scope; an empty scope command
    ///        defaults to the dispatched command.
    [[nodiscard]] Grammar grammarFor(CommandScope scope) const;

    /// @brief Strictly parse the command line against @p scope.
    /// @details Exits on usage errors, help, and version.  On success the
    ///          result replaces the launch context's arguments.
    const ParsedArgs &parse(CommandScope scope);

    /// @brief Strictly parse with no command-specific declarations.
    /// @param description Text shown under the command's help group.
    void takesNoArguments(std::string description);

    [[nodiscard]] SessionMarkers &markers()
    {
        return launch_.markers;
    }

    [[nodiscard]] EngineServices &services()
    {
        return services_;
    }

    /// @brief Record a note for `--trace` output.
    void note(std::string message);

    /// @brief Request the process exit status used when the command stops.
    void setExitStatus(int status)
    {
        launch_.exitStatus = status;
    }

    [[nodiscard]] std::string_view programName() const
    {
        return prog_;
    }

  private:
    const ArgVector &argv_;
    const CommandRegistry &registry_;
    LaunchContext &launch_;
    EngineServices &services_;
    std::string command_;
    std::string prog_;
};

} // namespace novella::cli
