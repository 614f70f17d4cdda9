//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the built-in commands.  Each handler performs the strict parse
// for its own flags before touching the engine, so stray arguments are
// rejected before any side effect happens.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Handlers for run, lint, compile, rmpersistent and quit.

#include "cli/BuiltinCommands.hpp"

#include <string>
#include <utility>

namespace novella::cli
{
namespace
{

OptionSpec commandFlag(std::string name, std::string dest, std::string help)
{
    OptionSpec spec;
    spec.names = {std::move(name)};
    spec.dest = std::move(dest);
    spec.kind = OptionKind::Flag;
    spec.help = std::move(help);
    return spec;
}

} // namespace

bool cmdRun(CommandContext &ctx)
{
    CommandScope scope;
    scope.description = "Runs the current project normally.";
    scope.requireCommand = false;
    scope.options.push_back(commandFlag(
        "--profile-display",
        "profile_display",
        "If present, Novella will report the amount of time it takes to draw the screen."));
    scope.options.push_back(commandFlag(
        "--debug-image-cache",
        "debug_image_cache",
        "If present, Novella will log information regarding the contents of the image cache."));

    const ParsedArgs &args = ctx.parse(std::move(scope));

    if (args.warp && !ctx.markers().warped)
    {
        ctx.markers().warped = true;
        ctx.services().setWarpSpec(*args.warp);
        ctx.note("warp target set to " + *args.warp);
    }

    if (args.flag("profile_display"))
        ctx.services().setProfileDisplay(true);

    if (args.flag("debug_image_cache"))
        ctx.services().setDebugImageCache(true);

    return true;
}

bool cmdLint(CommandContext &ctx)
{
    CommandScope scope;
    scope.description = "Checks the script for errors and prints script statistics.";
    scope.requireCommand = false;
    scope.options.push_back(commandFlag(
        "--error-code",
        "error_code",
        "If given, the exit status will be 1 when lint reports a problem."));
    scope.positionals.push_back(
        PositionalSpec{"filename", "The file to write the report to.", false, std::nullopt});

    const ParsedArgs &args = ctx.parse(std::move(scope));

    LintRequest request;
    request.basedir = args.basedir;
    request.reportPath = args.text("filename");

    const std::size_t problems = ctx.services().runLint(request);
    ctx.note("lint reported " + std::to_string(problems) + " problem(s)");
    if (problems != 0 && args.flag("error_code"))
        ctx.setExitStatus(1);

    return false;
}

bool cmdCompile(CommandContext &ctx)
{
    ctx.takesNoArguments("Recompiles the game script.");
    return false;
}

bool cmdRmPersistent(CommandContext &ctx)
{
    ctx.takesNoArguments("Deletes the persistent data.");

    if (!ctx.services().unlinkPersistent(ctx.args()))
        ctx.setExitStatus(1);
    ctx.services().setShouldSavePersistent(false);

    return false;
}

bool cmdQuit(CommandContext &ctx)
{
    ctx.takesNoArguments("Quits without doing anything.");
    return false;
}

void registerBuiltinCommands(CommandRegistry &registry)
{
    registry.registerCommand("run", cmdRun, true);
    registry.registerCommand("lint", cmdLint);
    registry.registerCommand("compile", cmdCompile);
    registry.registerCommand("rmpersistent", cmdRmPersistent);
    registry.registerCommand("quit", cmdQuit);
}

} // namespace novella::cli
