//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the `novella` launcher.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `novella` CLI tool.
/// @details Runs the two-phase argument protocol with the built-in commands
///          and console engine services, then reports the startup
///          configuration the engine would boot with.

#include "cli/BuiltinCommands.hpp"
#include "cli/Launcher.hpp"
#include "console_services.hpp"
#include "support/environment.hpp"
#include "support/session_store.hpp"

#include <filesystem>
#include <iostream>
#include <utility>

namespace
{

const char *yesNo(bool value)
{
    return value ? "yes" : "no";
}

/// @brief Print the configuration handed to engine startup.
void printStartup(const novella::cli::ParsedArgs &args,
                  const novella::tools::StartupSettings &settings,
                  const std::filesystem::path &projectDefault)
{
    using novella::tools::projectDirectory;
    using novella::tools::saveDirectory;

    std::cout << "novella: starting project '"
              << projectDirectory(args.basedir, projectDefault).string() << "'\n"
              << "  save directory:   " << saveDirectory(args, projectDefault).string() << "\n"
              << "  compile scripts:  " << yesNo(args.compile) << "\n"
              << "  compile python:   " << yesNo(args.compilePython) << "\n"
              << "  safe mode:        " << yesNo(args.safeMode) << "\n"
              << "  errors in editor: " << yesNo(args.errorsInEditor) << "\n"
              << "  profile display:  " << yesNo(settings.profileDisplay) << "\n"
              << "  image cache log:  " << yesNo(settings.debugImageCache) << "\n";
    if (settings.warpSpec)
        std::cout << "  warp target:      " << *settings.warpSpec << "\n";
    if (args.jsonDump)
    {
        std::cout << "  json dump:        " << *args.jsonDump
                  << " (private: " << yesNo(args.jsonDumpPrivate)
                  << ", common: " << yesNo(args.jsonDumpCommon) << ")\n";
    }
}

} // namespace

/// @brief Program entry for the `novella` launcher.
///
/// @details Step-by-step summary:
///          1. Bootstrap: sanitize argv and parse leniently.
///          2. Register the built-in commands and seal the registry.
///          3. Dispatch; usage errors, help and version exit inside this step.
///          4. Print launch notes when tracing, then either stop with the
///             command's status or report the startup configuration.
int main(int argc, char **argv)
{
    using namespace novella;

    cli::ArgVector arguments = cli::ArgVector::fromMain(argc, argv);
    const std::filesystem::path projectDefault =
        tools::executableDirectory(arguments.programName());

    support::SessionStore session;
    support::ProcessEnvironment environment;
    tools::ConsoleEngineServices services(std::cout, std::cerr, projectDefault);

    cli::Launcher launcher(std::move(arguments), session, services, environment);
    launcher.bootstrap();

    cli::registerBuiltinCommands(launcher.registry());
    launcher.finishRegistration();

    const cli::LaunchOutcome outcome = launcher.dispatch();

    const cli::LaunchContext &context = launcher.context();
    if (context.args.trace > 0)
    {
        context.notes.printAll(std::cerr);
        std::cerr << "note: launch phase " << cli::phaseName(launcher.phase()) << "\n";
    }

    if (outcome == cli::LaunchOutcome::Stop)
    {
        return launcher.exitStatus();
    }

    printStartup(context.args, services.settings(), projectDefault);
    return 0;
}
