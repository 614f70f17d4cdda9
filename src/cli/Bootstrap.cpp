//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the bootstrap pass.  At this point the engine has not loaded any
// project code, so command-specific flags are unknown; the lenient grammar
// sets them aside and the strict pass judges them after registration.
//
//===----------------------------------------------------------------------===//

#include "cli/Bootstrap.hpp"
#include "cli/Grammar.hpp"
#include "cli/UsageExit.hpp"
#include "cli/UsageFormatter.hpp"

#include <utility>

namespace novella::cli
{

void applyBootstrapOverrides(ParsedArgs &args)
{
    if (args.command == "lint")
        args.lint = true;
}

BootstrapResult parseProvisional(const ArgVector &argv, const SessionMarkers &markers)
{
    const Grammar grammar = buildLenientGrammar();
    ParseResult parsed = parseOrExit(grammar, argv.tail(), markers, programLabel(argv.programName()));

    applyBootstrapOverrides(parsed.args);
    BootstrapResult result;
    result.args = std::move(parsed.args);
    result.unrecognized = std::move(parsed.unrecognized);
    return result;
}

BootstrapResult bootstrap(ArgVector &argv, const SessionMarkers &markers)
{
    const SanitizeAction sanitized = sanitizeLauncherArguments(argv);
    BootstrapResult result = parseProvisional(argv, markers);
    result.sanitized = sanitized;
    return result;
}

} // namespace novella::cli
