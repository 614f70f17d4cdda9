//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the places where a parse ends the process.  Usage errors are
// never recovered: the parser reports them as diagnostics and this file is
// the only code that turns them into an exit.
//
//===----------------------------------------------------------------------===//

#include "cli/UsageExit.hpp"
#include "cli/UsageFormatter.hpp"
#include "novella/version.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

namespace novella::cli
{

void printUsageError(std::ostream &os,
                     const Grammar &grammar,
                     std::string_view prog,
                     const support::Diag &diag)
{
    os << formatUsage(grammar, prog);
    support::printDiag(diag, os, prog);
}

void exitWithUsageError(const Grammar &grammar, std::string_view prog, const support::Diag &diag)
{
    std::cout.flush();
    printUsageError(std::cerr, grammar, prog, diag);
    std::cerr.flush();
    std::exit(kUsageErrorExitCode);
}

ParseResult parseOrExit(const Grammar &grammar,
                        const std::vector<std::string> &tokens,
                        const SessionMarkers &markers,
                        std::string_view prog)
{
    auto parsed = parseArguments(grammar, tokens, markers);
    if (!parsed)
    {
        exitWithUsageError(grammar, prog, parsed.error());
    }

    switch (parsed.value().action)
    {
        case ParseAction::ShowHelp:
            std::cout << formatHelp(grammar, prog);
            std::cout.flush();
            std::exit(0);
        case ParseAction::ShowVersion:
            std::cout << versionString() << '\n';
            std::cout.flush();
            std::exit(0);
        case ParseAction::Proceed:
            break;
    }
    return std::move(parsed.value());
}

} // namespace novella::cli
