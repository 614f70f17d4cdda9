//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the console engine services used by the `novella` binary.  The
// full script pipeline lives elsewhere; these services cover what the
// launcher's built-in commands need on their own: recording startup switches,
// a structural project check for lint, and persistent data removal.
//
//===----------------------------------------------------------------------===//

#include "console_services.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace novella::tools
{
namespace
{

namespace fs = std::filesystem;

using support::makeError;
using support::makeNote;
using support::printDiag;

bool hasScript(const fs::path &dir)
{
    std::error_code ec;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        if (it->path().extension() == ".rpy")
            return true;
    }
    return false;
}

} // namespace

ConsoleEngineServices::ConsoleEngineServices(std::ostream &out,
                                             std::ostream &err,
                                             fs::path projectDefault)
    : out_(out), err_(err), projectDefault_(std::move(projectDefault))
{
}

void ConsoleEngineServices::setWarpSpec(const std::string &spec)
{
    settings_.warpSpec = spec;
}

void ConsoleEngineServices::setProfileDisplay(bool enabled)
{
    settings_.profileDisplay = enabled;
}

void ConsoleEngineServices::setDebugImageCache(bool enabled)
{
    settings_.debugImageCache = enabled;
}

std::size_t ConsoleEngineServices::runLint(const cli::LintRequest &request)
{
    std::error_code ec;
    const fs::path root = projectDirectory(request.basedir, projectDefault_);
    const fs::path game = root / "game";

    support::DiagnosticEngine problems;
    if (!fs::is_directory(root, ec))
    {
        problems.report(makeError("project directory not found: " + root.string()));
    }
    else if (!fs::is_directory(game, ec))
    {
        problems.report(makeError("game directory not found: " + game.string()));
    }
    else if (!hasScript(game))
    {
        problems.report(makeError("no .rpy scripts under " + game.string()));
    }

    std::ofstream file;
    std::ostream *report = &out_;
    if (request.reportPath)
    {
        file.open(*request.reportPath);
        if (file)
        {
            report = &file;
        }
        else
        {
            support::Diag failure = makeError("cannot write lint report: " + *request.reportPath);
            printDiag(failure, err_, "lint");
            problems.report(std::move(failure));
        }
    }

    *report << "Novella lint report for " << root.string() << "\n\n";
    problems.printAll(*report);
    if (problems.errorCount() == 0)
        printDiag(makeNote("lint is successful"), *report);
    return problems.errorCount();
}

/// @brief Resolve the directory of the running program from argv[0].
/// @details A bare program name found through PATH carries no directory and
///          resolves against the working directory.
fs::path executableDirectory(const std::string &programName)
{
    std::error_code ec;
    const fs::path program = fs::absolute(fs::path(programName), ec);
    const fs::path directory =
        ec ? fs::path(programName).parent_path() : program.lexically_normal().parent_path();
    return directory.empty() ? fs::path(".") : directory;
}

fs::path projectDirectory(const std::string &basedir, const fs::path &projectDefault)
{
    return basedir.empty() ? projectDefault : fs::path(basedir);
}

fs::path saveDirectory(const cli::ParsedArgs &args, const fs::path &projectDefault)
{
    if (args.savedir)
        return fs::path(*args.savedir);
    return projectDirectory(args.basedir, projectDefault) / "game" / "saves";
}

bool ConsoleEngineServices::unlinkPersistent(const cli::ParsedArgs &args)
{
    const fs::path target = saveDirectory(args, projectDefault_) / "persistent";
    std::error_code ec;
    fs::remove(target, ec);
    if (ec)
    {
        printDiag(makeError("cannot delete " + target.string() + ": " + ec.message()),
                  err_,
                  "rmpersistent");
        return false;
    }
    return true;
}

void ConsoleEngineServices::setShouldSavePersistent(bool enabled)
{
    settings_.savePersistent = enabled;
}

} // namespace novella::tools
