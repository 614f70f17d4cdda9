//===----------------------------------------------------------------------===//
//
// Part of the Novella project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Declares the launcher's global flags.  Both builders share one routine that
// lays down the positionals and global options, so the lenient bootstrap
// grammar and every strict command grammar accept the same global spellings.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Builders for the lenient and strict launcher grammars.

#include "cli/Grammar.hpp"

#include <utility>

namespace novella::cli
{
namespace
{

constexpr std::string_view kProgramDescription = "The Novella visual novel engine.";

constexpr std::string_view kBasedirHelp =
    "The base directory containing the project to run. This defaults to the directory "
    "containing the Novella executable.";

std::string joinNames(const std::vector<std::string> &names)
{
    std::string joined;
    for (const auto &name : names)
    {
        if (!joined.empty())
            joined += ", ";
        joined += name;
    }
    return joined;
}

OptionSpec flag(std::string name, std::string dest, std::string help)
{
    OptionSpec spec;
    spec.names = {std::move(name)};
    spec.dest = std::move(dest);
    spec.kind = OptionKind::Flag;
    spec.help = std::move(help);
    return spec;
}

OptionSpec value(std::string name, std::string dest, std::string metavar, std::string help)
{
    OptionSpec spec;
    spec.names = {std::move(name)};
    spec.dest = std::move(dest);
    spec.kind = OptionKind::Value;
    spec.metavar = std::move(metavar);
    spec.help = std::move(help);
    return spec;
}

/// @brief Positionals shared by every grammar.
std::vector<PositionalSpec> basePositionals(bool requireCommand,
                                            const std::vector<std::string> &commandNames)
{
    std::string commandHelp = "The command to execute. Available commands are: " +
                              joinNames(commandNames) + ". Defaults to 'run'.";

    PositionalSpec basedir{"basedir", std::string(kBasedirHelp), true, std::nullopt};
    PositionalSpec command{"command", std::move(commandHelp), true, std::nullopt};
    if (!requireCommand)
    {
        basedir.required = false;
        basedir.defaultValue = "";
        command.required = false;
        command.defaultValue = "run";
    }
    return {std::move(basedir), std::move(command)};
}

/// @brief Global options, declared in the same order for both modes.
/// @param groups Receives the "JSON dump arguments" group.
std::vector<OptionSpec> globalOptions(std::vector<OptionGroup> &groups)
{
    std::vector<OptionSpec> options;

    options.push_back(value("--savedir",
                            "savedir",
                            "DIRECTORY",
                            "The directory where saves and persistent data are placed."));

    OptionSpec trace = value("--trace",
                             "trace",
                             "LEVEL",
                             "The level of trace Novella will log to trace.txt. "
                             "(1=per-call, 2=per-line)");
    trace.kind = OptionKind::IntValue;
    options.push_back(std::move(trace));

    OptionSpec version = flag("--version", "version", "Displays the version of Novella in use.");
    version.kind = OptionKind::Version;
    options.push_back(std::move(version));

    options.push_back(flag("--compile",
                           "compile",
                           "Forces all .rpy scripts to be recompiled before proceeding."));
    options.push_back(flag("--compile-python",
                           "compile_python",
                           "Forces all Python to be recompiled, rather than read from "
                           "game/cache/bytecode-*.rpyb."));
    options.push_back(flag("--keep-orphan-rpyc",
                           "keep_orphan_rpyc",
                           "Prevents the compile command from deleting orphan rpyc files."));

    OptionSpec lint = flag("--lint", "lint", "");
    lint.hidden = true;
    options.push_back(std::move(lint));

    options.push_back(
        flag("--errors-in-editor", "errors_in_editor", "Causes errors to open in a text editor."));
    options.push_back(flag("--safe-mode",
                           "safe_mode",
                           "Forces Novella to start in safe mode, allowing the player to "
                           "configure graphics."));
    options.push_back(value("--warp",
                            "warp",
                            "WARP",
                            "This takes as an argument a filename:linenumber pair, and tries to "
                            "warp to the statement before that line number. It is only valid in "
                            "conjunction with the run command."));

    groups.push_back({"JSON dump arguments",
                      "Novella can dump information about the game to a JSON file. These "
                      "options let you select the file, and choose what is dumped."});
    const std::size_t dumpGroup = groups.size() - 1;

    OptionSpec dump = value("--json-dump", "json_dump", "FILE", "The name of the JSON file.");
    dump.group = dumpGroup;
    options.push_back(std::move(dump));

    OptionSpec dumpPrivate = flag(
        "--json-dump-private", "json_dump_private", "Include private names. (Names beginning with _.)");
    dumpPrivate.group = dumpGroup;
    options.push_back(std::move(dumpPrivate));

    OptionSpec dumpCommon = flag("--json-dump-common",
                                 "json_dump_common",
                                 "Include names defined in the common directory.");
    dumpCommon.group = dumpGroup;
    options.push_back(std::move(dumpCommon));

    return options;
}

} // namespace

Grammar::Grammar(GrammarMode mode,
                 std::string description,
                 std::vector<PositionalSpec> positionals,
                 std::vector<OptionSpec> options,
                 std::vector<OptionGroup> groups)
    : mode_(mode), description_(std::move(description)), positionals_(std::move(positionals)),
      options_(std::move(options)), groups_(std::move(groups))
{
}

const OptionSpec *Grammar::findOption(std::string_view name) const
{
    for (const auto &option : options_)
    {
        for (const auto &spelling : option.names)
        {
            if (spelling == name)
            {
                return &option;
            }
        }
    }
    return nullptr;
}

std::vector<std::string> Grammar::longSpellingsStartingWith(std::string_view prefix) const
{
    std::vector<std::string> matches;
    if (!prefix.starts_with("--"))
        return matches;
    for (const auto &option : options_)
    {
        for (const auto &spelling : option.names)
        {
            if (spelling.starts_with("--") && std::string_view(spelling).starts_with(prefix))
                matches.push_back(spelling);
        }
    }
    return matches;
}

Grammar buildLenientGrammar(const std::vector<std::string> &commandNames)
{
    std::vector<OptionGroup> groups;
    std::vector<OptionSpec> options = globalOptions(groups);
    return Grammar(GrammarMode::Lenient,
                   std::string(kProgramDescription),
                   basePositionals(false, commandNames),
                   std::move(options),
                   std::move(groups));
}

/// @brief Build a strict grammar for @p scope.
///
/// @details Step-by-step summary:
///          1. Lay down basedir/command, required unless the scope opts out.
///          2. Declare the global options followed by -h/--help.
///          3. Open a "<command> command arguments" group and move the scope's
///             options into it; append the scope's positionals.
Grammar buildStrictGrammar(const CommandScope &scope, const std::vector<std::string> &commandNames)
{
    std::vector<OptionGroup> groups;
    std::vector<PositionalSpec> positionals = basePositionals(scope.requireCommand, commandNames);

    std::vector<OptionSpec> options = globalOptions(groups);
    OptionSpec help;
    help.names = {"-h", "--help"};
    help.dest = "help";
    help.kind = OptionKind::Help;
    help.help = "Displays this help message, then exits.";
    options.push_back(std::move(help));

    groups.push_back({scope.command + " command arguments", scope.description});
    const std::size_t commandGroup = groups.size() - 1;
    for (OptionSpec option : scope.options)
    {
        option.group = commandGroup;
        options.push_back(std::move(option));
    }
    for (const auto &positional : scope.positionals)
    {
        positionals.push_back(positional);
    }

    return Grammar(GrammarMode::Strict,
                   std::string(kProgramDescription),
                   std::move(positionals),
                   std::move(options),
                   std::move(groups));
}

} // namespace novella::cli
