// File: tests/cli/ArgumentParserTests.cpp
// Purpose: Exercise the generic parser against lenient and strict grammars.
// Key invariants: Lenient parsing defers unknown tokens in input order; strict parsing
//                 rejects them; unique long-option prefixes expand; compile overrides
//                 apply reload, command, then marker.
// Ownership/Lifetime: Standalone unit test executable.

#include "cli/ArgumentParser.hpp"
#include "cli/Grammar.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

using namespace novella::cli;

namespace
{

using Tokens = std::vector<std::string>;

ParseResult parseLenient(const Tokens &tokens, const SessionMarkers &markers = {})
{
    auto parsed = parseArguments(buildLenientGrammar(), tokens, markers);
    EXPECT_TRUE(parsed.hasValue()) << (parsed ? "" : parsed.error().message);
    return parsed ? parsed.value() : ParseResult{};
}

std::string lenientError(const Tokens &tokens)
{
    auto parsed = parseArguments(buildLenientGrammar(), tokens, SessionMarkers{});
    EXPECT_FALSE(parsed.hasValue());
    return parsed ? std::string() : parsed.error().message;
}

Grammar runGrammar()
{
    CommandScope scope;
    scope.command = "run";
    scope.requireCommand = false;
    OptionSpec profile;
    profile.names = {"--profile-display"};
    profile.dest = "profile_display";
    scope.options.push_back(profile);
    return buildStrictGrammar(scope, {"quit", "run"});
}

Grammar quitGrammar()
{
    CommandScope scope;
    scope.command = "quit";
    return buildStrictGrammar(scope, {"quit", "run"});
}

} // namespace

TEST(ArgumentParser, EmptyInputUsesDefaults)
{
    const ParseResult result = parseLenient({});
    EXPECT_EQ(result.action, ParseAction::Proceed);
    EXPECT_EQ(result.args.basedir, "");
    EXPECT_EQ(result.args.command, "run");
    EXPECT_EQ(result.args.trace, 0);
    EXPECT_FALSE(result.args.compile);
    EXPECT_FALSE(result.args.savedir.has_value());
    EXPECT_TRUE(result.unrecognized.empty());
}

TEST(ArgumentParser, GlobalsAndPositionals)
{
    const ParseResult result = parseLenient({"--trace", "2", "--safe-mode", "myproject", "run"});
    EXPECT_EQ(result.args.trace, 2);
    EXPECT_TRUE(result.args.safeMode);
    EXPECT_EQ(result.args.basedir, "myproject");
    EXPECT_EQ(result.args.command, "run");
    EXPECT_TRUE(result.unrecognized.empty());
}

TEST(ArgumentParser, InlineValuesAndJsonDump)
{
    const ParseResult result = parseLenient(
        {"--savedir=/tmp/saves", "--json-dump", "out.json", "--json-dump-private", "proj"});
    EXPECT_EQ(result.args.savedir, std::optional<std::string>("/tmp/saves"));
    EXPECT_EQ(result.args.jsonDump, std::optional<std::string>("out.json"));
    EXPECT_TRUE(result.args.jsonDumpPrivate);
    EXPECT_FALSE(result.args.jsonDumpCommon);
    EXPECT_EQ(result.args.basedir, "proj");
    EXPECT_EQ(result.args.command, "run");
}

TEST(ArgumentParser, NegativeNumberIsAValue)
{
    const ParseResult result = parseLenient({"--trace", "-1"});
    EXPECT_EQ(result.args.trace, -1);
}

TEST(ArgumentParser, DoubleDashEndsOptions)
{
    const ParseResult result = parseLenient({"--", "-odd-dir", "quit"});
    EXPECT_EQ(result.args.basedir, "-odd-dir");
    EXPECT_EQ(result.args.command, "quit");
}

TEST(ArgumentParser, LenientDefersUnknownTokensInOrder)
{
    const ParseResult result =
        parseLenient({"--profile-display", "proj", "run", "extra", "--error-code"});
    EXPECT_EQ(result.args.basedir, "proj");
    EXPECT_EQ(result.args.command, "run");
    EXPECT_EQ(result.unrecognized, (Tokens{"--profile-display", "extra", "--error-code"}));
}

TEST(ArgumentParser, LenientTreatsHelpAsUnknown)
{
    const ParseResult result = parseLenient({"proj", "--help"});
    EXPECT_EQ(result.action, ParseAction::Proceed);
    EXPECT_EQ(result.unrecognized, (Tokens{"--help"}));
}

TEST(ArgumentParser, VersionRequest)
{
    const ParseResult result = parseLenient({"proj", "--version"});
    EXPECT_EQ(result.action, ParseAction::ShowVersion);
}

TEST(ArgumentParser, UniquePrefixSelectsLongOption)
{
    const ParseResult result = parseLenient({"--safe", "--tr=3", "--keep", "proj"});
    EXPECT_TRUE(result.args.safeMode);
    EXPECT_EQ(result.args.trace, 3);
    EXPECT_TRUE(result.args.keepOrphanRpyc);
    EXPECT_TRUE(result.unrecognized.empty());

    EXPECT_TRUE(parseLenient({"--compile", "proj"}).args.compile);
    EXPECT_FALSE(parseLenient({"--compile", "proj"}).args.compilePython);

    auto strict = parseArguments(runGrammar(), {"proj", "--profile"}, SessionMarkers{});
    ASSERT_TRUE(strict.hasValue()) << strict.error().message;
    EXPECT_TRUE(strict.value().args.flag("profile_display"));
}

TEST(ArgumentParser, AmbiguousPrefixIsAnError)
{
    EXPECT_EQ(lenientError({"--sa", "proj"}),
              "ambiguous option: --sa could match --savedir, --safe-mode");
    EXPECT_EQ(lenientError({"--json-dump-p=x"}),
              "argument --json-dump-private: ignored explicit argument 'x'");
    EXPECT_EQ(lenientError({"--json-d", "out.json"}),
              "ambiguous option: --json-d could match --json-dump, --json-dump-private, "
              "--json-dump-common");
}

TEST(ArgumentParser, CompileCommandsForceCompile)
{
    for (const char *command : {"compile", "add_from", "merge_strings"})
    {
        const ParseResult result = parseLenient({"proj", command});
        EXPECT_TRUE(result.args.compile) << command;
    }
    EXPECT_FALSE(parseLenient({"proj", "quit"}).args.compile);
    EXPECT_TRUE(parseLenient({"--compile", "proj", "quit"}).args.compile);
}

TEST(ArgumentParser, ReloadClearsCompileFlag)
{
    SessionMarkers markers;
    markers.reload = true;
    EXPECT_FALSE(parseLenient({"--compile", "proj", "run"}, markers).args.compile);
}

TEST(ArgumentParser, CompileCommandWinsOverReload)
{
    SessionMarkers markers;
    markers.reload = true;
    EXPECT_TRUE(parseLenient({"proj", "compile"}, markers).args.compile);
}

TEST(ArgumentParser, CompileMarkerWinsOverReload)
{
    SessionMarkers markers;
    markers.reload = true;
    markers.compileRequested = true;
    EXPECT_TRUE(parseLenient({"proj", "run"}, markers).args.compile);
}

TEST(ArgumentParser, ApplyCompileOverridesDirectly)
{
    ParsedArgs args;
    args.compile = true;
    applyCompileOverrides(args, SessionMarkers{true, false, false});
    EXPECT_FALSE(args.compile);

    EXPECT_TRUE(isCompileCommand("merge_strings"));
    EXPECT_FALSE(isCompileCommand("run"));
}

TEST(ArgumentParser, MalformedKnownOptionsAreErrors)
{
    EXPECT_EQ(lenientError({"--trace", "abc"}), "argument --trace: invalid int value: 'abc'");
    EXPECT_EQ(lenientError({"--trace=2x"}), "argument --trace: invalid int value: '2x'");
    EXPECT_EQ(lenientError({"proj", "--savedir"}), "argument --savedir: expected one argument");
    EXPECT_EQ(lenientError({"--warp", "--safe-mode"}), "argument --warp: expected one argument");
    EXPECT_EQ(lenientError({"--compile=yes"}), "argument --compile: ignored explicit argument 'yes'");
}

TEST(ArgumentParser, StrictAcceptsCommandOptions)
{
    auto parsed = parseArguments(runGrammar(), {"proj", "--profile-display"}, SessionMarkers{});
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_TRUE(parsed.value().args.flag("profile_display"));
    EXPECT_FALSE(parsed.value().args.flag("debug_image_cache"));
    EXPECT_EQ(parsed.value().args.command, "run");
}

TEST(ArgumentParser, StrictRejectsUnknownTokens)
{
    auto parsed =
        parseArguments(quitGrammar(), {"proj", "quit", "--bogus", "stray"}, SessionMarkers{});
    ASSERT_FALSE(parsed.hasValue());
    EXPECT_EQ(parsed.error().message, "unrecognized arguments: --bogus stray");
}

TEST(ArgumentParser, StrictRequiresCommandPositional)
{
    auto parsed = parseArguments(quitGrammar(), {"proj"}, SessionMarkers{});
    ASSERT_FALSE(parsed.hasValue());
    EXPECT_EQ(parsed.error().message, "the following arguments are required: command");

    auto none = parseArguments(quitGrammar(), {}, SessionMarkers{});
    ASSERT_FALSE(none.hasValue());
    EXPECT_EQ(none.error().message, "the following arguments are required: basedir, command");
}

TEST(ArgumentParser, StrictGlobalsAndRequiredPositionals)
{
    CommandScope scope;
    scope.command = "run";
    const Grammar grammar = buildStrictGrammar(scope, {"quit", "run"});
    ASSERT_TRUE(grammar.positionals().at(0).required);
    ASSERT_TRUE(grammar.positionals().at(1).required);

    auto parsed = parseArguments(
        grammar, {"--trace", "2", "--safe-mode", "myproject", "run"}, SessionMarkers{});
    ASSERT_TRUE(parsed.hasValue()) << parsed.error().message;
    const ParseResult &result = parsed.value();
    EXPECT_EQ(result.action, ParseAction::Proceed);
    EXPECT_EQ(result.args.trace, 2);
    EXPECT_TRUE(result.args.safeMode);
    EXPECT_EQ(result.args.basedir, "myproject");
    EXPECT_EQ(result.args.command, "run");
    EXPECT_TRUE(result.unrecognized.empty());
}

TEST(ArgumentParser, StrictHelpRequest)
{
    auto parsed = parseArguments(quitGrammar(), {"proj", "quit", "-h"}, SessionMarkers{});
    ASSERT_TRUE(parsed.hasValue());
    EXPECT_EQ(parsed.value().action, ParseAction::ShowHelp);
}

TEST(ParsedArgs, AssignRoutesDestinations)
{
    ParsedArgs args;
    args.assign("keep_orphan_rpyc", true);
    args.assign("warp", std::string("script.rpy:10"));
    args.assign("trace", std::int64_t{1});
    args.assign("error_code", true);
    args.assign("filename", std::string("report.txt"));

    EXPECT_TRUE(args.keepOrphanRpyc);
    EXPECT_EQ(args.warp, std::optional<std::string>("script.rpy:10"));
    EXPECT_EQ(args.trace, 1);
    EXPECT_TRUE(args.flag("error_code"));
    EXPECT_EQ(args.text("filename"), std::optional<std::string>("report.txt"));
    EXPECT_FALSE(args.flag("filename"));
    EXPECT_FALSE(args.text("missing").has_value());
}
