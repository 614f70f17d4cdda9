// File: tests/cli/LauncherSanitizerTests.cpp
// Purpose: Verify store-launcher and quarantine token handling before parsing.
// Key invariants: Marker matching is a case-insensitive prefix test that skips argv[0];
//                 the store launcher marker takes precedence over the quarantine marker.
// Ownership/Lifetime: Standalone unit test executable.

#include "cli/LauncherSanitizer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace novella::cli;

namespace
{

ArgVector makeArgs(std::vector<std::string> tokens)
{
    return ArgVector(std::move(tokens));
}

} // namespace

TEST(LauncherSanitizer, LeavesOrdinaryArgumentsAlone)
{
    ArgVector args = makeArgs({"novella", "--safe-mode", "proj", "run"});
    EXPECT_EQ(sanitizeLauncherArguments(args), SanitizeAction::None);
    EXPECT_EQ(args.size(), 4u);
    EXPECT_FALSE(args.launcherArguments().has_value());
}

TEST(LauncherSanitizer, PreservesStoreLauncherArguments)
{
    ArgVector args = makeArgs({"novella", "-AUTH_LOGIN=unused", "-EpicApp=Novella", "-epicenv=Prod"});
    EXPECT_EQ(sanitizeLauncherArguments(args), SanitizeAction::LauncherArgsPreserved);

    ASSERT_EQ(args.size(), 1u);
    EXPECT_EQ(args.programName(), "novella");
    ASSERT_TRUE(args.launcherArguments().has_value());
    const std::vector<std::string> expected{"-AUTH_LOGIN=unused", "-EpicApp=Novella", "-epicenv=Prod"};
    EXPECT_EQ(*args.launcherArguments(), expected);
}

TEST(LauncherSanitizer, DropsQuarantineSerialNumber)
{
    ArgVector args = makeArgs({"novella", "-psn_0_1234567"});
    EXPECT_EQ(sanitizeLauncherArguments(args), SanitizeAction::QuarantineArgsDropped);
    EXPECT_EQ(args.size(), 1u);
    EXPECT_FALSE(args.launcherArguments().has_value());
}

TEST(LauncherSanitizer, StoreLauncherWinsOverQuarantine)
{
    ArgVector args = makeArgs({"novella", "-psn_0_99", "-epicapp=x"});
    EXPECT_EQ(sanitizeLauncherArguments(args), SanitizeAction::LauncherArgsPreserved);
    ASSERT_TRUE(args.launcherArguments().has_value());
    EXPECT_EQ(args.launcherArguments()->size(), 2u);
}

TEST(LauncherSanitizer, ProgramNameIsNotInspected)
{
    ArgVector args = makeArgs({"-psn_launcher", "proj"});
    EXPECT_EQ(sanitizeLauncherArguments(args), SanitizeAction::None);
    EXPECT_EQ(args.size(), 2u);
}

TEST(LauncherSanitizer, HasMarkerIgnoresCase)
{
    const std::vector<std::string> tokens{"novella", "-PSN_0_1"};
    EXPECT_TRUE(hasMarker(tokens, kQuarantineMarker));
    EXPECT_FALSE(hasMarker(tokens, kEpicLauncherMarker));
    EXPECT_FALSE(hasMarker({}, kQuarantineMarker));
}

TEST(ArgVector, TailAndTruncate)
{
    ArgVector args = makeArgs({"novella", "proj", "lint"});
    EXPECT_EQ(args.tail(), (std::vector<std::string>{"proj", "lint"}));
    args.truncateToProgram();
    EXPECT_TRUE(args.tail().empty());
    EXPECT_EQ(args.programName(), "novella");

    ArgVector empty;
    EXPECT_EQ(empty.programName(), "");
    EXPECT_TRUE(empty.tail().empty());
}

TEST(ArgVector, FromMainCopiesTokens)
{
    char prog[] = "novella";
    char dir[] = "proj";
    char *argv[] = {prog, dir, nullptr};
    ArgVector args = ArgVector::fromMain(2, argv);
    EXPECT_EQ(args.tokens(), (std::vector<std::string>{"novella", "proj"}));
    EXPECT_TRUE(ArgVector::fromMain(0, nullptr).empty());
}
