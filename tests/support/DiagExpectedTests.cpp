// File: tests/support/DiagExpectedTests.cpp
// Purpose: Cover Expected<T>, diagnostic formatting and the DiagnosticEngine error count.
// Key invariants: printDiag emits "[prefix: ]severity: message" on one line.
// Ownership/Lifetime: Standalone unit test executable.

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace novella::support;

TEST(DiagExpected, HoldsValue)
{
    Expected<int> result(42);
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(result.value(), 42);
}

TEST(DiagExpected, HoldsError)
{
    Expected<std::string> result(makeError("bad input"));
    ASSERT_FALSE(result.hasValue());
    EXPECT_EQ(result.error().severity, Severity::Error);
    EXPECT_EQ(result.error().message, "bad input");
}

TEST(DiagExpected, PrintDiagWithAndWithoutPrefix)
{
    std::ostringstream os;
    printDiag(makeError("Command bogus is unknown."), os, "novella");
    printDiag(makeNote("lint is successful"), os);
    EXPECT_EQ(os.str(),
              "novella: error: Command bogus is unknown.\n"
              "note: lint is successful\n");
}

TEST(DiagnosticEngine, CountsErrorsOnly)
{
    DiagnosticEngine engine;
    engine.note("first");
    engine.report(makeError("broken"));
    engine.report(makeError("broken again"));

    EXPECT_EQ(engine.diagnostics().size(), 3u);
    EXPECT_EQ(engine.errorCount(), 2u);

    std::ostringstream os;
    engine.printAll(os);
    EXPECT_EQ(os.str(),
              "note: first\n"
              "error: broken\n"
              "error: broken again\n");
}
