// File: tests/support/SessionStoreTests.cpp
// Purpose: Verify the session key/value store used for launch markers.
// Key invariants: Missing flags fall back; non-empty strings read as set flags.
// Ownership/Lifetime: Standalone unit test executable.

#include "support/session_store.hpp"

#include <gtest/gtest.h>

#include <string>

using novella::support::SessionStore;

TEST(SessionStore, MissingKeysUseFallback)
{
    SessionStore store;
    EXPECT_FALSE(store.getFlag("_reload"));
    EXPECT_TRUE(store.getFlag("_reload", true));
}

TEST(SessionStore, FlagsAndStrings)
{
    SessionStore store;
    store.set("_warped", true);
    store.set("compile", std::string("yes"));
    store.set("empty", std::string());

    EXPECT_TRUE(store.getFlag("_warped"));
    EXPECT_TRUE(store.getFlag("compile"));
    EXPECT_FALSE(store.getFlag("empty", true));
}

TEST(SessionStore, OverwriteReplacesValue)
{
    SessionStore store;
    store.set("_reload", true);
    store.set("_reload", false);
    EXPECT_FALSE(store.getFlag("_reload", true));

    store.set("_reload", std::string("again"));
    EXPECT_TRUE(store.getFlag("_reload"));
}
