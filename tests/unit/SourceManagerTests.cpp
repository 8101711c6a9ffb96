// File: tests/unit/SourceManagerTests.cpp
// Purpose: Verify file registration, path normalization and lookup by basename.
// Key invariants: '..' segments collapse; identical normalized paths share an id;
//                 ambiguous basenames resolve to no file.
// Ownership/Lifetime: Standalone test executable.
// Links: src/support/source_manager.hpp, src/support/source_location.hpp

#include "support/source_location.hpp"
#include "support/source_manager.hpp"

#include <gtest/gtest.h>

using strata::support::formatLoc;
using strata::support::SourceLoc;
using strata::support::SourceManager;

TEST(SourceManagerTest, NormalizesAndDeduplicates)
{
    SourceManager sm;
    uint32_t a = sm.addFile("a/b/../c/main.nr");
    ASSERT_NE(a, 0u);
    EXPECT_EQ(sm.getPath(a), "a/c/main.nr");
    EXPECT_EQ(sm.addFile("a/c/main.nr"), a);
    EXPECT_EQ(sm.getPath(0), "");
    EXPECT_EQ(sm.getPath(a + 1), "");
}

TEST(SourceManagerTest, FindsByFullPathOrUniqueBasename)
{
    SourceManager sm;
    uint32_t mainId = sm.addFile("src/main.nr");
    uint32_t libA = sm.addFile("lib/a/util.nr");
    uint32_t libB = sm.addFile("lib/b/util.nr");

    EXPECT_EQ(sm.findFile("src/main.nr"), mainId);
    EXPECT_EQ(sm.findFile("src/./main.nr"), mainId);
    EXPECT_EQ(sm.findFile("main.nr"), mainId);
    EXPECT_EQ(sm.findFile("lib/a/util.nr"), libA);
    EXPECT_EQ(sm.findFile("lib/b/util.nr"), libB);
    EXPECT_EQ(sm.findFile("util.nr"), 0u);
    EXPECT_EQ(sm.findFile("missing.nr"), 0u);
}

TEST(SourceManagerTest, FormatsLocations)
{
    SourceManager sm;
    uint32_t id = sm.addFile("src/main.nr");
    EXPECT_EQ(formatLoc(SourceLoc{id, 3, 7}, &sm), "src/main.nr:3:7");
    EXPECT_EQ(formatLoc(SourceLoc{id, 3, 0}, &sm), "src/main.nr:3");
    EXPECT_EQ(formatLoc(SourceLoc{9, 4, 0}, &sm), "#9:4");
    EXPECT_EQ(formatLoc(SourceLoc{id, 1, 1}), "#1:1:1");
}

TEST(SourceManagerTest, LocationEquality)
{
    EXPECT_EQ((SourceLoc{1, 2, 3}), (SourceLoc{1, 2, 3}));
    EXPECT_NE((SourceLoc{1, 2, 3}), (SourceLoc{1, 2, 4}));
    EXPECT_FALSE(SourceLoc{}.isValid());
    EXPECT_TRUE((SourceLoc{1, 0, 0}).isValid());
    EXPECT_FALSE((SourceLoc{1, 0, 0}).hasLine());
}
