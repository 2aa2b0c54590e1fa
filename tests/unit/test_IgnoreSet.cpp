#include <gtest/gtest.h>
#include "project/IgnoreSet.hpp"

#include <stdexcept>

using namespace pith::project;

TEST(IgnoreSetTest, StartsWithDefaults) {
    const IgnoreSet set;
    EXPECT_EQ(set.size(), 7u);
    EXPECT_EQ(set.patterns(), IgnoreSet::defaults());
}

TEST(IgnoreSetTest, DefaultsMatchAnyComponent) {
    const IgnoreSet set;
    EXPECT_TRUE(set.matches("_partial.html"));
    EXPECT_TRUE(set.matches("docs/_layout.html"));
    EXPECT_TRUE(set.matches(".git/HEAD"));
    EXPECT_TRUE(set.matches("notes.txt~"));
    EXPECT_TRUE(set.matches("src/.main.cpp.swp"));
    EXPECT_TRUE(set.matches("a.swo"));
    EXPECT_TRUE(set.matches("styles/.sass-cache/x.css"));

    EXPECT_FALSE(set.matches("a.swx"));
    EXPECT_FALSE(set.matches("index.html"));
    EXPECT_FALSE(set.matches("docs/under_score.html"));
}

TEST(IgnoreSetTest, AddReportsDuplicates) {
    IgnoreSet set;
    EXPECT_TRUE(set.add("*.bak"));
    EXPECT_FALSE(set.add("*.bak"));
    EXPECT_FALSE(set.add("_*"));
    EXPECT_TRUE(set.contains("*.bak"));
    EXPECT_TRUE(set.matches("old/page.bak"));
}

TEST(IgnoreSetTest, SlashPatternsAreAnchored) {
    IgnoreSet set;
    set.add("drafts/*.html");
    set.add("docs/old");

    EXPECT_TRUE(set.matches("drafts/post.html"));
    EXPECT_FALSE(set.matches("other/drafts/post.html"));
    EXPECT_FALSE(set.matches("drafts/deep/post.html"));
    EXPECT_TRUE(set.matches("docs/old"));
    EXPECT_TRUE(set.matches("docs/old/page.html"));
    EXPECT_FALSE(set.matches("docs/older/page.html"));
}

TEST(IgnoreSetTest, EmptyPatternIsRejected) {
    IgnoreSet set;
    EXPECT_THROW(set.add(""), std::invalid_argument);
    EXPECT_FALSE(set.matches(""));
}
