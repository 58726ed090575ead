#include "session/LineSplitter.h"
#include <gtest/gtest.h>

using namespace BjornManager::Session;

TEST(LineSplitterTest, JoinsChunksIntoLines)
{
    LineSplitter splitter;
    EXPECT_TRUE(splitter.push("Step 1 of").empty());
    EXPECT_EQ(splitter.partial(), "Step 1 of");

    const auto lines = splitter.push(" 9: Updating\nnext");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "Step 1 of 9: Updating");
    EXPECT_EQ(splitter.flush(), "next");
    EXPECT_EQ(splitter.partial(), "");
}

TEST(LineSplitterTest, CrLfSplitAcrossChunksIsOneBreak)
{
    LineSplitter splitter;
    auto first = splitter.push("alpha\r");
    auto second = splitter.push("\nbeta\n");
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0], "alpha");
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0], "beta");
}

TEST(LineSplitterTest, BareCarriageReturnEndsLine)
{
    LineSplitter splitter;
    auto lines = splitter.push("10%\r20%\r\n\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "10%");
    EXPECT_EQ(lines[1], "20%");
    EXPECT_EQ(lines[2], "");
}
