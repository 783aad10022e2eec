/**
 * @file test_line_grouping.cpp
 * @brief Unit tests for grouping detected word boxes into text lines
 */

#include "test_helpers.h"

#include "ocr/dnn_ocr_engine.h"

#include <gtest/gtest.h>

using namespace overlay_ocr;
using namespace overlay_ocr::test;

namespace {

cv::RotatedRect box(float x, float y, float w, float h)
{
    return toRotatedRect(cv::Rect2f(x, y, w, h));
}

} // namespace

TEST(LineGroupingTest, NoWordsNoLines)
{
    EXPECT_TRUE(groupWordsIntoLines({}).empty());
}

TEST(LineGroupingTest, WordsOnOneBaselineFormOneLineLeftToRight)
{
    const WordBoxes words = {box(200, 10, 40, 12), box(0, 11, 50, 12), box(100, 9, 30, 12)};

    const LineBoxes lines = groupWordsIntoLines(words);
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].size(), 3u);
    EXPECT_FLOAT_EQ(lines[0][0].center.x, 25.0f);
    EXPECT_FLOAT_EQ(lines[0][1].center.x, 115.0f);
    EXPECT_FLOAT_EQ(lines[0][2].center.x, 220.0f);
}

TEST(LineGroupingTest, StackedWordsFormSeparateLinesTopToBottom)
{
    const WordBoxes words = {box(0, 30, 40, 12), box(0, 0, 40, 12), box(60, 31, 40, 12)};

    const LineBoxes lines = groupWordsIntoLines(words);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].size(), 1u);
    EXPECT_FLOAT_EQ(lines[0][0].center.y, 6.0f);
    ASSERT_EQ(lines[1].size(), 2u);
    EXPECT_LT(lines[1][0].center.x, lines[1][1].center.x);
}

TEST(LineGroupingTest, SmallOverlapDoesNotJoinLines)
{
    // 2 px of a 12 px height overlap: below half of the smaller height.
    const WordBoxes words = {box(0, 0, 40, 12), box(50, 10, 40, 12)};
    EXPECT_EQ(groupWordsIntoLines(words).size(), 2u);
}

TEST(LineGroupingTest, EveryWordIsKept)
{
    const WordBoxes words = {box(0, 0, 10, 10), box(20, 2, 10, 10), box(0, 40, 10, 10),
                             box(20, 41, 10, 10), box(40, 80, 10, 10)};

    size_t total = 0;
    for (const auto& line : groupWordsIntoLines(words))
    {
        total += line.size();
    }
    EXPECT_EQ(total, words.size());
}
