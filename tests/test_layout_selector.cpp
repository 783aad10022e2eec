/**
 * @file test_layout_selector.cpp
 * @brief Unit tests for layout matching and OCR bounds scaling
 */

#include "test_helpers.h"

#include "detection/layout_selector.h"
#include "utils/config_loader.h"

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace overlay_ocr;
using namespace overlay_ocr::test;

class LayoutSelectorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        option = defaultLayoutOption();
    }

    LayoutOption option;
};

TEST_F(LayoutSelectorTest, AspectRatioMatchesExactly)
{
    EXPECT_TRUE(option.aspectRatioMatches(1920, 1080));
    EXPECT_TRUE(option.aspectRatioMatches(3840, 2160));
    EXPECT_FALSE(option.aspectRatioMatches(1920, 1200));
    EXPECT_FALSE(option.aspectRatioMatches(1921, 1080));
}

TEST_F(LayoutSelectorTest, RatioNeedNotBeReduced)
{
    option.aspectRatio = {{32, 18}};
    EXPECT_TRUE(option.aspectRatioMatches(1920, 1080));
    EXPECT_FALSE(option.aspectRatioMatches(1920, 1200));
}

TEST(PixelCheckTest, ZeroToleranceRequiresExactMatch)
{
    PixelCheck check;
    check.color = Rgba8{255, 255, 255, 255};
    check.tolerance = 0.0f;

    EXPECT_TRUE(check.matchesPixel(Rgba8{255, 255, 255, 255}));
    EXPECT_FALSE(check.matchesPixel(Rgba8{254, 254, 254, 255}));
}

TEST(PixelCheckTest, ToleranceIsEuclideanRgbDistance)
{
    PixelCheck check;
    check.color = Rgba8{255, 255, 255, 255};
    check.tolerance = 3.0f;

    // sqrt(3) ~ 1.73
    EXPECT_TRUE(check.matchesPixel(Rgba8{254, 254, 254, 255}));
    // sqrt(3 * 4) ~ 3.46
    EXPECT_FALSE(check.matchesPixel(Rgba8{253, 253, 253, 255}));
    // exactly 3
    EXPECT_TRUE(check.matchesPixel(Rgba8{252, 255, 255, 255}));
}

TEST(PixelCheckTest, ColorDistanceIgnoresAlpha)
{
    EXPECT_FLOAT_EQ(colorDistance(Rgba8{0, 0, 0, 0}, Rgba8{0, 0, 0, 255}), 0.0f);
    EXPECT_FLOAT_EQ(colorDistance(Rgba8{0, 0, 0, 255}, Rgba8{3, 4, 0, 255}), 5.0f);
}

TEST_F(LayoutSelectorTest, PixelChecksMustAllPass)
{
    RgbaImage image = makeSolidImage(16, 9, Rgba8{0, 0, 0, 255});
    const size_t i = (static_cast<size_t>(2) * 16 + 3) * 4;
    image.pixels[i] = 200;

    PixelCheck red;
    red.x = 3;
    red.y = 2;
    red.color = Rgba8{200, 0, 0, 255};
    option.pixelChecks = {red};
    EXPECT_TRUE(option.matches(image));

    PixelCheck black;
    black.x = 0;
    black.y = 0;
    black.color = Rgba8{10, 10, 10, 255};
    option.pixelChecks.push_back(black);
    EXPECT_FALSE(option.matches(image));
}

TEST_F(LayoutSelectorTest, OutOfBoundsCheckFails)
{
    RgbaImage image = makeSolidImage(16, 9, Rgba8{0, 0, 0, 255});
    PixelCheck check;
    check.x = 16;
    check.y = 0;
    check.color = Rgba8{0, 0, 0, 255};
    option.pixelChecks = {check};

    EXPECT_FALSE(option.verifyPixelChecks(image));
    EXPECT_FALSE(option.matches(image));
}

TEST_F(LayoutSelectorTest, FirstMatchingOptionWins)
{
    LayoutOption wide;
    wide.aspectRatio = {{21, 9}};
    wide.layout.offset = UVec2{1, 1};

    LayoutOption first = option;
    first.layout.offset = UVec2{10, 10};
    LayoutOption second = option;
    second.layout.offset = UVec2{20, 20};

    const std::vector<LayoutOption> options = {wide, first, second};
    const RgbaImage image = makeSolidImage(32, 18, Rgba8{});

    const Layout* chosen = selectLayout(image, options);
    ASSERT_NE(chosen, nullptr);
    EXPECT_EQ(chosen->offset.x, 10u);
    EXPECT_EQ(chosen, &options[1].layout);

    const auto all = selectAllLayouts(image, options);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0], &options[1]);
    EXPECT_EQ(all[1], &options[2]);
}

TEST_F(LayoutSelectorTest, NoMatchYieldsNull)
{
    const std::vector<LayoutOption> options = {option};
    const RgbaImage image = makeSolidImage(16, 10, Rgba8{});
    EXPECT_EQ(selectLayout(image, options), nullptr);
    EXPECT_TRUE(selectAllLayouts(image, options).empty());
    EXPECT_EQ(selectLayout(image, {}), nullptr);
}

TEST_F(LayoutSelectorTest, BoundsAtReferenceResolutionAreUnscaled)
{
    const PixelRect r = option.layout.ocrBounds(1920, 1080);
    EXPECT_EQ(r.x, 478u);
    EXPECT_EQ(r.y, 411u);
    EXPECT_EQ(r.w, 965u);
    EXPECT_EQ(r.h, 49u);
}

TEST_F(LayoutSelectorTest, BoundsScaleByIntegerFactor)
{
    const PixelRect r = option.layout.ocrBounds(3840, 2160);
    EXPECT_EQ(r.x, 956u);
    EXPECT_EQ(r.y, 822u);
    EXPECT_EQ(r.w, 1930u);
    EXPECT_EQ(r.h, 98u);

    // 2560x1440 is a 1.33x frame; the integer factor is 1.
    const PixelRect q = option.layout.ocrBounds(2560, 1440);
    EXPECT_EQ(q.x, 478u);
    EXPECT_EQ(q.w, 965u);
}

TEST_F(LayoutSelectorTest, SmallerFrameOrZeroReferenceGivesEmptyBounds)
{
    EXPECT_TRUE(option.layout.ocrBounds(1280, 720).empty());

    option.layout.referenceResolution = UVec2{0, 0};
    EXPECT_TRUE(option.layout.ocrBounds(1920, 1080).empty());
}

TEST_F(LayoutSelectorTest, BoundsAreClippedToTheFrame)
{
    option.layout.offset = UVec2{1900, 1000};
    const PixelRect r = option.layout.ocrBounds(1920, 1080);
    EXPECT_EQ(r.x, 1900u);
    EXPECT_EQ(r.y, 1000u);
    EXPECT_EQ(r.w, 20u);
    EXPECT_EQ(r.h, 49u);

    option.layout.offset = UVec2{4000, 0};
    EXPECT_TRUE(option.layout.ocrBounds(1920, 1080).empty());
}

TEST_F(LayoutSelectorTest, HugeRegionDoesNotWrap)
{
    option.layout.referenceResolution = UVec2{1, 1};
    option.layout.offset = UVec2{0, 0};
    option.layout.size = UVec2{4000000000u, 4000000000u};

    const PixelRect r = option.layout.ocrBounds(3840, 2160);
    EXPECT_EQ(r.w, 3840u);
    EXPECT_EQ(r.h, 2160u);

    const Aabb box = Aabb::fromRect(r);
    EXPECT_FLOAT_EQ(box.maxX, 3840.0f);
    EXPECT_FLOAT_EQ(box.maxY, 2160.0f);
}
