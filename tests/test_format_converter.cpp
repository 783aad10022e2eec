/**
 * @file test_format_converter.cpp
 * @brief Unit tests for capture pixel format normalization
 */

#include "test_helpers.h"

#include "processing/format_converter.h"

#include <gtest/gtest.h>

#include <vector>

using namespace overlay_ocr;
using namespace overlay_ocr::test;

TEST(FormatConverterTest, BgraPixelIsSwizzledToRgba)
{
    std::vector<uint8_t> bytes = {10, 20, 30, 40};
    auto image = normalizeToRgba(std::move(bytes), makeFormat(1, 1, PixelFormat::BGRA));

    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->pixels, (std::vector<uint8_t>{30, 20, 10, 40}));
}

TEST(FormatConverterTest, InPlaceSwizzleCoversEveryPixel)
{
    std::vector<uint8_t> bytes = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12};
    bgraToRgbaInPlace(bytes.data(), 3);
    EXPECT_EQ(bytes, (std::vector<uint8_t>{3, 2, 1, 4, 7, 6, 5, 8, 11, 10, 9, 12}));
}

TEST(FormatConverterTest, BgrxIsSwizzledLikeBgra)
{
    std::vector<uint8_t> bytes = {10, 20, 30, 0};
    auto image = normalizeToRgba(std::move(bytes), makeFormat(1, 1, PixelFormat::BGRx));

    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->pixels, (std::vector<uint8_t>{30, 20, 10, 0}));
}

TEST(FormatConverterTest, RgbaAndRgbxPassThrough)
{
    for (PixelFormat format : {PixelFormat::RGBA, PixelFormat::RGBx})
    {
        std::vector<uint8_t> bytes = {10, 20, 30, 40, 50, 60, 70, 80};
        auto image = normalizeToRgba(std::move(bytes), makeFormat(2, 1, format));

        ASSERT_TRUE(image.has_value());
        EXPECT_EQ(image->width, 2u);
        EXPECT_EQ(image->height, 1u);
        EXPECT_EQ(image->pixels, (std::vector<uint8_t>{10, 20, 30, 40, 50, 60, 70, 80}));
    }
}

TEST(FormatConverterTest, UnknownFormatYieldsNothing)
{
    FrameFormat format = makeFormat(1, 1, PixelFormat::Other);
    format.formatName = "I420";

    std::vector<uint8_t> bytes = {1, 2, 3, 4};
    EXPECT_FALSE(normalizeToRgba(std::move(bytes), format).has_value());

    // Logged once, still rejected on repeat.
    std::vector<uint8_t> again = {1, 2, 3, 4};
    EXPECT_FALSE(normalizeToRgba(std::move(again), format).has_value());
}

TEST(FormatConverterTest, ShortBufferYieldsNothing)
{
    std::vector<uint8_t> bytes(12, 0);
    EXPECT_FALSE(normalizeToRgba(std::move(bytes), makeFormat(2, 2)).has_value());
}

TEST(FormatConverterTest, ZeroSizedFormatYieldsNothing)
{
    std::vector<uint8_t> bytes(4, 0);
    EXPECT_FALSE(normalizeToRgba(std::move(bytes), makeFormat(0, 0)).has_value());
}

TEST(FormatConverterTest, TrailingBytesAreTrimmed)
{
    std::vector<uint8_t> bytes = {10, 20, 30, 40, 99, 99};
    auto image = normalizeToRgba(std::move(bytes), makeFormat(1, 1, PixelFormat::BGRA));

    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->pixels.size(), 4u);
    EXPECT_EQ(image->pixel(0, 0), (Rgba8{30, 20, 10, 40}));
}
