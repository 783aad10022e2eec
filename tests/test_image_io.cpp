/**
 * @file test_image_io.cpp
 * @brief Unit tests for capture image files and the file-replay capture source
 */

#include "test_helpers.h"

#include "capture/capture_link.h"
#include "capture/image_file_source.h"
#include "utils/image_io.h"

#include <gtest/gtest.h>

#include <ctime>
#include <filesystem>

using namespace overlay_ocr;
using namespace overlay_ocr::test;

TEST(ImageIoTest, CaptureFilenameIsUtcWithUnderscores)
{
    std::tm tm{};
    tm.tm_year = 2026 - 1900;
    tm.tm_mon = 9;
    tm.tm_mday = 17;
    tm.tm_hour = 12;
    tm.tm_min = 30;
    tm.tm_sec = 45;
    const auto when = std::chrono::system_clock::from_time_t(timegm(&tm));

    EXPECT_EQ(makeCaptureFilename(when), "2026-10-17_12_30_45Z.png");
}

TEST(ImageIoTest, SavedCaptureReadsBackAsBgra)
{
    TempDir dir;
    RgbaImage image = makeSolidImage(3, 2, Rgba8{10, 20, 30, 255});

    std::string written;
    std::string error;
    ASSERT_TRUE(saveCaptureImage(image, dir.file("shots"), written, error)) << error;
    EXPECT_TRUE(std::filesystem::exists(written));
    EXPECT_EQ(std::filesystem::path(written).extension().string(), ".png");

    std::vector<uint8_t> bytes;
    FrameFormat format;
    ASSERT_TRUE(loadImageAsBgraFrame(written, bytes, format, error)) << error;
    EXPECT_EQ(format.width, 3u);
    EXPECT_EQ(format.height, 2u);
    EXPECT_EQ(format.format, PixelFormat::BGRA);
    ASSERT_EQ(bytes.size(), 24u);
    EXPECT_EQ(bytes[0], 30);
    EXPECT_EQ(bytes[1], 20);
    EXPECT_EQ(bytes[2], 10);
    EXPECT_EQ(bytes[3], 255);
}

TEST(ImageIoTest, EmptyCaptureIsNotSaved)
{
    TempDir dir;
    std::string written;
    std::string error;
    EXPECT_FALSE(saveCaptureImage(RgbaImage{}, dir.file("shots"), written, error));
    EXPECT_FALSE(error.empty());
}

TEST(ImageIoTest, MissingFileFailsToLoad)
{
    std::vector<uint8_t> bytes;
    FrameFormat format;
    std::string error;
    EXPECT_FALSE(loadImageAsBgraFrame("/nonexistent/capture.png", bytes, format, error));
    EXPECT_FALSE(error.empty());
}

TEST(ImageFileSourceTest, PublishesFormatThenFrames)
{
    TempDir dir;
    std::string written;
    std::string error;
    ASSERT_TRUE(saveCaptureImage(makeSolidImage(4, 4, Rgba8{1, 2, 3, 255}),
                                 dir.path().string(), written, error)) << error;

    ImageFileSource source;
    ASSERT_TRUE(source.open(dir.path().string()));
    EXPECT_EQ(source.getImageCount(), 1u);

    CaptureLink link;
    ASSERT_TRUE(source.start(link, 200.0));
    ASSERT_TRUE(waitUntil([&] { return source.getFramesPublished() >= 3; }));
    source.stop();
    EXPECT_FALSE(source.isRunning());

    LatestImage latest;
    latest.receive(link);
    EXPECT_EQ(latest.getAnnouncedFormat().width, 4u);

    auto image = latest.takeLatestRgba();
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->pixel(3, 3), (Rgba8{1, 2, 3, 255}));
}

TEST(ImageFileSourceTest, NothingToOpen)
{
    TempDir dir;
    ImageFileSource source;
    EXPECT_FALSE(source.open(dir.path().string()));

    CaptureLink link;
    EXPECT_FALSE(source.start(link, 30.0));
}
