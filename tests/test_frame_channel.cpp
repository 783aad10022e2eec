/**
 * @file test_frame_channel.cpp
 * @brief Unit tests for LatestValueChannel, CaptureLink and LatestImage
 */

#include "test_helpers.h"

#include "capture/capture_link.h"
#include "capture/frame_channel.h"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace overlay_ocr;
using namespace overlay_ocr::test;

class FrameChannelTest : public ::testing::Test
{
protected:
    LatestValueChannel<int> channel;
};

TEST_F(FrameChannelTest, EmptyChannelYieldsNothing)
{
    EXPECT_FALSE(channel.hasPending());
    EXPECT_FALSE(channel.tryTake().has_value());
}

TEST_F(FrameChannelTest, LatestValueWins)
{
    EXPECT_FALSE(channel.publish(1));
    EXPECT_TRUE(channel.publish(2)); // v1 dropped

    auto first = channel.tryTake();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 2);

    EXPECT_FALSE(channel.tryTake().has_value());
}

TEST_F(FrameChannelTest, TakeEmptiesSlot)
{
    channel.publish(7);
    EXPECT_TRUE(channel.hasPending());
    EXPECT_EQ(channel.tryTake().value(), 7);
    EXPECT_FALSE(channel.hasPending());
}

TEST_F(FrameChannelTest, ConsumerSeesIncreasingValuesAndTheLastOne)
{
    constexpr int kCount = 20000;
    std::atomic<bool> done{false};

    std::thread producer([&] {
        for (int i = 1; i <= kCount; i++)
        {
            channel.publish(i);
        }
        done = true;
    });

    int last = 0;
    bool ordered = true;
    while (!done || channel.hasPending())
    {
        if (auto v = channel.tryTake())
        {
            if (*v <= last)
            {
                ordered = false;
            }
            last = *v;
        }
    }
    producer.join();
    if (auto v = channel.tryTake())
    {
        last = *v;
    }

    EXPECT_TRUE(ordered);
    EXPECT_EQ(last, kCount);
}

TEST(CaptureLinkTest, FramesCarryTheFormatCurrentAtPublish)
{
    CaptureLink link;
    link.publishFormat(makeFormat(2, 1));
    link.publishFrame(std::vector<uint8_t>(8, 0));

    link.publishFormat(makeFormat(4, 4, PixelFormat::RGBA));

    auto frame = link.pollFrame();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->format.width, 2u);
    EXPECT_EQ(frame->format.height, 1u);
    EXPECT_EQ(frame->format.format, PixelFormat::BGRA);

    auto format = link.pollFormat();
    ASSERT_TRUE(format.has_value());
    EXPECT_EQ(format->width, 4u);
    EXPECT_FALSE(link.pollFormat().has_value());
}

TEST(CaptureLinkTest, StatsCountDroppedFrames)
{
    CaptureLink link;
    link.publishFormat(makeFormat(1, 1));
    EXPECT_FALSE(link.publishFrame({1, 2, 3, 4}));
    EXPECT_TRUE(link.publishFrame({5, 6, 7, 8}));
    EXPECT_TRUE(link.publishFrame({9, 10, 11, 12}));

    const CaptureStats stats = link.getStats();
    EXPECT_EQ(stats.framesPublished, 3u);
    EXPECT_EQ(stats.framesDropped, 2u);
    EXPECT_EQ(stats.formatChanges, 1u);

    auto frame = link.pollFrame();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->data[0], 9);
}

class LatestImageTest : public ::testing::Test
{
protected:
    CaptureLink link;
    LatestImage latest;
};

TEST_F(LatestImageTest, NothingPublishedIsNoFrame)
{
    latest.receive(link);
    ErrorKind reason = ErrorKind::EngineFailure;
    EXPECT_FALSE(latest.takeLatestRgba(&reason).has_value());
    EXPECT_EQ(reason, ErrorKind::NoFrame);
}

TEST_F(LatestImageTest, FrameIsConsumedOnce)
{
    link.publishFormat(makeFormat(2, 2));
    link.publishFrame(makeBgraBytes(2, 2, Rgba8{1, 2, 3, 255}));
    latest.receive(link);

    EXPECT_TRUE(latest.hasFrame());
    EXPECT_EQ(latest.getAnnouncedFormat().width, 2u);

    auto image = latest.takeLatestRgba();
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->width, 2u);
    EXPECT_EQ(image->pixel(1, 1), (Rgba8{1, 2, 3, 255}));

    ErrorKind reason = ErrorKind::EngineFailure;
    EXPECT_FALSE(latest.takeLatestRgba(&reason).has_value());
    EXPECT_EQ(reason, ErrorKind::NoFrame);
}

TEST_F(LatestImageTest, ShortFrameIsNotYetUsable)
{
    RawFrame frame;
    frame.format = makeFormat(4, 4);
    frame.data.assign(16, 0); // 4x4 needs 64 bytes
    latest.setLatestFrame(frame);

    ErrorKind reason = ErrorKind::EngineFailure;
    EXPECT_FALSE(latest.takeLatestRgba(&reason).has_value());
    EXPECT_EQ(reason, ErrorKind::NoFrame);

    // Still held until a complete frame replaces it.
    EXPECT_TRUE(latest.hasFrame());

    frame.data.assign(64, 0);
    latest.setLatestFrame(frame);
    EXPECT_TRUE(latest.takeLatestRgba().has_value());
}

TEST_F(LatestImageTest, UnknownPixelFormatIsReported)
{
    FrameFormat format = makeFormat(1, 1, PixelFormat::Other);
    format.formatName = "NV12";
    link.publishFormat(format);
    link.publishFrame({1, 2, 3, 4});
    latest.receive(link);

    ErrorKind reason = ErrorKind::EngineFailure;
    EXPECT_FALSE(latest.takeLatestRgba(&reason).has_value());
    EXPECT_EQ(reason, ErrorKind::UnsupportedPixelFormat);
}

TEST_F(LatestImageTest, NewerFrameReplacesUnconsumedOne)
{
    link.publishFormat(makeFormat(1, 1));
    link.publishFrame(makeBgraBytes(1, 1, Rgba8{10, 0, 0, 255}));
    latest.receive(link);
    link.publishFrame(makeBgraBytes(1, 1, Rgba8{20, 0, 0, 255}));
    latest.receive(link);

    auto image = latest.takeLatestRgba();
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->pixel(0, 0).r, 20);
}
