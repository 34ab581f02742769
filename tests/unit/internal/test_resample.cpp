/**
 * @file test_resample.cpp
 * @brief Unit tests for Internal/Resample
 */

#include <gtest/gtest.h>
#include <VisMatch/Internal/Resample.h>
#include <VisMatch/Core/Exception.h>

#include "test_images.h"

using namespace Vis::Match;
using namespace Vis::Match::Internal;

namespace {

const uint8_t* Pixel(const Image& img, int32_t x, int32_t y) {
    return static_cast<const uint8_t*>(img.RowPtr(y)) + x * 3;
}

} // namespace

TEST(ResampleTest, OutputIsRgbOfRequestedSize) {
    Image src = Vis::Match::Test::ColorRamp(100, 60);
    Image dst = ResampleRgb(src, 48, 48);
    EXPECT_EQ(dst.Width(), 48);
    EXPECT_EQ(dst.Height(), 48);
    EXPECT_EQ(dst.GetChannelType(), ChannelType::RGB);
    EXPECT_EQ(dst.Type(), PixelType::UInt8);
}

TEST(ResampleTest, SolidColorStaysExact) {
    Image src = Vis::Match::Test::SolidRgb(17, 91, 12, 34, 56);
    Image dst = ResampleRgb(src, 48, 48);
    for (int32_t y = 0; y < 48; y += 7) {
        for (int32_t x = 0; x < 48; x += 5) {
            const uint8_t* p = Pixel(dst, x, y);
            EXPECT_EQ(p[0], 12);
            EXPECT_EQ(p[1], 34);
            EXPECT_EQ(p[2], 56);
        }
    }
}

TEST(ResampleTest, SameSizeIsIdentity) {
    Image src = Vis::Match::Test::ColorRamp(48, 48);
    Image dst = ResampleRgb(src, 48, 48);
    for (int32_t y = 0; y < 48; ++y) {
        for (int32_t x = 0; x < 48; ++x) {
            const uint8_t* a = Pixel(src, x, y);
            const uint8_t* b = Pixel(dst, x, y);
            ASSERT_EQ(a[0], b[0]);
            ASSERT_EQ(a[1], b[1]);
            ASSERT_EQ(a[2], b[2]);
        }
    }
}

TEST(ResampleTest, GrayIsReplicatedToRgb) {
    Image src = Vis::Match::Test::VerticalStep(10, 10, 40, 40);
    Image dst = ResampleRgb(src, 5, 5);
    const uint8_t* p = Pixel(dst, 2, 2);
    EXPECT_EQ(p[0], 40);
    EXPECT_EQ(p[1], 40);
    EXPECT_EQ(p[2], 40);
}

TEST(ResampleTest, BgrIsReordered) {
    Image src(4, 4, PixelType::UInt8, ChannelType::BGR);
    for (int32_t y = 0; y < 4; ++y) {
        uint8_t* row = static_cast<uint8_t*>(src.RowPtr(y));
        for (int32_t x = 0; x < 4; ++x) {
            row[x * 3] = 200;     // B
            row[x * 3 + 1] = 100; // G
            row[x * 3 + 2] = 10;  // R
        }
    }
    Image dst = ResampleRgb(src, 4, 4);
    const uint8_t* p = Pixel(dst, 1, 1);
    EXPECT_EQ(p[0], 10);
    EXPECT_EQ(p[1], 100);
    EXPECT_EQ(p[2], 200);
}

TEST(ResampleTest, AlphaIsDropped) {
    Image src(3, 3, PixelType::UInt8, ChannelType::RGBA);
    for (int32_t y = 0; y < 3; ++y) {
        uint8_t* row = static_cast<uint8_t*>(src.RowPtr(y));
        for (int32_t x = 0; x < 3; ++x) {
            row[x * 4] = 1;
            row[x * 4 + 1] = 2;
            row[x * 4 + 2] = 3;
            row[x * 4 + 3] = 0;
        }
    }
    Image dst = ResampleRgb(src, 6, 6);
    const uint8_t* p = Pixel(dst, 5, 5);
    EXPECT_EQ(p[0], 1);
    EXPECT_EQ(p[1], 2);
    EXPECT_EQ(p[2], 3);
}

TEST(ResampleTest, InvalidInputThrows) {
    Image empty;
    EXPECT_THROW(ResampleRgb(empty, 48, 48), InvalidArgumentException);

    Image src = Vis::Match::Test::SolidRgb(4, 4, 0, 0, 0);
    EXPECT_THROW(ResampleRgb(src, 0, 48), InvalidArgumentException);

    Image wide(4, 4, PixelType::Float32, ChannelType::Gray);
    EXPECT_THROW(ResampleRgb(wide, 48, 48), UnsupportedException);
}
