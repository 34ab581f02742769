/**
 * @file Resample.cpp
 * @brief Bilinear RGB resampling
 */

#include <VisMatch/Internal/Resample.h>
#include <VisMatch/Core/Validate.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace Vis::Match::Internal {

namespace {

// Source channel offsets for R, G, B
std::array<int, 3> ChannelOrder(ChannelType type) {
    switch (type) {
        case ChannelType::Gray: return {0, 0, 0};
        case ChannelType::BGR:
        case ChannelType::BGRA: return {2, 1, 0};
        case ChannelType::RGB:
        case ChannelType::RGBA:
        default: return {0, 1, 2};
    }
}

inline uint8_t ClampU8(double v) {
    return static_cast<uint8_t>(std::clamp(std::lround(v), 0L, 255L));
}

} // namespace

Image ResampleRgb(const Image& src, int32_t dstWidth, int32_t dstHeight) {
    Validate::RequireImageNonEmptyU8(src, "ResampleRgb");
    Validate::RequirePositive(dstWidth, "dstWidth", "ResampleRgb");
    Validate::RequirePositive(dstHeight, "dstHeight", "ResampleRgb");

    const int32_t srcW = src.Width();
    const int32_t srcH = src.Height();
    const int channels = src.Channels();
    const std::array<int, 3> order = ChannelOrder(src.GetChannelType());

    const double scaleX = static_cast<double>(srcW) / dstWidth;
    const double scaleY = static_cast<double>(srcH) / dstHeight;

    Image dst(dstWidth, dstHeight, PixelType::UInt8, ChannelType::RGB);

    for (int32_t y = 0; y < dstHeight; ++y) {
        double sy = (y + 0.5) * scaleY - 0.5;
        sy = std::clamp(sy, 0.0, static_cast<double>(srcH - 1));
        int32_t y0 = static_cast<int32_t>(std::floor(sy));
        int32_t y1 = std::min(y0 + 1, srcH - 1);
        double fy = sy - y0;

        const uint8_t* row0 = static_cast<const uint8_t*>(src.RowPtr(y0));
        const uint8_t* row1 = static_cast<const uint8_t*>(src.RowPtr(y1));
        uint8_t* out = static_cast<uint8_t*>(dst.RowPtr(y));

        for (int32_t x = 0; x < dstWidth; ++x) {
            double sx = (x + 0.5) * scaleX - 0.5;
            sx = std::clamp(sx, 0.0, static_cast<double>(srcW - 1));
            int32_t x0 = static_cast<int32_t>(std::floor(sx));
            int32_t x1 = std::min(x0 + 1, srcW - 1);
            double fx = sx - x0;

            for (int c = 0; c < 3; ++c) {
                int ch = order[c];
                double p00 = row0[x0 * channels + ch];
                double p01 = row0[x1 * channels + ch];
                double p10 = row1[x0 * channels + ch];
                double p11 = row1[x1 * channels + ch];

                double top = p00 + (p01 - p00) * fx;
                double bottom = p10 + (p11 - p10) * fx;
                out[x * 3 + c] = ClampU8(top + (bottom - top) * fy);
            }
        }
    }

    return dst;
}

} // namespace Vis::Match::Internal
