/**
 * @file FeatureExtractor.cpp
 * @brief Feature vector extraction
 */

#include <VisMatch/Feature/FeatureExtractor.h>
#include <VisMatch/Core/Constants.h>
#include <VisMatch/Core/Types.h>
#include <VisMatch/Core/Validate.h>
#include <VisMatch/Internal/ColorSpace.h>
#include <VisMatch/Internal/Gradient.h>
#include <VisMatch/Internal/Histogram.h>
#include <VisMatch/Internal/Resample.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace Vis::Match::Feature {

namespace {

using Internal::Histogram;

// Per-pixel accumulation over the resampled grid
struct ColorStats {
    std::array<double, 3> sum{};
    std::array<double, 3> sumSq{};
    double graySum = 0;
    int64_t count = 0;

    void Add(uint8_t r, uint8_t g, uint8_t b) {
        const double c[3] = {static_cast<double>(r), static_cast<double>(g),
                             static_cast<double>(b)};
        for (int i = 0; i < 3; ++i) {
            sum[i] += c[i];
            sumSq[i] += c[i] * c[i];
        }
        graySum += (c[0] + c[1] + c[2]) / 3.0;
        count++;
    }

    double Mean(int ch) const { return count > 0 ? sum[ch] / count : 0.0; }

    double Variance(int ch) const {
        if (count == 0) return 0.0;
        double m = Mean(ch);
        return std::max(0.0, sumSq[ch] / count - m * m);
    }

    // Variance of all channel samples pooled together
    double PooledVariance() const {
        if (count == 0) return 0.0;
        double n = 3.0 * count;
        double s = sum[0] + sum[1] + sum[2];
        double sq = sumSq[0] + sumSq[1] + sumSq[2];
        double m = s / n;
        return std::max(0.0, sq / n - m * m);
    }
};

void AppendBlockFeatures(const Image& rgb, FeatureVector& out) {
    const int32_t width = rgb.Width();
    const int32_t height = rgb.Height();

    for (int32_t by = 0; by < BLOCK_GRID; ++by) {
        for (int32_t bx = 0; bx < BLOCK_GRID; ++bx) {
            const int32_t x0 = bx * width / BLOCK_GRID;
            const int32_t x1 = (bx + 1) * width / BLOCK_GRID;
            const int32_t y0 = by * height / BLOCK_GRID;
            const int32_t y1 = (by + 1) * height / BLOCK_GRID;
            const Rect2i block(x0, y0, x1 - x0, y1 - y0);

            ColorStats stats;
            for (int32_t y = block.y; y < block.Bottom(); ++y) {
                const uint8_t* row = static_cast<const uint8_t*>(rgb.RowPtr(y));
                for (int32_t x = block.x; x < block.Right(); ++x) {
                    stats.Add(row[x * 3], row[x * 3 + 1], row[x * 3 + 2]);
                }
            }

            // Texture: RMS deviation from the block's mean color
            double variance = (stats.Variance(0) + stats.Variance(1) + stats.Variance(2)) / 3.0;

            out.push_back(stats.Mean(0) / CHANNEL_MAX);
            out.push_back(stats.Mean(1) / CHANNEL_MAX);
            out.push_back(stats.Mean(2) / CHANNEL_MAX);
            out.push_back(std::sqrt(variance) / CHANNEL_MAX);
        }
    }
}

void AppendEdgeFeatures(const std::vector<double>& gray, int32_t width, int32_t height,
                        FeatureVector& out) {
    std::vector<double> gx;
    std::vector<double> gy;
    Internal::SobelInterior(gray, width, height, gx, gy);

    double strength = 0.0;
    std::array<double, Internal::EDGE_DIRECTION_BINS> directions{};

    for (int32_t y = 1; y < height - 1; ++y) {
        for (int32_t x = 1; x < width - 1; ++x) {
            size_t idx = static_cast<size_t>(y) * width + x;
            double magnitude = std::hypot(gx[idx], gy[idx]);
            if (magnitude <= 0.0) {
                continue;
            }
            strength += magnitude;
            int32_t bin = static_cast<int32_t>(Internal::ClassifyDirection(gx[idx], gy[idx]));
            directions[bin] += magnitude;
        }
    }

    const double norm = static_cast<double>(width) * height * CHANNEL_MAX;
    out.push_back(strength / norm);
    for (double d : directions) {
        out.push_back(d / norm);
    }
}

} // namespace

FeatureVector ExtractFeatures(const Image& image) {
    Validate::RequireImageNonEmptyU8(image, "ExtractFeatures");

    const Image rgb = Internal::ResampleRgb(image, RESAMPLE_SIZE, RESAMPLE_SIZE);
    const int32_t width = rgb.Width();
    const int32_t height = rgb.Height();

    // Bin index floor(c / 25.6) == floor(c * 10 / 256)
    Histogram rHist(RGB_BINS, 0, 256);
    Histogram gHist(RGB_BINS, 0, 256);
    Histogram bHist(RGB_BINS, 0, 256);
    Histogram hHist(HUE_BINS, 0, 360);
    Histogram sHist(SATURATION_BINS, 0, 1);
    Histogram vHist(VALUE_BINS, 0, 1);

    ColorStats global;
    std::vector<double> gray(static_cast<size_t>(width) * height);

    for (int32_t y = 0; y < height; ++y) {
        const uint8_t* row = static_cast<const uint8_t*>(rgb.RowPtr(y));
        for (int32_t x = 0; x < width; ++x) {
            const uint8_t r = row[x * 3];
            const uint8_t g = row[x * 3 + 1];
            const uint8_t b = row[x * 3 + 2];

            rHist.Add(r);
            gHist.Add(g);
            bHist.Add(b);

            const Internal::Hsv hsv = Internal::RgbToHsv(r, g, b);
            hHist.Add(hsv.h);
            sHist.Add(hsv.s);
            vHist.Add(hsv.v);

            global.Add(r, g, b);
            gray[static_cast<size_t>(y) * width + x] = Internal::RgbToGray(r, g, b);
        }
    }

    FeatureVector features;
    features.reserve(FEATURE_DIMENSION);

    Internal::AppendNormalized(rHist, features);
    Internal::AppendNormalized(gHist, features);
    Internal::AppendNormalized(bHist, features);
    Internal::AppendNormalized(hHist, features);
    Internal::AppendNormalized(sHist, features);
    Internal::AppendNormalized(vHist, features);

    AppendBlockFeatures(rgb, features);

    const double brightness = global.count > 0 ? global.graySum / global.count : 0.0;
    features.push_back(brightness / CHANNEL_MAX);
    features.push_back(std::sqrt(global.PooledVariance()) / CHANNEL_MAX);
    for (int ch = 0; ch < 3; ++ch) {
        features.push_back(std::sqrt(global.Variance(ch)) / CHANNEL_MAX);
    }

    AppendEdgeFeatures(gray, width, height, features);

    return features;
}

} // namespace Vis::Match::Feature
