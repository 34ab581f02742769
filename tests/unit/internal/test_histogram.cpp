/**
 * @file test_histogram.cpp
 * @brief Unit tests for Internal/Histogram
 */

#include <gtest/gtest.h>
#include <VisMatch/Internal/Histogram.h>

#include <numeric>

using namespace Vis::Match::Internal;

TEST(HistogramTest, ConstructEmpty) {
    Histogram hist(10, 0, 256);
    EXPECT_EQ(hist.numBins, 10);
    EXPECT_EQ(hist.bins.size(), 10u);
    EXPECT_TRUE(hist.Empty());
}

TEST(HistogramTest, NegativeBinCountIsEmpty) {
    Histogram hist(-3);
    EXPECT_EQ(hist.numBins, 0);
    hist.Add(0.5);
    EXPECT_TRUE(hist.Empty());
}

TEST(HistogramTest, ChannelBinsFollowFloorOfValueOver25_6) {
    Histogram hist(10, 0, 256);
    EXPECT_EQ(hist.GetBinIndex(0), 0);
    EXPECT_EQ(hist.GetBinIndex(25), 0);
    EXPECT_EQ(hist.GetBinIndex(26), 1);
    EXPECT_EQ(hist.GetBinIndex(128), 5);
    EXPECT_EQ(hist.GetBinIndex(230), 8);
    EXPECT_EQ(hist.GetBinIndex(231), 9);
    EXPECT_EQ(hist.GetBinIndex(255), 9);
}

TEST(HistogramTest, OutOfRangeValuesClamp) {
    Histogram hist(18, 0, 360);
    EXPECT_EQ(hist.GetBinIndex(-5), 0);
    EXPECT_EQ(hist.GetBinIndex(360), 17);
    EXPECT_EQ(hist.GetBinIndex(1000), 17);
}

TEST(HistogramTest, AddCountsSamples) {
    Histogram hist(4, 0, 1);
    hist.Add(0.1);
    hist.Add(0.1);
    hist.Add(0.9);
    EXPECT_EQ(hist.At(0), 2u);
    EXPECT_EQ(hist.At(3), 1u);
    EXPECT_EQ(hist.At(7), 0u);
    EXPECT_EQ(hist.totalCount, 3u);

    hist.Clear();
    EXPECT_TRUE(hist.Empty());
    EXPECT_EQ(hist.At(0), 0u);
}

TEST(HistogramTest, NormalizeSumsToOne) {
    Histogram hist(5, 0, 1);
    for (int i = 0; i < 7; ++i) hist.Add(0.05);
    for (int i = 0; i < 3; ++i) hist.Add(0.95);

    std::vector<double> norm = NormalizeHistogram(hist);
    ASSERT_EQ(norm.size(), 5u);
    EXPECT_DOUBLE_EQ(norm[0], 0.7);
    EXPECT_DOUBLE_EQ(norm[4], 0.3);
    EXPECT_NEAR(std::accumulate(norm.begin(), norm.end(), 0.0), 1.0, 1e-12);
}

TEST(HistogramTest, NormalizeEmptyIsZero) {
    Histogram hist(3, 0, 1);
    std::vector<double> norm = NormalizeHistogram(hist);
    ASSERT_EQ(norm.size(), 3u);
    for (double v : norm) {
        EXPECT_EQ(v, 0.0);
    }
}

TEST(HistogramTest, AppendNormalizedExtends) {
    Histogram a(2, 0, 1);
    a.Add(0.2);
    Histogram b(3, 0, 1);
    b.Add(0.9);

    std::vector<double> out = {42.0};
    AppendNormalized(a, out);
    AppendNormalized(b, out);

    ASSERT_EQ(out.size(), 6u);
    EXPECT_EQ(out[0], 42.0);
    EXPECT_EQ(out[1], 1.0);
    EXPECT_EQ(out[2], 0.0);
    EXPECT_EQ(out[5], 1.0);
}
