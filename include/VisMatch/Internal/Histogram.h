#pragma once

/**
 * @file Histogram.h
 * @brief Fixed-bin histograms over scalar values
 *
 * Provides:
 * - Histogram accumulation with clamped bin lookup
 * - Normalization to a probability distribution
 *
 * Used by:
 * - Color histogram features (RGB and HSV channels)
 */

#include <algorithm>
#include <cstdint>
#include <vector>

namespace Vis::Match::Internal {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief 1D Histogram data
 *
 * Bin index of a value v is floor((v - minValue) / binWidth) clamped to
 * [0, numBins - 1], so maxValue itself lands in the last bin.
 */
struct Histogram {
    std::vector<uint32_t> bins;     ///< Bin counts
    int32_t numBins = 0;            ///< Number of bins
    double minValue = 0;            ///< Minimum value in range
    double maxValue = 1;            ///< Maximum value in range
    uint64_t totalCount = 0;        ///< Total accumulated samples

    /// Constructor with custom bin count
    explicit Histogram(int32_t nBins, double minVal = 0, double maxVal = 1)
        : bins(nBins > 0 ? nBins : 0, 0), numBins(nBins > 0 ? nBins : 0),
          minValue(minVal), maxValue(maxVal) {}

    /// Get bin count at index
    uint32_t At(int32_t idx) const {
        if (idx < 0 || idx >= static_cast<int32_t>(bins.size())) return 0;
        return bins[idx];
    }

    /// Get bin index for a value
    int32_t GetBinIndex(double value) const {
        if (maxValue <= minValue || numBins == 0) return 0;
        double normalized = (value - minValue) / (maxValue - minValue);
        int32_t idx = static_cast<int32_t>(normalized * numBins);
        return std::max(0, std::min(idx, numBins - 1));
    }

    /// Add one sample
    void Add(double value) {
        if (numBins == 0) return;
        bins[GetBinIndex(value)]++;
        totalCount++;
    }

    /// Check if empty
    bool Empty() const { return totalCount == 0; }

    /// Clear histogram
    void Clear() {
        std::fill(bins.begin(), bins.end(), 0);
        totalCount = 0;
    }
};

// ============================================================================
// Histogram Operations
// ============================================================================

/**
 * @brief Normalize histogram to probability distribution
 *
 * @param hist Histogram
 * @return Normalized histogram (sums to 1, all zeros if empty)
 */
std::vector<double> NormalizeHistogram(const Histogram& hist);

/**
 * @brief Append normalized bins to an output vector
 *
 * @param hist Histogram
 * @param out Destination; numBins values are appended
 */
void AppendNormalized(const Histogram& hist, std::vector<double>& out);

} // namespace Vis::Match::Internal
