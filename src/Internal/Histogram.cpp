/**
 * @file Histogram.cpp
 * @brief Histogram normalization
 */

#include <VisMatch/Internal/Histogram.h>

namespace Vis::Match::Internal {

std::vector<double> NormalizeHistogram(const Histogram& hist) {
    std::vector<double> normalized(hist.numBins, 0);

    if (hist.totalCount == 0) {
        return normalized;
    }

    double total = static_cast<double>(hist.totalCount);
    for (int32_t i = 0; i < hist.numBins; ++i) {
        normalized[i] = hist.bins[i] / total;
    }

    return normalized;
}

void AppendNormalized(const Histogram& hist, std::vector<double>& out) {
    std::vector<double> normalized = NormalizeHistogram(hist);
    out.insert(out.end(), normalized.begin(), normalized.end());
}

} // namespace Vis::Match::Internal
