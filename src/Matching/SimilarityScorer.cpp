/**
 * @file SimilarityScorer.cpp
 * @brief Weighted cosine similarity with consistency terms and stepped penalties
 */

#include <VisMatch/Matching/SimilarityScorer.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Platform/Logging.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace Vis::Match::Matching {

using namespace Feature;

namespace {

// Blend of the raw similarity
constexpr double COSINE_WEIGHT = 0.4;
constexpr double BLOCK_WEIGHT = 0.25;
constexpr double HUE_WEIGHT = 0.25;
constexpr double DIFFERENCE_WEIGHT = 0.1;

constexpr double BLOCK_COLOR_SHARE = 0.7;
constexpr double BLOCK_TEXTURE_SHARE = 0.3;
constexpr double BLOCK_DECAY = 5.0;
constexpr double HUE_DECAY = 8.0;

constexpr double COMPRESSION_EXPONENT = 0.7;
constexpr double DAMPING = 0.9;

constexpr double GLOBAL_WEIGHTS[GLOBAL_FEATURES] = {1.8, 2.0, 1.5, 1.5, 1.5};
constexpr double EDGE_WEIGHTS[EDGE_FEATURES] = {2.2, 1.8, 1.8, 1.8, 1.8};

bool Comparable(const FeatureVector& a, const FeatureVector& b) {
    return a.size() == b.size() && a.size() >= static_cast<size_t>(FEATURE_DIMENSION);
}

std::string MismatchMessage(const FeatureVector& a, const FeatureVector& b) {
    return "feature vectors of length " + std::to_string(a.size()) + " and " +
           std::to_string(b.size()) + " (need equal lengths >= " +
           std::to_string(FEATURE_DIMENSION) + ")";
}

double BlockConsistency(const FeatureVector& a, const FeatureVector& b) {
    double sum = 0.0;
    for (int32_t block = 0; block < BLOCK_COUNT; ++block) {
        size_t base = static_cast<size_t>(BLOCK_OFFSET + block * VALUES_PER_BLOCK);
        double dr = a[base] - b[base];
        double dg = a[base + 1] - b[base + 1];
        double db = a[base + 2] - b[base + 2];
        double colorDist = std::sqrt(dr * dr + dg * dg + db * db);
        double textureDist = std::abs(a[base + 3] - b[base + 3]);
        double dist = BLOCK_COLOR_SHARE * colorDist + BLOCK_TEXTURE_SHARE * textureDist;
        sum += std::exp(-dist * BLOCK_DECAY);
    }
    return sum / BLOCK_COUNT;
}

double HueConsistency(const FeatureVector& a, const FeatureVector& b) {
    double sum = 0.0;
    for (int32_t bin = 0; bin < HUE_BINS; ++bin) {
        size_t i = static_cast<size_t>(HUE_OFFSET + bin);
        sum += std::exp(-std::abs(a[i] - b[i]) * HUE_DECAY);
    }
    return sum / HUE_BINS;
}

double MaxDifferencePenalty(double maxDiff) {
    if (maxDiff > 0.8) return 0.3;
    if (maxDiff > 0.6) return 0.5;
    if (maxDiff > 0.4) return 0.7;
    if (maxDiff > 0.3) return 0.85;
    return 1.0;
}

double LowScoreSuppression(double score) {
    if (score < 0.2) return 0.5;
    if (score < 0.4) return 0.8;
    return 1.0;
}

} // anonymous namespace

double FeatureWeight(size_t index) {
    if (index < static_cast<size_t>(HUE_OFFSET)) return 1.2;
    if (index < static_cast<size_t>(SATURATION_OFFSET)) return 2.0;
    if (index < static_cast<size_t>(VALUE_OFFSET)) return 1.8;
    if (index < static_cast<size_t>(BLOCK_OFFSET)) return 1.5;
    if (index < static_cast<size_t>(GLOBAL_OFFSET)) return 2.2;
    if (index < static_cast<size_t>(EDGE_OFFSET)) return GLOBAL_WEIGHTS[index - GLOBAL_OFFSET];
    if (index < static_cast<size_t>(FEATURE_DIMENSION)) return EDGE_WEIGHTS[index - EDGE_OFFSET];
    return 1.0;
}

double ScoreSimilarity(const FeatureVector& a, const FeatureVector& b, ScoreDetails* details) {
    if (details) {
        *details = ScoreDetails();
    }
    if (!Comparable(a, b)) {
        Platform::Logger()->warn("ScoreSimilarity: {}, scoring 0", MismatchMessage(a, b));
        return 0.0;
    }

    double dot = 0.0;
    double normA = 0.0;
    double normB = 0.0;
    double weightedDiff = 0.0;
    double weightSum = 0.0;
    double maxDiff = 0.0;

    for (size_t i = 0; i < a.size(); ++i) {
        double w = FeatureWeight(i);
        double wa = a[i] * w;
        double wb = b[i] * w;
        dot += wa * wb;
        normA += wa * wa;
        normB += wb * wb;

        double diff = std::abs(a[i] - b[i]);
        weightedDiff += diff * w;
        weightSum += w;
        maxDiff = std::max(maxDiff, diff);
    }

    double cosine = 0.0;
    if (normA > 0.0 && normB > 0.0) {
        cosine = dot / (std::sqrt(normA) * std::sqrt(normB));
    }
    double meanDiff = weightedDiff / weightSum;
    double blocks = BlockConsistency(a, b);
    double hues = HueConsistency(a, b);

    double raw = COSINE_WEIGHT * cosine + BLOCK_WEIGHT * blocks + HUE_WEIGHT * hues +
                 DIFFERENCE_WEIGHT * (1.0 - meanDiff);

    double score;
    if (maxDiff == 0.0) {
        // Identical vectors
        score = 1.0;
    } else {
        score = std::pow(std::max(raw, 0.0), COMPRESSION_EXPONENT);
        score *= MaxDifferencePenalty(maxDiff);
        score *= LowScoreSuppression(score);
        score *= DAMPING;
        score = std::clamp(score, 0.0, 1.0);
    }

    if (details) {
        details->cosine = cosine;
        details->meanDifference = meanDiff;
        details->maxDifference = maxDiff;
        details->blockConsistency = blocks;
        details->hueConsistency = hues;
        details->raw = raw;
        details->score = score;
    }
    return score;
}

double ScoreStrict(const FeatureVector& a, const FeatureVector& b) {
    if (!Comparable(a, b)) {
        throw DimensionMismatchException(MismatchMessage(a, b));
    }
    return ScoreSimilarity(a, b);
}

} // namespace Vis::Match::Matching
