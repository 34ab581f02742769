#pragma once

/**
 * @file SimilarityScorer.h
 * @brief Similarity between two feature vectors
 *
 * Score pipeline:
 * 1. Weighted cosine similarity over the per-dimension weight table
 * 2. Weighted mean and unweighted maximum of absolute differences
 * 3. Block consistency: mean over the 3x3 blocks of exp(-5 * d), where
 *    d = 0.7 * |RGB mean distance| + 0.3 * |texture difference|
 * 4. Hue consistency: mean over the hue bins of exp(-8 * |h1 - h2|)
 * 5. raw = 0.4 * cosine + 0.25 * block + 0.25 * hue + 0.1 * (1 - meanDiff)
 * 6. raw^0.7, stepped max-difference penalty, low-score suppression,
 *    damping by 0.9, clamp to [0, 1]
 *
 * Identical vectors score exactly 1. The score is symmetric.
 * Any other pair is damped, so near-duplicates such as a re-encoded copy
 * score at most 0.9; a threshold above 0.9 keeps only exact duplicates.
 */

#include <VisMatch/Core/Export.h>
#include <VisMatch/Feature/FeatureExtractor.h>

#include <cstddef>

namespace Vis::Match::Matching {

using Feature::FeatureVector;

/**
 * @brief Intermediate values of one score computation
 */
struct VISMATCH_API ScoreDetails {
    double cosine = 0.0;            ///< Weighted cosine similarity
    double meanDifference = 0.0;    ///< Weighted mean |a - b|
    double maxDifference = 0.0;     ///< Unweighted max |a - b|
    double blockConsistency = 0.0;
    double hueConsistency = 0.0;
    double raw = 0.0;               ///< Blend before compression
    double score = 0.0;             ///< Final score
};

/**
 * @brief Weight of one feature dimension
 *
 * | Range        | Weight                       |
 * |--------------|------------------------------|
 * | RGB hist     | 1.2                          |
 * | hue / sat / val | 2.0 / 1.8 / 1.5           |
 * | blocks       | 2.2                          |
 * | global       | 1.8, 2.0, 1.5, 1.5, 1.5      |
 * | edges        | 2.2, 1.8, 1.8, 1.8, 1.8      |
 *
 * Indices at or beyond FEATURE_DIMENSION weigh 1.0.
 */
VISMATCH_API double FeatureWeight(size_t index);

/**
 * @brief Similarity of two feature vectors in [0, 1]
 *
 * Never throws. Vectors of different length, or shorter than
 * FEATURE_DIMENSION, score 0 and a warning is logged. Only identical
 * vectors reach 1; every other pair is capped at 0.9 by damping.
 *
 * @param a First vector
 * @param b Second vector
 * @param details Optional output of intermediate values
 */
VISMATCH_API double ScoreSimilarity(const FeatureVector& a, const FeatureVector& b,
                                    ScoreDetails* details = nullptr);

/**
 * @brief ScoreSimilarity() that rejects incomparable vectors
 * @throws DimensionMismatchException if the lengths differ or are too short
 */
VISMATCH_API double ScoreStrict(const FeatureVector& a, const FeatureVector& b);

} // namespace Vis::Match::Matching
