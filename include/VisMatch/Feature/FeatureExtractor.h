#pragma once

/**
 * @file FeatureExtractor.h
 * @brief Fixed-length color/texture/edge feature vectors for image retrieval
 *
 * Every image is resampled to 48x48 RGB and summarized as a 114-element
 * vector laid out as:
 *
 * | Offset | Count | Content                                            |
 * |--------|-------|----------------------------------------------------|
 * |      0 |    30 | R, G, B histograms (10 bins each, floor(c / 25.6)) |
 * |     30 |    18 | Hue histogram (20 degree bins)                     |
 * |     48 |    10 | Saturation histogram                               |
 * |     58 |    10 | Value histogram                                    |
 * |     68 |    36 | 3x3 blocks: mean R, G, B and texture per block     |
 * |    104 |     5 | brightness, color spread, R/G/B second moments     |
 * |    109 |     5 | edge strength, 4 direction strengths               |
 *
 * All histograms sum to one; all other values are divided by 255 (edges by
 * pixelCount * 255). Extraction is deterministic.
 */

#include <VisMatch/Core/Export.h>
#include <VisMatch/Core/Image.h>

#include <cstdint>
#include <vector>

namespace Vis::Match::Feature {

/// Feature vector (immutable once produced)
using FeatureVector = std::vector<double>;

// ============================================================================
// Layout
// ============================================================================

/// Side length of the square resample grid
constexpr int32_t RESAMPLE_SIZE = 48;

constexpr int32_t RGB_BINS = 10;            ///< Bins per RGB channel
constexpr int32_t HUE_BINS = 18;            ///< 20 degrees per bin
constexpr int32_t SATURATION_BINS = 10;
constexpr int32_t VALUE_BINS = 10;
constexpr int32_t BLOCK_GRID = 3;           ///< Blocks per side
constexpr int32_t BLOCK_COUNT = BLOCK_GRID * BLOCK_GRID;
constexpr int32_t VALUES_PER_BLOCK = 4;     ///< R, G, B, texture
constexpr int32_t GLOBAL_FEATURES = 5;
constexpr int32_t EDGE_FEATURES = 5;

constexpr int32_t RGB_OFFSET = 0;
constexpr int32_t HUE_OFFSET = RGB_OFFSET + 3 * RGB_BINS;
constexpr int32_t SATURATION_OFFSET = HUE_OFFSET + HUE_BINS;
constexpr int32_t VALUE_OFFSET = SATURATION_OFFSET + SATURATION_BINS;
constexpr int32_t BLOCK_OFFSET = VALUE_OFFSET + VALUE_BINS;
constexpr int32_t GLOBAL_OFFSET = BLOCK_OFFSET + BLOCK_COUNT * VALUES_PER_BLOCK;
constexpr int32_t EDGE_OFFSET = GLOBAL_OFFSET + GLOBAL_FEATURES;

/// Total feature vector length
constexpr int32_t FEATURE_DIMENSION = EDGE_OFFSET + EDGE_FEATURES;

static_assert(FEATURE_DIMENSION == 114, "feature layout changed");

// ============================================================================
// Extraction
// ============================================================================

/**
 * @brief Extract the feature vector of an image
 *
 * @param image Decoded image (UInt8; Gray, RGB, BGR, RGBA or BGRA)
 * @return FEATURE_DIMENSION values
 * @throws InvalidArgumentException if the image is empty
 * @throws UnsupportedException if the pixel type is not UInt8
 *
 * @code
 * Image img = Image::FromFile("shirt.jpg");
 * FeatureVector v = ExtractFeatures(img);
 * @endcode
 */
VISMATCH_API FeatureVector ExtractFeatures(const Image& image);

} // namespace Vis::Match::Feature
