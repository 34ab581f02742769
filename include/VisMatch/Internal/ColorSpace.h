#pragma once

/**
 * @file ColorSpace.h
 * @brief Per-pixel color space conversion
 */

#include <cstdint>

namespace Vis::Match::Internal {

/**
 * @brief HSV triple in natural units
 */
struct Hsv {
    double h = 0;   ///< Hue in degrees [0, 360)
    double s = 0;   ///< Saturation [0, 1]
    double v = 0;   ///< Value [0, 1]
};

/**
 * @brief Convert an 8-bit RGB pixel to HSV
 *
 * delta = max - min; hue branches on the maximal channel (red, green, blue
 * in that priority), saturation = delta / max (0 when max = 0), value = max.
 * Gray pixels (delta = 0) get hue 0.
 */
Hsv RgbToHsv(uint8_t r, uint8_t g, uint8_t b);

/**
 * @brief Luma of an 8-bit RGB pixel (ITU-R BT.601 weights), range [0, 255]
 */
inline double RgbToGray(uint8_t r, uint8_t g, uint8_t b) {
    return 0.299 * r + 0.587 * g + 0.114 * b;
}

} // namespace Vis::Match::Internal
