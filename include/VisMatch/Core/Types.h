#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for VisMatch
 */

#include <cstdint>
#include <VisMatch/Core/Export.h>

namespace Vis::Match {

// =============================================================================
// Pixel Types
// =============================================================================

/**
 * @brief Supported pixel data types
 */
enum class PixelType {
    UInt8,      ///< 8-bit unsigned [0, 255]
    UInt16,     ///< 16-bit unsigned [0, 65535]
    Int16,      ///< 16-bit signed [-32768, 32767]
    Float32     ///< 32-bit float
};

/**
 * @brief Image channel types
 */
enum class ChannelType {
    Gray,       ///< Single channel grayscale
    RGB,        ///< 3 channels RGB
    BGR,        ///< 3 channels BGR
    RGBA,       ///< 4 channels RGBA
    BGRA        ///< 4 channels BGRA
};

// =============================================================================
// Rectangle Type
// =============================================================================

/**
 * @brief Axis-aligned rectangle with integer coordinates
 */
struct VISMATCH_API Rect2i {
    int32_t x = 0;      ///< Left
    int32_t y = 0;      ///< Top
    int32_t width = 0;
    int32_t height = 0;

    Rect2i() = default;
    Rect2i(int32_t x_, int32_t y_, int32_t w, int32_t h)
        : x(x_), y(y_), width(w), height(h) {}

    int32_t Right() const { return x + width; }
    int32_t Bottom() const { return y + height; }
};

} // namespace Vis::Match
