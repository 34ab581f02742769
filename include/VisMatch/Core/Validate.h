#pragma once

/**
 * @file Validate.h
 * @brief Unified validation utilities for VisMatch
 *
 * Design principles:
 * - Type restriction and channel restriction are INDEPENDENT
 * - Consistent error message format: "<Function>: <what> ..."
 */

#include <VisMatch/Core/Export.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Core/Image.h>

#include <cstdint>
#include <cstdio>
#include <string>

namespace Vis::Match::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

// Format double with limited precision (avoid long tails)
inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

inline const char* PixelTypeName(PixelType type) {
    switch (type) {
        case PixelType::UInt8:   return "UInt8";
        case PixelType::UInt16:  return "UInt16";
        case PixelType::Int16:   return "Int16";
        case PixelType::Float32: return "Float32";
        default:                 return "Unknown";
    }
}

} // namespace Detail

// =============================================================================
// Image Validation
// =============================================================================

/**
 * @brief Check image is non-empty and valid (throws on empty)
 *
 * @param image Input image
 * @param funcName Function name for error messages
 * @throws InvalidArgumentException if image is empty or invalid
 */
inline void RequireImageNonEmpty(const Image& image, const char* funcName) {
    if (image.Empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is empty");
    }
    if (!image.IsValid()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is invalid");
    }
}

/**
 * @brief Check image has specific pixel type
 *
 * @throws UnsupportedException if type mismatch
 */
inline void RequireImageType(const Image& image, PixelType expected, const char* funcName) {
    if (image.Type() != expected) {
        throw UnsupportedException(
            std::string(funcName) + ": expected " + Detail::PixelTypeName(expected) +
            " image, got " + Detail::PixelTypeName(image.Type()));
    }
}

/**
 * @brief Check image is non-empty, valid, UInt8 (throws on empty)
 */
inline void RequireImageNonEmptyU8(const Image& image, const char* funcName) {
    RequireImageNonEmpty(image, funcName);
    RequireImageType(image, PixelType::UInt8, funcName);
}

// =============================================================================
// Parameter Validation
// =============================================================================

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (!(value >= minVal && value <= maxVal)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is positive (> 0)
 */
template<typename T>
inline void RequirePositive(T value, const char* paramName, const char* funcName) {
    if (value <= T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be > 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (value < T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

} // namespace Vis::Match::Validate
