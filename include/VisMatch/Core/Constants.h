#pragma once

/**
 * @file Constants.h
 * @brief Library-wide constants
 */

#include <cstddef>
#include <cstdint>

namespace Vis::Match {

/// Row alignment for image buffers (AVX-512 friendly)
constexpr size_t MEMORY_ALIGNMENT = 64;

/// Maximum 8-bit channel value
constexpr double CHANNEL_MAX = 255.0;

/// Milliseconds per day
constexpr int64_t MS_PER_DAY = 24LL * 60 * 60 * 1000;

} // namespace Vis::Match
