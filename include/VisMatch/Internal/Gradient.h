#pragma once

/**
 * @file Gradient.h
 * @brief Sobel image gradients on grayscale planes
 *
 * Provides:
 * - 3x3 Sobel derivatives (separable: [-1 0 1] x [1 2 1])
 * - Orientation quantization into undirected edge-direction bins
 *
 * Used by:
 * - Edge-direction features
 */

#include <cstdint>
#include <vector>

namespace Vis::Match::Internal {

// ============================================================================
// Constants
// ============================================================================

/// Number of undirected orientation bins over [0, 180) degrees
constexpr int32_t EDGE_DIRECTION_BINS = 4;

/**
 * @brief Undirected edge orientation classes
 *
 * Each class spans 45 degrees centered on its nominal angle.
 */
enum class EdgeDirection : int32_t {
    Horizontal = 0,     ///< [0, 22.5) and [157.5, 180)
    Diagonal = 1,       ///< [22.5, 67.5)
    Vertical = 2,       ///< [67.5, 112.5)
    AntiDiagonal = 3    ///< [112.5, 157.5)
};

// ============================================================================
// Kernel Functions
// ============================================================================

/// Sobel derivative kernel [-1, 0, 1]
std::vector<double> SobelDerivativeKernel();

/// Sobel smoothing kernel [1, 2, 1]
std::vector<double> SobelSmoothingKernel();

// ============================================================================
// Gradient Computation
// ============================================================================

/**
 * @brief Compute 3x3 Sobel gradients at interior pixels
 *
 * Border pixels (first/last row and column) are set to 0 in both outputs.
 *
 * @param gray Row-major grayscale plane (width * height values)
 * @param width Plane width
 * @param height Plane height
 * @param[out] gx Horizontal derivative (resized to width * height)
 * @param[out] gy Vertical derivative (resized to width * height)
 */
void SobelInterior(const std::vector<double>& gray, int32_t width, int32_t height,
                   std::vector<double>& gx, std::vector<double>& gy);

/**
 * @brief Classify gradient orientation into an undirected direction bin
 *
 * The angle atan2(gy, gx) is folded into [0, 180) degrees first.
 */
EdgeDirection ClassifyDirection(double gx, double gy);

} // namespace Vis::Match::Internal
