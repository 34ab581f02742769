/**
 * @file Gradient.cpp
 * @brief Image gradient computation implementation
 */

#include <VisMatch/Internal/Gradient.h>

#include <algorithm>
#include <cmath>

namespace Vis::Match::Internal {

namespace {

constexpr double RAD_TO_DEG = 180.0 / 3.14159265358979323846;

} // namespace

// ============================================================================
// Kernel Functions
// ============================================================================

std::vector<double> SobelDerivativeKernel() {
    return {-1.0, 0.0, 1.0};
}

std::vector<double> SobelSmoothingKernel() {
    return {1.0, 2.0, 1.0};
}

// ============================================================================
// Gradient Computation
// ============================================================================

void SobelInterior(const std::vector<double>& gray, int32_t width, int32_t height,
                   std::vector<double>& gx, std::vector<double>& gy) {
    const size_t size = static_cast<size_t>(std::max(width, 0)) *
                        static_cast<size_t>(std::max(height, 0));
    gx.assign(size, 0.0);
    gy.assign(size, 0.0);

    if (width < 3 || height < 3 || gray.size() < size) {
        return;
    }

    const std::vector<double> deriv = SobelDerivativeKernel();
    const std::vector<double> smooth = SobelSmoothingKernel();

    for (int32_t y = 1; y < height - 1; ++y) {
        for (int32_t x = 1; x < width - 1; ++x) {
            double sx = 0.0;
            double sy = 0.0;
            for (int32_t ky = -1; ky <= 1; ++ky) {
                const double* row = gray.data() + static_cast<size_t>(y + ky) * width;
                for (int32_t kx = -1; kx <= 1; ++kx) {
                    double v = row[x + kx];
                    // Gx = deriv_x * smooth_y, Gy = smooth_x * deriv_y
                    sx += v * deriv[kx + 1] * smooth[ky + 1];
                    sy += v * smooth[kx + 1] * deriv[ky + 1];
                }
            }
            gx[static_cast<size_t>(y) * width + x] = sx;
            gy[static_cast<size_t>(y) * width + x] = sy;
        }
    }
}

EdgeDirection ClassifyDirection(double gx, double gy) {
    double angle = std::atan2(gy, gx) * RAD_TO_DEG;
    if (angle < 0.0) {
        angle += 180.0;
    }
    if (angle >= 180.0) {
        angle -= 180.0;
    }

    if (angle < 22.5 || angle >= 157.5) {
        return EdgeDirection::Horizontal;
    }
    if (angle < 67.5) {
        return EdgeDirection::Diagonal;
    }
    if (angle < 112.5) {
        return EdgeDirection::Vertical;
    }
    return EdgeDirection::AntiDiagonal;
}

} // namespace Vis::Match::Internal
