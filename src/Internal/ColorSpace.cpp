/**
 * @file ColorSpace.cpp
 * @brief Color space conversion implementation
 */

#include <VisMatch/Internal/ColorSpace.h>

#include <algorithm>
#include <cmath>

namespace Vis::Match::Internal {

Hsv RgbToHsv(uint8_t r, uint8_t g, uint8_t b) {
    double rd = r / 255.0;
    double gd = g / 255.0;
    double bd = b / 255.0;

    double maxVal = std::max({rd, gd, bd});
    double minVal = std::min({rd, gd, bd});
    double diff = maxVal - minVal;

    Hsv hsv;
    hsv.v = maxVal;
    hsv.s = (maxVal == 0) ? 0.0 : diff / maxVal;

    if (diff > 0) {
        if (maxVal == rd) {
            hsv.h = 60.0 * std::fmod((gd - bd) / diff + 6.0, 6.0);
        } else if (maxVal == gd) {
            hsv.h = 60.0 * ((bd - rd) / diff + 2.0);
        } else {
            hsv.h = 60.0 * ((rd - gd) / diff + 4.0);
        }
    }
    if (hsv.h >= 360.0) {
        hsv.h -= 360.0;
    }

    return hsv;
}

} // namespace Vis::Match::Internal
