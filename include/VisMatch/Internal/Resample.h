#pragma once

/**
 * @file Resample.h
 * @brief Fixed-size RGB resampling
 */

#include <VisMatch/Core/Image.h>

#include <cstdint>

namespace Vis::Match::Internal {

/**
 * @brief Resample an 8-bit image to RGB at a fixed size
 *
 * Bilinear interpolation with pixel-center alignment and replicated borders.
 * Gray input is expanded to three equal channels, BGR/BGRA are reordered and
 * alpha is dropped. Output samples are rounded to the nearest integer.
 *
 * @param src Input image (UInt8, any channel layout)
 * @param dstWidth Output width (> 0)
 * @param dstHeight Output height (> 0)
 * @return RGB UInt8 image of dstWidth x dstHeight
 * @throws InvalidArgumentException on empty input or non-positive size
 * @throws UnsupportedException if src is not UInt8
 */
Image ResampleRgb(const Image& src, int32_t dstWidth, int32_t dstHeight);

} // namespace Vis::Match::Internal
