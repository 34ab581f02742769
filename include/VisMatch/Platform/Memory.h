#pragma once

/**
 * @file Memory.h
 * @brief Aligned pixel buffers
 */

#include <VisMatch/Core/Constants.h>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace Vis::Match::Platform {

/**
 * @brief Round size up to a multiple of alignment (a power of two)
 */
inline size_t AlignedSize(size_t size, size_t alignment = MEMORY_ALIGNMENT) {
    return (size + alignment - 1) & ~(alignment - 1);
}

/**
 * @brief Allocate a zero-filled buffer aligned to MEMORY_ALIGNMENT
 *
 * The buffer is released when the last shared_ptr goes away, so image copies
 * can share it.
 *
 * @param size Size in bytes (0 yields an empty pointer)
 * @throws std::bad_alloc if the allocation fails
 */
std::shared_ptr<uint8_t> AllocatePixelBuffer(size_t size);

} // namespace Vis::Match::Platform
