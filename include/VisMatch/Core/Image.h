#pragma once

/**
 * @file Image.h
 * @brief Shallow-copy image buffer with aligned rows
 */

#include <VisMatch/Core/Types.h>
#include <VisMatch/Core/Constants.h>
#include <VisMatch/Core/Export.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace Vis::Match {

/**
 * @brief Image class
 *
 * Key features:
 * - Multiple pixel types (UInt8, UInt16, Float32)
 * - 64-byte row alignment for SIMD
 * - Shallow copy by default, Clone() for deep copy
 * - Decoding through stb_image (PNG, JPEG, BMP, GIF, TGA, PNM)
 */
class VISMATCH_API Image {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Default constructor (empty image)
    Image();

    /// Create image with specified dimensions and type
    Image(int32_t width, int32_t height,
          PixelType type = PixelType::UInt8,
          ChannelType channels = ChannelType::Gray);

    /// Copy constructor (shallow copy)
    Image(const Image& other);

    /// Move constructor
    Image(Image&& other) noexcept;

    /// Destructor
    ~Image();

    /// Copy assignment (shallow copy)
    Image& operator=(const Image& other);

    /// Move assignment
    Image& operator=(Image&& other) noexcept;

    // =========================================================================
    // Factory Methods
    // =========================================================================

    /**
     * @brief Load image from file
     * @throws DecodeException if the file is missing or not a decodable image
     */
    static Image FromFile(const std::string& path);

    /**
     * @brief Decode image from encoded bytes held in memory
     *
     * @param data Encoded file contents (PNG, JPEG, ...)
     * @param size Number of bytes
     * @throws DecodeException if the bytes cannot be decoded
     */
    static Image FromMemory(const void* data, size_t size);

    /// Create from raw data (copies data)
    static Image FromData(const void* data, int32_t width, int32_t height,
                          PixelType type = PixelType::UInt8,
                          ChannelType channels = ChannelType::Gray);

    // =========================================================================
    // Basic Properties
    // =========================================================================

    /// Image width in pixels
    int32_t Width() const;

    /// Image height in pixels
    int32_t Height() const;

    /// Number of channels
    int Channels() const;

    /// Pixel type
    PixelType Type() const;

    /// Channel type
    ChannelType GetChannelType() const;

    /// Row stride in bytes (includes alignment padding)
    size_t Stride() const;

    /// Check if image is empty
    bool Empty() const;

    /// Check if image is valid (allocated)
    bool IsValid() const;

    // =========================================================================
    // Data Access
    // =========================================================================

    /// Get pointer to raw data
    void* Data();
    const void* Data() const;

    /// Get pointer to specific row
    void* RowPtr(int32_t row);
    const void* RowPtr(int32_t row) const;

    /// Get pixel value at (x, y) - for single channel UInt8
    uint8_t At(int32_t x, int32_t y) const;

    /// Set pixel value at (x, y) - for single channel UInt8
    void SetAt(int32_t x, int32_t y, uint8_t value);

    // =========================================================================
    // Image Operations
    // =========================================================================

    /// Deep copy
    Image Clone() const;

    /// Save image to file (UInt8 only; format from extension, PNG default)
    bool SaveToFile(const std::string& path) const;

private:
    class Impl;
    std::shared_ptr<Impl> impl_;
};

} // namespace Vis::Match
