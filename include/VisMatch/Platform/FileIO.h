#pragma once

#include <VisMatch/Core/Export.h>
#include <VisMatch/Core/Exception.h>

/**
 * @file FileIO.h
 * @brief Cross-platform file I/O and byte serialization utilities
 *
 * Provides:
 * - Binary file read/write
 * - Path utilities
 * - File/directory existence checks
 * - In-memory binary writer/reader for persisted blobs
 *
 * Note: Image decoding is handled by Image using stb_image.
 */

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string>
#include <vector>

namespace Vis::Match::Platform {

// ============================================================================
// Path Utilities
// ============================================================================

/**
 * @brief Check if file exists
 */
VISMATCH_API bool FileExists(const std::string& path);

/**
 * @brief Join path components
 */
VISMATCH_API std::string JoinPath(const std::string& dir, const std::string& name);

/**
 * @brief Create directory (and parents if needed)
 * @return true if created or already exists
 */
VISMATCH_API bool CreateDirectory(const std::string& path);

/**
 * @brief Delete file
 * @return true if deleted or didn't exist
 */
VISMATCH_API bool DeleteFile(const std::string& path);

// ============================================================================
// Binary File I/O
// ============================================================================

/**
 * @brief Read entire file into a byte string
 * @param path File path
 * @param data Output string (will be resized)
 * @return true on success
 */
VISMATCH_API bool ReadBinaryFile(const std::string& path, std::string& data);

/**
 * @brief Write raw bytes to file (truncates existing content)
 * @param path File path
 * @param data Pointer to data
 * @param size Size in bytes
 * @return true on success
 */
VISMATCH_API bool WriteBinaryFile(const std::string& path, const void* data, size_t size);

// ============================================================================
// Serialization Helpers
// ============================================================================

/**
 * @brief Binary writer appending to an in-memory byte string
 *
 * Layout is host byte order; vectors and strings are prefixed with a
 * uint64 element count.
 */
class VISMATCH_API ByteWriter {
public:
    ByteWriter() = default;

    /// Write primitive type
    template<typename T>
    void Write(T value);

    /// Write vector (count then elements)
    template<typename T>
    void WriteVector(const std::vector<T>& vec);

    /// Write string (length-prefixed)
    void WriteString(const std::string& str);

    /// Write raw bytes
    void WriteBytes(const void* data, size_t size);

    /// Accumulated bytes
    const std::string& Buffer() const { return buffer_; }

    /// Move accumulated bytes out
    std::string Release() { return std::move(buffer_); }

private:
    std::string buffer_;
};

/**
 * @brief Binary reader over a byte string produced by ByteWriter
 *
 * Every read is bounds-checked; reading past the end throws IOException.
 */
class VISMATCH_API ByteReader {
public:
    /**
     * @brief Construct reader (the buffer must outlive the reader)
     */
    explicit ByteReader(const std::string& buffer) : buffer_(buffer) {}

    /// Read primitive type
    template<typename T>
    T Read();

    /// Read vector (reads count then elements)
    template<typename T>
    std::vector<T> ReadVector();

    /// Read string (length-prefixed)
    std::string ReadString();

    /// Read raw bytes
    void ReadBytes(void* data, size_t size);

    /// Bytes not yet consumed
    size_t Remaining() const { return buffer_.size() - pos_; }

    /// Check if all bytes were consumed
    bool AtEnd() const { return pos_ >= buffer_.size(); }

private:
    void Require(size_t size) const;

    const std::string& buffer_;
    size_t pos_ = 0;
};

// ============================================================================
// Template Implementations
// ============================================================================

template<typename T>
void ByteWriter::Write(T value) {
    WriteBytes(&value, sizeof(T));
}

template<typename T>
void ByteWriter::WriteVector(const std::vector<T>& vec) {
    uint64_t size = vec.size();
    Write(size);
    if (!vec.empty()) {
        WriteBytes(vec.data(), vec.size() * sizeof(T));
    }
}

template<typename T>
T ByteReader::Read() {
    T value{};
    ReadBytes(&value, sizeof(T));
    return value;
}

template<typename T>
std::vector<T> ByteReader::ReadVector() {
    uint64_t size = Read<uint64_t>();
    // Reject counts the remaining bytes cannot hold before allocating
    if (size > Remaining() / sizeof(T)) {
        throw IOException("vector length " + std::to_string(size) + " exceeds data");
    }
    std::vector<T> vec(static_cast<size_t>(size));
    if (size > 0) {
        ReadBytes(vec.data(), static_cast<size_t>(size) * sizeof(T));
    }
    return vec;
}

} // namespace Vis::Match::Platform
