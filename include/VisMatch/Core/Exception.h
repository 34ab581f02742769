#pragma once

#include <VisMatch/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for VisMatch
 */

#include <stdexcept>
#include <string>

namespace Vis::Match {

/**
 * @brief Base exception class for VisMatch
 */
class VISMATCH_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Invalid argument exception
 */
class VISMATCH_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief File I/O exception
 */
class VISMATCH_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

/**
 * @brief Unsupported operation or format
 */
class VISMATCH_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message) {}
};

/**
 * @brief Version mismatch for serialization
 */
class VISMATCH_API VersionMismatchException : public Exception {
public:
    explicit VersionMismatchException(const std::string& message)
        : Exception("Version mismatch: " + message) {}
};

/**
 * @brief Image could not be rasterized (bad bytes, missing file, unknown scheme)
 */
class VISMATCH_API DecodeException : public Exception {
public:
    explicit DecodeException(const std::string& message)
        : Exception("Decode error: " + message) {}
};

/**
 * @brief Image load did not finish within the allowed time
 */
class VISMATCH_API TimeoutException : public Exception {
public:
    explicit TimeoutException(const std::string& message)
        : Exception("Timeout: " + message) {}
};

/**
 * @brief Feature vectors of different length were compared
 */
class VISMATCH_API DimensionMismatchException : public Exception {
public:
    explicit DimensionMismatchException(const std::string& message)
        : Exception("Dimension mismatch: " + message) {}
};

/**
 * @brief Key-value store rejected a write (quota exceeded, disk error)
 */
class VISMATCH_API CacheWriteException : public Exception {
public:
    explicit CacheWriteException(const std::string& message)
        : Exception("Cache write failed: " + message) {}
};

/**
 * @brief Operation stopped through a CancellationToken
 */
class VISMATCH_API CancelledException : public Exception {
public:
    explicit CancelledException(const std::string& message)
        : Exception("Cancelled: " + message) {}
};

} // namespace Vis::Match
