#pragma once

/**
 * @file ImageSource.h
 * @brief Resolving image URLs to decoded images
 *
 * Candidates and queries are referenced by URL. An ImageSource turns a URL
 * into a decoded Image; LoadImage() bounds how long the caller waits for it.
 *
 * @code
 * auto source = std::make_shared<IO::FileImageSource>();
 * Image img = IO::LoadImage(source, "file:///data/query.png", 5000);
 * @endcode
 */

#include <VisMatch/Core/Export.h>
#include <VisMatch/Core/Image.h>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace Vis::Match::IO {

/// Default decode timeout in milliseconds
constexpr int64_t DEFAULT_DECODE_TIMEOUT_MS = 5000;

/**
 * @brief Source of decoded images
 *
 * Load() may be called from a thread pool worker. Implementations report
 * unknown URLs and undecodable data with DecodeException.
 */
class VISMATCH_API ImageSource {
public:
    virtual ~ImageSource() = default;

    /**
     * @brief Decode the image behind url
     * @throws DecodeException if the URL cannot be resolved or decoded
     */
    virtual Image Load(const std::string& url) = 0;
};

/**
 * @brief Images on the local file system
 *
 * Accepts plain paths and file:// URLs. Relative paths are resolved against
 * the base directory when one is given. Any other scheme is rejected.
 */
class VISMATCH_API FileImageSource : public ImageSource {
public:
    explicit FileImageSource(std::string baseDirectory = "");

    Image Load(const std::string& url) override;

    /// File path that url refers to
    std::string ResolvePath(const std::string& url) const;

private:
    std::string baseDirectory_;
};

/**
 * @brief Encoded images registered in memory under arbitrary URLs
 *
 * Stands in for uploaded files (blob: URLs) and for tests.
 */
class VISMATCH_API MemoryImageSource : public ImageSource {
public:
    MemoryImageSource() = default;

    /// Register encoded bytes (PNG, JPEG, ...) under url, replacing any previous entry
    void Register(const std::string& url, std::string encoded);

    /// Remove url
    void Unregister(const std::string& url);

    bool Contains(const std::string& url) const;

    Image Load(const std::string& url) override;

private:
    std::map<std::string, std::string> images_;
    mutable std::mutex mutex_;
};

/**
 * @brief Load an image on the thread pool and wait at most timeoutMs
 *
 * On timeout the load keeps running in the background and its result is
 * discarded.
 *
 * @throws InvalidArgumentException if source is null or timeoutMs <= 0
 * @throws TimeoutException if the load does not finish in time
 * @throws DecodeException (or any other error) raised by the source
 */
VISMATCH_API Image LoadImage(const std::shared_ptr<ImageSource>& source,
                             const std::string& url,
                             int64_t timeoutMs = DEFAULT_DECODE_TIMEOUT_MS);

} // namespace Vis::Match::IO
