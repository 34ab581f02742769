/**
 * @file ImageSource.cpp
 * @brief File and memory image sources, bounded image loading
 */

#include <VisMatch/IO/ImageSource.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Core/Validate.h>
#include <VisMatch/Platform/FileIO.h>
#include <VisMatch/Platform/Thread.h>

#include <chrono>
#include <future>
#include <utility>

namespace Vis::Match::IO {

namespace {

constexpr const char* FILE_SCHEME = "file://";

bool StartsWith(const std::string& s, const char* prefix) {
    return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

bool IsAbsolutePath(const std::string& path) {
    if (!path.empty() && (path[0] == '/' || path[0] == '\\')) {
        return true;
    }
    // Windows drive letter
    return path.size() >= 2 && path[1] == ':';
}

} // anonymous namespace

// ============================================================================
// FileImageSource
// ============================================================================

FileImageSource::FileImageSource(std::string baseDirectory)
    : baseDirectory_(std::move(baseDirectory)) {}

std::string FileImageSource::ResolvePath(const std::string& url) const {
    std::string path;
    if (StartsWith(url, FILE_SCHEME)) {
        path = url.substr(std::char_traits<char>::length(FILE_SCHEME));
    } else if (url.find("://") != std::string::npos || StartsWith(url, "blob:") ||
               StartsWith(url, "data:")) {
        throw DecodeException("unsupported URL scheme: " + url);
    } else {
        path = url;
    }

    if (path.empty()) {
        throw DecodeException("empty image path");
    }
    if (!baseDirectory_.empty() && !IsAbsolutePath(path)) {
        path = Platform::JoinPath(baseDirectory_, path);
    }
    return path;
}

Image FileImageSource::Load(const std::string& url) {
    return Image::FromFile(ResolvePath(url));
}

// ============================================================================
// MemoryImageSource
// ============================================================================

void MemoryImageSource::Register(const std::string& url, std::string encoded) {
    std::lock_guard<std::mutex> lock(mutex_);
    images_[url] = std::move(encoded);
}

void MemoryImageSource::Unregister(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    images_.erase(url);
}

bool MemoryImageSource::Contains(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return images_.count(url) > 0;
}

Image MemoryImageSource::Load(const std::string& url) {
    std::string encoded;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = images_.find(url);
        if (it == images_.end()) {
            throw DecodeException("no image registered for " + url);
        }
        encoded = it->second;
    }
    return Image::FromMemory(encoded.data(), encoded.size());
}

// ============================================================================
// Bounded loading
// ============================================================================

Image LoadImage(const std::shared_ptr<ImageSource>& source,
                const std::string& url,
                int64_t timeoutMs) {
    if (!source) {
        throw InvalidArgumentException("LoadImage: source is null");
    }
    Validate::RequirePositive(timeoutMs, "timeoutMs", "LoadImage");

    // The task owns copies so it may outlive this call after a timeout
    std::shared_ptr<ImageSource> owner = source;
    auto future = Platform::ThreadPool::Instance().Submit(
        [owner, url]() { return owner->Load(url); });

    if (future.wait_for(std::chrono::milliseconds(timeoutMs)) != std::future_status::ready) {
        throw TimeoutException("loading " + url + " exceeded " +
                               std::to_string(timeoutMs) + " ms");
    }
    return future.get();
}

} // namespace Vis::Match::IO
