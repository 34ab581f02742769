/**
 * @file KeyValueStore.cpp
 * @brief Memory and file key-value stores
 */

#include <VisMatch/Feature/KeyValueStore.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Platform/FileIO.h>

#include <cctype>
#include <utility>

namespace Vis::Match::Feature {

// ============================================================================
// MemoryKeyValueStore
// ============================================================================

MemoryKeyValueStore::MemoryKeyValueStore(size_t quotaBytes)
    : quotaBytes_(quotaBytes) {}

std::optional<std::string> MemoryKeyValueStore::Read(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryKeyValueStore::Write(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (quotaBytes_ > 0) {
        size_t used = 0;
        for (const auto& [k, v] : values_) {
            if (k != key) {
                used += v.size();
            }
        }
        if (used + value.size() > quotaBytes_) {
            throw CacheWriteException("quota of " + std::to_string(quotaBytes_) +
                                      " bytes exceeded writing '" + key + "' (" +
                                      std::to_string(value.size()) + " bytes)");
        }
    }

    values_[key] = value;
}

void MemoryKeyValueStore::Delete(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    values_.erase(key);
}

size_t MemoryKeyValueStore::UsedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t used = 0;
    for (const auto& entry : values_) {
        used += entry.second.size();
    }
    return used;
}

// ============================================================================
// FileKeyValueStore
// ============================================================================

FileKeyValueStore::FileKeyValueStore(std::string directory)
    : directory_(std::move(directory)) {}

std::string FileKeyValueStore::PathForKey(const std::string& key) const {
    std::string name;
    name.reserve(key.size() + 4);
    for (char c : key) {
        unsigned char uc = static_cast<unsigned char>(c);
        name += (std::isalnum(uc) || c == '.' || c == '_' || c == '-') ? c : '_';
    }
    return Platform::JoinPath(directory_, name + ".bin");
}

std::optional<std::string> FileKeyValueStore::Read(const std::string& key) {
    std::string path = PathForKey(key);
    if (!Platform::FileExists(path)) {
        return std::nullopt;
    }

    std::string data;
    if (!Platform::ReadBinaryFile(path, data)) {
        throw IOException("cannot read " + path);
    }
    return data;
}

void FileKeyValueStore::Write(const std::string& key, const std::string& value) {
    if (!Platform::CreateDirectory(directory_)) {
        throw CacheWriteException("cannot create directory " + directory_);
    }

    std::string path = PathForKey(key);
    if (!Platform::WriteBinaryFile(path, value.data(), value.size())) {
        throw CacheWriteException("cannot write " + path);
    }
}

void FileKeyValueStore::Delete(const std::string& key) {
    std::string path = PathForKey(key);
    if (!Platform::DeleteFile(path)) {
        throw IOException("cannot delete " + path);
    }
}

} // namespace Vis::Match::Feature
