#pragma once

/**
 * @file KeyValueStore.h
 * @brief String-valued persistent storage used by the feature cache
 */

#include <VisMatch/Core/Export.h>

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace Vis::Match::Feature {

/**
 * @brief Keyed string storage
 *
 * Values are opaque byte strings. Implementations report rejected writes by
 * throwing CacheWriteException.
 */
class VISMATCH_API KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    /// Value stored under key, or nullopt if absent
    virtual std::optional<std::string> Read(const std::string& key) = 0;

    /**
     * @brief Store value under key, replacing any previous value
     * @throws CacheWriteException if the value cannot be stored
     */
    virtual void Write(const std::string& key, const std::string& value) = 0;

    /// Remove key (no-op if absent)
    virtual void Delete(const std::string& key) = 0;
};

/**
 * @brief In-process store with an optional byte quota
 *
 * With a non-zero quota, a write that would bring the total size of all
 * stored values above the quota is rejected and leaves the store unchanged.
 */
class VISMATCH_API MemoryKeyValueStore : public KeyValueStore {
public:
    /// @param quotaBytes Maximum total value size (0 = unlimited)
    explicit MemoryKeyValueStore(size_t quotaBytes = 0);

    std::optional<std::string> Read(const std::string& key) override;
    void Write(const std::string& key, const std::string& value) override;
    void Delete(const std::string& key) override;

    /// Total size of stored values in bytes
    size_t UsedBytes() const;

private:
    size_t quotaBytes_;
    std::map<std::string, std::string> values_;
    mutable std::mutex mutex_;
};

/**
 * @brief Store keeping one file per key inside a directory
 *
 * Key characters outside [A-Za-z0-9._-] are replaced by '_' in file names.
 * The directory is created on first write.
 */
class VISMATCH_API FileKeyValueStore : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::string directory);

    std::optional<std::string> Read(const std::string& key) override;
    void Write(const std::string& key, const std::string& value) override;
    void Delete(const std::string& key) override;

    /// File that backs key
    std::string PathForKey(const std::string& key) const;

private:
    std::string directory_;
};

} // namespace Vis::Match::Feature
