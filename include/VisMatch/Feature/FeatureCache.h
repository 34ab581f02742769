#pragma once

/**
 * @file FeatureCache.h
 * @brief Persistent id -> feature vector cache with expiry and capacity bound
 *
 * The whole cache is kept as one blob under a single key of a KeyValueStore:
 *
 * | Field      | Type                              |
 * |------------|-----------------------------------|
 * | magic      | "VMFC"                            |
 * | version    | uint32 (FEATURE_CACHE_VERSION)    |
 * | count      | uint64                            |
 * | entries    | id, sourceUrl, createdAt, vector  |
 *
 * Lifecycle: a store without the key is an empty cache. Every load drops
 * entries older than maxAgeMs. Every save rewrites the blob with at most
 * capacity entries, newest first. Clear() deletes the blob.
 *
 * When the store rejects a write, the cache deletes its blob, logs the
 * failure and stays disabled for the lifetime of the object: Get() misses
 * and Put() does nothing.
 *
 * @code
 * auto store = std::make_shared<FileKeyValueStore>("/tmp/vismatch");
 * FeatureCache cache(store);
 * if (auto v = cache.Get("sku-001")) {
 *     ...
 * }
 * cache.Put("sku-001", "file:///data/sku-001.jpg", ExtractFeatures(img));
 * @endcode
 */

#include <VisMatch/Core/Constants.h>
#include <VisMatch/Core/Export.h>
#include <VisMatch/Feature/FeatureExtractor.h>
#include <VisMatch/Feature/KeyValueStore.h>
#include <VisMatch/Platform/Timer.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Vis::Match::Feature {

/// Serialization format version of the cache blob
constexpr uint32_t FEATURE_CACHE_VERSION = 1;

/**
 * @brief Cache parameters
 */
struct VISMATCH_API FeatureCacheParams {
    int32_t capacity = 100;                         ///< Entries kept after a write
    int64_t maxAgeMs = 7 * MS_PER_DAY;              ///< Freshness window
    std::string storageKey = "image_features_cache"; ///< Key of the blob in the store

    static FeatureCacheParams Default() { return FeatureCacheParams(); }
};

/**
 * @brief One cached extraction
 */
struct VISMATCH_API CacheEntry {
    std::string id;
    std::string sourceUrl;
    FeatureVector vector;
    int64_t createdAt = 0;      ///< Milliseconds since epoch
};

/**
 * @brief Snapshot of the live cache content
 */
struct VISMATCH_API CacheStats {
    size_t count = 0;                   ///< Live entries
    size_t sizeBytes = 0;               ///< Serialized size of the live entries
    std::optional<int64_t> oldestMs;    ///< createdAt of the oldest live entry
    std::optional<int64_t> newestMs;    ///< createdAt of the newest live entry
};

/**
 * @brief Feature cache over an injected store and clock
 *
 * All member functions are serialized by an internal mutex.
 */
class VISMATCH_API FeatureCache {
public:
    /**
     * @param store Backing store (must not be null)
     * @param params Capacity, freshness window and storage key
     * @param clock Wall clock used for createdAt and expiry
     * @throws InvalidArgumentException on null store/clock or non-positive limits
     */
    explicit FeatureCache(std::shared_ptr<KeyValueStore> store,
                          FeatureCacheParams params = FeatureCacheParams::Default(),
                          std::shared_ptr<Platform::Clock> clock = Platform::DefaultClock());

    FeatureCache(const FeatureCache&) = delete;
    FeatureCache& operator=(const FeatureCache&) = delete;

    /**
     * @brief Look up a live entry
     * @return Cached vector, or nullopt if absent, expired or cache disabled
     */
    std::optional<FeatureVector> Get(const std::string& id);

    /**
     * @brief Insert or replace the entry for id, stamped with the current time
     *
     * Never throws on storage failure; the cache disables itself instead.
     */
    void Put(const std::string& id, const std::string& sourceUrl, const FeatureVector& vector);

    /// Delete all entries
    void Clear();

    /// Statistics over live entries
    CacheStats Stats();

    /// False after a write failure
    bool IsEnabled() const;

    const FeatureCacheParams& Params() const { return params_; }

private:
    std::vector<CacheEntry> LoadLive();
    void Save(const std::vector<CacheEntry>& entries);

    std::shared_ptr<KeyValueStore> store_;
    FeatureCacheParams params_;
    std::shared_ptr<Platform::Clock> clock_;
    bool enabled_ = true;
    mutable std::mutex mutex_;
};

} // namespace Vis::Match::Feature
