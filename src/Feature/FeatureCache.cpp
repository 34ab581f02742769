/**
 * @file FeatureCache.cpp
 * @brief Feature cache persistence, expiry and eviction
 */

#include <VisMatch/Feature/FeatureCache.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Core/Validate.h>
#include <VisMatch/Platform/FileIO.h>
#include <VisMatch/Platform/Logging.h>

#include <algorithm>
#include <cstring>
#include <utility>

namespace Vis::Match::Feature {

namespace {

constexpr char CACHE_MAGIC[4] = {'V', 'M', 'F', 'C'};

std::string SerializeEntries(const std::vector<CacheEntry>& entries) {
    Platform::ByteWriter writer;
    writer.WriteBytes(CACHE_MAGIC, sizeof(CACHE_MAGIC));
    writer.Write<uint32_t>(FEATURE_CACHE_VERSION);
    writer.Write<uint64_t>(entries.size());
    for (const auto& entry : entries) {
        writer.WriteString(entry.id);
        writer.WriteString(entry.sourceUrl);
        writer.Write<int64_t>(entry.createdAt);
        writer.WriteVector(entry.vector);
    }
    return writer.Release();
}

std::vector<CacheEntry> DeserializeEntries(const std::string& blob) {
    Platform::ByteReader reader(blob);

    char magic[4];
    reader.ReadBytes(magic, sizeof(magic));
    if (std::memcmp(magic, CACHE_MAGIC, sizeof(magic)) != 0) {
        throw IOException("not a feature cache blob");
    }

    uint32_t version = reader.Read<uint32_t>();
    if (version != FEATURE_CACHE_VERSION) {
        throw VersionMismatchException("feature cache version " + std::to_string(version) +
                                       ", expected " + std::to_string(FEATURE_CACHE_VERSION));
    }

    uint64_t count = reader.Read<uint64_t>();
    std::vector<CacheEntry> entries;
    for (uint64_t i = 0; i < count; ++i) {
        CacheEntry entry;
        entry.id = reader.ReadString();
        entry.sourceUrl = reader.ReadString();
        entry.createdAt = reader.Read<int64_t>();
        entry.vector = reader.ReadVector<double>();
        entries.push_back(std::move(entry));
    }

    if (!reader.AtEnd()) {
        throw IOException("trailing bytes after feature cache entries");
    }
    return entries;
}

} // anonymous namespace

FeatureCache::FeatureCache(std::shared_ptr<KeyValueStore> store,
                           FeatureCacheParams params,
                           std::shared_ptr<Platform::Clock> clock)
    : store_(std::move(store))
    , params_(std::move(params))
    , clock_(std::move(clock))
{
    if (!store_) {
        throw InvalidArgumentException("FeatureCache: store is null");
    }
    if (!clock_) {
        throw InvalidArgumentException("FeatureCache: clock is null");
    }
    Validate::RequirePositive(params_.capacity, "capacity", "FeatureCache");
    Validate::RequirePositive(params_.maxAgeMs, "maxAgeMs", "FeatureCache");
}

std::vector<CacheEntry> FeatureCache::LoadLive() {
    std::vector<CacheEntry> entries;
    try {
        auto blob = store_->Read(params_.storageKey);
        if (!blob) {
            return entries;
        }
        entries = DeserializeEntries(*blob);
    } catch (const Exception& e) {
        Platform::Logger()->warn("feature cache '{}' unreadable, treating as empty: {}",
                                 params_.storageKey, e.what());
        return {};
    }

    int64_t now = clock_->NowMs();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const CacheEntry& entry) {
                                     return now - entry.createdAt >= params_.maxAgeMs;
                                 }),
                  entries.end());
    return entries;
}

void FeatureCache::Save(const std::vector<CacheEntry>& entries) {
    try {
        store_->Write(params_.storageKey, SerializeEntries(entries));
    } catch (const Exception& e) {
        Platform::Logger()->error("feature cache write failed, disabling cache: {}", e.what());
        enabled_ = false;
        try {
            store_->Delete(params_.storageKey);
        } catch (const Exception& cleanup) {
            Platform::Logger()->error("feature cache cleanup failed: {}", cleanup.what());
        }
    }
}

std::optional<FeatureVector> FeatureCache::Get(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) {
        return std::nullopt;
    }

    auto entries = LoadLive();
    for (auto& entry : entries) {
        if (entry.id == id) {
            Platform::Logger()->debug("feature cache hit: {}", id);
            return std::move(entry.vector);
        }
    }
    Platform::Logger()->debug("feature cache miss: {}", id);
    return std::nullopt;
}

void FeatureCache::Put(const std::string& id, const std::string& sourceUrl,
                       const FeatureVector& vector) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!enabled_) {
        return;
    }

    auto entries = LoadLive();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const CacheEntry& entry) { return entry.id == id; }),
                  entries.end());

    CacheEntry entry;
    entry.id = id;
    entry.sourceUrl = sourceUrl;
    entry.vector = vector;
    entry.createdAt = clock_->NowMs();
    entries.insert(entries.begin(), std::move(entry));

    // Newest first; equal timestamps keep the later insertion ahead
    std::stable_sort(entries.begin(), entries.end(),
                     [](const CacheEntry& a, const CacheEntry& b) {
                         return a.createdAt > b.createdAt;
                     });
    if (entries.size() > static_cast<size_t>(params_.capacity)) {
        entries.resize(static_cast<size_t>(params_.capacity));
    }

    Save(entries);
}

void FeatureCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        store_->Delete(params_.storageKey);
        Platform::Logger()->info("feature cache '{}' cleared", params_.storageKey);
    } catch (const Exception& e) {
        Platform::Logger()->error("feature cache clear failed: {}", e.what());
    }
}

CacheStats FeatureCache::Stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    if (!enabled_) {
        return stats;
    }

    auto entries = LoadLive();
    stats.count = entries.size();
    if (entries.empty()) {
        return stats;
    }

    stats.sizeBytes = SerializeEntries(entries).size();
    for (const auto& entry : entries) {
        if (!stats.oldestMs || entry.createdAt < *stats.oldestMs) {
            stats.oldestMs = entry.createdAt;
        }
        if (!stats.newestMs || entry.createdAt > *stats.newestMs) {
            stats.newestMs = entry.createdAt;
        }
    }
    return stats;
}

bool FeatureCache::IsEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return enabled_;
}

} // namespace Vis::Match::Feature
