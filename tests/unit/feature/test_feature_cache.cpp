/**
 * @file test_feature_cache.cpp
 * @brief Unit tests for Feature/FeatureCache
 */

#include <gtest/gtest.h>
#include <VisMatch/Feature/FeatureCache.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Platform/FileIO.h>

#include <memory>
#include <string>

using namespace Vis::Match;
using namespace Vis::Match::Feature;

namespace {

class ManualClock : public Platform::Clock {
public:
    explicit ManualClock(int64_t start) : now_(start) {}
    int64_t NowMs() const override { return now_; }
    void Advance(int64_t ms) { now_ += ms; }

private:
    int64_t now_;
};

// Store whose writes can be made to fail
class FailingStore : public MemoryKeyValueStore {
public:
    void Write(const std::string& key, const std::string& value) override {
        if (failWrites) {
            throw CacheWriteException("disk full");
        }
        MemoryKeyValueStore::Write(key, value);
    }

    bool failWrites = false;
};

FeatureVector MakeVector(double seed) {
    FeatureVector v(FEATURE_DIMENSION);
    for (size_t i = 0; i < v.size(); ++i) {
        v[i] = seed + static_cast<double>(i) * 1e-3;
    }
    return v;
}

constexpr int64_t START_MS = 1'700'000'000'000LL;

} // namespace

class FeatureCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_shared<MemoryKeyValueStore>();
        clock_ = std::make_shared<ManualClock>(START_MS);
    }

    std::unique_ptr<FeatureCache> MakeCache(FeatureCacheParams params = FeatureCacheParams::Default()) {
        return std::make_unique<FeatureCache>(store_, params, clock_);
    }

    std::shared_ptr<MemoryKeyValueStore> store_;
    std::shared_ptr<ManualClock> clock_;
};

// ============================================================================
// Basic operations
// ============================================================================

TEST_F(FeatureCacheTest, DefaultParams) {
    FeatureCacheParams params = FeatureCacheParams::Default();
    EXPECT_EQ(params.capacity, 100);
    EXPECT_EQ(params.maxAgeMs, 7 * MS_PER_DAY);
    EXPECT_EQ(params.storageKey, "image_features_cache");
}

TEST_F(FeatureCacheTest, EmptyStoreMisses) {
    auto cache = MakeCache();
    EXPECT_FALSE(cache->Get("a").has_value());
    EXPECT_EQ(cache->Stats().count, 0u);
}

TEST_F(FeatureCacheTest, PutThenGetReturnsSameVector) {
    auto cache = MakeCache();
    FeatureVector v = MakeVector(0.25);
    cache->Put("a", "file:///a.png", v);

    auto hit = cache->Get("a");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, v);
}

TEST_F(FeatureCacheTest, PutReplacesExistingId) {
    auto cache = MakeCache();
    cache->Put("a", "u1", MakeVector(0.1));
    cache->Put("a", "u2", MakeVector(0.2));

    EXPECT_EQ(*cache->Get("a"), MakeVector(0.2));
    EXPECT_EQ(cache->Stats().count, 1u);
}

TEST_F(FeatureCacheTest, PersistsThroughStore) {
    MakeCache()->Put("a", "u", MakeVector(0.5));

    // A new cache over the same store sees the entry
    auto reopened = MakeCache();
    ASSERT_TRUE(reopened->Get("a").has_value());
    EXPECT_EQ(*reopened->Get("a"), MakeVector(0.5));
}

TEST_F(FeatureCacheTest, ClearRemovesEverything) {
    auto cache = MakeCache();
    cache->Put("a", "u", MakeVector(0.1));
    cache->Put("b", "u", MakeVector(0.2));
    cache->Clear();

    EXPECT_FALSE(cache->Get("a").has_value());
    EXPECT_FALSE(store_->Read("image_features_cache").has_value());
    EXPECT_TRUE(cache->IsEnabled());
}

// ============================================================================
// Expiry and capacity
// ============================================================================

TEST_F(FeatureCacheTest, EntryExpiresAfterSevenDays) {
    auto cache = MakeCache();
    cache->Put("a", "u", MakeVector(0.3));

    clock_->Advance(7 * MS_PER_DAY - 1);
    EXPECT_TRUE(cache->Get("a").has_value());

    clock_->Advance(1);
    EXPECT_FALSE(cache->Get("a").has_value());
}

TEST_F(FeatureCacheTest, ExpiredEntriesArePrunedOnNextWrite) {
    auto cache = MakeCache();
    cache->Put("old", "u", MakeVector(0.1));
    clock_->Advance(8 * MS_PER_DAY);
    cache->Put("new", "u", MakeVector(0.2));

    CacheStats stats = cache->Stats();
    EXPECT_EQ(stats.count, 1u);
    ASSERT_TRUE(stats.oldestMs.has_value());
    EXPECT_EQ(*stats.oldestMs, START_MS + 8 * MS_PER_DAY);
}

TEST_F(FeatureCacheTest, CapacityKeepsNewestEntries) {
    FeatureCacheParams params;
    params.capacity = 3;
    auto cache = MakeCache(params);

    for (int i = 0; i < 5; ++i) {
        cache->Put("id" + std::to_string(i), "u", MakeVector(i));
        clock_->Advance(1000);
    }

    EXPECT_EQ(cache->Stats().count, 3u);
    EXPECT_FALSE(cache->Get("id0").has_value());
    EXPECT_FALSE(cache->Get("id1").has_value());
    EXPECT_TRUE(cache->Get("id2").has_value());
    EXPECT_TRUE(cache->Get("id4").has_value());
}

TEST_F(FeatureCacheTest, AccessDoesNotRefreshRecency) {
    FeatureCacheParams params;
    params.capacity = 2;
    auto cache = MakeCache(params);

    cache->Put("a", "u", MakeVector(0.1));
    clock_->Advance(10);
    cache->Put("b", "u", MakeVector(0.2));
    clock_->Advance(10);

    // Reading "a" does not protect it
    EXPECT_TRUE(cache->Get("a").has_value());
    cache->Put("c", "u", MakeVector(0.3));

    EXPECT_FALSE(cache->Get("a").has_value());
    EXPECT_TRUE(cache->Get("b").has_value());
    EXPECT_TRUE(cache->Get("c").has_value());
}

TEST_F(FeatureCacheTest, StatsReportsRange) {
    auto cache = MakeCache();
    cache->Put("a", "u", MakeVector(0.1));
    clock_->Advance(500);
    cache->Put("b", "u", MakeVector(0.2));

    CacheStats stats = cache->Stats();
    EXPECT_EQ(stats.count, 2u);
    EXPECT_GT(stats.sizeBytes, 2 * FEATURE_DIMENSION * sizeof(double));
    ASSERT_TRUE(stats.oldestMs.has_value());
    ASSERT_TRUE(stats.newestMs.has_value());
    EXPECT_EQ(*stats.oldestMs, START_MS);
    EXPECT_EQ(*stats.newestMs, START_MS + 500);
}

TEST_F(FeatureCacheTest, InvalidParamsThrow) {
    FeatureCacheParams params;
    params.capacity = 0;
    EXPECT_THROW(MakeCache(params), InvalidArgumentException);

    EXPECT_THROW(FeatureCache(nullptr), InvalidArgumentException);
}

// ============================================================================
// Failure handling
// ============================================================================

TEST_F(FeatureCacheTest, CorruptBlobIsTreatedAsEmpty) {
    store_->Write("image_features_cache", "garbage that is not a cache");
    auto cache = MakeCache();

    EXPECT_FALSE(cache->Get("a").has_value());
    cache->Put("a", "u", MakeVector(0.1));
    EXPECT_TRUE(cache->Get("a").has_value());
}

TEST_F(FeatureCacheTest, UnknownVersionIsTreatedAsEmpty) {
    Platform::ByteWriter writer;
    writer.WriteBytes("VMFC", 4);
    writer.Write<uint32_t>(FEATURE_CACHE_VERSION + 1);
    writer.Write<uint64_t>(0);
    store_->Write("image_features_cache", writer.Release());

    auto cache = MakeCache();
    EXPECT_EQ(cache->Stats().count, 0u);
}

TEST_F(FeatureCacheTest, WriteFailureDisablesCache) {
    auto failing = std::make_shared<FailingStore>();
    FeatureCache cache(failing, FeatureCacheParams::Default(), clock_);

    cache.Put("a", "u", MakeVector(0.1));
    ASSERT_TRUE(cache.Get("a").has_value());

    failing->failWrites = true;
    EXPECT_NO_THROW(cache.Put("b", "u", MakeVector(0.2)));
    EXPECT_FALSE(cache.IsEnabled());

    // The stored blob is gone and the cache stays off
    EXPECT_FALSE(failing->Read("image_features_cache").has_value());
    failing->failWrites = false;
    cache.Put("c", "u", MakeVector(0.3));
    EXPECT_FALSE(cache.Get("c").has_value());
    EXPECT_FALSE(failing->Read("image_features_cache").has_value());
}

TEST_F(FeatureCacheTest, QuotaExceededDisablesCache) {
    // One entry fits, two do not
    auto tiny = std::make_shared<MemoryKeyValueStore>(1500);
    FeatureCache cache(tiny, FeatureCacheParams::Default(), clock_);

    cache.Put("a", "u", MakeVector(0.1));
    EXPECT_TRUE(cache.IsEnabled());
    cache.Put("b", "u", MakeVector(0.2));
    EXPECT_FALSE(cache.IsEnabled());
    EXPECT_FALSE(cache.Get("a").has_value());
}
