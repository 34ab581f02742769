/**
 * @file test_batch_matcher.cpp
 * @brief Unit tests for Matching/BatchMatcher
 */

#include <gtest/gtest.h>
#include <VisMatch/Matching/BatchMatcher.h>
#include <VisMatch/Matching/SimilaritySearch.h>
#include <VisMatch/Core/Exception.h>

#include "test_images.h"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace Vis::Match;
using namespace Vis::Match::Matching;

namespace {

// Memory source that can stall one URL or fail another with a plain runtime_error
class StallingSource : public IO::MemoryImageSource {
public:
    Image Load(const std::string& url) override {
        if (url == stallUrl) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        if (url == resetUrl) {
            throw std::runtime_error("connection reset by peer");
        }
        return MemoryImageSource::Load(url);
    }

    std::string stallUrl;
    std::string resetUrl;
};

} // namespace

class BatchMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        source_ = std::make_shared<StallingSource>();
        const std::string tmp = Vis::Match::Test::TempDir() + "/batch_encode.png";
        source_->Register("blob:red", Vis::Match::Test::EncodePng(Vis::Match::Test::SolidRgb(48, 48, 255, 0, 0), tmp));
        source_->Register("blob:red2", Vis::Match::Test::EncodePng(Vis::Match::Test::SolidRgb(48, 48, 255, 0, 0), tmp));
        source_->Register("blob:blue", Vis::Match::Test::EncodePng(Vis::Match::Test::SolidRgb(48, 48, 0, 0, 255), tmp));
        source_->Register("blob:ramp", Vis::Match::Test::EncodePng(Vis::Match::Test::ColorRamp(64, 64), tmp));
        source_->Register("blob:broken", "not an image");

        store_ = std::make_shared<Feature::MemoryKeyValueStore>();
        cache_ = std::make_shared<Feature::FeatureCache>(store_);
    }

    std::shared_ptr<StallingSource> source_;
    std::shared_ptr<Feature::MemoryKeyValueStore> store_;
    std::shared_ptr<Feature::FeatureCache> cache_;
};

// ============================================================================
// Results
// ============================================================================

TEST_F(BatchMatcherTest, EmptyCandidateList) {
    BatchMatcher matcher(source_, cache_);
    int calls = 0;
    auto results = matcher.Match(CandidateImage{"q", "blob:red"}, {}, BatchMatchParams::Default(),
                                 [&](size_t, size_t) { ++calls; });
    EXPECT_TRUE(results.empty());
    EXPECT_EQ(calls, 0);
}

TEST_F(BatchMatcherTest, IdenticalCandidateScoresOne) {
    BatchMatcher matcher(source_, cache_);
    auto results = matcher.Match(CandidateImage{"q", "blob:red"}, {{"c", "blob:red2"}});

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].id, "c");
    EXPECT_EQ(results[0].imageUrl, "blob:red2");
    EXPECT_NEAR(results[0].similarity, 1.0, 1e-9);
}

TEST_F(BatchMatcherTest, RedQueryKeepsOnlyRedAtHalfThreshold) {
    BatchMatcher matcher(source_, cache_);
    auto results = matcher.Match(CandidateImage{"q", "blob:red"},
                                 {{"blue", "blob:blue"}, {"red", "blob:red2"}});

    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].id, "blue");
    EXPECT_LT(results[0].similarity, 0.5);
    EXPECT_GT(results[1].similarity, 0.9);

    auto ranked = FilterAndRank(results, 0.5);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0].id, "red");
}

TEST_F(BatchMatcherTest, ResultsKeepCandidateOrder) {
    BatchMatcher matcher(source_, cache_);
    std::vector<CandidateImage> candidates = {
        {"a", "blob:ramp"}, {"b", "blob:blue"}, {"c", "blob:red2"}};
    auto results = matcher.Match(CandidateImage{"q", "blob:red"}, candidates);

    ASSERT_EQ(results.size(), 3u);
    for (size_t i = 0; i < candidates.size(); ++i) {
        EXPECT_EQ(results[i].id, candidates[i].id);
    }
}

TEST_F(BatchMatcherTest, DecodedQueryOverload) {
    BatchMatcher matcher(source_, cache_);
    auto results = matcher.Match(Vis::Match::Test::SolidRgb(48, 48, 255, 0, 0), {{"c", "blob:red2"}});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NEAR(results[0].similarity, 1.0, 1e-9);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(BatchMatcherTest, FailedCandidateScoresZeroAndBatchContinues) {
    BatchMatcher matcher(source_, cache_);
    auto results = matcher.Match(CandidateImage{"q", "blob:red"},
                                 {{"bad", "blob:broken"}, {"missing", "blob:nothing"},
                                  {"red", "blob:red2"}});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].similarity, 0.0);
    EXPECT_EQ(results[1].similarity, 0.0);
    EXPECT_NEAR(results[2].similarity, 1.0, 1e-9);
}

TEST_F(BatchMatcherTest, NonLibraryExceptionScoresZeroAndBatchContinues) {
    source_->resetUrl = "http://cdn.example.com/reset.png";
    BatchMatcher matcher(source_, cache_);
    auto results = matcher.Match(CandidateImage{"q", "blob:red"},
                                 {{"red", "blob:red"}, {"reset", source_->resetUrl},
                                  {"red2", "blob:red2"}});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_NEAR(results[0].similarity, 1.0, 1e-9);
    EXPECT_EQ(results[1].id, "reset");
    EXPECT_EQ(results[1].similarity, 0.0);
    EXPECT_NEAR(results[2].similarity, 1.0, 1e-9);
}

TEST_F(BatchMatcherTest, SlowCandidateTimesOutToZero) {
    source_->stallUrl = "blob:blue";
    BatchMatchParams params;
    params.decodeTimeoutMs = 100;

    BatchMatcher matcher(source_, cache_);
    auto results = matcher.Match(CandidateImage{"q", "blob:red"},
                                 {{"red", "blob:red2"}, {"slow", "blob:blue"}}, params);

    ASSERT_EQ(results.size(), 2u);
    EXPECT_NEAR(results[0].similarity, 1.0, 1e-9);
    EXPECT_EQ(results[1].similarity, 0.0);
    EXPECT_FALSE(cache_->Get("slow").has_value());
}

TEST_F(BatchMatcherTest, QueryFailureAborts) {
    BatchMatcher matcher(source_, cache_);
    EXPECT_THROW(matcher.Match(CandidateImage{"q", "blob:broken"}, {{"red", "blob:red2"}}),
                 DecodeException);
}

TEST_F(BatchMatcherTest, InvalidParamsThrow) {
    BatchMatcher matcher(source_, cache_);
    BatchMatchParams params;
    params.decodeTimeoutMs = 0;
    EXPECT_THROW(matcher.Match(CandidateImage{"q", "blob:red"}, {}, params),
                 InvalidArgumentException);
    EXPECT_THROW(BatchMatcher(nullptr), InvalidArgumentException);
}

// ============================================================================
// Progress and cancellation
// ============================================================================

TEST_F(BatchMatcherTest, ProgressIsMonotonic) {
    BatchMatcher matcher(source_, cache_);
    std::vector<std::pair<size_t, size_t>> calls;
    matcher.Match(CandidateImage{"q", "blob:red"},
                  {{"a", "blob:blue"}, {"b", "blob:broken"}, {"c", "blob:red2"}},
                  BatchMatchParams::Default(),
                  [&](size_t current, size_t total) { calls.emplace_back(current, total); });

    ASSERT_EQ(calls.size(), 3u);
    for (size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i].first, i + 1);
        EXPECT_EQ(calls[i].second, 3u);
    }
}

TEST_F(BatchMatcherTest, CancelledBeforeStart) {
    BatchMatcher matcher(source_, cache_);
    Platform::CancellationToken token;
    token.Cancel();
    EXPECT_THROW(matcher.Match(CandidateImage{"q", "blob:red"}, {{"a", "blob:blue"}},
                               BatchMatchParams::Default(), nullptr, &token),
                 CancelledException);
}

TEST_F(BatchMatcherTest, CancelledBetweenCandidates) {
    BatchMatcher matcher(source_, cache_);
    Platform::CancellationToken token;
    size_t progressed = 0;
    EXPECT_THROW(matcher.Match(CandidateImage{"q", "blob:red"},
                               {{"a", "blob:blue"}, {"b", "blob:red2"}, {"c", "blob:ramp"}},
                               BatchMatchParams::Default(),
                               [&](size_t current, size_t) {
                                   progressed = current;
                                   token.Cancel();
                               },
                               &token),
                 CancelledException);
    EXPECT_EQ(progressed, 1u);
}

// ============================================================================
// Caching
// ============================================================================

TEST_F(BatchMatcherTest, FeaturesAreCachedById) {
    BatchMatcher matcher(source_, cache_);
    matcher.Match(CandidateImage{"q", "blob:red"}, {{"c", "blob:red2"}});

    EXPECT_TRUE(cache_->Get("q").has_value());
    EXPECT_TRUE(cache_->Get("c").has_value());

    // Second run is served from the cache even if the images disappear
    source_->Unregister("blob:red2");
    source_->Unregister("blob:red");
    auto results = matcher.Match(CandidateImage{"q", "blob:red"}, {{"c", "blob:red2"}});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NEAR(results[0].similarity, 1.0, 1e-9);
}

TEST_F(BatchMatcherTest, EmptyIdFallsBackToUrlKey) {
    BatchMatcher matcher(source_, cache_);
    matcher.Match(CandidateImage{"q", "blob:red"}, {{"", "blob:ramp"}});
    EXPECT_TRUE(cache_->Get("blob:ramp").has_value());
}

TEST_F(BatchMatcherTest, CacheCanBeBypassed) {
    BatchMatcher matcher(source_, cache_);
    BatchMatchParams params;
    params.useCache = false;
    matcher.Match(CandidateImage{"q", "blob:red"}, {{"c", "blob:blue"}}, params);
    EXPECT_EQ(cache_->Stats().count, 0u);
}

TEST_F(BatchMatcherTest, DecodedQueryIsNotCached) {
    BatchMatcher matcher(source_, cache_);
    matcher.Match(Vis::Match::Test::SolidRgb(8, 8, 1, 2, 3), {{"c", "blob:blue"}});
    EXPECT_EQ(cache_->Stats().count, 1u);
}

TEST_F(BatchMatcherTest, WorksWithoutCache) {
    BatchMatcher matcher(source_);
    auto results = matcher.Match(CandidateImage{"q", "blob:red"}, {{"c", "blob:red2"}});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_NEAR(results[0].similarity, 1.0, 1e-9);
}
