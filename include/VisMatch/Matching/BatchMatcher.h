#pragma once

/**
 * @file BatchMatcher.h
 * @brief Score one query image against a list of candidate images
 *
 * Candidates are processed one at a time in list order. A candidate that
 * fails to load or extract scores 0 and the batch continues; a query that
 * fails aborts the batch. Progress is reported after every candidate.
 *
 * @code
 * auto source = std::make_shared<IO::FileImageSource>();
 * auto cache = std::make_shared<Feature::FeatureCache>(store);
 * BatchMatcher matcher(source, cache);
 *
 * auto results = matcher.Match({"q", "query.png"}, candidates, BatchMatchParams::Default(),
 *     [](size_t done, size_t total) { std::printf("%zu/%zu\n", done, total); });
 * @endcode
 */

#include <VisMatch/Core/Export.h>
#include <VisMatch/Core/Image.h>
#include <VisMatch/Feature/FeatureCache.h>
#include <VisMatch/Feature/FeatureExtractor.h>
#include <VisMatch/IO/ImageSource.h>
#include <VisMatch/Platform/Thread.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Vis::Match::Matching {

/**
 * @brief Score of one candidate
 */
struct VISMATCH_API SimilarityResult {
    std::string id;
    std::string imageUrl;
    double similarity = 0.0;    ///< [0, 1]
};

/**
 * @brief Image reference resolved through an ImageSource
 *
 * The id keys the feature cache; an empty id falls back to the URL.
 */
struct VISMATCH_API CandidateImage {
    std::string id;
    std::string imageUrl;
};

/**
 * @brief Batch parameters
 */
struct VISMATCH_API BatchMatchParams {
    int64_t decodeTimeoutMs = IO::DEFAULT_DECODE_TIMEOUT_MS; ///< Per-image load limit
    bool useCache = true;                                   ///< Read and write the feature cache

    static BatchMatchParams Default() { return BatchMatchParams(); }
};

/// Called after each candidate with (completed, total)
using ProgressCallback = std::function<void(size_t current, size_t total)>;

/**
 * @brief Sequential query-vs-candidates scorer
 */
class VISMATCH_API BatchMatcher {
public:
    /**
     * @param source Resolves candidate and query URLs (must not be null)
     * @param cache Optional feature cache
     * @throws InvalidArgumentException if source is null
     */
    explicit BatchMatcher(std::shared_ptr<IO::ImageSource> source,
                          std::shared_ptr<Feature::FeatureCache> cache = nullptr);

    /**
     * @brief Match a query referenced by URL
     *
     * The query's features come from the cache when available.
     *
     * @return One result per candidate, in candidate order
     * @throws DecodeException / TimeoutException if the query cannot be loaded
     * @throws CancelledException if token is cancelled between candidates
     * @throws InvalidArgumentException on invalid params
     */
    std::vector<SimilarityResult> Match(const CandidateImage& query,
                                        const std::vector<CandidateImage>& candidates,
                                        const BatchMatchParams& params = BatchMatchParams::Default(),
                                        const ProgressCallback& onProgress = nullptr,
                                        const Platform::CancellationToken* token = nullptr);

    /**
     * @brief Match an already decoded query (an upload); the query is not cached
     */
    std::vector<SimilarityResult> Match(const Image& query,
                                        const std::vector<CandidateImage>& candidates,
                                        const BatchMatchParams& params = BatchMatchParams::Default(),
                                        const ProgressCallback& onProgress = nullptr,
                                        const Platform::CancellationToken* token = nullptr);

    /**
     * @brief Features of one image, from the cache or by loading and extracting
     * @throws DecodeException / TimeoutException on load failure
     */
    Feature::FeatureVector Features(const CandidateImage& image,
                                    const BatchMatchParams& params = BatchMatchParams::Default());

    /**
     * @brief Features of an image the caller already decoded
     *
     * The cache is consulted and filled under the image's key; decoded is
     * only extracted on a miss.
     */
    Feature::FeatureVector Features(const CandidateImage& image, const Image& decoded,
                                    const BatchMatchParams& params = BatchMatchParams::Default());

    /**
     * @brief Match precomputed query features
     * @throws CancelledException if token is cancelled between candidates
     * @throws InvalidArgumentException on invalid params
     */
    std::vector<SimilarityResult> MatchFeatures(const Feature::FeatureVector& query,
                                                const std::vector<CandidateImage>& candidates,
                                                const BatchMatchParams& params = BatchMatchParams::Default(),
                                                const ProgressCallback& onProgress = nullptr,
                                                const Platform::CancellationToken* token = nullptr);

    const std::shared_ptr<IO::ImageSource>& Source() const { return source_; }
    const std::shared_ptr<Feature::FeatureCache>& Cache() const { return cache_; }

private:

    std::shared_ptr<IO::ImageSource> source_;
    std::shared_ptr<Feature::FeatureCache> cache_;
};

} // namespace Vis::Match::Matching
