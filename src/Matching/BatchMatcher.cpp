/**
 * @file BatchMatcher.cpp
 * @brief Sequential batch matching with per-candidate failure isolation
 */

#include <VisMatch/Matching/BatchMatcher.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Core/Validate.h>
#include <VisMatch/Matching/SimilarityScorer.h>
#include <VisMatch/Platform/Logging.h>
#include <VisMatch/Platform/Timer.h>

#include <exception>
#include <utility>

namespace Vis::Match::Matching {

namespace {

const std::string& CacheKey(const CandidateImage& image) {
    return image.id.empty() ? image.imageUrl : image.id;
}

void ValidateParams(const BatchMatchParams& params) {
    Validate::RequirePositive(params.decodeTimeoutMs, "decodeTimeoutMs", "BatchMatcher::Match");
}

} // anonymous namespace

BatchMatcher::BatchMatcher(std::shared_ptr<IO::ImageSource> source,
                           std::shared_ptr<Feature::FeatureCache> cache)
    : source_(std::move(source))
    , cache_(std::move(cache))
{
    if (!source_) {
        throw InvalidArgumentException("BatchMatcher: source is null");
    }
}

Feature::FeatureVector BatchMatcher::Features(const CandidateImage& image,
                                              const BatchMatchParams& params) {
    const std::string& key = CacheKey(image);
    bool cached = params.useCache && cache_ && !key.empty();

    if (cached) {
        if (auto hit = cache_->Get(key)) {
            return std::move(*hit);
        }
    }

    Platform::Timer timer(true);
    Image decoded = IO::LoadImage(source_, image.imageUrl, params.decodeTimeoutMs);
    double loadMs = timer.ElapsedMs();

    Feature::FeatureVector features = Feature::ExtractFeatures(decoded);
    Platform::Logger()->debug("features for '{}': load {:.1f} ms, extract {:.1f} ms",
                              key, loadMs, timer.ElapsedMs() - loadMs);

    if (cached) {
        cache_->Put(key, image.imageUrl, features);
    }
    return features;
}

Feature::FeatureVector BatchMatcher::Features(const CandidateImage& image,
                                              const Image& decoded,
                                              const BatchMatchParams& params) {
    const std::string& key = CacheKey(image);
    bool cached = params.useCache && cache_ && !key.empty();

    if (cached) {
        if (auto hit = cache_->Get(key)) {
            return std::move(*hit);
        }
    }

    Feature::FeatureVector features = Feature::ExtractFeatures(decoded);
    if (cached) {
        cache_->Put(key, image.imageUrl, features);
    }
    return features;
}

std::vector<SimilarityResult> BatchMatcher::Match(const CandidateImage& query,
                                                  const std::vector<CandidateImage>& candidates,
                                                  const BatchMatchParams& params,
                                                  const ProgressCallback& onProgress,
                                                  const Platform::CancellationToken* token) {
    ValidateParams(params);
    Feature::FeatureVector queryFeatures = Features(query, params);
    return MatchFeatures(queryFeatures, candidates, params, onProgress, token);
}

std::vector<SimilarityResult> BatchMatcher::Match(const Image& query,
                                                  const std::vector<CandidateImage>& candidates,
                                                  const BatchMatchParams& params,
                                                  const ProgressCallback& onProgress,
                                                  const Platform::CancellationToken* token) {
    Feature::FeatureVector queryFeatures = Feature::ExtractFeatures(query);
    return MatchFeatures(queryFeatures, candidates, params, onProgress, token);
}

std::vector<SimilarityResult> BatchMatcher::MatchFeatures(
    const Feature::FeatureVector& query,
    const std::vector<CandidateImage>& candidates,
    const BatchMatchParams& params,
    const ProgressCallback& onProgress,
    const Platform::CancellationToken* token)
{
    ValidateParams(params);

    auto logger = Platform::Logger();
    logger->info("matching {} candidates", candidates.size());

    Platform::Timer timer(true);
    std::vector<SimilarityResult> results;
    results.reserve(candidates.size());
    size_t failures = 0;

    for (size_t i = 0; i < candidates.size(); ++i) {
        if (token) {
            token->ThrowIfCancelled("BatchMatcher::Match");
        }

        const CandidateImage& candidate = candidates[i];
        SimilarityResult result;
        result.id = candidate.id;
        result.imageUrl = candidate.imageUrl;

        try {
            result.similarity = ScoreSimilarity(query, Features(candidate, params));
        } catch (const std::exception& e) {
            logger->warn("candidate '{}' ({}) scored 0: {}",
                         candidate.id, candidate.imageUrl, e.what());
            result.similarity = 0.0;
            ++failures;
        }
        results.push_back(std::move(result));

        if (onProgress) {
            onProgress(i + 1, candidates.size());
        }
    }

    logger->info("matched {} candidates in {:.1f} ms ({} failed)",
                 candidates.size(), timer.ElapsedMs(), failures);
    return results;
}

} // namespace Vis::Match::Matching
