/**
 * @file SimilaritySearch.cpp
 * @brief Search pipeline: batch match, tag re-rank, filter, sort
 */

#include <VisMatch/Matching/SimilaritySearch.h>
#include <VisMatch/Core/Exception.h>
#include <VisMatch/Core/Validate.h>
#include <VisMatch/IO/ImageSource.h>
#include <VisMatch/Platform/Logging.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace Vis::Match::Matching {

namespace {

void ValidateThreshold(double threshold, const char* funcName) {
    Validate::RequireRange(threshold, 0.0, 1.0, "threshold", funcName);
}

template<typename T, typename ScoreFn>
std::vector<T> FilterAndSort(std::vector<T> results, double threshold, ScoreFn score) {
    results.erase(std::remove_if(results.begin(), results.end(),
                                 [&](const T& r) { return score(r) < threshold; }),
                  results.end());
    std::stable_sort(results.begin(), results.end(),
                     [&](const T& a, const T& b) { return score(a) > score(b); });
    return results;
}

} // anonymous namespace

std::vector<SimilarityResult> FilterAndRank(std::vector<SimilarityResult> results,
                                            double threshold) {
    ValidateThreshold(threshold, "FilterAndRank");
    return FilterAndSort(std::move(results), threshold,
                         [](const SimilarityResult& r) { return r.similarity; });
}

SimilaritySearch::SimilaritySearch(std::shared_ptr<BatchMatcher> matcher,
                                   std::shared_ptr<ImageTagger> tagger)
    : matcher_(std::move(matcher))
    , tagger_(std::move(tagger))
{
    if (!matcher_) {
        throw InvalidArgumentException("SimilaritySearch: matcher is null");
    }
}

TagSet SimilaritySearch::TagQuery(const LabeledImage& query, const Image& image) {
    try {
        return tagger_->Tag(image);
    } catch (const std::exception& e) {
        Platform::Logger()->warn("tagging query '{}' failed: {}", query.id, e.what());
        return query.tags;
    }
}

std::vector<CombinedResult> SimilaritySearch::Run(const LabeledImage& query,
                                                  const std::vector<LabeledImage>& candidates,
                                                  const SearchParams& params,
                                                  const ProgressCallback& onProgress,
                                                  const Platform::CancellationToken* token) {
    ValidateThreshold(params.threshold, "SimilaritySearch::Run");
    Validate::RequireNonNegative(params.vectorWeight, "vectorWeight", "SimilaritySearch::Run");
    Validate::RequireNonNegative(params.tagWeight, "tagWeight", "SimilaritySearch::Run");

    std::vector<CandidateImage> refs;
    refs.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        refs.push_back({candidate.id, candidate.imageUrl});
    }

    CandidateImage queryRef{query.id, query.imageUrl};
    TagSet queryTags = query.tags;
    std::vector<SimilarityResult> matches;

    if (params.useTagRerank && query.tags.IsAllUnrecognized() && tagger_) {
        Validate::RequirePositive(params.match.decodeTimeoutMs, "decodeTimeoutMs",
                                  "SimilaritySearch::Run");
        Image image = IO::LoadImage(matcher_->Source(), query.imageUrl,
                                    params.match.decodeTimeoutMs);
        queryTags = TagQuery(query, image);
        matches = matcher_->MatchFeatures(matcher_->Features(queryRef, image, params.match),
                                          refs, params.match, onProgress, token);
    } else {
        if (params.useTagRerank && query.tags.IsAllUnrecognized()) {
            Platform::Logger()->warn("query '{}' has no tags and no tagger is set", query.id);
        }
        matches = matcher_->Match(queryRef, refs, params.match, onProgress, token);
    }

    std::vector<CombinedResult> results;
    results.reserve(matches.size());
    for (size_t i = 0; i < matches.size(); ++i) {
        CombinedResult r;
        r.id = matches[i].id;
        r.imageUrl = matches[i].imageUrl;
        r.similarity = matches[i].similarity;
        if (params.useTagRerank) {
            r.tagSimilarity = TagSimilarity(queryTags, candidates[i].tags, params.tagWeights);
            r.combinedScore = CombinedScore(r.similarity, r.tagSimilarity,
                                            params.vectorWeight, params.tagWeight);
        } else {
            r.combinedScore = r.similarity;
        }
        results.push_back(std::move(r));
    }

    auto ranked = FilterAndSort(std::move(results), params.threshold,
                                [](const CombinedResult& r) { return r.combinedScore; });
    Platform::Logger()->info("search kept {} of {} candidates (threshold {:.2f}{})",
                             ranked.size(), candidates.size(), params.threshold,
                             params.useTagRerank ? ", tag re-ranked" : "");
    return ranked;
}

} // namespace Vis::Match::Matching
