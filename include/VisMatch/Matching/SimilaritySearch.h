#pragma once

/**
 * @file SimilaritySearch.h
 * @brief Ranked similarity search with optional tag re-ranking
 *
 * Run():
 * 1. Batch-match the query against all candidates
 * 2. With tag re-ranking, score tag overlap against the query's tags and
 *    blend: combined = vectorWeight * similarity + tagWeight * tag / 100
 * 3. Keep results whose score (combined when re-ranking, similarity
 *    otherwise) is >= threshold
 * 4. Sort by that score, descending; ties keep candidate order
 */

#include <VisMatch/Core/Export.h>
#include <VisMatch/Core/Image.h>
#include <VisMatch/Matching/BatchMatcher.h>
#include <VisMatch/Matching/TagSimilarity.h>
#include <VisMatch/Platform/Thread.h>

#include <memory>
#include <string>
#include <vector>

namespace Vis::Match::Matching {

/**
 * @brief Tagging collaborator
 *
 * Returns the attribute labels of an image. Implementations report failures
 * by throwing a VisMatch Exception.
 */
class VISMATCH_API ImageTagger {
public:
    virtual ~ImageTagger() = default;

    virtual TagSet Tag(const Image& image) = 0;
};

/**
 * @brief Image reference with its tags
 */
struct VISMATCH_API LabeledImage {
    std::string id;
    std::string imageUrl;
    TagSet tags;
};

/**
 * @brief Ranked search result
 */
struct VISMATCH_API CombinedResult {
    std::string id;
    std::string imageUrl;
    double similarity = 0.0;        ///< Vector similarity [0, 1]
    double tagSimilarity = 0.0;     ///< Tag overlap [0, 100], 0 without re-ranking
    double combinedScore = 0.0;     ///< Ranking score
};

/**
 * @brief Search parameters
 */
struct VISMATCH_API SearchParams {
    double threshold = 0.0;         ///< Minimum ranking score [0, 1]
    bool useTagRerank = false;      ///< Blend in tag similarity
    double vectorWeight = 0.6;      ///< Share of vector similarity in the blend
    double tagWeight = 0.4;         ///< Share of tag similarity in the blend
    TagWeights tagWeights = TagWeights::Default();
    BatchMatchParams match = BatchMatchParams::Default();

    static SearchParams Default() { return SearchParams(); }
};

/**
 * @brief Filter by threshold and sort by similarity, descending and stable
 * @throws InvalidArgumentException if threshold is outside [0, 1]
 */
VISMATCH_API std::vector<SimilarityResult> FilterAndRank(std::vector<SimilarityResult> results,
                                                         double threshold);

/**
 * @brief Search pipeline over a BatchMatcher
 */
class VISMATCH_API SimilaritySearch {
public:
    /**
     * @param matcher Batch matcher (must not be null)
     * @param tagger Optional tagger for queries that arrive without tags
     * @throws InvalidArgumentException if matcher is null
     */
    explicit SimilaritySearch(std::shared_ptr<BatchMatcher> matcher,
                              std::shared_ptr<ImageTagger> tagger = nullptr);

    /**
     * @brief Rank candidates by similarity to the query
     *
     * With re-ranking enabled and no recognized query tags, the query image is
     * tagged through the tagger. The image is loaded once and shared by the
     * tagger and the feature extractor. A missing or failing tagger leaves the
     * query without tags, so every tag similarity is 0.
     *
     * @throws InvalidArgumentException on invalid params
     * @throws DecodeException / TimeoutException if the query cannot be loaded
     * @throws CancelledException if token is cancelled
     */
    std::vector<CombinedResult> Run(const LabeledImage& query,
                                    const std::vector<LabeledImage>& candidates,
                                    const SearchParams& params = SearchParams::Default(),
                                    const ProgressCallback& onProgress = nullptr,
                                    const Platform::CancellationToken* token = nullptr);

    const std::shared_ptr<BatchMatcher>& Matcher() const { return matcher_; }

private:
    TagSet TagQuery(const LabeledImage& query, const Image& image);

    std::shared_ptr<BatchMatcher> matcher_;
    std::shared_ptr<ImageTagger> tagger_;
};

} // namespace Vis::Match::Matching
