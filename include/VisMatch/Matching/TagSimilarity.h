#pragma once

/**
 * @file TagSimilarity.h
 * @brief Structured garment tags and weighted tag overlap
 *
 * A tagging collaborator labels each image with a fixed set of 13
 * attributes. Each attribute holds a free-text value or the sentinel
 * "未识别" (unrecognized).
 *
 * Tag similarity in [0, 100]: over the keys recognized in both sets,
 *   exact match (case-insensitive, trimmed) -> full key weight
 *   one value contains the other            -> 0.6 * weight
 *   same color family (黑/白/红/蓝)          -> 0.4 * weight
 * divided by the summed weights of those keys.
 */

#include <VisMatch/Core/Export.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace Vis::Match::Matching {

// ============================================================================
// Keys
// ============================================================================

/**
 * @brief Tag attribute
 */
enum class TagKey : int32_t {
    StyleName = 0,  ///< 样式名称
    Color,          ///< 颜色
    Tone,           ///< 色调
    Collar,         ///< 领
    Sleeve,         ///< 袖
    Fit,            ///< 版型
    Length,         ///< 长度
    Fabric,         ///< 面料
    Pattern,        ///< 图案
    Craft,          ///< 工艺
    Occasion,       ///< 场合
    Season,         ///< 季节
    Style           ///< 风格
};

constexpr size_t TAG_KEY_COUNT = 13;

/// Sentinel value of an unrecognized attribute
constexpr const char* UNRECOGNIZED_TAG = "未识别";

/// All keys in declaration order
VISMATCH_API const std::array<TagKey, TAG_KEY_COUNT>& AllTagKeys();

/// English key name ("StyleName")
VISMATCH_API const char* TagKeyName(TagKey key);

/// Label used by the tagging collaborator ("样式名称")
VISMATCH_API const char* TagKeyLabel(TagKey key);

/// Key for a collaborator label or English key name
VISMATCH_API std::optional<TagKey> ParseTagKey(const std::string& name);

/**
 * @brief Check whether a tag value carries information
 *
 * Empty values, "未识别", "unrecognized", "unknown", "null" and
 * "undefined" (trimmed, case-insensitive) are unrecognized.
 */
VISMATCH_API bool IsRecognizedTagValue(const std::string& value);

// ============================================================================
// TagSet
// ============================================================================

/**
 * @brief One value per TagKey (empty = unrecognized)
 */
class VISMATCH_API TagSet {
public:
    TagSet() = default;

    /**
     * @brief Build from a label map
     *
     * Map keys may be collaborator labels or English key names; other keys
     * are ignored.
     */
    static TagSet FromMap(const std::map<std::string, std::string>& labels);

    const std::string& Get(TagKey key) const { return values_[Index(key)]; }
    void Set(TagKey key, std::string value) { values_[Index(key)] = std::move(value); }

    /// Value of key is recognized
    bool Has(TagKey key) const { return IsRecognizedTagValue(Get(key)); }

    /// No key holds a recognized value
    bool IsAllUnrecognized() const;

    /// Label map with collaborator labels as keys, unrecognized values as "未识别"
    std::map<std::string, std::string> ToMap() const;

private:
    static size_t Index(TagKey key) { return static_cast<size_t>(key); }

    std::array<std::string, TAG_KEY_COUNT> values_;
};

// ============================================================================
// Weights and scores
// ============================================================================

/**
 * @brief Importance of each key
 *
 * Default: StyleName and Style 3; Color, Collar and Sleeve 2; Tone and
 * Fit 1.5; all other keys 1.
 */
struct VISMATCH_API TagWeights {
    std::array<double, TAG_KEY_COUNT> weights{};

    double Get(TagKey key) const { return weights[static_cast<size_t>(key)]; }
    void Set(TagKey key, double weight) { weights[static_cast<size_t>(key)] = weight; }

    static TagWeights Default();
};

/**
 * @brief Weighted overlap of two tag sets in [0, 100]
 *
 * Returns 0 when no key is recognized in both sets.
 *
 * @throws InvalidArgumentException if a weight is negative
 */
VISMATCH_API double TagSimilarity(const TagSet& a, const TagSet& b,
                                  const TagWeights& weights = TagWeights::Default());

/**
 * @brief Blend of vector similarity [0, 1] and tag similarity [0, 100]
 *
 * vectorWeight * vectorSimilarity + tagWeight * tagSimilarity / 100
 */
VISMATCH_API double CombinedScore(double vectorSimilarity, double tagSimilarity,
                                  double vectorWeight = 0.6, double tagWeight = 0.4);

} // namespace Vis::Match::Matching
