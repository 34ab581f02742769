/**
 * @file TagSimilarity.cpp
 * @brief Tag keys, tag sets and weighted tag overlap
 */

#include <VisMatch/Matching/TagSimilarity.h>
#include <VisMatch/Core/Validate.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace Vis::Match::Matching {

namespace {

struct KeyInfo {
    TagKey key;
    const char* name;
    const char* label;
    double weight;
};

constexpr KeyInfo KEY_TABLE[TAG_KEY_COUNT] = {
    {TagKey::StyleName, "StyleName", "样式名称", 3.0},
    {TagKey::Color,     "Color",     "颜色",     2.0},
    {TagKey::Tone,      "Tone",      "色调",     1.5},
    {TagKey::Collar,    "Collar",    "领",       2.0},
    {TagKey::Sleeve,    "Sleeve",    "袖",       2.0},
    {TagKey::Fit,       "Fit",       "版型",     1.5},
    {TagKey::Length,    "Length",    "长度",     1.0},
    {TagKey::Fabric,    "Fabric",    "面料",     1.0},
    {TagKey::Pattern,   "Pattern",   "图案",     1.0},
    {TagKey::Craft,     "Craft",     "工艺",     1.0},
    {TagKey::Occasion,  "Occasion",  "场合",     1.0},
    {TagKey::Season,    "Season",    "季节",     1.0},
    {TagKey::Style,     "Style",     "风格",     3.0},
};

constexpr double SUBSTRING_CREDIT = 0.6;
constexpr double COLOR_FAMILY_CREDIT = 0.4;

// Each family matches if both values contain any of its terms
const std::array<std::array<const char*, 2>, 4> COLOR_FAMILIES = {{
    {{"黑", "black"}},
    {{"白", "white"}},
    {{"红", "red"}},
    {{"蓝", "blue"}},
}};

// ASCII lowercase and trim; multi-byte UTF-8 sequences pass through unchanged
std::string Normalize(const std::string& value) {
    size_t begin = 0;
    size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;

    std::string out = value.substr(begin, end - begin);
    for (char& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80) {
            c = static_cast<char>(std::tolower(uc));
        }
    }
    return out;
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

bool SameColorFamily(const std::string& a, const std::string& b) {
    for (const auto& family : COLOR_FAMILIES) {
        bool inA = false;
        bool inB = false;
        for (const char* term : family) {
            inA = inA || Contains(a, term);
            inB = inB || Contains(b, term);
        }
        if (inA && inB) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ============================================================================
// Keys
// ============================================================================

const std::array<TagKey, TAG_KEY_COUNT>& AllTagKeys() {
    static const std::array<TagKey, TAG_KEY_COUNT> keys = [] {
        std::array<TagKey, TAG_KEY_COUNT> k{};
        for (size_t i = 0; i < TAG_KEY_COUNT; ++i) {
            k[i] = KEY_TABLE[i].key;
        }
        return k;
    }();
    return keys;
}

const char* TagKeyName(TagKey key) {
    return KEY_TABLE[static_cast<size_t>(key)].name;
}

const char* TagKeyLabel(TagKey key) {
    return KEY_TABLE[static_cast<size_t>(key)].label;
}

std::optional<TagKey> ParseTagKey(const std::string& name) {
    std::string trimmed = Normalize(name);
    for (const auto& info : KEY_TABLE) {
        if (trimmed == info.label || trimmed == Normalize(info.name)) {
            return info.key;
        }
    }
    return std::nullopt;
}

bool IsRecognizedTagValue(const std::string& value) {
    std::string v = Normalize(value);
    return !(v.empty() || v == UNRECOGNIZED_TAG || v == "unrecognized" || v == "unknown" ||
             v == "null" || v == "undefined");
}

// ============================================================================
// TagSet
// ============================================================================

TagSet TagSet::FromMap(const std::map<std::string, std::string>& labels) {
    TagSet tags;
    for (const auto& [name, value] : labels) {
        if (auto key = ParseTagKey(name)) {
            tags.Set(*key, value);
        }
    }
    return tags;
}

bool TagSet::IsAllUnrecognized() const {
    return std::none_of(values_.begin(), values_.end(), IsRecognizedTagValue);
}

std::map<std::string, std::string> TagSet::ToMap() const {
    std::map<std::string, std::string> labels;
    for (TagKey key : AllTagKeys()) {
        labels[TagKeyLabel(key)] = Has(key) ? Get(key) : UNRECOGNIZED_TAG;
    }
    return labels;
}

// ============================================================================
// Scores
// ============================================================================

TagWeights TagWeights::Default() {
    TagWeights w;
    for (const auto& info : KEY_TABLE) {
        w.Set(info.key, info.weight);
    }
    return w;
}

double TagSimilarity(const TagSet& a, const TagSet& b, const TagWeights& weights) {
    double matchScore = 0.0;
    double totalWeight = 0.0;

    for (TagKey key : AllTagKeys()) {
        double weight = weights.Get(key);
        Validate::RequireNonNegative(weight, TagKeyName(key), "TagSimilarity");

        if (!a.Has(key) || !b.Has(key)) {
            continue;
        }
        std::string va = Normalize(a.Get(key));
        std::string vb = Normalize(b.Get(key));
        totalWeight += weight;

        if (va == vb) {
            matchScore += weight;
        } else if (va.find(vb) != std::string::npos || vb.find(va) != std::string::npos) {
            matchScore += weight * SUBSTRING_CREDIT;
        } else if (SameColorFamily(va, vb)) {
            matchScore += weight * COLOR_FAMILY_CREDIT;
        }
    }

    return totalWeight > 0.0 ? matchScore / totalWeight * 100.0 : 0.0;
}

double CombinedScore(double vectorSimilarity, double tagSimilarity,
                     double vectorWeight, double tagWeight) {
    return vectorWeight * vectorSimilarity + tagWeight * (tagSimilarity / 100.0);
}

} // namespace Vis::Match::Matching
