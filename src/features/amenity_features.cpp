/// @file src/features/amenity_features.cpp
/// @brief AmenityEngine: category completeness, named flags and score.

#include "strp/amenity.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace strp::features {

AmenityEngine::AmenityEngine(AmenityConfig config) : config_(std::move(config)) {
    for (std::size_t c = 0; c < AMENITY_CATEGORY_COUNT; ++c) {
        for (const auto& s : config_.categories[c].synonyms) synonyms_lc_[c].push_back(to_lower(s));
    }
    for (const auto& f : config_.flags) {
        std::vector<std::string> kw;
        kw.reserve(f.keywords.size());
        for (const auto& k : f.keywords) kw.push_back(to_lower(k));
        flag_keywords_lc_.push_back(std::move(kw));
    }

    for (const auto& spec : config_.categories) {
        columns_.push_back({fmt::format("has_{}_amenities", to_string(spec.category)), 0.0});
    }
    for (const auto& spec : config_.categories) {
        columns_.push_back({fmt::format("{}_completeness", to_string(spec.category)), 0.0});
    }
    for (const auto& f : config_.flags) columns_.push_back({f.column, 0.0});
    columns_.push_back({"amenities_count", 0.0});
    columns_.push_back({"amenity_score", 0.0});
}

bool AmenityEngine::matches_any(const std::vector<std::string>& lowered_amenities,
                                const std::vector<std::string>& lowered_keywords) {
    for (const auto& kw : lowered_keywords) {
        for (const auto& a : lowered_amenities) {
            if (a.find(kw) != std::string::npos) return true;
        }
    }
    return false;
}

AmenityScores AmenityEngine::score(const std::set<std::string>& amenities) const {
    std::vector<std::string> lowered;
    lowered.reserve(amenities.size());
    for (const auto& a : amenities) lowered.push_back(to_lower(a));

    AmenityScores s;
    for (std::size_t c = 0; c < AMENITY_CATEGORY_COUNT; ++c) {
        const auto& syn = synonyms_lc_[c];
        if (syn.empty()) continue;
        std::size_t matched = 0;
        for (const auto& kw : syn) {
            if (matches_any(lowered, {kw})) ++matched;
        }
        s.has_category[c] = matched > 0;
        s.completeness[c] = static_cast<double>(matched) / static_cast<double>(syn.size());
        s.amenity_score  += config_.categories[c].weight * s.completeness[c];
    }
    s.amenity_score = std::clamp(s.amenity_score, 0.0, 1.0);
    return s;
}

RowStatus AmenityEngine::compute_row(const Listing& listing, std::span<double> row) const {
    const auto parsed = listing.amenities_raw ? parse_amenities(*listing.amenities_raw)
                                              : AmenityParse{};
    const auto& set = parsed.amenities;
    const auto  s   = score(set);

    std::size_t col = 0;
    for (std::size_t c = 0; c < AMENITY_CATEGORY_COUNT; ++c) row[col++] = s.has_category[c] ? 1.0 : 0.0;
    for (std::size_t c = 0; c < AMENITY_CATEGORY_COUNT; ++c) row[col++] = s.completeness[c];

    std::vector<std::string> lowered;
    lowered.reserve(set.size());
    for (const auto& a : set) lowered.push_back(to_lower(a));
    for (const auto& kw : flag_keywords_lc_) row[col++] = matches_any(lowered, kw) ? 1.0 : 0.0;

    row[col++] = static_cast<double>(set.size());
    row[col++] = s.amenity_score;

    return parsed.status == AmenityParseStatus::Malformed ? RowStatus::Malformed
                                                          : RowStatus::Computed;
}

}  // namespace strp::features
