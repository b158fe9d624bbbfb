#pragma once

/// @file include/strp/amenity.hpp
/// @brief Amenity Engine: tolerant amenity-text parsing and category scores.
///
/// # Module: Amenity Features
///
/// ## Responsibility
/// Parse free-form amenity text into a set of amenity names and score it
/// against configured category synonym lists.
///
/// ## Accepted input
///   - Bracketed lists: `["Wifi", "Pool"]`, `{Wifi,"Free parking"}`,
///     `['Kitchen']` (double-quoted, single-quoted or bare entries)
///   - Plain comma-delimited text: `Wifi, Pool, Free parking`
///
/// An entry is quoted only when it starts with a quote; quotes inside a
/// bare entry are literal (`{Wifi,Children's books}`). Quoted entries
/// understand JSON escapes, `\uXXXX` included; an undecodable `\u` is
/// kept verbatim.
///
/// Anything else (an unterminated quoted entry, stray brackets, trailing
/// text after a closing quote or bracket, control characters) is Malformed
/// and yields an empty set. Parsing never throws on bad text.
///
/// ## Matching
/// A synonym matches an amenity when it is a case-insensitive substring
/// of it ("parking" matches "Free parking on premises").
///
///     completeness_c = matched synonyms of c / |synonyms of c|
///     amenity_score  = Σ_c weight_c · completeness_c      ∈ [0, 1]
///
/// ## NOT Responsible For
/// - Translating amenity names between languages

#include "strp/config.hpp"
#include "strp/feature_engine.hpp"
#include "strp/types.hpp"

#include <array>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strp::features {

enum class AmenityParseStatus : unsigned char {
    Empty,       ///< No text, or only whitespace
    Structured,  ///< Bracketed list
    Delimited,   ///< Plain comma-separated text
    Malformed,   ///< Unparseable; amenity set is empty
};

[[nodiscard]] const char* to_string(AmenityParseStatus status) noexcept;

struct AmenityParse {
    std::set<std::string> amenities;
    AmenityParseStatus    status = AmenityParseStatus::Empty;
};

/// Parse raw amenity text. Never throws on malformed text.
[[nodiscard]] AmenityParse parse_amenities(std::string_view raw);

/// Lower-cased copy (ASCII).
[[nodiscard]] std::string to_lower(std::string_view s);

/// Per-category scores of one amenity set.
struct AmenityScores {
    std::array<bool, AMENITY_CATEGORY_COUNT>   has_category{};
    std::array<double, AMENITY_CATEGORY_COUNT> completeness{};
    double amenity_score = 0.0;
};

/// Columns:
///   has_essential_amenities, has_premium_amenities,
///   has_work_friendly_amenities, essential_completeness,
///   premium_completeness, work_friendly_completeness, <flag columns>,
///   amenities_count, amenity_score
class AmenityEngine final : public PerListingEngine {
public:
    explicit AmenityEngine(AmenityConfig config);

    [[nodiscard]] std::string_view name() const noexcept override { return "amenity"; }
    [[nodiscard]] const std::vector<ColumnSpec>& columns() const noexcept override { return columns_; }

    [[nodiscard]] AmenityScores score(const std::set<std::string>& amenities) const;

    /// True when any amenity contains any of `keywords` (lower-cased).
    [[nodiscard]] static bool matches_any(const std::vector<std::string>& lowered_amenities,
                                          const std::vector<std::string>& lowered_keywords);

protected:
    [[nodiscard]] RowStatus compute_row(const Listing& listing,
                                        std::span<double> row) const override;

private:
    AmenityConfig config_;
    std::array<std::vector<std::string>, AMENITY_CATEGORY_COUNT> synonyms_lc_;
    std::vector<std::vector<std::string>> flag_keywords_lc_;
    std::vector<ColumnSpec> columns_;
};

}  // namespace strp::features
