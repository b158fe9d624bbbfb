/// @file tests/features/test_amenity.cpp
/// @brief Amenity text parsing and AmenityEngine scoring.

#include <gtest/gtest.h>
#include "strp/amenity.hpp"

#include <limits>
#include <string>
#include <vector>

using namespace strp;
using namespace strp::features;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Listing with_amenities(std::optional<std::string> raw) {
    Listing l;
    l.amenities_raw = std::move(raw);
    return l;
}

static double value_of(const AmenityEngine& engine, const EngineOutput& out,
                       Eigen::Index row, const std::string& name) {
    const auto& cols = engine.columns();
    for (std::size_t j = 0; j < cols.size(); ++j) {
        if (cols[j].name == name) return out.values(row, static_cast<Eigen::Index>(j));
    }
    ADD_FAILURE() << "missing column " << name;
    return std::numeric_limits<double>::quiet_NaN();
}

// ─── parse_amenities ─────────────────────────────────────────────────────────

TEST(AmenityParse, BracedListWithQuotedEntries) {
    const auto p = parse_amenities(R"({TV,Wifi,"Air conditioning",Kitchen})");
    EXPECT_EQ(p.status, AmenityParseStatus::Structured);
    EXPECT_EQ(p.amenities, (std::set<std::string>{"Air conditioning", "Kitchen", "TV", "Wifi"}));
}

TEST(AmenityParse, JsonStyleArray) {
    const auto p = parse_amenities(R"(["Pool", "Gym", "Hot water"])");
    EXPECT_EQ(p.status, AmenityParseStatus::Structured);
    EXPECT_EQ(p.amenities.size(), 3u);
    EXPECT_TRUE(p.amenities.contains("Hot water"));
}

TEST(AmenityParse, EscapedQuoteInsideEntry) {
    const auto p = parse_amenities(R"(["Kid\"s toys"])");
    EXPECT_EQ(p.status, AmenityParseStatus::Structured);
    EXPECT_TRUE(p.amenities.contains("Kid\"s toys"));
}

TEST(AmenityParse, PlainDelimitedText) {
    const auto p = parse_amenities("Wifi, Pool, Free parking");
    EXPECT_EQ(p.status, AmenityParseStatus::Delimited);
    EXPECT_EQ(p.amenities, (std::set<std::string>{"Free parking", "Pool", "Wifi"}));
}

TEST(AmenityParse, DuplicatesAndEmptyEntriesCollapse) {
    const auto p = parse_amenities("{Wifi,,Wifi, }");
    EXPECT_EQ(p.status, AmenityParseStatus::Structured);
    EXPECT_EQ(p.amenities.size(), 1u);
}

TEST(AmenityParse, BlankIsEmpty) {
    EXPECT_EQ(parse_amenities("").status, AmenityParseStatus::Empty);
    EXPECT_EQ(parse_amenities("   \t").status, AmenityParseStatus::Empty);
    EXPECT_TRUE(parse_amenities("{}").amenities.empty());
}

TEST(AmenityParse, MalformedInputsYieldEmptySet) {
    for (const std::string raw : {
             std::string(R"({Wifi,"Pool)"),     // unterminated quote
             std::string(R"(["Pool" "Gym"])"),  // missing comma
             std::string("{Wifi,Pool"),         // unclosed brace
             std::string("Wifi\x01Pool"),       // control character
             std::string("\"Wifi, Pool"),       // unterminated leading quote
             std::string("Wifi, [Pool]"),        // bracket in plain text
         }) {
        const auto p = parse_amenities(raw);
        EXPECT_EQ(p.status, AmenityParseStatus::Malformed) << raw;
        EXPECT_TRUE(p.amenities.empty()) << raw;
    }
}

TEST(AmenityParse, ApostropheInsideBareEntryIsText) {
    const auto plain = parse_amenities("Wifi, Chef's kitchen, Pool");
    EXPECT_EQ(plain.status, AmenityParseStatus::Delimited);
    EXPECT_EQ(plain.amenities, (std::set<std::string>{"Chef's kitchen", "Pool", "Wifi"}));

    const auto braced = parse_amenities("{Wifi,Children's books,Pool}");
    EXPECT_EQ(braced.status, AmenityParseStatus::Structured);
    EXPECT_EQ(braced.amenities, (std::set<std::string>{"Children's books", "Pool", "Wifi"}));

    const auto wrapped = parse_amenities("'Chef's kitchen', Pool");
    EXPECT_EQ(wrapped.status, AmenityParseStatus::Delimited);
    EXPECT_TRUE(wrapped.amenities.contains("Chef's kitchen"));
}

TEST(AmenityParse, UnicodeEscapesDecodeToUtf8) {
    const auto p = parse_amenities(R"(["Chef\u2019s kitchen", "Caf\u00e9", "Pool \ud83c\udfca"])");
    EXPECT_EQ(p.status, AmenityParseStatus::Structured);
    EXPECT_TRUE(p.amenities.contains("Chef\xe2\x80\x99s kitchen"));
    EXPECT_TRUE(p.amenities.contains("Caf\xc3\xa9"));
    EXPECT_TRUE(p.amenities.contains("Pool \xf0\x9f\x8f\x8a"));
}

TEST(AmenityParse, UndecodableEscapeKeptVerbatim) {
    const auto p = parse_amenities(R"(["Bad \uZZ", "Lone \ud83c"])");
    EXPECT_EQ(p.status, AmenityParseStatus::Structured);
    EXPECT_TRUE(p.amenities.contains(R"(Bad \uZZ)"));
    EXPECT_TRUE(p.amenities.contains(R"(Lone \ud83c)"));
}

TEST(AmenityParse, ToLower) {
    EXPECT_EQ(to_lower("Free PARKING"), "free parking");
}

// ─── AmenityEngine::score ────────────────────────────────────────────────────

TEST(AmenityScore, EmptySetScoresZero) {
    const AmenityEngine engine(AmenityConfig{});
    const auto s = engine.score({});
    EXPECT_DOUBLE_EQ(s.amenity_score, 0.0);
    EXPECT_FALSE(s.has_category[0]);
}

TEST(AmenityScore, CaseInsensitiveSubstringMatch) {
    const AmenityEngine engine(AmenityConfig{});
    const auto s = engine.score({"WIFI", "Laptop friendly workspace"});
    EXPECT_TRUE(s.has_category[static_cast<std::size_t>(AmenityCategory::Essential)]);
    EXPECT_TRUE(s.has_category[static_cast<std::size_t>(AmenityCategory::WorkFriendly)]);
    EXPECT_FALSE(s.has_category[static_cast<std::size_t>(AmenityCategory::Premium)]);
}

TEST(AmenityScore, EverySynonymGivesScoreOne) {
    const AmenityConfig cfg;
    std::set<std::string> all;
    for (const auto& spec : cfg.categories) all.insert(spec.synonyms.begin(), spec.synonyms.end());
    const AmenityEngine engine(cfg);
    const auto s = engine.score(all);
    EXPECT_NEAR(s.amenity_score, 1.0, 1e-12);
    for (double c : s.completeness) EXPECT_DOUBLE_EQ(c, 1.0);
}

TEST(AmenityScore, MatchesAnyIsSubstringBased) {
    EXPECT_TRUE(AmenityEngine::matches_any({"rooftop pool"}, {"pool"}));
    EXPECT_FALSE(AmenityEngine::matches_any({"pool"}, {"rooftop pool"}));
    EXPECT_FALSE(AmenityEngine::matches_any({}, {"pool"}));
}

// ─── AmenityEngine rows ──────────────────────────────────────────────────────

TEST(AmenityEngine_Compute, WifiPoolFreeParkingFlags) {
    const AmenityEngine engine(AmenityConfig{});
    const std::vector<Listing> listings = {with_amenities("Wifi, Pool, Free parking")};
    const auto out = engine.compute(listings, 1);

    EXPECT_EQ(out.status[0], RowStatus::Computed);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "has_wifi"), 1.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "has_pool"), 1.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "has_parking"), 1.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "has_kitchen"), 0.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "has_tv"), 0.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "has_essential_amenities"), 1.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "has_premium_amenities"), 1.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "has_work_friendly_amenities"), 0.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "premium_completeness"), 2.0 / 8.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "amenities_count"), 3.0);

    const double expected = 0.3 * (1.0 / 9.0) + 0.5 * (2.0 / 8.0);
    EXPECT_NEAR(value_of(engine, out, 0, "amenity_score"), expected, 1e-12);
}

TEST(AmenityEngine_Compute, MalformedRowIsFlaggedAndEmpty) {
    const AmenityEngine engine(AmenityConfig{});
    const std::vector<Listing> listings = {
        with_amenities(R"({"Wifi)"),
        with_amenities(std::nullopt),
        with_amenities("{Kitchen}"),
    };
    const auto out = engine.compute(listings, 3);

    EXPECT_EQ(out.status[0], RowStatus::Malformed);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "amenities_count"), 0.0);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 0, "amenity_score"), 0.0);

    EXPECT_EQ(out.status[1], RowStatus::Computed);
    EXPECT_EQ(out.status[2], RowStatus::Computed);
    EXPECT_DOUBLE_EQ(value_of(engine, out, 2, "has_kitchen"), 1.0);
}
