/// @file tests/features/test_temporal.cpp
/// @brief Calendar encoding, holidays and TemporalFeatureEngine rows.

#include <gtest/gtest.h>
#include "strp/temporal.hpp"
#include "strp/constants.hpp"

#include <chrono>
#include <cmath>
#include <vector>

using namespace strp;
using namespace strp::features;
using namespace std::chrono;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static TemporalConfig config_at(year_month_day date) {
    TemporalConfig cfg;
    cfg.reference_date = date;
    return cfg;
}

static Eigen::Index column_of(const TemporalFeatureEngine& engine, const std::string& name) {
    const auto& cols = engine.columns();
    for (std::size_t j = 0; j < cols.size(); ++j) {
        if (cols[j].name == name) return static_cast<Eigen::Index>(j);
    }
    ADD_FAILURE() << "missing column " << name;
    return 0;
}

// ─── season_of ───────────────────────────────────────────────────────────────

TEST(Temporal_Season, SouthernHemisphere) {
    EXPECT_EQ(season_of(12), Season::Summer);
    EXPECT_EQ(season_of(1), Season::Summer);
    EXPECT_EQ(season_of(2), Season::Summer);
    EXPECT_EQ(season_of(3), Season::Autumn);
    EXPECT_EQ(season_of(7), Season::Winter);
    EXPECT_EQ(season_of(10), Season::Spring);
}

// ─── Holidays ────────────────────────────────────────────────────────────────

TEST(Temporal_Holiday, ChristmasIsHolidayInSummer) {
    const auto e = encode(year{2024} / December / 25, config_at(year{2024} / December / 25));
    EXPECT_TRUE(e.is_holiday);
    EXPECT_TRUE(e.is_holiday_period);
    EXPECT_EQ(e.season, Season::Summer);
    EXPECT_TRUE(e.is_high_season);
    EXPECT_EQ(e.days_to_holiday, 0);
    EXPECT_EQ(e.quarter, 4u);
}

TEST(Temporal_Holiday, DayBeforeIsPeriodNotHoliday) {
    const auto e = encode(year{2024} / December / 24, config_at(year{2024} / December / 24));
    EXPECT_FALSE(e.is_holiday);
    EXPECT_TRUE(e.is_holiday_period);
    EXPECT_EQ(e.days_to_holiday, 1);
}

TEST(Temporal_Holiday, DistanceWrapsIntoNextYear) {
    const std::vector<Holiday> holidays = {{1, 1}, {12, 25}};
    EXPECT_EQ(days_to_nearest_holiday(year{2024} / December / 30, holidays), 2);
}

TEST(Temporal_Holiday, NoHolidaysMeansCappedDistance) {
    EXPECT_EQ(days_to_nearest_holiday(year{2024} / June / 1, {}), constants::MAX_DAYS_TO_HOLIDAY);
    TemporalConfig cfg = config_at(year{2024} / June / 1);
    cfg.holidays.clear();
    EXPECT_FALSE(encode(year{2024} / June / 1, cfg).is_holiday_period);
}

TEST(Temporal_Holiday, LeapDayHolidayInNonLeapYear) {
    const std::vector<Holiday> holidays = {{2, 29}};
    // 2023 has no Feb 29; the nearest occurrence is 2024-02-29.
    EXPECT_EQ(days_to_nearest_holiday(year{2023} / December / 31, holidays), 60);
}

// ─── Weekday encoding ────────────────────────────────────────────────────────

TEST(Temporal_Weekday, FridayToSundayIsWeekend) {
    const TemporalConfig cfg;
    EXPECT_FALSE(encode(year{2024} / June / 27, cfg).is_weekend);  // Thursday
    EXPECT_TRUE(encode(year{2024} / June / 28, cfg).is_weekend);   // Friday
    EXPECT_TRUE(encode(year{2024} / June / 30, cfg).is_weekend);   // Sunday
    EXPECT_FALSE(encode(year{2024} / July / 1, cfg).is_weekend);   // Monday
}

TEST(Temporal_Weekday, MondayEncodesAsZeroAngle) {
    const auto e = encode(year{2024} / July / 1, TemporalConfig{});
    EXPECT_NEAR(e.dow_sin, 0.0, 1e-12);
    EXPECT_NEAR(e.dow_cos, 1.0, 1e-12);
}

TEST(Temporal_Month, CyclicalEncodingOnUnitCircle) {
    const auto e = encode(year{2024} / March / 10, TemporalConfig{});
    EXPECT_NEAR(e.month_sin * e.month_sin + e.month_cos * e.month_cos, 1.0, 1e-12);
    EXPECT_NEAR(e.month_sin, 1.0, 1e-12);  // 2π·3/12 = π/2
}

// ─── occupancy_rate ──────────────────────────────────────────────────────────

TEST(Temporal_Occupancy, RateFromAvailability) {
    EXPECT_DOUBLE_EQ(*TemporalFeatureEngine::occupancy_rate(15, 30), 0.5);
    EXPECT_DOUBLE_EQ(*TemporalFeatureEngine::occupancy_rate(0, 30), 1.0);
    EXPECT_DOUBLE_EQ(*TemporalFeatureEngine::occupancy_rate(45, 30), 0.0);
    EXPECT_FALSE(TemporalFeatureEngine::occupancy_rate(std::nullopt, 30).has_value());
}

// ─── TemporalFeatureEngine ───────────────────────────────────────────────────

TEST(TemporalEngine_Compute, ReferenceDateSharedAcrossRows) {
    const TemporalFeatureEngine engine(config_at(year{2024} / December / 25));
    std::vector<Listing> listings(3);
    const auto out = engine.compute(listings, 2);
    for (Eigen::Index i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(out.values(i, column_of(engine, "is_holiday")), 1.0);
        EXPECT_DOUBLE_EQ(out.values(i, column_of(engine, "season_summer")), 1.0);
        EXPECT_DOUBLE_EQ(out.values(i, column_of(engine, "month")), 12.0);
    }
}

TEST(TemporalEngine_Compute, DemandFromAvailabilityAndReviews) {
    const TemporalFeatureEngine engine(config_at(year{2024} / June / 30));
    Listing l;
    l.availability      = Availability{15, 30, std::nullopt};
    l.review_count      = 40;
    l.reviews_per_month = 2.0;
    l.last_review       = year{2024} / June / 20;
    const std::vector<Listing> listings = {l};

    const auto out = engine.compute(listings, 1);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "occupancy_rate_30")), 0.5);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "occupancy_rate_60")), 0.5);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "occupancy_rate_90")),
                     constants::UNKNOWN_DEMAND);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "demand_index")), 0.5);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "recent_demand")), 2.0);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "popularity_score")), 0.5 * 40 + 0.5 * 200);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "days_since_last_review")), 10.0);
}

TEST(TemporalEngine_Compute, MissingDemandInputsKeepSentinels) {
    const TemporalFeatureEngine engine(config_at(year{2024} / June / 30));
    const std::vector<Listing> listings(1);
    const auto out = engine.compute(listings, 1);
    EXPECT_EQ(out.status[0], RowStatus::Computed);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "demand_index")), constants::UNKNOWN_DEMAND);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "days_since_last_review")),
                     constants::UNKNOWN_DEMAND);
    EXPECT_DOUBLE_EQ(out.values(0, column_of(engine, "popularity_score")), 0.0);
}
