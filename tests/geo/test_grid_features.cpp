/// @file tests/geo/test_grid_features.cpp
/// @brief GridAggregationEngine: cell assignment and per-cell statistics.

#include <gtest/gtest.h>
#include "strp/grid.hpp"
#include "strp/constants.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

using namespace strp;
using namespace strp::geo;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Listing make_listing(double lat, double lon, double price,
                            std::optional<double> bedrooms = std::nullopt) {
    Listing l;
    l.id       = "L";
    l.coords   = {lat, lon};
    l.price    = price;
    l.bedrooms = bedrooms;
    return l;
}

enum : Eigen::Index { AVG = 0, COUNT, MEDIAN, STD, BEDROOMS };

// ─── cell_of ─────────────────────────────────────────────────────────────────

TEST(Grid_CellOf, FloorsTowardsNegativeInfinity) {
    const GridAggregationEngine engine(GeoConfig{});
    const auto cell = engine.cell_of({-22.975, -43.191});
    ASSERT_TRUE(cell.has_value());
    EXPECT_EQ(cell->lat_index, -2298);
    EXPECT_EQ(cell->lon_index, -4320);
}

TEST(Grid_CellOf, InvalidCoordinatesHaveNoCell) {
    const GridAggregationEngine engine(GeoConfig{});
    EXPECT_FALSE(engine.cell_of({91.0, 0.0}).has_value());
}

// ─── reduce ──────────────────────────────────────────────────────────────────

TEST(Grid_Reduce, SinglePriceHasZeroSpread) {
    const std::vector<Listing> listings = {make_listing(0.0, 0.0, 80.0, 2.0)};
    const std::vector<std::size_t> members = {0};
    const auto s = GridAggregationEngine::reduce(listings, members);
    EXPECT_EQ(s.listing_count, 1u);
    EXPECT_DOUBLE_EQ(*s.avg_price, 80.0);
    EXPECT_DOUBLE_EQ(*s.median_price, 80.0);
    EXPECT_DOUBLE_EQ(*s.price_std, 0.0);
    EXPECT_DOUBLE_EQ(*s.avg_bedrooms, 2.0);
}

TEST(Grid_Reduce, EvenCountMedianAveragesMiddlePair) {
    const std::vector<Listing> listings = {
        make_listing(0, 0, 40.0), make_listing(0, 0, 10.0),
        make_listing(0, 0, 30.0), make_listing(0, 0, 20.0),
    };
    const std::vector<std::size_t> members = {0, 1, 2, 3};
    const auto s = GridAggregationEngine::reduce(listings, members);
    EXPECT_DOUBLE_EQ(*s.median_price, 25.0);
    EXPECT_DOUBLE_EQ(*s.avg_price, 25.0);
    EXPECT_NEAR(*s.price_std, std::sqrt(500.0 / 3.0), 1e-12);
    EXPECT_FALSE(s.avg_bedrooms.has_value());
}

TEST(Grid_Reduce, OverflowingStatisticsAreUnknown) {
    const std::vector<Listing> listings = {
        make_listing(0, 0, 1e308, 1e308), make_listing(0, 0, 1e308, 1e308),
    };
    const std::vector<std::size_t> members = {0, 1};
    const auto s = GridAggregationEngine::reduce(listings, members);
    EXPECT_EQ(s.listing_count, 2u);
    EXPECT_FALSE(s.avg_price.has_value());
    EXPECT_FALSE(s.median_price.has_value());
    EXPECT_FALSE(s.avg_bedrooms.has_value());
    EXPECT_FALSE(s.price_std.has_value());
}

// ─── compute ─────────────────────────────────────────────────────────────────

TEST(Grid_Compute, TwoListingsInOneCellAverage150) {
    const std::vector<Listing> listings = {
        make_listing(-22.9712, -43.1851, 100.0),
        make_listing(-22.9715, -43.1858, 200.0),
    };
    const GridAggregationEngine engine(GeoConfig{});
    const auto out = engine.compute(listings, 2);
    for (Eigen::Index i = 0; i < 2; ++i) {
        EXPECT_EQ(out.status[static_cast<std::size_t>(i)], RowStatus::Computed);
        EXPECT_DOUBLE_EQ(out.values(i, AVG), 150.0);
        EXPECT_DOUBLE_EQ(out.values(i, COUNT), 2.0);
    }
}

TEST(Grid_Compute, SeparateCellsDoNotMix) {
    const std::vector<Listing> listings = {
        make_listing(-22.9712, -43.1851, 100.0),
        make_listing(-22.9512, -43.1851, 300.0),
    };
    const GridAggregationEngine engine(GeoConfig{});
    const auto out = engine.compute(listings, 1);
    EXPECT_DOUBLE_EQ(out.values(0, AVG), 100.0);
    EXPECT_DOUBLE_EQ(out.values(1, AVG), 300.0);
    EXPECT_DOUBLE_EQ(out.values(0, COUNT), 1.0);
}

TEST(Grid_Compute, InvalidCoordinatesGetSentinels) {
    const std::vector<Listing> listings = {make_listing(0.0, 500.0, 100.0)};
    const GridAggregationEngine engine(GeoConfig{});
    const auto out = engine.compute(listings, 1);
    EXPECT_EQ(out.status[0], RowStatus::Unavailable);
    EXPECT_DOUBLE_EQ(out.values(0, AVG), constants::UNKNOWN_ATTRIBUTE);
    EXPECT_DOUBLE_EQ(out.values(0, COUNT), 0.0);
}

TEST(Grid_Compute, RowOrderDoesNotChangeCellValues) {
    std::vector<Listing> listings;
    std::mt19937_64 rng(7);
    std::uniform_real_distribution<double> lat(-22.99, -22.95);
    std::uniform_real_distribution<double> price(40.0, 900.0);
    for (int i = 0; i < 200; ++i) {
        listings.push_back(make_listing(lat(rng), -43.185, price(rng), 1.0 + i % 3));
        listings.back().id = "L" + std::to_string(i);
    }
    std::vector<Listing> shuffled = listings;
    std::shuffle(shuffled.begin(), shuffled.end(), rng);

    const GridAggregationEngine engine(GeoConfig{});
    const auto a = engine.compute(listings, 4);
    const auto b = engine.compute(shuffled, 3);

    for (std::size_t i = 0; i < shuffled.size(); ++i) {
        const auto it = std::find_if(listings.begin(), listings.end(),
                                     [&](const Listing& l) { return l.id == shuffled[i].id; });
        const auto j = static_cast<Eigen::Index>(it - listings.begin());
        for (Eigen::Index c = 0; c < a.values.cols(); ++c) {
            EXPECT_EQ(a.values(j, c), b.values(static_cast<Eigen::Index>(i), c));
        }
    }
}
