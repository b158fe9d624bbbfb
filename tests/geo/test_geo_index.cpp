#include <gtest/gtest.h>
#include "strp/geo.hpp"
#include "strp/constants.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <numbers>
#include <vector>

using namespace strp;
using namespace strp::geo;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static Poi make_poi(std::string id, double lat, double lon, PoiCategory cat) {
    return Poi{.id = std::move(id), .coords = {lat, lon}, .category = cat};
}

static Listing make_listing(std::string id, double lat, double lon) {
    Listing l;
    l.id     = std::move(id);
    l.coords = {lat, lon};
    l.price  = 100.0;
    return l;
}

/// Kilometres per degree of latitude on the 6371 km sphere.
static constexpr double KM_PER_DEGREE = constants::EARTH_RADIUS_KM * std::numbers::pi / 180.0;

// ─── haversine_km ────────────────────────────────────────────────────────────

TEST(Haversine, SamePointIsZero) {
    const Coordinates p{-22.97, -43.19};
    EXPECT_DOUBLE_EQ(haversine_km(p, p), 0.0);
}

TEST(Haversine, OneDegreeOfLatitude) {
    EXPECT_NEAR(haversine_km({0.0, 0.0}, {1.0, 0.0}), KM_PER_DEGREE, 1e-9);
}

TEST(Haversine, Symmetric) {
    const Coordinates a{-22.97, -43.19};
    const Coordinates b{-22.91, -43.17};
    EXPECT_DOUBLE_EQ(haversine_km(a, b), haversine_km(b, a));
}

TEST(Haversine, AntipodesIsHalfCircumference) {
    EXPECT_NEAR(haversine_km({0.0, 0.0}, {0.0, 180.0}),
                constants::EARTH_RADIUS_KM * std::numbers::pi, 1e-6);
}

// ─── GeoIndex construction ───────────────────────────────────────────────────

TEST(GeoIndex_Build, InvalidCoordinatesAreSkipped) {
    const std::vector<Poi> pois = {
        make_poi("ok", -22.97, -43.19, PoiCategory::Beach),
        make_poi("nan", std::numeric_limits<double>::quiet_NaN(), 0.0, PoiCategory::Beach),
        make_poi("far", 95.0, 0.0, PoiCategory::Park),
    };
    const GeoIndex index(pois);
    EXPECT_EQ(index.size(), 1u);
    EXPECT_EQ(index.skipped_count(), 2u);
    EXPECT_EQ(index.size(PoiCategory::Beach), 1u);
    EXPECT_EQ(index.size(PoiCategory::Park), 0u);
}

// ─── nearest / nearest_distance ──────────────────────────────────────────────

TEST(GeoIndex_Nearest, PicksClosestOfCategory) {
    const std::vector<Poi> pois = {
        make_poi("far", 0.05, 0.0, PoiCategory::Museum),
        make_poi("near", 0.01, 0.0, PoiCategory::Museum),
        make_poi("other", 0.001, 0.0, PoiCategory::Bar),
    };
    const GeoIndex index(pois);
    const auto hit = index.nearest({0.0, 0.0}, PoiCategory::Museum);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(index.pois()[hit->poi_index].id, "near");
    EXPECT_NEAR(hit->distance_km, 0.01 * KM_PER_DEGREE, 1e-9);
}

TEST(GeoIndex_Nearest, BeyondCapIsSentinel) {
    const std::vector<Poi> pois = {make_poi("far", 1.0, 0.0, PoiCategory::Beach)};
    const GeoIndex index(pois, 10.0);
    EXPECT_FALSE(index.nearest({0.0, 0.0}, PoiCategory::Beach).has_value());
    EXPECT_DOUBLE_EQ(index.nearest_distance({0.0, 0.0}, PoiCategory::Beach),
                     constants::NO_POI_WITHIN_CAP_KM);
}

TEST(GeoIndex_Nearest, EmptyCategoryIsSentinel) {
    const std::vector<Poi> pois = {make_poi("b", 0.0, 0.0, PoiCategory::Bar)};
    const GeoIndex index(pois);
    EXPECT_DOUBLE_EQ(index.nearest_distance({0.0, 0.0}, PoiCategory::Hospital),
                     constants::NO_POI_WITHIN_CAP_KM);
}

TEST(GeoIndex_Nearest, TieGoesToEarliestPoi) {
    const std::vector<Poi> pois = {
        make_poi("first", 0.0, 0.01, PoiCategory::Cafe),
        make_poi("second", 0.0, -0.01, PoiCategory::Cafe),
    };
    const GeoIndex index(pois);
    const auto hit = index.nearest({0.0, 0.0}, PoiCategory::Cafe);
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(index.pois()[hit->poi_index].id, "first");
}

TEST(GeoIndex_Nearest, InvalidQueryPointHasNoHit) {
    const std::vector<Poi> pois = {make_poi("b", 0.0, 0.0, PoiCategory::Beach)};
    const GeoIndex index(pois);
    EXPECT_FALSE(index.nearest({std::numeric_limits<double>::quiet_NaN(), 0.0},
                               PoiCategory::Beach).has_value());
}

TEST(GeoIndex_Nearest, MatchesBruteForceAcrossBuckets) {
    std::vector<Poi> pois;
    for (int i = 0; i < 40; ++i) {
        const double lat = -23.0 + 0.013 * (i % 8);
        const double lon = -43.3 + 0.021 * (i / 8);
        pois.push_back(make_poi("p" + std::to_string(i), lat, lon, PoiCategory::Restaurant));
    }
    const GeoIndex index(pois);
    for (int q = 0; q < 25; ++q) {
        const Coordinates point{-23.01 + 0.005 * q, -43.32 + 0.004 * q};
        double best = std::numeric_limits<double>::infinity();
        for (const auto& p : pois) best = std::min(best, haversine_km(point, p.coords));
        const auto hit = index.nearest(point, PoiCategory::Restaurant);
        ASSERT_TRUE(hit.has_value());
        EXPECT_DOUBLE_EQ(hit->distance_km, best) << "query " << q;
    }
}

TEST(GeoIndex_Nearest, WorksAcrossAntimeridian) {
    const std::vector<Poi> pois = {make_poi("east", 0.0, 179.99, PoiCategory::Viewpoint)};
    const GeoIndex index(pois);
    const auto hit = index.nearest({0.0, -179.99}, PoiCategory::Viewpoint);
    ASSERT_TRUE(hit.has_value());
    EXPECT_NEAR(hit->distance_km, 0.02 * KM_PER_DEGREE, 1e-6);
}

// ─── count_within ────────────────────────────────────────────────────────────

TEST(GeoIndex_CountWithin, CountsOnlyInsideRadius) {
    const std::vector<Poi> pois = {
        make_poi("a", 0.0, 0.0, PoiCategory::Park),
        make_poi("b", 0.005, 0.0, PoiCategory::Park),   // ~0.56 km
        make_poi("c", 0.02, 0.0, PoiCategory::Park),    // ~2.2 km
        make_poi("d", 0.0, 0.0, PoiCategory::Museum),
    };
    const GeoIndex index(pois);
    EXPECT_EQ(index.count_within({0.0, 0.0}, PoiCategory::Park, 1.0), 2u);
    EXPECT_EQ(index.count_within({0.0, 0.0}, PoiCategory::Park, 3.0), 3u);
    EXPECT_EQ(index.count_within({0.0, 0.0}, PoiCategory::Museum, 1.0), 1u);
}

TEST(GeoIndex_CountWithin, RadiusIsInclusive) {
    const std::vector<Poi> pois = {make_poi("edge", 0.01, 0.0, PoiCategory::Subway)};
    const GeoIndex index(pois);
    const double d = haversine_km({0.0, 0.0}, pois[0].coords);
    EXPECT_EQ(index.count_within({0.0, 0.0}, PoiCategory::Subway, d), 1u);
}

// ─── DistanceFeatureEngine ───────────────────────────────────────────────────

namespace {

struct DistanceFixture {
    std::shared_ptr<const GeoIndex> index;
    GeoConfig                       config;
    std::unique_ptr<DistanceFeatureEngine> engine;

    explicit DistanceFixture(const std::vector<Poi>& pois, GeoConfig cfg = {})
        : index(std::make_shared<const GeoIndex>(pois, cfg.distance_cap_km)),
          config(std::move(cfg)),
          engine(std::make_unique<DistanceFeatureEngine>(index, config)) {}

    [[nodiscard]] std::size_t col(const std::string& name) const {
        const auto& cols = engine->columns();
        for (std::size_t j = 0; j < cols.size(); ++j) {
            if (cols[j].name == name) return j;
        }
        ADD_FAILURE() << "missing column " << name;
        return 0;
    }
};

}  // namespace

TEST(DistanceEngine_Schema, ColumnsPerCategoryPlusScores) {
    const DistanceFixture f(std::vector<Poi>{});
    EXPECT_EQ(f.engine->columns().size(), 2 * POI_CATEGORY_COUNT + 2);
    EXPECT_EQ(f.engine->columns().front().name, "distance_to_subway");
    EXPECT_EQ(f.engine->density_column(PoiCategory::Beach), "density_beach_1km");
    EXPECT_EQ(f.engine->columns().back().name, "transport_score");
}

TEST(DistanceEngine_Compute, BeachAtListingIsZeroDistance) {
    const DistanceFixture f({make_poi("beach", -22.97, -43.19, PoiCategory::Beach)});
    const std::vector<Listing> listings = {make_listing("L1", -22.97, -43.19)};
    const auto out = f.engine->compute(listings, 1);

    ASSERT_EQ(out.status.size(), 1u);
    EXPECT_EQ(out.status[0], RowStatus::Computed);
    EXPECT_DOUBLE_EQ(out.values(0, f.col("distance_to_beach")), 0.0);
    EXPECT_GE(out.values(0, f.col("density_beach_1km")), 1.0);
    EXPECT_DOUBLE_EQ(out.values(0, f.col("distance_to_museum")), constants::NO_POI_WITHIN_CAP_KM);
}

TEST(DistanceEngine_Compute, InvalidCoordinatesAreUnavailable) {
    const DistanceFixture f({make_poi("beach", 0.0, 0.0, PoiCategory::Beach)});
    const std::vector<Listing> listings = {make_listing("bad", 200.0, 0.0)};
    const auto out = f.engine->compute(listings, 1);
    EXPECT_EQ(out.status[0], RowStatus::Unavailable);
    for (Eigen::Index j = 0; j < out.values.cols(); ++j) {
        EXPECT_DOUBLE_EQ(out.values(0, j), f.engine->columns()[static_cast<std::size_t>(j)].sentinel);
    }
}

TEST(DistanceEngine_Compute, TransportScoreUsesNearestStation) {
    const DistanceFixture f({
        make_poi("subway", 0.0, 0.0, PoiCategory::Subway),
        make_poi("bus", 0.05, 0.0, PoiCategory::BusStation),
    });
    const std::vector<Listing> listings = {make_listing("L", 0.0, 0.0)};
    const auto out = f.engine->compute(listings, 1);
    EXPECT_NEAR(out.values(0, f.col("transport_score")), 1.0 / constants::ACCESSIBILITY_OFFSET_KM, 1e-9);
    EXPECT_GT(out.values(0, f.col("accessibility_score")), 0.0);
}

TEST(DistanceEngine_Compute, DeterministicAcrossWorkerCounts) {
    std::vector<Poi> pois;
    for (int i = 0; i < 30; ++i) {
        pois.push_back(make_poi("p" + std::to_string(i), -22.95 + 0.003 * i, -43.2 + 0.002 * i,
                                ALL_POI_CATEGORIES[static_cast<std::size_t>(i) % POI_CATEGORY_COUNT]));
    }
    std::vector<Listing> listings;
    for (int i = 0; i < 50; ++i) {
        listings.push_back(make_listing("L" + std::to_string(i), -22.96 + 0.001 * i, -43.19));
    }
    const DistanceFixture f(pois);
    const auto one  = f.engine->compute(listings, 1);
    const auto many = f.engine->compute(listings, 8);
    EXPECT_TRUE(one.values == many.values);
}
