#pragma once

/// @file include/strp/geo.hpp
/// @brief Geospatial POI index and the distance/density feature engine.
///
/// # Module: Geospatial Index
///
/// ## Responsibility
/// Answer "how far is the nearest POI of category C" and "how many POIs of
/// category C lie within r km" for any point, using great-circle
/// (haversine) distance on a spherical Earth of radius 6371 km.
///
/// ## Spatial hashing
/// POIs are bucketed per category into square lat/lon cells of
/// `bucket_degrees`. A query visits only the cells overlapping the search
/// radius's bounding box:
///
///     Δlat = r / (R · π/180)
///     Δlon = Δlat / cos(φ_max)
///
/// Near the poles or across the antimeridian the box degenerates, and the
/// query falls back to a full scan of the category.
///
/// ## Guarantees
/// - Deterministic: candidates are scored in POI load order and ties keep
///   the earliest-loaded POI
/// - Read-only after construction; concurrent queries need no locking
/// - A miss is the sentinel `constants::NO_POI_WITHIN_CAP_KM`, never an error
///
/// ## NOT Responsible For
/// - Road-network or travel-time distances
/// - Fetching POIs from any external source

#include "strp/config.hpp"
#include "strp/constants.hpp"
#include "strp/feature_engine.hpp"
#include "strp/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <unordered_map>
#include <vector>

namespace strp::geo {

/// Great-circle distance in kilometres.
///
/// # Returns
/// Non-negative distance, exactly 0 for identical points. NaN propagates
/// for non-finite input.
[[nodiscard]] double haversine_km(const Coordinates& a, const Coordinates& b) noexcept;

/// Result of a nearest-POI query.
struct PoiHit {
    std::size_t poi_index;    ///< Index into `GeoIndex::pois()`
    double      distance_km;
};

class GeoIndex {
public:
    /// Build an index over `pois`. POIs with invalid coordinates are
    /// skipped and counted in `skipped_count()`.
    ///
    /// # Arguments
    /// * `distance_cap_km` - nearest-POI searches ignore POIs beyond this
    /// * `bucket_degrees`  - spatial hash cell size
    explicit GeoIndex(std::span<const Poi> pois,
                      double distance_cap_km = constants::DEFAULT_DISTANCE_CAP_KM,
                      double bucket_degrees  = constants::POI_BUCKET_DEGREES);

    /// Distance to the nearest POI of `category`, or
    /// `constants::NO_POI_WITHIN_CAP_KM` if none lies within the cap or the
    /// point is invalid.
    [[nodiscard]] double nearest_distance(const Coordinates& point,
                                          PoiCategory category) const;

    /// Nearest POI of `category` within the cap.
    [[nodiscard]] std::optional<PoiHit> nearest(const Coordinates& point,
                                                PoiCategory category) const;

    /// Number of POIs of `category` within `radius_km` (inclusive). Zero for
    /// an invalid point or a non-positive radius.
    [[nodiscard]] std::size_t count_within(const Coordinates& point,
                                           PoiCategory category,
                                           double radius_km = constants::DEFAULT_DENSITY_RADIUS_KM) const;

    [[nodiscard]] const std::vector<Poi>& pois() const noexcept { return pois_; }
    [[nodiscard]] std::size_t size() const noexcept { return pois_.size(); }
    [[nodiscard]] std::size_t size(PoiCategory category) const noexcept;
    [[nodiscard]] std::size_t skipped_count() const noexcept { return skipped_; }
    [[nodiscard]] double distance_cap_km() const noexcept { return cap_km_; }

private:
    struct CategoryBuckets {
        std::vector<std::size_t> members;  ///< POI indices in load order
        std::unordered_map<std::int64_t, std::vector<std::size_t>> cells;
    };

    /// POI indices of `category` that may lie within `radius_km`, ascending.
    [[nodiscard]] std::vector<std::size_t> candidates(const Coordinates& point,
                                                      PoiCategory category,
                                                      double radius_km) const;

    [[nodiscard]] std::int64_t cell_key(std::int64_t lat_cell, std::int64_t lon_cell) const noexcept;

    std::vector<Poi> pois_;
    std::array<CategoryBuckets, POI_CATEGORY_COUNT> buckets_;
    double      cap_km_;
    double      bucket_deg_;
    std::size_t skipped_ = 0;
};

// ─── DistanceFeatureEngine ───────────────────────────────────────────────────

/// Per-listing distance and density features over a shared `GeoIndex`.
///
/// Columns, per configured category `c`:
///   - `distance_to_<c>`       nearest distance in km, sentinel -1
///   - `density_<c>_<r>km`     POIs within r km
/// followed by `accessibility_score` and `transport_score`.
class DistanceFeatureEngine final : public PerListingEngine {
public:
    DistanceFeatureEngine(std::shared_ptr<const GeoIndex> index, GeoConfig config);

    [[nodiscard]] std::string_view name() const noexcept override { return "distance"; }
    [[nodiscard]] const std::vector<ColumnSpec>& columns() const noexcept override { return columns_; }

    [[nodiscard]] const GeoIndex& index() const noexcept { return *index_; }

    /// Column name for a category's density at the configured radius.
    [[nodiscard]] std::string density_column(PoiCategory category) const;

protected:
    [[nodiscard]] RowStatus compute_row(const Listing& listing,
                                        std::span<double> row) const override;

private:
    std::shared_ptr<const GeoIndex> index_;
    GeoConfig                       config_;
    std::vector<ColumnSpec>         columns_;
};

}  // namespace strp::geo
