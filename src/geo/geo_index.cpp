/// @file src/geo/geo_index.cpp
/// @brief Haversine distance and the bucketed per-category POI index.

#include "strp/geo.hpp"
#include "strp/constants.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace strp::geo {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

constexpr double DEG_TO_RAD = std::numbers::pi / 180.0;

/// Kilometres per degree of latitude.
constexpr double KM_PER_DEGREE = constants::EARTH_RADIUS_KM * DEG_TO_RAD;

/// Bounding boxes are widened by this factor so rounding never drops a
/// POI that is exactly on the radius.
constexpr double BOX_MARGIN = 1.001;

/// Latitude beyond which a query box is treated as polar.
constexpr double POLAR_LATITUDE = 89.0;

[[nodiscard]] std::int64_t cell_index(double degrees, double bucket) noexcept {
    return static_cast<std::int64_t>(std::floor(degrees / bucket));
}

}  // namespace

// ─── Haversine ───────────────────────────────────────────────────────────────

double haversine_km(const Coordinates& a, const Coordinates& b) noexcept {
    const double lat1 = a.latitude * DEG_TO_RAD;
    const double lat2 = b.latitude * DEG_TO_RAD;
    const double dlat = (b.latitude - a.latitude) * DEG_TO_RAD;
    const double dlon = (b.longitude - a.longitude) * DEG_TO_RAD;

    const double s_lat = std::sin(dlat / 2.0);
    const double s_lon = std::sin(dlon / 2.0);
    const double h     = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;

    // d = 2R · asin(√h), h clamped against rounding above 1.
    return 2.0 * constants::EARTH_RADIUS_KM * std::asin(std::min(1.0, std::sqrt(h)));
}

// ─── GeoIndex ────────────────────────────────────────────────────────────────

GeoIndex::GeoIndex(std::span<const Poi> pois, double distance_cap_km, double bucket_degrees)
    : cap_km_(distance_cap_km), bucket_deg_(bucket_degrees) {
    pois_.reserve(pois.size());
    for (const auto& poi : pois) {
        if (!poi.coords.is_valid()) {
            ++skipped_;
            continue;
        }
        const std::size_t idx = pois_.size();
        pois_.push_back(poi);

        auto& b = buckets_[static_cast<std::size_t>(poi.category)];
        b.members.push_back(idx);
        const auto key = cell_key(cell_index(poi.coords.latitude, bucket_deg_),
                                  cell_index(poi.coords.longitude, bucket_deg_));
        b.cells[key].push_back(idx);
    }
}

std::int64_t GeoIndex::cell_key(std::int64_t lat_cell, std::int64_t lon_cell) const noexcept {
    return (lat_cell << 32) ^ static_cast<std::int64_t>(static_cast<std::uint32_t>(lon_cell));
}

std::size_t GeoIndex::size(PoiCategory category) const noexcept {
    return buckets_[static_cast<std::size_t>(category)].members.size();
}

std::vector<std::size_t> GeoIndex::candidates(const Coordinates& point,
                                              PoiCategory category,
                                              double radius_km) const {
    const auto& b = buckets_[static_cast<std::size_t>(category)];
    if (b.members.empty()) return {};

    const double dlat    = radius_km / KM_PER_DEGREE * BOX_MARGIN;
    const double lat_lo  = point.latitude - dlat;
    const double lat_hi  = point.latitude + dlat;
    const double phi_max = std::max(std::abs(lat_lo), std::abs(lat_hi));
    if (phi_max >= POLAR_LATITUDE) return b.members;

    const double dlon   = dlat / std::cos(phi_max * DEG_TO_RAD);
    const double lon_lo = point.longitude - dlon;
    const double lon_hi = point.longitude + dlon;
    if (lon_lo < -180.0 || lon_hi > 180.0) return b.members;

    const auto r0 = cell_index(lat_lo, bucket_deg_);
    const auto r1 = cell_index(lat_hi, bucket_deg_);
    const auto c0 = cell_index(lon_lo, bucket_deg_);
    const auto c1 = cell_index(lon_hi, bucket_deg_);

    // A box wider than the category itself is cheaper to scan directly.
    const auto cell_count = static_cast<double>(r1 - r0 + 1) * static_cast<double>(c1 - c0 + 1);
    if (cell_count > static_cast<double>(b.members.size())) return b.members;

    std::vector<std::size_t> out;
    for (auto r = r0; r <= r1; ++r) {
        for (auto c = c0; c <= c1; ++c) {
            const auto it = b.cells.find(cell_key(r, c));
            if (it == b.cells.end()) continue;
            out.insert(out.end(), it->second.begin(), it->second.end());
        }
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::optional<PoiHit> GeoIndex::nearest(const Coordinates& point,
                                        PoiCategory category) const {
    if (!point.is_valid()) return std::nullopt;
    std::optional<PoiHit> best;
    for (const std::size_t idx : candidates(point, category, cap_km_)) {
        const double d = haversine_km(point, pois_[idx].coords);
        if (d > cap_km_) continue;
        // Strict < keeps the earliest-loaded POI on ties.
        if (!best || d < best->distance_km) best = PoiHit{idx, d};
    }
    return best;
}

double GeoIndex::nearest_distance(const Coordinates& point,
                                  PoiCategory category) const {
    const auto hit = nearest(point, category);
    return hit ? hit->distance_km : constants::NO_POI_WITHIN_CAP_KM;
}

std::size_t GeoIndex::count_within(const Coordinates& point,
                                   PoiCategory category,
                                   double radius_km) const {
    if (!point.is_valid() || !(radius_km > 0.0) || !std::isfinite(radius_km)) return 0;
    std::size_t n = 0;
    for (const std::size_t idx : candidates(point, category, radius_km)) {
        if (haversine_km(point, pois_[idx].coords) <= radius_km) ++n;
    }
    return n;
}

}  // namespace strp::geo
