/// @file src/geo/distance_features.cpp
/// @brief DistanceFeatureEngine: per-category distance, density and
///        accessibility columns.

#include "strp/geo.hpp"
#include "strp/constants.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace strp::geo {

namespace {

/// Distance with the miss sentinel replaced by the cap.
[[nodiscard]] double capped(double distance_km, double cap_km) noexcept {
    return distance_km < 0.0 ? cap_km : distance_km;
}

}  // namespace

DistanceFeatureEngine::DistanceFeatureEngine(std::shared_ptr<const GeoIndex> index,
                                             GeoConfig config)
    : index_(std::move(index)), config_(std::move(config)) {
    if (!index_) throw std::invalid_argument("DistanceFeatureEngine requires a GeoIndex");

    columns_.reserve(config_.categories.size() * 2 + 2);
    for (const auto c : config_.categories) {
        columns_.push_back({fmt::format("distance_to_{}", to_string(c)),
                            constants::NO_POI_WITHIN_CAP_KM});
        columns_.push_back({density_column(c), constants::UNKNOWN_ATTRIBUTE});
    }
    columns_.push_back({"accessibility_score", constants::UNKNOWN_ATTRIBUTE});
    columns_.push_back({"transport_score", constants::UNKNOWN_ATTRIBUTE});
}

std::string DistanceFeatureEngine::density_column(PoiCategory category) const {
    return fmt::format("density_{}_{:g}km", to_string(category), config_.density_radius_km);
}

RowStatus DistanceFeatureEngine::compute_row(const Listing& listing,
                                             std::span<double> row) const {
    if (!listing.coords.is_valid()) return RowStatus::Unavailable;

    const double cap = index_->distance_cap_km();
    double sum_capped = 0.0;
    std::optional<double> nearest_transit;

    std::size_t col = 0;
    for (const auto c : config_.categories) {
        const double d = index_->nearest_distance(listing.coords, c);
        row[col++] = d;
        row[col++] = static_cast<double>(
            index_->count_within(listing.coords, c, config_.density_radius_km));

        sum_capped += capped(d, cap);
        if (c == PoiCategory::Subway || c == PoiCategory::BusStation) {
            const double t = capped(d, cap);
            nearest_transit = nearest_transit ? std::min(*nearest_transit, t) : t;
        }
    }

    // accessibility = 1 / (mean capped distance + 0.1)
    const auto n_cat = config_.categories.size();
    row[col++] = n_cat == 0
        ? 0.0
        : 1.0 / (sum_capped / static_cast<double>(n_cat) + constants::ACCESSIBILITY_OFFSET_KM);
    row[col++] = nearest_transit
        ? 1.0 / (*nearest_transit + constants::ACCESSIBILITY_OFFSET_KM)
        : 0.0;
    return RowStatus::Computed;
}

}  // namespace strp::geo
