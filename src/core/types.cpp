/// @file src/core/types.cpp
/// @brief Name tables and small helpers for the value types in strp/types.hpp.

#include "strp/types.hpp"

#include <algorithm>
#include <cmath>

namespace strp {

namespace {

constexpr std::array<std::string_view, POI_CATEGORY_COUNT> POI_NAMES = {
    "subway",     "bus_station", "tourist_attraction",
    "beach",      "viewpoint",   "museum",
    "park",       "restaurant",  "bar",
    "cafe",       "supermarket", "hospital",
    "shopping_mall",
};

}  // namespace

bool Coordinates::is_valid() const noexcept {
    return std::isfinite(latitude) && std::isfinite(longitude) &&
           latitude >= -90.0 && latitude <= 90.0 &&
           longitude >= -180.0 && longitude <= 180.0;
}

std::string_view to_string(PoiCategory category) noexcept {
    return POI_NAMES[static_cast<std::size_t>(category)];
}

std::optional<PoiCategory> parse_poi_category(std::string_view name) noexcept {
    const auto it = std::find(POI_NAMES.begin(), POI_NAMES.end(), name);
    if (it == POI_NAMES.end()) return std::nullopt;
    return static_cast<PoiCategory>(std::distance(POI_NAMES.begin(), it));
}

std::string_view to_string(RoomType room) noexcept {
    switch (room) {
        case RoomType::EntirePlace: return "entire_place";
        case RoomType::PrivateRoom: return "private_room";
        case RoomType::SharedRoom:  return "shared_room";
    }
    return "unknown";
}

std::vector<double> SubRatings::available() const {
    std::vector<double> out;
    out.reserve(6);
    for (const auto& r : {accuracy, cleanliness, checkin, communication, location, value}) {
        if (r && std::isfinite(*r)) out.push_back(*r);
    }
    return out;
}

std::optional<double> FeatureVector::get(std::string_view name) const noexcept {
    const auto it = std::find(names.begin(), names.end(), name);
    if (it == names.end()) return std::nullopt;
    const auto idx = static_cast<std::size_t>(std::distance(names.begin(), it));
    if (idx >= values.size()) return std::nullopt;
    return values[idx];
}

}  // namespace strp
