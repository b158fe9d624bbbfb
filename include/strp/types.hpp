#pragma once

/// @file include/strp/types.hpp
/// @brief Core value types shared by every pipeline stage.
///
/// # Module: Types
///
/// ## Responsibility
/// Plain data records for listings, points of interest and per-listing
/// feature vectors. No behaviour beyond trivial helpers.
///
/// ## Guarantees
/// - All types are regular value types (copyable, movable)
/// - Optional attributes are `std::optional`; absence is never encoded as a
///   magic number inside these records
///
/// ## NOT Responsible For
/// - Sentinel imputation (see strp/feature_matrix.hpp)
/// - Data acquisition or file formats

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strp {

// ─── Geometry ────────────────────────────────────────────────────────────────

/// WGS-84 coordinate pair in decimal degrees.
struct Coordinates {
    double latitude  = 0.0;
    double longitude = 0.0;

    /// True when both components are finite and inside the valid ranges.
    [[nodiscard]] bool is_valid() const noexcept;
};

// ─── Enumerations ────────────────────────────────────────────────────────────

enum class RoomType : std::uint8_t {
    EntirePlace,
    PrivateRoom,
    SharedRoom,
};

/// POI categories. Order is the canonical column order.
enum class PoiCategory : std::uint8_t {
    Subway,
    BusStation,
    TouristAttraction,
    Beach,
    Viewpoint,
    Museum,
    Park,
    Restaurant,
    Bar,
    Cafe,
    Supermarket,
    Hospital,
    ShoppingMall,
};

inline constexpr std::size_t POI_CATEGORY_COUNT = 13;

inline constexpr std::array<PoiCategory, POI_CATEGORY_COUNT> ALL_POI_CATEGORIES = {
    PoiCategory::Subway,     PoiCategory::BusStation, PoiCategory::TouristAttraction,
    PoiCategory::Beach,      PoiCategory::Viewpoint,  PoiCategory::Museum,
    PoiCategory::Park,       PoiCategory::Restaurant, PoiCategory::Bar,
    PoiCategory::Cafe,       PoiCategory::Supermarket, PoiCategory::Hospital,
    PoiCategory::ShoppingMall,
};

/// Stable snake_case name used in column names ("bus_station").
[[nodiscard]] std::string_view to_string(PoiCategory category) noexcept;

/// Inverse of `to_string`; nullopt for unknown names.
[[nodiscard]] std::optional<PoiCategory> parse_poi_category(std::string_view name) noexcept;

[[nodiscard]] std::string_view to_string(RoomType room) noexcept;

// ─── Listing ─────────────────────────────────────────────────────────────────

/// Six optional guest sub-ratings, each on the same scale as the overall
/// rating.
struct SubRatings {
    std::optional<double> accuracy;
    std::optional<double> cleanliness;
    std::optional<double> checkin;
    std::optional<double> communication;
    std::optional<double> location;
    std::optional<double> value;

    /// The present sub-ratings, in declaration order.
    [[nodiscard]] std::vector<double> available() const;
};

struct HostProfile {
    bool is_superhost        = false;
    bool identity_verified   = false;
    std::optional<double> response_rate;    ///< Fraction in [0, 1]
    std::optional<double> acceptance_rate;  ///< Fraction in [0, 1]
    std::optional<std::chrono::year_month_day> host_since;
    std::optional<int> listings_count;
};

struct Availability {
    std::optional<int> days_30;
    std::optional<int> days_60;
    std::optional<int> days_90;
};

/// One short-term rental listing. Immutable input to every engine.
struct Listing {
    std::string id;
    Coordinates coords;
    double      price = 0.0;  ///< Nightly price, the regression target
    RoomType    room_type = RoomType::EntirePlace;

    std::optional<int>    accommodates;
    std::optional<double> bedrooms;
    std::optional<double> bathrooms;
    std::optional<double> beds;

    std::optional<double> rating;
    SubRatings            sub_ratings;
    int                   review_count = 0;
    std::optional<double> reviews_per_month;

    HostProfile host;

    std::optional<std::string> amenities_raw;
    Availability               availability;
    std::optional<std::chrono::year_month_day> last_review;
};

// ─── Point of interest ───────────────────────────────────────────────────────

struct Poi {
    std::string id;
    Coordinates coords;
    PoiCategory category = PoiCategory::Restaurant;
};

// ─── Feature vector ──────────────────────────────────────────────────────────

/// One listing's features as parallel name/value lists.
struct FeatureVector {
    std::vector<std::string> names;
    std::vector<double>      values;

    /// Value of a named column, or nullopt when the column is absent.
    [[nodiscard]] std::optional<double> get(std::string_view name) const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return values.size(); }
};

}  // namespace strp
