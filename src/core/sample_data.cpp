/// @file src/core/sample_data.cpp
/// @brief SampleCityGenerator.

#include "strp/sample_data.hpp"
#include "strp/geo.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <fmt/format.h>
#include <random>
#include <string>
#include <string_view>

namespace strp::core {

namespace {

constexpr std::array<std::string_view, 16> AMENITY_POOL = {
    "Wifi", "Kitchen", "Air conditioning", "Heating", "TV", "Hot water",
    "Pool", "Gym", "Elevator", "Doorman", "Free parking", "Washer",
    "Dryer", "Laptop friendly workspace", "Ethernet connection", "Hair dryer",
};

/// Index of the first premium amenity in AMENITY_POOL.
constexpr std::size_t PREMIUM_BEGIN = 6;

enum class AmenityFormat : unsigned char { Braced, Bracketed, Delimited };

[[nodiscard]] std::string render_amenities(const std::vector<std::string_view>& items,
                                           AmenityFormat format) {
    std::string body;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) body += format == AmenityFormat::Delimited ? ", " : ",";
        switch (format) {
            case AmenityFormat::Braced:
                // Multi-word names are quoted, single words left bare.
                body += items[i].find(' ') == std::string_view::npos
                            ? std::string(items[i])
                            : fmt::format("\"{}\"", items[i]);
                break;
            case AmenityFormat::Bracketed:
                body += fmt::format("\"{}\"", items[i]);
                break;
            case AmenityFormat::Delimited:
                body += items[i];
                break;
        }
    }
    switch (format) {
        case AmenityFormat::Braced:    return "{" + body + "}";
        case AmenityFormat::Bracketed: return "[" + body + "]";
        case AmenityFormat::Delimited: return body;
    }
    return body;
}

}  // namespace

SampleCity SampleCityGenerator::generate() const {
    using namespace std::chrono;

    std::mt19937_64 rng(config_.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_real_distribution<double> offset(-config_.spread_degrees, config_.spread_degrees);
    std::normal_distribution<double>       noise(0.0, 15.0);

    auto chance  = [&](double p) { return unit(rng) < p; };
    auto missing = [&] { return chance(config_.missing_fraction); };
    auto around  = [&] {
        return Coordinates{config_.centre.latitude + offset(rng),
                           config_.centre.longitude + offset(rng)};
    };

    SampleCity city;

    // ── POIs ────────────────────────────────────────────────────────────────
    city.pois.reserve(config_.pois_per_category * POI_CATEGORY_COUNT);
    for (const auto category : ALL_POI_CATEGORIES) {
        for (std::size_t i = 0; i < config_.pois_per_category; ++i) {
            city.pois.push_back(Poi{
                .id       = fmt::format("{}-{}", to_string(category), i),
                .coords   = around(),
                .category = category,
            });
        }
    }

    auto nearest_beach_km = [&](const Coordinates& c) {
        double best = 10.0;
        for (const auto& p : city.pois) {
            if (p.category == PoiCategory::Beach) best = std::min(best, geo::haversine_km(c, p.coords));
        }
        return best;
    };

    // ── Listings ────────────────────────────────────────────────────────────
    const sys_days as_of{config_.as_of};
    std::uniform_int_distribution<int> bedrooms_dist(0, 4);
    std::uniform_int_distribution<int> reviews_dist(0, 250);
    std::uniform_int_distribution<int> days_back(0, 720);
    std::uniform_int_distribution<int> host_days_back(180, 4000);
    std::uniform_int_distribution<int> avail_30(0, 30);
    std::uniform_int_distribution<int> format_dist(0, 2);
    std::uniform_int_distribution<int> host_listings(1, 8);
    std::uniform_real_distribution<double> rating_dist(3.6, 5.0);
    std::uniform_real_distribution<double> sub_jitter(-0.3, 0.3);

    city.listings.reserve(config_.listings);
    for (std::size_t i = 0; i < config_.listings; ++i) {
        Listing l;
        l.id     = fmt::format("L{:05}", i);
        l.coords = around();

        const double room_roll = unit(rng);
        l.room_type = room_roll < 0.65 ? RoomType::EntirePlace
                    : room_roll < 0.95 ? RoomType::PrivateRoom
                                       : RoomType::SharedRoom;

        const int bedrooms = l.room_type == RoomType::EntirePlace ? bedrooms_dist(rng) : 1;
        const double bathrooms = std::max(1.0, std::round(bedrooms * 0.6 * 2.0) / 2.0);
        if (!missing()) l.bedrooms = bedrooms;
        if (!missing()) l.bathrooms = bathrooms;
        if (!missing()) l.beds = std::max(1, bedrooms + (chance(0.4) ? 1 : 0));
        if (!missing()) l.accommodates = std::max(1, bedrooms * 2 + (chance(0.5) ? 1 : 0));

        // Reviews
        l.review_count = reviews_dist(rng);
        if (l.review_count > 0) {
            const double rating = std::round(rating_dist(rng) * 100.0) / 100.0;
            l.rating = rating;
            auto sub = [&]() -> std::optional<double> {
                if (missing()) return std::nullopt;
                return std::clamp(rating + sub_jitter(rng), 0.0, 5.0);
            };
            l.sub_ratings = SubRatings{sub(), sub(), sub(), sub(), sub(), sub()};
            l.reviews_per_month = std::round(l.review_count / 24.0 * 100.0) / 100.0;
            l.last_review = year_month_day{as_of - days{days_back(rng)}};
        }

        // Host
        l.host.is_superhost      = chance(0.25);
        l.host.identity_verified = chance(0.7);
        if (!missing()) l.host.response_rate = std::round(unit(rng) * 100.0) / 100.0;
        if (!missing()) l.host.acceptance_rate = std::round(unit(rng) * 100.0) / 100.0;
        if (!missing()) l.host.host_since = year_month_day{as_of - days{host_days_back(rng)}};
        l.host.listings_count = host_listings(rng);

        // Availability
        if (!missing()) {
            const int a30 = avail_30(rng);
            l.availability = Availability{a30, a30 + avail_30(rng), a30 + 2 * avail_30(rng)};
        }

        // Amenities
        std::vector<std::string_view> items;
        for (const auto a : AMENITY_POOL) {
            if (chance(0.45)) items.push_back(a);
        }
        const bool has_pool = std::find(items.begin(), items.end(), "Pool") != items.end();
        const auto premium_count = static_cast<double>(std::count_if(
            items.begin(), items.end(), [](std::string_view a) {
                const auto it = std::find(AMENITY_POOL.begin(), AMENITY_POOL.end(), a);
                const auto k  = static_cast<std::size_t>(it - AMENITY_POOL.begin());
                return k >= PREMIUM_BEGIN && k < PREMIUM_BEGIN + 8;
            }));
        if (chance(config_.malformed_amenity_fraction)) {
            l.amenities_raw = "{Wifi,\x01Kitchen}";
        } else if (!missing()) {
            l.amenities_raw = render_amenities(items, static_cast<AmenityFormat>(format_dist(rng)));
        }

        // Price
        const double beach_km = nearest_beach_km(l.coords);
        double price = 70.0 + 55.0 * bedrooms + 110.0 * std::exp(-beach_km / 1.5) +
                       6.0 * premium_count + (has_pool ? 30.0 : 0.0);
        if (l.room_type == RoomType::PrivateRoom) price *= 0.55;
        if (l.room_type == RoomType::SharedRoom)  price *= 0.35;
        if (l.rating) price += 20.0 * (*l.rating - 4.3);
        if (l.host.is_superhost) price += 10.0;
        l.price = std::max(15.0, std::round((price + noise(rng)) * 100.0) / 100.0);

        city.listings.push_back(std::move(l));
    }
    return city;
}

}  // namespace strp::core
