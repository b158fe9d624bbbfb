#pragma once

/// @file include/strp/sample_data.hpp
/// @brief Seeded synthetic city: listings and POIs for demos, tests and benchmarks.
///
/// # Module: Sample City
///
/// ## Responsibility
/// Scatter POIs of every category around a city centre and generate
/// listings whose price depends on size, room type, beach proximity, rating
/// and amenities plus Gaussian noise, so the regressors have signal to learn.
///
/// ## Guarantees
/// - Same config (including seed) → identical listings and POIs
/// - Prices are strictly positive
/// - Optional fields go missing at `missing_fraction`, and amenity text is
///   corrupted at `malformed_amenity_fraction`
///
/// ## NOT Responsible For
/// - Loading real datasets

#include "strp/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace strp::core {

struct SampleCityConfig {
    std::size_t   listings          = 300;
    std::size_t   pois_per_category = 6;
    std::uint64_t seed              = 42;

    Coordinates centre{-22.9700, -43.1900};
    double      spread_degrees = 0.04;

    double missing_fraction           = 0.05;
    double malformed_amenity_fraction = 0.02;

    /// Latest date a review or host start can fall on.
    std::chrono::year_month_day as_of{std::chrono::year{2024}, std::chrono::month{6},
                                      std::chrono::day{30}};
};

struct SampleCity {
    std::vector<Listing> listings;
    std::vector<Poi>     pois;
};

class SampleCityGenerator {
public:
    explicit SampleCityGenerator(SampleCityConfig config = SampleCityConfig{}) : config_(config) {}

    [[nodiscard]] SampleCity generate() const;

    [[nodiscard]] const SampleCityConfig& config() const noexcept { return config_; }

private:
    SampleCityConfig config_;
};

}  // namespace strp::core
