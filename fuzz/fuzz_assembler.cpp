/**
 * @file  fuzz_assembler.cpp
 * @brief libFuzzer target for FeatureAssembler::assemble (all engines)
 *
 * Build:
 *   cmake -DSTRP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_assembler
 *
 * Run for 60 seconds:
 *   ./fuzz_assembler -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception escapes assembly.
 *   2. One row per listing, one column per declared schema column.
 *   3. No cell is NaN; missing signals hold sentinels.
 *   4. Every engine reports exactly one outcome per listing.
 *   5. invalid_coordinates counts the listings whose coordinates are invalid.
 *
 * Fuzzer strategy:
 *   Each listing consumes 10 bytes decoded into bounded fields (coordinates
 *   slightly beyond the valid ranges, NaN prices and missing ratings on
 *   sentinel bytes). Trailing bytes become the first listing's raw amenity
 *   text.
 */

#include <cassert>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "strp/assembler.hpp"

using namespace strp;
using namespace strp::features;

namespace {

constexpr std::size_t BYTES_PER_LISTING = 10;

std::int16_t read_i16(const uint8_t* p) {
    std::int16_t v{};
    __builtin_memcpy(&v, p, sizeof(v));
    return v;
}

const FeatureAssembler& assembler() {
    static const std::vector<Poi> pois = {
        Poi{.id = "beach-0",  .coords = {-22.98, -43.19}, .category = PoiCategory::Beach},
        Poi{.id = "subway-0", .coords = {-22.96, -43.18}, .category = PoiCategory::Subway},
        Poi{.id = "park-0",   .coords = {-22.95, -43.21}, .category = PoiCategory::Park},
    };
    static const FeatureAssembler instance = [] {
        FeatureConfig cfg;
        cfg.temporal.reference_date = std::chrono::year{2024} / std::chrono::June / 30;
        cfg.worker_threads          = 2;
        return FeatureAssembler::from_config(pois, cfg).value();
    }();
    return instance;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::size_t n = size / BYTES_PER_LISTING;
    std::vector<Listing> listings;
    listings.reserve(n);

    std::size_t expected_invalid = 0;
    for (std::size_t i = 0; i < n; ++i) {
        const uint8_t* p = data + i * BYTES_PER_LISTING;
        Listing l;
        l.id = "F" + std::to_string(i % 7);  // forces duplicate ids
        // ±99° latitude and ±198° longitude reach past the valid ranges.
        l.coords.latitude  = static_cast<double>(read_i16(p)) / 32768.0 * 99.0;
        l.coords.longitude = static_cast<double>(read_i16(p + 2)) / 32768.0 * 198.0;
        l.price = p[4] == 0xff ? std::numeric_limits<double>::quiet_NaN()
                               : static_cast<double>(p[4]) * 4.0;
        if (p[5] != 0xff) l.rating = static_cast<double>(p[5]) / 40.0;
        l.review_count = static_cast<int>(p[6]) - 16;
        l.bedrooms     = static_cast<double>(p[7] % 8);
        if (p[8] % 3 != 0) l.bathrooms = static_cast<double>(p[8] % 5);
        l.room_type = static_cast<RoomType>(p[9] % 3);
        if (p[9] & 0x80) l.host.is_superhost = true;
        if (!l.coords.is_valid()) ++expected_invalid;
        listings.push_back(std::move(l));
    }
    if (!listings.empty() && size % BYTES_PER_LISTING != 0) {
        const std::size_t tail = size % BYTES_PER_LISTING;
        listings.front().amenities_raw =
            std::string(reinterpret_cast<const char*>(data + size - tail), tail);
    }

    const auto& a = assembler();
    const auto  m = a.assemble(listings);

    // Invariant 2
    assert(m.rows() == listings.size());
    assert(m.cols() == a.columns().size());

    // Invariant 3
    assert(!m.values().array().isNaN().any());

    // Invariant 4
    const auto& d = m.diagnostics();
    for (const auto& report : d.engines) {
        assert(report.computed + report.malformed + report.unavailable == listings.size());
        (void)report;
    }

    // Invariant 5
    assert(d.invalid_coordinates == expected_invalid);
    (void)expected_invalid;
    return 0;
}
