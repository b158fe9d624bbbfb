/**
 * @file  fuzz_amenity_parser.cpp
 * @brief libFuzzer target for parse_amenities and AmenityEngine::score
 *
 * Build:
 *   cmake -DSTRP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_amenity_parser
 *
 * Run for 60 seconds:
 *   ./fuzz_amenity_parser -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no exception for any byte sequence.
 *   2. Empty and Malformed parses carry an empty amenity set.
 *   3. Every parsed entry is non-empty and has no leading/trailing blanks.
 *   4. Parsing is deterministic.
 *   5. amenity_score of the parsed set lies in [0, 1].
 *
 * Fuzzer strategy:
 *   Input is passed directly as std::string_view, exercising unbalanced
 *   brackets and quotes, stray escapes, control bytes and UTF-8.
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string_view>

#include "strp/amenity.hpp"

using namespace strp;
using namespace strp::features;

namespace {

bool is_blank(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view raw(reinterpret_cast<const char*>(data), size);

    const auto parsed = parse_amenities(raw);

    // Invariant 2
    if (parsed.status == AmenityParseStatus::Empty ||
        parsed.status == AmenityParseStatus::Malformed) {
        assert(parsed.amenities.empty());
    }

    // Invariant 3
    for (const auto& a : parsed.amenities) {
        assert(!a.empty());
        assert(!is_blank(a.front()));
        assert(!is_blank(a.back()));
    }

    // Invariant 4
    const auto again = parse_amenities(raw);
    assert(again.status == parsed.status);
    assert(again.amenities == parsed.amenities);

    // Invariant 5
    static const AmenityEngine engine{AmenityConfig{}};
    const auto scores = engine.score(parsed.amenities);
    assert(scores.amenity_score >= 0.0);
    assert(scores.amenity_score <= 1.0 + 1e-12);

    (void)again;
    (void)scores;
    return 0;
}
