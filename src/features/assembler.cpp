/// @file src/features/assembler.cpp
/// @brief BaseListingEngine and FeatureAssembler.

#include "strp/assembler.hpp"
#include "strp/amenity.hpp"
#include "strp/constants.hpp"
#include "strp/geo.hpp"
#include "strp/grid.hpp"
#include "strp/review_trust.hpp"
#include "strp/temporal.hpp"

#include "../core/parallel.hpp"

#include <cmath>
#include <fmt/format.h>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace strp::features {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

enum BaseColumn : std::size_t {
    PRICE = 0,
    ACCOMMODATES,
    BEDROOMS,
    BATHROOMS,
    BEDS,
    ROOM_ENTIRE,
    ROOM_PRIVATE,
    ROOM_SHARED,
    TOTAL_ROOMS,
    BED_BATH_RATIO,
};

[[nodiscard]] std::optional<double> finite(std::optional<double> x) noexcept {
    if (x && std::isfinite(*x)) return x;
    return std::nullopt;
}

}  // namespace

// ─── BaseListingEngine ───────────────────────────────────────────────────────

BaseListingEngine::BaseListingEngine() {
    const double unknown = constants::UNKNOWN_ATTRIBUTE;
    columns_ = {
        {"price", unknown},
        {"accommodates", unknown},
        {"bedrooms", unknown},
        {"bathrooms", unknown},
        {"beds", unknown},
        {"room_entire_place", 0.0},
        {"room_private_room", 0.0},
        {"room_shared_room", 0.0},
        {"total_rooms", unknown},
        {"bedroom_bathroom_ratio", unknown},
    };
}

RowStatus BaseListingEngine::compute_row(const Listing& listing, std::span<double> row) const {
    if (std::isfinite(listing.price)) row[PRICE] = listing.price;
    if (listing.accommodates) row[ACCOMMODATES] = static_cast<double>(*listing.accommodates);

    const auto bedrooms  = finite(listing.bedrooms);
    const auto bathrooms = finite(listing.bathrooms);
    if (bedrooms)                    row[BEDROOMS]  = *bedrooms;
    if (bathrooms)                   row[BATHROOMS] = *bathrooms;
    if (const auto b = finite(listing.beds)) row[BEDS] = *b;

    row[ROOM_ENTIRE]  = listing.room_type == RoomType::EntirePlace ? 1.0 : 0.0;
    row[ROOM_PRIVATE] = listing.room_type == RoomType::PrivateRoom ? 1.0 : 0.0;
    row[ROOM_SHARED]  = listing.room_type == RoomType::SharedRoom ? 1.0 : 0.0;

    if (bedrooms && bathrooms) {
        row[TOTAL_ROOMS]    = *bedrooms + *bathrooms;
        row[BED_BATH_RATIO] = *bedrooms / (*bathrooms + constants::RATIO_OFFSET);
    }
    return RowStatus::Computed;
}

// ─── FeatureAssembler ────────────────────────────────────────────────────────

FeatureAssembler::FeatureAssembler(std::vector<EnginePtr> engines,
                                   std::vector<ColumnSpec> columns,
                                   FeatureConfig config)
    : engines_(std::move(engines)), columns_(std::move(columns)), config_(std::move(config)) {}

Result<FeatureAssembler> FeatureAssembler::create(std::vector<EnginePtr> engines,
                                                  FeatureConfig config) {
    if (auto err = config.validate()) return *err;

    std::vector<ColumnSpec> columns;
    std::unordered_map<std::string, std::string_view> owner;
    for (const auto& engine : engines) {
        if (!engine) return make_error(ErrorKind::ConfigurationError, "null feature engine");
        for (const auto& col : engine->columns()) {
            const auto [it, inserted] = owner.emplace(col.name, engine->name());
            if (!inserted) {
                return make_error(ErrorKind::ConfigurationError,
                                  fmt::format("column '{}' is declared by both '{}' and '{}'",
                                              col.name, it->second, engine->name()));
            }
            columns.push_back(col);
        }
    }
    return FeatureAssembler(std::move(engines), std::move(columns), std::move(config));
}

Result<FeatureAssembler> FeatureAssembler::from_config(std::span<const Poi> pois,
                                                       const FeatureConfig& config) {
    if (auto err = config.validate()) return *err;

    auto index = std::make_shared<const geo::GeoIndex>(pois, config.geo.distance_cap_km);
    const auto reference = config.temporal.resolved_reference_date();

    // Pin the reference date so temporal and trust engines agree on "today".
    FeatureConfig pinned = config;
    pinned.temporal.reference_date = reference;

    std::vector<EnginePtr> engines = {
        std::make_shared<const BaseListingEngine>(),
        std::make_shared<const geo::DistanceFeatureEngine>(index, pinned.geo),
        std::make_shared<const geo::GridAggregationEngine>(pinned.geo),
        std::make_shared<const TemporalFeatureEngine>(pinned.temporal),
        std::make_shared<const ReviewTrustEngine>(pinned.trust, reference),
        std::make_shared<const AmenityEngine>(pinned.amenity),
    };

    auto assembler = create(std::move(engines), std::move(pinned));
    if (assembler) {
        assembler->skipped_pois_ = index->skipped_count();
        if (config.verbose && index->skipped_count() > 0) {
            fmt::print(stderr, "Skipped {} POIs with invalid coordinates\n", index->skipped_count());
        }
    }
    return assembler;
}

FeatureMatrix FeatureAssembler::assemble(std::span<const Listing> listings) const {
    const std::size_t n       = listings.size();
    const std::size_t workers = detail::resolve_workers(config_.worker_threads);

    AssemblyDiagnostics diag;
    diag.listings     = n;
    diag.skipped_pois = skipped_pois_;

    std::vector<std::string> ids;
    ids.reserve(n);
    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> reported;
    for (const auto& l : listings) {
        ids.push_back(l.id);
        if (!l.coords.is_valid()) ++diag.invalid_coordinates;
        if (!seen.insert(l.id).second && reported.insert(l.id).second) {
            diag.duplicate_ids.push_back(l.id);
        }
    }

    RowMatrix values(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(columns_.size()));
    Eigen::Index offset = 0;
    for (const auto& engine : engines_) {
        const auto width = static_cast<Eigen::Index>(engine->columns().size());
        EngineOutput out = engine->compute(listings, workers);
        if (width > 0) values.middleCols(offset, width) = out.values;
        offset += width;

        EngineReport report{.engine = std::string(engine->name())};
        for (const auto s : out.status) {
            switch (s) {
                case RowStatus::Computed:    ++report.computed;    break;
                case RowStatus::Malformed:   ++report.malformed;   break;
                case RowStatus::Unavailable: ++report.unavailable; break;
            }
        }
        if (config_.verbose && (report.malformed > 0 || report.unavailable > 0)) {
            fmt::print(stderr, "Engine '{}': {} malformed, {} unavailable of {} rows\n",
                       report.engine, report.malformed, report.unavailable, n);
        }
        diag.engines.push_back(std::move(report));
    }

    if (config_.verbose) {
        if (diag.invalid_coordinates > 0) {
            fmt::print(stderr, "{} listings have invalid coordinates\n", diag.invalid_coordinates);
        }
        for (const auto& id : diag.duplicate_ids) {
            fmt::print(stderr, "Duplicate listing id: {}\n", id);
        }
    }

    return FeatureMatrix(std::move(ids), columns_, std::move(values), std::move(diag));
}

}  // namespace strp::features
