/// @file src/geo/grid_features.cpp
/// @brief GridAggregationEngine: map listings to cells, reduce per cell.

#include "strp/grid.hpp"
#include "strp/constants.hpp"

#include "../core/parallel.hpp"

#include <algorithm>
#include <cmath>
#include <functional>
#include <map>
#include <numeric>

namespace strp::geo {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

enum GridColumn : std::size_t {
    AVG_PRICE = 0,
    LISTING_COUNT,
    MEDIAN_PRICE,
    PRICE_STD,
    AVG_BEDROOMS,
};

/// Sum of an ascending-sorted sequence. Sorting first makes the result
/// independent of the order the values were collected in.
[[nodiscard]] double sorted_sum(const std::vector<double>& sorted) noexcept {
    return std::accumulate(sorted.begin(), sorted.end(), 0.0);
}

[[nodiscard]] double sorted_median(const std::vector<double>& sorted) noexcept {
    const std::size_t n = sorted.size();
    return n % 2 == 1 ? sorted[n / 2] : 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
}

/// nullopt when `x` overflowed.
[[nodiscard]] std::optional<double> if_finite(double x) noexcept {
    if (std::isfinite(x)) return x;
    return std::nullopt;
}

}  // namespace

// ─── GridAggregationEngine ───────────────────────────────────────────────────

GridAggregationEngine::GridAggregationEngine(const GeoConfig& config)
    : cell_deg_(config.grid_cell_degrees),
      columns_{
          {"grid_avg_price", constants::UNKNOWN_ATTRIBUTE},
          {"grid_listing_count", 0.0},
          {"grid_median_price", constants::UNKNOWN_ATTRIBUTE},
          {"grid_price_std", constants::UNKNOWN_ATTRIBUTE},
          {"grid_avg_bedrooms", constants::UNKNOWN_ATTRIBUTE},
      } {}

std::optional<GridCell> GridAggregationEngine::cell_of(const Coordinates& coords) const noexcept {
    if (!coords.is_valid()) return std::nullopt;
    return GridCell{
        .lat_index = static_cast<std::int64_t>(std::floor(coords.latitude / cell_deg_)),
        .lon_index = static_cast<std::int64_t>(std::floor(coords.longitude / cell_deg_)),
    };
}

CellStats GridAggregationEngine::reduce(std::span<const Listing> listings,
                                        std::span<const std::size_t> members) {
    std::vector<double> prices;
    std::vector<double> bedrooms;
    prices.reserve(members.size());
    for (const std::size_t i : members) {
        const auto& l = listings[i];
        if (std::isfinite(l.price)) prices.push_back(l.price);
        if (l.bedrooms && std::isfinite(*l.bedrooms)) bedrooms.push_back(*l.bedrooms);
    }
    std::sort(prices.begin(), prices.end());
    std::sort(bedrooms.begin(), bedrooms.end());

    CellStats s;
    s.listing_count = members.size();
    if (!prices.empty()) {
        const double n    = static_cast<double>(prices.size());
        const double mean = sorted_sum(prices) / n;
        s.avg_price    = if_finite(mean);
        s.median_price = if_finite(sorted_median(prices));

        // Sample std-dev (n−1 denominator); a single price has zero spread.
        if (prices.size() < 2) {
            s.price_std = 0.0;
        } else {
            double sq = 0.0;
            for (double p : prices) sq += (p - mean) * (p - mean);
            s.price_std = if_finite(std::sqrt(sq / (n - 1.0)));
        }
    }
    if (!bedrooms.empty()) {
        s.avg_bedrooms = if_finite(sorted_sum(bedrooms) / static_cast<double>(bedrooms.size()));
    }
    return s;
}

EngineOutput GridAggregationEngine::compute(std::span<const Listing> listings,
                                            std::size_t workers) const {
    const std::size_t n = listings.size();
    EngineOutput out{.values = sentinel_block(columns_, n),
                     .status = std::vector<RowStatus>(n, RowStatus::Unavailable)};

    // Phase 1 (map): cell assignment, disjoint writes.
    std::vector<std::optional<GridCell>> cells(n);
    detail::parallel_chunks(n, workers, [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) cells[i] = cell_of(listings[i].coords);
    });

    // Barrier: parallel_chunks has joined. Group members per cell.
    std::map<GridCell, std::vector<std::size_t>> groups;
    for (std::size_t i = 0; i < n; ++i) {
        if (cells[i]) groups[*cells[i]].push_back(i);
    }
    std::vector<std::reference_wrapper<const std::vector<std::size_t>>> work;
    work.reserve(groups.size());
    for (const auto& [cell, members] : groups) work.emplace_back(members);

    // Phase 2 (reduce): one cell per task unit; each cell owns its rows.
    detail::parallel_chunks(work.size(), workers, [&](std::size_t begin, std::size_t end) {
        for (std::size_t k = begin; k < end; ++k) {
            const auto& members = work[k].get();
            const CellStats s   = reduce(listings, members);
            for (const std::size_t i : members) {
                auto row = out.values.row(static_cast<Eigen::Index>(i));
                row(AVG_PRICE)     = s.avg_price.value_or(columns_[AVG_PRICE].sentinel);
                row(LISTING_COUNT) = static_cast<double>(s.listing_count);
                row(MEDIAN_PRICE)  = s.median_price.value_or(columns_[MEDIAN_PRICE].sentinel);
                row(PRICE_STD)     = s.price_std.value_or(columns_[PRICE_STD].sentinel);
                row(AVG_BEDROOMS)  = s.avg_bedrooms.value_or(columns_[AVG_BEDROOMS].sentinel);
                out.status[i] = RowStatus::Computed;
            }
        }
    });
    return out;
}

}  // namespace strp::geo
