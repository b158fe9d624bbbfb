#pragma once

/// @file include/strp/grid.hpp
/// @brief Grid Aggregation Engine: neighbourhood price statistics.
///
/// # Module: Grid Aggregation
///
/// ## Responsibility
/// Partition space into square lat/lon cells and attach, to every listing,
/// the price statistics of the listings sharing its cell:
///
///     cell(φ, λ) = ( ⌊φ / s⌋, ⌊λ / s⌋ )
///
/// ## Execution
/// Two phases with a barrier between them. The map phase assigns every
/// listing its cell in parallel; the reduce phase computes each cell's
/// statistics from a sorted copy of its values and writes them to the
/// cell's rows.
///
/// ## Guarantees
/// - Results are bit-identical for any permutation of the input
/// - A cell's statistics include every listing in it, the listing itself
///   included; a lone listing sees its own price as the average
/// - Listings with invalid coordinates get sentinels
///
/// ## NOT Responsible For
/// - Smoothing across neighbouring cells

#include "strp/config.hpp"
#include "strp/feature_engine.hpp"
#include "strp/types.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace strp::geo {

struct GridCell {
    std::int64_t lat_index;
    std::int64_t lon_index;

    auto operator<=>(const GridCell&) const = default;
};

/// Aggregates of one grid cell.
struct CellStats {
    std::size_t listing_count = 0;
    std::optional<double> avg_price;
    std::optional<double> median_price;
    std::optional<double> price_std;     ///< Sample std; 0 for a single price
    std::optional<double> avg_bedrooms;
};

class GridAggregationEngine final : public FeatureEngine {
public:
    explicit GridAggregationEngine(const GeoConfig& config);

    [[nodiscard]] std::string_view name() const noexcept override { return "grid"; }
    [[nodiscard]] const std::vector<ColumnSpec>& columns() const noexcept override { return columns_; }

    [[nodiscard]] EngineOutput compute(std::span<const Listing> listings,
                                       std::size_t workers) const override;

    /// Cell of a coordinate, or nullopt for invalid coordinates.
    [[nodiscard]] std::optional<GridCell> cell_of(const Coordinates& coords) const noexcept;

    /// Statistics over `listings[members[k]]`, assumed to share one cell.
    /// Non-finite prices and unknown bedroom counts are left out.
    [[nodiscard]] static CellStats reduce(std::span<const Listing> listings,
                                          std::span<const std::size_t> members);

    [[nodiscard]] double cell_degrees() const noexcept { return cell_deg_; }

private:
    double                  cell_deg_;
    std::vector<ColumnSpec> columns_;
};

}  // namespace strp::geo
