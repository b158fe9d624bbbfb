#pragma once

/// @file include/strp/feature_engine.hpp
/// @brief Common interface of the per-category feature engines.
///
/// # Module: Feature Engine
///
/// ## Responsibility
/// Every engine declares its output columns up front and computes a block
/// of `listings.size() x columns().size()` values. Engines that work one
/// listing at a time derive from `PerListingEngine`, which handles chunked
/// parallel execution and sentinel filling.
///
/// ## Guarantees
/// - `columns()` is fixed at construction and independent of the data
/// - `compute()` returns exactly one row per input listing
/// - A row whose status is `Unavailable` holds only sentinels
/// - No cell is NaN or infinite; a value that overflows falls back to its
///   column sentinel
/// - Engines are immutable; `compute()` is safe to call concurrently
///
/// ## NOT Responsible For
/// - Cross-engine column collisions (see strp/assembler.hpp)

#include "strp/feature_matrix.hpp"
#include "strp/types.hpp"

#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace strp {

enum class RowStatus : unsigned char {
    Computed,     ///< Row holds computed values
    Malformed,    ///< Input was degraded; row computed from the recoverable part
    Unavailable,  ///< Row could not be computed and holds sentinels
};

struct EngineOutput {
    RowMatrix              values;
    std::vector<RowStatus> status;  ///< One per listing
};

class FeatureEngine {
public:
    virtual ~FeatureEngine() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
    [[nodiscard]] virtual const std::vector<ColumnSpec>& columns() const noexcept = 0;

    /// # Arguments
    /// * `listings` - input batch, never mutated
    /// * `workers`  - maximum number of threads to use (>= 1)
    [[nodiscard]] virtual EngineOutput compute(std::span<const Listing> listings,
                                               std::size_t workers) const = 0;
};

/// Base for engines whose rows depend on a single listing each.
class PerListingEngine : public FeatureEngine {
public:
    [[nodiscard]] EngineOutput compute(std::span<const Listing> listings,
                                       std::size_t workers) const final;

protected:
    /// Fill `row` (pre-filled with sentinels) for one listing.
    [[nodiscard]] virtual RowStatus compute_row(const Listing& listing,
                                                std::span<double> row) const = 0;
};

/// `columns` sentinels as a row-major block of `rows` rows.
[[nodiscard]] RowMatrix sentinel_block(std::span<const ColumnSpec> columns, std::size_t rows);

}  // namespace strp
