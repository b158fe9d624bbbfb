/// @file src/features/feature_engine.cpp
/// @brief Parallel driver shared by all per-listing engines.

#include "strp/feature_engine.hpp"

#include "../core/parallel.hpp"

#include <algorithm>
#include <cmath>
#include <exception>

namespace strp {

RowMatrix sentinel_block(std::span<const ColumnSpec> columns, std::size_t rows) {
    RowMatrix block(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(columns.size()));
    for (std::size_t j = 0; j < columns.size(); ++j) {
        block.col(static_cast<Eigen::Index>(j)).setConstant(columns[j].sentinel);
    }
    return block;
}

EngineOutput PerListingEngine::compute(std::span<const Listing> listings,
                                       std::size_t workers) const {
    const auto& cols = columns();
    EngineOutput out{.values = sentinel_block(cols, listings.size()),
                     .status = std::vector<RowStatus>(listings.size(), RowStatus::Unavailable)};

    // Chunks own disjoint row ranges, so writes never overlap.
    detail::parallel_chunks(listings.size(), workers, [&](std::size_t begin, std::size_t end) {
        for (std::size_t i = begin; i < end; ++i) {
            std::span<double> row(out.values.row(static_cast<Eigen::Index>(i)).data(), cols.size());
            RowStatus status = RowStatus::Unavailable;
            try {
                status = compute_row(listings[i], row);
            } catch (const std::exception&) {
                status = RowStatus::Unavailable;
            }
            if (status == RowStatus::Unavailable) {
                for (std::size_t j = 0; j < cols.size(); ++j) row[j] = cols[j].sentinel;
            } else {
                // Extreme finite inputs can overflow derived values.
                for (std::size_t j = 0; j < cols.size(); ++j) {
                    if (!std::isfinite(row[j])) row[j] = cols[j].sentinel;
                }
            }
            out.status[i] = status;
        }
    });
    return out;
}

}  // namespace strp
