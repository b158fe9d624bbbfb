/// @file src/core/feature_matrix.cpp
/// @brief FeatureMatrix accessors, row/column selection and diagnostics text.

#include "strp/feature_matrix.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace strp {

// ─── AssemblyDiagnostics ─────────────────────────────────────────────────────

std::optional<EngineReport> AssemblyDiagnostics::engine(std::string_view name) const {
    for (const auto& e : engines) {
        if (e.engine == name) return e;
    }
    return std::nullopt;
}

std::string AssemblyDiagnostics::to_string() const {
    std::string out = fmt::format(
        "listings={} invalid_coordinates={} skipped_pois={} duplicate_ids={}\n",
        listings, invalid_coordinates, skipped_pois, duplicate_ids.size());
    for (const auto& e : engines) {
        out += fmt::format("  {:<10} computed={:<6} malformed={:<6} unavailable={}\n",
                           e.engine, e.computed, e.malformed, e.unavailable);
    }
    return out;
}

// ─── FeatureMatrix ───────────────────────────────────────────────────────────

FeatureMatrix::FeatureMatrix(std::vector<std::string> listing_ids,
                             std::vector<ColumnSpec>  columns,
                             RowMatrix                values,
                             AssemblyDiagnostics      diagnostics)
    : listing_ids_(std::move(listing_ids)),
      columns_(std::move(columns)),
      values_(std::move(values)),
      diagnostics_(std::move(diagnostics)) {
    if (static_cast<std::size_t>(values_.rows()) != listing_ids_.size() ||
        static_cast<std::size_t>(values_.cols()) != columns_.size()) {
        throw std::invalid_argument(fmt::format(
            "FeatureMatrix shape {}x{} does not match {} ids and {} columns",
            values_.rows(), values_.cols(), listing_ids_.size(), columns_.size()));
    }
}

std::vector<std::string> FeatureMatrix::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& c : columns_) names.push_back(c.name);
    return names;
}

std::optional<std::size_t> FeatureMatrix::column_index(std::string_view name) const noexcept {
    for (std::size_t j = 0; j < columns_.size(); ++j) {
        if (columns_[j].name == name) return j;
    }
    return std::nullopt;
}

std::optional<Eigen::VectorXd> FeatureMatrix::column(std::string_view name) const {
    const auto j = column_index(name);
    if (!j) return std::nullopt;
    return Eigen::VectorXd(values_.col(static_cast<Eigen::Index>(*j)));
}

std::span<const double> FeatureMatrix::row_span(std::size_t i) const noexcept {
    return {values_.data() + i * cols(), cols()};
}

FeatureVector FeatureMatrix::row(std::size_t i) const {
    const auto r = row_span(i);
    return FeatureVector{.names = column_names(), .values = {r.begin(), r.end()}};
}

FeatureMatrix FeatureMatrix::select_rows(std::span<const std::size_t> indices) const {
    std::vector<std::string> ids;
    ids.reserve(indices.size());
    RowMatrix out(static_cast<Eigen::Index>(indices.size()), values_.cols());
    for (std::size_t k = 0; k < indices.size(); ++k) {
        const std::size_t i = indices[k];
        if (i >= rows()) {
            throw std::out_of_range(fmt::format("row index {} out of range ({} rows)", i, rows()));
        }
        ids.push_back(listing_ids_[i]);
        out.row(static_cast<Eigen::Index>(k)) = values_.row(static_cast<Eigen::Index>(i));
    }
    return FeatureMatrix(std::move(ids), columns_, std::move(out), diagnostics_);
}

FeatureMatrix FeatureMatrix::select_columns(std::span<const std::string> names) const {
    std::vector<ColumnSpec> cols;
    cols.reserve(names.size());
    RowMatrix out(values_.rows(), static_cast<Eigen::Index>(names.size()));
    for (std::size_t k = 0; k < names.size(); ++k) {
        const auto j = column_index(names[k]);
        if (!j) throw std::out_of_range(fmt::format("unknown column '{}'", names[k]));
        cols.push_back(columns_[*j]);
        out.col(static_cast<Eigen::Index>(k)) = values_.col(static_cast<Eigen::Index>(*j));
    }
    return FeatureMatrix(listing_ids_, std::move(cols), std::move(out), diagnostics_);
}

}  // namespace strp
