#pragma once

/// @file include/strp/feature_matrix.hpp
/// @brief Column schema, assembled feature matrix and assembly diagnostics.
///
/// # Module: Feature Matrix
///
/// ## Responsibility
/// Hold one row per listing over a fixed, ordered column set. Values are a
/// row-major Eigen matrix so a row is contiguous and can be handed to a
/// regressor as `std::span<const double>`.
///
/// ## Guarantees
/// - `rows() == listing_ids().size()` and `cols() == columns().size()`
/// - Column order never changes after construction
/// - Missing signals hold their column's sentinel, never NaN
///
/// ## NOT Responsible For
/// - Computing features (see strp/assembler.hpp)

#include "strp/types.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strp {

using RowMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// A declared output column and the value imputed when it cannot be computed.
struct ColumnSpec {
    std::string name;
    double      sentinel = 0.0;
};

/// Per-engine row outcome counts from one assembly run.
struct EngineReport {
    std::string engine;
    std::size_t computed    = 0;  ///< Rows computed normally
    std::size_t malformed   = 0;  ///< Rows computed from a degraded input
    std::size_t unavailable = 0;  ///< Rows left at their sentinels
};

struct AssemblyDiagnostics {
    std::size_t listings            = 0;
    std::size_t invalid_coordinates = 0;
    std::size_t skipped_pois        = 0;  ///< POIs dropped for invalid coordinates
    std::vector<std::string>  duplicate_ids;
    std::vector<EngineReport> engines;

    /// Report for a named engine, or nullopt.
    [[nodiscard]] std::optional<EngineReport> engine(std::string_view name) const;

    [[nodiscard]] std::string to_string() const;
};

class FeatureMatrix {
public:
    FeatureMatrix() = default;

    /// # Arguments
    /// * `listing_ids` - one id per row
    /// * `columns`     - ordered column schema
    /// * `values`      - `listing_ids.size() x columns.size()`
    ///
    /// Throws `std::invalid_argument` on a shape mismatch.
    FeatureMatrix(std::vector<std::string> listing_ids,
                  std::vector<ColumnSpec>  columns,
                  RowMatrix                values,
                  AssemblyDiagnostics      diagnostics = {});

    [[nodiscard]] std::size_t rows() const noexcept { return listing_ids_.size(); }
    [[nodiscard]] std::size_t cols() const noexcept { return columns_.size(); }

    [[nodiscard]] const std::vector<std::string>& listing_ids() const noexcept { return listing_ids_; }
    [[nodiscard]] const std::vector<ColumnSpec>&  columns() const noexcept { return columns_; }
    [[nodiscard]] std::vector<std::string>        column_names() const;
    [[nodiscard]] const RowMatrix&                values() const noexcept { return values_; }
    [[nodiscard]] const AssemblyDiagnostics&      diagnostics() const noexcept { return diagnostics_; }

    [[nodiscard]] std::optional<std::size_t> column_index(std::string_view name) const noexcept;

    /// Copy of a named column, or nullopt.
    [[nodiscard]] std::optional<Eigen::VectorXd> column(std::string_view name) const;

    /// Contiguous view of row `i`. Precondition: `i < rows()`.
    [[nodiscard]] std::span<const double> row_span(std::size_t i) const noexcept;

    /// Row `i` as a named feature vector. Precondition: `i < rows()`.
    [[nodiscard]] FeatureVector row(std::size_t i) const;

    /// New matrix with the given rows in the given order. Indices must be
    /// `< rows()`; throws `std::out_of_range` otherwise.
    [[nodiscard]] FeatureMatrix select_rows(std::span<const std::size_t> indices) const;

    /// New matrix keeping only the named columns, in the given order.
    /// Unknown names throw `std::out_of_range`.
    [[nodiscard]] FeatureMatrix select_columns(std::span<const std::string> names) const;

private:
    std::vector<std::string> listing_ids_;
    std::vector<ColumnSpec>  columns_;
    RowMatrix                values_;
    AssemblyDiagnostics      diagnostics_;
};

}  // namespace strp
