#pragma once

/// @file src/models/regression_tree.hpp
/// @brief CART regression tree shared by the forest and boosting models.
///
/// Nodes live in a flat vector; children are indices. Splits minimise the
/// summed squared error of the two halves (exact search over sorted
/// feature values), and each split's SSE reduction is credited to its
/// feature for importance.

#include "strp/feature_matrix.hpp"

#include <Eigen/Dense>

#include <cstddef>
#include <cstdint>
#include <random>
#include <span>
#include <vector>

namespace strp::models::detail {

struct TreeParams {
    std::size_t max_depth        = 6;
    std::size_t min_samples_leaf = 1;
    double      max_features     = 1.0;  ///< Fraction of features tried per split
};

struct TreeNode {
    int    feature   = -1;   ///< -1 marks a leaf
    double threshold = 0.0;  ///< Go left when x[feature] <= threshold
    int    left      = -1;
    int    right     = -1;
    double value     = 0.0;  ///< Leaf prediction (mean target)
};

class RegressionTree {
public:
    /// Fit on the rows `sample` of `X` (duplicates allowed, for bootstrap).
    ///
    /// # Arguments
    /// * `rng` - used only when `params.max_features < 1`
    void fit(const RowMatrix& X, const Eigen::VectorXd& y,
             std::span<const std::size_t> sample,
             const TreeParams& params, std::mt19937_64& rng);

    [[nodiscard]] double predict(std::span<const double> row) const noexcept;

    /// Unnormalised SSE reduction per feature.
    [[nodiscard]] const std::vector<double>& gains() const noexcept { return gains_; }

    [[nodiscard]] std::size_t node_count() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t depth() const;

private:
    int build(const RowMatrix& X, const Eigen::VectorXd& y,
              std::vector<std::size_t>& idx, std::size_t depth,
              const TreeParams& params, std::mt19937_64& rng);

    std::vector<TreeNode> nodes_;
    std::vector<double>   gains_;
};

}  // namespace strp::models::detail
