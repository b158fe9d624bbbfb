#pragma once

/// @file src/models/random_forest.hpp
/// @brief Bootstrap-aggregated regression trees.
///
/// Tree t draws a bootstrap sample with `std::mt19937_64(seed + t)`, so a
/// forest is reproducible regardless of how many threads train it.

#include "strp/regressor.hpp"

#include "regression_tree.hpp"

#include <stop_token>
#include <vector>

namespace strp::models {

class RandomForestRegressor final : public Regressor {
public:
    explicit RandomForestRegressor(Hyperparameters params, std::stop_token stop = {})
        : params_(params), stop_(std::move(stop)) {}

    [[nodiscard]] RegressorKind kind() const noexcept override { return RegressorKind::RandomForest; }
    [[nodiscard]] Result<FittedPtr> fit(const RowMatrix& X,
                                        const Eigen::VectorXd& y) const override;

private:
    Hyperparameters params_;
    std::stop_token stop_;
};

class FittedForest final : public FittedRegressor {
public:
    FittedForest(std::vector<detail::RegressionTree> trees, std::size_t n_features)
        : trees_(std::move(trees)), n_features_(n_features) {}

    [[nodiscard]] RegressorKind kind() const noexcept override { return RegressorKind::RandomForest; }
    [[nodiscard]] double predict(std::span<const double> row) const override;
    [[nodiscard]] std::vector<double> feature_importance() const override;

    [[nodiscard]] std::size_t tree_count() const noexcept { return trees_.size(); }

private:
    std::vector<detail::RegressionTree> trees_;
    std::size_t                         n_features_;
};

}  // namespace strp::models
