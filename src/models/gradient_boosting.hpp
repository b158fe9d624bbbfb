#pragma once

/// @file src/models/gradient_boosting.hpp
/// @brief Squared-loss gradient boosting over CART trees.
///
///     F₀(x)  = ȳ
///     r_m    = y − F_{m−1}(x)
///     F_m(x) = F_{m−1}(x) + η · h_m(x),   h_m fitted to r_m
///
/// Each round fits on a `subsample` fraction of rows drawn without
/// replacement from a generator seeded once with `seed`.

#include "strp/regressor.hpp"

#include "regression_tree.hpp"

#include <stop_token>
#include <vector>

namespace strp::models {

class GradientBoostingRegressor final : public Regressor {
public:
    explicit GradientBoostingRegressor(Hyperparameters params, std::stop_token stop = {})
        : params_(params), stop_(std::move(stop)) {}

    [[nodiscard]] RegressorKind kind() const noexcept override { return RegressorKind::GradientBoosting; }
    [[nodiscard]] Result<FittedPtr> fit(const RowMatrix& X,
                                        const Eigen::VectorXd& y) const override;

private:
    Hyperparameters params_;
    std::stop_token stop_;
};

class FittedBoosting final : public FittedRegressor {
public:
    FittedBoosting(double base_score, double learning_rate,
                   std::vector<detail::RegressionTree> trees, std::size_t n_features)
        : base_score_(base_score), learning_rate_(learning_rate),
          trees_(std::move(trees)), n_features_(n_features) {}

    [[nodiscard]] RegressorKind kind() const noexcept override { return RegressorKind::GradientBoosting; }
    [[nodiscard]] double predict(std::span<const double> row) const override;
    [[nodiscard]] std::vector<double> feature_importance() const override;

    [[nodiscard]] std::size_t round_count() const noexcept { return trees_.size(); }

private:
    double                              base_score_;
    double                              learning_rate_;
    std::vector<detail::RegressionTree> trees_;
    std::size_t                         n_features_;
};

}  // namespace strp::models
