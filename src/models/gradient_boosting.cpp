/// @file src/models/gradient_boosting.cpp
/// @brief GradientBoostingRegressor / FittedBoosting.

#include "gradient_boosting.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numeric>
#include <random>

namespace strp::models {

Result<FittedPtr> GradientBoostingRegressor::fit(const RowMatrix& X,
                                                 const Eigen::VectorXd& y) const {
    if (auto err = check_training_data(X, y)) return *err;

    const auto n = static_cast<std::size_t>(X.rows());
    const detail::TreeParams tp{.max_depth        = params_.max_depth,
                                .min_samples_leaf = params_.min_samples_leaf,
                                .max_features     = 1.0};
    const double eta = params_.learning_rate;

    const double base = y.mean();
    Eigen::VectorXd fitted = Eigen::VectorXd::Constant(y.size(), base);
    Eigen::VectorXd residual(y.size());

    std::mt19937_64 rng(params_.seed);
    std::vector<std::size_t> all(n);
    std::iota(all.begin(), all.end(), 0);
    const auto m = std::clamp<std::size_t>(
        static_cast<std::size_t>(std::lround(params_.subsample * static_cast<double>(n))), 1, n);

    std::vector<detail::RegressionTree> trees;
    for (std::size_t round = 0; round < params_.n_estimators; ++round) {
        if (stop_.stop_requested()) {
            return make_error(ErrorKind::TrainingFailure,
                              fmt::format("gradient boosting stopped at round {}", round));
        }
        residual = y - fitted;

        std::vector<std::size_t> sample = all;
        if (m < n) {
            std::shuffle(sample.begin(), sample.end(), rng);
            sample.resize(m);
            std::sort(sample.begin(), sample.end());
        }

        detail::RegressionTree tree;
        tree.fit(X, residual, sample, tp, rng);
        for (std::size_t i = 0; i < n; ++i) {
            const auto ii = static_cast<Eigen::Index>(i);
            fitted(ii) += eta * tree.predict({X.row(ii).data(), static_cast<std::size_t>(X.cols())});
        }
        trees.push_back(std::move(tree));

        const double loss = (y - fitted).squaredNorm() / static_cast<double>(n);
        if (!std::isfinite(loss)) {
            return make_error(ErrorKind::TrainingFailure,
                              fmt::format("gradient boosting diverged at round {}", round));
        }
    }
    return FittedPtr(std::make_shared<const FittedBoosting>(base, eta, std::move(trees),
                                                            static_cast<std::size_t>(X.cols())));
}

double FittedBoosting::predict(std::span<const double> row) const {
    double out = base_score_;
    for (const auto& t : trees_) out += learning_rate_ * t.predict(row);
    return out;
}

std::vector<double> FittedBoosting::feature_importance() const {
    std::vector<double> raw(n_features_, 0.0);
    for (const auto& t : trees_) {
        const auto& g = t.gains();
        for (std::size_t j = 0; j < raw.size() && j < g.size(); ++j) raw[j] += g[j];
    }
    return normalize_importance(std::move(raw));
}

}  // namespace strp::models
