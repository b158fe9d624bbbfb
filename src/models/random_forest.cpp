/// @file src/models/random_forest.cpp
/// @brief RandomForestRegressor / FittedForest.

#include "random_forest.hpp"

#include <fmt/format.h>
#include <random>

namespace strp::models {

Result<FittedPtr> RandomForestRegressor::fit(const RowMatrix& X, const Eigen::VectorXd& y) const {
    if (auto err = check_training_data(X, y)) return *err;

    const auto n = static_cast<std::size_t>(X.rows());
    const detail::TreeParams tp{.max_depth        = params_.max_depth,
                                .min_samples_leaf = params_.min_samples_leaf,
                                .max_features     = params_.max_features};

    std::vector<detail::RegressionTree> trees;
    std::vector<std::size_t> sample(n);
    for (std::size_t t = 0; t < params_.n_estimators; ++t) {
        if (stop_.stop_requested()) {
            return make_error(ErrorKind::TrainingFailure,
                              fmt::format("random forest stopped after {} trees", t));
        }
        std::mt19937_64 rng(params_.seed + t);
        std::uniform_int_distribution<std::size_t> pick(0, n - 1);
        for (auto& s : sample) s = pick(rng);
        trees.emplace_back().fit(X, y, sample, tp, rng);
    }
    return FittedPtr(std::make_shared<const FittedForest>(std::move(trees),
                                                          static_cast<std::size_t>(X.cols())));
}

double FittedForest::predict(std::span<const double> row) const {
    if (trees_.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& t : trees_) sum += t.predict(row);
    return sum / static_cast<double>(trees_.size());
}

std::vector<double> FittedForest::feature_importance() const {
    std::vector<double> raw(n_features_, 0.0);
    for (const auto& t : trees_) {
        const auto& g = t.gains();
        for (std::size_t j = 0; j < raw.size() && j < g.size(); ++j) raw[j] += g[j];
    }
    return normalize_importance(std::move(raw));
}

}  // namespace strp::models
