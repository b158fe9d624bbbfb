/// @file src/models/regressor.cpp
/// @brief Regressor factory and shared helpers.

#include "strp/regressor.hpp"

#include "gradient_boosting.hpp"
#include "random_forest.hpp"
#include "ridge.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <numeric>

namespace strp::models {

Eigen::VectorXd FittedRegressor::predict_batch(const RowMatrix& X) const {
    Eigen::VectorXd out(X.rows());
    const auto p = static_cast<std::size_t>(X.cols());
    for (Eigen::Index i = 0; i < X.rows(); ++i) out(i) = predict({X.row(i).data(), p});
    return out;
}

std::unique_ptr<Regressor> make_regressor(const RegressorSpec& spec, std::stop_token stop) {
    switch (spec.kind) {
        case RegressorKind::Ridge:
            return std::make_unique<RidgeRegressor>(spec.params.alpha);
        case RegressorKind::RandomForest:
            return std::make_unique<RandomForestRegressor>(spec.params, std::move(stop));
        case RegressorKind::GradientBoosting:
            return std::make_unique<GradientBoostingRegressor>(spec.params, std::move(stop));
    }
    return nullptr;
}

std::optional<PipelineError> check_training_data(const RowMatrix& X, const Eigen::VectorXd& y) {
    if (X.rows() == 0 || X.cols() == 0) {
        return make_error(ErrorKind::TrainingFailure,
                          fmt::format("empty training data ({}x{})", X.rows(), X.cols()));
    }
    if (X.rows() != y.size()) {
        return make_error(ErrorKind::TrainingFailure,
                          fmt::format("{} feature rows but {} targets", X.rows(), y.size()));
    }
    if (!X.allFinite()) return make_error(ErrorKind::TrainingFailure, "non-finite feature value");
    if (!y.allFinite()) return make_error(ErrorKind::TrainingFailure, "non-finite target value");
    return std::nullopt;
}

std::vector<double> normalize_importance(std::vector<double> raw) {
    const double total = std::accumulate(raw.begin(), raw.end(), 0.0);
    if (!(total > 0.0)) {
        std::fill(raw.begin(), raw.end(), 0.0);
        return raw;
    }
    for (auto& v : raw) v /= total;
    return raw;
}

}  // namespace strp::models
