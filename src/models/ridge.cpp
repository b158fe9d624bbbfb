/// @file src/models/ridge.cpp
/// @brief RidgeRegressor / FittedRidge.

#include "ridge.hpp"

#include <cmath>
#include <fmt/format.h>

namespace strp::models {

namespace {

/// Columns with a smaller spread are treated as constant.
constexpr double MIN_SCALE = 1e-12;

}  // namespace

Result<FittedPtr> RidgeRegressor::fit(const RowMatrix& X, const Eigen::VectorXd& y) const {
    if (auto err = check_training_data(X, y)) return *err;

    const Eigen::Index n = X.rows();
    const Eigen::Index p = X.cols();

    const Eigen::VectorXd mean = X.colwise().mean().transpose();
    Eigen::MatrixXd Z = X.rowwise() - mean.transpose();

    Eigen::VectorXd scale(p);
    for (Eigen::Index j = 0; j < p; ++j) {
        const double sd = std::sqrt(Z.col(j).squaredNorm() / static_cast<double>(n));
        scale(j) = sd > MIN_SCALE ? sd : 1.0;
        Z.col(j) /= scale(j);
    }

    const double y_mean = y.mean();
    const Eigen::VectorXd yc = y.array() - y_mean;

    Eigen::MatrixXd gram = Z.transpose() * Z;
    gram.diagonal().array() += alpha_;
    const Eigen::LDLT<Eigen::MatrixXd> ldlt(gram);
    if (ldlt.info() != Eigen::Success) {
        return make_error(ErrorKind::TrainingFailure, "ridge: normal equations are singular");
    }
    Eigen::VectorXd beta = ldlt.solve(Z.transpose() * yc);
    if (!beta.allFinite()) {
        return make_error(ErrorKind::TrainingFailure,
                          fmt::format("ridge: non-finite solution (alpha = {})", alpha_));
    }

    return FittedPtr(std::make_shared<const FittedRidge>(mean, scale, std::move(beta), y_mean));
}

double FittedRidge::predict(std::span<const double> row) const {
    double out = intercept_;
    const auto p = std::min<std::size_t>(row.size(), static_cast<std::size_t>(beta_.size()));
    for (std::size_t j = 0; j < p; ++j) {
        const auto jj = static_cast<Eigen::Index>(j);
        out += beta_(jj) * (row[j] - mean_(jj)) / scale_(jj);
    }
    return out;
}

std::vector<double> FittedRidge::feature_importance() const {
    std::vector<double> raw(static_cast<std::size_t>(beta_.size()));
    for (Eigen::Index j = 0; j < beta_.size(); ++j) {
        raw[static_cast<std::size_t>(j)] = std::abs(beta_(j));
    }
    return normalize_importance(std::move(raw));
}

}  // namespace strp::models
