#pragma once

/// @file src/models/ridge.hpp
/// @brief Standardised closed-form ridge regression.
///
/// Columns are centred and scaled to unit variance (constant columns get
/// scale 1 and therefore a zero coefficient), the target is centred, and
///
///     (ZᵀZ + α I) β = Zᵀ(y − ȳ)
///
/// is solved with Eigen's LDLT. Predictions map back to raw units.

#include "strp/regressor.hpp"

namespace strp::models {

class RidgeRegressor final : public Regressor {
public:
    explicit RidgeRegressor(double alpha) : alpha_(alpha) {}

    [[nodiscard]] RegressorKind kind() const noexcept override { return RegressorKind::Ridge; }
    [[nodiscard]] Result<FittedPtr> fit(const RowMatrix& X,
                                        const Eigen::VectorXd& y) const override;

private:
    double alpha_;
};

class FittedRidge final : public FittedRegressor {
public:
    FittedRidge(Eigen::VectorXd mean, Eigen::VectorXd scale, Eigen::VectorXd beta, double intercept)
        : mean_(std::move(mean)), scale_(std::move(scale)), beta_(std::move(beta)),
          intercept_(intercept) {}

    [[nodiscard]] RegressorKind kind() const noexcept override { return RegressorKind::Ridge; }
    [[nodiscard]] double predict(std::span<const double> row) const override;
    [[nodiscard]] std::vector<double> feature_importance() const override;

    /// Coefficients on the standardised scale.
    [[nodiscard]] const Eigen::VectorXd& coefficients() const noexcept { return beta_; }
    [[nodiscard]] double intercept() const noexcept { return intercept_; }

private:
    Eigen::VectorXd mean_;
    Eigen::VectorXd scale_;
    Eigen::VectorXd beta_;
    double          intercept_;
};

}  // namespace strp::models
