#pragma once

/// @file include/strp/regressor.hpp
/// @brief Pluggable regressor contract and the in-tree implementations.
///
/// # Module: Regressors
///
/// ## Responsibility
/// `Regressor` is an untrained algorithm plus hyperparameters; `fit()`
/// produces an immutable `FittedRegressor`. The pipeline only relies on
/// this contract, so any algorithm can be plugged in.
///
/// ## In-tree algorithms
///   - Ridge:             standardised closed-form ridge, (XᵀX + αI)β = Xᵀy
///   - Random forest:     bootstrap-bagged CART trees, seeded per tree
///   - Gradient boosting: squared-loss boosting of shallow CART trees
///
/// ## Guarantees
/// - `fit()` never throws on bad data; it returns `TrainingFailure`
/// - Tree ensembles check their stop token between trees and rounds, and
///   return `TrainingFailure` once a stop is requested
/// - A fitted regressor is immutable and safe for concurrent `predict()`
/// - `feature_importance()` has one entry per training column and sums to
///   1, or is all zeros when the model uses no feature
///
/// ## NOT Responsible For
/// - Train/test splitting and model selection (see strp/orchestrator.hpp)

#include "strp/config.hpp"
#include "strp/errors.hpp"
#include "strp/feature_matrix.hpp"

#include <Eigen/Dense>

#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace strp::models {

class FittedRegressor {
public:
    virtual ~FittedRegressor() = default;

    [[nodiscard]] virtual RegressorKind kind() const noexcept = 0;

    /// Prediction for one feature row in training column order.
    [[nodiscard]] virtual double predict(std::span<const double> row) const = 0;

    /// Predictions for every row of `X`.
    [[nodiscard]] virtual Eigen::VectorXd predict_batch(const RowMatrix& X) const;

    [[nodiscard]] virtual std::vector<double> feature_importance() const = 0;
};

using FittedPtr = std::shared_ptr<const FittedRegressor>;

class Regressor {
public:
    virtual ~Regressor() = default;

    [[nodiscard]] virtual RegressorKind kind() const noexcept = 0;

    /// Fit on `X` (rows = samples) and target `y`.
    ///
    /// # Returns
    /// `TrainingFailure` on empty or mismatched input, non-finite values,
    /// or numerical breakdown.
    [[nodiscard]] virtual Result<FittedPtr> fit(const RowMatrix& X,
                                                const Eigen::VectorXd& y) const = 0;
};

/// Build the in-tree regressor named by `spec.kind`. `stop` abandons an
/// iterative fit early; ridge ignores it.
[[nodiscard]] std::unique_ptr<Regressor> make_regressor(const RegressorSpec& spec,
                                                        std::stop_token stop = {});

/// Shared input checks; nullopt when `X` and `y` are usable.
[[nodiscard]] std::optional<PipelineError> check_training_data(const RowMatrix& X,
                                                               const Eigen::VectorXd& y);

/// Scale non-negative scores to sum to 1; all zeros stay zeros.
[[nodiscard]] std::vector<double> normalize_importance(std::vector<double> raw);

}  // namespace strp::models
