#pragma once

/// @file include/strp/ensemble.hpp
/// @brief Trained models and their weighted ensemble.
///
/// # Module: Trained Model / Ensemble
///
/// ## Responsibility
/// Bind a fitted regressor to the feature-column order it was trained on,
/// and combine several such models with convex weights:
///
///     ŷ = Σ_i w_i · ŷ_i,    w_i ≥ 0,    Σ_i w_i = 1
///
/// ## Guarantees
/// - Immutable after construction; retraining produces a new instance
/// - Prediction selects columns by name, so a feature vector may carry
///   extra columns or a different order
/// - An ensemble always holds at least two members and normalised weights
///
/// ## NOT Responsible For
/// - Choosing the weights (see strp/orchestrator.hpp)

#include "strp/config.hpp"
#include "strp/errors.hpp"
#include "strp/feature_matrix.hpp"
#include "strp/regressor.hpp"
#include "strp/types.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace strp::models {

class TrainedModel {
public:
    TrainedModel(std::string name, RegressorKind kind, FittedPtr fitted,
                 std::vector<std::string> feature_columns,
                 std::chrono::duration<double> training_time);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] RegressorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::vector<std::string>& feature_columns() const noexcept { return columns_; }
    [[nodiscard]] std::chrono::duration<double> training_time() const noexcept { return time_; }
    [[nodiscard]] const FittedRegressor& regressor() const noexcept { return *fitted_; }

    /// Predict from a named feature vector.
    ///
    /// # Returns
    /// nullopt if any training column is missing from `features`.
    [[nodiscard]] std::optional<double> predict(const FeatureVector& features) const;

    /// Predict every row of `matrix`, selecting columns by name.
    ///
    /// # Returns
    /// nullopt if any training column is missing from `matrix`.
    [[nodiscard]] std::optional<Eigen::VectorXd> predict(const FeatureMatrix& matrix) const;

    /// (column, importance) pairs sorted by importance, descending.
    [[nodiscard]] std::vector<std::pair<std::string, double>> feature_importance() const;

private:
    std::string              name_;
    RegressorKind            kind_;
    FittedPtr                fitted_;
    std::vector<std::string> columns_;
    std::chrono::duration<double> time_;
};

/// One member's share of an ensemble prediction.
struct Contribution {
    std::string model;
    double      weight;
    double      prediction;
};

class Ensemble {
public:
    /// # Arguments
    /// * `members` - successfully trained models
    /// * `weights` - one per member, finite and non-negative with a positive
    ///               sum; normalised to sum to 1. Empty means uniform.
    ///
    /// # Returns
    /// `InsufficientModels` with fewer than two members,
    /// `ConfigurationError` for unusable weights.
    [[nodiscard]] static Result<Ensemble> create(std::vector<TrainedModel> members,
                                                 std::vector<double> weights = {});

    [[nodiscard]] const std::vector<TrainedModel>& members() const noexcept { return members_; }
    [[nodiscard]] const std::vector<double>& weights() const noexcept { return weights_; }

    [[nodiscard]] std::optional<double> predict(const FeatureVector& features) const;
    [[nodiscard]] std::optional<Eigen::VectorXd> predict(const FeatureMatrix& matrix) const;

    /// Per-member predictions and weights behind `predict(features)`.
    [[nodiscard]] std::optional<std::vector<Contribution>>
    contributions(const FeatureVector& features) const;

private:
    Ensemble(std::vector<TrainedModel> members, std::vector<double> weights)
        : members_(std::move(members)), weights_(std::move(weights)) {}

    std::vector<TrainedModel> members_;
    std::vector<double>       weights_;
};

}  // namespace strp::models
