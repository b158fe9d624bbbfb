#pragma once

/// @file include/strp/orchestrator.hpp
/// @brief Model Orchestrator: split, train every regressor, build the ensemble.
///
/// # Module: Model Orchestrator
///
/// ## Responsibility
/// 1. Validate the model configuration and the target column
/// 2. Split rows into train / held-out test with a seeded shuffle
/// 3. Train each configured regressor independently (concurrently when
///    enabled), recording success or failure per model
/// 4. Combine the successes into an ensemble with the configured weighting
///
/// ## Guarantees
/// - Same matrix, config and seed → identical split, models and weights
/// - One failing regressor never prevents the others from training
/// - Fewer than two successes → the ensemble is `InsufficientModels`, while
///   the successful models are still returned
/// - A regressor exceeding `ModelConfig::timeout` is recorded as a
///   `TrainingFailure`; its worker is asked to stop and winds down in the
///   background on data it shares ownership of
///
/// ## NOT Responsible For
/// - Computing metrics (see strp/evaluation.hpp)

#include "strp/config.hpp"
#include "strp/ensemble.hpp"
#include "strp/errors.hpp"
#include "strp/feature_matrix.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strp::models {

enum class ModelState : unsigned char {
    Trained,
    Failed,
};

struct ModelStatus {
    std::string   name;
    RegressorKind kind = RegressorKind::Ridge;
    ModelState    state = ModelState::Failed;
    std::optional<PipelineError> failure;  ///< Set when `state == Failed`
    std::chrono::duration<double> training_time{0.0};
};

/// Row indices of a train/test split.
struct DataSplit {
    std::vector<std::size_t> train;
    std::vector<std::size_t> test;
};

/// Seeded shuffle split. `test` holds `round(n · fraction)` rows, at least
/// one, leaving at least two for training.
///
/// # Returns
/// `MalformedInput` when `n < 3`, `ConfigurationError` for a fraction
/// outside (0, 1).
[[nodiscard]] Result<DataSplit> split_rows(std::size_t n, double held_out_fraction,
                                           std::uint64_t seed);

struct TrainingOutcome {
    std::vector<TrainedModel> models;    ///< Successful models, config order
    std::vector<ModelStatus>  statuses;  ///< Every configured model, config order
    Result<Ensemble>          ensemble;
    DataSplit                 split;
    std::vector<std::string>  feature_columns;
    std::string               target_column;
    FeatureMatrix             test_features;   ///< Held-out rows, all columns
    Eigen::VectorXd           test_target;
    FeatureMatrix             train_features;  ///< Rows the models were fitted on
    Eigen::VectorXd           train_target;

    /// Successful model by name.
    [[nodiscard]] std::optional<TrainedModel> find(std::string_view name) const;
};

class ModelOrchestrator {
public:
    explicit ModelOrchestrator(ModelConfig config) : config_(std::move(config)) {}

    /// # Returns
    /// `ConfigurationError` for an invalid config, an unknown target or
    /// excluded column, or no feature columns left; `MalformedInput` when
    /// fewer than three rows have a known target. Rows whose target holds
    /// the column sentinel or a non-finite value are left out. Per-model
    /// failures are reported in `TrainingOutcome::statuses`, not here.
    [[nodiscard]] Result<TrainingOutcome> train(const FeatureMatrix& matrix,
                                                const std::string& target_column) const;

    /// Random search over the weight simplex minimising MAE of `predictions`
    /// (one column per model) against `target`. Trial 0 is uniform.
    [[nodiscard]] static std::vector<double> search_weights(const Eigen::MatrixXd& predictions,
                                                            const Eigen::VectorXd& target,
                                                            std::size_t trials,
                                                            std::uint64_t seed);

    [[nodiscard]] const ModelConfig& config() const noexcept { return config_; }

private:
    ModelConfig config_;
};

}  // namespace strp::models
