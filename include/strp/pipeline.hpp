#pragma once

/// @file include/strp/pipeline.hpp
/// @brief Public entry points: features → training → evaluation → prediction.
///
/// # Module: Pipeline
///
/// ## Responsibility
/// Wire the stages together:
///   listings + POIs → FeatureAssembler → FeatureMatrix →
///   ModelOrchestrator → TrainingOutcome → Evaluator → EvaluationReport
///
/// ## Usage
/// ```cpp
/// strp::core::Pipeline pipeline;
/// auto run = pipeline.run(listings, pois);
/// if (run) fmt::print("{}\n", run->report.to_string());
/// ```
///
/// ## Guarantees
/// - Configuration errors surface before any feature is computed
/// - Per-record problems never fail a call; see `AssemblyDiagnostics`
/// - Same inputs, configuration and seed → identical report

#include "strp/config.hpp"
#include "strp/ensemble.hpp"
#include "strp/errors.hpp"
#include "strp/evaluation.hpp"
#include "strp/feature_matrix.hpp"
#include "strp/orchestrator.hpp"
#include "strp/types.hpp"

#include <Eigen/Dense>

#include <optional>
#include <span>
#include <string>

namespace strp {

// ─── Stage functions ─────────────────────────────────────────────────────────

/// Compute the full feature matrix with the standard engine set.
///
/// # Returns
/// `ConfigurationError` for an invalid configuration or a column collision.
[[nodiscard]] Result<FeatureMatrix> assemble_features(std::span<const Listing> listings,
                                                      std::span<const Poi> pois,
                                                      const FeatureConfig& config = {});

/// Split, train every configured regressor and build the ensemble.
[[nodiscard]] Result<models::TrainingOutcome> train(const FeatureMatrix& features,
                                                    const std::string& target_column,
                                                    const ModelConfig& config = {});

[[nodiscard]] evaluation::EvaluationReport
evaluate(std::span<const models::TrainedModel> models,
         const Result<models::Ensemble>& ensemble,
         const FeatureMatrix& test_features,
         const Eigen::VectorXd& test_target,
         std::span<const models::ModelStatus> statuses = {},
         const EvaluationConfig& config = {});

[[nodiscard]] evaluation::EvaluationReport evaluate(const models::TrainingOutcome& outcome,
                                                    const EvaluationConfig& config = {});

/// Price estimate for one feature row; nullopt when a required column is missing.
[[nodiscard]] std::optional<double> predict(const models::Ensemble& ensemble,
                                            const FeatureVector& features);
[[nodiscard]] std::optional<double> predict(const models::TrainedModel& model,
                                            const FeatureVector& features);

}  // namespace strp

namespace strp::core {

/// Everything one end-to-end run produces.
struct PipelineRun {
    FeatureMatrix                features;
    models::TrainingOutcome      outcome;
    evaluation::EvaluationReport report;
};

/// Stage functions bound to one `PipelineConfig`.
class Pipeline {
public:
    explicit Pipeline(PipelineConfig config = PipelineConfig{});

    [[nodiscard]] Result<FeatureMatrix> assemble(std::span<const Listing> listings,
                                                 std::span<const Poi> pois) const;

    /// Train against `config().target_column`.
    [[nodiscard]] Result<models::TrainingOutcome> train(const FeatureMatrix& features) const;

    [[nodiscard]] evaluation::EvaluationReport evaluate(const models::TrainingOutcome& outcome) const;

    /// Assemble, train and evaluate in one call.
    ///
    /// # Returns
    /// The first stage error; per-model failures stay inside the report.
    [[nodiscard]] Result<PipelineRun> run(std::span<const Listing> listings,
                                          std::span<const Poi> pois) const;

    [[nodiscard]] const PipelineConfig& config() const noexcept { return config_; }

private:
    PipelineConfig config_;
};

}  // namespace strp::core
