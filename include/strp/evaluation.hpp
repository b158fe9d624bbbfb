#pragma once

/// @file include/strp/evaluation.hpp
/// @brief Evaluator: accuracy metrics, ranking and cross-validation.
///
/// # Module: Evaluator
///
/// ## Metrics
///   - MAE          = mean |y − ŷ|
///   - RMSE         = √ mean (y − ŷ)²
///   - R²           = 1 − SS_res / SS_tot            (0 when SS_tot = 0)
///   - MAPE         = 100 · mean |y − ŷ| / |y|       (rows with |y| ≤ ε skipped;
///                                                    0 when none remain)
///   - within_10pct = fraction with |y − ŷ| ≤ 0.10 · |y|
///   - within_20pct = fraction with |y − ŷ| ≤ 0.20 · |y|
///
/// ## Ranking
/// By the configured primary metric (RMSE by default). Error metrics rank
/// ascending, R² and the within-fractions descending; ties break by name.
///
/// ## Overfitting
/// When the training rows are supplied, each scored entry also carries its
/// training-set metrics and the gaps `train − test` for MAE and R².
///
/// ## Tuning
/// `tune()` cross-validates every point of a hyperparameter grid on the same
/// folds and keeps the one with the lowest mean MAE (first point on ties).
///
/// ## Guarantees
/// - Pure: same inputs give the same report
/// - Failed models and a failed ensemble appear in the report with their
///   reason and no rank
///
/// ## NOT Responsible For
/// - Plotting or persisting reports

#include "strp/config.hpp"
#include "strp/ensemble.hpp"
#include "strp/errors.hpp"
#include "strp/feature_matrix.hpp"
#include "strp/orchestrator.hpp"

#include <Eigen/Dense>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strp::evaluation {

struct MetricSet {
    double mae          = 0.0;
    double rmse         = 0.0;
    double r2           = 0.0;
    double mape         = 0.0;  ///< Percent
    double within_10pct = 0.0;  ///< Fraction in [0, 1]
    double within_20pct = 0.0;  ///< Fraction in [0, 1]

    [[nodiscard]] double get(Metric metric) const noexcept;

    /// One-line summary.
    [[nodiscard]] std::string to_string() const;
};

/// Stateless metric functions over paired actual/predicted series.
///
/// Every function returns nullopt for empty or mismatched input or any
/// non-finite value.
class MetricsCalculator {
public:
    [[nodiscard]] static std::optional<double> mae(std::span<const double> actual,
                                                   std::span<const double> predicted) noexcept;
    [[nodiscard]] static std::optional<double> rmse(std::span<const double> actual,
                                                    std::span<const double> predicted) noexcept;
    [[nodiscard]] static std::optional<double> r2(std::span<const double> actual,
                                                  std::span<const double> predicted) noexcept;
    [[nodiscard]] static std::optional<double> mape(std::span<const double> actual,
                                                    std::span<const double> predicted) noexcept;

    /// Fraction of rows with |y − ŷ| ≤ tolerance · |y|.
    [[nodiscard]] static std::optional<double> within_fraction(std::span<const double> actual,
                                                               std::span<const double> predicted,
                                                               double tolerance) noexcept;

    [[nodiscard]] static std::optional<MetricSet> compute(std::span<const double> actual,
                                                          std::span<const double> predicted) noexcept;

private:
    [[nodiscard]] static bool usable(std::span<const double> actual,
                                     std::span<const double> predicted) noexcept;
};

/// Training-set metric minus held-out metric.
struct OverfittingGap {
    double mae_diff = 0.0;  ///< Usually negative: lower error on seen rows
    double r2_diff  = 0.0;  ///< Usually positive
};

struct ModelReport {
    std::string name;
    bool        is_ensemble = false;
    std::optional<MetricSet>     metrics;  ///< Absent for failed entries
    std::optional<PipelineError> failure;
    std::optional<std::size_t>   rank;     ///< 1 = best
    std::optional<MetricSet>      train_metrics;  ///< Set when training rows were supplied
    std::optional<OverfittingGap> overfitting;

    [[nodiscard]] bool succeeded() const noexcept { return metrics.has_value(); }
};

struct EvaluationReport {
    Metric                   primary_metric = Metric::Rmse;
    std::size_t              test_rows      = 0;
    std::vector<ModelReport> entries;  ///< Ranked entries first, then failures

    [[nodiscard]] std::optional<ModelReport> best() const;
    [[nodiscard]] std::optional<ModelReport> find(std::string_view name) const;

    /// Formatted comparison table.
    [[nodiscard]] std::string to_string() const;
};

struct CrossValidationReport {
    std::string            name;
    std::vector<MetricSet> folds;
    MetricSet              mean;
    MetricSet              stddev;  ///< Sample std across folds

    [[nodiscard]] std::string to_string() const;
};

/// Candidate values per hyperparameter. An empty list keeps the base value.
struct HyperparameterGrid {
    std::vector<double>      alpha;
    std::vector<std::size_t> n_estimators;
    std::vector<std::size_t> max_depth;
    std::vector<std::size_t> min_samples_leaf;
    std::vector<double>      learning_rate;
    std::vector<double>      subsample;
    std::vector<double>      max_features;

    /// Cartesian product over the non-empty lists, applied to `base`, in
    /// declaration order with the last field varying fastest.
    [[nodiscard]] std::vector<Hyperparameters> expand(const Hyperparameters& base) const;
};

struct TuningTrial {
    Hyperparameters              params;
    std::optional<MetricSet>     cv_mean;  ///< Absent when a fold failed to fit
    std::optional<PipelineError> failure;
};

struct TuningReport {
    std::string              name;
    Hyperparameters          best;
    double                   best_mae = 0.0;  ///< Mean cross-validated MAE of `best`
    std::vector<TuningTrial> trials;          ///< Grid order

    [[nodiscard]] std::string to_string() const;
};

class Evaluator {
public:
    /// Name used for the ensemble's report entry.
    static constexpr std::string_view ENSEMBLE_NAME = "ensemble";

    explicit Evaluator(EvaluationConfig config = {}) : config_(config) {}

    /// Score every model and the ensemble on a held-out set.
    ///
    /// # Arguments
    /// * `models`   - trained models
    /// * `ensemble` - ensemble or the error that prevented it
    /// * `test`     - held-out feature rows (any column superset)
    /// * `target`   - actual values, one per test row
    /// * `statuses` - training statuses; failed ones are reported as such
    [[nodiscard]] EvaluationReport evaluate(std::span<const models::TrainedModel> models,
                                            const Result<models::Ensemble>& ensemble,
                                            const FeatureMatrix& test,
                                            const Eigen::VectorXd& target,
                                            std::span<const models::ModelStatus> statuses = {}) const;

    /// As above, also scoring every entry on the rows it was fitted on and
    /// filling `train_metrics` and `overfitting`.
    [[nodiscard]] EvaluationReport evaluate(std::span<const models::TrainedModel> models,
                                            const Result<models::Ensemble>& ensemble,
                                            const FeatureMatrix& test,
                                            const Eigen::VectorXd& target,
                                            std::span<const models::ModelStatus> statuses,
                                            const FeatureMatrix& train,
                                            const Eigen::VectorXd& train_target) const;

    /// Evaluate a training outcome on its own held-out split, with the
    /// train-vs-test comparison.
    [[nodiscard]] EvaluationReport evaluate(const models::TrainingOutcome& outcome) const;

    /// Seeded k-fold cross-validation of one regressor spec.
    ///
    /// # Returns
    /// `ConfigurationError` for unknown columns, `MalformedInput` with fewer
    /// rows than folds, `TrainingFailure` if any fold fails to fit.
    [[nodiscard]] Result<CrossValidationReport>
    cross_validate(const RegressorSpec& spec,
                   const FeatureMatrix& matrix,
                   const std::string& target_column,
                   std::span<const std::string> feature_columns,
                   std::uint64_t seed = constants::DEFAULT_SEED) const;

    /// Grid search of `spec`'s hyperparameters by cross-validated MAE.
    ///
    /// # Returns
    /// The errors of `cross_validate` for bad columns, rows or grid points;
    /// `TrainingFailure` when every grid point fails to fit.
    [[nodiscard]] Result<TuningReport>
    tune(const RegressorSpec& spec,
         const HyperparameterGrid& grid,
         const FeatureMatrix& matrix,
         const std::string& target_column,
         std::span<const std::string> feature_columns,
         std::uint64_t seed = constants::DEFAULT_SEED) const;

    /// Assign ranks in place and order entries: ranked by rank, then failures.
    void rank(std::vector<ModelReport>& entries) const;

    [[nodiscard]] const EvaluationConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] EvaluationReport evaluate_entries(std::span<const models::TrainedModel> models,
                                                    const Result<models::Ensemble>& ensemble,
                                                    const FeatureMatrix& test,
                                                    const Eigen::VectorXd& target,
                                                    std::span<const models::ModelStatus> statuses,
                                                    const FeatureMatrix* train,
                                                    const Eigen::VectorXd* train_target) const;

    EvaluationConfig config_;
};

}  // namespace strp::evaluation
