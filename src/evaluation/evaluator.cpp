/// @file src/evaluation/evaluator.cpp
/// @brief Evaluator: held-out comparison, ranking and k-fold cross-validation.

#include "strp/evaluation.hpp"
#include "strp/constants.hpp"
#include "strp/regressor.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numeric>
#include <random>

namespace strp::evaluation {

namespace {

[[nodiscard]] std::span<const double> as_span(const Eigen::VectorXd& v) noexcept {
    return {v.data(), static_cast<std::size_t>(v.size())};
}

[[nodiscard]] ModelReport failed_entry(std::string name, bool is_ensemble, PipelineError error) {
    return ModelReport{.name = std::move(name), .is_ensemble = is_ensemble,
                       .metrics = std::nullopt, .failure = std::move(error), .rank = std::nullopt};
}

/// Metrics for a prediction vector, or a failure entry explaining why not.
[[nodiscard]] ModelReport score_entry(std::string name, bool is_ensemble,
                                      const std::optional<Eigen::VectorXd>& predicted,
                                      const Eigen::VectorXd& target) {
    if (!predicted) {
        return failed_entry(std::move(name), is_ensemble,
                            make_error(ErrorKind::ConfigurationError,
                                       "test matrix lacks columns the model was trained on"));
    }
    auto metrics = MetricsCalculator::compute(as_span(target), as_span(*predicted));
    if (!metrics) {
        return failed_entry(std::move(name), is_ensemble,
                            make_error(ErrorKind::MalformedInput,
                                       "empty test set or non-finite predictions"));
    }
    return ModelReport{.name = std::move(name), .is_ensemble = is_ensemble,
                       .metrics = *metrics, .failure = std::nullopt, .rank = std::nullopt};
}

/// Training-set metrics and the train − test gap for a scored entry. Left
/// unset when the training rows cannot be scored.
void attach_training_fit(ModelReport& entry,
                         const std::optional<Eigen::VectorXd>& predicted,
                         const Eigen::VectorXd& train_target) {
    if (!entry.metrics || !predicted) return;
    const auto train = MetricsCalculator::compute(as_span(train_target), as_span(*predicted));
    if (!train) return;
    entry.train_metrics = *train;
    entry.overfitting   = OverfittingGap{.mae_diff = train->mae - entry.metrics->mae,
                                         .r2_diff  = train->r2 - entry.metrics->r2};
}

/// Short form of the tuned fields for tables and logs.
[[nodiscard]] std::string describe(const Hyperparameters& p) {
    return fmt::format("alpha={} trees={} depth={} leaf={} lr={} subsample={} features={}",
                       p.alpha, p.n_estimators, p.max_depth, p.min_samples_leaf,
                       p.learning_rate, p.subsample, p.max_features);
}

[[nodiscard]] MetricSet fold_mean(const std::vector<MetricSet>& folds) {
    MetricSet m;
    for (const auto& f : folds) {
        m.mae += f.mae;
        m.rmse += f.rmse;
        m.r2 += f.r2;
        m.mape += f.mape;
        m.within_10pct += f.within_10pct;
        m.within_20pct += f.within_20pct;
    }
    const double n = static_cast<double>(folds.size());
    m.mae /= n;
    m.rmse /= n;
    m.r2 /= n;
    m.mape /= n;
    m.within_10pct /= n;
    m.within_20pct /= n;
    return m;
}

[[nodiscard]] MetricSet fold_stddev(const std::vector<MetricSet>& folds, const MetricSet& mean) {
    MetricSet s;
    if (folds.size() < 2) return s;
    auto sq = [](double x) { return x * x; };
    for (const auto& f : folds) {
        s.mae += sq(f.mae - mean.mae);
        s.rmse += sq(f.rmse - mean.rmse);
        s.r2 += sq(f.r2 - mean.r2);
        s.mape += sq(f.mape - mean.mape);
        s.within_10pct += sq(f.within_10pct - mean.within_10pct);
        s.within_20pct += sq(f.within_20pct - mean.within_20pct);
    }
    const double d = static_cast<double>(folds.size() - 1);
    s.mae          = std::sqrt(s.mae / d);
    s.rmse         = std::sqrt(s.rmse / d);
    s.r2           = std::sqrt(s.r2 / d);
    s.mape         = std::sqrt(s.mape / d);
    s.within_10pct = std::sqrt(s.within_10pct / d);
    s.within_20pct = std::sqrt(s.within_20pct / d);
    return s;
}

}  // namespace

// ─── EvaluationReport ────────────────────────────────────────────────────────

std::optional<ModelReport> EvaluationReport::best() const {
    for (const auto& e : entries) {
        if (e.rank && *e.rank == 1) return e;
    }
    return std::nullopt;
}

std::optional<ModelReport> EvaluationReport::find(std::string_view name) const {
    for (const auto& e : entries) {
        if (e.name == name) return e;
    }
    return std::nullopt;
}

std::string EvaluationReport::to_string() const {
    std::string out = fmt::format(
        "┌──────┬──────────────────────┬───────────┬───────────┬─────────┬──────────┬────────┬────────┐\n"
        "│ Rank │ Model                │       MAE │      RMSE │      R2 │   MAPE % │    W10 │    W20 │\n"
        "├──────┼──────────────────────┼───────────┼───────────┼─────────┼──────────┼────────┼────────┤\n");
    for (const auto& e : entries) {
        const std::string label = e.is_ensemble ? fmt::format("{} *", e.name) : e.name;
        if (e.metrics) {
            const auto& m = *e.metrics;
            out += fmt::format("│ {:>4} │ {:<20} │ {:9.3f} │ {:9.3f} │ {:7.4f} │ {:8.2f} │ {:6.3f} │ {:6.3f} │\n",
                               e.rank.value_or(0), label, m.mae, m.rmse, m.r2, m.mape,
                               m.within_10pct, m.within_20pct);
        } else {
            const std::string reason = e.failure ? e.failure->to_string() : "not evaluated";
            out += fmt::format("│    - │ {:<20} │ {:<65.65} │\n", label, reason);
        }
    }
    out += fmt::format(
        "├──────┴──────────────────────┴───────────┴───────────┴─────────┴──────────┴────────┴────────┤\n"
        "│ Ranked by {:<6}  test rows: {:<8}  (* = ensemble){:>44}│\n"
        "└─────────────────────────────────────────────────────────────────────────────────────────────┘\n",
        strp::to_string(primary_metric), test_rows, "");

    const bool any_train = std::any_of(entries.begin(), entries.end(),
                                       [](const ModelReport& e) { return e.train_metrics.has_value(); });
    if (!any_train) return out;
    out += fmt::format(
        "\nTrain vs test\n"
        "  {:<22} {:>11} {:>11} {:>10} {:>9} {:>9} {:>9}\n",
        "Model", "Train MAE", "Test MAE", "MAE gap", "Train R2", "Test R2", "R2 gap");
    for (const auto& e : entries) {
        if (!e.train_metrics || !e.metrics || !e.overfitting) continue;
        const std::string label = e.is_ensemble ? fmt::format("{} *", e.name) : e.name;
        out += fmt::format("  {:<22} {:11.3f} {:11.3f} {:10.3f} {:9.4f} {:9.4f} {:9.4f}\n",
                           label, e.train_metrics->mae, e.metrics->mae, e.overfitting->mae_diff,
                           e.train_metrics->r2, e.metrics->r2, e.overfitting->r2_diff);
    }
    return out;
}

std::string CrossValidationReport::to_string() const {
    return fmt::format("{} ({}-fold)\n  mean: {}\n  std:  {}\n", name, folds.size(),
                       mean.to_string(), stddev.to_string());
}

// ─── Tuning ──────────────────────────────────────────────────────────────────

std::vector<Hyperparameters> HyperparameterGrid::expand(const Hyperparameters& base) const {
    std::vector<Hyperparameters> points = {base};
    auto vary = [&points](const auto& values, auto field) {
        if (values.empty()) return;
        std::vector<Hyperparameters> next;
        next.reserve(points.size() * values.size());
        for (const auto& p : points) {
            for (const auto& v : values) {
                Hyperparameters q = p;
                q.*field = v;
                next.push_back(q);
            }
        }
        points = std::move(next);
    };
    vary(alpha, &Hyperparameters::alpha);
    vary(n_estimators, &Hyperparameters::n_estimators);
    vary(max_depth, &Hyperparameters::max_depth);
    vary(min_samples_leaf, &Hyperparameters::min_samples_leaf);
    vary(learning_rate, &Hyperparameters::learning_rate);
    vary(subsample, &Hyperparameters::subsample);
    vary(max_features, &Hyperparameters::max_features);
    return points;
}

std::string TuningReport::to_string() const {
    std::string out = fmt::format("{}: {} grid points, best mean CV MAE {:.3f}\n  best: {}\n",
                                  name, trials.size(), best_mae, describe(best));
    for (const auto& t : trials) {
        if (t.cv_mean) {
            out += fmt::format("  {:10.3f}  {}\n", t.cv_mean->mae, describe(t.params));
        } else {
            out += fmt::format("  {:>10}  {} ({})\n", "failed", describe(t.params),
                               t.failure ? t.failure->message : "unknown");
        }
    }
    return out;
}

// ─── Evaluator ───────────────────────────────────────────────────────────────

void Evaluator::rank(std::vector<ModelReport>& entries) const {
    const Metric metric = config_.primary_metric;
    const bool   higher = higher_is_better(metric);
    std::stable_sort(entries.begin(), entries.end(), [&](const ModelReport& a, const ModelReport& b) {
        if (a.succeeded() != b.succeeded()) return a.succeeded();
        if (!a.succeeded()) return a.name < b.name;
        const double va = a.metrics->get(metric);
        const double vb = b.metrics->get(metric);
        if (va != vb) return higher ? va > vb : va < vb;
        return a.name < b.name;
    });
    std::size_t next = 1;
    for (auto& e : entries) {
        e.rank = e.succeeded() ? std::optional<std::size_t>(next++) : std::nullopt;
    }
}

EvaluationReport Evaluator::evaluate(std::span<const models::TrainedModel> models,
                                     const Result<models::Ensemble>& ensemble,
                                     const FeatureMatrix& test,
                                     const Eigen::VectorXd& target,
                                     std::span<const models::ModelStatus> statuses) const {
    return evaluate_entries(models, ensemble, test, target, statuses, nullptr, nullptr);
}

EvaluationReport Evaluator::evaluate(std::span<const models::TrainedModel> models,
                                     const Result<models::Ensemble>& ensemble,
                                     const FeatureMatrix& test,
                                     const Eigen::VectorXd& target,
                                     std::span<const models::ModelStatus> statuses,
                                     const FeatureMatrix& train,
                                     const Eigen::VectorXd& train_target) const {
    return evaluate_entries(models, ensemble, test, target, statuses, &train, &train_target);
}

EvaluationReport Evaluator::evaluate_entries(std::span<const models::TrainedModel> models,
                                             const Result<models::Ensemble>& ensemble,
                                             const FeatureMatrix& test,
                                             const Eigen::VectorXd& target,
                                             std::span<const models::ModelStatus> statuses,
                                             const FeatureMatrix* train,
                                             const Eigen::VectorXd* train_target) const {
    EvaluationReport report;
    report.primary_metric = config_.primary_metric;
    report.test_rows      = test.rows();

    const bool shape_ok = static_cast<std::size_t>(target.size()) == test.rows();
    const bool train_ok = train && train_target &&
                          static_cast<std::size_t>(train_target->size()) == train->rows();
    const auto shape_error = make_error(
        ErrorKind::MalformedInput,
        fmt::format("{} test targets for {} test rows", target.size(), test.rows()));

    for (const auto& m : models) {
        if (!shape_ok) {
            report.entries.push_back(failed_entry(m.name(), false, shape_error));
            continue;
        }
        report.entries.push_back(score_entry(m.name(), false, m.predict(test), target));
        if (train_ok) attach_training_fit(report.entries.back(), m.predict(*train), *train_target);
    }

    for (const auto& s : statuses) {
        if (s.state != models::ModelState::Failed) continue;
        report.entries.push_back(failed_entry(
            s.name, false,
            s.failure.value_or(make_error(ErrorKind::TrainingFailure, "training failed"))));
    }

    const std::string ensemble_name(ENSEMBLE_NAME);
    if (!ensemble) {
        report.entries.push_back(failed_entry(ensemble_name, true, ensemble.error()));
    } else if (!shape_ok) {
        report.entries.push_back(failed_entry(ensemble_name, true, shape_error));
    } else {
        report.entries.push_back(score_entry(ensemble_name, true, ensemble->predict(test), target));
        if (train_ok) {
            attach_training_fit(report.entries.back(), ensemble->predict(*train), *train_target);
        }
    }

    rank(report.entries);
    return report;
}

EvaluationReport Evaluator::evaluate(const models::TrainingOutcome& outcome) const {
    return evaluate(outcome.models, outcome.ensemble, outcome.test_features, outcome.test_target,
                    outcome.statuses, outcome.train_features, outcome.train_target);
}

Result<CrossValidationReport> Evaluator::cross_validate(const RegressorSpec& spec,
                                                        const FeatureMatrix& matrix,
                                                        const std::string& target_column,
                                                        std::span<const std::string> feature_columns,
                                                        std::uint64_t seed) const {
    if (auto err = config_.validate()) return *err;
    if (auto err = spec.validate()) return *err;

    const auto target_idx = matrix.column_index(target_column);
    if (!target_idx) {
        return make_error(ErrorKind::ConfigurationError,
                          fmt::format("target column '{}' is not in the feature matrix", target_column));
    }
    if (feature_columns.empty()) {
        return make_error(ErrorKind::ConfigurationError, "cross-validation needs feature columns");
    }
    for (const auto& c : feature_columns) {
        if (!matrix.column_index(c)) {
            return make_error(ErrorKind::ConfigurationError,
                              fmt::format("feature column '{}' is not in the feature matrix", c));
        }
        if (c == target_column) {
            return make_error(ErrorKind::ConfigurationError,
                              fmt::format("target column '{}' cannot also be a feature", c));
        }
    }

    const double sentinel = matrix.columns()[*target_idx].sentinel;
    std::vector<std::size_t> usable;
    for (std::size_t i = 0; i < matrix.rows(); ++i) {
        const double t = matrix.row_span(i)[*target_idx];
        if (std::isfinite(t) && t != sentinel) usable.push_back(i);
    }
    const std::size_t k = config_.cv_folds;
    if (usable.size() < k) {
        return make_error(ErrorKind::MalformedInput,
                          fmt::format("{} usable rows for {} folds", usable.size(), k));
    }

    std::mt19937_64 rng(seed);
    std::shuffle(usable.begin(), usable.end(), rng);

    const std::vector<std::string> features(feature_columns.begin(), feature_columns.end());
    const auto features_only = matrix.select_columns(features);
    const auto target_all    = *matrix.column(target_column);
    const auto regressor     = models::make_regressor(spec);

    CrossValidationReport report;
    report.name = spec.name;
    report.folds.reserve(k);
    for (std::size_t f = 0; f < k; ++f) {
        std::vector<std::size_t> train_rows, test_rows;
        for (std::size_t i = 0; i < usable.size(); ++i) {
            (i % k == f ? test_rows : train_rows).push_back(usable[i]);
        }

        const auto train = features_only.select_rows(train_rows);
        Eigen::VectorXd y_train(static_cast<Eigen::Index>(train_rows.size()));
        for (std::size_t i = 0; i < train_rows.size(); ++i) {
            y_train(static_cast<Eigen::Index>(i)) = target_all(static_cast<Eigen::Index>(train_rows[i]));
        }

        auto fitted = regressor->fit(train.values(), y_train);
        if (!fitted) {
            return make_error(ErrorKind::TrainingFailure,
                              fmt::format("fold {} of '{}': {}", f + 1, spec.name,
                                          fitted.error().message));
        }

        const auto test = features_only.select_rows(test_rows);
        const Eigen::VectorXd predicted = (*fitted)->predict_batch(test.values());
        Eigen::VectorXd y_test(static_cast<Eigen::Index>(test_rows.size()));
        for (std::size_t i = 0; i < test_rows.size(); ++i) {
            y_test(static_cast<Eigen::Index>(i)) = target_all(static_cast<Eigen::Index>(test_rows[i]));
        }

        auto metrics = MetricsCalculator::compute(as_span(y_test), as_span(predicted));
        if (!metrics) {
            return make_error(ErrorKind::TrainingFailure,
                              fmt::format("fold {} of '{}' produced non-finite predictions",
                                          f + 1, spec.name));
        }
        report.folds.push_back(*metrics);
    }

    report.mean   = fold_mean(report.folds);
    report.stddev = fold_stddev(report.folds, report.mean);
    return report;
}

Result<TuningReport> Evaluator::tune(const RegressorSpec& spec,
                                     const HyperparameterGrid& grid,
                                     const FeatureMatrix& matrix,
                                     const std::string& target_column,
                                     std::span<const std::string> feature_columns,
                                     std::uint64_t seed) const {
    TuningReport report;
    report.name = spec.name;

    // Every point reuses `seed`, so all of them see the same folds.
    std::optional<std::size_t> best;
    for (const auto& params : grid.expand(spec.params)) {
        RegressorSpec candidate = spec;
        candidate.params        = params;
        auto cv = cross_validate(candidate, matrix, target_column, feature_columns, seed);
        if (!cv) {
            if (cv.error().kind != ErrorKind::TrainingFailure) return cv.error();
            report.trials.push_back(TuningTrial{.params = params, .cv_mean = std::nullopt,
                                                .failure = cv.error()});
            continue;
        }
        report.trials.push_back(TuningTrial{.params = params, .cv_mean = cv->mean,
                                            .failure = std::nullopt});
        if (!best || cv->mean.mae < report.trials[*best].cv_mean->mae) {
            best = report.trials.size() - 1;
        }
    }
    if (!best) {
        return make_error(ErrorKind::TrainingFailure,
                          fmt::format("no grid point of '{}' could be fitted", spec.name));
    }
    report.best     = report.trials[*best].params;
    report.best_mae = report.trials[*best].cv_mean->mae;
    return report;
}

}  // namespace strp::evaluation
