/// @file src/models/orchestrator.cpp
/// @brief Train/test split, per-model training with timeouts, ensemble weights.

#include "strp/orchestrator.hpp"
#include "strp/constants.hpp"
#include "strp/regressor.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <fmt/format.h>
#include <future>
#include <memory>
#include <numeric>
#include <random>
#include <set>
#include <stop_token>
#include <thread>

namespace strp::models {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

using Clock = std::chrono::steady_clock;

/// Training inputs shared with (possibly detached) worker threads.
struct TrainingData {
    RowMatrix       X;
    Eigen::VectorXd y;
};

struct FitResult {
    Result<FittedPtr>             fitted;
    std::chrono::duration<double> elapsed;
};

struct PendingFit {
    std::future<FitResult> future;
    Clock::time_point      started;
    std::stop_source       stop;
};

/// Launch one fit on a detached thread. The thread co-owns its inputs so it
/// may outlive the caller after a timeout.
[[nodiscard]] PendingFit launch_fit(const RegressorSpec& spec,
                                    std::shared_ptr<const TrainingData> data) {
    std::stop_source stop;
    std::shared_ptr<const Regressor> regressor = make_regressor(spec, stop.get_token());
    std::packaged_task<FitResult()> task([regressor, data] {
        const auto t0 = Clock::now();
        auto fitted   = regressor->fit(data->X, data->y);
        return FitResult{std::move(fitted), Clock::now() - t0};
    });
    PendingFit pending{task.get_future(), Clock::now(), stop};
    std::thread(std::move(task)).detach();
    return pending;
}

/// Wait for a fit, honouring the optional timeout measured from launch.
/// A timed-out fit is asked to stop so its thread does not keep a core busy.
[[nodiscard]] FitResult collect_fit(PendingFit& pending, const RegressorSpec& spec,
                                    const std::optional<std::chrono::milliseconds>& timeout) {
    if (timeout) {
        if (pending.future.wait_until(pending.started + *timeout) != std::future_status::ready) {
            pending.stop.request_stop();
            return FitResult{
                make_error(ErrorKind::TrainingFailure,
                           fmt::format("'{}' exceeded the {} ms timeout", spec.name, timeout->count())),
                Clock::now() - pending.started};
        }
    }
    try {
        return pending.future.get();
    } catch (const std::exception& e) {
        return FitResult{
            make_error(ErrorKind::TrainingFailure, fmt::format("'{}' threw: {}", spec.name, e.what())),
            Clock::now() - pending.started};
    }
}

[[nodiscard]] double mean_abs_error(const Eigen::VectorXd& pred, const Eigen::VectorXd& target) {
    return (pred - target).cwiseAbs().mean();
}

}  // namespace

// ─── Split ───────────────────────────────────────────────────────────────────

Result<DataSplit> split_rows(std::size_t n, double held_out_fraction, std::uint64_t seed) {
    if (!std::isfinite(held_out_fraction) || held_out_fraction <= 0.0 || held_out_fraction >= 1.0) {
        return make_error(ErrorKind::ConfigurationError,
                          fmt::format("held_out_fraction must be in (0, 1) (got {})", held_out_fraction));
    }
    if (n < 3) {
        return make_error(ErrorKind::MalformedInput,
                          fmt::format("need at least 3 rows to split, got {}", n));
    }

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::mt19937_64 rng(seed);
    std::shuffle(order.begin(), order.end(), rng);

    const auto n_test = std::clamp<std::size_t>(
        static_cast<std::size_t>(std::llround(held_out_fraction * static_cast<double>(n))), 1, n - 2);

    DataSplit split;
    split.test.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(n_test));
    split.train.assign(order.begin() + static_cast<std::ptrdiff_t>(n_test), order.end());
    return split;
}

// ─── TrainingOutcome ─────────────────────────────────────────────────────────

std::optional<TrainedModel> TrainingOutcome::find(std::string_view name) const {
    for (const auto& m : models) {
        if (m.name() == name) return m;
    }
    return std::nullopt;
}

// ─── Weight search ───────────────────────────────────────────────────────────

std::vector<double> ModelOrchestrator::search_weights(const Eigen::MatrixXd& predictions,
                                                      const Eigen::VectorXd& target,
                                                      std::size_t trials,
                                                      std::uint64_t seed) {
    const auto m = static_cast<std::size_t>(predictions.cols());
    std::vector<double> best(m, m == 0 ? 0.0 : 1.0 / static_cast<double>(m));
    if (m == 0 || predictions.rows() == 0) return best;

    auto mae_of = [&](const std::vector<double>& w) {
        const Eigen::Map<const Eigen::VectorXd> wv(w.data(), static_cast<Eigen::Index>(m));
        return mean_abs_error(predictions * wv, target);
    };

    double best_mae = mae_of(best);
    std::mt19937_64 rng(seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::vector<double> w(m);
    for (std::size_t t = 1; t < trials; ++t) {
        for (auto& x : w) x = unit(rng);
        const double total = std::accumulate(w.begin(), w.end(), 0.0);
        if (!(total > 0.0)) continue;
        for (auto& x : w) x /= total;

        const double mae = mae_of(w);
        if (mae < best_mae) {
            best_mae = mae;
            best     = w;
        }
    }
    return best;
}

// ─── ModelOrchestrator ───────────────────────────────────────────────────────

Result<TrainingOutcome> ModelOrchestrator::train(const FeatureMatrix& matrix,
                                                 const std::string& target_column) const {
    if (auto err = config_.validate()) return *err;

    const auto target_idx = matrix.column_index(target_column);
    if (!target_idx) {
        return make_error(ErrorKind::ConfigurationError,
                          fmt::format("target column '{}' is not in the feature matrix", target_column));
    }

    // ── Feature columns ─────────────────────────────────────────────────────
    std::set<std::string> excluded(config_.excluded_columns.begin(), config_.excluded_columns.end());
    for (const auto& name : excluded) {
        if (!matrix.column_index(name)) {
            return make_error(ErrorKind::ConfigurationError,
                              fmt::format("excluded column '{}' is not in the feature matrix", name));
        }
    }
    excluded.insert(target_column);

    std::vector<std::string> features;
    for (const auto& c : matrix.columns()) {
        if (!excluded.contains(c.name)) features.push_back(c.name);
    }
    if (features.empty()) {
        return make_error(ErrorKind::ConfigurationError, "no feature columns left after exclusions");
    }

    // ── Rows with a known target ────────────────────────────────────────────
    const double sentinel = matrix.columns()[*target_idx].sentinel;
    std::vector<std::size_t> usable;
    usable.reserve(matrix.rows());
    for (std::size_t i = 0; i < matrix.rows(); ++i) {
        const double t = matrix.row_span(i)[*target_idx];
        if (std::isfinite(t) && t != sentinel) usable.push_back(i);
    }
    if (config_.verbose && usable.size() < matrix.rows()) {
        fmt::print(stderr, "Skipping {} rows with unknown '{}'\n",
                   matrix.rows() - usable.size(), target_column);
    }

    auto local_split = split_rows(usable.size(), config_.held_out_fraction, config_.seed);
    if (!local_split) return local_split.error();
    DataSplit split;
    for (const auto i : local_split->train) split.train.push_back(usable[i]);
    for (const auto i : local_split->test)  split.test.push_back(usable[i]);

    // ── Fit / validation rows ───────────────────────────────────────────────
    std::vector<std::size_t> fit_rows = split.train;
    std::vector<std::size_t> validation_rows;
    const bool search = config_.weighting == WeightingStrategy::RandomSearch;
    if (search) {
        const auto n_val = static_cast<std::size_t>(
            std::llround(config_.validation_fraction * static_cast<double>(split.train.size())));
        if (n_val >= 1 && split.train.size() - n_val >= 2) {
            validation_rows.assign(split.train.end() - static_cast<std::ptrdiff_t>(n_val), split.train.end());
            fit_rows.resize(split.train.size() - n_val);
        } else if (config_.verbose) {
            fmt::print(stderr, "Too few training rows for a validation slice; using uniform weights\n");
        }
    }

    auto train_matrix = matrix.select_rows(fit_rows);
    auto data = std::make_shared<TrainingData>();
    data->X = train_matrix.select_columns(features).values();
    data->y = *train_matrix.column(target_column);
    Eigen::VectorXd train_target = data->y;
    std::shared_ptr<const TrainingData> shared = std::move(data);

    // ── Train ───────────────────────────────────────────────────────────────
    const auto& specs = config_.regressors;
    std::vector<FitResult> results;
    results.reserve(specs.size());
    if (config_.parallel_training) {
        std::vector<PendingFit> pending;
        pending.reserve(specs.size());
        for (const auto& spec : specs) pending.push_back(launch_fit(spec, shared));
        for (std::size_t k = 0; k < specs.size(); ++k) {
            results.push_back(collect_fit(pending[k], specs[k], config_.timeout));
        }
    } else {
        for (const auto& spec : specs) {
            auto pending = launch_fit(spec, shared);
            results.push_back(collect_fit(pending, spec, config_.timeout));
        }
    }

    std::vector<TrainedModel> models;
    std::vector<ModelStatus>  statuses;
    for (std::size_t k = 0; k < specs.size(); ++k) {
        auto& r = results[k];
        ModelStatus status{.name = specs[k].name, .kind = specs[k].kind,
                           .state = ModelState::Failed, .failure = std::nullopt,
                           .training_time = r.elapsed};
        if (r.fitted) {
            status.state = ModelState::Trained;
            models.emplace_back(specs[k].name, specs[k].kind, std::move(r.fitted).value(),
                                features, r.elapsed);
        } else {
            status.failure = r.fitted.error();
            if (config_.verbose) {
                fmt::print(stderr, "Model '{}' failed: {}\n", specs[k].name, r.fitted.error().to_string());
            }
        }
        if (config_.verbose && status.state == ModelState::Trained) {
            fmt::print(stderr, "Model '{}' trained in {:.3f}s\n", specs[k].name, r.elapsed.count());
        }
        statuses.push_back(std::move(status));
    }

    // ── Ensemble weights ────────────────────────────────────────────────────
    std::vector<double> weights;
    if (config_.weighting == WeightingStrategy::Fixed) {
        for (const auto& m : models) {
            const auto it = config_.fixed_weights.find(m.name());
            weights.push_back(it == config_.fixed_weights.end() ? 0.0 : it->second);
        }
    } else if (search && !validation_rows.empty() && models.size() >= constants::MIN_ENSEMBLE_MEMBERS) {
        const auto val = matrix.select_rows(validation_rows);
        Eigen::MatrixXd preds(static_cast<Eigen::Index>(val.rows()),
                              static_cast<Eigen::Index>(models.size()));
        for (std::size_t k = 0; k < models.size(); ++k) {
            preds.col(static_cast<Eigen::Index>(k)) = *models[k].predict(val);
        }
        weights = search_weights(preds, *val.column(target_column),
                                 config_.weight_search_trials, config_.seed);
    }

    auto ensemble = Ensemble::create(models, weights);
    if (config_.verbose && !ensemble) {
        fmt::print(stderr, "Ensemble unavailable: {}\n", ensemble.error().to_string());
    }

    auto test_features = matrix.select_rows(split.test);
    Eigen::VectorXd test_target = *test_features.column(target_column);
    return TrainingOutcome{
        .models          = std::move(models),
        .statuses        = std::move(statuses),
        .ensemble        = std::move(ensemble),
        .split           = std::move(split),
        .feature_columns = std::move(features),
        .target_column   = target_column,
        .test_features   = std::move(test_features),
        .test_target     = std::move(test_target),
        .train_features  = std::move(train_matrix),
        .train_target    = std::move(train_target),
    };
}

}  // namespace strp::models
