/// @file src/evaluation/metrics.cpp
/// @brief MetricsCalculator and MetricSet.
///
/// Fallible paths return std::nullopt; nothing here throws.

#include "strp/evaluation.hpp"
#include "strp/constants.hpp"

#include <cmath>
#include <fmt/format.h>

namespace strp::evaluation {

// ─── MetricSet ───────────────────────────────────────────────────────────────

double MetricSet::get(Metric metric) const noexcept {
    switch (metric) {
        case Metric::Mae:         return mae;
        case Metric::Rmse:        return rmse;
        case Metric::R2:          return r2;
        case Metric::Mape:        return mape;
        case Metric::Within10Pct: return within_10pct;
        case Metric::Within20Pct: return within_20pct;
    }
    return 0.0;
}

std::string MetricSet::to_string() const {
    return fmt::format("MAE={:.4f}  RMSE={:.4f}  R2={:.4f}  MAPE={:.2f}%  W10={:.3f}  W20={:.3f}",
                       mae, rmse, r2, mape, within_10pct, within_20pct);
}

// ─── MetricsCalculator ───────────────────────────────────────────────────────

bool MetricsCalculator::usable(std::span<const double> actual,
                               std::span<const double> predicted) noexcept {
    if (actual.empty() || actual.size() != predicted.size()) return false;
    for (std::size_t i = 0; i < actual.size(); ++i) {
        if (!std::isfinite(actual[i]) || !std::isfinite(predicted[i])) return false;
    }
    return true;
}

std::optional<double> MetricsCalculator::mae(std::span<const double> actual,
                                             std::span<const double> predicted) noexcept {
    if (!usable(actual, predicted)) return std::nullopt;
    double sum = 0.0;
    for (std::size_t i = 0; i < actual.size(); ++i) sum += std::abs(actual[i] - predicted[i]);
    return sum / static_cast<double>(actual.size());
}

std::optional<double> MetricsCalculator::rmse(std::span<const double> actual,
                                              std::span<const double> predicted) noexcept {
    if (!usable(actual, predicted)) return std::nullopt;
    double sq = 0.0;
    for (std::size_t i = 0; i < actual.size(); ++i) {
        const double d = actual[i] - predicted[i];
        sq += d * d;
    }
    return std::sqrt(sq / static_cast<double>(actual.size()));
}

std::optional<double> MetricsCalculator::r2(std::span<const double> actual,
                                            std::span<const double> predicted) noexcept {
    if (!usable(actual, predicted)) return std::nullopt;
    const double n = static_cast<double>(actual.size());
    double mean = 0.0;
    for (double y : actual) mean += y;
    mean /= n;

    double ss_res = 0.0, ss_tot = 0.0;
    for (std::size_t i = 0; i < actual.size(); ++i) {
        ss_res += (actual[i] - predicted[i]) * (actual[i] - predicted[i]);
        ss_tot += (actual[i] - mean) * (actual[i] - mean);
    }
    // Constant target: R² is undefined, reported as 0.
    if (ss_tot <= constants::FLOAT_EPSILON) return 0.0;
    return 1.0 - ss_res / ss_tot;
}

std::optional<double> MetricsCalculator::mape(std::span<const double> actual,
                                              std::span<const double> predicted) noexcept {
    if (!usable(actual, predicted)) return std::nullopt;
    double sum = 0.0;
    std::size_t n = 0;
    for (std::size_t i = 0; i < actual.size(); ++i) {
        if (std::abs(actual[i]) <= constants::MAPE_ZERO_EPSILON) continue;
        sum += std::abs((actual[i] - predicted[i]) / actual[i]);
        ++n;
    }
    if (n == 0) return 0.0;
    return 100.0 * sum / static_cast<double>(n);
}

std::optional<double> MetricsCalculator::within_fraction(std::span<const double> actual,
                                                         std::span<const double> predicted,
                                                         double tolerance) noexcept {
    if (!usable(actual, predicted) || !std::isfinite(tolerance) || tolerance < 0.0) return std::nullopt;
    std::size_t hits = 0;
    for (std::size_t i = 0; i < actual.size(); ++i) {
        if (std::abs(actual[i] - predicted[i]) <= tolerance * std::abs(actual[i])) ++hits;
    }
    return static_cast<double>(hits) / static_cast<double>(actual.size());
}

std::optional<MetricSet> MetricsCalculator::compute(std::span<const double> actual,
                                                    std::span<const double> predicted) noexcept {
    if (!usable(actual, predicted)) return std::nullopt;
    return MetricSet{
        .mae          = *mae(actual, predicted),
        .rmse         = *rmse(actual, predicted),
        .r2           = *r2(actual, predicted),
        .mape         = *mape(actual, predicted),
        .within_10pct = *within_fraction(actual, predicted, 0.10),
        .within_20pct = *within_fraction(actual, predicted, 0.20),
    };
}

}  // namespace strp::evaluation
