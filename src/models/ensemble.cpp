/// @file src/models/ensemble.cpp
/// @brief TrainedModel and Ensemble.

#include "strp/ensemble.hpp"
#include "strp/constants.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numeric>
#include <stdexcept>

namespace strp::models {

// ─── TrainedModel ────────────────────────────────────────────────────────────

TrainedModel::TrainedModel(std::string name, RegressorKind kind, FittedPtr fitted,
                           std::vector<std::string> feature_columns,
                           std::chrono::duration<double> training_time)
    : name_(std::move(name)), kind_(kind), fitted_(std::move(fitted)),
      columns_(std::move(feature_columns)), time_(training_time) {
    if (!fitted_) throw std::invalid_argument("TrainedModel requires a fitted regressor");
}

std::optional<double> TrainedModel::predict(const FeatureVector& features) const {
    std::vector<double> row;
    row.reserve(columns_.size());
    for (const auto& c : columns_) {
        const auto v = features.get(c);
        if (!v) return std::nullopt;
        row.push_back(*v);
    }
    return fitted_->predict(row);
}

std::optional<Eigen::VectorXd> TrainedModel::predict(const FeatureMatrix& matrix) const {
    for (const auto& c : columns_) {
        if (!matrix.column_index(c)) return std::nullopt;
    }
    const auto selected = matrix.select_columns(columns_);
    return fitted_->predict_batch(selected.values());
}

std::vector<std::pair<std::string, double>> TrainedModel::feature_importance() const {
    const auto imp = fitted_->feature_importance();
    std::vector<std::pair<std::string, double>> out;
    out.reserve(columns_.size());
    for (std::size_t j = 0; j < columns_.size() && j < imp.size(); ++j) {
        out.emplace_back(columns_[j], imp[j]);
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    return out;
}

// ─── Ensemble ────────────────────────────────────────────────────────────────

Result<Ensemble> Ensemble::create(std::vector<TrainedModel> members, std::vector<double> weights) {
    if (members.size() < constants::MIN_ENSEMBLE_MEMBERS) {
        return make_error(ErrorKind::InsufficientModels,
                          fmt::format("ensemble needs at least {} trained models, got {}",
                                      constants::MIN_ENSEMBLE_MEMBERS, members.size()));
    }
    if (weights.empty()) weights.assign(members.size(), 1.0);
    if (weights.size() != members.size()) {
        return make_error(ErrorKind::ConfigurationError,
                          fmt::format("{} ensemble weights for {} models", weights.size(),
                                      members.size()));
    }
    for (std::size_t i = 0; i < weights.size(); ++i) {
        if (!std::isfinite(weights[i]) || weights[i] < 0.0) {
            return make_error(ErrorKind::ConfigurationError,
                              fmt::format("ensemble weight for '{}' must be finite and non-negative",
                                          members[i].name()));
        }
    }
    const double total = std::accumulate(weights.begin(), weights.end(), 0.0);
    if (!(total > 0.0)) {
        return make_error(ErrorKind::ConfigurationError, "ensemble weights sum to zero");
    }
    for (auto& w : weights) w /= total;
    return Ensemble(std::move(members), std::move(weights));
}

std::optional<double> Ensemble::predict(const FeatureVector& features) const {
    double out = 0.0;
    for (std::size_t i = 0; i < members_.size(); ++i) {
        const auto p = members_[i].predict(features);
        if (!p) return std::nullopt;
        out += weights_[i] * *p;
    }
    return out;
}

std::optional<Eigen::VectorXd> Ensemble::predict(const FeatureMatrix& matrix) const {
    Eigen::VectorXd out = Eigen::VectorXd::Zero(static_cast<Eigen::Index>(matrix.rows()));
    for (std::size_t i = 0; i < members_.size(); ++i) {
        const auto p = members_[i].predict(matrix);
        if (!p) return std::nullopt;
        out += weights_[i] * *p;
    }
    return out;
}

std::optional<std::vector<Contribution>>
Ensemble::contributions(const FeatureVector& features) const {
    std::vector<Contribution> out;
    out.reserve(members_.size());
    for (std::size_t i = 0; i < members_.size(); ++i) {
        const auto p = members_[i].predict(features);
        if (!p) return std::nullopt;
        out.push_back({members_[i].name(), weights_[i], *p});
    }
    return out;
}

}  // namespace strp::models
