/// @file src/core/config.cpp
/// @brief Defaults and validation for the configuration records.
///
/// Validation reports the first problem found, naming the key as
/// `<section>.<field>` so the caller can locate it.

#include "strp/config.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <set>

namespace strp {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

[[nodiscard]] PipelineError config_error(std::string message) {
    return make_error(ErrorKind::ConfigurationError, std::move(message));
}

[[nodiscard]] bool positive_finite(double x) noexcept {
    return std::isfinite(x) && x > 0.0;
}

[[nodiscard]] bool unit_open_closed(double x) noexcept {
    return std::isfinite(x) && x > 0.0 && x <= 1.0;
}

/// Weights must be finite, non-negative and sum to one.
[[nodiscard]] std::optional<PipelineError>
check_weights(const char* section, std::initializer_list<std::pair<const char*, double>> weights) {
    double sum = 0.0;
    for (const auto& [name, w] : weights) {
        if (!std::isfinite(w) || w < 0.0) {
            return config_error(fmt::format("{}.{} must be finite and non-negative (got {})",
                                            section, name, w));
        }
        sum += w;
    }
    if (std::abs(sum - 1.0) > constants::WEIGHT_SUM_TOLERANCE) {
        return config_error(fmt::format("{} weights must sum to 1 (got {})", section, sum));
    }
    return std::nullopt;
}

}  // namespace

// ─── GeoConfig ───────────────────────────────────────────────────────────────

std::optional<PipelineError> GeoConfig::validate() const {
    if (!positive_finite(distance_cap_km))
        return config_error(fmt::format("geo.distance_cap_km must be > 0 (got {})", distance_cap_km));
    if (!positive_finite(density_radius_km))
        return config_error(fmt::format("geo.density_radius_km must be > 0 (got {})", density_radius_km));
    if (!positive_finite(grid_cell_degrees))
        return config_error(fmt::format("geo.grid_cell_degrees must be > 0 (got {})", grid_cell_degrees));

    std::set<PoiCategory> seen;
    for (const auto c : categories) {
        if (!seen.insert(c).second) {
            return config_error(fmt::format("geo.categories lists '{}' twice", to_string(c)));
        }
    }
    return std::nullopt;
}

// ─── TemporalConfig ──────────────────────────────────────────────────────────

std::vector<Holiday> default_holidays() {
    return {{1, 1}, {4, 21}, {5, 1}, {9, 7}, {10, 12}, {11, 2}, {11, 15}, {12, 25}};
}

std::chrono::year_month_day TemporalConfig::resolved_reference_date() const {
    if (reference_date) return *reference_date;
    return std::chrono::year_month_day{
        std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

std::optional<PipelineError> TemporalConfig::validate() const {
    if (reference_date && !reference_date->ok())
        return config_error("temporal.reference_date is not a calendar date");
    if (holiday_tolerance_days < 0)
        return config_error(fmt::format("temporal.holiday_tolerance_days must be >= 0 (got {})",
                                        holiday_tolerance_days));
    for (const auto& h : holidays) {
        // Leap year so that Feb 29 is accepted.
        const std::chrono::year_month_day ymd{std::chrono::year{2000},
                                              std::chrono::month{h.month},
                                              std::chrono::day{h.day}};
        if (!ymd.ok()) {
            return config_error(fmt::format("temporal.holidays contains invalid date {}/{}",
                                            h.month, h.day));
        }
    }
    return std::nullopt;
}

// ─── TrustConfig ─────────────────────────────────────────────────────────────

std::optional<PipelineError> TrustConfig::validate() const {
    if (!positive_finite(rating_scale))
        return config_error(fmt::format("trust.rating_scale must be > 0 (got {})", rating_scale));
    if (!positive_finite(review_saturation))
        return config_error(fmt::format("trust.review_saturation must be > 0 (got {})", review_saturation));
    if (min_reviews < 0)
        return config_error(fmt::format("trust.min_reviews must be >= 0 (got {})", min_reviews));
    if (!positive_finite(tenure_cap_years))
        return config_error(fmt::format("trust.tenure_cap_years must be > 0 (got {})", tenure_cap_years));

    if (auto err = check_weights("trust", {{"rating_weight", rating_weight},
                                           {"volume_weight", volume_weight},
                                           {"sufficiency_weight", sufficiency_weight}})) {
        return err;
    }
    return check_weights("trust.host", {{"superhost_weight", superhost_weight},
                                        {"response_weight", response_weight},
                                        {"verified_weight", verified_weight},
                                        {"tenure_weight", tenure_weight}});
}

// ─── AmenityConfig ───────────────────────────────────────────────────────────

const char* to_string(AmenityCategory category) noexcept {
    switch (category) {
        case AmenityCategory::Essential:    return "essential";
        case AmenityCategory::Premium:      return "premium";
        case AmenityCategory::WorkFriendly: return "work_friendly";
    }
    return "unknown";
}

std::array<AmenityCategorySpec, AMENITY_CATEGORY_COUNT> AmenityConfig::default_categories() {
    return {{
        {AmenityCategory::Essential,
         {"Wifi", "Internet", "Wireless Internet", "Kitchen", "Air conditioning",
          "Heating", "TV", "Cable TV", "Hot water"},
         constants::DEFAULT_ESSENTIAL_WEIGHT},
        {AmenityCategory::Premium,
         {"Pool", "Swimming pool", "Gym", "Elevator", "Doorman", "Free parking",
          "Washer", "Dryer"},
         constants::DEFAULT_PREMIUM_WEIGHT},
        {AmenityCategory::WorkFriendly,
         {"Laptop friendly workspace", "Desk", "Ethernet connection", "Printer"},
         constants::DEFAULT_WORK_FRIENDLY_WEIGHT},
    }};
}

std::vector<NamedAmenityFlag> AmenityConfig::default_flags() {
    return {
        {"has_wifi", {"wifi", "wi-fi", "wireless internet"}},
        {"has_pool", {"pool"}},
        {"has_parking", {"parking"}},
        {"has_air_conditioning", {"air conditioning", "a/c"}},
        {"has_kitchen", {"kitchen"}},
        {"has_washer", {"washer", "washing machine"}},
        {"has_tv", {"tv", "television"}},
    };
}

std::optional<PipelineError> AmenityConfig::validate() const {
    double sum = 0.0;
    for (std::size_t i = 0; i < categories.size(); ++i) {
        const auto& spec = categories[i];
        if (static_cast<std::size_t>(spec.category) != i) {
            return config_error(fmt::format("amenity.categories[{}] must be '{}'", i,
                                            to_string(static_cast<AmenityCategory>(i))));
        }
        if (spec.synonyms.empty()) {
            return config_error(fmt::format("amenity.{}.synonyms must not be empty",
                                            to_string(spec.category)));
        }
        if (!std::isfinite(spec.weight) || spec.weight < 0.0) {
            return config_error(fmt::format("amenity.{}.weight must be finite and non-negative",
                                            to_string(spec.category)));
        }
        sum += spec.weight;
    }
    if (std::abs(sum - 1.0) > constants::WEIGHT_SUM_TOLERANCE)
        return config_error(fmt::format("amenity category weights must sum to 1 (got {})", sum));

    for (const auto& flag : flags) {
        if (flag.column.empty() || flag.keywords.empty())
            return config_error("amenity.flags entries need a column name and keywords");
    }
    return std::nullopt;
}

// ─── FeatureConfig ───────────────────────────────────────────────────────────

std::optional<PipelineError> FeatureConfig::validate() const {
    if (auto err = geo.validate())      return err;
    if (auto err = temporal.validate()) return err;
    if (auto err = trust.validate())    return err;
    return amenity.validate();
}

// ─── Regressors ──────────────────────────────────────────────────────────────

const char* to_string(RegressorKind kind) noexcept {
    switch (kind) {
        case RegressorKind::Ridge:            return "ridge";
        case RegressorKind::RandomForest:     return "random_forest";
        case RegressorKind::GradientBoosting: return "gradient_boosting";
    }
    return "unknown";
}

std::optional<PipelineError> RegressorSpec::validate() const {
    if (name.empty()) return config_error("models.regressors entry has an empty name");
    const auto& p = params;
    if (!std::isfinite(p.alpha) || p.alpha < 0.0)
        return config_error(fmt::format("models.{}.alpha must be >= 0 (got {})", name, p.alpha));
    if (p.n_estimators == 0)
        return config_error(fmt::format("models.{}.n_estimators must be >= 1", name));
    if (p.max_depth == 0)
        return config_error(fmt::format("models.{}.max_depth must be >= 1", name));
    if (p.min_samples_leaf == 0)
        return config_error(fmt::format("models.{}.min_samples_leaf must be >= 1", name));
    if (!unit_open_closed(p.learning_rate))
        return config_error(fmt::format("models.{}.learning_rate must be in (0, 1] (got {})",
                                        name, p.learning_rate));
    if (!unit_open_closed(p.subsample))
        return config_error(fmt::format("models.{}.subsample must be in (0, 1] (got {})",
                                        name, p.subsample));
    if (!unit_open_closed(p.max_features))
        return config_error(fmt::format("models.{}.max_features must be in (0, 1] (got {})",
                                        name, p.max_features));
    return std::nullopt;
}

std::vector<RegressorSpec> default_regressors() {
    RegressorSpec ridge{.name = "ridge", .kind = RegressorKind::Ridge, .params = {}};

    RegressorSpec forest{.name = "random_forest", .kind = RegressorKind::RandomForest, .params = {}};
    forest.params.max_depth        = 12;
    forest.params.min_samples_leaf = 1;
    forest.params.max_features     = 0.5;

    RegressorSpec boosting{.name = "gradient_boosting", .kind = RegressorKind::GradientBoosting,
                           .params = {}};
    boosting.params.n_estimators = constants::DEFAULT_BOOSTING_ROUNDS;
    boosting.params.subsample    = 0.8;

    return {ridge, forest, boosting};
}

// ─── ModelConfig ─────────────────────────────────────────────────────────────

std::optional<PipelineError> ModelConfig::validate() const {
    if (regressors.empty()) return config_error("models.regressors must not be empty");

    std::set<std::string> names;
    for (const auto& spec : regressors) {
        if (auto err = spec.validate()) return err;
        if (!names.insert(spec.name).second)
            return config_error(fmt::format("models.regressors name '{}' is used twice", spec.name));
    }

    if (!std::isfinite(held_out_fraction) || held_out_fraction <= 0.0 || held_out_fraction >= 1.0)
        return config_error(fmt::format("models.held_out_fraction must be in (0, 1) (got {})",
                                        held_out_fraction));
    if (!std::isfinite(validation_fraction) || validation_fraction <= 0.0 ||
        validation_fraction >= 1.0)
        return config_error(fmt::format("models.validation_fraction must be in (0, 1) (got {})",
                                        validation_fraction));
    if (timeout && timeout->count() <= 0)
        return config_error("models.timeout must be positive");

    if (weighting == WeightingStrategy::RandomSearch && weight_search_trials == 0)
        return config_error("models.weight_search_trials must be >= 1");

    if (weighting == WeightingStrategy::Fixed) {
        if (fixed_weights.empty())
            return config_error("models.fixed_weights must not be empty with fixed weighting");
        double total = 0.0;
        for (const auto& [name, w] : fixed_weights) {
            if (!names.contains(name))
                return config_error(fmt::format("models.fixed_weights names unknown regressor '{}'", name));
            if (!std::isfinite(w) || w < 0.0)
                return config_error(fmt::format("models.fixed_weights.{} must be finite and non-negative", name));
            total += w;
        }
        if (total <= 0.0) return config_error("models.fixed_weights must not all be zero");
    }
    return std::nullopt;
}

// ─── Evaluation ──────────────────────────────────────────────────────────────

const char* to_string(Metric metric) noexcept {
    switch (metric) {
        case Metric::Mae:         return "mae";
        case Metric::Rmse:        return "rmse";
        case Metric::R2:          return "r2";
        case Metric::Mape:        return "mape";
        case Metric::Within10Pct: return "within_10pct";
        case Metric::Within20Pct: return "within_20pct";
    }
    return "unknown";
}

bool higher_is_better(Metric metric) noexcept {
    return metric == Metric::R2 || metric == Metric::Within10Pct ||
           metric == Metric::Within20Pct;
}

std::optional<PipelineError> EvaluationConfig::validate() const {
    if (cv_folds < 2)
        return config_error(fmt::format("evaluation.cv_folds must be >= 2 (got {})", cv_folds));
    return std::nullopt;
}

// ─── PipelineConfig ──────────────────────────────────────────────────────────

std::optional<PipelineError> PipelineConfig::validate() const {
    if (target_column.empty()) return config_error("target_column must not be empty");
    if (auto err = features.validate())   return err;
    if (auto err = models.validate())     return err;
    return evaluation.validate();
}

}  // namespace strp
