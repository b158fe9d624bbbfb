#pragma once

/// @file include/strp/config.hpp
/// @brief Immutable configuration records for every pipeline stage.
///
/// # Module: Configuration
///
/// ## Responsibility
/// Aggregate structs with in-class defaults taken from strp/constants.hpp.
/// Each is passed by const reference to the component it configures; no
/// component reads global state.
///
/// ## Guarantees
/// - `validate()` never throws; it names the first offending key
/// - A default-constructed `PipelineConfig` is valid
///
/// ## NOT Responsible For
/// - Parsing configuration files or command lines

#include "strp/constants.hpp"
#include "strp/errors.hpp"
#include "strp/types.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strp {

// ─── Geography ───────────────────────────────────────────────────────────────

struct GeoConfig {
    std::vector<PoiCategory> categories{ALL_POI_CATEGORIES.begin(),
                                        ALL_POI_CATEGORIES.end()};
    double distance_cap_km   = constants::DEFAULT_DISTANCE_CAP_KM;
    double density_radius_km = constants::DEFAULT_DENSITY_RADIUS_KM;
    double grid_cell_degrees = constants::DEFAULT_GRID_CELL_DEGREES;

    [[nodiscard]] std::optional<PipelineError> validate() const;
};

// ─── Temporal ────────────────────────────────────────────────────────────────

/// A fixed-date holiday recurring every year.
struct Holiday {
    unsigned month = 1;
    unsigned day   = 1;
};

[[nodiscard]] std::vector<Holiday> default_holidays();

struct TemporalConfig {
    /// Date the temporal features describe; today's UTC date when unset.
    std::optional<std::chrono::year_month_day> reference_date;
    std::vector<Holiday> holidays = default_holidays();
    int holiday_tolerance_days    = constants::DEFAULT_HOLIDAY_TOLERANCE_DAYS;

    /// `reference_date` or today's UTC date.
    [[nodiscard]] std::chrono::year_month_day resolved_reference_date() const;

    [[nodiscard]] std::optional<PipelineError> validate() const;
};

// ─── Review trust ────────────────────────────────────────────────────────────

struct TrustConfig {
    double rating_scale      = constants::DEFAULT_RATING_SCALE;
    double review_saturation = constants::DEFAULT_REVIEW_SATURATION;
    int    min_reviews       = constants::DEFAULT_MIN_REVIEWS;

    double rating_weight      = constants::DEFAULT_TRUST_RATING_WEIGHT;
    double volume_weight      = constants::DEFAULT_TRUST_VOLUME_WEIGHT;
    double sufficiency_weight = constants::DEFAULT_TRUST_SUFFICIENCY_WEIGHT;

    double superhost_weight = constants::DEFAULT_HOST_SUPERHOST_WEIGHT;
    double response_weight  = constants::DEFAULT_HOST_RESPONSE_WEIGHT;
    double verified_weight  = constants::DEFAULT_HOST_VERIFIED_WEIGHT;
    double tenure_weight    = constants::DEFAULT_HOST_TENURE_WEIGHT;
    double tenure_cap_years = constants::DEFAULT_HOST_TENURE_CAP_YEARS;

    [[nodiscard]] std::optional<PipelineError> validate() const;
};

// ─── Amenities ───────────────────────────────────────────────────────────────

enum class AmenityCategory : std::uint8_t {
    Essential,
    Premium,
    WorkFriendly,
};

inline constexpr std::size_t AMENITY_CATEGORY_COUNT = 3;

/// "essential", "premium", "work_friendly"
[[nodiscard]] const char* to_string(AmenityCategory category) noexcept;

struct AmenityCategorySpec {
    AmenityCategory          category = AmenityCategory::Essential;
    std::vector<std::string> synonyms;
    double                   weight = 0.0;  ///< Share of `amenity_score`
};

/// A single-amenity flag column such as `has_wifi`.
struct NamedAmenityFlag {
    std::string              column;
    std::vector<std::string> keywords;
};

struct AmenityConfig {
    std::array<AmenityCategorySpec, AMENITY_CATEGORY_COUNT> categories = default_categories();
    std::vector<NamedAmenityFlag> flags = default_flags();

    [[nodiscard]] static std::array<AmenityCategorySpec, AMENITY_CATEGORY_COUNT>
    default_categories();
    [[nodiscard]] static std::vector<NamedAmenityFlag> default_flags();

    [[nodiscard]] std::optional<PipelineError> validate() const;
};

// ─── Feature assembly ────────────────────────────────────────────────────────

struct FeatureConfig {
    GeoConfig      geo;
    TemporalConfig temporal;
    TrustConfig    trust;
    AmenityConfig  amenity;

    std::size_t worker_threads = 0;  ///< 0 = std::thread::hardware_concurrency()
    bool        verbose        = false;

    [[nodiscard]] std::optional<PipelineError> validate() const;
};

// ─── Models ──────────────────────────────────────────────────────────────────

enum class RegressorKind : std::uint8_t {
    Ridge,
    RandomForest,
    GradientBoosting,
};

[[nodiscard]] const char* to_string(RegressorKind kind) noexcept;

struct Hyperparameters {
    double        alpha            = constants::DEFAULT_RIDGE_ALPHA;
    std::size_t   n_estimators     = constants::DEFAULT_FOREST_TREES;
    std::size_t   max_depth        = constants::DEFAULT_TREE_DEPTH;
    std::size_t   min_samples_leaf = constants::DEFAULT_MIN_SAMPLES_LEAF;
    double        learning_rate    = constants::DEFAULT_LEARNING_RATE;
    double        subsample        = 1.0;  ///< Row fraction per boosting round
    double        max_features     = 1.0;  ///< Feature fraction per forest split
    std::uint64_t seed             = constants::DEFAULT_SEED;
};

struct RegressorSpec {
    std::string     name;
    RegressorKind   kind = RegressorKind::Ridge;
    Hyperparameters params;

    [[nodiscard]] std::optional<PipelineError> validate() const;
};

/// Ridge, random forest and gradient boosting with their usual defaults.
[[nodiscard]] std::vector<RegressorSpec> default_regressors();

enum class WeightingStrategy : std::uint8_t {
    Uniform,       ///< Equal weights
    Fixed,         ///< `ModelConfig::fixed_weights`, renormalised over successes
    RandomSearch,  ///< Seeded search minimising validation MAE
};

struct ModelConfig {
    std::vector<RegressorSpec> regressors = default_regressors();
    std::vector<std::string>   excluded_columns;
    double        held_out_fraction = constants::DEFAULT_HELD_OUT_FRACTION;
    std::uint64_t seed              = constants::DEFAULT_SEED;

    WeightingStrategy             weighting = WeightingStrategy::Uniform;
    std::map<std::string, double> fixed_weights;
    std::size_t weight_search_trials  = constants::DEFAULT_WEIGHT_SEARCH_TRIALS;
    double      validation_fraction   = constants::DEFAULT_VALIDATION_FRACTION;

    bool parallel_training = true;
    /// Per-regressor wall-clock limit; unset means no limit.
    std::optional<std::chrono::milliseconds> timeout;
    bool verbose = false;

    [[nodiscard]] std::optional<PipelineError> validate() const;
};

// ─── Evaluation ──────────────────────────────────────────────────────────────

enum class Metric : std::uint8_t {
    Mae,
    Rmse,
    R2,
    Mape,
    Within10Pct,
    Within20Pct,
};

[[nodiscard]] const char* to_string(Metric metric) noexcept;

/// True for metrics where larger values rank first.
[[nodiscard]] bool higher_is_better(Metric metric) noexcept;

struct EvaluationConfig {
    Metric      primary_metric = Metric::Rmse;
    std::size_t cv_folds       = constants::DEFAULT_CV_FOLDS;

    [[nodiscard]] std::optional<PipelineError> validate() const;
};

// ─── Whole pipeline ──────────────────────────────────────────────────────────

struct PipelineConfig {
    FeatureConfig    features;
    ModelConfig      models;
    EvaluationConfig evaluation;
    std::string      target_column = "price";

    [[nodiscard]] std::optional<PipelineError> validate() const;
};

}  // namespace strp
