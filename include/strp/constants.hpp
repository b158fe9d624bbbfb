#pragma once

#include <cstddef>
#include <cstdint>

/// @file include/strp/constants.hpp
/// @brief Default parameters and sentinels for the pricing pipeline.
///
/// Every configurable default lives here so config structs and tests agree.

namespace strp::constants {

// ─── Geography ────────────────────────────────────────────────────────────────

/// Mean Earth radius used by the haversine formula.
static constexpr double EARTH_RADIUS_KM = 6371.0;

/// Nearest-POI searches beyond this distance report `NO_POI_WITHIN_CAP_KM`.
static constexpr double DEFAULT_DISTANCE_CAP_KM = 10.0;

/// Distance sentinel: no POI of the category lies within the cap.
static constexpr double NO_POI_WITHIN_CAP_KM = -1.0;

/// Default radius for POI density counts.
static constexpr double DEFAULT_DENSITY_RADIUS_KM = 1.0;

/// Bucket size of the POI spatial hash, in degrees (~5.5 km of latitude).
static constexpr double POI_BUCKET_DEGREES = 0.05;

/// Offset added to distances before inversion in accessibility scores.
static constexpr double ACCESSIBILITY_OFFSET_KM = 0.1;

/// Default grid cell size for price aggregation, in degrees (~1.1 km).
static constexpr double DEFAULT_GRID_CELL_DEGREES = 0.01;

// ─── Temporal ────────────────────────────────────────────────────────────────

/// Dates within this many days of a holiday fall in its holiday period.
static constexpr int DEFAULT_HOLIDAY_TOLERANCE_DAYS = 1;

/// Upper bound on `days_to_holiday` (half a year).
static constexpr int MAX_DAYS_TO_HOLIDAY = 183;

/// Sentinel for demand signals that cannot be derived.
static constexpr double UNKNOWN_DEMAND = -1.0;

// ─── Review trust ────────────────────────────────────────────────────────────

static constexpr double DEFAULT_RATING_SCALE        = 5.0;
static constexpr double DEFAULT_REVIEW_SATURATION   = 100.0;
static constexpr int    DEFAULT_MIN_REVIEWS         = 5;
static constexpr double DEFAULT_TRUST_RATING_WEIGHT = 0.4;
static constexpr double DEFAULT_TRUST_VOLUME_WEIGHT = 0.3;
static constexpr double DEFAULT_TRUST_SUFFICIENCY_WEIGHT = 0.3;

static constexpr double DEFAULT_HOST_SUPERHOST_WEIGHT = 0.4;
static constexpr double DEFAULT_HOST_RESPONSE_WEIGHT  = 0.25;
static constexpr double DEFAULT_HOST_VERIFIED_WEIGHT  = 0.2;
static constexpr double DEFAULT_HOST_TENURE_WEIGHT    = 0.15;
static constexpr double DEFAULT_HOST_TENURE_CAP_YEARS = 5.0;

/// Hosts with more listings than this are flagged as professional.
static constexpr int PROFESSIONAL_HOST_LISTINGS = 3;

/// Rating-consistency sentinel. Real consistency values are <= 0.
static constexpr double UNKNOWN_CONSISTENCY = 1.0;

/// Tolerance on "weights sum to one" configuration checks.
static constexpr double WEIGHT_SUM_TOLERANCE = 1e-6;

// ─── Amenities ───────────────────────────────────────────────────────────────

static constexpr double DEFAULT_ESSENTIAL_WEIGHT     = 0.3;
static constexpr double DEFAULT_PREMIUM_WEIGHT       = 0.5;
static constexpr double DEFAULT_WORK_FRIENDLY_WEIGHT = 0.2;

// ─── Base features ───────────────────────────────────────────────────────────

/// Sentinel for unknown numeric listing attributes.
static constexpr double UNKNOWN_ATTRIBUTE = -1.0;

/// Denominator offset in the bedroom/bathroom ratio.
static constexpr double RATIO_OFFSET = 0.1;

// ─── Training ────────────────────────────────────────────────────────────────

static constexpr double        DEFAULT_HELD_OUT_FRACTION = 0.2;
static constexpr std::uint64_t DEFAULT_SEED              = 42;

/// Ensembles need at least this many successfully trained members.
static constexpr std::size_t MIN_ENSEMBLE_MEMBERS = 2;

/// Tolerance on ensemble weights summing to one.
static constexpr double ENSEMBLE_WEIGHT_TOLERANCE = 1e-9;

static constexpr double        DEFAULT_RIDGE_ALPHA       = 1.0;
static constexpr std::size_t   DEFAULT_FOREST_TREES      = 100;
static constexpr std::size_t   DEFAULT_BOOSTING_ROUNDS   = 200;
static constexpr double        DEFAULT_LEARNING_RATE     = 0.1;
static constexpr std::size_t   DEFAULT_TREE_DEPTH        = 6;
static constexpr std::size_t   DEFAULT_MIN_SAMPLES_LEAF  = 2;

/// Trials of the random ensemble-weight search.
static constexpr std::size_t DEFAULT_WEIGHT_SEARCH_TRIALS = 1000;

/// Fraction of the training rows held back to score weight candidates.
static constexpr double DEFAULT_VALIDATION_FRACTION = 0.2;

// ─── Evaluation ──────────────────────────────────────────────────────────────

/// |actual| at or below this is excluded from MAPE.
static constexpr double MAPE_ZERO_EPSILON = 1e-12;

/// General floating-point comparison epsilon.
static constexpr double FLOAT_EPSILON = 1e-12;

static constexpr std::size_t DEFAULT_CV_FOLDS = 5;

} // namespace strp::constants
