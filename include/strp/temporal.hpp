#pragma once

/// @file include/strp/temporal.hpp
/// @brief Temporal Feature Engine: calendar encoding and demand proxies.
///
/// # Module: Temporal Features
///
/// ## Responsibility
/// Encode a reference date (seasonality, weekday, holidays) and derive
/// demand signals from a listing's availability and review activity.
///
/// ## Cyclical encoding
///     month_sin = sin(2π · month / 12),  month_cos = cos(2π · month / 12)
///     dow_sin   = sin(2π · dow / 7),     dow_cos   = cos(2π · dow / 7)
/// with `dow` the ISO weekday, Monday = 0.
///
/// ## Seasons
/// Southern Hemisphere: Dec–Feb summer, Mar–May autumn, Jun–Aug winter,
/// Sep–Nov spring. Summer is the high season.
///
/// ## Guarantees
/// - Pure and deterministic given the reference date
/// - Occupancy rates lie in [0, 1] or equal the -1 sentinel
///
/// ## NOT Responsible For
/// - Per-night calendar pricing; features describe one reference date

#include "strp/config.hpp"
#include "strp/feature_engine.hpp"
#include "strp/types.hpp"

#include <chrono>
#include <span>
#include <string_view>
#include <vector>

namespace strp::features {

enum class Season : unsigned char {
    Summer,
    Autumn,
    Winter,
    Spring,
};

[[nodiscard]] std::string_view to_string(Season season) noexcept;

/// Southern-Hemisphere season of a month in [1, 12].
[[nodiscard]] Season season_of(unsigned month) noexcept;

/// Calendar features of one date.
struct DateEncoding {
    unsigned month   = 1;
    unsigned quarter = 1;
    double month_sin = 0.0;
    double month_cos = 1.0;
    double dow_sin   = 0.0;
    double dow_cos   = 1.0;
    bool   is_weekend        = false;  ///< Friday, Saturday or Sunday
    Season season            = Season::Summer;
    bool   is_high_season    = false;
    bool   is_holiday        = false;  ///< Exact match
    bool   is_holiday_period = false;  ///< Within the tolerance window
    int    days_to_holiday   = 0;      ///< Circular distance to nearest holiday
};

/// True when `date` falls exactly on one of `holidays`.
[[nodiscard]] bool is_holiday(std::chrono::year_month_day date,
                              std::span<const Holiday> holidays) noexcept;

/// Days from `date` to the nearest holiday occurrence (previous, current or
/// next year), capped at `constants::MAX_DAYS_TO_HOLIDAY`.
[[nodiscard]] int days_to_nearest_holiday(std::chrono::year_month_day date,
                                          std::span<const Holiday> holidays);

/// Full calendar encoding of `date`.
[[nodiscard]] DateEncoding encode(std::chrono::year_month_day date,
                                  const TemporalConfig& config);

/// Columns:
///   month, quarter, month_sin, month_cos, dow_sin, dow_cos, is_weekend,
///   season_summer, season_autumn, season_winter, season_spring,
///   is_high_season, is_holiday, is_holiday_period, days_to_holiday,
///   occupancy_rate_30, occupancy_rate_60, occupancy_rate_90, demand_index,
///   recent_demand, popularity_score, days_since_last_review
class TemporalFeatureEngine final : public PerListingEngine {
public:
    explicit TemporalFeatureEngine(TemporalConfig config);

    [[nodiscard]] std::string_view name() const noexcept override { return "temporal"; }
    [[nodiscard]] const std::vector<ColumnSpec>& columns() const noexcept override { return columns_; }

    [[nodiscard]] std::chrono::year_month_day reference_date() const noexcept { return reference_; }
    [[nodiscard]] const DateEncoding& encoding() const noexcept { return encoding_; }

    /// `clamp(1 − available / window, 0, 1)`, or nullopt when unknown.
    [[nodiscard]] static std::optional<double> occupancy_rate(std::optional<int> available,
                                                              int window_days) noexcept;

protected:
    [[nodiscard]] RowStatus compute_row(const Listing& listing,
                                        std::span<double> row) const override;

private:
    TemporalConfig              config_;
    std::chrono::year_month_day reference_;
    DateEncoding                encoding_;  ///< Shared by every row
    std::vector<ColumnSpec>     columns_;
};

}  // namespace strp::features
