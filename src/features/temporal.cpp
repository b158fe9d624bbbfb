/// @file src/features/temporal.cpp
/// @brief Calendar encoding and TemporalFeatureEngine.

#include "strp/temporal.hpp"
#include "strp/constants.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <numbers>

namespace strp::features {

using namespace std::chrono;

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

enum TemporalColumn : std::size_t {
    MONTH = 0,
    QUARTER,
    MONTH_SIN,
    MONTH_COS,
    DOW_SIN,
    DOW_COS,
    IS_WEEKEND,
    SEASON_SUMMER,
    SEASON_AUTUMN,
    SEASON_WINTER,
    SEASON_SPRING,
    IS_HIGH_SEASON,
    IS_HOLIDAY,
    IS_HOLIDAY_PERIOD,
    DAYS_TO_HOLIDAY,
    OCCUPANCY_30,
    OCCUPANCY_60,
    OCCUPANCY_90,
    DEMAND_INDEX,
    RECENT_DEMAND,
    POPULARITY,
    DAYS_SINCE_REVIEW,
};

constexpr double TWO_PI = 2.0 * std::numbers::pi;

[[nodiscard]] double flag(bool b) noexcept { return b ? 1.0 : 0.0; }

}  // namespace

// ─── Pure calendar functions ─────────────────────────────────────────────────

std::string_view to_string(Season season) noexcept {
    switch (season) {
        case Season::Summer: return "summer";
        case Season::Autumn: return "autumn";
        case Season::Winter: return "winter";
        case Season::Spring: return "spring";
    }
    return "unknown";
}

Season season_of(unsigned month) noexcept {
    if (month == 12 || month <= 2) return Season::Summer;
    if (month <= 5)                return Season::Autumn;
    if (month <= 8)                return Season::Winter;
    return Season::Spring;
}

bool is_holiday(year_month_day date, std::span<const Holiday> holidays) noexcept {
    const unsigned m = static_cast<unsigned>(date.month());
    const unsigned d = static_cast<unsigned>(date.day());
    return std::any_of(holidays.begin(), holidays.end(),
                       [&](const Holiday& h) { return h.month == m && h.day == d; });
}

int days_to_nearest_holiday(year_month_day date, std::span<const Holiday> holidays) {
    const sys_days today{date};
    const int y = static_cast<int>(date.year());

    long best = constants::MAX_DAYS_TO_HOLIDAY;
    for (const auto& h : holidays) {
        // Neighbouring years cover the wrap at the year boundary.
        for (int dy = -1; dy <= 1; ++dy) {
            const year_month_day occ{year{y + dy}, month{h.month}, std::chrono::day{h.day}};
            if (!occ.ok()) continue;  // Feb 29 outside leap years
            const long diff = std::labs((sys_days{occ} - today).count());
            best = std::min(best, diff);
        }
    }
    return static_cast<int>(best);
}

DateEncoding encode(year_month_day date, const TemporalConfig& config) {
    DateEncoding e;
    e.month   = static_cast<unsigned>(date.month());
    e.quarter = (e.month - 1) / 3 + 1;

    const double m = static_cast<double>(e.month);
    e.month_sin = std::sin(TWO_PI * m / 12.0);
    e.month_cos = std::cos(TWO_PI * m / 12.0);

    // ISO weekday: Monday = 1 … Sunday = 7, shifted to Monday = 0.
    const unsigned dow = weekday{sys_days{date}}.iso_encoding() - 1;
    e.dow_sin    = std::sin(TWO_PI * static_cast<double>(dow) / 7.0);
    e.dow_cos    = std::cos(TWO_PI * static_cast<double>(dow) / 7.0);
    e.is_weekend = dow >= 4;

    e.season         = season_of(e.month);
    e.is_high_season = e.season == Season::Summer;

    e.is_holiday        = is_holiday(date, config.holidays);
    e.days_to_holiday   = days_to_nearest_holiday(date, config.holidays);
    e.is_holiday_period = !config.holidays.empty() &&
                          e.days_to_holiday <= config.holiday_tolerance_days;
    return e;
}

// ─── TemporalFeatureEngine ───────────────────────────────────────────────────

TemporalFeatureEngine::TemporalFeatureEngine(TemporalConfig config)
    : config_(std::move(config)),
      reference_(config_.resolved_reference_date()),
      encoding_(encode(reference_, config_)) {
    const double unknown = constants::UNKNOWN_DEMAND;
    columns_ = {
        {"month", 0.0},          {"quarter", 0.0},
        {"month_sin", 0.0},      {"month_cos", 0.0},
        {"dow_sin", 0.0},        {"dow_cos", 0.0},
        {"is_weekend", 0.0},
        {"season_summer", 0.0},  {"season_autumn", 0.0},
        {"season_winter", 0.0},  {"season_spring", 0.0},
        {"is_high_season", 0.0}, {"is_holiday", 0.0},
        {"is_holiday_period", 0.0},
        {"days_to_holiday", static_cast<double>(constants::MAX_DAYS_TO_HOLIDAY)},
        {"occupancy_rate_30", unknown},
        {"occupancy_rate_60", unknown},
        {"occupancy_rate_90", unknown},
        {"demand_index", unknown},
        {"recent_demand", 0.0},
        {"popularity_score", 0.0},
        {"days_since_last_review", unknown},
    };
}

std::optional<double> TemporalFeatureEngine::occupancy_rate(std::optional<int> available,
                                                            int window_days) noexcept {
    if (!available || window_days <= 0) return std::nullopt;
    const double rate = 1.0 - static_cast<double>(*available) / static_cast<double>(window_days);
    return std::clamp(rate, 0.0, 1.0);
}

RowStatus TemporalFeatureEngine::compute_row(const Listing& listing,
                                             std::span<double> row) const {
    const auto& e = encoding_;
    row[MONTH]             = static_cast<double>(e.month);
    row[QUARTER]           = static_cast<double>(e.quarter);
    row[MONTH_SIN]         = e.month_sin;
    row[MONTH_COS]         = e.month_cos;
    row[DOW_SIN]           = e.dow_sin;
    row[DOW_COS]           = e.dow_cos;
    row[IS_WEEKEND]        = flag(e.is_weekend);
    row[SEASON_SUMMER]     = flag(e.season == Season::Summer);
    row[SEASON_AUTUMN]     = flag(e.season == Season::Autumn);
    row[SEASON_WINTER]     = flag(e.season == Season::Winter);
    row[SEASON_SPRING]     = flag(e.season == Season::Spring);
    row[IS_HIGH_SEASON]    = flag(e.is_high_season);
    row[IS_HOLIDAY]        = flag(e.is_holiday);
    row[IS_HOLIDAY_PERIOD] = flag(e.is_holiday_period);
    row[DAYS_TO_HOLIDAY]   = static_cast<double>(e.days_to_holiday);

    const auto& a = listing.availability;
    const std::optional<double> occ[] = {
        occupancy_rate(a.days_30, 30),
        occupancy_rate(a.days_60, 60),
        occupancy_rate(a.days_90, 90),
    };
    double occ_sum = 0.0;
    int    occ_n   = 0;
    for (std::size_t k = 0; k < 3; ++k) {
        if (!occ[k]) continue;
        row[OCCUPANCY_30 + k] = *occ[k];
        occ_sum += *occ[k];
        ++occ_n;
    }
    if (occ_n > 0) row[DEMAND_INDEX] = occ_sum / occ_n;

    const double rpm = listing.reviews_per_month.value_or(0.0);
    const double reviews = static_cast<double>(std::max(listing.review_count, 0));
    row[RECENT_DEMAND] = std::isfinite(rpm) ? rpm : 0.0;
    // popularity = 0.5 · reviews + 0.5 · (100 · reviews_per_month)
    row[POPULARITY] = 0.5 * reviews + 0.5 * (row[RECENT_DEMAND] * 100.0);

    if (listing.last_review && listing.last_review->ok()) {
        const auto days = (sys_days{reference_} - sys_days{*listing.last_review}).count();
        row[DAYS_SINCE_REVIEW] = static_cast<double>(std::max<long long>(days, 0));
    }
    return RowStatus::Computed;
}

}  // namespace strp::features
