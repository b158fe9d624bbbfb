#pragma once

/// @file include/strp/review_trust.hpp
/// @brief Review Trust Engine: rating trust, host quality, consistency.
///
/// # Module: Review Trust
///
/// ## Responsibility
/// Turn guest reviews and host attributes into bounded quality signals.
///
/// ## Formulas
///     rating_norm = clamp(rating / scale, 0, 1)          (unknown → 0)
///     trust       = w_r · rating_norm
///                 + w_v · min(reviews, saturation) / saturation
///                 + w_s · [reviews ≥ min_reviews]
///     host        = w_sh · superhost + w_rr · response_rate
///                 + w_iv · verified  + w_t  · min(years, cap) / cap
///     consistency = −stddev(available sub-ratings)       (≥ 2 required)
///
/// ## Guarantees
/// - `trust_score` and `host_quality_score` lie in [0, 1] for every input
///   when the configured weights are valid
/// - Consistency is ≤ 0 when known and +1 (sentinel) otherwise
///
/// ## NOT Responsible For
/// - Sentiment analysis of review text

#include "strp/config.hpp"
#include "strp/feature_engine.hpp"
#include "strp/types.hpp"

#include <chrono>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace strp::features {

/// Scalar scores of one listing.
struct TrustScores {
    double trust_score        = 0.0;
    double host_quality_score = 0.0;
    std::optional<double> rating_consistency;
};

class ReviewTrustEngine final : public PerListingEngine {
public:
    /// # Arguments
    /// * `config`         - weights and caps; must pass `TrustConfig::validate()`
    /// * `reference_date` - "today" for host tenure
    ReviewTrustEngine(TrustConfig config, std::chrono::year_month_day reference_date);

    [[nodiscard]] std::string_view name() const noexcept override { return "trust"; }
    [[nodiscard]] const std::vector<ColumnSpec>& columns() const noexcept override { return columns_; }

    [[nodiscard]] double trust_score(const Listing& listing) const noexcept;
    [[nodiscard]] double host_quality_score(const Listing& listing) const noexcept;
    [[nodiscard]] TrustScores scores(const Listing& listing) const;

    /// −(sample std) over available sub-ratings; nullopt with fewer than two.
    [[nodiscard]] static std::optional<double> rating_consistency(const SubRatings& sub);

    /// Whole years (fractional) between `since` and the reference date.
    [[nodiscard]] std::optional<double> host_years(const HostProfile& host) const noexcept;

protected:
    [[nodiscard]] RowStatus compute_row(const Listing& listing,
                                        std::span<double> row) const override;

private:
    [[nodiscard]] std::optional<double> normalized_rating(const Listing& listing) const noexcept;

    TrustConfig                 config_;
    std::chrono::year_month_day reference_;
    std::vector<ColumnSpec>     columns_;
};

}  // namespace strp::features
