/// @file src/features/review_trust.cpp
/// @brief ReviewTrustEngine implementation.

#include "strp/review_trust.hpp"
#include "strp/constants.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace strp::features {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

enum TrustColumn : std::size_t {
    TRUST_SCORE = 0,
    HOST_QUALITY,
    CONSISTENCY,
    RATING_NORMALIZED,
    HAS_ENOUGH_REVIEWS,
    REVIEWS_LOG,
    REVIEW_FREQUENCY,
    AVG_DETAILED_RATING,
    IS_SUPERHOST,
    IS_VERIFIED,
    RESPONSE_RATE,
    ACCEPTANCE_RATE,
    EXPERIENCE_YEARS,
    IS_PROFESSIONAL,
};

constexpr double DAYS_PER_YEAR = 365.25;

[[nodiscard]] double flag(bool b) noexcept { return b ? 1.0 : 0.0; }

[[nodiscard]] std::optional<double> finite(std::optional<double> x) noexcept {
    if (x && std::isfinite(*x)) return x;
    return std::nullopt;
}

}  // namespace

// ─── ReviewTrustEngine ───────────────────────────────────────────────────────

ReviewTrustEngine::ReviewTrustEngine(TrustConfig config,
                                     std::chrono::year_month_day reference_date)
    : config_(std::move(config)), reference_(reference_date) {
    const double unknown = constants::UNKNOWN_ATTRIBUTE;
    columns_ = {
        {"trust_score", 0.0},
        {"host_quality_score", 0.0},
        {"rating_consistency", constants::UNKNOWN_CONSISTENCY},
        {"rating_normalized", unknown},
        {"has_enough_reviews", 0.0},
        {"reviews_log", 0.0},
        {"review_frequency", 0.0},
        {"avg_detailed_rating", unknown},
        {"is_superhost", 0.0},
        {"is_identity_verified", 0.0},
        {"host_response_rate", unknown},
        {"host_acceptance_rate", unknown},
        {"host_experience_years", unknown},
        {"is_professional_host", 0.0},
    };
}

std::optional<double> ReviewTrustEngine::normalized_rating(const Listing& listing) const noexcept {
    const auto r = finite(listing.rating);
    if (!r) return std::nullopt;
    return std::clamp(*r / config_.rating_scale, 0.0, 1.0);
}

double ReviewTrustEngine::trust_score(const Listing& listing) const noexcept {
    const double reviews = static_cast<double>(std::max(listing.review_count, 0));
    const double volume  = std::min(reviews, config_.review_saturation) / config_.review_saturation;
    const bool   enough  = listing.review_count >= config_.min_reviews;

    const double score = config_.rating_weight * normalized_rating(listing).value_or(0.0) +
                         config_.volume_weight * volume +
                         config_.sufficiency_weight * flag(enough);
    return std::clamp(score, 0.0, 1.0);
}

std::optional<double> ReviewTrustEngine::host_years(const HostProfile& host) const noexcept {
    if (!host.host_since || !host.host_since->ok()) return std::nullopt;
    using std::chrono::sys_days;
    const auto days = (sys_days{reference_} - sys_days{*host.host_since}).count();
    return std::max(0.0, static_cast<double>(days) / DAYS_PER_YEAR);
}

double ReviewTrustEngine::host_quality_score(const Listing& listing) const noexcept {
    const auto& h = listing.host;
    const double response = std::clamp(finite(h.response_rate).value_or(0.0), 0.0, 1.0);
    const double tenure   = host_years(h)
        ? std::min(*host_years(h), config_.tenure_cap_years) / config_.tenure_cap_years
        : 0.0;

    const double score = config_.superhost_weight * flag(h.is_superhost) +
                         config_.response_weight * response +
                         config_.verified_weight * flag(h.identity_verified) +
                         config_.tenure_weight * tenure;
    return std::clamp(score, 0.0, 1.0);
}

std::optional<double> ReviewTrustEngine::rating_consistency(const SubRatings& sub) {
    const auto values = sub.available();
    if (values.size() < 2) return std::nullopt;

    const double n    = static_cast<double>(values.size());
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
    double sq = 0.0;
    for (double v : values) sq += (v - mean) * (v - mean);
    // Higher is more consistent; a perfectly uniform profile scores 0.
    return -std::sqrt(sq / (n - 1.0));
}

TrustScores ReviewTrustEngine::scores(const Listing& listing) const {
    TrustScores s;
    s.trust_score        = trust_score(listing);
    s.host_quality_score = host_quality_score(listing);
    s.rating_consistency = rating_consistency(listing.sub_ratings);
    return s;
}

RowStatus ReviewTrustEngine::compute_row(const Listing& listing,
                                         std::span<double> row) const {
    const auto& h = listing.host;
    const double reviews = static_cast<double>(std::max(listing.review_count, 0));

    row[TRUST_SCORE]  = trust_score(listing);
    row[HOST_QUALITY] = host_quality_score(listing);
    if (const auto c = rating_consistency(listing.sub_ratings)) row[CONSISTENCY] = *c;
    if (const auto r = normalized_rating(listing))              row[RATING_NORMALIZED] = *r;

    row[HAS_ENOUGH_REVIEWS] = flag(listing.review_count >= config_.min_reviews);
    row[REVIEWS_LOG]        = std::log1p(reviews);
    row[REVIEW_FREQUENCY]   = finite(listing.reviews_per_month).value_or(0.0);

    const auto sub = listing.sub_ratings.available();
    if (!sub.empty()) {
        row[AVG_DETAILED_RATING] =
            std::accumulate(sub.begin(), sub.end(), 0.0) / static_cast<double>(sub.size());
    }

    row[IS_SUPERHOST] = flag(h.is_superhost);
    row[IS_VERIFIED]  = flag(h.identity_verified);
    if (const auto rr = finite(h.response_rate))   row[RESPONSE_RATE]   = std::clamp(*rr, 0.0, 1.0);
    if (const auto ar = finite(h.acceptance_rate)) row[ACCEPTANCE_RATE] = std::clamp(*ar, 0.0, 1.0);
    if (const auto y = host_years(h))            row[EXPERIENCE_YEARS] = *y;
    row[IS_PROFESSIONAL] =
        flag(h.listings_count.value_or(0) > constants::PROFESSIONAL_HOST_LISTINGS);
    return RowStatus::Computed;
}

}  // namespace strp::features
