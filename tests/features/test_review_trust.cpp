#include <gtest/gtest.h>
#include "strp/review_trust.hpp"
#include "strp/constants.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <vector>

using namespace strp;
using namespace strp::features;
using namespace std::chrono;

// ─── Helpers ─────────────────────────────────────────────────────────────────

static const year_month_day REFERENCE = year{2024} / June / 30;

static Listing reviewed(double rating, int reviews) {
    Listing l;
    l.rating       = rating;
    l.review_count = reviews;
    return l;
}

// ─── Trust score ─────────────────────────────────────────────────────────────

TEST(Trust_Score, PerfectRatingHundredReviewsIsOne) {
    const ReviewTrustEngine engine(TrustConfig{}, REFERENCE);
    EXPECT_DOUBLE_EQ(engine.trust_score(reviewed(5.0, 100)), 1.0);
}

TEST(Trust_Score, NoReviewsNoRatingIsZero) {
    const ReviewTrustEngine engine(TrustConfig{}, REFERENCE);
    EXPECT_DOUBLE_EQ(engine.trust_score(Listing{}), 0.0);
}

TEST(Trust_Score, WeightedComponents) {
    const ReviewTrustEngine engine(TrustConfig{}, REFERENCE);
    // 0.4 · (4/5) + 0.3 · (50/100) + 0.3 · 1
    EXPECT_NEAR(engine.trust_score(reviewed(4.0, 50)), 0.32 + 0.15 + 0.3, 1e-12);
    // Below the minimum review count the sufficiency term drops out.
    EXPECT_NEAR(engine.trust_score(reviewed(4.0, 4)), 0.32 + 0.3 * 0.04, 1e-12);
}

TEST(Trust_Score, OutOfScaleRatingIsClamped) {
    const ReviewTrustEngine engine(TrustConfig{}, REFERENCE);
    const double s = engine.trust_score(reviewed(9.0, 1000));
    EXPECT_LE(s, 1.0);
    EXPECT_GE(engine.trust_score(reviewed(-3.0, -5)), 0.0);
}

TEST(Trust_Score, NonFiniteRatingContributesNothing) {
    const ReviewTrustEngine engine(TrustConfig{}, REFERENCE);
    const double s = engine.trust_score(reviewed(std::numeric_limits<double>::quiet_NaN(), 100));
    EXPECT_NEAR(s, 0.6, 1e-12);
}

// ─── Host quality ────────────────────────────────────────────────────────────

TEST(Trust_Host, FullProfileIsOne) {
    const ReviewTrustEngine engine(TrustConfig{}, REFERENCE);
    Listing l;
    l.host.is_superhost      = true;
    l.host.identity_verified = true;
    l.host.response_rate     = 1.0;
    l.host.host_since        = year{2010} / January / 1;
    EXPECT_DOUBLE_EQ(engine.host_quality_score(l), 1.0);
}

TEST(Trust_Host, TenureIsCapped) {
    const ReviewTrustEngine engine(TrustConfig{}, REFERENCE);
    Listing l;
    l.host.host_since = year{2022} / June / 30;
    const double years = *engine.host_years(l.host);
    EXPECT_NEAR(years, 731.0 / 365.25, 1e-12);
    EXPECT_NEAR(engine.host_quality_score(l), 0.15 * years / 5.0, 1e-12);
}

TEST(Trust_Host, MissingHostSinceHasNoYears) {
    const ReviewTrustEngine engine(TrustConfig{}, REFERENCE);
    EXPECT_FALSE(engine.host_years(HostProfile{}).has_value());
}

// ─── Rating consistency ──────────────────────────────────────────────────────

TEST(Trust_Consistency, UniformSubRatingsScoreZero) {
    SubRatings sub{5.0, 5.0, 5.0, 5.0, std::nullopt, 5.0};
    EXPECT_DOUBLE_EQ(*ReviewTrustEngine::rating_consistency(sub), 0.0);
}

TEST(Trust_Consistency, NegativeSampleStd) {
    SubRatings sub;
    sub.accuracy    = 4.0;
    sub.cleanliness = 5.0;
    EXPECT_NEAR(*ReviewTrustEngine::rating_consistency(sub), -std::sqrt(0.5), 1e-12);
}

TEST(Trust_Consistency, FewerThanTwoIsUnknown) {
    SubRatings sub;
    sub.value = 4.5;
    EXPECT_FALSE(ReviewTrustEngine::rating_consistency(sub).has_value());
}

// ─── Engine rows ─────────────────────────────────────────────────────────────

TEST(TrustEngine_Compute, RowValues) {
    const ReviewTrustEngine engine(TrustConfig{}, REFERENCE);
    Listing l = reviewed(4.5, 20);
    l.reviews_per_month   = 1.5;
    l.host.listings_count = 12;
    l.host.response_rate  = 0.9;
    l.host.acceptance_rate = 1.4;
    const std::vector<Listing> listings = {l, Listing{}};

    const auto out = engine.compute(listings, 2);
    const auto& cols = engine.columns();
    auto at = [&](Eigen::Index row, const std::string& name) {
        for (std::size_t j = 0; j < cols.size(); ++j) {
            if (cols[j].name == name) return out.values(row, static_cast<Eigen::Index>(j));
        }
        ADD_FAILURE() << "missing column " << name;
        return std::numeric_limits<double>::quiet_NaN();
    };

    EXPECT_DOUBLE_EQ(at(0, "rating_normalized"), 0.9);
    EXPECT_DOUBLE_EQ(at(0, "has_enough_reviews"), 1.0);
    EXPECT_DOUBLE_EQ(at(0, "reviews_log"), std::log1p(20.0));
    EXPECT_DOUBLE_EQ(at(0, "review_frequency"), 1.5);
    EXPECT_DOUBLE_EQ(at(0, "is_professional_host"), 1.0);
    EXPECT_DOUBLE_EQ(at(0, "host_response_rate"), 0.9);
    EXPECT_DOUBLE_EQ(at(0, "host_acceptance_rate"), 1.0);

    EXPECT_DOUBLE_EQ(at(1, "rating_normalized"), constants::UNKNOWN_ATTRIBUTE);
    EXPECT_DOUBLE_EQ(at(1, "rating_consistency"), constants::UNKNOWN_CONSISTENCY);
    EXPECT_DOUBLE_EQ(at(1, "avg_detailed_rating"), constants::UNKNOWN_ATTRIBUTE);
    EXPECT_DOUBLE_EQ(at(1, "host_experience_years"), constants::UNKNOWN_ATTRIBUTE);
    EXPECT_DOUBLE_EQ(at(1, "host_acceptance_rate"), constants::UNKNOWN_ATTRIBUTE);
}

TEST(TrustEngine_Compute, ScoresStayInUnitInterval) {
    TrustConfig cfg;
    const ReviewTrustEngine engine(cfg, REFERENCE);
    for (int reviews : {0, 1, 5, 99, 100, 5000}) {
        for (double rating : {0.0, 2.5, 5.0, 7.0}) {
            const auto s = engine.scores(reviewed(rating, reviews));
            EXPECT_GE(s.trust_score, 0.0);
            EXPECT_LE(s.trust_score, 1.0);
            EXPECT_GE(s.host_quality_score, 0.0);
            EXPECT_LE(s.host_quality_score, 1.0);
        }
    }
}
