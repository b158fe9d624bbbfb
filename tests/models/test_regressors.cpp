/// @file tests/models/test_regressors.cpp
/// @brief Ridge, CART tree, random forest and gradient boosting.

#include <gtest/gtest.h>
#include "strp/regressor.hpp"
#include "models/gradient_boosting.hpp"
#include "models/random_forest.hpp"
#include "models/regression_tree.hpp"
#include "models/ridge.hpp"

#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <stop_token>
#include <string>

using namespace strp;
using namespace strp::models;

// ─── Helpers ─────────────────────────────────────────────────────────────────

/// y = 3 + 2·x0 − x1 (+ optional Gaussian noise), x2 is pure noise.
static void linear_data(std::size_t n, RowMatrix& X, Eigen::VectorXd& y, double noise = 0.0) {
    std::mt19937_64 rng(11);
    std::uniform_real_distribution<double> u(-5.0, 5.0);
    std::normal_distribution<double> e(0.0, noise > 0.0 ? noise : 1.0);
    X.resize(static_cast<Eigen::Index>(n), 3);
    y.resize(static_cast<Eigen::Index>(n));
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        X(i, 0) = u(rng);
        X(i, 1) = u(rng);
        X(i, 2) = u(rng);
        y(i) = 3.0 + 2.0 * X(i, 0) - X(i, 1) + (noise > 0.0 ? e(rng) : 0.0);
    }
}

/// y = 10 when x0 > 0.5 else 0; x1 is irrelevant.
static void step_data(std::size_t n, RowMatrix& X, Eigen::VectorXd& y) {
    X.resize(static_cast<Eigen::Index>(n), 2);
    y.resize(static_cast<Eigen::Index>(n));
    for (Eigen::Index i = 0; i < X.rows(); ++i) {
        X(i, 0) = static_cast<double>(i) / static_cast<double>(n);
        X(i, 1) = static_cast<double>((i * 7) % 5);
        y(i) = X(i, 0) > 0.5 ? 10.0 : 0.0;
    }
}

static double rmse(const FittedRegressor& m, const RowMatrix& X, const Eigen::VectorXd& y) {
    return std::sqrt((m.predict_batch(X) - y).squaredNorm() / static_cast<double>(y.size()));
}

static RegressorSpec spec_of(RegressorKind kind) {
    RegressorSpec s{.name = "m", .kind = kind, .params = {}};
    s.params.n_estimators = 30;
    return s;
}

// ─── Shared contract ─────────────────────────────────────────────────────────

class RegressorContract : public ::testing::TestWithParam<RegressorKind> {};

TEST_P(RegressorContract, RejectsEmptyData) {
    const auto r = make_regressor(spec_of(GetParam()));
    const auto fitted = r->fit(RowMatrix(0, 3), Eigen::VectorXd(0));
    ASSERT_FALSE(fitted.has_value());
    EXPECT_EQ(fitted.error().kind, ErrorKind::TrainingFailure);
}

TEST_P(RegressorContract, RejectsMismatchedTarget) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(20, X, y);
    const auto fitted = make_regressor(spec_of(GetParam()))->fit(X, y.head(10));
    ASSERT_FALSE(fitted.has_value());
    EXPECT_EQ(fitted.error().kind, ErrorKind::TrainingFailure);
}

TEST_P(RegressorContract, RejectsNonFiniteFeature) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(20, X, y);
    X(3, 1) = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(make_regressor(spec_of(GetParam()))->fit(X, y).has_value());
}

TEST_P(RegressorContract, ImportanceSumsToOne) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(120, X, y, 0.5);
    const auto fitted = make_regressor(spec_of(GetParam()))->fit(X, y);
    ASSERT_TRUE(fitted.has_value());
    const auto imp = (*fitted)->feature_importance();
    ASSERT_EQ(imp.size(), 3u);
    EXPECT_NEAR(std::accumulate(imp.begin(), imp.end(), 0.0), 1.0, 1e-9);
    // x0 carries the most signal.
    EXPECT_GT(imp[0], imp[2]);
}

TEST_P(RegressorContract, SameSeedSamePredictions) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(80, X, y, 1.0);
    const auto spec = spec_of(GetParam());
    const auto a = make_regressor(spec)->fit(X, y);
    const auto b = make_regressor(spec)->fit(X, y);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE((*a)->predict_batch(X) == (*b)->predict_batch(X));
}

TEST_P(RegressorContract, KindMatchesSpec) {
    const auto r = make_regressor(spec_of(GetParam()));
    EXPECT_EQ(r->kind(), GetParam());
}

INSTANTIATE_TEST_SUITE_P(AllKinds, RegressorContract,
                         ::testing::Values(RegressorKind::Ridge,
                                           RegressorKind::RandomForest,
                                           RegressorKind::GradientBoosting));

// ─── Ridge ───────────────────────────────────────────────────────────────────

TEST(Ridge, RecoversLinearFunction) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(200, X, y);
    const auto fitted = RidgeRegressor(1e-8).fit(X, y);
    ASSERT_TRUE(fitted.has_value());
    EXPECT_LT(rmse(**fitted, X, y), 1e-4);
    const std::vector<double> query = {1.0, 2.0, 0.0};
    EXPECT_NEAR((*fitted)->predict(query), 3.0, 1e-4);
}

TEST(Ridge, ConstantColumnIsHarmless) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(50, X, y);
    X.col(2).setConstant(4.0);
    const auto fitted = RidgeRegressor(1.0).fit(X, y);
    ASSERT_TRUE(fitted.has_value());
    const auto& ridge = dynamic_cast<const FittedRidge&>(**fitted);
    EXPECT_NEAR(ridge.coefficients()(2), 0.0, 1e-12);
}

TEST(Ridge, LargerAlphaShrinksCoefficients) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(60, X, y);
    const auto small = RidgeRegressor(0.01).fit(X, y);
    const auto large = RidgeRegressor(1000.0).fit(X, y);
    ASSERT_TRUE(small.has_value());
    ASSERT_TRUE(large.has_value());
    const auto& a = dynamic_cast<const FittedRidge&>(**small);
    const auto& b = dynamic_cast<const FittedRidge&>(**large);
    EXPECT_LT(b.coefficients().norm(), a.coefficients().norm());
}

// ─── Regression tree ─────────────────────────────────────────────────────────

TEST(RegressionTree, SplitsStepFunction) {
    RowMatrix X;
    Eigen::VectorXd y;
    step_data(100, X, y);
    std::vector<std::size_t> sample(100);
    std::iota(sample.begin(), sample.end(), 0);
    std::mt19937_64 rng(1);

    detail::RegressionTree tree;
    tree.fit(X, y, sample, {.max_depth = 3, .min_samples_leaf = 1, .max_features = 1.0}, rng);

    const std::vector<double> low  = {0.2, 0.0};
    const std::vector<double> high = {0.9, 0.0};
    EXPECT_DOUBLE_EQ(tree.predict(low), 0.0);
    EXPECT_DOUBLE_EQ(tree.predict(high), 10.0);
    // One split separates the classes perfectly; nothing further helps.
    EXPECT_EQ(tree.node_count(), 3u);
    EXPECT_EQ(tree.depth(), 1u);
    EXPECT_GT(tree.gains()[0], 0.0);
    EXPECT_DOUBLE_EQ(tree.gains()[1], 0.0);
}

TEST(RegressionTree, RespectsMaxDepth) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(200, X, y, 0.1);
    std::vector<std::size_t> sample(200);
    std::iota(sample.begin(), sample.end(), 0);
    std::mt19937_64 rng(1);
    detail::RegressionTree tree;
    tree.fit(X, y, sample, {.max_depth = 2, .min_samples_leaf = 1, .max_features = 1.0}, rng);
    EXPECT_LE(tree.depth(), 2u);
    EXPECT_LE(tree.node_count(), 7u);
}

TEST(RegressionTree, ConstantTargetIsSingleLeaf) {
    RowMatrix X;
    Eigen::VectorXd y;
    step_data(30, X, y);
    y.setConstant(4.0);
    std::vector<std::size_t> sample(30);
    std::iota(sample.begin(), sample.end(), 0);
    std::mt19937_64 rng(1);
    detail::RegressionTree tree;
    tree.fit(X, y, sample, {}, rng);
    EXPECT_EQ(tree.node_count(), 1u);
    const std::vector<double> query = {0.7, 1.0};
    EXPECT_DOUBLE_EQ(tree.predict(query), 4.0);
}

// ─── Ensembles of trees ──────────────────────────────────────────────────────

TEST(RandomForest, FitsNonLinearStep) {
    RowMatrix X;
    Eigen::VectorXd y;
    step_data(200, X, y);
    Hyperparameters p;
    p.n_estimators = 25;
    p.max_depth    = 4;
    const auto fitted = RandomForestRegressor(p).fit(X, y);
    ASSERT_TRUE(fitted.has_value());
    EXPECT_LT(rmse(**fitted, X, y), 1.5);
    EXPECT_EQ(dynamic_cast<const FittedForest&>(**fitted).tree_count(), 25u);
}

TEST(GradientBoosting, BeatsMeanBaseline) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(150, X, y, 0.5);
    Hyperparameters p;
    p.n_estimators = 60;
    p.max_depth    = 3;
    const auto fitted = GradientBoostingRegressor(p).fit(X, y);
    ASSERT_TRUE(fitted.has_value());

    const double baseline = std::sqrt((y.array() - y.mean()).square().mean());
    EXPECT_LT(rmse(**fitted, X, y), 0.5 * baseline);
    EXPECT_EQ(dynamic_cast<const FittedBoosting&>(**fitted).round_count(), 60u);
}

TEST(TreeEnsembles, StopRequestEndsFitEarly) {
    RowMatrix X;
    Eigen::VectorXd y;
    linear_data(50, X, y);
    Hyperparameters p;
    p.n_estimators = 10'000'000;

    std::stop_source stop;
    stop.request_stop();
    for (const auto kind : {RegressorKind::RandomForest, RegressorKind::GradientBoosting}) {
        const auto fitted = make_regressor({.name = "m", .kind = kind, .params = p},
                                           stop.get_token())->fit(X, y);
        ASSERT_FALSE(fitted.has_value());
        EXPECT_EQ(fitted.error().kind, ErrorKind::TrainingFailure);
        EXPECT_NE(fitted.error().message.find("stopped"), std::string::npos);
    }
}

TEST(TreeEnsembles, UnrequestedStopTokenChangesNothing) {
    RowMatrix X;
    Eigen::VectorXd y;
    step_data(80, X, y);
    Hyperparameters p;
    p.n_estimators = 10;
    std::stop_source stop;
    const auto a = RandomForestRegressor(p, stop.get_token()).fit(X, y);
    const auto b = RandomForestRegressor(p).fit(X, y);
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE((*a)->predict_batch(X) == (*b)->predict_batch(X));
}
