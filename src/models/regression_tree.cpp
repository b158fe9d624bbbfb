/// @file src/models/regression_tree.cpp
/// @brief Exact-split CART regression tree.

#include "regression_tree.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace strp::models::detail {

namespace {

/// Minimum SSE reduction for a split to be worth making.
constexpr double MIN_GAIN = 1e-12;

struct Split {
    int    feature   = -1;
    double threshold = 0.0;
    double gain      = 0.0;
};

}  // namespace

void RegressionTree::fit(const RowMatrix& X, const Eigen::VectorXd& y,
                         std::span<const std::size_t> sample,
                         const TreeParams& params, std::mt19937_64& rng) {
    nodes_.clear();
    gains_.assign(static_cast<std::size_t>(X.cols()), 0.0);
    std::vector<std::size_t> idx(sample.begin(), sample.end());
    if (idx.empty()) {
        nodes_.push_back(TreeNode{});
        return;
    }
    build(X, y, idx, 0, params, rng);
}

int RegressionTree::build(const RowMatrix& X, const Eigen::VectorXd& y,
                          std::vector<std::size_t>& idx, std::size_t depth,
                          const TreeParams& params, std::mt19937_64& rng) {
    const std::size_t n = idx.size();
    double sum = 0.0, sum_sq = 0.0;
    for (const std::size_t i : idx) {
        const double v = y(static_cast<Eigen::Index>(i));
        sum += v;
        sum_sq += v * v;
    }
    const double dn = static_cast<double>(n);

    TreeNode node;
    node.value = sum / dn;

    const std::size_t min_leaf = std::max<std::size_t>(params.min_samples_leaf, 1);
    const double total_sse = sum_sq - sum * sum / dn;
    if (depth >= params.max_depth || n < 2 * min_leaf || total_sse <= MIN_GAIN) {
        nodes_.push_back(node);
        return static_cast<int>(nodes_.size() - 1);
    }

    // Candidate features, optionally a random subset (random forest).
    const auto p = static_cast<std::size_t>(X.cols());
    std::vector<std::size_t> features(p);
    std::iota(features.begin(), features.end(), 0);
    if (params.max_features < 1.0 && p > 1) {
        const auto k = std::clamp<std::size_t>(
            static_cast<std::size_t>(std::lround(params.max_features * static_cast<double>(p))), 1, p);
        std::shuffle(features.begin(), features.end(), rng);
        features.resize(k);
        std::sort(features.begin(), features.end());
    }

    Split best;
    std::vector<std::size_t> order(n);
    for (const std::size_t f : features) {
        const auto fc = static_cast<Eigen::Index>(f);
        order = idx;
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return X(static_cast<Eigen::Index>(a), fc) < X(static_cast<Eigen::Index>(b), fc);
        });

        double l_sum = 0.0, l_sq = 0.0;
        for (std::size_t k = 1; k < n; ++k) {
            const double v = y(static_cast<Eigen::Index>(order[k - 1]));
            l_sum += v;
            l_sq += v * v;
            if (k < min_leaf || n - k < min_leaf) continue;

            const double x_lo = X(static_cast<Eigen::Index>(order[k - 1]), fc);
            const double x_hi = X(static_cast<Eigen::Index>(order[k]), fc);
            if (!(x_lo < x_hi)) continue;  // no boundary between equal values

            const double kl = static_cast<double>(k);
            const double kr = dn - kl;
            const double r_sum = sum - l_sum;
            const double r_sq  = sum_sq - l_sq;
            // ΔSSE = SSE(parent) − SSE(left) − SSE(right)
            const double gain = total_sse - (l_sq - l_sum * l_sum / kl) - (r_sq - r_sum * r_sum / kr);
            if (gain > best.gain + MIN_GAIN) {
                best = Split{static_cast<int>(f), x_lo + 0.5 * (x_hi - x_lo), gain};
            }
        }
    }

    if (best.feature < 0) {
        nodes_.push_back(node);
        return static_cast<int>(nodes_.size() - 1);
    }

    std::vector<std::size_t> left, right;
    const auto bf = static_cast<Eigen::Index>(best.feature);
    for (const std::size_t i : idx) {
        (X(static_cast<Eigen::Index>(i), bf) <= best.threshold ? left : right).push_back(i);
    }
    if (left.empty() || right.empty()) {
        nodes_.push_back(node);
        return static_cast<int>(nodes_.size() - 1);
    }

    node.feature   = best.feature;
    node.threshold = best.threshold;
    gains_[static_cast<std::size_t>(best.feature)] += best.gain;

    const int self = static_cast<int>(nodes_.size());
    nodes_.push_back(node);
    // Release the parent's index list before recursing.
    idx.clear();
    idx.shrink_to_fit();
    const int l = build(X, y, left, depth + 1, params, rng);
    const int r = build(X, y, right, depth + 1, params, rng);
    nodes_[static_cast<std::size_t>(self)].left  = l;
    nodes_[static_cast<std::size_t>(self)].right = r;
    return self;
}

double RegressionTree::predict(std::span<const double> row) const noexcept {
    if (nodes_.empty()) return 0.0;
    std::size_t id = 0;
    while (nodes_[id].feature >= 0) {
        const auto& nd = nodes_[id];
        const auto  f  = static_cast<std::size_t>(nd.feature);
        const bool  go_left = f < row.size() && row[f] <= nd.threshold;
        id = static_cast<std::size_t>(go_left ? nd.left : nd.right);
    }
    return nodes_[id].value;
}

std::size_t RegressionTree::depth() const {
    if (nodes_.empty()) return 0;
    std::size_t deepest = 0;
    std::vector<std::pair<std::size_t, std::size_t>> stack{{0, 0}};
    while (!stack.empty()) {
        const auto [id, d] = stack.back();
        stack.pop_back();
        deepest = std::max(deepest, d);
        if (nodes_[id].feature >= 0) {
            stack.emplace_back(static_cast<std::size_t>(nodes_[id].left), d + 1);
            stack.emplace_back(static_cast<std::size_t>(nodes_[id].right), d + 1);
        }
    }
    return deepest;
}

}  // namespace strp::models::detail
