#include "ml/isolation_forest.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace datalens::ml {

namespace {

constexpr double kEulerGamma = 0.5772156649015329;

} // namespace

auto AveragePathLength(size_t n) -> double {
    if (n <= 1) {
        return 0.0;
    }
    if (n == 2) {
        return 1.0;
    }
    double nd = static_cast<double>(n);
    double harmonic = std::log(nd - 1.0) + kEulerGamma;
    return 2.0 * harmonic - 2.0 * (nd - 1.0) / nd;
}

void IsolationForest::Fit(const linalg::Matrix& x) {
    if (x.rows == 0) {
        throw std::invalid_argument("IsolationForest requires at least one row");
    }
    if (params_.n_estimators <= 0) {
        throw std::invalid_argument("n_estimators must be positive");
    }

    sample_size_ = std::min(params_.max_samples, x.rows);
    height_limit_ = static_cast<int>(std::ceil(std::log2(std::max<size_t>(sample_size_, 2))));

    std::mt19937_64 rng(params_.seed);
    std::vector<size_t> pool(x.rows);

    trees_.clear();
    trees_.reserve(static_cast<size_t>(params_.n_estimators));
    for (int t = 0; t < params_.n_estimators; ++t) {
        for (size_t i = 0; i < pool.size(); ++i) {
            pool[i] = i;
        }
        // Partial Fisher-Yates: the first sample_size_ slots form the subsample.
        for (size_t i = 0; i < sample_size_; ++i) {
            std::uniform_int_distribution<size_t> pick(i, pool.size() - 1);
            std::swap(pool[i], pool[pick(rng)]);
        }
        std::vector<size_t> sample(pool.begin(), pool.begin() + static_cast<std::ptrdiff_t>(sample_size_));

        Tree tree;
        Grow(x, sample, 0, sample.size(), 0, rng, tree);
        trees_.push_back(std::move(tree));
    }
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
auto IsolationForest::Grow(const linalg::Matrix& x, std::vector<size_t>& idx, size_t begin, size_t end,
                           int depth, std::mt19937_64& rng, Tree& tree) const -> int {
    int node_id = static_cast<int>(tree.nodes.size());
    tree.nodes.emplace_back();
    tree.nodes.back().size = end - begin;

    if (depth >= height_limit_ || end - begin <= 1) {
        return node_id;
    }

    std::vector<size_t> candidates;
    std::vector<double> lows(x.cols, 0.0);
    std::vector<double> highs(x.cols, 0.0);
    for (size_t f = 0; f < x.cols; ++f) {
        double lo = x(idx[begin], f);
        double hi = lo;
        for (size_t i = begin + 1; i < end; ++i) {
            double v = x(idx[i], f);
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
        if (hi > lo) {
            candidates.push_back(f);
            lows[f] = lo;
            highs[f] = hi;
        }
    }
    if (candidates.empty()) {
        return node_id;
    }

    std::uniform_int_distribution<size_t> pick_feature(0, candidates.size() - 1);
    size_t feature = candidates[pick_feature(rng)];
    double lo = lows[feature];
    double hi = highs[feature];
    std::uniform_real_distribution<double> pick_threshold(lo, hi);
    double threshold = pick_threshold(rng);
    if (threshold <= lo) {
        threshold = lo + (hi - lo) / 2.0;
    }

    auto first = idx.begin() + static_cast<std::ptrdiff_t>(begin);
    auto last = idx.begin() + static_cast<std::ptrdiff_t>(end);
    auto split = std::partition(first, last, [&](size_t i) { return x(i, feature) < threshold; });
    size_t mid = begin + static_cast<size_t>(split - first);

    int left = Grow(x, idx, begin, mid, depth + 1, rng, tree);
    int right = Grow(x, idx, mid, end, depth + 1, rng, tree);

    Node& node = tree.nodes[static_cast<size_t>(node_id)];
    node.feature = static_cast<int>(feature);
    node.threshold = threshold;
    node.left = left;
    node.right = right;
    return node_id;
}

auto IsolationForest::PathLength(const Tree& tree, const double* row) const -> double {
    size_t node_id = 0;
    int depth = 0;
    while (tree.nodes[node_id].feature >= 0) {
        const Node& node = tree.nodes[node_id];
        node_id = static_cast<size_t>(row[node.feature] < node.threshold ? node.left : node.right);
        depth++;
    }
    return static_cast<double>(depth) + AveragePathLength(tree.nodes[node_id].size);
}

auto IsolationForest::Score(const linalg::Matrix& x) const -> std::vector<double> {
    if (trees_.empty()) {
        throw std::runtime_error("IsolationForest is not fitted");
    }
    double norm = AveragePathLength(sample_size_);
    std::vector<double> scores(x.rows, 0.5);
    if (norm <= 0.0) {
        return scores;
    }
    for (size_t r = 0; r < x.rows; ++r) {
        double total = 0.0;
        for (const auto& tree : trees_) {
            total += PathLength(tree, x.row(r));
        }
        double mean_path = total / static_cast<double>(trees_.size());
        scores[r] = std::pow(2.0, -mean_path / norm);
    }
    return scores;
}

auto SelectOutliers(const std::vector<double>& scores, double contamination) -> std::vector<size_t> {
    if (contamination < 0.0 || contamination > 1.0) {
        throw std::invalid_argument("contamination must be within [0, 1]");
    }
    auto n_flag = static_cast<size_t>(std::llround(contamination * static_cast<double>(scores.size())));
    n_flag = std::min(n_flag, scores.size());
    auto order = linalg::argsort_desc(scores);
    order.resize(n_flag);
    return order;
}

} // namespace datalens::ml
