#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "linalg/matrix.h"

namespace datalens::ml {

struct IsolationForestParams {
    int n_estimators = 100;
    size_t max_samples = 256;
    uint64_t seed = 42;
};

// Average path length of an unsuccessful BST search over n points, c(n).
auto AveragePathLength(size_t n) -> double;

/**
 * @brief Isolation forest over standardized rows.
 *
 * Each tree isolates a random subsample (without replacement) by splitting on
 * a random non-constant feature at a uniform threshold, up to depth
 * ceil(log2(sample_size)). The anomaly score of a row is
 * 2^(-E[h(x)] / c(sample_size)): close to 1 for easily isolated rows, around
 * 0.5 or below for inliers. All randomness comes from one engine seeded
 * with `seed`, so identical input gives identical scores.
 */
class IsolationForest {
public:
    explicit IsolationForest(IsolationForestParams params) : params_(params) {}

    void Fit(const linalg::Matrix& x);

    [[nodiscard]] auto Score(const linalg::Matrix& x) const -> std::vector<double>;

    [[nodiscard]] auto tree_count() const -> size_t { return trees_.size(); }
    [[nodiscard]] auto sample_size() const -> size_t { return sample_size_; }

private:
    struct Node {
        int feature = -1; // leaf when negative
        double threshold = 0.0;
        int left = -1;
        int right = -1;
        size_t size = 0;
    };

    struct Tree {
        std::vector<Node> nodes;
    };

    auto Grow(const linalg::Matrix& x, std::vector<size_t>& idx, size_t begin, size_t end,
              int depth, std::mt19937_64& rng, Tree& tree) const -> int;
    [[nodiscard]] auto PathLength(const Tree& tree, const double* row) const -> double;

    IsolationForestParams params_;
    std::vector<Tree> trees_;
    size_t sample_size_ = 0;
    int height_limit_ = 0;
};

// Indices of the round(contamination * n) highest scores, highest first.
// Ties keep row order.
auto SelectOutliers(const std::vector<double>& scores, double contamination) -> std::vector<size_t>;

} // namespace datalens::ml
