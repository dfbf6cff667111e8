#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "analysis_config.h"
#include "linalg/matrix.h"

namespace datalens::ml {

struct KMeansParams {
    int k = 2;
    int n_init = 10;
    int max_iter = 300;
    double tolerance = 1e-4;
    uint64_t seed = 42;
};

struct KMeansResult {
    std::vector<int> labels; // one per row, in [0, k)
    linalg::Matrix centroids; // k x d
    double inertia = 0.0;
    int iterations = 0;
};

// Lloyd's algorithm with k-means++ seeding, best of n_init restarts by
// inertia. Requires 1 <= k <= rows.
auto FitKMeans(const linalg::Matrix& x, const KMeansParams& params) -> KMeansResult;

// Mean silhouette coefficient. When rows exceed sample_size the score is
// computed on a seeded subsample. Singleton clusters contribute 0, and a
// labelling with a single cluster scores 0.
auto SilhouetteScore(const linalg::Matrix& x, const std::vector<int>& labels, int k,
                     size_t sample_size, uint64_t seed) -> double;

struct ClusterSelection {
    int k = 0;
    KMeansResult result;
    double silhouette = 0.0;
    std::vector<std::pair<int, double>> candidates; // (k, silhouette) per k tried
};

// Tries every k in [k_min, min(k_max, rows)] and keeps the highest
// silhouette; ties keep the smaller k.
auto SelectClusterCount(const linalg::Matrix& x, const ClusteringConfig& config, uint64_t seed) -> ClusterSelection;

} // namespace datalens::ml
