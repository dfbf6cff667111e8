#include "ml/kmeans.h"

#include <algorithm>
#include <limits>
#include <random>
#include <stdexcept>

#include "errors.h"

namespace datalens::ml {

namespace {

auto SeedCentroids(const linalg::Matrix& x, int k, std::mt19937_64& rng) -> linalg::Matrix {
    const size_t n = x.rows;
    const size_t d = x.cols;
    linalg::Matrix centroids(static_cast<size_t>(k), d);

    std::uniform_int_distribution<size_t> first(0, n - 1);
    size_t chosen = first(rng);
    std::copy(x.row(chosen), x.row(chosen) + d, centroids.row(0));

    std::vector<double> closest(n, std::numeric_limits<double>::max());
    for (int c = 1; c < k; ++c) {
        const double* prev = centroids.row(static_cast<size_t>(c - 1));
        double total = 0.0;
        for (size_t i = 0; i < n; ++i) {
            closest[i] = std::min(closest[i], linalg::squared_distance(x.row(i), prev, d));
            total += closest[i];
        }

        if (total <= 0.0) {
            // Every point sits on a centroid already.
            std::uniform_int_distribution<size_t> any(0, n - 1);
            chosen = any(rng);
        } else {
            std::uniform_real_distribution<double> target_dist(0.0, total);
            double target = target_dist(rng);
            chosen = n - 1;
            double acc = 0.0;
            for (size_t i = 0; i < n; ++i) {
                acc += closest[i];
                if (acc >= target && closest[i] > 0.0) {
                    chosen = i;
                    break;
                }
            }
        }
        std::copy(x.row(chosen), x.row(chosen) + d, centroids.row(static_cast<size_t>(c)));
    }
    return centroids;
}

auto Assign(const linalg::Matrix& x, const linalg::Matrix& centroids, std::vector<int>& labels,
            std::vector<double>& dist) -> double {
    double inertia = 0.0;
    for (size_t i = 0; i < x.rows; ++i) {
        double best = std::numeric_limits<double>::max();
        int best_c = 0;
        for (size_t c = 0; c < centroids.rows; ++c) {
            double dd = linalg::squared_distance(x.row(i), centroids.row(c), x.cols);
            if (dd < best) {
                best = dd;
                best_c = static_cast<int>(c);
            }
        }
        labels[i] = best_c;
        dist[i] = best;
        inertia += best;
    }
    return inertia;
}

auto RunLloyd(const linalg::Matrix& x, const KMeansParams& params, std::mt19937_64& rng) -> KMeansResult {
    const size_t n = x.rows;
    const size_t d = x.cols;
    const auto k = static_cast<size_t>(params.k);

    KMeansResult result;
    result.centroids = SeedCentroids(x, params.k, rng);
    result.labels.assign(n, 0);
    std::vector<double> dist(n, 0.0);

    for (int iter = 0; iter < params.max_iter; ++iter) {
        Assign(x, result.centroids, result.labels, dist);

        linalg::Matrix next(k, d);
        std::vector<size_t> counts(k, 0);
        for (size_t i = 0; i < n; ++i) {
            auto c = static_cast<size_t>(result.labels[i]);
            counts[c]++;
            const double* row = x.row(i);
            double* acc = next.row(c);
            for (size_t j = 0; j < d; ++j) {
                acc[j] += row[j];
            }
        }

        for (size_t c = 0; c < k; ++c) {
            if (counts[c] == 0) {
                // Re-seed an empty cluster on the point farthest from its centroid.
                size_t far = static_cast<size_t>(std::max_element(dist.begin(), dist.end()) - dist.begin());
                std::copy(x.row(far), x.row(far) + d, next.row(c));
                dist[far] = 0.0;
                continue;
            }
            double* acc = next.row(c);
            for (size_t j = 0; j < d; ++j) {
                acc[j] /= static_cast<double>(counts[c]);
            }
        }

        double shift = 0.0;
        for (size_t c = 0; c < k; ++c) {
            shift += linalg::squared_distance(next.row(c), result.centroids.row(c), d);
        }
        result.centroids = std::move(next);
        result.iterations = iter + 1;
        if (shift <= params.tolerance) {
            break;
        }
    }

    result.inertia = Assign(x, result.centroids, result.labels, dist);
    return result;
}

} // namespace

auto FitKMeans(const linalg::Matrix& x, const KMeansParams& params) -> KMeansResult {
    if (params.k < 1 || static_cast<size_t>(params.k) > x.rows) {
        throw std::invalid_argument("k must be within [1, rows]");
    }
    if (params.n_init < 1 || params.max_iter < 1) {
        throw std::invalid_argument("n_init and max_iter must be positive");
    }

    std::mt19937_64 rng(params.seed);
    KMeansResult best;
    best.inertia = std::numeric_limits<double>::max();
    for (int run = 0; run < params.n_init; ++run) {
        KMeansResult candidate = RunLloyd(x, params, rng);
        if (candidate.inertia < best.inertia) {
            best = std::move(candidate);
        }
    }
    return best;
}

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
auto SilhouetteScore(const linalg::Matrix& x, const std::vector<int>& labels, int k,
                     size_t sample_size, uint64_t seed) -> double {
    if (labels.size() != x.rows) {
        throw std::invalid_argument("labels size mismatch");
    }

    std::vector<size_t> idx(x.rows);
    for (size_t i = 0; i < idx.size(); ++i) {
        idx[i] = i;
    }
    if (idx.size() > sample_size) {
        std::mt19937_64 rng(seed);
        for (size_t i = 0; i < sample_size; ++i) {
            std::uniform_int_distribution<size_t> pick(i, idx.size() - 1);
            std::swap(idx[i], idx[pick(rng)]);
        }
        idx.resize(sample_size);
    }

    const auto kk = static_cast<size_t>(k);
    std::vector<size_t> members(kk, 0);
    for (size_t i : idx) {
        members[static_cast<size_t>(labels[i])]++;
    }
    size_t populated = std::count_if(members.begin(), members.end(), [](size_t m) { return m > 0; });
    if (populated < 2) {
        return 0.0;
    }

    double total = 0.0;
    std::vector<double> sums(kk, 0.0);
    for (size_t i : idx) {
        std::fill(sums.begin(), sums.end(), 0.0);
        for (size_t j : idx) {
            if (i == j) continue;
            sums[static_cast<size_t>(labels[j])] += linalg::euclidean_distance(x.row(i), x.row(j), x.cols);
        }
        auto own = static_cast<size_t>(labels[i]);
        if (members[own] <= 1) {
            continue;
        }
        double a = sums[own] / static_cast<double>(members[own] - 1);
        double b = std::numeric_limits<double>::max();
        for (size_t c = 0; c < kk; ++c) {
            if (c == own || members[c] == 0) continue;
            b = std::min(b, sums[c] / static_cast<double>(members[c]));
        }
        double denom = std::max(a, b);
        if (denom > 0.0) {
            total += (b - a) / denom;
        }
    }
    return total / static_cast<double>(idx.size());
}

auto SelectClusterCount(const linalg::Matrix& x, const ClusteringConfig& config, uint64_t seed) -> ClusterSelection {
    if (x.rows < static_cast<size_t>(config.k_min)) {
        throw InsufficientDataError("Need at least " + std::to_string(config.k_min) +
                                    " rows for clustering, got " + std::to_string(x.rows));
    }

    int k_max = std::min<int>(config.k_max, static_cast<int>(x.rows));
    ClusterSelection best;
    bool have_best = false;
    for (int k = config.k_min; k <= k_max; ++k) {
        KMeansParams params;
        params.k = k;
        params.n_init = config.n_init;
        params.max_iter = config.max_iter;
        params.tolerance = config.tolerance;
        params.seed = seed;

        KMeansResult result = FitKMeans(x, params);
        double score = SilhouetteScore(x, result.labels, k, config.silhouette_sample_size, seed);
        best.candidates.emplace_back(k, score);
        if (!have_best || score > best.silhouette) {
            best.k = k;
            best.result = std::move(result);
            best.silhouette = score;
            have_best = true;
        }
    }
    return best;
}

} // namespace datalens::ml
