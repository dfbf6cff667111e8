#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace datalens {

struct RoutingConfig {
    size_t min_rows_for_ml = 500;     // ML needs strictly more rows than this
    double min_numeric_ratio = 0.5;   // and a strictly larger numeric ratio
};

struct IsolationForestConfig {
    int n_estimators = 100;
    size_t max_samples = 256;
};

struct ClusteringConfig {
    int k_min = 2;
    int k_max = 4;
    int n_init = 10;
    int max_iter = 300;
    double tolerance = 1e-4;
    size_t silhouette_sample_size = 2000;
};

struct MlConfig {
    double contamination = 0.1;
    uint64_t seed = 42;
    IsolationForestConfig forest;
    ClusteringConfig clustering;
};

struct InsightConfig {
    std::chrono::milliseconds timeout{15000};
    size_t max_insights = 5;
    size_t preview_rows = 3;
};

struct AnalysisConfig {
    RoutingConfig routing;
    MlConfig ml;
    InsightConfig insight;
};

struct ConfigValidationError {
    std::string field;
    std::string message;
};

auto ValidateAnalysisConfig(const AnalysisConfig& config) -> std::vector<ConfigValidationError>;

// Whole-string unsigned decimal. Throws std::invalid_argument otherwise.
auto ParseSeed(const std::string& text) -> uint64_t;

// Applies DATALENS_* environment overrides on top of `base`. Unparsable
// values are logged and ignored.
auto LoadAnalysisConfigFromEnv(AnalysisConfig base = {}) -> AnalysisConfig;

} // namespace datalens
