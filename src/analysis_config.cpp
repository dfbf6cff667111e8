#include "analysis_config.h"

#include <cstdlib>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace datalens {

namespace {

template <typename T, typename Parse>
void OverrideFromEnv(const char* key, T& target, Parse parse) {
    const char* env = std::getenv(key);
    if (!env) return;
    try {
        target = static_cast<T>(parse(std::string(env)));
        spdlog::info("Using {} from env: {}", key, env);
    } catch (const std::exception&) {
        spdlog::warn("Invalid {}: {}. Keeping default.", key, env);
    }
}

auto ParseSize(const std::string& s) -> unsigned long long {
    if (!s.empty() && s[0] == '-') throw std::invalid_argument("negative");
    return std::stoull(s);
}

auto ParseInt(const std::string& s) -> int { return std::stoi(s); }
auto ParseDouble(const std::string& s) -> double { return std::stod(s); }

} // namespace

auto ParseSeed(const std::string& text) -> uint64_t {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Seed must be an unsigned integer: '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Seed out of range: '" + text + "'");
    }
}

auto ValidateAnalysisConfig(const AnalysisConfig& config) -> std::vector<ConfigValidationError> {
    std::vector<ConfigValidationError> errors;
    if (config.routing.min_numeric_ratio < 0.0 || config.routing.min_numeric_ratio > 1.0) {
        errors.push_back({"routing.min_numeric_ratio", "Must be within [0, 1]"});
    }
    if (config.ml.contamination <= 0.0 || config.ml.contamination > 0.5) {
        errors.push_back({"ml.contamination", "Must be within (0, 0.5]"});
    }
    if (config.ml.forest.n_estimators <= 0) {
        errors.push_back({"ml.forest.n_estimators", "Must be positive"});
    }
    if (config.ml.forest.max_samples < 2) {
        errors.push_back({"ml.forest.max_samples", "Must be at least 2"});
    }
    const auto& c = config.ml.clustering;
    if (c.k_min < 2) {
        errors.push_back({"ml.clustering.k_min", "Must be at least 2"});
    }
    if (c.k_max < c.k_min) {
        errors.push_back({"ml.clustering.k_max", "Must not be smaller than k_min"});
    }
    if (c.n_init <= 0) {
        errors.push_back({"ml.clustering.n_init", "Must be positive"});
    }
    if (c.max_iter <= 0) {
        errors.push_back({"ml.clustering.max_iter", "Must be positive"});
    }
    if (c.tolerance < 0.0) {
        errors.push_back({"ml.clustering.tolerance", "Must be non-negative"});
    }
    if (c.silhouette_sample_size < 2) {
        errors.push_back({"ml.clustering.silhouette_sample_size", "Must be at least 2"});
    }
    if (config.insight.timeout.count() <= 0) {
        errors.push_back({"insight.timeout", "Must be positive"});
    }
    if (config.insight.max_insights == 0) {
        errors.push_back({"insight.max_insights", "Must be positive"});
    }
    return errors;
}

auto LoadAnalysisConfigFromEnv(AnalysisConfig base) -> AnalysisConfig {
    AnalysisConfig config = base;
    OverrideFromEnv("DATALENS_ML_MIN_ROWS", config.routing.min_rows_for_ml, ParseSize);
    OverrideFromEnv("DATALENS_ML_MIN_NUMERIC_RATIO", config.routing.min_numeric_ratio, ParseDouble);
    OverrideFromEnv("DATALENS_CONTAMINATION", config.ml.contamination, ParseDouble);
    OverrideFromEnv("DATALENS_SEED", config.ml.seed, ParseSeed);
    OverrideFromEnv("DATALENS_N_ESTIMATORS", config.ml.forest.n_estimators, ParseInt);
    OverrideFromEnv("DATALENS_K_MIN", config.ml.clustering.k_min, ParseInt);
    OverrideFromEnv("DATALENS_K_MAX", config.ml.clustering.k_max, ParseInt);
    OverrideFromEnv("DATALENS_MAX_INSIGHTS", config.insight.max_insights, ParseSize);

    long long timeout_ms = config.insight.timeout.count();
    OverrideFromEnv("DATALENS_INSIGHT_TIMEOUT_MS", timeout_ms, ParseSize);
    config.insight.timeout = std::chrono::milliseconds(timeout_ms);
    return config;
}

} // namespace datalens
