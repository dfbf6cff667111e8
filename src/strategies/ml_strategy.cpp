#include "strategies/ml_strategy.h"

#include <string>

#include "errors.h"
#include "ml/isolation_forest.h"
#include "ml/kmeans.h"
#include "obs/logging.h"
#include "preprocessing.h"

namespace datalens {

auto MlStrategy::Analyze(const Dataset& dataset, const DatasetProfile& profile) const -> AnalysisSummary {
    return RunMl(dataset, profile);
}

auto MlStrategy::RunMl(const Dataset& dataset, const DatasetProfile& profile) const -> MlSummary {
    obs::ScopedTimer timer("ml_strategy", "ml_strategy");

    if (profile.numeric_columns.empty()) {
        throw InsufficientDataError("No numeric columns available for ML analysis");
    }

    ml::NumericTable table = ml::ExtractNumericTable(dataset, profile.numeric_columns);
    const auto k_min = static_cast<size_t>(config_.clustering.k_min);
    if (table.values.rows < k_min) {
        throw InsufficientDataError("Only " + std::to_string(table.values.rows) +
                                    " complete numeric rows, need at least " + std::to_string(k_min));
    }

    ml::StandardScaler scaler;
    linalg::Matrix features = scaler.FitTransform(table.values);

    ml::IsolationForestParams forest_params;
    forest_params.n_estimators = config_.forest.n_estimators;
    forest_params.max_samples = config_.forest.max_samples;
    forest_params.seed = config_.seed;
    ml::IsolationForest forest(forest_params);
    forest.Fit(features);
    auto outliers = ml::SelectOutliers(forest.Score(features), config_.contamination);

    ml::ClusterSelection clusters = ml::SelectClusterCount(features, config_.clustering, config_.seed);

    MlSummary summary;
    summary.original_row_count = dataset.RowCount();
    summary.analyzed_row_count = table.values.rows;
    summary.excluded_row_count = table.excluded_rows;
    summary.feature_columns = table.columns;
    summary.contamination = config_.contamination;
    summary.outlier_count = outliers.size();
    summary.outlier_percent = static_cast<double>(summary.outlier_count) /
                              static_cast<double>(summary.original_row_count) * 100.0;
    summary.cluster_count = clusters.k;
    summary.silhouette_score = clusters.silhouette;
    for (int c = 0; c < clusters.k; ++c) {
        summary.cluster_distribution["C" + std::to_string(c)] = 0;
    }
    for (int label : clusters.result.labels) {
        summary.cluster_distribution["C" + std::to_string(label)]++;
    }

    nlohmann::json candidates = nlohmann::json::array();
    for (const auto& kv : clusters.candidates) {
        candidates.push_back({{"k", kv.first}, {"silhouette", kv.second}});
    }
    timer.Stop(obs::LogLevel::Info, {{"analyzed_rows", summary.analyzed_row_count},
                                     {"excluded_rows", summary.excluded_row_count},
                                     {"outliers", summary.outlier_count},
                                     {"cluster_count", summary.cluster_count},
                                     {"k_candidates", candidates}});
    return summary;
}

} // namespace datalens
