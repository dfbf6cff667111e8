#pragma once

#include "analysis_config.h"
#include "strategies/analysis_strategy.h"

namespace datalens {

/**
 * @brief Outlier detection and clustering over the numeric columns.
 *
 * Rows with a missing numeric cell are excluded and counted. The remaining
 * rows are standardized, scored by an isolation forest (the top
 * `contamination` share is flagged) and partitioned by k-means with k chosen
 * by silhouette. Outlier percentages use the original row count.
 *
 * Throws InsufficientDataError when there are no numeric columns or fewer
 * than k_min complete rows.
 */
class MlStrategy final : public IAnalysisStrategy {
public:
    explicit MlStrategy(MlConfig config) : config_(config) {}

    [[nodiscard]] auto route() const -> Route override { return Route::Ml; }

    [[nodiscard]] auto Analyze(const Dataset& dataset,
                               const DatasetProfile& profile) const -> AnalysisSummary override;

    [[nodiscard]] auto RunMl(const Dataset& dataset, const DatasetProfile& profile) const -> MlSummary;

private:
    MlConfig config_;
};

} // namespace datalens
