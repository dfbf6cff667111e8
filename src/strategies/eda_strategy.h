#pragma once

#include <vector>

#include "strategies/analysis_strategy.h"

namespace datalens {

// Linear-interpolated quantile of sorted values, q in [0, 1].
auto Quantile(const std::vector<double>& sorted, double q) -> double;

// count, mean, sample std, min, quartiles and max of non-empty `values`.
auto DescribeNumeric(std::vector<double> values) -> NumericColumnStats;

// Rows minus distinct rows; all but one copy of each repeated row counts.
auto CountDuplicateRows(const Dataset& dataset) -> size_t;

class EdaStrategy final : public IAnalysisStrategy {
public:
    [[nodiscard]] auto route() const -> Route override { return Route::Eda; }

    [[nodiscard]] auto Analyze(const Dataset& dataset,
                               const DatasetProfile& profile) const -> AnalysisSummary override;

    [[nodiscard]] auto RunEda(const Dataset& dataset, const DatasetProfile& profile) const -> EdaSummary;
};

} // namespace datalens
