#pragma once

#include <memory>

#include "analysis_config.h"
#include "contract.h"
#include "types.h"

namespace datalens {

class IAnalysisStrategy {
public:
    virtual ~IAnalysisStrategy() = default;

    [[nodiscard]] virtual auto route() const -> Route = 0;

    // Pure with respect to its inputs. `profile` must describe `dataset`.
    [[nodiscard]] virtual auto Analyze(const Dataset& dataset,
                                       const DatasetProfile& profile) const -> AnalysisSummary = 0;
};

auto MakeStrategy(Route route, const AnalysisConfig& config) -> std::unique_ptr<IAnalysisStrategy>;

} // namespace datalens
