#include "strategies/analysis_strategy.h"

#include "strategies/eda_strategy.h"
#include "strategies/ml_strategy.h"

namespace datalens {

auto MakeStrategy(Route route, const AnalysisConfig& config) -> std::unique_ptr<IAnalysisStrategy> {
    if (route == Route::Ml) {
        return std::make_unique<MlStrategy>(config.ml);
    }
    return std::make_unique<EdaStrategy>();
}

} // namespace datalens
