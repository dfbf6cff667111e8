#pragma once

#include "analysis_config.h"
#include "contract.h"

namespace datalens {

class RoutingAgent {
public:
    explicit RoutingAgent(RoutingConfig config) : config_(config) {}

    // ML iff row_count > min_rows_for_ml and numeric_column_ratio > min_numeric_ratio.
    [[nodiscard]] auto Decide(const DatasetProfile& profile) const -> RoutingDecision;

    [[nodiscard]] auto config() const -> const RoutingConfig& { return config_; }

private:
    RoutingConfig config_;
};

} // namespace datalens
