#include "routing_agent.h"

#include "obs/logging.h"

namespace datalens {

auto RoutingAgent::Decide(const DatasetProfile& profile) const -> RoutingDecision {
    bool enough_rows = profile.row_count > config_.min_rows_for_ml;
    bool mostly_numeric = profile.numeric_column_ratio > config_.min_numeric_ratio;

    RoutingDecision decision;
    decision.route = (enough_rows && mostly_numeric) ? Route::Ml : Route::Eda;
    decision.profile = profile;

    obs::LogEvent(obs::LogLevel::Info, "route_selected", "routing_agent",
                  {{"route", RouteToString(decision.route)},
                   {"row_count", profile.row_count},
                   {"numeric_column_ratio", profile.numeric_column_ratio},
                   {"min_rows_for_ml", config_.min_rows_for_ml},
                   {"min_numeric_ratio", config_.min_numeric_ratio}});
    return decision;
}

} // namespace datalens
