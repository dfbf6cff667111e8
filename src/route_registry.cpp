#include "route_registry.h"

namespace datalens::api {

const std::vector<RouteSpec> kRequiredRoutes = {
    {"POST", "/api/analyze", "Analyze"},
    {"GET", "/", "Root"},
    {"GET", "/healthz", "HealthCheck"},
    {"GET", "/metrics", "Metrics"}
};

} // namespace datalens::api
