#include <gtest/gtest.h>
#include "route_registry.h"
#include <set>

namespace datalens {
namespace api {

TEST(RouteRegistryTest, BasicInvariants) {
    EXPECT_FALSE(kRequiredRoutes.empty());

    std::set<std::pair<std::string, std::string>> unique_routes;
    for (const auto& route : kRequiredRoutes) {
        auto res = unique_routes.insert({route.method, route.pattern});
        EXPECT_TRUE(res.second) << "Duplicate route found: " << route.method << " " << route.pattern;
    }
}

TEST(RouteRegistryTest, ExpectedCount) {
    EXPECT_EQ(kRequiredRoutes.size(), 4u);
}

TEST(RouteRegistryTest, AnalyzeIsPost) {
    bool found = false;
    for (const auto& route : kRequiredRoutes) {
        if (route.pattern == "/api/analyze") {
            EXPECT_EQ(route.method, "POST");
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

} // namespace api
} // namespace datalens
