#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

#include "analysis_config.h"

namespace datalens {
namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* key, const char* value) : key_(key) {
        ::setenv(key, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(key_); }

private:
    const char* key_;
};

TEST(AnalysisConfigTest, DefaultsAreValid) {
    AnalysisConfig config;
    EXPECT_TRUE(ValidateAnalysisConfig(config).empty());
    EXPECT_EQ(config.routing.min_rows_for_ml, 500u);
    EXPECT_DOUBLE_EQ(config.routing.min_numeric_ratio, 0.5);
    EXPECT_DOUBLE_EQ(config.ml.contamination, 0.1);
    EXPECT_EQ(config.ml.clustering.k_min, 2);
    EXPECT_EQ(config.ml.clustering.k_max, 4);
    EXPECT_EQ(config.insight.max_insights, 5u);
}

TEST(AnalysisConfigTest, ValidationReportsFields) {
    AnalysisConfig config;
    config.ml.contamination = 0.0;
    config.ml.clustering.k_min = 5;
    config.routing.min_numeric_ratio = 1.5;

    auto errors = ValidateAnalysisConfig(config);
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0].field, "routing.min_numeric_ratio");
    EXPECT_EQ(errors[1].field, "ml.contamination");
    EXPECT_EQ(errors[2].field, "ml.clustering.k_max");
}

TEST(AnalysisConfigTest, ParseSeedAcceptsOnlyUnsignedDecimal) {
    EXPECT_EQ(ParseSeed("7"), 7u);
    EXPECT_EQ(ParseSeed("18446744073709551615"), 18446744073709551615ull);
    EXPECT_THROW(ParseSeed("abc"), std::invalid_argument);
    EXPECT_THROW(ParseSeed("12abc"), std::invalid_argument);
    EXPECT_THROW(ParseSeed("-1"), std::invalid_argument);
    EXPECT_THROW(ParseSeed(""), std::invalid_argument);
    EXPECT_THROW(ParseSeed("18446744073709551616"), std::invalid_argument);
}

TEST(AnalysisConfigTest, EnvOverrides) {
    ScopedEnv rows("DATALENS_ML_MIN_ROWS", "100");
    ScopedEnv seed("DATALENS_SEED", "7");
    ScopedEnv timeout("DATALENS_INSIGHT_TIMEOUT_MS", "250");

    auto config = LoadAnalysisConfigFromEnv();
    EXPECT_EQ(config.routing.min_rows_for_ml, 100u);
    EXPECT_EQ(config.ml.seed, 7u);
    EXPECT_EQ(config.insight.timeout.count(), 250);
}

TEST(AnalysisConfigTest, BadEnvKeepsDefault) {
    ScopedEnv contamination("DATALENS_CONTAMINATION", "lots");
    ScopedEnv rows("DATALENS_ML_MIN_ROWS", "-3");

    auto config = LoadAnalysisConfigFromEnv();
    EXPECT_DOUBLE_EQ(config.ml.contamination, 0.1);
    EXPECT_EQ(config.routing.min_rows_for_ml, 500u);
}

} // namespace
} // namespace datalens
