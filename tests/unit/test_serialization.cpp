#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "errors.h"
#include "serialization.h"

namespace datalens {
namespace {

TEST(SerializationTest, ParsesRequest) {
    auto body = nlohmann::json::parse(R"({
        "dataset_name": "sales.csv",
        "row_count_hint": 2,
        "requester_identity": "a@b.c",
        "rows": [{"x": 1}, {"x": 2}]
    })");
    AnalysisRequest req = ParseAnalysisRequest(body);
    EXPECT_EQ(req.dataset_name, "sales.csv");
    EXPECT_EQ(req.row_count_hint, 2);
    EXPECT_EQ(req.requester_identity, "a@b.c");
    ASSERT_NE(req.dataset, nullptr);
    EXPECT_EQ(req.dataset->RowCount(), 2u);
}

TEST(SerializationTest, AcceptsLegacyFieldNames) {
    auto body = nlohmann::json::parse(R"({
        "nome_arquivo": "vendas.csv",
        "total_de_linhas": 99,
        "user_email": "u@x.y",
        "dados_completos": [{"x": 1}]
    })");
    AnalysisRequest req = ParseAnalysisRequest(body);
    EXPECT_EQ(req.dataset_name, "vendas.csv");
    EXPECT_EQ(req.row_count_hint, 99);
    EXPECT_EQ(req.requester_identity, "u@x.y");
    EXPECT_EQ(req.dataset->RowCount(), 1u);
}

TEST(SerializationTest, RowCountHintMustBeAnInteger) {
    EXPECT_THROW(ParseAnalysisRequest(nlohmann::json::parse(R"({"row_count_hint": 1e30, "rows": [{"x": 1}]})")),
                 std::invalid_argument);
    EXPECT_THROW(ParseAnalysisRequest(nlohmann::json::parse(R"({"row_count_hint": "3", "rows": [{"x": 1}]})")),
                 std::invalid_argument);

    AnalysisRequest huge =
        ParseAnalysisRequest(nlohmann::json::parse(R"({"row_count_hint": 18446744073709551615, "rows": [{"x": 1}]})"));
    EXPECT_EQ(huge.row_count_hint, std::numeric_limits<long>::max());
}

TEST(SerializationTest, MissingRowsRejected) {
    EXPECT_THROW(ParseAnalysisRequest(nlohmann::json::parse(R"({"dataset_name": "x"})")), MissingFieldError);
    EXPECT_THROW(ParseAnalysisRequest(nlohmann::json::array()), std::invalid_argument);
}

TEST(SerializationTest, MalformedRowPropagates) {
    auto body = nlohmann::json::parse(R"({"rows": [{"x": 1}, 5]})");
    EXPECT_THROW(ParseAnalysisRequest(body), MalformedRowError);
}

TEST(SerializationTest, SummaryIsTypeTagged) {
    MlSummary ml;
    ml.cluster_count = 2;
    ml.cluster_distribution = {{"C0", 3}, {"C1", 4}};
    auto j = SummaryToJson(AnalysisSummary{ml});
    EXPECT_EQ(j["type"], "ml");
    EXPECT_EQ(j["cluster_distribution"]["C1"], 4);

    EdaSummary eda;
    eda.numeric_stats["a"] = NumericColumnStats{2, 1.5, 0.7, 1.0, 1.25, 1.5, 1.75, 2.0};
    eda.column_type_breakdown["a"] = ColumnType::Numeric;
    auto e = SummaryToJson(AnalysisSummary{eda});
    EXPECT_EQ(e["type"], "eda");
    EXPECT_EQ(e["column_type_breakdown"]["a"], "numeric");
    EXPECT_DOUBLE_EQ(e["numeric_stats"]["a"]["25%"].get<double>(), 1.25);
    EXPECT_FALSE(e.contains("fallback_reason"));
}

TEST(SerializationTest, RunResponseFields) {
    AnalysisRun run;
    run.run_id = "rid";
    run.dataset_name = "d";
    run.decision.route = Route::Ml;
    run.executed_route = Route::Eda;
    run.summary = EdaSummary{};
    run.report.insights = {"i1"};
    run.report.recommendation = "r";

    auto j = RunToResponseJson(run);
    EXPECT_EQ(j["run_id"], "rid");
    EXPECT_EQ(j["route"], "eda");
    EXPECT_EQ(j["decided_route"], "ml");
    EXPECT_EQ(j["summary"]["type"], "eda");
    EXPECT_EQ(j["insights"][0], "i1");
    EXPECT_EQ(j["recommendation"], "r");
    EXPECT_EQ(j["insight_source"], "fallback");
}

} // namespace
} // namespace datalens
