#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <memory>
#include <string>
#include <thread>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "api_server.h"
#include "dataset_builders.h"
#include "http_test_utils.h"
#include "metrics.h"
#include "mocks/mock_text_generator.h"

using ::testing::_;
using ::testing::AnyNumber;
using ::testing::Return;

namespace datalens::api {

class ApiServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        generator = std::make_shared<MockTextGenerator>();
        ON_CALL(*generator, Generate(_, _))
            .WillByDefault(Return("INSIGHTS:\n- Mocked insight\nRECOMMENDATION: Mocked recommendation"));
        EXPECT_CALL(*generator, Generate(_, _)).Times(AnyNumber());

        ServerOptions options;
        options.max_rows = 50;
        server = std::make_unique<ApiServer>(AnalysisConfig{}, generator, options);
        port = AllocateTestPort();
        server_thread = std::thread([this]() { server->Start("127.0.0.1", port); });
        ASSERT_TRUE(WaitForServerReady("127.0.0.1", port));
    }

    void TearDown() override {
        server->Stop();
        if (server_thread.joinable()) {
            server_thread.join();
        }
        server.reset();
    }

    auto Post(const std::string& body, const httplib::Headers& headers = {}) -> httplib::Result {
        httplib::Client cli("127.0.0.1", port);
        return cli.Post("/api/analyze", headers, body, "application/json");
    }

    std::shared_ptr<MockTextGenerator> generator;
    std::unique_ptr<ApiServer> server;
    std::thread server_thread;
    int port = 0;
};

TEST_F(ApiServerTest, RootReportsOnline) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["status"], "online");
}

TEST_F(ApiServerTest, HealthzReturns200) {
    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/healthz");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "OK");
}

TEST_F(ApiServerTest, AnalyzeReturnsReport) {
    nlohmann::json body;
    body["dataset_name"] = "mixed.csv";
    body["rows"] = testing::MakeMixedRows();

    auto res = Post(body.dump(), {{"X-Request-ID", "req-42"}});
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 200) << res->body;
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["route"], "eda");
    EXPECT_EQ(j["dataset_name"], "mixed.csv");
    EXPECT_EQ(j["summary"]["type"], "eda");
    EXPECT_EQ(j["insights"][0], "Mocked insight");
    EXPECT_EQ(j["recommendation"], "Mocked recommendation");
    EXPECT_EQ(j["insight_source"], "generated");
    EXPECT_EQ(j["request_id"], "req-42");
    EXPECT_FALSE(j["run_id"].get<std::string>().empty());
}

TEST_F(ApiServerTest, LegacyFieldNamesAccepted) {
    nlohmann::json body;
    body["nome_arquivo"] = "legacy.csv";
    body["dados_completos"] = testing::MakeMixedRows();
    auto res = Post(body.dump());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(nlohmann::json::parse(res->body)["dataset_name"], "legacy.csv");
}

TEST_F(ApiServerTest, EmptyDatasetIs400) {
    auto res = Post(R"({"dataset_name": "x", "rows": []})", {{"X-Request-ID", "req-empty"}});
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    auto j = nlohmann::json::parse(res->body);
    EXPECT_EQ(j["error"]["code"], "E_EMPTY_DATASET");
    EXPECT_EQ(j["error"]["request_id"], "req-empty");
}

TEST_F(ApiServerTest, MalformedRowIs400) {
    auto res = Post(R"({"rows": [{"a": 1}, {"a": [1, 2]}]})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"]["code"], "E_MALFORMED_ROW");
}

TEST_F(ApiServerTest, InvalidJsonIs400) {
    auto res = Post("{not json");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"]["code"], "E_HTTP_JSON_PARSE_ERROR");
}

TEST_F(ApiServerTest, NumberOverflowIs400) {
    auto res = Post(R"({"rows": [{"a": 1e400}]})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"]["code"], "E_HTTP_INVALID_ARGUMENT");
}

TEST_F(ApiServerTest, MissingRowsIs400) {
    auto res = Post(R"({"dataset_name": "x"})");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 400);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"]["code"], "E_HTTP_MISSING_FIELD");
}

TEST_F(ApiServerTest, TooManyRowsIs413) {
    nlohmann::json body;
    body["rows"] = testing::MakeNumericRows(51, 2);
    auto res = Post(body.dump());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 413);
    EXPECT_EQ(nlohmann::json::parse(res->body)["error"]["code"], "E_HTTP_PAYLOAD_TOO_LARGE");
}

TEST_F(ApiServerTest, MetricsExposeRunCounters) {
    nlohmann::json body;
    body["rows"] = testing::MakeMixedRows();
    ASSERT_TRUE(Post(body.dump()));

    httplib::Client cli("127.0.0.1", port);
    auto res = cli.Get("/metrics");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_NE(res->body.find("analysis_runs_total{route=\"eda\"}"), std::string::npos);
}

} // namespace datalens::api
