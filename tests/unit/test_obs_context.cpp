#include <gtest/gtest.h>
#include "obs/context.h"
#include "obs/logging.h"
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>

namespace {

using namespace datalens::obs;

TEST(ObsContextTest, LogEventIncludesContext) {
    // Setup a custom logger to capture output
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    auto logger = std::make_shared<spdlog::logger>("test_context", sink);
    logger->set_pattern("%v"); // Only the message
    auto old_default = spdlog::default_logger();
    spdlog::set_default_logger(logger);

    {
        Context ctx;
        ctx.request_id = "req-123";
        ctx.run_id = "run-456";
        ctx.dataset_name = "sales.csv";
        ScopedContext scope(ctx);

        LogEvent(LogLevel::Info, "test_event", "test_component", {{"extra", "val"}});
    }

    spdlog::set_default_logger(old_default);

    std::string output = oss.str();
    nlohmann::json j = nlohmann::json::parse(output);

    EXPECT_EQ(j["event"], "test_event");
    EXPECT_EQ(j["component"], "test_component");
    EXPECT_EQ(j["level"], "INFO");
    EXPECT_EQ(j["request_id"], "req-123");
    EXPECT_EQ(j["run_id"], "run-456");
    EXPECT_EQ(j["dataset_name"], "sales.csv");
    EXPECT_EQ(j["extra"], "val");
}

TEST(ObsContextTest, ScopedContextNesting) {
    Context outer;
    outer.request_id = "outer";

    {
        ScopedContext s1(outer);
        EXPECT_EQ(GetContext().request_id, "outer");

        Context inner;
        inner.request_id = "inner";
        {
            ScopedContext s2(inner);
            EXPECT_EQ(GetContext().request_id, "inner");
        }

        EXPECT_EQ(GetContext().request_id, "outer");
    }

    EXPECT_FALSE(HasContext());
}

TEST(ObsContextTest, ScopedTimerLogsDuration) {
    std::ostringstream oss;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(oss);
    auto logger = std::make_shared<spdlog::logger>("test_timer", sink);
    logger->set_pattern("%v");
    auto old_default = spdlog::default_logger();
    spdlog::set_default_logger(logger);

    {
        ScopedTimer timer("stage", "test_component", {{"step", 1}});
        timer.Stop(LogLevel::Warn, {{"rows", 10}});
    }

    spdlog::set_default_logger(old_default);

    nlohmann::json j = nlohmann::json::parse(oss.str());
    EXPECT_EQ(j["event"], "stage");
    EXPECT_EQ(j["level"], "WARN");
    EXPECT_EQ(j["step"], 1);
    EXPECT_EQ(j["rows"], 10);
    EXPECT_TRUE(j.contains("duration_ms"));
}

} // namespace
