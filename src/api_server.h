#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "analysis_config.h"
#include "insights/generation_workers.h"
#include "insights/text_generator.h"

namespace datalens::api {

struct ServerOptions {
    size_t max_rows = 100000;                  // larger datasets get 413
    size_t payload_max_bytes = 50 * 1024 * 1024;
    int read_timeout_sec = 30;
    int write_timeout_sec = 30;
};

class ApiServer {
public:
    friend class ApiServerTestPeer;
    ApiServer(AnalysisConfig config, std::shared_ptr<ITextGenerator> generator, ServerOptions options = {});
    ~ApiServer();

    ApiServer(const ApiServer&) = delete;
    ApiServer& operator=(const ApiServer&) = delete;

    // Blocks until Stop().
    void Start(const std::string& host, int port);
    // Raises the cancellation flag for in-flight runs, stops listening and
    // joins generator calls still running past their deadline.
    void Stop();

private:
    void Initialize();
    // Route Handlers
    void HandleAnalyze(const httplib::Request& req, httplib::Response& res);
    void HandleRoot(const httplib::Request& req, httplib::Response& res);
    void HandleHealth(const httplib::Request& req, httplib::Response& res);
    void HandleMetrics(const httplib::Request& req, httplib::Response& res);

    void ValidateRoutes();

    // Helpers
    void SendJson(httplib::Response& res, nlohmann::json j, int status = 200, const std::string& request_id = "");
    struct ApiErrorArgs {
        httplib::Response& res;
        std::string message;
        int status = 400;
        std::string code = "E_INTERNAL";
        std::string request_id = "";
    };

    void SendError(const ApiErrorArgs& args);

    httplib::Server svr_;
    AnalysisConfig config_;
    std::shared_ptr<ITextGenerator> generator_;
    std::shared_ptr<GenerationWorkers> workers_ = std::make_shared<GenerationWorkers>();
    ServerOptions options_;
    std::atomic<bool> stopping_{false};
    size_t registered_routes_ = 0;
};

} // namespace datalens::api
