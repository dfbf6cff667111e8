#include <cstdlib>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "analysis_config.h"
#include "api_server.h"
#include "insights/http_text_generator.h"

int main() {
    auto console = spdlog::stdout_color_mt("console");
    spdlog::set_default_logger(console);

    datalens::AnalysisConfig config = datalens::LoadAnalysisConfigFromEnv();
    auto errors = datalens::ValidateAnalysisConfig(config);
    if (!errors.empty()) {
        for (const auto& e : errors) {
            spdlog::error("Invalid config {}: {}", e.field, e.message);
        }
        return 1;
    }

    int port = 8000;
    if (const char* env_p = std::getenv("PORT")) {
        try {
            port = std::stoi(env_p);
        } catch (const std::exception&) {
            spdlog::warn("Invalid PORT: {}. Using {}.", env_p, port);
        }
    }

    datalens::api::ServerOptions options;
    if (const char* env_p = std::getenv("DATALENS_MAX_ROWS")) {
        try {
            options.max_rows = std::stoul(env_p);
        } catch (const std::exception&) {
            spdlog::warn("Invalid DATALENS_MAX_ROWS: {}. Using {}.", env_p, options.max_rows);
        }
    }

    datalens::api::ApiServer server(config, datalens::MakeTextGeneratorFromEnv(), options);

    try {
        server.Start("0.0.0.0", port);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error in API Server: {}", e.what());
        return 1;
    }

    return 0;
}
