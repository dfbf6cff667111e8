#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "analysis_config.h"
#include "insights/generation_workers.h"
#include "insights/http_text_generator.h"
#include "pipeline.h"
#include "serialization.h"

int main(int argc, char** argv) {
    std::string input_path;
    std::string output_path;
    bool no_llm = false;
    bool has_seed = false;
    unsigned long long seed = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--input" && i + 1 < argc) {
            input_path = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            try {
                seed = datalens::ParseSeed(argv[++i]);
            } catch (const std::invalid_argument& e) {
                std::cerr << "Invalid --seed: " << e.what() << std::endl;
                return 1;
            }
            has_seed = true;
        } else if (arg == "--no-llm") {
            no_llm = true;
        }
    }

    if (input_path.empty()) {
        std::cerr << "Missing --input (JSON analysis request)." << std::endl;
        return 1;
    }

    auto console = spdlog::stderr_color_mt("console");
    spdlog::set_default_logger(console);

    datalens::AnalysisConfig config = datalens::LoadAnalysisConfigFromEnv();
    if (has_seed) {
        config.ml.seed = seed;
    }

    std::shared_ptr<datalens::ITextGenerator> generator;
    if (no_llm) {
        generator = std::make_shared<datalens::UnavailableTextGenerator>();
    } else {
        generator = datalens::MakeTextGeneratorFromEnv();
    }
    // Joined before main returns so no generator call outlives the logger.
    auto workers = std::make_shared<datalens::GenerationWorkers>();

    try {
        std::ifstream in(input_path);
        if (!in) {
            std::cerr << "Failed to open input path: " << input_path << std::endl;
            return 1;
        }
        auto body = nlohmann::json::parse(in);
        auto request = datalens::ParseAnalysisRequest(body);

        auto start = std::chrono::steady_clock::now();
        auto run = datalens::Analyze(request, config, generator, nullptr, workers);
        std::chrono::duration<double> secs = std::chrono::steady_clock::now() - start;

        std::string out = datalens::RunToResponseJson(run).dump(2);
        if (output_path.empty()) {
            std::cout << out << std::endl;
        } else {
            std::ofstream os(output_path);
            if (!os) {
                std::cerr << "Failed to open output path: " << output_path << std::endl;
                return 1;
            }
            os << out << std::endl;
        }

        workers->Drain();
        std::cerr << "Route: " << datalens::RouteToString(run.executed_route)
                  << " rows=" << run.profile.row_count
                  << " time (s): " << secs.count() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Analysis failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
