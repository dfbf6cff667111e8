#include "insights/http_text_generator.h"

#include <cstdlib>
#include <utility>

#include <httplib.h>

#include "obs/logging.h"

namespace datalens {

HttpTextGenerator::HttpTextGenerator(ChatCompletionConfig config) : config_(std::move(config)) {}

auto HttpTextGenerator::BuildRequestBody(const std::string& prompt) const -> nlohmann::json {
    nlohmann::json body;
    body["model"] = config_.model;
    body["temperature"] = config_.temperature;
    body["messages"] = nlohmann::json::array({
        {{"role", "system"}, {"content", config_.system_prompt}},
        {{"role", "user"}, {"content", prompt}},
    });
    return body;
}

auto HttpTextGenerator::ExtractCompletionText(const std::string& response_body) -> std::string {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(response_body);
    } catch (const nlohmann::json::parse_error& e) {
        throw GenerationFailure(std::string("Unparsable completion response: ") + e.what());
    }
    if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty()) {
        throw GenerationFailure("Completion response has no choices");
    }
    const auto& message = j["choices"][0].value("message", nlohmann::json::object());
    if (!message.contains("content") || !message["content"].is_string()) {
        throw GenerationFailure("Completion response has no message content");
    }
    return message["content"].get<std::string>();
}

auto HttpTextGenerator::Generate(const std::string& prompt, std::chrono::milliseconds timeout) -> std::string {
    httplib::Client cli(config_.base_url);
    if (!cli.is_valid()) {
        throw GenerationFailure("Invalid text generation endpoint: " + config_.base_url);
    }
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Headers headers;
    if (!config_.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + config_.api_key);
    }

    auto res = cli.Post(config_.chat_path, headers, BuildRequestBody(prompt).dump(), "application/json");
    if (!res) {
        auto err = res.error();
        std::string detail = httplib::to_string(err);
        if (err == httplib::Error::ConnectionTimeout || err == httplib::Error::Read) {
            throw GenerationTimeoutError("Text generation timed out: " + detail);
        }
        throw GenerationFailure("Text generation request failed: " + detail);
    }
    if (res->status != 200) {
        obs::LogEvent(obs::LogLevel::Warn, "generation_http_error", "text_generator",
                      {{"status_code", res->status}, {"model", config_.model}});
        throw GenerationFailure("Text generation returned HTTP " + std::to_string(res->status));
    }
    return ExtractCompletionText(res->body);
}

auto MakeTextGeneratorFromEnv() -> std::shared_ptr<ITextGenerator> {
    ChatCompletionConfig config;
    const char* key = std::getenv("GROQ_API_KEY");
    if (!key || std::string(key).empty()) {
        obs::LogEvent(obs::LogLevel::Warn, "generator_unavailable", "text_generator",
                      {{"reason", "GROQ_API_KEY not set"}});
        return std::make_shared<UnavailableTextGenerator>();
    }
    config.api_key = key;
    if (const char* env_p = std::getenv("LLM_BASE_URL")) {
        config.base_url = env_p;
    }
    if (const char* env_p = std::getenv("LLM_CHAT_PATH")) {
        config.chat_path = env_p;
    }
    if (const char* env_p = std::getenv("LLM_MODEL")) {
        config.model = env_p;
    }
    obs::LogEvent(obs::LogLevel::Info, "generator_configured", "text_generator",
                  {{"base_url", config.base_url}, {"model", config.model}});
    return std::make_shared<HttpTextGenerator>(std::move(config));
}

} // namespace datalens
