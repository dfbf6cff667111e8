#pragma once

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "insights/text_generator.h"

namespace datalens {

struct ChatCompletionConfig {
    std::string base_url = "https://api.groq.com";
    std::string chat_path = "/openai/v1/chat/completions";
    std::string api_key;
    std::string model = "openai/gpt-oss-120b";
    double temperature = 0.7;
    std::string system_prompt = "You are a data analyst. Be objective.";
};

// OpenAI-compatible chat completions over cpp-httplib.
class HttpTextGenerator final : public ITextGenerator {
public:
    explicit HttpTextGenerator(ChatCompletionConfig config);

    auto Generate(const std::string& prompt, std::chrono::milliseconds timeout) -> std::string override;

    [[nodiscard]] auto BuildRequestBody(const std::string& prompt) const -> nlohmann::json;

    // choices[0].message.content, or GenerationFailure.
    static auto ExtractCompletionText(const std::string& response_body) -> std::string;

private:
    ChatCompletionConfig config_;
};

// HttpTextGenerator when GROQ_API_KEY is set (LLM_BASE_URL, LLM_CHAT_PATH and
// LLM_MODEL override the endpoint), UnavailableTextGenerator otherwise.
auto MakeTextGeneratorFromEnv() -> std::shared_ptr<ITextGenerator>;

} // namespace datalens
