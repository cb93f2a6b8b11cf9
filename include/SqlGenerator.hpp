#pragma once

#include "Config.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace querymind {

// Turns a plain-language question into one SQL statement, given the schema text
class SqlGenerator {
public:
    virtual ~SqlGenerator() = default;

    // Raw model output; callers clean and check it before running it.
    // Throws GenerationError.
    virtual std::string generate(const std::string& question, const std::string& schemaText) = 0;
};

// SqlGenerator backed by the Anthropic Messages API (POST /v1/messages)
class AnthropicSqlGenerator : public SqlGenerator {
public:
    static constexpr const char* API_VERSION = "2023-06-01";
    static constexpr const char* MESSAGES_PATH = "/v1/messages";

    explicit AnthropicSqlGenerator(LlmConfig config);

    std::string generate(const std::string& question, const std::string& schemaText) override;

    static std::string buildPrompt(const std::string& question, const std::string& schemaText);
    static nlohmann::json buildRequestBody(const LlmConfig& config, const std::string& prompt);

    // Text of the first text block; throws GenerationError on an error
    // payload, malformed JSON or an empty answer
    static std::string parseResponse(const std::string& body);

    // 429 and transient 5xx responses are worth another attempt
    static bool isRetryableStatus(int status);

    // Wait before retry number attempt + 1, after a failed request or a retryable status
    static std::chrono::milliseconds retryDelay(int attempt);

private:
    LlmConfig m_config;
};

}  // namespace querymind
