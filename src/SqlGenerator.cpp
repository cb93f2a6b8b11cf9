#include "SqlGenerator.hpp"
#include "ErrorHandler.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <thread>

namespace querymind {

AnthropicSqlGenerator::AnthropicSqlGenerator(LlmConfig config)
    : m_config(std::move(config)) {
}

// ============================================================================
// Request and response shapes
// ============================================================================

std::string AnthropicSqlGenerator::buildPrompt(const std::string& question,
                                               const std::string& schemaText) {
    return "You are a SQL expert. Convert the following natural language question into a "
           "PostgreSQL query.\n\n" +
           schemaText +
           "\n\nUser Question: " + question +
           "\n\nRequirements:\n"
           "1. Generate ONLY the SQL query, no explanations\n"
           "2. Use proper PostgreSQL syntax\n"
           "3. Make the query safe (SELECT only, no modifications)\n"
           "4. Use appropriate JOINs if multiple tables are needed\n"
           "5. Add LIMIT clauses where appropriate to prevent overwhelming results\n"
           "6. Return only valid, executable SQL\n\n"
           "SQL Query:";
}

nlohmann::json AnthropicSqlGenerator::buildRequestBody(const LlmConfig& config,
                                                       const std::string& prompt) {
    return nlohmann::json{
        {"model", config.model},
        {"max_tokens", config.max_tokens},
        {"messages", nlohmann::json::array({
            {{"role", "user"}, {"content", prompt}}
        })}
    };
}

std::string AnthropicSqlGenerator::parseResponse(const std::string& body) {
    auto response = nlohmann::json::parse(body, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        throw GenerationError("Malformed response from language model");
    }

    if (response.contains("error")) {
        const auto& error = response["error"];
        std::string message = error.is_object() ? error.value("message", "unknown error")
                                                : error.dump();
        throw GenerationError("Language model error: " + message);
    }

    auto content = response.find("content");
    if (content == response.end() || !content->is_array()) {
        throw GenerationError("Language model response has no content");
    }

    for (const auto& block : *content) {
        if (block.is_object() && block.value("type", "") == "text") {
            auto text = block.find("text");
            if (text != block.end() && text->is_string() && !text->get<std::string>().empty()) {
                return text->get<std::string>();
            }
        }
    }

    throw GenerationError("Language model returned no text");
}

std::chrono::milliseconds AnthropicSqlGenerator::retryDelay(int attempt) {
    return std::chrono::milliseconds(1000 * (attempt + 1));
}

bool AnthropicSqlGenerator::isRetryableStatus(int status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 529;
}

// ============================================================================
// HTTP call
// ============================================================================

std::string AnthropicSqlGenerator::generate(const std::string& question,
                                            const std::string& schemaText) {
    if (m_config.api_key.empty()) {
        throw GenerationError("Anthropic API key not configured");
    }

    std::string body = buildRequestBody(m_config, buildPrompt(question, schemaText)).dump();

    httplib::Client cli(m_config.endpoint);
    cli.set_connection_timeout(m_config.timeout);
    cli.set_read_timeout(m_config.timeout);

    httplib::Headers headers = {
        {"x-api-key", m_config.api_key},
        {"anthropic-version", API_VERSION}
    };

    for (int attempt = 0; attempt <= m_config.max_retries; ++attempt) {
        spdlog::debug("Requesting SQL from {} (model {}, attempt {})",
                      m_config.endpoint, m_config.model, attempt + 1);

        auto res = cli.Post(MESSAGES_PATH, headers, body, "application/json");

        if (!res) {
            if (attempt < m_config.max_retries) {
                spdlog::warn("Language model request failed: {}; retrying",
                             httplib::to_string(res.error()));
                std::this_thread::sleep_for(retryDelay(attempt));
                continue;
            }
            throw GenerationError("HTTP request failed: " + httplib::to_string(res.error()));
        }

        if (isRetryableStatus(res->status) && attempt < m_config.max_retries) {
            spdlog::warn("Language model returned HTTP {}; retrying", res->status);
            std::this_thread::sleep_for(retryDelay(attempt));
            continue;
        }

        if (res->status != 200) {
            throw GenerationError("API error: HTTP " + std::to_string(res->status) + " - " +
                                  res->body.substr(0, 200));
        }

        return parseResponse(res->body);
    }

    throw GenerationError("Max retries exceeded");
}

}  // namespace querymind
