#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <filesystem>

namespace querymind {

struct ConnectionConfig {
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user;
    std::string password;
    std::string database;

    // libpq sslmode (disable, prefer, require, verify-ca, verify-full)
    std::string sslmode = "prefer";

    std::chrono::milliseconds connect_timeout{5000};
};

struct CacheConfig {
    std::filesystem::path directory = ".querymind";
    bool enabled = true;
};

struct ExtractionConfig {
    bool include_samples = true;
    int sample_rows = 3;
    bool include_statistics = true;
    std::chrono::milliseconds statement_timeout{30000};
};

struct LlmConfig {
    std::string endpoint = "https://api.anthropic.com";
    std::string api_key;
    std::string model = "claude-sonnet-4-20250514";
    int max_tokens = 1024;
    std::chrono::milliseconds timeout{60000};
    int max_retries = 2;
};

struct QueryConfig {
    std::chrono::milliseconds statement_timeout{30000};
    size_t max_rows = 1000;
};

struct ProfilesConfig {
    std::filesystem::path file = ".querymind/connections.json";
};

struct Config {
    ConnectionConfig connection;
    CacheConfig cache;
    ExtractionConfig extraction;
    LlmConfig llm;
    QueryConfig query;
    ProfilesConfig profiles;

    // Subcommand and its arguments
    std::string command;
    std::vector<std::string> arguments;
    std::string profile;
    bool json_output = false;
    bool use_cache = true;
    bool debug = false;
    std::string log_file;

    // Profile fields for "profiles add"
    std::string profile_description;

    // Load from file
    static std::optional<Config> loadFromFile(const std::filesystem::path& path);

    // Parse command line arguments
    static Config parseArgs(int argc, char* argv[]);

    // Validate configuration
    bool validate() const;

    // Fill password and API key from the environment when not set
    void resolveSecrets();

    // Cache file for a given connection, inside cache.directory
    std::filesystem::path cacheFileFor(const ConnectionConfig& conn) const;
};

}  // namespace querymind
