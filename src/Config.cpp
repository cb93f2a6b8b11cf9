#include "Config.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <cstdlib>
#include <algorithm>
#include <cctype>

#ifndef QUERYMIND_VERSION
#define QUERYMIND_VERSION "1.0.0"
#endif

namespace querymind {

namespace {

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool parseBool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes" || value == "on";
}

std::string sanitizeForFilename(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        unsigned char uc = static_cast<unsigned char>(c);
        result += (std::isalnum(uc) || c == '-' || c == '_') ? c : '_';
    }
    return result;
}

// Find -c/--config before CLI11 runs so file values become the defaults
std::string findConfigArgument(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return "";
}

}  // namespace

std::optional<Config> Config::loadFromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Config config;
    std::string line;
    std::string current_section;
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = line.substr(1, line.size() - 2);
            continue;
        }

        // Key-value pair
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 &&
            ((value.front() == '"' && value.back() == '"') ||
             (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        try {
            if (current_section == "connection") {
                if (key == "host") config.connection.host = value;
                else if (key == "port") config.connection.port = static_cast<uint16_t>(std::stoi(value));
                else if (key == "user") config.connection.user = value;
                else if (key == "password") config.connection.password = value;
                else if (key == "database") config.connection.database = value;
                else if (key == "sslmode") config.connection.sslmode = value;
                else if (key == "connect_timeout")
                    config.connection.connect_timeout = std::chrono::milliseconds(std::stoi(value));
            }
            else if (current_section == "cache") {
                if (key == "directory") config.cache.directory = value;
                else if (key == "enabled") config.cache.enabled = parseBool(value);
            }
            else if (current_section == "extraction") {
                if (key == "include_samples")
                    config.extraction.include_samples = parseBool(value);
                else if (key == "sample_rows")
                    config.extraction.sample_rows = std::stoi(value);
                else if (key == "include_statistics")
                    config.extraction.include_statistics = parseBool(value);
                else if (key == "statement_timeout_ms")
                    config.extraction.statement_timeout = std::chrono::milliseconds(std::stoi(value));
            }
            else if (current_section == "llm") {
                if (key == "endpoint") config.llm.endpoint = value;
                else if (key == "api_key") config.llm.api_key = value;
                else if (key == "model") config.llm.model = value;
                else if (key == "max_tokens") config.llm.max_tokens = std::stoi(value);
                else if (key == "timeout_ms")
                    config.llm.timeout = std::chrono::milliseconds(std::stoi(value));
                else if (key == "max_retries") config.llm.max_retries = std::stoi(value);
            }
            else if (current_section == "query") {
                if (key == "statement_timeout_ms")
                    config.query.statement_timeout = std::chrono::milliseconds(std::stoi(value));
                else if (key == "max_rows")
                    config.query.max_rows = static_cast<size_t>(std::stoul(value));
            }
            else if (current_section == "profiles") {
                if (key == "file") config.profiles.file = value;
            }
        } catch (const std::exception& e) {
            spdlog::warn("{}:{}: invalid value for '{}' ({}): {}", path.string(), line_number, key,
                         value, e.what());
        }
    }

    return config;
}

Config Config::parseArgs(int argc, char* argv[]) {
    Config config;

    std::string config_file = findConfigArgument(argc, argv);
    if (!config_file.empty()) {
        auto file_config = loadFromFile(config_file);
        if (file_config) {
            config = std::move(*file_config);
        } else {
            spdlog::warn("Could not load config file: {}", config_file);
        }
    }

    CLI::App app{"QueryMind - ask questions about a PostgreSQL database in plain English"};
    app.require_subcommand(1);
    app.set_version_flag("-V,--version", "querymind " QUERYMIND_VERSION);

    // Options below are bound to fields already holding file values, so
    // anything given on the command line overrides the file.
    app.add_option("-c,--config", config_file, "Path to configuration file");

    // Connection options
    app.add_option("-H,--host", config.connection.host, "Database server host");
    app.add_option("-P,--port", config.connection.port, "Database server port");
    app.add_option("-u,--user", config.connection.user, "Database username");
    app.add_option("-p,--password", config.connection.password, "Database password (or PGPASSWORD)");
    app.add_option("-D,--database", config.connection.database, "Database name");
    app.add_option("--sslmode", config.connection.sslmode, "libpq sslmode");
    app.add_option("--profile", config.profile, "Use a saved connection profile");

    // Cache options
    std::string cache_dir;
    auto* cache_dir_opt = app.add_option("--cache-dir", cache_dir, "Directory for the metadata cache");
    app.add_flag_function("--no-cache", [&config](int64_t) { config.cache.enabled = false; },
                 "Disable the metadata cache entirely");

    // Logging
    app.add_flag("-d,--debug", config.debug, "Enable debug output");
    app.add_option("--log-file", config.log_file, "Also write logs to this file");

    auto* schema = app.add_subcommand("schema", "Print the schema description sent to the model");

    auto* metadata = app.add_subcommand("metadata", "Print extracted metadata");
    metadata->add_flag("--json", config.json_output, "Print the snapshot as JSON");
    metadata->add_flag_function("--no-samples", [&config](int64_t) { config.extraction.include_samples = false; },
                       "Skip sample rows");
    metadata->add_flag_function("--no-statistics", [&config](int64_t) { config.extraction.include_statistics = false; },
                       "Skip column statistics");
    metadata->add_option("--sample-rows", config.extraction.sample_rows, "Sample rows per relation")
        ->check(CLI::NonNegativeNumber);
    metadata->add_flag_function("--fresh", [&config](int64_t) { config.use_cache = false; },
                       "Ignore the cached snapshot for this run");

    auto* refresh = app.add_subcommand("refresh", "Rebuild the metadata cache");
    auto* clear_cache = app.add_subcommand("clear-cache", "Delete the metadata cache");

    std::string question;
    auto* ask = app.add_subcommand("ask", "Translate a question to SQL and run it");
    ask->add_option("question", question, "Question in plain language")->required();
    int64_t max_rows = 0;
    auto* max_rows_opt = ask->add_option("--max-rows", max_rows, "Maximum rows to return")
        ->check(CLI::PositiveNumber);

    auto* profiles = app.add_subcommand("profiles", "Manage saved connection profiles");
    profiles->require_subcommand(1);
    std::string profile_name;
    auto* profiles_list = profiles->add_subcommand("list", "List saved profiles");
    auto* profiles_add = profiles->add_subcommand("add", "Save the connection options as a profile");
    profiles_add->add_option("name", profile_name, "Profile name")->required();
    profiles_add->add_option("--description", config.profile_description, "Free-form description");
    auto* profiles_remove = profiles->add_subcommand("remove", "Delete a profile");
    profiles_remove->add_option("name", profile_name, "Profile name")->required();
    auto* profiles_activate = profiles->add_subcommand("activate", "Make a profile the active one");
    profiles_activate->add_option("name", profile_name, "Profile name")->required();
    auto* profiles_test = profiles->add_subcommand("test", "Test a profile or the connection options");
    profiles_test->add_option("name", profile_name, "Profile name");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e));
    }

    if (cache_dir_opt->count() > 0) {
        config.cache.directory = cache_dir;
    }

    if (schema->parsed()) {
        config.command = "schema";
    } else if (metadata->parsed()) {
        config.command = "metadata";
    } else if (refresh->parsed()) {
        config.command = "refresh";
    } else if (clear_cache->parsed()) {
        config.command = "clear-cache";
    } else if (ask->parsed()) {
        config.command = "ask";
        config.arguments.push_back(question);
        if (max_rows_opt->count() > 0) {
            config.query.max_rows = static_cast<size_t>(max_rows);
        }
    } else if (profiles->parsed()) {
        config.command = "profiles";
        if (profiles_list->parsed()) config.arguments.push_back("list");
        else if (profiles_add->parsed()) config.arguments.push_back("add");
        else if (profiles_remove->parsed()) config.arguments.push_back("remove");
        else if (profiles_activate->parsed()) config.arguments.push_back("activate");
        else if (profiles_test->parsed()) config.arguments.push_back("test");
        if (!profile_name.empty()) {
            config.arguments.push_back(profile_name);
        }
    }

    config.resolveSecrets();

    return config;
}

bool Config::validate() const {
    if (connection.host.empty()) {
        spdlog::error("Database host is required (use -H option)");
        return false;
    }

    if (connection.port == 0) {
        spdlog::error("Invalid database port: {}", connection.port);
        return false;
    }

    if (extraction.sample_rows < 0) {
        spdlog::error("sample_rows must not be negative: {}", extraction.sample_rows);
        return false;
    }

    if (extraction.statement_timeout.count() < 0 || query.statement_timeout.count() < 0) {
        spdlog::error("Statement timeouts must not be negative");
        return false;
    }

    if (query.max_rows == 0) {
        spdlog::error("max_rows must be positive");
        return false;
    }

    static const std::vector<std::string> sslmodes = {
        "disable", "allow", "prefer", "require", "verify-ca", "verify-full"
    };
    if (std::find(sslmodes.begin(), sslmodes.end(), connection.sslmode) == sslmodes.end()) {
        spdlog::error("Unknown sslmode: {}", connection.sslmode);
        return false;
    }

    if (command == "ask" && llm.api_key.empty()) {
        spdlog::error("Anthropic API key not configured (set ANTHROPIC_API_KEY or [llm] api_key)");
        return false;
    }

    return true;
}

void Config::resolveSecrets() {
    if (connection.password.empty()) {
        const char* env_pwd = std::getenv("PGPASSWORD");
        if (env_pwd) {
            connection.password = env_pwd;
        }
    }
    if (llm.api_key.empty()) {
        const char* env_key = std::getenv("ANTHROPIC_API_KEY");
        if (env_key) {
            llm.api_key = env_key;
        }
    }
}

std::filesystem::path Config::cacheFileFor(const ConnectionConfig& conn) const {
    std::string name = "metadata_" + sanitizeForFilename(conn.host) + "_" +
                       std::to_string(conn.port) + "_" +
                       sanitizeForFilename(conn.database) + ".json";
    return cache.directory / name;
}

}  // namespace querymind
