#include "CacheManager.hpp"
#include "Config.hpp"
#include "ConnectionProfileStore.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "QueryService.hpp"
#include "SchemaFormatter.hpp"
#include "PostgreSQLConnection.hpp"
#include "PostgreSQLQueryExecutor.hpp"
#include "PostgreSQLSchemaProber.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <vector>

using namespace querymind;

namespace {

// Logs go to stderr; stdout carries command output only
void setupLogging(bool debug, const std::string& logFile) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(debug ? spdlog::level::debug : spdlog::level::info);
        sinks.push_back(console_sink);

        if (!logFile.empty()) {
            try {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false);
                file_sink->set_level(spdlog::level::debug);
                sinks.push_back(file_sink);
            } catch (const spdlog::spdlog_ex& ex) {
                std::cerr << "Cannot open log file " << logFile << ": " << ex.what() << std::endl;
            }
        }

        auto logger = std::make_shared<spdlog::logger>("querymind", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::debug);

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void printProfiles(const std::vector<ProfileSummary>& profiles) {
    if (profiles.empty()) {
        std::cout << "No saved connection profiles." << std::endl;
        return;
    }
    for (const auto& p : profiles) {
        std::cout << (p.active ? "* " : "  ") << p.name << "  "
                  << p.user << "@" << p.host << ":" << p.port << "/" << p.database;
        if (!p.description.empty()) {
            std::cout << "  (" << p.description << ")";
        }
        std::cout << "\n";
    }
    std::cout.flush();
}

int runProfiles(const Config& config, ConnectionProfileStore& store) {
    const std::string action = config.arguments.empty() ? "list" : config.arguments[0];
    const std::string name = config.arguments.size() > 1 ? config.arguments[1] : "";

    if (action == "list") {
        printProfiles(store.list());
        return 0;
    }

    if (action == "add") {
        auto summary = store.add(ConnectionProfile::fromConnectionConfig(
            name, config.connection, config.profile_description));
        std::cout << "Saved profile '" << summary.name << "'" << std::endl;
        return 0;
    }

    if (action == "remove") {
        if (!store.remove(name)) {
            spdlog::error("Connection profile not found: {}", name);
            return 1;
        }
        std::cout << "Connection '" << name << "' deleted" << std::endl;
        return 0;
    }

    if (action == "activate" || action == "test") {
        ConnectionConfig target = config.connection;
        if (!name.empty()) {
            auto profile = store.get(name);
            if (!profile) {
                spdlog::error("Connection profile not found: {}", name);
                return 1;
            }
            target = profile->toConnectionConfig(config.connection);
        }

        auto result = testConnection(target);
        if (!result.success) {
            spdlog::error("Connection test failed: {}", result.message);
            return 1;
        }

        if (action == "activate") {
            store.setActive(name);
            std::cout << "Connection '" << name << "' activated" << std::endl;
        } else {
            std::cout << result.message << "\n" << result.serverVersion << std::endl;
        }
        return 0;
    }

    spdlog::error("Unknown profiles action: {}", action);
    return 1;
}

int runCommand(const Config& config) {
    ConnectionProfileStore store(config.profiles.file);

    if (config.command == "profiles") {
        return runProfiles(config, store);
    }

    Session session = Session::resolve(config, store);

    CacheManager cache(session.cacheFile);
    PostgreSQLProberFactory factory(session.connection, config.extraction);
    AnthropicSqlGenerator generator(config.llm);
    PostgreSQLQueryExecutor executor(config.query);

    QueryService service(session, factory, cache, generator, executor, config.cache.enabled);

    if (config.command == "schema") {
        std::cout << service.schemaText() << std::endl;
        return 0;
    }

    if (config.command == "metadata") {
        ExtractOptions options;
        options.includeSamples = config.extraction.include_samples;
        options.sampleRows = config.extraction.sample_rows;
        options.includeStatistics = config.extraction.include_statistics;
        options.useCache = config.use_cache;

        auto snapshot = service.metadata(options);
        if (config.json_output) {
            std::cout << FormatConverter::toJSON(snapshot).dump(2, ' ', false, json::error_handler_t::replace)
                      << std::endl;
        } else {
            std::cout << SchemaFormatter::format(snapshot) << std::endl;
        }
        return 0;
    }

    if (config.command == "refresh") {
        ExtractOptions options;
        options.includeSamples = config.extraction.include_samples;
        options.sampleRows = config.extraction.sample_rows;
        options.includeStatistics = config.extraction.include_statistics;

        auto snapshot = service.refresh(options);
        std::cout << "Metadata refreshed: " << snapshot.totalTables() << " tables, "
                  << snapshot.totalViews() << " views" << std::endl;
        return 0;
    }

    if (config.command == "clear-cache") {
        service.clearCache();
        std::cout << "Cache cleared" << std::endl;
        return 0;
    }

    if (config.command == "ask") {
        auto result = service.ask(config.arguments.empty() ? "" : config.arguments[0]);

        json response{
            {"sql", result.sql},
            {"results", result.rows},
            {"row_count", result.rowCount}
        };
        if (result.truncated) {
            response["truncated"] = true;
        }
        std::cout << response.dump(2, ' ', false, json::error_handler_t::replace) << std::endl;
        return 0;
    }

    spdlog::error("Unknown command: {}", config.command);
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    // Parse configuration
    Config config;
    try {
        config = Config::parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    // Setup logging
    setupLogging(config.debug, config.log_file);

    spdlog::debug("Command: {}", config.command);

    // Profile bookkeeping needs no database settings
    bool needs_database = config.command != "profiles" ||
                          (!config.arguments.empty() &&
                           (config.arguments[0] == "test" || config.arguments[0] == "add"));
    if (needs_database && !config.validate()) {
        return 1;
    }

    try {
        return runCommand(config);
    } catch (const ConnectionError& e) {
        spdlog::error("Database connection failed: {}", e.what());
    } catch (const DatabaseException& e) {
        spdlog::error("Query execution failed [{}]: {}", e.sqlState(), e.what());
    } catch (const UnsafeQueryError& e) {
        spdlog::error("Query rejected: {}", e.what());
    } catch (const GenerationError& e) {
        spdlog::error("Failed to generate SQL: {}", e.what());
    } catch (const ProfileError& e) {
        spdlog::error("{}", e.what());
    } catch (const CacheError& e) {
        spdlog::error("Cache error: {}", e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
    }

    return 1;
}
