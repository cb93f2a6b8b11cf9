#include "QueryService.hpp"
#include "ErrorHandler.hpp"
#include "SchemaFormatter.hpp"
#include "SqlGuard.hpp"
#include <spdlog/spdlog.h>

namespace querymind {

namespace {

void throwIfUnreachable(const Snapshot& snapshot) {
    if (!snapshot.connectionFailed) {
        return;
    }
    std::string message = "Database connection failed";
    for (const auto& w : snapshot.warnings) {
        if (w.step == "connection") {
            message = w.message;
            break;
        }
    }
    throw ConnectionError(message);
}

}  // namespace

Session Session::resolve(const Config& config, ConnectionProfileStore& store) {
    Session session;

    if (!config.profile.empty()) {
        auto conn = store.connectionConfig(config.profile, config.connection);
        if (!conn) {
            throw ProfileError("Unknown connection profile: " + config.profile);
        }
        session.profile = config.profile;
        session.connection = *conn;
    } else if (config.connection.database.empty() && store.active()) {
        auto active = *store.active();
        auto conn = store.connectionConfig(active, config.connection);
        if (!conn) {
            throw ProfileError("Active connection profile disappeared: " + active);
        }
        session.profile = active;
        session.connection = *conn;
    } else {
        session.connection = config.connection;
    }

    session.cacheFile = config.cacheFileFor(session.connection);

    spdlog::debug("Session: {}{}:{}/{}",
                  session.profile.empty() ? "" : "[" + session.profile + "] ",
                  session.connection.host, session.connection.port, session.connection.database);
    return session;
}

QueryService::QueryService(Session session, ProberFactory& factory, CacheManager& cache,
                           SqlGenerator& generator, QueryExecutor& executor, bool cacheEnabled)
    : m_session(std::move(session)),
      m_generator(generator),
      m_executor(executor),
      m_extractor(factory, cache),
      m_cacheEnabled(cacheEnabled) {
}

Snapshot QueryService::schemaSnapshot() {
    ExtractOptions options;
    options.includeSamples = false;
    options.includeStatistics = false;
    options.useCache = m_cacheEnabled;

    auto snapshot = m_extractor.extract(options);
    throwIfUnreachable(snapshot);
    return snapshot;
}

std::string QueryService::schemaText() {
    return SchemaFormatter::formatForAi(schemaSnapshot());
}

Snapshot QueryService::metadata(ExtractOptions options) {
    if (!m_cacheEnabled) {
        options.useCache = false;
    }
    auto snapshot = m_extractor.extract(options);
    throwIfUnreachable(snapshot);
    return snapshot;
}

Snapshot QueryService::refresh(const ExtractOptions& options) {
    ExtractOptions fresh = options;
    fresh.useCache = m_cacheEnabled;
    auto snapshot = m_extractor.refresh(fresh);
    throwIfUnreachable(snapshot);

    spdlog::info("Metadata refreshed: {} tables, {} views",
                 snapshot.totalTables(), snapshot.totalViews());
    return snapshot;
}

void QueryService::clearCache() {
    m_extractor.clearCache();
}

QueryResult QueryService::ask(const std::string& question) {
    if (question.empty()) {
        throw GenerationError("Question must not be empty");
    }

    std::string schema = schemaText();

    std::string raw = m_generator.generate(question, schema);
    std::string sql = SqlGuard::clean(raw);
    spdlog::info("Generated SQL: {}", sql);

    SqlGuard::check(sql);

    return m_executor.execute(m_session.connection, sql);
}

}  // namespace querymind
