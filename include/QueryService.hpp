#pragma once

#include "CacheManager.hpp"
#include "Config.hpp"
#include "ConnectionProfileStore.hpp"
#include "MetadataExtractor.hpp"
#include "QueryExecutor.hpp"
#include "SqlGenerator.hpp"
#include <filesystem>
#include <string>

namespace querymind {

// The database a command works against: which profile (if any) it came
// from, how to connect, and where its metadata cache lives.
struct Session {
    std::string profile;
    ConnectionConfig connection;
    std::filesystem::path cacheFile;

    // --profile wins, then the store's active profile when no database was
    // given on the command line or in the config file, then the plain
    // connection options. Throws ProfileError for an unknown --profile.
    static Session resolve(const Config& config, ConnectionProfileStore& store);
};

// Orchestrates the question -> SQL -> rows flow over one Session
class QueryService {
public:
    QueryService(Session session, ProberFactory& factory, CacheManager& cache,
                 SqlGenerator& generator, QueryExecutor& executor, bool cacheEnabled = true);

    // Schema text for the model: no samples, no statistics, cache allowed.
    // Throws ConnectionError when the database cannot be reached.
    std::string schemaText();

    // Full snapshot; useCache is forced off when caching is disabled
    Snapshot metadata(ExtractOptions options);

    // Drop the cache, extract from scratch and store the fresh snapshot.
    // A failed listing is returned but never stored.
    Snapshot refresh(const ExtractOptions& options = ExtractOptions{});

    void clearCache();

    // Question -> schema text -> model -> clean -> guard -> execute.
    // Throws GenerationError, UnsafeQueryError or DatabaseException.
    QueryResult ask(const std::string& question);

    const Session& session() const { return m_session; }

private:
    Snapshot schemaSnapshot();

    Session m_session;
    SqlGenerator& m_generator;
    QueryExecutor& m_executor;
    MetadataExtractor m_extractor;
    bool m_cacheEnabled;
};

}  // namespace querymind
