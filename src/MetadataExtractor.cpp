#include "MetadataExtractor.hpp"
#include "ErrorHandler.hpp"
#include "FormatConverter.hpp"
#include "RelationshipGrapher.hpp"
#include <spdlog/spdlog.h>

namespace querymind {

MetadataExtractor::MetadataExtractor(ProberFactory& factory, CacheManager& cache, Clock clock)
    : m_factory(factory), m_cache(cache), m_clock(std::move(clock)) {
}

std::chrono::system_clock::time_point MetadataExtractor::now() const {
    return m_clock ? m_clock() : std::chrono::system_clock::now();
}

void MetadataExtractor::recordWarning(Snapshot& snapshot, const std::string& relation,
                                      const std::string& step, const std::string& message) {
    std::string context = ErrorContext::current();
    spdlog::warn("{}{} failed: {}", context.empty() ? "" : context + ": ", step, message);
    snapshot.warnings.push_back(ProbeWarning{relation, step, message});
}

template <typename T, typename Fn>
T MetadataExtractor::probe(Snapshot& snapshot, const std::string& relation, const char* step,
                           Fn&& fn, T fallback) {
    try {
        return fn();
    } catch (const DatabaseException& e) {
        recordWarning(snapshot, relation, step, e.what());
        return fallback;
    }
}

Snapshot MetadataExtractor::extractAllMetadata(bool includeSamples, int sampleRows,
                                               bool includeStatistics, bool useCache) {
    return extract(ExtractOptions{includeSamples, sampleRows, includeStatistics, useCache});
}

void MetadataExtractor::clearCache() {
    m_cache.clear();
}

Snapshot MetadataExtractor::extract(const ExtractOptions& options) {
    if (options.useCache) {
        if (auto entry = m_cache.get()) {
            spdlog::info("Using cached metadata (cached at {})",
                         FormatConverter::formatTimestamp(entry->cachedAt));
            return std::move(entry->snapshot);
        }
    }

    return probeAll(options);
}

Snapshot MetadataExtractor::refresh(const ExtractOptions& options) {
    if (options.useCache) {
        try {
            m_cache.clear();
        } catch (const CacheError& e) {
            spdlog::warn("Failed to clear cache: {}", e.what());
        }
    }
    return probeAll(options);
}

Snapshot MetadataExtractor::probeAll(const ExtractOptions& options) {
    Snapshot snapshot;
    snapshot.extractedAt = FormatConverter::truncateToMicros(now());

    std::unique_ptr<SchemaProber> prober;
    try {
        prober = m_factory.open();
    } catch (const DatabaseException& e) {
        spdlog::error("Connection failed: {}", e.what());
        snapshot.connectionFailed = true;
        snapshot.warnings.push_back(ProbeWarning{"", "connection", e.what()});
        return snapshot;
    }

    std::vector<RelationInfo> tables;
    std::vector<RelationInfo> views;
    try {
        snapshot.databaseName = prober->databaseName();
        tables = prober->listTables();
        views = prober->listViews();
    } catch (const DatabaseException& e) {
        spdlog::error("Could not list relations: {}", e.what());
        Snapshot empty;
        empty.extractedAt = snapshot.extractedAt;
        empty.databaseName = snapshot.databaseName;
        empty.warnings.push_back(ProbeWarning{"", "relations", e.what()});
        return empty;
    }

    spdlog::info("Extracting metadata from {} ({} tables, {} views)",
                 snapshot.databaseName, tables.size(), views.size());

    for (const auto& info : tables) {
        ErrorContext ctx("table " + info.name);
        spdlog::info("Processing table: {}", info.name);
        snapshot.tables[info.name] = probeTable(*prober, info, options, snapshot);
    }

    for (const auto& info : views) {
        if (snapshot.tables.count(info.name)) {
            continue;
        }
        ErrorContext ctx("view " + info.name);
        spdlog::info("Processing view: {}", info.name);
        snapshot.views[info.name] = probeView(*prober, info, options, snapshot);
    }

    auto fk_rows = probe(snapshot, "", "relationships",
                         [&] { return prober->getAllForeignKeys(); },
                         std::vector<ForeignKeyRow>{});
    snapshot.relationships = RelationshipGrapher::build(fk_rows);
    spdlog::debug("{} tables reference {} others", snapshot.relationships.size(),
                  RelationshipGrapher::referencedTables(snapshot.relationships).size());

    // Release the connection before touching the cache file
    prober.reset();

    if (options.useCache) {
        try {
            m_cache.put(snapshot);
        } catch (const CacheError& e) {
            spdlog::warn("Failed to save cache: {}", e.what());
        }
    }

    spdlog::info("Extracted {} tables, {} views, {} relationship sources ({} warnings)",
                 snapshot.totalTables(), snapshot.totalViews(),
                 snapshot.relationships.size(), snapshot.warnings.size());

    return snapshot;
}

TableMeta MetadataExtractor::probeTable(SchemaProber& prober, const RelationInfo& info,
                                        const ExtractOptions& options, Snapshot& snapshot) {
    const std::string& name = info.name;

    TableMeta table;
    table.tableType = info.type.empty() ? "BASE TABLE" : info.type;
    table.comment = info.comment;

    table.columns = probe(snapshot, name, "columns",
                          [&] { return prober.getColumns(name); }, std::vector<ColumnMeta>{});
    table.primaryKeys = probe(snapshot, name, "primary_keys",
                              [&] { return prober.getPrimaryKeys(name); }, std::vector<std::string>{});
    table.foreignKeys = probe(snapshot, name, "foreign_keys",
                              [&] { return prober.getForeignKeys(name); }, std::vector<ForeignKeyMeta>{});
    table.indexes = probe(snapshot, name, "indexes",
                          [&] { return prober.getIndexes(name); }, std::vector<IndexMeta>{});
    table.rowCount = probe(snapshot, name, "row_count",
                           [&] { return prober.getRowCount(name); }, int64_t{0});
    table.tableSize = probe(snapshot, name, "table_size",
                            [&] { return prober.getTableSize(name); }, std::string("Unknown"));

    // Statistics and samples only for non-empty tables
    if (table.rowCount > 0) {
        if (options.includeStatistics) {
            spdlog::debug("Calculating statistics for {}", name);
            table.columnStatistics = probeStatistics(prober, name, table.columns, snapshot);
        }
        if (options.includeSamples) {
            table.sampleData = probe(snapshot, name, "sample_data",
                                     [&] { return prober.getSampleRows(name, options.sampleRows); },
                                     std::vector<SampleRow>{});
        }
    }

    return table;
}

std::map<std::string, ColumnStats> MetadataExtractor::probeStatistics(
    SchemaProber& prober, const std::string& table, const std::vector<ColumnMeta>& columns,
    Snapshot& snapshot) {
    std::map<std::string, ColumnStats> stats;

    for (const auto& col : columns) {
        try {
            stats[col.name] = prober.getColumnStats(table, col.name);
        } catch (const DatabaseException& e) {
            ColumnStats failed;
            failed.error = e.what();
            stats[col.name] = failed;
            recordWarning(snapshot, table + "." + col.name, "statistics", e.what());
        }
    }

    return stats;
}

ViewMeta MetadataExtractor::probeView(SchemaProber& prober, const RelationInfo& info,
                                      const ExtractOptions& options, Snapshot& snapshot) {
    const std::string& name = info.name;

    ViewMeta view;
    view.viewType = info.type.empty() ? "VIEW" : info.type;
    view.comment = info.comment;
    view.definition = info.definition;

    view.columns = probe(snapshot, name, "columns",
                         [&] { return prober.getColumns(name); }, std::vector<ColumnMeta>{});

    if (options.includeSamples) {
        view.sampleData = probe(snapshot, name, "sample_data",
                                [&] { return prober.getSampleRows(name, options.sampleRows); },
                                std::vector<SampleRow>{});
    }

    return view;
}

}  // namespace querymind
