#include "FormatConverter.hpp"
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace querymind {

namespace {

template <typename T>
json optionalToJSON(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optionalFromJSON(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

std::vector<SampleRow> rowsFromJSON(const json& data) {
    std::vector<SampleRow> rows;
    for (const auto& row : data) {
        rows.push_back(row);
    }
    return rows;
}

}  // namespace

// ============================================================================
// Timestamps
// ============================================================================

std::chrono::system_clock::time_point FormatConverter::truncateToMicros(
    std::chrono::system_clock::time_point tp) {
    return std::chrono::time_point_cast<std::chrono::microseconds>(tp);
}

std::string FormatConverter::formatTimestamp(std::chrono::system_clock::time_point tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch());
    auto secs = std::chrono::floor<std::chrono::seconds>(micros);
    auto fraction = (micros - secs).count();

    std::time_t time = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&time, &tm);

    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);

    char result[48];
    std::snprintf(result, sizeof(result), "%s.%06lldZ", buf, static_cast<long long>(fraction));
    return result;
}

std::optional<std::chrono::system_clock::time_point> FormatConverter::parseTimestamp(
    const std::string& text) {
    std::tm tm{};
    int micros = 0;
    int consumed = 0;

    int fields = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%6dZ%n",
                             &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                             &tm.tm_hour, &tm.tm_min, &tm.tm_sec, &micros, &consumed);
    if (fields != 7 || consumed != static_cast<int>(text.size())) {
        return std::nullopt;
    }

    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds(time) + std::chrono::microseconds(micros)));
}

// ============================================================================
// Snapshot to JSON
// ============================================================================

json FormatConverter::toJSON(const ColumnMeta& column) {
    return json{
        {"column_name", column.name},
        {"data_type", column.dataType},
        {"character_maximum_length", optionalToJSON(column.maxLength)},
        {"numeric_precision", optionalToJSON(column.numericPrecision)},
        {"numeric_scale", optionalToJSON(column.numericScale)},
        {"is_nullable", column.nullable ? "YES" : "NO"},
        {"column_default", optionalToJSON(column.defaultValue)},
        {"column_comment", optionalToJSON(column.comment)},
        {"ordinal_position", column.ordinal}
    };
}

json FormatConverter::toJSON(const ColumnStats& stats) {
    if (stats.error) {
        return json{{"error", *stats.error}};
    }
    return json{
        {"null_count", stats.nullCount},
        {"null_percentage", stats.nullPercentage},
        {"distinct_count", stats.distinctCount},
        {"distinct_percentage", stats.distinctPercentage}
    };
}

json FormatConverter::toJSON(const TableMeta& table) {
    json columns = json::array();
    for (const auto& col : table.columns) {
        columns.push_back(toJSON(col));
    }

    json foreign_keys = json::array();
    for (const auto& fk : table.foreignKeys) {
        foreign_keys.push_back(json{
            {"column_name", fk.column},
            {"foreign_table_name", fk.foreignTable},
            {"foreign_column_name", fk.foreignColumn},
            {"constraint_name", fk.constraintName},
            {"update_rule", referentialActionToString(fk.onUpdate)},
            {"delete_rule", referentialActionToString(fk.onDelete)}
        });
    }

    json indexes = json::array();
    for (const auto& idx : table.indexes) {
        indexes.push_back(json{
            {"index_name", idx.name},
            {"columns", idx.columns},
            {"is_unique", idx.unique},
            {"is_primary", idx.primary},
            {"index_type", idx.type}
        });
    }

    json result{
        {"table_type", table.tableType},
        {"comment", optionalToJSON(table.comment)},
        {"row_count", table.rowCount},
        {"table_size", table.tableSize},
        {"columns", std::move(columns)},
        {"primary_keys", table.primaryKeys},
        {"foreign_keys", std::move(foreign_keys)},
        {"indexes", std::move(indexes)}
    };

    // Absent and empty are different: absent means the probe was skipped
    if (table.columnStatistics) {
        json stats = json::object();
        for (const auto& [name, s] : *table.columnStatistics) {
            stats[name] = toJSON(s);
        }
        result["column_statistics"] = std::move(stats);
    }
    if (table.sampleData) {
        result["sample_data"] = *table.sampleData;
    }

    return result;
}

json FormatConverter::toJSON(const ViewMeta& view) {
    json columns = json::array();
    for (const auto& col : view.columns) {
        columns.push_back(toJSON(col));
    }

    json result{
        {"view_type", view.viewType},
        {"comment", optionalToJSON(view.comment)},
        {"definition", view.definition},
        {"columns", std::move(columns)}
    };
    if (view.sampleData) {
        result["sample_data"] = *view.sampleData;
    }
    return result;
}

json FormatConverter::toJSON(const Snapshot& snapshot) {
    json tables = json::object();
    for (const auto& [name, table] : snapshot.tables) {
        tables[name] = toJSON(table);
    }

    json views = json::object();
    for (const auto& [name, view] : snapshot.views) {
        views[name] = toJSON(view);
    }

    json relationships = json::object();
    for (const auto& [table, edges] : snapshot.relationships) {
        json list = json::array();
        for (const auto& edge : edges) {
            list.push_back(json{
                {"from_column", edge.fromColumn},
                {"to_table", edge.toTable},
                {"to_column", edge.toColumn}
            });
        }
        relationships[table] = std::move(list);
    }

    json warnings = json::array();
    for (const auto& w : snapshot.warnings) {
        warnings.push_back(json{{"relation", w.relation}, {"step", w.step}, {"message", w.message}});
    }

    return json{
        {"database_name", snapshot.databaseName},
        {"extracted_at", formatTimestamp(snapshot.extractedAt)},
        {"total_tables", snapshot.totalTables()},
        {"total_views", snapshot.totalViews()},
        {"tables", std::move(tables)},
        {"views", std::move(views)},
        {"relationships", std::move(relationships)},
        {"warnings", std::move(warnings)},
        {"connection_failed", snapshot.connectionFailed}
    };
}

// ============================================================================
// JSON to Snapshot
// ============================================================================

ColumnMeta FormatConverter::columnFromJSON(const json& data) {
    ColumnMeta col;
    col.name = data.at("column_name").get<std::string>();
    col.dataType = data.at("data_type").get<std::string>();
    col.maxLength = optionalFromJSON<int64_t>(data, "character_maximum_length");
    col.numericPrecision = optionalFromJSON<int64_t>(data, "numeric_precision");
    col.numericScale = optionalFromJSON<int64_t>(data, "numeric_scale");
    col.nullable = data.at("is_nullable").get<std::string>() == "YES";
    col.defaultValue = optionalFromJSON<std::string>(data, "column_default");
    col.comment = optionalFromJSON<std::string>(data, "column_comment");
    col.ordinal = data.at("ordinal_position").get<int>();
    return col;
}

ColumnStats FormatConverter::statsFromJSON(const json& data) {
    ColumnStats stats;
    if (data.contains("error")) {
        stats.error = data.at("error").get<std::string>();
        return stats;
    }
    stats.nullCount = data.at("null_count").get<int64_t>();
    stats.nullPercentage = data.at("null_percentage").get<double>();
    stats.distinctCount = data.at("distinct_count").get<int64_t>();
    stats.distinctPercentage = data.at("distinct_percentage").get<double>();
    return stats;
}

TableMeta FormatConverter::tableFromJSON(const json& data) {
    TableMeta table;
    table.tableType = data.at("table_type").get<std::string>();
    table.comment = optionalFromJSON<std::string>(data, "comment");
    table.rowCount = data.at("row_count").get<int64_t>();
    table.tableSize = data.at("table_size").get<std::string>();

    for (const auto& col : data.at("columns")) {
        table.columns.push_back(columnFromJSON(col));
    }
    table.primaryKeys = data.at("primary_keys").get<std::vector<std::string>>();

    for (const auto& fk : data.at("foreign_keys")) {
        ForeignKeyMeta meta;
        meta.column = fk.at("column_name").get<std::string>();
        meta.foreignTable = fk.at("foreign_table_name").get<std::string>();
        meta.foreignColumn = fk.at("foreign_column_name").get<std::string>();
        meta.constraintName = fk.at("constraint_name").get<std::string>();
        meta.onUpdate = parseReferentialAction(fk.at("update_rule").get<std::string>());
        meta.onDelete = parseReferentialAction(fk.at("delete_rule").get<std::string>());
        table.foreignKeys.push_back(std::move(meta));
    }

    for (const auto& idx : data.at("indexes")) {
        IndexMeta meta;
        meta.name = idx.at("index_name").get<std::string>();
        meta.columns = idx.at("columns").get<std::vector<std::string>>();
        meta.unique = idx.at("is_unique").get<bool>();
        meta.primary = idx.at("is_primary").get<bool>();
        meta.type = idx.at("index_type").get<std::string>();
        table.indexes.push_back(std::move(meta));
    }

    if (data.contains("column_statistics")) {
        std::map<std::string, ColumnStats> stats;
        for (const auto& [name, s] : data.at("column_statistics").items()) {
            stats[name] = statsFromJSON(s);
        }
        table.columnStatistics = std::move(stats);
    }
    if (data.contains("sample_data")) {
        table.sampleData = rowsFromJSON(data.at("sample_data"));
    }

    return table;
}

ViewMeta FormatConverter::viewFromJSON(const json& data) {
    ViewMeta view;
    view.viewType = data.at("view_type").get<std::string>();
    view.comment = optionalFromJSON<std::string>(data, "comment");
    view.definition = data.at("definition").get<std::string>();
    for (const auto& col : data.at("columns")) {
        view.columns.push_back(columnFromJSON(col));
    }
    if (data.contains("sample_data")) {
        view.sampleData = rowsFromJSON(data.at("sample_data"));
    }
    return view;
}

Snapshot FormatConverter::snapshotFromJSON(const json& data) {
    Snapshot snapshot;
    snapshot.databaseName = data.at("database_name").get<std::string>();

    auto extracted = parseTimestamp(data.at("extracted_at").get<std::string>());
    if (!extracted) {
        throw std::invalid_argument("Malformed extracted_at timestamp");
    }
    snapshot.extractedAt = *extracted;

    for (const auto& [name, table] : data.at("tables").items()) {
        snapshot.tables[name] = tableFromJSON(table);
    }
    for (const auto& [name, view] : data.at("views").items()) {
        snapshot.views[name] = viewFromJSON(view);
    }
    for (const auto& [table, edges] : data.at("relationships").items()) {
        auto& list = snapshot.relationships[table];
        for (const auto& edge : edges) {
            list.push_back(RelationshipEdge{edge.at("from_column").get<std::string>(),
                                            edge.at("to_table").get<std::string>(),
                                            edge.at("to_column").get<std::string>()});
        }
    }

    if (data.contains("warnings")) {
        for (const auto& w : data.at("warnings")) {
            snapshot.warnings.push_back(ProbeWarning{w.at("relation").get<std::string>(),
                                                     w.at("step").get<std::string>(),
                                                     w.at("message").get<std::string>()});
        }
    }
    snapshot.connectionFailed = data.value("connection_failed", false);

    return snapshot;
}

}  // namespace querymind
