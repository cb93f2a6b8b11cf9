#pragma once

#include "SchemaProber.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace querymind {

using json = nlohmann::ordered_json;

// Snapshot <-> JSON conversion shared by the cache file and `metadata --json`.
// Keys use the snake_case names of the catalog columns they come from
// (column_name, foreign_table_name, index_type, ...).
class FormatConverter {
public:
    static json toJSON(const Snapshot& snapshot);
    static json toJSON(const TableMeta& table);
    static json toJSON(const ViewMeta& view);
    static json toJSON(const ColumnMeta& column);
    static json toJSON(const ColumnStats& stats);

    // Throws nlohmann::json::exception on missing keys or wrong types and
    // std::invalid_argument on a malformed timestamp
    static Snapshot snapshotFromJSON(const json& data);

    // ISO-8601 UTC with microseconds: 2024-05-01T12:30:00.123456Z
    static std::string formatTimestamp(std::chrono::system_clock::time_point tp);
    static std::optional<std::chrono::system_clock::time_point> parseTimestamp(const std::string& text);

    // Drop sub-microsecond precision so a timestamp survives formatting
    static std::chrono::system_clock::time_point truncateToMicros(
        std::chrono::system_clock::time_point tp);

private:
    static TableMeta tableFromJSON(const json& data);
    static ViewMeta viewFromJSON(const json& data);
    static ColumnMeta columnFromJSON(const json& data);
    static ColumnStats statsFromJSON(const json& data);
};

}  // namespace querymind
