#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace querymind {

// Sample rows keep the column order of the SELECT that produced them
using SampleRow = nlohmann::ordered_json;

enum class ReferentialAction {
    NoAction,
    Cascade,
    SetNull,
    SetDefault,
    Restrict
};

// "SET NULL" <-> ReferentialAction::SetNull; unknown text maps to NoAction
ReferentialAction parseReferentialAction(const std::string& rule);
std::string referentialActionToString(ReferentialAction action);

struct ColumnMeta {
    std::string name;
    std::string dataType;
    std::optional<int64_t> maxLength;
    std::optional<int64_t> numericPrecision;
    std::optional<int64_t> numericScale;
    bool nullable = true;
    std::optional<std::string> defaultValue;
    std::optional<std::string> comment;
    int ordinal = 0;

    bool operator==(const ColumnMeta&) const = default;
};

struct ForeignKeyMeta {
    std::string column;
    std::string foreignTable;
    std::string foreignColumn;
    std::string constraintName;
    ReferentialAction onUpdate = ReferentialAction::NoAction;
    ReferentialAction onDelete = ReferentialAction::NoAction;

    bool operator==(const ForeignKeyMeta&) const = default;
};

struct IndexMeta {
    std::string name;
    std::vector<std::string> columns;
    bool unique = false;
    bool primary = false;
    std::string type = "btree";

    bool operator==(const IndexMeta&) const = default;
};

struct ColumnStats {
    int64_t nullCount = 0;
    double nullPercentage = 0.0;
    int64_t distinctCount = 0;
    double distinctPercentage = 0.0;
    std::optional<std::string> error;  // set alone when the stats query failed

    bool operator==(const ColumnStats&) const = default;
};

struct RelationshipEdge {
    std::string fromColumn;
    std::string toTable;
    std::string toColumn;

    bool operator==(const RelationshipEdge&) const = default;
};

// One row of the schema-wide foreign key listing
struct ForeignKeyRow {
    std::string fromTable;
    std::string fromColumn;
    std::string toTable;
    std::string toColumn;
};

struct TableMeta {
    std::string tableType = "BASE TABLE";
    std::optional<std::string> comment;
    int64_t rowCount = 0;
    std::string tableSize = "Unknown";
    std::vector<ColumnMeta> columns;
    std::vector<std::string> primaryKeys;
    std::vector<ForeignKeyMeta> foreignKeys;
    std::vector<IndexMeta> indexes;
    std::optional<std::map<std::string, ColumnStats>> columnStatistics;
    std::optional<std::vector<SampleRow>> sampleData;

    bool operator==(const TableMeta&) const = default;
};

struct ViewMeta {
    std::string viewType = "VIEW";  // VIEW or MATERIALIZED VIEW
    std::optional<std::string> comment;
    std::string definition;
    std::vector<ColumnMeta> columns;
    std::optional<std::vector<SampleRow>> sampleData;

    bool operator==(const ViewMeta&) const = default;
};

struct ProbeWarning {
    std::string relation;
    std::string step;
    std::string message;

    bool operator==(const ProbeWarning&) const = default;
};

struct Snapshot {
    std::string databaseName;
    std::chrono::system_clock::time_point extractedAt;
    std::map<std::string, TableMeta> tables;
    std::map<std::string, ViewMeta> views;
    std::map<std::string, std::vector<RelationshipEdge>> relationships;
    std::vector<ProbeWarning> warnings;
    bool connectionFailed = false;

    size_t totalTables() const { return tables.size(); }
    size_t totalViews() const { return views.size(); }

    bool operator==(const Snapshot&) const = default;
};

// Table/view listing row from the catalog
struct RelationInfo {
    std::string name;
    std::string type;  // BASE TABLE, VIEW, MATERIALIZED VIEW
    std::optional<std::string> comment;
    std::string definition;  // views only
};

// Abstract read-only introspection over one open connection.
// Every method throws DatabaseException on failure; an empty result means
// the catalog had nothing to report.
class SchemaProber {
public:
    virtual ~SchemaProber() = default;

    SchemaProber(const SchemaProber&) = delete;
    SchemaProber& operator=(const SchemaProber&) = delete;

    virtual std::string databaseName() = 0;

    // Relation enumeration (fatal to an extraction when it fails)
    virtual std::vector<RelationInfo> listTables() = 0;
    virtual std::vector<RelationInfo> listViews() = 0;

    // Structure
    virtual std::vector<ColumnMeta> getColumns(const std::string& relation) = 0;
    virtual std::vector<std::string> getPrimaryKeys(const std::string& table) = 0;
    virtual std::vector<ForeignKeyMeta> getForeignKeys(const std::string& table) = 0;
    virtual std::vector<ForeignKeyRow> getAllForeignKeys() = 0;
    virtual std::vector<IndexMeta> getIndexes(const std::string& table) = 0;

    // Size
    virtual int64_t getRowCount(const std::string& table) = 0;
    virtual std::string getTableSize(const std::string& table) = 0;

    // Data-scanning probes
    virtual ColumnStats getColumnStats(const std::string& table, const std::string& column) = 0;
    virtual std::vector<SampleRow> getSampleRows(const std::string& relation, int limit) = 0;

protected:
    SchemaProber() = default;
};

// Opens a connection and returns a prober bound to it. The connection is
// released when the prober is destroyed. Throws ConnectionError.
class ProberFactory {
public:
    virtual ~ProberFactory() = default;

    virtual std::unique_ptr<SchemaProber> open() = 0;
};

}  // namespace querymind
