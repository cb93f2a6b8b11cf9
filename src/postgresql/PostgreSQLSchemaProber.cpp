/**
 * @file PostgreSQLSchemaProber.cpp
 * @brief Catalog queries behind PostgreSQLSchemaProber.
 *
 * Every query is restricted to the `public` schema. Relation lookups go
 * through to_regclass('public.' || quote_ident($1)), which returns NULL
 * rather than raising when the relation does not exist.
 */

#include "PostgreSQLSchemaProber.hpp"
#include "PostgreSQLFormatConverter.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <utility>

namespace querymind {

namespace {

constexpr const char* kRegclass = "to_regclass('public.' || quote_ident($1))";

const std::string kFkRuleText =
    "CASE %s WHEN 'a' THEN 'NO ACTION' WHEN 'r' THEN 'RESTRICT' WHEN 'c' THEN 'CASCADE' "
    "WHEN 'n' THEN 'SET NULL' WHEN 'd' THEN 'SET DEFAULT' ELSE 'NO ACTION' END";

std::string ruleText(const std::string& column) {
    std::string text = kFkRuleText;
    return text.replace(text.find("%s"), 2, column);
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

PostgreSQLSchemaProber::PostgreSQLSchemaProber(PostgreSQLConnection connection)
    : m_conn(std::move(connection)) {
}

std::string PostgreSQLSchemaProber::qualifiedName(const std::string& relation) const {
    return m_conn.escapeIdentifier("public") + "." + m_conn.escapeIdentifier(relation);
}

double PostgreSQLSchemaProber::roundPercentage(double value) {
    return std::round(value * 100.0) / 100.0;
}

std::string PostgreSQLSchemaProber::databaseName() {
    return m_conn.databaseName();
}

// ============================================================================
// Relation Enumeration
// ============================================================================

std::vector<RelationInfo> PostgreSQLSchemaProber::listTables() {
    std::vector<RelationInfo> tables;

    auto result = m_conn.execute(
        "SELECT c.relname, obj_description(c.oid, 'pg_class') "
        "FROM pg_class c "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE n.nspname = 'public' AND c.relkind IN ('r', 'p') "
        "ORDER BY c.relname");

    while (result.fetchRow()) {
        RelationInfo info;
        info.name = result.getString(0);
        info.type = "BASE TABLE";
        info.comment = result.getOptionalString(1);
        tables.push_back(std::move(info));
    }

    return tables;
}

std::vector<RelationInfo> PostgreSQLSchemaProber::listViews() {
    std::vector<RelationInfo> views;

    // information_schema.tables does not list materialized views
    auto result = m_conn.execute(
        "SELECT c.relname, "
        "CASE c.relkind WHEN 'm' THEN 'MATERIALIZED VIEW' ELSE 'VIEW' END, "
        "obj_description(c.oid, 'pg_class'), "
        "pg_get_viewdef(c.oid, true) "
        "FROM pg_class c "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "WHERE n.nspname = 'public' AND c.relkind IN ('v', 'm') "
        "ORDER BY c.relname");

    while (result.fetchRow()) {
        RelationInfo info;
        info.name = result.getString(0);
        info.type = result.getString(1);
        info.comment = result.getOptionalString(2);
        info.definition = result.getString(3);
        views.push_back(std::move(info));
    }

    return views;
}

// ============================================================================
// Structure
// ============================================================================

std::vector<ColumnMeta> PostgreSQLSchemaProber::getColumns(const std::string& relation) {
    std::vector<ColumnMeta> columns;

    // pg_attribute covers materialized views too; information_schema adds
    // the standard type names and lengths where it knows the relation
    std::string sql =
        "SELECT a.attname, "
        "CASE WHEN ic.data_type IS NULL OR ic.data_type IN ('USER-DEFINED', 'ARRAY') "
        "THEN format_type(a.atttypid, NULL) ELSE ic.data_type END, "
        "ic.character_maximum_length, ic.numeric_precision, ic.numeric_scale, "
        "NOT a.attnotnull, "
        "pg_get_expr(d.adbin, d.adrelid), "
        "col_description(a.attrelid, a.attnum), "
        "a.attnum "
        "FROM pg_attribute a "
        "LEFT JOIN pg_attrdef d ON d.adrelid = a.attrelid AND d.adnum = a.attnum "
        "LEFT JOIN information_schema.columns ic "
        "ON ic.table_schema = 'public' AND ic.table_name = $1 AND ic.column_name = a.attname "
        "WHERE a.attrelid = " + std::string(kRegclass) + " "
        "AND a.attnum > 0 AND NOT a.attisdropped "
        "ORDER BY a.attnum";

    auto result = m_conn.executeParams(sql, {relation});

    while (result.fetchRow()) {
        ColumnMeta col;
        col.name = result.getString(0);
        col.dataType = result.getString(1);
        col.maxLength = result.getOptionalInt(2);
        col.numericPrecision = result.getOptionalInt(3);
        col.numericScale = result.getOptionalInt(4);
        col.nullable = result.getBool(5);
        col.defaultValue = result.getOptionalString(6);
        col.comment = result.getOptionalString(7);
        col.ordinal = static_cast<int>(result.getOptionalInt(8).value_or(0));
        columns.push_back(std::move(col));
    }

    return columns;
}

std::vector<std::string> PostgreSQLSchemaProber::getPrimaryKeys(const std::string& table) {
    std::vector<std::string> keys;

    std::string sql =
        "SELECT a.attname "
        "FROM pg_index i "
        "JOIN LATERAL unnest(i.indkey::int2[]) WITH ORDINALITY AS k(attnum, pos) ON true "
        "JOIN pg_attribute a ON a.attrelid = i.indrelid AND a.attnum = k.attnum "
        "WHERE i.indrelid = " + std::string(kRegclass) + " AND i.indisprimary "
        "ORDER BY k.pos";

    auto result = m_conn.executeParams(sql, {table});

    while (result.fetchRow()) {
        keys.push_back(result.getString(0));
    }

    return keys;
}

std::vector<ForeignKeyMeta> PostgreSQLSchemaProber::getForeignKeys(const std::string& table) {
    std::vector<ForeignKeyMeta> keys;

    // conkey/confkey pair up column by column, so composite keys stay aligned
    std::string sql =
        "SELECT a.attname, cf.relname, af.attname, con.conname, " +
        ruleText("con.confupdtype") + ", " + ruleText("con.confdeltype") + " "
        "FROM pg_constraint con "
        "JOIN LATERAL unnest(con.conkey, con.confkey) WITH ORDINALITY AS k(attnum, fattnum, pos) ON true "
        "JOIN pg_attribute a ON a.attrelid = con.conrelid AND a.attnum = k.attnum "
        "JOIN pg_class cf ON cf.oid = con.confrelid "
        "JOIN pg_attribute af ON af.attrelid = con.confrelid AND af.attnum = k.fattnum "
        "WHERE con.contype = 'f' AND con.conrelid = " + std::string(kRegclass) + " "
        "ORDER BY con.conname, k.pos";

    auto result = m_conn.executeParams(sql, {table});

    while (result.fetchRow()) {
        ForeignKeyMeta fk;
        fk.column = result.getString(0);
        fk.foreignTable = result.getString(1);
        fk.foreignColumn = result.getString(2);
        fk.constraintName = result.getString(3);
        fk.onUpdate = parseReferentialAction(result.getString(4));
        fk.onDelete = parseReferentialAction(result.getString(5));
        keys.push_back(std::move(fk));
    }

    return keys;
}

std::vector<ForeignKeyRow> PostgreSQLSchemaProber::getAllForeignKeys() {
    std::vector<ForeignKeyRow> rows;

    auto result = m_conn.execute(
        "SELECT c.relname, a.attname, cf.relname, af.attname "
        "FROM pg_constraint con "
        "JOIN pg_class c ON c.oid = con.conrelid "
        "JOIN pg_namespace n ON n.oid = c.relnamespace "
        "JOIN LATERAL unnest(con.conkey, con.confkey) WITH ORDINALITY AS k(attnum, fattnum, pos) ON true "
        "JOIN pg_attribute a ON a.attrelid = con.conrelid AND a.attnum = k.attnum "
        "JOIN pg_class cf ON cf.oid = con.confrelid "
        "JOIN pg_attribute af ON af.attrelid = con.confrelid AND af.attnum = k.fattnum "
        "WHERE con.contype = 'f' AND n.nspname = 'public' "
        "ORDER BY c.relname, con.conname, k.pos");

    while (result.fetchRow()) {
        rows.push_back(ForeignKeyRow{result.getString(0), result.getString(1),
                                     result.getString(2), result.getString(3)});
    }

    return rows;
}

std::vector<IndexMeta> PostgreSQLSchemaProber::getIndexes(const std::string& table) {
    // One row per indexed column; expression columns (attnum 0) drop out
    std::string sql =
        "SELECT i.relname, a.attname, ix.indisunique, ix.indisprimary, am.amname "
        "FROM pg_index ix "
        "JOIN pg_class i ON i.oid = ix.indexrelid "
        "JOIN pg_am am ON am.oid = i.relam "
        "JOIN LATERAL unnest(ix.indkey::int2[]) WITH ORDINALITY AS k(attnum, pos) ON true "
        "JOIN pg_attribute a ON a.attrelid = ix.indrelid AND a.attnum = k.attnum "
        "WHERE ix.indrelid = " + std::string(kRegclass) + " "
        "ORDER BY i.relname, k.pos";

    auto result = m_conn.executeParams(sql, {table});
    return groupIndexRows(result);
}

std::vector<IndexMeta> PostgreSQLSchemaProber::groupIndexRows(PostgreSQLResultSet& rows) {
    std::vector<IndexMeta> indexes;

    while (rows.fetchRow()) {
        std::string name = rows.getString(0);

        // Rows arrive grouped by index name
        if (indexes.empty() || indexes.back().name != name) {
            IndexMeta idx;
            idx.name = name;
            idx.unique = rows.getBool(2);
            idx.primary = rows.getBool(3);
            idx.type = rows.getString(4);
            indexes.push_back(std::move(idx));
        }
        indexes.back().columns.push_back(rows.getString(1));
    }

    return indexes;
}

// ============================================================================
// Size
// ============================================================================

int64_t PostgreSQLSchemaProber::getRowCount(const std::string& table) {
    // reltuples is -1 until the first VACUUM/ANALYZE on PostgreSQL 14+
    auto result = m_conn.executeParams(
        "SELECT GREATEST(reltuples, 0)::bigint FROM pg_class WHERE oid = " +
        std::string(kRegclass), {table});

    if (!result.fetchRow()) {
        throw DatabaseException(ErrorHandler::STATE_UNDEFINED_TABLE,
                                "relation \"" + table + "\" does not exist");
    }
    return result.getOptionalInt(0).value_or(0);
}

std::string PostgreSQLSchemaProber::getTableSize(const std::string& table) {
    auto result = m_conn.executeParams(
        "SELECT pg_size_pretty(pg_total_relation_size(" + std::string(kRegclass) + "))",
        {table});

    std::optional<std::string> size;
    if (result.fetchRow()) {
        size = result.getOptionalString(0);
    }
    if (!size) {
        throw DatabaseException(ErrorHandler::STATE_UNDEFINED_TABLE,
                                "relation \"" + table + "\" does not exist");
    }
    return *size;
}

// ============================================================================
// Data-scanning probes
// ============================================================================

ColumnStats PostgreSQLSchemaProber::getColumnStats(const std::string& table,
                                                   const std::string& column) {
    std::string col = m_conn.escapeIdentifier(column);
    std::string sql = "SELECT COUNT(*), COUNT(" + col + "), COUNT(DISTINCT " + col + ") "
                      "FROM " + qualifiedName(table);

    auto result = m_conn.execute(sql);

    ColumnStats stats;
    if (!result.fetchRow()) {
        return stats;
    }

    int64_t total = result.getOptionalInt(0).value_or(0);
    int64_t non_null = result.getOptionalInt(1).value_or(0);
    stats.nullCount = total - non_null;
    stats.distinctCount = result.getOptionalInt(2).value_or(0);

    if (total > 0) {
        stats.nullPercentage = roundPercentage(
            static_cast<double>(stats.nullCount) * 100.0 / static_cast<double>(total));
        stats.distinctPercentage = roundPercentage(
            static_cast<double>(stats.distinctCount) * 100.0 / static_cast<double>(total));
    }

    return stats;
}

std::vector<SampleRow> PostgreSQLSchemaProber::getSampleRows(const std::string& relation, int limit) {
    auto result = m_conn.executeParams("SELECT * FROM " + qualifiedName(relation) + " LIMIT $1",
                                       {std::to_string(limit)});
    return PostgreSQLFormatConverter::toRows(result);
}

// ============================================================================
// Factory
// ============================================================================

PostgreSQLProberFactory::PostgreSQLProberFactory(ConnectionConfig connection,
                                                 ExtractionConfig extraction)
    : m_connection(std::move(connection)), m_extraction(std::move(extraction)) {
}

std::unique_ptr<SchemaProber> PostgreSQLProberFactory::open() {
    PostgreSQLConnection conn(m_connection, "querymind-metadata");

    conn.execute("SET SESSION CHARACTERISTICS AS TRANSACTION READ ONLY");
    conn.setStatementTimeout(m_extraction.statement_timeout);

    spdlog::debug("Metadata connection ready (statement_timeout {} ms)",
                  m_extraction.statement_timeout.count());

    return std::make_unique<PostgreSQLSchemaProber>(std::move(conn));
}

}  // namespace querymind
