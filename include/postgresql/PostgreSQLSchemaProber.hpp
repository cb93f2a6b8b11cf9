#pragma once

/**
 * @file PostgreSQLSchemaProber.hpp
 * @brief SchemaProber backed by the PostgreSQL system catalogs.
 *
 * Reads relations of the `public` schema from pg_catalog and
 * information_schema over one owned connection.
 */

#include "SchemaProber.hpp"
#include "Config.hpp"
#include "PostgreSQLConnection.hpp"
#include <memory>

namespace querymind {

/**
 * @class PostgreSQLSchemaProber
 * @brief Catalog queries for one open PostgreSQL connection.
 *
 * PostgreSQL System Catalogs Used:
 * - pg_class / pg_namespace: relations, comments, row estimates
 * - pg_attribute / pg_attrdef: columns and defaults
 * - pg_index / pg_am: indexes and access methods
 * - pg_constraint: primary and foreign keys with their rules
 * - information_schema.columns: SQL-standard type names and lengths
 *
 * Relation names are never spliced into catalog queries. They are bound
 * as $1 and resolved with to_regclass(), so a relation that disappears
 * between two probes yields an empty result instead of a syntax error.
 * Only the statistics and sample queries put names in SQL text, quoted
 * with PQescapeIdentifier().
 */
class PostgreSQLSchemaProber : public SchemaProber {
public:
    explicit PostgreSQLSchemaProber(PostgreSQLConnection connection);

    std::string databaseName() override;

    std::vector<RelationInfo> listTables() override;
    std::vector<RelationInfo> listViews() override;

    std::vector<ColumnMeta> getColumns(const std::string& relation) override;
    std::vector<std::string> getPrimaryKeys(const std::string& table) override;
    std::vector<ForeignKeyMeta> getForeignKeys(const std::string& table) override;
    std::vector<ForeignKeyRow> getAllForeignKeys() override;
    std::vector<IndexMeta> getIndexes(const std::string& table) override;

    int64_t getRowCount(const std::string& table) override;
    std::string getTableSize(const std::string& table) override;

    ColumnStats getColumnStats(const std::string& table, const std::string& column) override;
    std::vector<SampleRow> getSampleRows(const std::string& relation, int limit) override;

    /**
     * @brief Round to two decimal places, as percentages are reported.
     */
    static double roundPercentage(double value);

    /**
     * @brief Fold per-column index rows into one IndexMeta per index.
     *
     * Expects rows of (index name, column, is unique, is primary, access
     * method) ordered by index name and column position.
     */
    static std::vector<IndexMeta> groupIndexRows(PostgreSQLResultSet& rows);

private:
    std::string qualifiedName(const std::string& relation) const;

    PostgreSQLConnection m_conn;
};

/**
 * @class PostgreSQLProberFactory
 * @brief Opens a fresh connection per extraction.
 *
 * The session is made read-only and given the configured statement_timeout
 * before the prober is handed out.
 */
class PostgreSQLProberFactory : public ProberFactory {
public:
    PostgreSQLProberFactory(ConnectionConfig connection, ExtractionConfig extraction);

    std::unique_ptr<SchemaProber> open() override;

private:
    ConnectionConfig m_connection;
    ExtractionConfig m_extraction;
};

}  // namespace querymind
