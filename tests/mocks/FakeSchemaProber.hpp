#pragma once

#include "ErrorHandler.hpp"
#include "QueryExecutor.hpp"
#include "SchemaProber.hpp"
#include "SqlGenerator.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace querymind::fakes {

// In-memory catalog served by FakeSchemaProber
struct FakeCatalog {
    std::string databaseName = "shop";
    std::vector<RelationInfo> tables;
    std::vector<RelationInfo> views;
    std::map<std::string, std::vector<ColumnMeta>> columns;
    std::map<std::string, std::vector<std::string>> primaryKeys;
    std::map<std::string, std::vector<ForeignKeyMeta>> foreignKeys;
    std::vector<ForeignKeyRow> allForeignKeys;
    std::map<std::string, std::vector<IndexMeta>> indexes;
    std::map<std::string, int64_t> rowCounts;
    std::map<std::string, std::string> sizes;
    std::map<std::string, ColumnStats> stats;  // "table.column"
    std::map<std::string, std::vector<SampleRow>> samples;

    // "relation/step" or "table.column/statistics" entries that throw
    std::set<std::string> failures;
    bool failListing = false;

    // Calls seen by every prober opened on this catalog
    std::vector<std::string> calls;
};

class FakeSchemaProber : public SchemaProber {
public:
    explicit FakeSchemaProber(FakeCatalog& catalog) : m_catalog(catalog) {}

    std::string databaseName() override { return m_catalog.databaseName; }

    std::vector<RelationInfo> listTables() override {
        record("listTables");
        if (m_catalog.failListing) {
            throw DatabaseException("42501", "permission denied for schema public");
        }
        return m_catalog.tables;
    }

    std::vector<RelationInfo> listViews() override {
        record("listViews");
        return m_catalog.views;
    }

    std::vector<ColumnMeta> getColumns(const std::string& relation) override {
        maybeFail(relation, "columns");
        return lookup(m_catalog.columns, relation);
    }

    std::vector<std::string> getPrimaryKeys(const std::string& table) override {
        maybeFail(table, "primary_keys");
        return lookup(m_catalog.primaryKeys, table);
    }

    std::vector<ForeignKeyMeta> getForeignKeys(const std::string& table) override {
        maybeFail(table, "foreign_keys");
        return lookup(m_catalog.foreignKeys, table);
    }

    std::vector<ForeignKeyRow> getAllForeignKeys() override {
        maybeFail("", "relationships");
        return m_catalog.allForeignKeys;
    }

    std::vector<IndexMeta> getIndexes(const std::string& table) override {
        maybeFail(table, "indexes");
        return lookup(m_catalog.indexes, table);
    }

    int64_t getRowCount(const std::string& table) override {
        maybeFail(table, "row_count");
        auto it = m_catalog.rowCounts.find(table);
        return it == m_catalog.rowCounts.end() ? 0 : it->second;
    }

    std::string getTableSize(const std::string& table) override {
        maybeFail(table, "table_size");
        auto it = m_catalog.sizes.find(table);
        return it == m_catalog.sizes.end() ? "8192 bytes" : it->second;
    }

    ColumnStats getColumnStats(const std::string& table, const std::string& column) override {
        maybeFail(table + "." + column, "statistics");
        auto it = m_catalog.stats.find(table + "." + column);
        return it == m_catalog.stats.end() ? ColumnStats{} : it->second;
    }

    std::vector<SampleRow> getSampleRows(const std::string& relation, int limit) override {
        maybeFail(relation, "sample_data");
        auto rows = lookup(m_catalog.samples, relation);
        if (static_cast<int>(rows.size()) > limit) {
            rows.resize(static_cast<size_t>(limit));
        }
        return rows;
    }

private:
    template <typename T>
    static T lookup(const std::map<std::string, T>& data, const std::string& key) {
        auto it = data.find(key);
        return it == data.end() ? T{} : it->second;
    }

    void record(const std::string& call) { m_catalog.calls.push_back(call); }

    void maybeFail(const std::string& relation, const std::string& step) {
        record(relation + "/" + step);
        if (m_catalog.failures.count(relation + "/" + step)) {
            throw DatabaseException("42703", step + " failed for " + relation);
        }
    }

    FakeCatalog& m_catalog;
};

// Counts opens; throws ConnectionError while `unreachable` is set
class FakeProberFactory : public ProberFactory {
public:
    explicit FakeProberFactory(FakeCatalog& catalog) : m_catalog(catalog) {}

    std::unique_ptr<SchemaProber> open() override {
        ++opens;
        if (unreachable) {
            throw ConnectionError("could not connect to server: Connection refused");
        }
        return std::make_unique<FakeSchemaProber>(m_catalog);
    }

    int opens = 0;
    bool unreachable = false;

private:
    FakeCatalog& m_catalog;
};

class FakeSqlGenerator : public SqlGenerator {
public:
    std::string generate(const std::string& question, const std::string& schemaText) override {
        lastQuestion = question;
        lastSchema = schemaText;
        ++calls;
        return reply;
    }

    std::string reply = "SELECT 1";
    std::string lastQuestion;
    std::string lastSchema;
    int calls = 0;
};

class FakeQueryExecutor : public QueryExecutor {
public:
    QueryResult execute(const ConnectionConfig& connection, const std::string& sql) override {
        lastConnection = connection;
        executed.push_back(sql);
        QueryResult result = canned;
        result.sql = sql;
        return result;
    }

    QueryResult canned;
    ConnectionConfig lastConnection;
    std::vector<std::string> executed;
};

// users/orders catalog used across the extractor, formatter and service tests
inline FakeCatalog shopCatalog() {
    FakeCatalog catalog;

    catalog.tables = {
        {"orders", "BASE TABLE", std::nullopt, ""},
        {"users", "BASE TABLE", std::string("Registered customers"), ""},
    };
    catalog.views = {
        {"active_users", "VIEW", std::nullopt, " SELECT users.id,\n    users.email\n   FROM users;"},
    };

    ColumnMeta id{"id", "integer", std::nullopt, 32, 0, false,
                  std::string("nextval('users_id_seq'::regclass)"), std::nullopt, 1};
    ColumnMeta email{"email", "character varying", 255, std::nullopt, std::nullopt, false,
                     std::nullopt, std::string("Login address"), 2};
    ColumnMeta order_id{"id", "integer", std::nullopt, 32, 0, false, std::nullopt, std::nullopt, 1};
    ColumnMeta user_id{"user_id", "integer", std::nullopt, 32, 0, true, std::nullopt, std::nullopt, 2};
    ColumnMeta total{"total", "numeric", std::nullopt, 10, 2, true, std::nullopt, std::nullopt, 3};

    catalog.columns["users"] = {id, email};
    catalog.columns["orders"] = {order_id, user_id, total};
    catalog.columns["active_users"] = {
        {"id", "integer", std::nullopt, 32, 0, true, std::nullopt, std::nullopt, 1},
        {"email", "character varying", 255, std::nullopt, std::nullopt, true, std::nullopt, std::nullopt, 2},
    };

    catalog.primaryKeys["users"] = {"id"};
    catalog.primaryKeys["orders"] = {"id"};

    catalog.foreignKeys["orders"] = {
        {"user_id", "users", "id", "orders_user_id_fkey",
         ReferentialAction::NoAction, ReferentialAction::Cascade},
    };
    catalog.allForeignKeys = {{"orders", "user_id", "users", "id"}};

    catalog.indexes["users"] = {
        {"users_pkey", {"id"}, true, true, "btree"},
        {"users_email_key", {"email"}, true, false, "btree"},
    };
    catalog.indexes["orders"] = {
        {"orders_pkey", {"id"}, true, true, "btree"},
        {"orders_user_id_idx", {"user_id"}, false, false, "btree"},
    };

    catalog.rowCounts["users"] = 1500;
    catalog.rowCounts["orders"] = 4200;
    catalog.sizes["users"] = "160 kB";
    catalog.sizes["orders"] = "432 kB";

    catalog.stats["users.id"] = {0, 0.0, 1500, 100.0, std::nullopt};
    catalog.stats["users.email"] = {0, 0.0, 1500, 100.0, std::nullopt};
    catalog.stats["orders.id"] = {0, 0.0, 4200, 100.0, std::nullopt};
    catalog.stats["orders.user_id"] = {42, 1.0, 900, 21.43, std::nullopt};
    catalog.stats["orders.total"] = {0, 0.0, 3100, 73.81, std::nullopt};

    SampleRow alice = SampleRow::object();
    alice["id"] = 1;
    alice["email"] = "alice@example.com";
    SampleRow bob = SampleRow::object();
    bob["id"] = 2;
    bob["email"] = "bob@example.com";
    catalog.samples["users"] = {alice, bob};
    catalog.samples["active_users"] = {alice};

    SampleRow order = SampleRow::object();
    order["id"] = 10;
    order["user_id"] = 1;
    order["total"] = "19.99";
    catalog.samples["orders"] = {order};

    return catalog;
}

}  // namespace querymind::fakes
