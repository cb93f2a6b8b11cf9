#pragma once

#include "QueryExecutor.hpp"

namespace querymind {

// Runs each statement in its own connection inside BEGIN READ ONLY with a
// transaction-local statement_timeout. The transaction is always rolled back.
class PostgreSQLQueryExecutor : public QueryExecutor {
public:
    explicit PostgreSQLQueryExecutor(QueryConfig config);

    QueryResult execute(const ConnectionConfig& connection, const std::string& sql) override;

private:
    QueryConfig m_config;
};

}  // namespace querymind
