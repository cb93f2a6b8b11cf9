#include "PostgreSQLQueryExecutor.hpp"
#include "ErrorHandler.hpp"
#include "PostgreSQLConnection.hpp"
#include "PostgreSQLFormatConverter.hpp"
#include <spdlog/spdlog.h>

namespace querymind {

PostgreSQLQueryExecutor::PostgreSQLQueryExecutor(QueryConfig config)
    : m_config(std::move(config)) {
}

QueryResult PostgreSQLQueryExecutor::execute(const ConnectionConfig& connection,
                                             const std::string& sql) {
    ErrorContext ctx("query");
    PostgreSQLConnection conn(connection, "querymind-query");

    conn.execute("BEGIN READ ONLY");

    QueryResult result;
    result.sql = sql;

    try {
        // SET LOCAL: the timeout ends with the transaction
        conn.executeParams("SELECT set_config('statement_timeout', $1, true)",
                           {std::to_string(m_config.statement_timeout.count())});

        auto rs = conn.execute(sql);
        result.columns = rs.getColumnNames();
        result.rows = PostgreSQLFormatConverter::toRows(rs, m_config.max_rows);
        result.rowCount = result.rows.size();
        result.truncated = static_cast<size_t>(rs.numRows()) > result.rows.size();
    } catch (const DatabaseException& e) {
        if (e.isTimeout()) {
            spdlog::warn("Query cancelled after {} ms", m_config.statement_timeout.count());
        }
        // Closing the connection aborts the open transaction
        throw;
    }

    conn.execute("ROLLBACK");

    if (result.truncated) {
        spdlog::info("Result truncated to {} rows", m_config.max_rows);
    }
    spdlog::debug("Query returned {} rows", result.rowCount);

    return result;
}

}  // namespace querymind
