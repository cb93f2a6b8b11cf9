#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief RAII owner of a single PostgreSQL connection.
 *
 * Each metadata extraction and each query execution opens its own
 * connection and closes it on scope exit. There is no pooling; the
 * connection lives exactly as long as the PostgreSQLConnection object.
 */

#include "Config.hpp"
#include "PostgreSQLResultSet.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <string>
#include <vector>

namespace querymind {

/**
 * @class PostgreSQLConnection
 * @brief RAII wrapper for a PGconn handle.
 *
 * The constructor connects with PQconnectdb() and throws ConnectionError
 * when the server cannot be reached or rejects the credentials. The
 * destructor calls PQfinish().
 *
 * PostgreSQL libpq API Usage:
 * - PQexec() for fixed catalog queries
 * - PQexecParams() for queries with bound values ($1, $2, ...)
 * - PQescapeIdentifier() for table and column names placed in SQL text
 * - PQresultErrorField(PG_DIAG_SQLSTATE) for error classification
 *
 * Thread Safety:
 * - A connection must not be shared between threads.
 */
class PostgreSQLConnection {
public:
    /**
     * @brief Connect to the server described by @p config.
     * @param config Host, port, database, credentials and timeouts.
     * @param applicationName Reported in pg_stat_activity.
     * @throws ConnectionError if the connection cannot be established.
     */
    explicit PostgreSQLConnection(const ConnectionConfig& config,
                                  const std::string& applicationName = "querymind");

    /**
     * @brief Destructor - closes the connection.
     */
    ~PostgreSQLConnection();

    // Non-copyable (connection ownership semantics)
    PostgreSQLConnection(const PostgreSQLConnection&) = delete;
    PostgreSQLConnection& operator=(const PostgreSQLConnection&) = delete;

    // Movable (transfer ownership)
    PostgreSQLConnection(PostgreSQLConnection&& other) noexcept;
    PostgreSQLConnection& operator=(PostgreSQLConnection&& other) noexcept;

    /**
     * @brief Get the underlying PGconn handle.
     * @return Raw PGconn* pointer (still owned by this wrapper).
     */
    PGconn* get() const { return m_conn; }

    /**
     * @brief Check if the connection is valid.
     * @return true if connection is established and not in error state.
     */
    bool isValid() const;

    /**
     * @brief Execute a SQL statement.
     * @param sql The SQL statement to execute.
     * @return Result set holding PGRES_TUPLES_OK or PGRES_COMMAND_OK.
     * @throws DatabaseException carrying the SQLSTATE on failure.
     */
    PostgreSQLResultSet execute(const std::string& sql);

    /**
     * @brief Execute a parameterized SQL statement.
     * @param sql SQL statement with $1, $2, etc. placeholders.
     * @param params Parameter values, passed as text.
     * @return Result set holding PGRES_TUPLES_OK or PGRES_COMMAND_OK.
     * @throws DatabaseException carrying the SQLSTATE on failure.
     *
     * Parameterized queries keep values out of the SQL text. Use this for
     * every relation name lookup and row limit.
     */
    PostgreSQLResultSet executeParams(const std::string& sql,
                                      const std::vector<std::string>& params);

    /**
     * @brief Set statement_timeout for the rest of the session.
     * @param timeout Zero disables the timeout.
     *
     * A statement that runs past the timeout fails with SQLSTATE 57014.
     */
    void setStatementTimeout(std::chrono::milliseconds timeout);

    /**
     * @brief Get the last error message.
     * @return Error message string from PQerrorMessage().
     */
    const char* error() const;

    /**
     * @brief Name of the database this connection is attached to.
     */
    std::string databaseName() const;

    /**
     * @brief Server version string (SELECT version()).
     */
    std::string serverVersion();

    /**
     * @brief Escape an identifier (table name, column name).
     * @param identifier The identifier to escape.
     * @return Escaped identifier wrapped in double quotes.
     *
     * Uses PQescapeIdentifier() which properly handles double quotes
     * and unicode characters in identifiers.
     */
    std::string escapeIdentifier(const std::string& identifier) const;

    /**
     * @brief Build a libpq connection string from @p config.
     *
     * Values are single-quoted with backslash escaping as libpq expects.
     */
    static std::string buildConnInfo(const ConnectionConfig& config,
                                     const std::string& applicationName);

private:
    PostgreSQLResultSet checkResult(PGresult* res, const std::string& sql);
    void close();

    PGconn* m_conn = nullptr;  ///< PostgreSQL connection handle
};

struct ConnectionTestResult {
    bool success = false;
    std::string message;
    std::string serverVersion;
};

/**
 * @brief Connect with a short timeout and run SELECT version().
 * @param config Connection settings; connect_timeout is capped at 5 seconds.
 * @return Outcome with the server version on success or the error text.
 *
 * Never throws for connection or query failures; they are reported in
 * the result.
 */
ConnectionTestResult testConnection(const ConnectionConfig& config);

}  // namespace querymind
