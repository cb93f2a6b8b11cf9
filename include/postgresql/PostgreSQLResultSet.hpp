#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief RAII wrapper for PostgreSQL query results.
 *
 * This file provides a high-level interface for working with PostgreSQL
 * query results (PGresult*), handling automatic cleanup and providing
 * convenient access to column values and metadata.
 */

#include <libpq-fe.h>
#include <optional>
#include <string>
#include <vector>

namespace querymind {

/**
 * @class PostgreSQLResultSet
 * @brief RAII wrapper for PostgreSQL query results.
 *
 * PostgreSQLResultSet manages a PGresult* handle, providing methods to
 * access row/column data and metadata. The result is automatically
 * cleared (PQclear) when the wrapper is destroyed.
 *
 * PostgreSQL loads the entire result into memory at once. This class
 * provides two access patterns:
 * 1. Direct access: getValue(row, col) for random access
 * 2. Iterator-style: fetchRow() + getField(col) for sequential access
 *
 * Usage:
 * @code
 *   auto result = conn.executeParams("SELECT column_name FROM ... WHERE table_name = $1", {name});
 *   while (result.fetchRow()) {
 *       std::string column = result.getString(0);
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; each thread should have its own result set.
 */
class PostgreSQLResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res PGresult handle to manage (takes ownership), or nullptr.
     */
    explicit PostgreSQLResultSet(PGresult* res = nullptr);

    /**
     * @brief Destructor - clears the result if still owned.
     */
    ~PostgreSQLResultSet();

    // Non-copyable
    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;

    // Movable
    PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept;
    PostgreSQLResultSet& operator=(PostgreSQLResultSet&& other) noexcept;

    /**
     * @brief Get the underlying PGresult handle.
     * @return Raw PGresult* pointer (still owned by this object).
     */
    PGresult* get() const { return m_res; }

    // ----- Status checking -----

    /**
     * @brief Check if the result status indicates success.
     * @return true if status is PGRES_TUPLES_OK or PGRES_COMMAND_OK.
     */
    bool isOk() const;

    /**
     * @brief Check if the result contains data rows.
     * @return true if status is PGRES_TUPLES_OK.
     *
     * Note: A SELECT with no matching rows still returns TUPLES_OK
     * but with numRows() == 0.
     */
    bool hasData() const;

    /**
     * @brief Get the error message if the query failed.
     * @return Error message string, or empty if no error.
     */
    const char* errorMessage() const;

    /**
     * @brief Five-character SQLSTATE of a failed result.
     * @return SQLSTATE, or empty string when libpq did not report one.
     */
    std::string sqlState() const;

    // ----- Row and column counts -----

    int numFields() const;
    int numRows() const;

    // ----- Direct value access -----

    /**
     * @brief Get a value at a specific row and column.
     * @param row Zero-based row index.
     * @param col Zero-based column index.
     * @return Value as C string, or nullptr if NULL or out of range.
     */
    const char* getValue(int row, int col) const;

    /**
     * @brief Check if a value is NULL.
     * @param row Zero-based row index.
     * @param col Zero-based column index.
     * @return true if the value is NULL.
     */
    bool isNull(int row, int col) const;

    // ----- Column metadata -----

    /**
     * @brief Get a column name by index.
     * @param col Zero-based column index.
     * @return Column name.
     */
    const char* fieldName(int col) const;

    /**
     * @brief Get a column's type Oid.
     * @param col Zero-based column index.
     * @return PostgreSQL type Oid.
     *
     * Common Oids: 16=bool, 23=int4, 25=text, 1043=varchar
     */
    Oid fieldType(int col) const;

    /**
     * @brief Get all column names as a vector.
     * @return Vector of column name strings.
     */
    std::vector<std::string> getColumnNames() const;

    // ----- Iterator-style access -----

    /**
     * @brief Advance to the next row.
     * @return true if a row is available, false when past last row.
     *
     * Call before accessing fields with getField(). The first call
     * positions on row 0.
     */
    bool fetchRow();

    /**
     * @brief Get a field from the current row.
     * @param col Zero-based column index.
     * @return Field value as C string, or nullptr if NULL.
     */
    const char* getField(int col) const;

    /**
     * @brief Check if a field in the current row is NULL.
     */
    bool isFieldNull(int col) const;

    /**
     * @brief Current-row field as a string; empty when NULL.
     */
    std::string getString(int col) const;

    /**
     * @brief Current-row field as text; nullopt when NULL.
     */
    std::optional<std::string> getOptionalString(int col) const;

    /**
     * @brief Current-row field parsed as an integer; nullopt when NULL or not numeric.
     */
    std::optional<int64_t> getOptionalInt(int col) const;

    /**
     * @brief Current-row boolean field ("t"/"true"); false when NULL.
     */
    bool getBool(int col) const;

private:
    PGresult* m_res;        ///< PostgreSQL result handle (owned)
    int m_currentRow = -1;  ///< Current row for iterator-style access
};

}  // namespace querymind
