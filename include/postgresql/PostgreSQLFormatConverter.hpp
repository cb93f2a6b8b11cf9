#pragma once

/**
 * @file PostgreSQLFormatConverter.hpp
 * @brief Conversion of PostgreSQL result rows to JSON objects.
 *
 * Sample rows in a metadata snapshot and rows returned by the query
 * executor are both produced here, so the two render values the same way.
 */

#include "PostgreSQLResultSet.hpp"
#include <libpq-fe.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace querymind {

/**
 * @class PostgreSQLFormatConverter
 * @brief Static utility class turning PGresult rows into ordered JSON objects.
 *
 * Each row becomes an object whose keys follow the SELECT column order.
 * Values are typed from the column Oid:
 * - INT2, INT4, INT8: JSON integer
 * - FLOAT4, FLOAT8: JSON number (NaN and Infinity stay strings)
 * - BOOL: JSON boolean
 * - NUMERIC: string, so no precision is lost
 * - everything else: the server's text representation
 * - SQL NULL: JSON null
 */
class PostgreSQLFormatConverter {
public:
    /**
     * @brief Convert the remaining rows of a result set to JSON objects.
     * @param result Result set; its row cursor is advanced past every converted row.
     * @param maxRows Stop after this many rows; 0 means no limit.
     * @return Rows in result order; empty if the result holds no tuples.
     */
    static std::vector<nlohmann::ordered_json> toRows(PostgreSQLResultSet& result,
                                                      size_t maxRows = 0);

    /**
     * @brief Convert the current row of a result set to a JSON object.
     */
    static nlohmann::ordered_json rowToJSON(const PostgreSQLResultSet& result);

    /**
     * @brief Type a single text value according to its column Oid.
     */
    static nlohmann::ordered_json convertValue(const std::string& value, Oid type);

    /**
     * @brief Check if a PostgreSQL type Oid is numeric.
     *
     * Numeric types: INT2, INT4, INT8, FLOAT4, FLOAT8, NUMERIC
     */
    static bool isNumericType(Oid type);

    /**
     * @brief Check if a PostgreSQL type Oid is boolean (Oid 16).
     */
    static bool isBooleanType(Oid type);
};

}  // namespace querymind
