#include "PostgreSQLFormatConverter.hpp"
#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace querymind {

// PostgreSQL OID constants for common types
constexpr Oid BOOLOID = 16;
constexpr Oid INT2OID = 21;
constexpr Oid INT4OID = 23;
constexpr Oid INT8OID = 20;
constexpr Oid FLOAT4OID = 700;
constexpr Oid FLOAT8OID = 701;
constexpr Oid NUMERICOID = 1700;

bool PostgreSQLFormatConverter::isNumericType(Oid type) {
    return type == INT2OID || type == INT4OID || type == INT8OID ||
           type == FLOAT4OID || type == FLOAT8OID || type == NUMERICOID;
}

bool PostgreSQLFormatConverter::isBooleanType(Oid type) {
    return type == BOOLOID;
}

nlohmann::ordered_json PostgreSQLFormatConverter::convertValue(const std::string& value, Oid type) {
    if (isBooleanType(type)) {
        return value == "t" || value == "true" || value == "1";
    }

    // Values that do not parse are kept as text
    if (type == INT2OID || type == INT4OID || type == INT8OID) {
        int64_t parsed = 0;
        auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), parsed);
        if (ec == std::errc() && end == value.data() + value.size()) {
            return parsed;
        }
    } else if (type == FLOAT4OID || type == FLOAT8OID) {
        errno = 0;
        char* end = nullptr;
        double parsed = std::strtod(value.c_str(), &end);
        if (errno == 0 && end == value.c_str() + value.size() && std::isfinite(parsed)) {
            return parsed;
        }
    }

    return value;
}

nlohmann::ordered_json PostgreSQLFormatConverter::rowToJSON(const PostgreSQLResultSet& result) {
    nlohmann::ordered_json obj = nlohmann::ordered_json::object();

    int num_fields = result.numFields();
    for (int col = 0; col < num_fields; ++col) {
        const char* name = result.fieldName(col);
        std::string key = name ? name : "";

        if (result.isFieldNull(col)) {
            obj[key] = nullptr;
        } else {
            obj[key] = convertValue(result.getField(col), result.fieldType(col));
        }
    }

    return obj;
}

std::vector<nlohmann::ordered_json> PostgreSQLFormatConverter::toRows(PostgreSQLResultSet& result,
                                                                      size_t maxRows) {
    std::vector<nlohmann::ordered_json> rows;
    if (!result.hasData()) {
        return rows;
    }

    rows.reserve(maxRows > 0 ? std::min(maxRows, static_cast<size_t>(result.numRows()))
                             : static_cast<size_t>(result.numRows()));
    while ((maxRows == 0 || rows.size() < maxRows) && result.fetchRow()) {
        rows.push_back(rowToJSON(result));
    }

    return rows;
}

}  // namespace querymind
