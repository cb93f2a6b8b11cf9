#pragma once

#include "Config.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace querymind {

struct QueryResult {
    std::string sql;
    std::vector<std::string> columns;
    std::vector<nlohmann::ordered_json> rows;
    size_t rowCount = 0;
    bool truncated = false;  // more rows existed than max_rows
};

// Runs an already-checked statement and returns its rows
class QueryExecutor {
public:
    virtual ~QueryExecutor() = default;

    // Throws DatabaseException (ConnectionError when the server is unreachable)
    virtual QueryResult execute(const ConnectionConfig& connection, const std::string& sql) = 0;
};

}  // namespace querymind
