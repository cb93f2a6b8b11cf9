#include "PostgreSQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace querymind {

namespace {

std::string quoteConnValue(const std::string& value) {
    std::string result = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') result += '\\';
        result += c;
    }
    result += "'";
    return result;
}

}  // namespace

std::string PostgreSQLConnection::buildConnInfo(const ConnectionConfig& config,
                                                const std::string& application_name) {
    std::ostringstream connInfo;

    connInfo << "host=" << quoteConnValue(config.host);
    connInfo << " port=" << config.port;

    if (!config.user.empty()) {
        connInfo << " user=" << quoteConnValue(config.user);
    }

    if (!config.password.empty()) {
        connInfo << " password=" << quoteConnValue(config.password);
    }

    if (!config.database.empty()) {
        connInfo << " dbname=" << quoteConnValue(config.database);
    }

    // libpq takes whole seconds; anything below 2 is raised to 2 by libpq itself
    auto timeout_s = config.connect_timeout.count() / 1000;
    connInfo << " connect_timeout=" << (timeout_s > 0 ? timeout_s : 1);

    connInfo << " sslmode=" << quoteConnValue(config.sslmode.empty() ? "prefer" : config.sslmode);

    // Application name for identification
    connInfo << " application_name=" << quoteConnValue(application_name);

    return connInfo.str();
}

PostgreSQLConnection::PostgreSQLConnection(const ConnectionConfig& config,
                                           const std::string& application_name) {
    m_conn = PQconnectdb(buildConnInfo(config, application_name).c_str());

    if (!m_conn) {
        throw ConnectionError("Failed to allocate PostgreSQL connection");
    }

    if (PQstatus(m_conn) != CONNECTION_OK) {
        std::string errorMsg = PQerrorMessage(m_conn);
        close();
        throw ConnectionError("Failed to connect to PostgreSQL at " + config.host + ":" +
                              std::to_string(config.port) + ": " + errorMsg);
    }

    // Set client encoding to UTF-8
    PQsetClientEncoding(m_conn, "UTF8");

    spdlog::debug("Connected to PostgreSQL {}:{}/{}", config.host, config.port, databaseName());
}

PostgreSQLConnection::~PostgreSQLConnection() {
    close();
}

PostgreSQLConnection::PostgreSQLConnection(PostgreSQLConnection&& other) noexcept
    : m_conn(other.m_conn) {
    other.m_conn = nullptr;
}

PostgreSQLConnection& PostgreSQLConnection::operator=(PostgreSQLConnection&& other) noexcept {
    if (this != &other) {
        close();
        m_conn = other.m_conn;
        other.m_conn = nullptr;
    }
    return *this;
}

void PostgreSQLConnection::close() {
    if (m_conn) {
        PQfinish(m_conn);
        m_conn = nullptr;
    }
}

bool PostgreSQLConnection::isValid() const {
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

PostgreSQLResultSet PostgreSQLConnection::checkResult(PGresult* res, const std::string& sql) {
    PostgreSQLResultSet result(res);

    if (result.isOk()) {
        return result;
    }

    std::string sql_state = result.sqlState();
    std::string message = res ? result.errorMessage() : error();
    while (!message.empty() && (message.back() == '\n' || message.back() == ' ')) {
        message.pop_back();
    }

    if (!isValid()) {
        throw ConnectionError("Lost connection to PostgreSQL: " + message);
    }

    spdlog::debug("Query failed [{}] {}: {}", sql_state, ErrorHandler::describe(sql_state),
                  sql.substr(0, 120));
    ErrorHandler::raise(sql_state, message);
}

PostgreSQLResultSet PostgreSQLConnection::execute(const std::string& sql) {
    if (!isValid()) {
        throw ConnectionError("PostgreSQL connection is not open");
    }
    return checkResult(PQexec(m_conn, sql.c_str()), sql);
}

PostgreSQLResultSet PostgreSQLConnection::executeParams(const std::string& sql,
                                                        const std::vector<std::string>& params) {
    if (!isValid()) {
        throw ConnectionError("PostgreSQL connection is not open");
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p.c_str());
    }

    return checkResult(PQexecParams(m_conn, sql.c_str(), static_cast<int>(values.size()),
                                    nullptr, values.data(), nullptr, nullptr, 0),
                       sql);
}

void PostgreSQLConnection::setStatementTimeout(std::chrono::milliseconds timeout) {
    executeParams("SELECT set_config('statement_timeout', $1, false)",
                  {std::to_string(timeout.count())});
}

const char* PostgreSQLConnection::error() const {
    if (!m_conn) return "No connection";
    return PQerrorMessage(m_conn);
}

std::string PostgreSQLConnection::databaseName() const {
    if (!m_conn) return "";
    const char* db = PQdb(m_conn);
    return db ? db : "";
}

std::string PostgreSQLConnection::serverVersion() {
    auto result = execute("SELECT version()");
    if (result.fetchRow() && result.getField(0)) {
        return result.getField(0);
    }
    return "";
}

std::string PostgreSQLConnection::escapeIdentifier(const std::string& identifier) const {
    if (m_conn) {
        char* escaped = PQescapeIdentifier(m_conn, identifier.c_str(), identifier.size());
        if (escaped) {
            std::string result(escaped);
            PQfreemem(escaped);
            return result;
        }
    }

    // Same rule PQescapeIdentifier applies: wrap in quotes, double embedded quotes
    std::string result = "\"";
    for (char c : identifier) {
        if (c == '"') result += "\"\"";
        else result += c;
    }
    result += "\"";
    return result;
}

ConnectionTestResult testConnection(const ConnectionConfig& config) {
    ConnectionConfig probe = config;
    probe.connect_timeout = std::min(config.connect_timeout, std::chrono::milliseconds(5000));

    ConnectionTestResult result;
    try {
        PostgreSQLConnection conn(probe, "querymind-test");
        result.serverVersion = conn.serverVersion();
        result.success = true;
        result.message = "Connection successful";
    } catch (const DatabaseException& e) {
        result.message = e.what();
    }
    return result;
}

}  // namespace querymind
