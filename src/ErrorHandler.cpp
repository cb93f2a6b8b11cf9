#include "ErrorHandler.hpp"
#include <utility>

namespace querymind {

thread_local std::string ErrorContext::s_currentContext;

namespace {

std::string stateClass(const std::string& sqlState) {
    return sqlState.size() >= 2 ? sqlState.substr(0, 2) : sqlState;
}

}  // namespace

bool ErrorHandler::isConnectionError(const std::string& sql_state) {
    if (sql_state.empty()) {
        // libpq reports no SQLSTATE when the socket itself is gone
        return false;
    }
    return stateClass(sql_state) == "08" ||
           sql_state == "57P01" ||  // admin_shutdown
           sql_state == "57P02" ||  // crash_shutdown
           sql_state == "57P03" ||  // cannot_connect_now
           sql_state == "28000" ||  // invalid_authorization_specification
           sql_state == "28P01";    // invalid_password
}

bool ErrorHandler::isTimeout(const std::string& sql_state) {
    return sql_state == STATE_QUERY_CANCELED ||
           sql_state == "55P03";  // lock_not_available
}

std::string ErrorHandler::describe(const std::string& sql_state) {
    if (sql_state.empty()) {
        return "Unknown error";
    }
    if (sql_state == STATE_QUERY_CANCELED) {
        return "Statement timeout";
    }
    if (sql_state == STATE_UNDEFINED_TABLE) {
        return "Relation does not exist";
    }
    if (sql_state == STATE_UNDEFINED_COLUMN) {
        return "Column does not exist";
    }
    if (sql_state == STATE_INSUFFICIENT_PRIVILEGE) {
        return "Permission denied";
    }
    if (sql_state == "28P01" || sql_state == "28000") {
        return "Authentication failed";
    }
    if (sql_state == "40P01") {
        return "Deadlock detected";
    }
    if (sql_state == "25006") {
        return "Write attempted in a read-only transaction";
    }

    auto cls = stateClass(sql_state);
    if (cls == "08") return "Connection exception";
    if (cls == "42") return "Syntax error or access rule violation";
    if (cls == "22") return "Data exception";
    if (cls == "53") return "Insufficient resources";
    if (cls == "57") return "Operator intervention";
    return "PostgreSQL error " + sql_state;
}

void ErrorHandler::raise(const std::string& sql_state, const std::string& message) {
    if (isConnectionError(sql_state)) {
        throw ConnectionError(sql_state, message);
    }
    throw DatabaseException(sql_state, message);
}

ErrorContext::ErrorContext(const std::string& context)
    : m_previous(s_currentContext) {
    if (s_currentContext.empty()) {
        s_currentContext = context;
    } else {
        s_currentContext = s_currentContext + " > " + context;
    }
}

ErrorContext::~ErrorContext() {
    s_currentContext = m_previous;
}

std::string ErrorContext::current() {
    return s_currentContext;
}

DatabaseException::DatabaseException(std::string sql_state, const std::string& message)
    : std::runtime_error(message)
    , m_sqlState(std::move(sql_state)) {
}

ConnectionError::ConnectionError(const std::string& message)
    : DatabaseException(ErrorHandler::STATE_CONNECTION_FAILURE, message) {
}

ConnectionError::ConnectionError(std::string sql_state, const std::string& message)
    : DatabaseException(std::move(sql_state), message) {
}

}  // namespace querymind
