#pragma once

#include <string>
#include <stdexcept>

namespace querymind {

// SQLSTATE classification for libpq errors
class ErrorHandler {
public:
    // Class 08 (connection exception) and the libpq-side "no connection" state
    static bool isConnectionError(const std::string& sqlState);

    // 57014 query_canceled, raised when statement_timeout fires
    static bool isTimeout(const std::string& sqlState);

    // Get human-readable description of a SQLSTATE
    static std::string describe(const std::string& sqlState);

    // Throw ConnectionError for connection-class states, DatabaseException otherwise
    [[noreturn]] static void raise(const std::string& sqlState, const std::string& message);

    static constexpr const char* STATE_CONNECTION_FAILURE = "08006";
    static constexpr const char* STATE_QUERY_CANCELED = "57014";
    static constexpr const char* STATE_UNDEFINED_TABLE = "42P01";
    static constexpr const char* STATE_UNDEFINED_COLUMN = "42703";
    static constexpr const char* STATE_INSUFFICIENT_PRIVILEGE = "42501";
};

// RAII wrapper for setting/clearing error context
class ErrorContext {
public:
    ErrorContext(const std::string& context);
    ~ErrorContext();

    static std::string current();

private:
    static thread_local std::string s_currentContext;
    std::string m_previous;
};

// Exception for PostgreSQL errors
class DatabaseException : public std::runtime_error {
public:
    DatabaseException(std::string sqlState, const std::string& message);

    const std::string& sqlState() const { return m_sqlState; }
    bool isTimeout() const { return ErrorHandler::isTimeout(m_sqlState); }

private:
    std::string m_sqlState;
};

// Could not reach or authenticate against the database
class ConnectionError : public DatabaseException {
public:
    explicit ConnectionError(const std::string& message);
    ConnectionError(std::string sqlState, const std::string& message);
};

// Snapshot cache could not be persisted
class CacheError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Generated SQL rejected by the safety gate
class UnsafeQueryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The language model call failed or returned nothing usable
class GenerationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connection profile store failures (unknown profile, unreadable store)
class ProfileError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace querymind
