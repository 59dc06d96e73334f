#pragma once

#include <stdexcept>
#include <string>

namespace sqlquery {

// Coarse classification of database failures
enum class ErrorKind {
    Connection,
    Constraint,
    Syntax,
    NotFound,
    Timeout,
    Cancelled,
    Unsupported,
    Busy,
    Other
};

// Driver error codes to ErrorKind mapping
class ErrorHandler {
public:
    // Classify a PostgreSQL SQLSTATE (five characters)
    static ErrorKind classifySqlState(const std::string& sqlState);

    // Classify an SQLite (extended) result code
    static ErrorKind classifySqlite(int resultCode);

    // Check if error indicates connection issue
    static bool isConnectionError(ErrorKind kind) { return kind == ErrorKind::Connection; }

    // Human-readable kind name
    static const char* kindName(ErrorKind kind);
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

// Base exception for every failure raised by the library
class DatabaseException : public std::runtime_error {
public:
    DatabaseException(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// Exception for PostgreSQL errors
class PostgreSQLException : public DatabaseException {
public:
    PostgreSQLException(const std::string& sqlState, const std::string& message);

    const std::string& sqlState() const { return m_sqlState; }

private:
    std::string m_sqlState;
};

// Exception for SQLite errors
class SQLiteException : public DatabaseException {
public:
    SQLiteException(int errorCode, const std::string& message);

    int errorCode() const { return m_errorCode; }

private:
    int m_errorCode;
};

}  // namespace sqlquery
