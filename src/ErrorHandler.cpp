#include "ErrorHandler.hpp"
#include <sqlite3.h>

namespace sqlquery {

thread_local std::string ErrorContext::s_currentContext;

ErrorKind ErrorHandler::classifySqlState(const std::string& sqlState) {
    if (sqlState.size() != 5) {
        return ErrorKind::Other;
    }

    // Exact codes first
    if (sqlState == "57014") return ErrorKind::Cancelled;        // query_canceled
    if (sqlState == "40P01") return ErrorKind::Busy;             // deadlock_detected
    if (sqlState == "55P03") return ErrorKind::Busy;             // lock_not_available
    if (sqlState == "42P01") return ErrorKind::NotFound;         // undefined_table
    if (sqlState == "42703") return ErrorKind::NotFound;         // undefined_column
    if (sqlState == "0A000") return ErrorKind::Unsupported;      // feature_not_supported

    std::string errorClass = sqlState.substr(0, 2);

    // Connection exception
    if (errorClass == "08") return ErrorKind::Connection;
    // Integrity constraint violation
    if (errorClass == "23") return ErrorKind::Constraint;
    // Syntax error or access rule violation
    if (errorClass == "42") return ErrorKind::Syntax;
    // Transaction rollback (serialization failure etc.)
    if (errorClass == "40") return ErrorKind::Busy;
    // Operator intervention (admin shutdown, crash)
    if (errorClass == "57") return ErrorKind::Connection;

    return ErrorKind::Other;
}

ErrorKind ErrorHandler::classifySqlite(int resultCode) {
    // Extended codes carry the primary code in the low byte
    switch (resultCode & 0xff) {
        case SQLITE_CONSTRAINT:
            return ErrorKind::Constraint;

        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return ErrorKind::Busy;

        case SQLITE_INTERRUPT:
            return ErrorKind::Cancelled;

        case SQLITE_CANTOPEN:
        case SQLITE_NOTADB:
            return ErrorKind::Connection;

        case SQLITE_ERROR:
            return ErrorKind::Syntax;

        case SQLITE_MISUSE:
        case SQLITE_RANGE:
            return ErrorKind::Unsupported;

        default:
            return ErrorKind::Other;
    }
}

const char* ErrorHandler::kindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection: return "connection";
        case ErrorKind::Constraint: return "constraint";
        case ErrorKind::Syntax: return "syntax";
        case ErrorKind::NotFound: return "not found";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Unsupported: return "unsupported";
        case ErrorKind::Busy: return "busy";
        case ErrorKind::Other: return "other";
    }
    return "other";
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

DatabaseException::DatabaseException(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , m_kind(kind) {
}

PostgreSQLException::PostgreSQLException(const std::string& sqlState, const std::string& message)
    : DatabaseException(ErrorHandler::classifySqlState(sqlState), message)
    , m_sqlState(sqlState) {
}

SQLiteException::SQLiteException(int errorCode, const std::string& message)
    : DatabaseException(ErrorHandler::classifySqlite(errorCode), message)
    , m_errorCode(errorCode) {
}

}  // namespace sqlquery
