/**
 * @file SQLiteConnection.cpp
 * @brief Implementation of the SQLite connection.
 *
 * Implements the SQLiteConnection class which provides a safe wrapper around
 * sqlite3 database handles with automatic resource management.
 */

#include "SQLiteConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlquery {

namespace {

// Wait on locked database files before reporting SQLITE_BUSY
constexpr int kBusyTimeoutMs = 5000;

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteConnection::SQLiteConnection(std::string name, const std::string& dbPath, bool foreignKeys)
    : Connection(std::move(name), "sqlite"), m_path(dbPath) {
    int rc = sqlite3_open_v2(dbPath.c_str(), &m_db,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                             SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
        spdlog::error("Failed to open SQLite database '{}': {}", dbPath, message);
        if (m_db) {
            sqlite3_close(m_db);
            m_db = nullptr;
        }
        throw SQLiteException(rc, message);
    }

    sqlite3_extended_result_codes(m_db, 1);
    sqlite3_busy_timeout(m_db, kBusyTimeoutMs);

    if (foreignKeys) {
        executeScript("PRAGMA foreign_keys = ON");
    }

    spdlog::info("Opened SQLite database [{}] at '{}'", this->name(), dbPath);
}

SQLiteConnection::~SQLiteConnection() {
    close();
}

// ============================================================================
// Query Execution
// ============================================================================

ResultSetPtr SQLiteConnection::queryContext(const QueryContext& ctx, const std::string& sql,
                                            const Bindings& bindings) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureOpen();
    ctx.check();

    auto results = std::make_unique<SQLiteResultSet>(prepare(sql), ctx);
    bind(results->get(), bindings);
    return results;
}

ExecResult SQLiteConnection::execContext(const QueryContext& ctx, const std::string& sql,
                                         const Bindings& bindings) {
    std::lock_guard<std::mutex> lock(m_mutex);
    ensureOpen();
    ctx.check();

    SQLiteResultSet statement(prepare(sql), ctx);
    bind(statement.get(), bindings);

    // Step to completion, discarding any rows
    while (statement.next()) {
    }

    return ExecResult(static_cast<int64_t>(sqlite3_changes(m_db)),
                      static_cast<int64_t>(sqlite3_last_insert_rowid(m_db)));
}

void SQLiteConnection::executeScript(const std::string& sql) {
    ensureOpen();

    char* errMsg = nullptr;
    int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string message = errMsg ? errMsg : sqlite3_errmsg(m_db);
        if (errMsg) sqlite3_free(errMsg);
        spdlog::error("SQLite exec failed: {}", message);
        throw SQLiteException(rc, message);
    }
}

sqlite3_stmt* SQLiteConnection::prepare(const std::string& sql) {
    // Compile SQL into a prepared statement for execution
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw SQLiteException(sqlite3_extended_errcode(m_db), sqlite3_errmsg(m_db));
    }
    return stmt;
}

void SQLiteConnection::bind(sqlite3_stmt* stmt, const Bindings& bindings) {
    if (!stmt) {
        if (!bindings.empty()) {
            throw DatabaseException(ErrorKind::Unsupported,
                                    "bindings supplied for an empty statement");
        }
        return;
    }

    for (size_t i = 0; i < bindings.size(); ++i) {
        const Value& value = bindings[i];
        int index = static_cast<int>(i) + 1;
        int rc;

        switch (value.type()) {
            case Value::Type::Null:
                rc = sqlite3_bind_null(stmt, index);
                break;
            case Value::Type::Boolean:
                rc = sqlite3_bind_int(stmt, index, value.asBool() ? 1 : 0);
                break;
            case Value::Type::Integer:
                rc = sqlite3_bind_int64(stmt, index, value.asInt64());
                break;
            case Value::Type::Real:
                rc = sqlite3_bind_double(stmt, index, value.asDouble());
                break;
            case Value::Type::Text: {
                const std::string& text = value.asString();
                rc = sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()),
                                       SQLITE_TRANSIENT);
                break;
            }
            case Value::Type::Raw:
            default:
                throw DatabaseException(ErrorKind::Unsupported,
                                        "raw expression cannot be bound as parameter " +
                                        std::to_string(index));
        }

        if (rc != SQLITE_OK) {
            throw SQLiteException(rc, "bind parameter " + std::to_string(index) + ": " +
                                      sqlite3_errmsg(m_db));
        }
    }
}

// ============================================================================
// Connection State
// ============================================================================

void SQLiteConnection::ping() {
    exec("SELECT 1");
}

bool SQLiteConnection::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_db != nullptr;
}

void SQLiteConnection::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_db) {
        sqlite3_close_v2(m_db);
        m_db = nullptr;
        spdlog::debug("Closed SQLite connection [{}]", name());
    }
}

void SQLiteConnection::ensureOpen() const {
    if (!m_db) {
        throw DatabaseException(ErrorKind::Connection, "connection [" + name() + "] is closed");
    }
}

// ============================================================================
// Error and Status Information
// ============================================================================

const char* SQLiteConnection::error() const {
    return m_db ? sqlite3_errmsg(m_db) : "no connection";
}

int SQLiteConnection::errorCode() const {
    return m_db ? sqlite3_extended_errcode(m_db) : SQLITE_ERROR;
}

int64_t SQLiteConnection::lastInsertRowId() const {
    return m_db ? sqlite3_last_insert_rowid(m_db) : 0;
}

int SQLiteConnection::changes() const {
    return m_db ? sqlite3_changes(m_db) : 0;
}

}  // namespace sqlquery
