#pragma once

/**
 * @file SQLiteConnection.hpp
 * @brief SQLite implementation of the Connection contract.
 *
 * This class provides a safe wrapper for SQLite database connections,
 * handling automatic cleanup when the connection goes out of scope.
 * SQLite is file-based, so a connection is simply an open handle on a
 * database file (or ":memory:").
 */

#include "Connection.hpp"
#include "SQLiteResultSet.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <mutex>
#include <string>

namespace sqlquery {

/**
 * @class SQLiteConnection
 * @brief RAII owner of an SQLite database handle implementing DBTX.
 *
 * SQLiteConnection manages a connection to an SQLite database file.
 * The connection is closed by close() or when the object is destroyed.
 *
 * SQLite Characteristics:
 * - File-based: One database per file
 * - Serverless: No separate server process
 * - Positional '?' placeholders bound with sqlite3_bind_*()
 *
 * Usage:
 * @code
 *   auto conn = std::make_shared<SQLiteConnection>("main", "/path/to/app.db");
 *   conn->exec("CREATE TABLE IF NOT EXISTS test (id INTEGER)");
 *   auto results = conn->query("SELECT * FROM test WHERE id > ?", {Value(10)});
 *   while (results->next()) {
 *       // ...
 *   }
 * @endcode
 *
 * Context Handling:
 * - The context is checked before each statement
 * - A progress handler interrupts a running step once the context expires,
 *   reported as DatabaseException(Cancelled or Timeout)
 *
 * Thread Safety:
 * - Opened with SQLITE_OPEN_FULLMUTEX for serialized mode
 * - Statement execution holds an internal mutex so changes() and
 *   lastInsertRowId() belong to the statement that produced them
 */
class SQLiteConnection : public Connection {
public:
    /**
     * @brief Open a connection to an SQLite database file.
     * @param name Connection name used in logs and errors.
     * @param dbPath Path to the database file, ":memory:" or a file: URI.
     * @param foreignKeys Enable foreign key enforcement on the connection.
     * @throws SQLiteException if the database cannot be opened.
     *
     * Creates the database file if it doesn't exist.
     * Uses SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX.
     */
    SQLiteConnection(std::string name, const std::string& dbPath, bool foreignKeys = false);

    /**
     * @brief Destructor - closes the database connection.
     */
    ~SQLiteConnection() override;

    /**
     * @brief Get the underlying sqlite3 handle.
     * @return Raw sqlite3* pointer (still owned by this object).
     */
    sqlite3* get() const { return m_db; }

    /**
     * @brief Get the database path this connection was opened with.
     */
    const std::string& path() const { return m_path; }

    /**
     * @brief Execute a statement returning rows.
     * @return Lazy result set; rows are stepped on next().
     * @throws SQLiteException on prepare or bind errors.
     */
    ResultSetPtr queryContext(const QueryContext& ctx, const std::string& sql,
                              const Bindings& bindings) override;

    /**
     * @brief Execute a statement to completion.
     * @return sqlite3_changes() and sqlite3_last_insert_rowid() of the statement.
     * @throws SQLiteException on errors.
     */
    ExecResult execContext(const QueryContext& ctx, const std::string& sql,
                           const Bindings& bindings) override;

    /**
     * @brief Execute one or more semicolon-separated statements without bindings.
     * @param sql The SQL script to execute.
     * @throws SQLiteException on the first failing statement.
     *
     * Use this for schema setup and PRAGMAs.
     */
    void executeScript(const std::string& sql);

    /**
     * @brief Test the connection by executing "SELECT 1".
     */
    void ping() override;

    bool isOpen() const override;

    /**
     * @brief Close the database. Later statements throw.
     *
     * Uses sqlite3_close_v2(), so result sets still alive keep the handle
     * usable until they are finalized.
     */
    void close() override;

    /**
     * @brief Get the last SQLite error message.
     * @return Error description from the last failed operation.
     */
    const char* error() const;

    /**
     * @brief Get the last SQLite error code.
     * @return Extended SQLite error code (SQLITE_OK = 0, SQLITE_ERROR = 1, etc.).
     */
    int errorCode() const;

    /**
     * @brief Get the rowid of the last inserted row.
     * @return Last insert rowid, or 0 if no inserts performed.
     */
    int64_t lastInsertRowId() const;

    /**
     * @brief Get the number of rows changed by the last statement.
     * @return Number of rows inserted, updated, or deleted.
     */
    int changes() const;

private:
    /**
     * @brief Compile SQL into a prepared statement.
     * @return Statement handle (caller owns), nullptr for empty SQL.
     * @throws SQLiteException on syntax errors.
     */
    sqlite3_stmt* prepare(const std::string& sql);

    /**
     * @brief Bind positional parameters to a prepared statement.
     * @throws DatabaseException(Unsupported) for raw expressions,
     *         SQLiteException when a bind fails.
     */
    void bind(sqlite3_stmt* stmt, const Bindings& bindings);

    void ensureOpen() const;

    sqlite3* m_db = nullptr;     ///< SQLite database handle
    std::string m_path;          ///< Path to database file
    mutable std::mutex m_mutex;  ///< Serializes statements on m_db
};

}  // namespace sqlquery
