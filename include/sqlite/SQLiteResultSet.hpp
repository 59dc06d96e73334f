#pragma once

/**
 * @file SQLiteResultSet.hpp
 * @brief RAII wrapper for SQLite prepared statement results.
 *
 * This file provides the ResultSet implementation for SQLite, handling
 * automatic cleanup of sqlite3_stmt resources, typed column access, and
 * interruption of long-running steps when the query context expires.
 */

#include "QueryContext.hpp"
#include "ResultSet.hpp"
#include <sqlite3.h>
#include <string>
#include <vector>

namespace sqlquery {

/**
 * @class SQLiteInterruptGuard
 * @brief Installs a progress handler that aborts a step once a context expires.
 *
 * While the guard is alive, SQLite invokes the handler every few hundred
 * virtual machine instructions; when the context is cancelled or past its
 * deadline the running step fails with SQLITE_INTERRUPT. The handler is
 * removed on destruction.
 */
class SQLiteInterruptGuard {
public:
    SQLiteInterruptGuard(sqlite3* db, const QueryContext& context);
    ~SQLiteInterruptGuard();

    SQLiteInterruptGuard(const SQLiteInterruptGuard&) = delete;
    SQLiteInterruptGuard& operator=(const SQLiteInterruptGuard&) = delete;

private:
    sqlite3* m_db;
};

/**
 * @class SQLiteResultSet
 * @brief RAII wrapper for SQLite prepared statement results.
 *
 * SQLiteResultSet manages a sqlite3_stmt handle, providing methods to
 * step through rows and access column values. The statement is automatically
 * finalized when the wrapper is destroyed.
 *
 * SQLite Result Iteration:
 * Unlike PostgreSQL, which buffers the whole result, SQLite uses step() to
 * both execute and fetch rows. Each call to next() advances to the next row
 * (or completes the statement for DML).
 *
 * Value Mapping (by storage class of the current row):
 * - INTEGER -> Integer
 * - FLOAT   -> Real
 * - TEXT    -> Text
 * - BLOB    -> Text (raw bytes)
 * - NULL    -> Null
 *
 * Usage:
 * @code
 *   auto results = conn->query("SELECT id, name FROM employees");
 *   while (results->next()) {
 *       int64_t id = results->value(0).asInt64();
 *       std::string name = results->value(1).asString();
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; each thread should have its own result set.
 */
class SQLiteResultSet : public ResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param stmt sqlite3_stmt handle to manage (takes ownership), or nullptr.
     * @param context Context checked while stepping.
     */
    explicit SQLiteResultSet(sqlite3_stmt* stmt = nullptr, QueryContext context = QueryContext());

    /**
     * @brief Destructor - finalizes the statement if still owned.
     */
    ~SQLiteResultSet() override;

    // Non-copyable
    SQLiteResultSet(const SQLiteResultSet&) = delete;
    SQLiteResultSet& operator=(const SQLiteResultSet&) = delete;

    // Movable
    SQLiteResultSet(SQLiteResultSet&& other) noexcept;
    SQLiteResultSet& operator=(SQLiteResultSet&& other) noexcept;

    /**
     * @brief Get the underlying sqlite3_stmt handle.
     * @return Raw sqlite3_stmt* pointer (still owned by this object).
     */
    sqlite3_stmt* get() const { return m_stmt; }

    // ----- ResultSet -----

    std::vector<std::string> columnNames() const override;

    /**
     * @brief Step to the next row.
     * @return true if a row is available, false once the statement is done.
     * @throws SQLiteException on step errors,
     *         DatabaseException(Cancelled / Timeout) when interrupted.
     */
    bool next() override;

    /**
     * @brief Typed value of a column in the current row.
     * @param index Zero-based column index.
     */
    Value value(int index) const override;

    // ----- Column access -----

    /**
     * @brief Get the number of columns in the result.
     * @return Column count.
     */
    int columnCount() const;

    /**
     * @brief Get a column name by index.
     * @param index Zero-based column index.
     * @return Column name.
     */
    std::string columnName(int index) const;

    /**
     * @brief Get a column value as a string.
     * @param index Zero-based column index.
     * @return String value (embedded NULs preserved), or empty string if NULL.
     */
    std::string getString(int index) const;

    /**
     * @brief Get a column value as a 64-bit integer.
     * @param index Zero-based column index.
     * @return Integer value, or 0 if NULL or non-numeric.
     */
    int64_t getInt64(int index) const;

    /**
     * @brief Check if a column value is NULL.
     * @param index Zero-based column index.
     * @return true if the column value is NULL.
     */
    bool isNull(int index) const;

    /**
     * @brief Finalize the statement and release resources.
     *
     * After calling finalize(), the statement cannot be used.
     * This is called automatically by the destructor.
     */
    void finalize();

private:
    sqlite3_stmt* m_stmt;    ///< SQLite prepared statement handle (owned)
    QueryContext m_context;  ///< Deadline / cancellation for steps
    bool m_done = false;     ///< Statement reached SQLITE_DONE or failed
};

}  // namespace sqlquery
