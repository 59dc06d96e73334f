#pragma once

/**
 * @file PostgreSQLConnection.hpp
 * @brief libpq-backed implementation of the Connection contract.
 *
 * This file provides the PostgreSQL driver: a single PGconn owned for the
 * lifetime of the object, parameterized execution with numbered
 * placeholders, and cooperative cancellation driven by QueryContext.
 */

#include "Config.hpp"
#include "Connection.hpp"
#include "PostgreSQLResultSet.hpp"
#include <libpq-fe.h>
#include <cstdint>
#include <mutex>
#include <string>

namespace sqlquery {

/**
 * @class PostgreSQLConnection
 * @brief RAII owner of a libpq connection implementing DBTX.
 *
 * The connection is opened in the constructor and closed by close() or the
 * destructor. Statements are sent with PQsendQueryParams() and all
 * parameters travel in text format, so the server infers their types from
 * the statement.
 *
 * PostgreSQL libpq API Usage:
 * - PQconnectdb() / PQfinish() for the connection lifecycle
 * - PQsendQueryParams() + PQconsumeInput() for non-blocking execution
 * - PQgetCancel() / PQcancel() to abort a statement whose context expired
 * - PQcmdTuples() for affected row counts
 * - PQresultErrorField(PG_DIAG_SQLSTATE) for error classification
 *
 * Context Handling:
 * - The context is checked before the statement is sent
 * - While waiting, the socket is polled in short slices; once the context
 *   expires a cancel request is sent and the statement's failure is reported
 *   as DatabaseException(Cancelled or Timeout)
 *
 * Thread Safety:
 * - Statements are serialized on the handle with an internal mutex
 * - Results are fully buffered, so result sets outlive the lock
 *
 * @see PostgreSQLResultSet for OID-to-Value conversion
 */
class PostgreSQLConnection : public Connection {
public:
    /**
     * @brief Open a connection from a libpq conninfo string or URI.
     * @param name Connection name used in logs and errors.
     * @param conninfo e.g. "host=localhost dbname=app user=app" or "postgresql://...".
     * @throws PostgreSQLException if the server cannot be reached.
     */
    PostgreSQLConnection(std::string name, const std::string& conninfo);

    /**
     * @brief Destructor - closes the connection.
     */
    ~PostgreSQLConnection() override;

    /**
     * @brief Build a libpq conninfo string from configuration.
     * @param config Connection settings; port 0 selects 5432.
     * @return Space-separated keyword=value list with quoted values.
     */
    static std::string buildConnInfo(const ConnectionConfig& config);

    /**
     * @brief Execute a statement returning rows.
     * @return Buffered result set positioned before the first row.
     * @throws PostgreSQLException on server errors,
     *         DatabaseException(Cancelled / Timeout) when @p ctx expires.
     */
    ResultSetPtr queryContext(const QueryContext& ctx, const std::string& sql,
                              const Bindings& bindings) override;

    /**
     * @brief Execute a statement without a result set.
     * @return Affected rows from PQcmdTuples(); lastInsertId() is unsupported.
     */
    ExecResult execContext(const QueryContext& ctx, const std::string& sql,
                           const Bindings& bindings) override;

    /**
     * @brief Test the connection by executing "SELECT 1".
     * @throws PostgreSQLException if the server does not respond.
     */
    void ping() override;

    /**
     * @brief Check if the connection is established and not in error state.
     */
    bool isOpen() const override;

    /**
     * @brief Close the connection. Later statements throw.
     */
    void close() override;

    /**
     * @brief Get the last error message from PQerrorMessage().
     */
    std::string error() const;

    /**
     * @brief Get the number of rows affected by a command.
     * @param result The PGresult from the command.
     * @return Parsed PQcmdTuples(), 0 for commands without a count.
     */
    static int64_t affectedRows(PGresult* result);

private:
    /**
     * @brief Send a statement and wait for its single result.
     * @return Owned result with status TUPLES_OK or COMMAND_OK.
     */
    PostgreSQLResultSet execute(const QueryContext& ctx, const std::string& sql,
                                const Bindings& bindings);

    /**
     * @brief Pump input until the statement completes.
     * @return true if a cancel request was sent because @p ctx expired.
     */
    bool waitForResult(const QueryContext& ctx);

    /**
     * @brief Ask the server to abort the running statement.
     */
    void cancelRunning();

    PGconn* m_conn = nullptr;  ///< PostgreSQL connection handle (owned)
    mutable std::mutex m_mutex;  ///< Serializes statements on m_conn
};

}  // namespace sqlquery
