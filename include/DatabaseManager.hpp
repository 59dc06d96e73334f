#pragma once

/**
 * @file DatabaseManager.hpp
 * @brief Registry of named database connections built from configuration.
 */

#include "Config.hpp"
#include "Connection.hpp"
#include "QueryBuilder.hpp"
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

namespace sqlquery {

class Transaction;

/**
 * @class DatabaseManager
 * @brief Owns the configured connections and hands out query builders.
 *
 * Connections are opened lazily on first use and cached by name. The
 * driver named in each ConnectionConfig selects the implementation:
 * - pgsql / postgres / postgresql -> PostgreSQLConnection
 * - sqlite / sqlite3              -> SQLiteConnection
 *
 * Usage:
 * @code
 *   DatabaseManager db(config.database);
 *   auto rows = db.table("users").where("active", "=", true).get();
 *   db.transaction([](Transaction& tx) {
 *       tx.table("audit").insert({{"event", Value("login")}});
 *   });
 * @endcode
 *
 * Thread Safety:
 * - All public methods are thread-safe
 * - The connection cache is guarded by a shared_mutex; lookups of an
 *   already-open connection take the shared lock only
 */
class DatabaseManager {
public:
    /**
     * @brief Create a manager over a set of connection configurations.
     * @param config Named connections plus the default connection name.
     *
     * Does not open any connection.
     */
    explicit DatabaseManager(DatabaseConfig config);

    /**
     * @brief Destructor - closes all open connections.
     */
    ~DatabaseManager();

    // Non-copyable, non-movable
    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

    /**
     * @brief Get (opening if needed) a connection by name.
     * @param name Connection name; empty selects the default connection.
     * @return Shared connection handle.
     * @throws DatabaseException(NotFound) for an unconfigured name,
     *         DatabaseException(Unsupported) for an unknown driver,
     *         driver exceptions when the connection cannot be opened.
     */
    ConnectionPtr connection(const std::string& name = "");

    /**
     * @brief Start a fluent query on a table.
     * @param table Table name, optionally schema-qualified.
     * @param connectionName Connection to use; empty selects the default.
     */
    QueryBuilder table(const std::string& table, const std::string& connectionName = "");

    /**
     * @brief Run a raw SELECT on the default connection.
     * @param sql Statement with dialect placeholders.
     * @param bindings Positional parameter values.
     * @return All rows, keyed by column name.
     */
    Rows select(const std::string& sql, const Bindings& bindings = {});

    /**
     * @brief Run a raw statement without results on the default connection.
     */
    ExecResult statement(const std::string& sql, const Bindings& bindings = {});

    /**
     * @brief Run a callback inside a transaction on the default connection.
     *
     * Commits when the callback returns, rolls back and rethrows when it throws.
     */
    void transaction(const std::function<void(Transaction&)>& callback);

    /**
     * @brief Begin a transaction on the default connection.
     */
    std::shared_ptr<Transaction> beginTransaction(const QueryContext& ctx = QueryContext());

    // Returned by value; the name may change concurrently
    std::string defaultConnection() const;

    /**
     * @brief Change the default connection.
     * @throws DatabaseException(NotFound) if @p name is not configured.
     */
    void setDefaultConnection(const std::string& name);

    /**
     * @brief Close a connection and drop it from the cache.
     *
     * The next connection() call opens a fresh one. Handles still held by
     * callers stay valid but are closed.
     */
    void disconnect(const std::string& name = "");

    /**
     * @brief Close and reopen a connection.
     * @return The new connection.
     */
    ConnectionPtr reconnect(const std::string& name = "");

    /**
     * @brief Close every open connection.
     */
    void closeAll();

    /**
     * @brief Number of connections currently open.
     */
    size_t openCount() const;

    /**
     * @brief Open a connection from configuration without caching it.
     */
    static ConnectionPtr createConnection(const std::string& name, const ConnectionConfig& config);

private:
    std::string resolveName(const std::string& name) const;

    DatabaseConfig m_config;
    std::map<std::string, ConnectionPtr> m_connections;
    mutable std::shared_mutex m_mutex;
};

}  // namespace sqlquery
