#include "DatabaseManager.hpp"
#include "ErrorHandler.hpp"
#include "PostgreSQLConnection.hpp"
#include "SQLiteConnection.hpp"
#include "Transaction.hpp"
#include <spdlog/spdlog.h>
#include <mutex>

namespace sqlquery {

// ============================================================================
// Construction and Destruction
// ============================================================================

DatabaseManager::DatabaseManager(DatabaseConfig config) : m_config(std::move(config)) {}

DatabaseManager::~DatabaseManager() {
    closeAll();
}

// ============================================================================
// Connection Management
// ============================================================================

ConnectionPtr DatabaseManager::createConnection(const std::string& name,
                                                const ConnectionConfig& config) {
    switch (dialectForDriver(config.driver)) {
        case Dialect::PostgreSQL:
            return std::make_shared<PostgreSQLConnection>(
                name, PostgreSQLConnection::buildConnInfo(config));
        case Dialect::SQLite:
            return std::make_shared<SQLiteConnection>(name, config.database, config.foreign_keys);
        case Dialect::Base:
        default:
            throw DatabaseException(ErrorKind::Unsupported,
                                    "Unsupported driver '" + config.driver +
                                    "' for connection '" + name + "'");
    }
}

std::string DatabaseManager::resolveName(const std::string& name) const {
    return name.empty() ? m_config.default_connection : name;
}

ConnectionPtr DatabaseManager::connection(const std::string& name) {
    std::string resolved;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        resolved = resolveName(name);
        auto it = m_connections.find(resolved);
        if (it != m_connections.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(m_mutex);

    // Another thread may have opened it while we waited
    auto it = m_connections.find(resolved);
    if (it != m_connections.end()) {
        return it->second;
    }

    auto configIt = m_config.connections.find(resolved);
    if (configIt == m_config.connections.end()) {
        throw DatabaseException(ErrorKind::NotFound,
                                "Database connection '" + resolved + "' is not configured");
    }

    ConnectionPtr conn = createConnection(resolved, configIt->second);
    m_connections.emplace(resolved, conn);
    spdlog::debug("Connection '{}' opened ({} driver)", resolved, conn->driver());
    return conn;
}

void DatabaseManager::disconnect(const std::string& name) {
    ConnectionPtr conn;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_connections.find(resolveName(name));
        if (it == m_connections.end()) {
            return;
        }
        conn = std::move(it->second);
        m_connections.erase(it);
    }

    conn->close();
    spdlog::debug("Connection '{}' disconnected", conn->name());
}

ConnectionPtr DatabaseManager::reconnect(const std::string& name) {
    disconnect(name);
    return connection(name);
}

void DatabaseManager::closeAll() {
    std::map<std::string, ConnectionPtr> connections;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        connections.swap(m_connections);
    }

    for (auto& [name, conn] : connections) {
        conn->close();
    }
}

size_t DatabaseManager::openCount() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_connections.size();
}

std::string DatabaseManager::defaultConnection() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_config.default_connection;
}

void DatabaseManager::setDefaultConnection(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (m_config.connections.find(name) == m_config.connections.end()) {
        throw DatabaseException(ErrorKind::NotFound,
                                "Database connection '" + name + "' is not configured");
    }
    m_config.default_connection = name;
}

// ============================================================================
// Query Entry Points
// ============================================================================

QueryBuilder DatabaseManager::table(const std::string& table, const std::string& connectionName) {
    return connection(connectionName)->table(table);
}

Rows DatabaseManager::select(const std::string& sql, const Bindings& bindings) {
    ErrorContext context("select");
    auto results = connection()->query(sql, bindings);
    return scanRows(*results);
}

ExecResult DatabaseManager::statement(const std::string& sql, const Bindings& bindings) {
    ErrorContext context("statement");
    return connection()->exec(sql, bindings);
}

void DatabaseManager::transaction(const std::function<void(Transaction&)>& callback) {
    connection()->transaction(callback);
}

std::shared_ptr<Transaction> DatabaseManager::beginTransaction(const QueryContext& ctx) {
    return connection()->beginTransaction(ctx);
}

}  // namespace sqlquery
