#include "Transaction.hpp"
#include "ErrorHandler.hpp"
#include "QueryBuilder.hpp"
#include <spdlog/spdlog.h>

namespace sqlquery {

Transaction::Transaction(std::shared_ptr<Connection> connection)
    : m_connection(std::move(connection)) {
}

Transaction::~Transaction() {
    if (m_active) {
        try {
            rollback();
        } catch (const std::exception& e) {
            spdlog::error("Implicit rollback on '{}' failed: {}", m_connection->name(), e.what());
        }
    }
}

ResultSetPtr Transaction::queryContext(const QueryContext& ctx, const std::string& sql,
                                       const Bindings& bindings) {
    ensureActive();
    return m_connection->queryContext(ctx, sql, bindings);
}

ExecResult Transaction::execContext(const QueryContext& ctx, const std::string& sql,
                                    const Bindings& bindings) {
    ensureActive();
    return m_connection->execContext(ctx, sql, bindings);
}

void Transaction::commit() {
    ensureActive();
    m_active = false;

    try {
        m_connection->exec("COMMIT");
    } catch (const std::exception& e) {
        // A failed COMMIT may leave the server-side transaction open
        spdlog::error("Commit on '{}' failed: {}", m_connection->name(), e.what());
        try {
            m_connection->exec("ROLLBACK");
        } catch (const std::exception& rollbackError) {
            spdlog::error("Rollback after failed commit on '{}' failed: {}",
                          m_connection->name(), rollbackError.what());
        }
        m_connection->endTransaction();
        throw;
    }

    m_connection->endTransaction();
    spdlog::debug("Transaction committed on '{}'", m_connection->name());
}

void Transaction::rollback() {
    ensureActive();
    m_active = false;

    try {
        m_connection->exec("ROLLBACK");
    } catch (...) {
        m_connection->endTransaction();
        throw;
    }

    m_connection->endTransaction();
    spdlog::debug("Transaction rolled back on '{}'", m_connection->name());
}

QueryBuilder Transaction::table(const std::string& table) {
    return QueryBuilder(Executor(shared_from_this()), m_connection->grammar(), table);
}

void Transaction::ensureActive() const {
    if (!m_active) {
        throw DatabaseException(ErrorKind::Other,
                                "transaction has already been committed or rolled back");
    }
}

}  // namespace sqlquery
