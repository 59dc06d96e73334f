#include "Connection.hpp"
#include "ErrorHandler.hpp"
#include "QueryBuilder.hpp"
#include "Transaction.hpp"
#include <spdlog/spdlog.h>

namespace sqlquery {

// ============================================================================
// DBTX conveniences
// ============================================================================

ResultSetPtr DBTX::query(const std::string& sql, const Bindings& bindings) {
    return queryContext(QueryContext::background(), sql, bindings);
}

ExecResult DBTX::exec(const std::string& sql, const Bindings& bindings) {
    return execContext(QueryContext::background(), sql, bindings);
}

std::optional<Row> DBTX::queryRowContext(const QueryContext& ctx, const std::string& sql,
                                         const Bindings& bindings) {
    auto results = queryContext(ctx, sql, bindings);
    if (!results || !results->next()) {
        return std::nullopt;
    }

    Row row;
    const auto columns = results->columnNames();
    for (size_t i = 0; i < columns.size(); ++i) {
        row[columns[i]] = results->value(static_cast<int>(i));
    }
    return row;
}

std::optional<Row> DBTX::queryRow(const std::string& sql, const Bindings& bindings) {
    return queryRowContext(QueryContext::background(), sql, bindings);
}

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(std::string name, std::string driver)
    : m_name(std::move(name))
    , m_driver(std::move(driver))
    , m_grammar(Grammar::forDriver(m_driver)) {
}

QueryBuilder Connection::table(const std::string& table) {
    return QueryBuilder(Executor(shared_from_this()), m_grammar, table);
}

std::shared_ptr<Transaction> Connection::beginTransaction(const QueryContext& ctx) {
    if (m_inTransaction.exchange(true)) {
        throw DatabaseException(ErrorKind::Unsupported,
                                "Connection '" + m_name + "' already has an open transaction");
    }

    try {
        execContext(ctx, "BEGIN", {});
    } catch (...) {
        m_inTransaction.store(false);
        throw;
    }

    spdlog::debug("Transaction started on '{}'", m_name);
    return std::make_shared<Transaction>(shared_from_this());
}

void Connection::transaction(const std::function<void(Transaction&)>& callback) {
    auto tx = beginTransaction();

    try {
        callback(*tx);
    } catch (const std::exception& e) {
        spdlog::debug("Transaction on '{}' failed, rolling back: {}", m_name, e.what());
        if (tx->isActive()) {
            try {
                tx->rollback();
            } catch (const std::exception& rollbackError) {
                spdlog::error("Rollback on '{}' failed: {}", m_name, rollbackError.what());
            }
        }
        throw;
    }

    if (tx->isActive()) {
        tx->commit();
    }
}

}  // namespace sqlquery
