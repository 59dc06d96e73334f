#include "Executor.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>

namespace sqlquery {

Executor::Executor(std::shared_ptr<Connection> connection)
    : m_connection(std::move(connection)) {
}

Executor::Executor(std::shared_ptr<Transaction> transaction)
    : m_transaction(std::move(transaction)) {
}

DBTX& Executor::target() const {
    if (m_transaction) return *m_transaction;
    if (m_connection) return *m_connection;
    throw DatabaseException(ErrorKind::Connection, "query builder has no connection");
}

Rows Executor::query(const QueryContext& ctx, const CompiledQuery& compiled) const {
    spdlog::debug("query{}: {} [{} bindings]", isTransaction() ? " (tx)" : "",
                  compiled.sql, compiled.bindings.size());

    try {
        auto results = target().queryContext(ctx, compiled.sql, compiled.bindings);
        if (!results) {
            return {};
        }
        return scanRows(*results);
    } catch (const DatabaseException& e) {
        spdlog::error("{}: {}", ErrorContext::current(), e.what());
        throw;
    }
}

std::optional<Row> Executor::queryRow(const QueryContext& ctx, const CompiledQuery& compiled) const {
    spdlog::debug("queryRow{}: {} [{} bindings]", isTransaction() ? " (tx)" : "",
                  compiled.sql, compiled.bindings.size());

    try {
        return target().queryRowContext(ctx, compiled.sql, compiled.bindings);
    } catch (const DatabaseException& e) {
        spdlog::error("{}: {}", ErrorContext::current(), e.what());
        throw;
    }
}

ExecResult Executor::exec(const QueryContext& ctx, const CompiledQuery& compiled) const {
    spdlog::debug("exec{}: {} [{} bindings]", isTransaction() ? " (tx)" : "",
                  compiled.sql, compiled.bindings.size());

    try {
        return target().execContext(ctx, compiled.sql, compiled.bindings);
    } catch (const DatabaseException& e) {
        spdlog::error("{}: {}", ErrorContext::current(), e.what());
        throw;
    }
}

}  // namespace sqlquery
