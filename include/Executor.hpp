#pragma once

#include "Connection.hpp"
#include "Grammar.hpp"
#include "QueryContext.hpp"
#include "Transaction.hpp"
#include <memory>
#include <optional>

namespace sqlquery {

/**
 * @class Executor
 * @brief Runs compiled statements on a connection or, when set, a transaction.
 *
 * The transaction takes precedence. Both handles are shared, so copies of a
 * builder (and its clones) execute on the same target.
 */
class Executor {
public:
    Executor() = default;
    explicit Executor(std::shared_ptr<Connection> connection);
    explicit Executor(std::shared_ptr<Transaction> transaction);

    bool isTransaction() const { return m_transaction != nullptr; }
    explicit operator bool() const { return m_transaction || m_connection; }

    Rows query(const QueryContext& ctx, const CompiledQuery& compiled) const;
    std::optional<Row> queryRow(const QueryContext& ctx, const CompiledQuery& compiled) const;
    ExecResult exec(const QueryContext& ctx, const CompiledQuery& compiled) const;

private:
    DBTX& target() const;

    std::shared_ptr<Connection> m_connection;
    std::shared_ptr<Transaction> m_transaction;
};

}  // namespace sqlquery
