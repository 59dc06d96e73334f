#pragma once

#include "Connection.hpp"
#include <memory>
#include <string>

namespace sqlquery {

// Open transaction on a single connection. Statements run through it until
// commit() or rollback(); destroying an active transaction rolls it back.
class Transaction : public DBTX, public std::enable_shared_from_this<Transaction> {
public:
    explicit Transaction(std::shared_ptr<Connection> connection);
    ~Transaction() override;

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    ResultSetPtr queryContext(const QueryContext& ctx, const std::string& sql,
                              const Bindings& bindings) override;
    ExecResult execContext(const QueryContext& ctx, const std::string& sql,
                           const Bindings& bindings) override;

    void commit();
    void rollback();

    bool isActive() const { return m_active; }

    // Fluent query bound to this transaction
    QueryBuilder table(const std::string& table);

    Connection& connection() const { return *m_connection; }

private:
    void ensureActive() const;

    std::shared_ptr<Connection> m_connection;
    bool m_active = true;
};

using TransactionPtr = std::shared_ptr<Transaction>;

}  // namespace sqlquery
