#pragma once

/**
 * @file Connection.hpp
 * @brief Execution contract and the abstract named database connection.
 */

#include "Grammar.hpp"
#include "QueryContext.hpp"
#include "ResultSet.hpp"
#include "Value.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sqlquery {

class QueryBuilder;
class Transaction;

/**
 * @class DBTX
 * @brief Statement execution contract shared by connections and transactions.
 *
 * Implementations bind @p bindings positionally to the placeholders of
 * @p sql and honor the deadline and cancellation of @p ctx. Every failure is
 * reported as a DatabaseException (or subclass).
 */
class DBTX {
public:
    virtual ~DBTX() = default;

    virtual ResultSetPtr queryContext(const QueryContext& ctx, const std::string& sql,
                                      const Bindings& bindings) = 0;
    virtual ExecResult execContext(const QueryContext& ctx, const std::string& sql,
                                   const Bindings& bindings) = 0;

    // Background-context conveniences
    ResultSetPtr query(const std::string& sql, const Bindings& bindings = {});
    ExecResult exec(const std::string& sql, const Bindings& bindings = {});

    // First row of a query, nullopt when the result is empty
    std::optional<Row> queryRowContext(const QueryContext& ctx, const std::string& sql,
                                       const Bindings& bindings);
    std::optional<Row> queryRow(const std::string& sql, const Bindings& bindings = {});
};

/**
 * @class Connection
 * @brief A named handle to one database, owning its grammar.
 *
 * Concrete drivers (PostgreSQLConnection, SQLiteConnection) implement the
 * DBTX contract plus ping/close. Connections are always held by
 * std::shared_ptr because transactions and builders keep them alive.
 *
 * One connection runs at most one transaction at a time; while it is open,
 * statements issued directly on the connection also run inside it.
 */
class Connection : public DBTX, public std::enable_shared_from_this<Connection> {
public:
    Connection(std::string name, std::string driver);
    ~Connection() override = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    const std::string& name() const { return m_name; }
    const std::string& driver() const { return m_driver; }
    Dialect dialect() const { return m_grammar->dialect(); }
    std::shared_ptr<const Grammar> grammar() const { return m_grammar; }

    // Start a fluent query against a table
    QueryBuilder table(const std::string& table);

    /**
     * @brief Issue BEGIN and return the open transaction.
     * @throws DatabaseException(Unsupported) if a transaction is already open.
     */
    std::shared_ptr<Transaction> beginTransaction(const QueryContext& ctx = QueryContext());

    /**
     * @brief Run @p callback inside a transaction.
     *
     * Commits when the callback returns. If it throws, the transaction is
     * rolled back and the original exception is rethrown.
     */
    void transaction(const std::function<void(Transaction&)>& callback);

    bool inTransaction() const { return m_inTransaction.load(); }

    // Round-trip to the server; throws on failure
    virtual void ping() = 0;
    virtual bool isOpen() const = 0;
    virtual void close() = 0;

private:
    friend class Transaction;

    void endTransaction() { m_inTransaction.store(false); }

    std::string m_name;
    std::string m_driver;
    std::shared_ptr<const Grammar> m_grammar;
    std::atomic<bool> m_inTransaction{false};
};

using ConnectionPtr = std::shared_ptr<Connection>;

}  // namespace sqlquery
