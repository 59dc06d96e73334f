#pragma once

/**
 * @file QueryBuilder.hpp
 * @brief Fluent, mutable builder for one SQL statement.
 *
 * Configuration methods mutate the builder in place and return it for
 * chaining. Terminal methods compile the accumulated state with the
 * connection's grammar and run it through the Executor.
 *
 * @code
 *   auto rows = manager.table("users")
 *                   .where("age", ">", 25)
 *                   .where("status", "=", "active")
 *                   .orderByDesc("age")
 *                   .limit(5)
 *                   .get();
 * @endcode
 *
 * A builder is a value: copying it (or calling clone()) yields an
 * independent query that shares only the execution handle and grammar.
 * Builders are not safe for concurrent mutation.
 */

#include "Clauses.hpp"
#include "Executor.hpp"
#include "Grammar.hpp"
#include "QueryContext.hpp"
#include "Value.hpp"
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlquery {

class QueryBuilder {
public:
    // Compile-only builder without an execution handle
    QueryBuilder(std::shared_ptr<const Grammar> grammar, const std::string& table);
    QueryBuilder(Executor executor, std::shared_ptr<const Grammar> grammar, const std::string& table);

    // ----- Projection -----

    // Replace the projection; an empty list keeps the current one
    QueryBuilder& select(const std::vector<std::string>& columns);
    QueryBuilder& selectRaw(const std::string& expression, const Bindings& bindings = {});
    QueryBuilder& distinct();
    QueryBuilder& from(const std::string& table);

    // ----- Joins -----

    QueryBuilder& join(const std::string& table, const std::string& first,
                       const std::string& op, const std::string& second);
    QueryBuilder& leftJoin(const std::string& table, const std::string& first,
                           const std::string& op, const std::string& second);
    QueryBuilder& rightJoin(const std::string& table, const std::string& first,
                            const std::string& op, const std::string& second);
    QueryBuilder& crossJoin(const std::string& table);

    // ----- Conditions -----

    QueryBuilder& where(const std::string& column, const std::string& op, const Value& value);
    QueryBuilder& orWhere(const std::string& column, const std::string& op, const Value& value);
    QueryBuilder& whereIn(const std::string& column, const Bindings& values);
    QueryBuilder& whereNotIn(const std::string& column, const Bindings& values);
    QueryBuilder& whereNull(const std::string& column);
    QueryBuilder& whereNotNull(const std::string& column);
    QueryBuilder& whereBetween(const std::string& column, const Value& low, const Value& high);
    QueryBuilder& whereRaw(const std::string& sql, const Bindings& bindings = {});

    // ----- Grouping -----

    QueryBuilder& groupBy(const std::vector<std::string>& columns);
    QueryBuilder& having(const std::string& column, const std::string& op, const Value& value);
    QueryBuilder& havingRaw(const std::string& sql, const Bindings& bindings = {});

    // ----- Ordering and pagination -----

    // Direction is case-insensitive; anything but ASC / DESC becomes ASC
    QueryBuilder& orderBy(const std::string& column, const std::string& direction = "asc");
    QueryBuilder& orderByDesc(const std::string& column);
    QueryBuilder& orderByRaw(const std::string& sql, const Bindings& bindings = {});

    QueryBuilder& limit(int64_t value);
    QueryBuilder& offset(int64_t value);
    QueryBuilder& take(int64_t value) { return limit(value); }
    QueryBuilder& skip(int64_t value) { return offset(value); }
    QueryBuilder& forPage(int64_t page, int64_t perPage = 15);

    // ----- Execution settings -----

    QueryBuilder& withContext(const QueryContext& context);

    // Latch an error; every later query or exec rethrows it
    QueryBuilder& setError(std::exception_ptr error);
    std::exception_ptr error() const { return m_error; }

    // ----- Reads -----

    Rows get();
    std::optional<Row> first();
    std::optional<Row> find(const Value& id);

    // First-row value of a column; null when there is no row
    Value value(const std::string& column);
    std::vector<Value> pluck(const std::string& column);

    bool exists();
    bool doesntExist();

    int64_t count();
    Value max(const std::string& column);
    Value min(const std::string& column);
    double sum(const std::string& column);
    double avg(const std::string& column);

    // ----- Writes -----

    int64_t insert(const ValueMap& values);
    int64_t insertGetId(const ValueMap& values);
    int64_t insertBatch(const std::vector<ValueMap>& records);
    int64_t update(const ValueMap& values);
    int64_t increment(const std::string& column, int64_t amount = 1);
    int64_t decrement(const std::string& column, int64_t amount = 1);
    int64_t remove();
    void truncate();

    // ----- Inspection -----

    CompiledQuery toSql() const;
    QueryBuilder clone() const { return *this; }

    const QueryState& state() const { return m_state; }
    const std::string& table() const { return m_state.table; }
    const std::vector<std::string>& columns() const { return m_state.columns; }
    const Grammar& grammar() const { return *m_grammar; }
    const QueryContext& context() const { return m_context; }

private:
    QueryBuilder& addJoin(JoinType type, const std::string& table, const std::string& first,
                          const std::string& op, const std::string& second);
    QueryBuilder& addWhere(Connective boolean, Predicate predicate);

    Value aggregate(const std::string& function, const std::string& column) const;
    double numericAggregate(const std::string& function, const std::string& column) const;

    Rows query(const CompiledQuery& compiled) const;
    std::optional<Row> queryRow(const CompiledQuery& compiled) const;
    ExecResult exec(const CompiledQuery& compiled) const;
    void checkError() const;

    Executor m_executor;
    std::shared_ptr<const Grammar> m_grammar;
    QueryState m_state;
    QueryContext m_context;
    std::exception_ptr m_error;
};

}  // namespace sqlquery
