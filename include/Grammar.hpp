#pragma once

/**
 * @file Grammar.hpp
 * @brief Dialect-aware compiler from QueryState to parameterized SQL.
 *
 * The base Grammar implements every statement compiler once. Dialects
 * override only identifier quoting, placeholder syntax and the handful of
 * statements they spell differently (TRUNCATE on SQLite).
 */

#include "Clauses.hpp"
#include "Value.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace sqlquery {

enum class Dialect { Base, PostgreSQL, SQLite };

const char* dialectName(Dialect dialect);

// Resolve a driver name ("pgsql", "postgres", "sqlite3", ...) to its dialect.
// Unrecognized names resolve to Dialect::Base.
Dialect dialectForDriver(const std::string& driver);

// Compiled statement: SQL text plus positionally aligned bind values
struct CompiledQuery {
    std::string sql;
    Bindings bindings;
};

class Grammar;

/**
 * @class ParameterSequence
 * @brief Placeholder counter for a single compile pass.
 *
 * Lives on the stack of one compile call and is threaded by reference
 * through the clause compilers, so every placeholder in a statement draws
 * from the same sequence while the Grammar itself stays stateless.
 */
class ParameterSequence {
public:
    explicit ParameterSequence(const Grammar& grammar) : m_grammar(grammar) {}

    // Placeholder for the next binding position
    std::string next();

    size_t count() const { return m_index; }

private:
    const Grammar& m_grammar;
    size_t m_index = 0;
};

/**
 * @class Grammar
 * @brief Base SQL grammar ('?' placeholders, double-quoted identifiers).
 *
 * Grammars hold no mutable state and may be shared between threads and
 * builders. A connection caches one instance for its lifetime.
 */
class Grammar {
public:
    virtual ~Grammar() = default;

    /**
     * @brief Create the grammar for a driver name.
     * @param driver "pgsql" / "postgres" / "postgresql", "sqlite" / "sqlite3",
     *               anything else yields the base grammar.
     */
    static std::shared_ptr<const Grammar> forDriver(const std::string& driver);

    virtual Dialect dialect() const { return Dialect::Base; }

    // ----- Identifier quoting -----

    virtual std::string wrapTable(const std::string& table) const;
    virtual std::string wrapColumn(const std::string& column) const;

    // ----- Placeholders -----

    /**
     * @brief Placeholder text for the binding at a zero-based position.
     */
    virtual std::string parameter(size_t index) const;

    // ----- Statement compilers -----

    CompiledQuery compileSelect(const QueryState& query) const;
    CompiledQuery compileInsert(const QueryState& query, const ValueMap& values) const;
    CompiledQuery compileUpdate(const QueryState& query, const ValueMap& values) const;
    CompiledQuery compileDelete(const QueryState& query) const;
    CompiledQuery compileExists(const QueryState& query) const;
    virtual CompiledQuery compileTruncate(const QueryState& query) const;

protected:
    std::string wrapIdentifier(const std::string& identifier) const;
    std::string quote(const std::string& segment) const;

    std::string compileColumns(const QueryState& query, ParameterSequence& params,
                               Bindings& bindings) const;
    std::string compileJoins(const QueryState& query) const;
    std::string compileConditions(const std::vector<Condition>& conditions,
                                  ParameterSequence& params, Bindings& bindings) const;
    std::string compilePredicate(const Predicate& predicate, ParameterSequence& params,
                                 Bindings& bindings) const;
    std::string compileOrders(const QueryState& query, ParameterSequence& params,
                              Bindings& bindings) const;

    // Emit a bound value, or the literal text of a RawExpression
    std::string compileValue(const Value& value, ParameterSequence& params,
                             Bindings& bindings) const;

    // Replace each '?' in caller-written SQL with the dialect placeholder.
    // Quoted literals and identifiers are copied as written; "??" emits '?'.
    std::string substituteParameters(const std::string& sql, const Bindings& values,
                                     ParameterSequence& params, Bindings& bindings) const;

    static std::vector<std::string> sortedKeys(const ValueMap& values);
};

}  // namespace sqlquery
