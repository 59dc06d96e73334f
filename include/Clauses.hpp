#pragma once

#include "Value.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sqlquery {

enum class JoinType { Inner, Left, Right, Cross };

const char* joinKeyword(JoinType type);

struct JoinClause {
    JoinType type = JoinType::Inner;
    std::string table;
    std::string first;     // unused for CROSS
    std::string op;        // unused for CROSS
    std::string second;    // unused for CROSS
};

// Logical connective placed before a condition (ignored on the first one)
enum class Connective { And, Or };

const char* connectiveKeyword(Connective connective);

namespace predicate {

struct Basic {
    std::string column;
    std::string op;
    Value value;
};

struct In {
    std::string column;
    Bindings values;
};

struct NotIn {
    std::string column;
    Bindings values;
};

struct Null {
    std::string column;
};

struct NotNull {
    std::string column;
};

struct Between {
    std::string column;
    Value low;
    Value high;
};

// Caller-written SQL, one '?' per binding
struct Raw {
    std::string sql;
    Bindings bindings;
};

}  // namespace predicate

using Predicate = std::variant<predicate::Basic,
                               predicate::In,
                               predicate::NotIn,
                               predicate::Null,
                               predicate::NotNull,
                               predicate::Between,
                               predicate::Raw>;

// Entry of a WHERE or HAVING list. HAVING only ever holds Basic and Raw.
struct Condition {
    Connective boolean = Connective::And;
    Predicate predicate;
};

struct OrderClause {
    std::string column;
    std::string direction = "ASC";
    std::optional<std::string> raw;  // set by orderByRaw, emitted verbatim
    Bindings bindings;               // bindings of a raw entry
};

// Everything a grammar needs to compile a statement
struct QueryState {
    std::string table;
    std::vector<std::string> columns{"*"};
    bool distinct = false;
    std::vector<JoinClause> joins;
    std::vector<Condition> wheres;
    std::vector<std::string> groups;
    std::vector<Condition> havings;
    std::vector<OrderClause> orders;
    std::optional<int64_t> limit;
    std::optional<int64_t> offset;
    Bindings selectBindings;  // accumulated by selectRaw
};

}  // namespace sqlquery
