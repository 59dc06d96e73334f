#pragma once

#include "Value.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace sqlquery {

class QueryBuilder;

enum class ConditionType {
    Basic,    // column op value
    In,       // column in a,b,c
    NotIn,    // column not in a,b,c
    Null,     // column is null
    NotNull   // column is not null
};

struct ParsedCondition {
    ConditionType type = ConditionType::Basic;
    std::string column;
    std::string op;    // normalized operator for Basic, e.g. "=", "LIKE"
    Bindings values;   // one value for Basic, the list for In / NotIn

    // Add this condition to a builder, joined with AND or OR
    void applyTo(QueryBuilder& builder, bool orJoin = false) const;
};

// Parses command-line conditions of the form "column op value".
//
// Operators: = != <> < > <= >= like, not like, ilike, in, not in,
// is null, is not null. Keywords are case-insensitive. Values go through
// parseLiteral(); in-lists are comma separated with optional parentheses.
class ConditionParser {
public:
    ConditionParser() = default;

    // Throws std::invalid_argument on malformed input
    ParsedCondition parse(std::string_view text) const;

    // null, true / false, integers, decimals, 'quoted' or "quoted" text;
    // anything else is text as written
    static Value parseLiteral(std::string_view text);

private:
    Bindings parseList(std::string_view text) const;
};

}  // namespace sqlquery
