#include "Grammar.hpp"
#include "PostgreSQLGrammar.hpp"
#include "SQLiteGrammar.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <type_traits>
#include <variant>

namespace sqlquery {

namespace {

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::ostringstream out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out << separator;
        out << parts[i];
    }
    return out.str();
}

std::vector<std::string> splitSegments(const std::string& identifier, char delimiter) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t pos = identifier.find(delimiter, start);
        if (pos == std::string::npos) {
            segments.push_back(identifier.substr(start));
            break;
        }
        segments.push_back(identifier.substr(start, pos - start));
        start = pos + 1;
    }
    return segments;
}

bool containsWhitespace(const std::string& str) {
    return std::any_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

// ============================================================================
// Dialect resolution
// ============================================================================

const char* dialectName(Dialect dialect) {
    switch (dialect) {
        case Dialect::PostgreSQL: return "postgresql";
        case Dialect::SQLite: return "sqlite";
        case Dialect::Base: return "base";
    }
    return "base";
}

Dialect dialectForDriver(const std::string& driver) {
    std::string name = driver;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "pgsql" || name == "postgres" || name == "postgresql") {
        return Dialect::PostgreSQL;
    }
    if (name == "sqlite" || name == "sqlite3") {
        return Dialect::SQLite;
    }
    return Dialect::Base;
}

std::shared_ptr<const Grammar> Grammar::forDriver(const std::string& driver) {
    switch (dialectForDriver(driver)) {
        case Dialect::PostgreSQL:
            return std::make_shared<const PostgreSQLGrammar>();
        case Dialect::SQLite:
            return std::make_shared<const SQLiteGrammar>();
        case Dialect::Base:
            break;
    }
    return std::make_shared<const Grammar>();
}

std::string ParameterSequence::next() {
    return m_grammar.parameter(m_index++);
}

// ============================================================================
// Identifier quoting and placeholders
// ============================================================================

std::string Grammar::wrapTable(const std::string& table) const {
    return wrapIdentifier(table);
}

std::string Grammar::wrapColumn(const std::string& column) const {
    return wrapIdentifier(column);
}

std::string Grammar::parameter(size_t /*index*/) const {
    return "?";
}

std::string Grammar::wrapIdentifier(const std::string& identifier) const {
    // Star, aliases ("x AS y"), function calls and expressions pass through
    if (identifier == "*") return identifier;
    if (identifier.find('(') != std::string::npos) return identifier;
    if (containsWhitespace(identifier)) return identifier;
    if (identifier.find('"') != std::string::npos) return identifier;

    if (identifier.find('.') != std::string::npos) {
        auto segments = splitSegments(identifier, '.');
        for (const auto& segment : segments) {
            if (segment.empty()) return identifier;
        }
        for (auto& segment : segments) {
            if (segment != "*") segment = quote(segment);
        }
        return join(segments, ".");
    }

    return quote(identifier);
}

std::string Grammar::quote(const std::string& segment) const {
    return "\"" + segment + "\"";
}

// ============================================================================
// Statement compilers
// ============================================================================

CompiledQuery Grammar::compileSelect(const QueryState& query) const {
    ParameterSequence params(*this);
    CompiledQuery compiled;
    std::vector<std::string> parts;

    std::string select = query.distinct ? "SELECT DISTINCT " : "SELECT ";
    parts.push_back(select + compileColumns(query, params, compiled.bindings));
    parts.push_back("FROM " + wrapTable(query.table));

    if (!query.joins.empty()) {
        parts.push_back(compileJoins(query));
    }

    if (!query.wheres.empty()) {
        parts.push_back("WHERE " + compileConditions(query.wheres, params, compiled.bindings));
    }

    if (!query.groups.empty()) {
        std::vector<std::string> groups;
        for (const auto& group : query.groups) {
            groups.push_back(wrapColumn(group));
        }
        parts.push_back("GROUP BY " + join(groups, ", "));
    }

    if (!query.havings.empty()) {
        parts.push_back("HAVING " + compileConditions(query.havings, params, compiled.bindings));
    }

    if (!query.orders.empty()) {
        parts.push_back("ORDER BY " + compileOrders(query, params, compiled.bindings));
    }

    // Pagination is always literal, never bound
    if (query.limit) {
        parts.push_back("LIMIT " + std::to_string(*query.limit));
    }
    if (query.offset) {
        parts.push_back("OFFSET " + std::to_string(*query.offset));
    }

    compiled.sql = join(parts, " ");
    return compiled;
}

CompiledQuery Grammar::compileInsert(const QueryState& query, const ValueMap& values) const {
    ParameterSequence params(*this);
    CompiledQuery compiled;

    if (values.empty()) {
        compiled.sql = "INSERT INTO " + wrapTable(query.table) + " DEFAULT VALUES";
        return compiled;
    }

    std::vector<std::string> columns;
    std::vector<std::string> placeholders;
    for (const auto& key : sortedKeys(values)) {
        columns.push_back(wrapColumn(key));
        placeholders.push_back(compileValue(values.at(key), params, compiled.bindings));
    }

    compiled.sql = "INSERT INTO " + wrapTable(query.table) +
                   " (" + join(columns, ", ") + ") VALUES (" + join(placeholders, ", ") + ")";
    return compiled;
}

CompiledQuery Grammar::compileUpdate(const QueryState& query, const ValueMap& values) const {
    ParameterSequence params(*this);
    CompiledQuery compiled;

    std::vector<std::string> sets;
    for (const auto& key : sortedKeys(values)) {
        sets.push_back(wrapColumn(key) + " = " +
                       compileValue(values.at(key), params, compiled.bindings));
    }

    compiled.sql = "UPDATE " + wrapTable(query.table) + " SET " + join(sets, ", ");

    // WHERE continues the numbering started by SET
    if (!query.wheres.empty()) {
        compiled.sql += " WHERE " + compileConditions(query.wheres, params, compiled.bindings);
    }

    return compiled;
}

CompiledQuery Grammar::compileDelete(const QueryState& query) const {
    ParameterSequence params(*this);
    CompiledQuery compiled;

    compiled.sql = "DELETE FROM " + wrapTable(query.table);
    if (!query.wheres.empty()) {
        compiled.sql += " WHERE " + compileConditions(query.wheres, params, compiled.bindings);
    }

    return compiled;
}

CompiledQuery Grammar::compileExists(const QueryState& query) const {
    CompiledQuery compiled = compileSelect(query);
    compiled.sql = "SELECT EXISTS (" + compiled.sql + ") AS " + quote("exists");
    return compiled;
}

CompiledQuery Grammar::compileTruncate(const QueryState& query) const {
    return CompiledQuery{"TRUNCATE TABLE " + wrapTable(query.table), {}};
}

// ============================================================================
// Clause compilers
// ============================================================================

std::string Grammar::compileColumns(const QueryState& query, ParameterSequence& params,
                                    Bindings& bindings) const {
    if (query.columns.empty()) {
        return "*";
    }

    std::vector<std::string> columns;
    columns.reserve(query.columns.size());
    for (const auto& column : query.columns) {
        columns.push_back(wrapColumn(column));
    }

    std::string list = join(columns, ", ");
    if (query.selectBindings.empty()) {
        return list;
    }
    return substituteParameters(list, query.selectBindings, params, bindings);
}

std::string Grammar::compileJoins(const QueryState& query) const {
    std::vector<std::string> joins;
    for (const auto& clause : query.joins) {
        std::string sql = std::string(joinKeyword(clause.type)) + " JOIN " + wrapTable(clause.table);
        if (clause.type != JoinType::Cross) {
            sql += " ON " + wrapColumn(clause.first) + " " + clause.op + " " +
                   wrapColumn(clause.second);
        }
        joins.push_back(std::move(sql));
    }
    return join(joins, " ");
}

std::string Grammar::compileConditions(const std::vector<Condition>& conditions,
                                       ParameterSequence& params, Bindings& bindings) const {
    std::ostringstream out;

    for (size_t i = 0; i < conditions.size(); ++i) {
        if (i > 0) {
            out << " " << connectiveKeyword(conditions[i].boolean) << " ";
        }
        out << compilePredicate(conditions[i].predicate, params, bindings);
    }

    return out.str();
}

std::string Grammar::compilePredicate(const Predicate& predicate, ParameterSequence& params,
                                      Bindings& bindings) const {
    auto list = [&](const Bindings& values) {
        std::vector<std::string> placeholders;
        placeholders.reserve(values.size());
        for (const auto& value : values) {
            placeholders.push_back(compileValue(value, params, bindings));
        }
        return "(" + join(placeholders, ", ") + ")";
    };

    return std::visit([&](const auto& p) -> std::string {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, predicate::Basic>) {
            return wrapColumn(p.column) + " " + p.op + " " + compileValue(p.value, params, bindings);
        } else if constexpr (std::is_same_v<T, predicate::In>) {
            return wrapColumn(p.column) + " IN " + list(p.values);
        } else if constexpr (std::is_same_v<T, predicate::NotIn>) {
            return wrapColumn(p.column) + " NOT IN " + list(p.values);
        } else if constexpr (std::is_same_v<T, predicate::Null>) {
            return wrapColumn(p.column) + " IS NULL";
        } else if constexpr (std::is_same_v<T, predicate::NotNull>) {
            return wrapColumn(p.column) + " IS NOT NULL";
        } else if constexpr (std::is_same_v<T, predicate::Between>) {
            std::string low = compileValue(p.low, params, bindings);
            std::string high = compileValue(p.high, params, bindings);
            return wrapColumn(p.column) + " BETWEEN " + low + " AND " + high;
        } else {
            return substituteParameters(p.sql, p.bindings, params, bindings);
        }
    }, predicate);
}

std::string Grammar::compileOrders(const QueryState& query, ParameterSequence& params,
                                   Bindings& bindings) const {
    std::vector<std::string> orders;
    for (const auto& order : query.orders) {
        if (order.raw) {
            orders.push_back(substituteParameters(*order.raw, order.bindings, params, bindings));
        } else {
            orders.push_back(wrapColumn(order.column) + " " + order.direction);
        }
    }
    return join(orders, ", ");
}

std::string Grammar::compileValue(const Value& value, ParameterSequence& params,
                                  Bindings& bindings) const {
    if (value.isRaw()) {
        return value.asRaw().sql;
    }
    bindings.push_back(value);
    return params.next();
}

std::string Grammar::substituteParameters(const std::string& sql, const Bindings& values,
                                          ParameterSequence& params, Bindings& bindings) const {
    std::string out;
    out.reserve(sql.size());
    size_t used = 0;
    char quote = 0;  // active ' or " while inside a literal or identifier

    for (size_t i = 0; i < sql.size(); ++i) {
        char c = sql[i];

        if (quote) {
            // A doubled quote escapes itself and toggles twice
            if (c == quote) quote = 0;
            out += c;
            continue;
        }

        if (c == '\'' || c == '"') {
            quote = c;
            out += c;
        } else if (c == '?' && i + 1 < sql.size() && sql[i + 1] == '?') {
            // "??" is a literal '?', e.g. the PostgreSQL jsonb key operators
            out += '?';
            ++i;
        } else if (c == '?' && used < values.size()) {
            out += params.next();
            bindings.push_back(values[used++]);
        } else {
            out += c;
        }
    }

    // Bindings without a marker keep their position in the sequence
    for (; used < values.size(); ++used) {
        params.next();
        bindings.push_back(values[used]);
    }

    return out;
}

std::vector<std::string> Grammar::sortedKeys(const ValueMap& values) {
    std::vector<std::string> keys;
    keys.reserve(values.size());
    for (const auto& entry : values) {
        keys.push_back(entry.first);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

}  // namespace sqlquery
