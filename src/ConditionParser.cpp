#include "ConditionParser.hpp"
#include "QueryBuilder.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <stdexcept>

namespace sqlquery {

namespace {

struct OperatorSpec {
    const char* token;   // as typed, lowercase
    const char* sql;     // as emitted
    ConditionType type;
    bool keyword;        // must be followed by whitespace
};

// Longer tokens first so "<=" wins over "<" and "not like" over "not in"
const OperatorSpec kOperators[] = {
    {"not like", "NOT LIKE", ConditionType::Basic, true},
    {"not in", "", ConditionType::NotIn, true},
    {"ilike", "ILIKE", ConditionType::Basic, true},
    {"like", "LIKE", ConditionType::Basic, true},
    {"in", "", ConditionType::In, true},
    {"<=", "<=", ConditionType::Basic, false},
    {">=", ">=", ConditionType::Basic, false},
    {"<>", "<>", ConditionType::Basic, false},
    {"!=", "!=", ConditionType::Basic, false},
    {"=", "=", ConditionType::Basic, false},
    {"<", "<", ConditionType::Basic, false},
    {">", ">", ConditionType::Basic, false},
};

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string toLower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// Collapse runs of whitespace so "is   not null" matches
std::string normalizeSpaces(std::string_view text) {
    std::string result;
    bool space = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            space = true;
            continue;
        }
        if (space && !result.empty()) result += ' ';
        space = false;
        result += c;
    }
    return result;
}

bool startsWith(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

// Length of the prefix of text matching the words of a keyword operator,
// each followed by whitespace; 0 when it does not match
size_t matchKeyword(std::string_view text, std::string_view token) {
    size_t pos = 0;
    while (!token.empty()) {
        size_t space = token.find(' ');
        std::string_view word = token.substr(0, space);
        if (!startsWith(text.substr(pos), word)) return 0;
        pos += word.size();

        size_t gap = pos;
        while (gap < text.size() && std::isspace(static_cast<unsigned char>(text[gap]))) {
            ++gap;
        }
        if (gap == pos) return 0;
        pos = gap;

        token = space == std::string_view::npos ? std::string_view() : token.substr(space + 1);
    }
    return pos;
}

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

ParsedCondition ConditionParser::parse(std::string_view text) const {
    std::string_view input = trim(text);

    size_t split = 0;
    while (split < input.size() && !std::isspace(static_cast<unsigned char>(input[split]))) {
        ++split;
    }
    if (split == 0 || split == input.size()) {
        throw std::invalid_argument("Condition must look like \"column op value\": " +
                                    std::string(text));
    }

    ParsedCondition condition;
    condition.column = std::string(input.substr(0, split));

    std::string_view rest = trim(input.substr(split));
    std::string lowered = toLower(normalizeSpaces(rest));

    if (lowered == "is null") {
        condition.type = ConditionType::Null;
        return condition;
    }
    if (lowered == "is not null") {
        condition.type = ConditionType::NotNull;
        return condition;
    }

    std::string restLower = toLower(rest);
    for (const auto& spec : kOperators) {
        std::string_view token(spec.token);

        size_t consumed = 0;
        if (spec.keyword) {
            consumed = matchKeyword(restLower, token);
        } else if (startsWith(restLower, token)) {
            consumed = token.size();
        }
        if (consumed == 0) continue;

        std::string_view valueText = trim(rest.substr(consumed));
        if (valueText.empty()) {
            throw std::invalid_argument("Missing value in condition: " + std::string(text));
        }

        condition.type = spec.type;
        condition.op = spec.sql;
        if (spec.type == ConditionType::Basic) {
            condition.values.push_back(parseLiteral(valueText));
        } else {
            condition.values = parseList(valueText);
        }
        return condition;
    }

    throw std::invalid_argument("Unknown operator in condition: " + std::string(text));
}

Bindings ConditionParser::parseList(std::string_view text) const {
    if (text.size() >= 2 && text.front() == '(' && text.back() == ')') {
        text = trim(text.substr(1, text.size() - 2));
    }

    Bindings values;
    while (true) {
        size_t comma = text.find(',');
        std::string_view item = trim(text.substr(0, comma));
        if (item.empty()) {
            throw std::invalid_argument("Empty item in value list");
        }
        values.push_back(parseLiteral(item));
        if (comma == std::string_view::npos) break;
        text = text.substr(comma + 1);
    }
    return values;
}

Value ConditionParser::parseLiteral(std::string_view text) {
    text = trim(text);
    std::string lowered = toLower(text);

    if (lowered == "null") return Value();
    if (lowered == "true") return Value(true);
    if (lowered == "false") return Value(false);

    if (text.size() >= 2 && (text.front() == '\'' || text.front() == '"') &&
        text.back() == text.front()) {
        return Value(std::string(text.substr(1, text.size() - 2)));
    }

    if (text.empty()) return Value(std::string());

    char first = text.front();
    bool numeric = std::isdigit(static_cast<unsigned char>(first)) || first == '-' ||
                   first == '+' || first == '.';
    if (numeric) {
        std::string buffer(text);
        char* end = nullptr;

        errno = 0;
        long long integer = std::strtoll(buffer.c_str(), &end, 10);
        if (errno == 0 && end == buffer.c_str() + buffer.size()) {
            return Value(static_cast<int64_t>(integer));
        }

        errno = 0;
        double real = std::strtod(buffer.c_str(), &end);
        if (errno == 0 && end == buffer.c_str() + buffer.size()) {
            return Value(real);
        }
    }

    return Value(std::string(text));
}

// ============================================================================
// Builder Integration
// ============================================================================

void ParsedCondition::applyTo(QueryBuilder& builder, bool orJoin) const {
    if (orJoin && type != ConditionType::Basic) {
        throw std::invalid_argument("OR conditions support comparison operators only: " + column);
    }

    switch (type) {
        case ConditionType::Basic:
            if (orJoin) {
                builder.orWhere(column, op, values.front());
            } else {
                builder.where(column, op, values.front());
            }
            break;
        case ConditionType::In:
            builder.whereIn(column, values);
            break;
        case ConditionType::NotIn:
            builder.whereNotIn(column, values);
            break;
        case ConditionType::Null:
            builder.whereNull(column);
            break;
        case ConditionType::NotNull:
            builder.whereNotNull(column);
            break;
    }
}

}  // namespace sqlquery
