#pragma once

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sqlquery {

// Literal SQL emitted verbatim by the grammar instead of being bound.
struct RawExpression {
    std::string sql;

    bool operator==(const RawExpression& other) const { return sql == other.sql; }
    bool operator!=(const RawExpression& other) const { return sql != other.sql; }
};

// A dynamically typed SQL value: bind parameter on the way in,
// scanned column on the way out.
class Value {
public:
    enum class Type { Null, Boolean, Integer, Real, Text, Raw };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool value) : m_data(value) {}

    template<typename T,
             std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
    Value(T value) : m_data(static_cast<int64_t>(value)) {}

    template<typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
    Value(T value) : m_data(static_cast<double>(value)) {}

    Value(const char* value);
    Value(std::string value) : m_data(std::move(value)) {}
    Value(RawExpression raw) : m_data(std::move(raw)) {}

    Type type() const;

    bool isNull() const { return std::holds_alternative<std::monostate>(m_data); }
    bool isRaw() const { return std::holds_alternative<RawExpression>(m_data); }
    bool isBool() const { return std::holds_alternative<bool>(m_data); }
    bool isInt() const { return std::holds_alternative<int64_t>(m_data); }
    bool isDouble() const { return std::holds_alternative<double>(m_data); }
    bool isString() const { return std::holds_alternative<std::string>(m_data); }
    bool isNumeric() const { return isInt() || isDouble(); }

    // Strict accessors, throw std::runtime_error on type mismatch
    bool asBool() const;
    int64_t asInt64() const;
    double asDouble() const;
    const std::string& asString() const;
    const RawExpression& asRaw() const;

    // Textual form used for driver text parameters and CSV output.
    // Null renders as an empty string.
    std::string toString() const;

    bool operator==(const Value& other) const { return m_data == other.m_data; }
    bool operator!=(const Value& other) const { return m_data != other.m_data; }

    friend std::ostream& operator<<(std::ostream& os, const Value& value);

private:
    using Storage = std::variant<std::monostate, bool, int64_t, double, std::string, RawExpression>;
    Storage m_data;
};

const char* valueTypeName(Value::Type type);

// Positional bind parameters, aligned with placeholders in compiled SQL.
using Bindings = std::vector<Value>;

// One scanned result row keyed by column name.
using Row = std::map<std::string, Value>;
using Rows = std::vector<Row>;

// Column -> value input for INSERT / UPDATE. Iteration order is unspecified,
// so compilers sort the keys before emitting SQL.
using ValueMap = std::unordered_map<std::string, Value>;

}  // namespace sqlquery
