#include "Value.hpp"
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace sqlquery {

namespace {

[[noreturn]] void throwTypeMismatch(const char* expected, Value::Type actual) {
    throw std::runtime_error(std::string("Value is not ") + expected +
                             " (holds " + valueTypeName(actual) + ")");
}

std::string formatDouble(double value) {
    std::ostringstream out;
    out << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return out.str();
}

}  // namespace

Value::Value(const char* value) {
    if (value) {
        m_data = std::string(value);
    }
}

Value::Type Value::type() const {
    switch (m_data.index()) {
        case 0: return Type::Null;
        case 1: return Type::Boolean;
        case 2: return Type::Integer;
        case 3: return Type::Real;
        case 4: return Type::Text;
        default: return Type::Raw;
    }
}

bool Value::asBool() const {
    if (auto b = std::get_if<bool>(&m_data)) return *b;
    if (auto i = std::get_if<int64_t>(&m_data)) return *i != 0;
    throwTypeMismatch("a boolean", type());
}

int64_t Value::asInt64() const {
    if (auto i = std::get_if<int64_t>(&m_data)) return *i;
    if (auto b = std::get_if<bool>(&m_data)) return *b ? 1 : 0;
    throwTypeMismatch("an integer", type());
}

double Value::asDouble() const {
    if (auto d = std::get_if<double>(&m_data)) return *d;
    if (auto i = std::get_if<int64_t>(&m_data)) return static_cast<double>(*i);
    throwTypeMismatch("a number", type());
}

const std::string& Value::asString() const {
    if (auto s = std::get_if<std::string>(&m_data)) return *s;
    throwTypeMismatch("a string", type());
}

const RawExpression& Value::asRaw() const {
    if (auto r = std::get_if<RawExpression>(&m_data)) return *r;
    throwTypeMismatch("a raw expression", type());
}

std::string Value::toString() const {
    switch (type()) {
        case Type::Null: return "";
        case Type::Boolean: return std::get<bool>(m_data) ? "true" : "false";
        case Type::Integer: return std::to_string(std::get<int64_t>(m_data));
        case Type::Real: return formatDouble(std::get<double>(m_data));
        case Type::Text: return std::get<std::string>(m_data);
        case Type::Raw: return std::get<RawExpression>(m_data).sql;
    }
    return "";
}

std::ostream& operator<<(std::ostream& os, const Value& value) {
    switch (value.type()) {
        case Value::Type::Null: return os << "NULL";
        case Value::Type::Text: return os << '"' << value.asString() << '"';
        case Value::Type::Raw: return os << "raw(" << value.asRaw().sql << ")";
        default: return os << value.toString();
    }
}

const char* valueTypeName(Value::Type type) {
    switch (type) {
        case Value::Type::Null: return "null";
        case Value::Type::Boolean: return "boolean";
        case Value::Type::Integer: return "integer";
        case Value::Type::Real: return "real";
        case Value::Type::Text: return "text";
        case Value::Type::Raw: return "raw";
    }
    return "unknown";
}

}  // namespace sqlquery
