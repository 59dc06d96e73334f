#include "FormatConverter.hpp"
#include <set>
#include <sstream>

namespace sqlquery {

namespace {

json rowObject(const Row& row, const JSONOptions& options) {
    json obj = json::object();

    for (const auto& [key, value] : row) {
        if (!value.isNull()) {
            obj[key] = FormatConverter::valueToJSON(value);
        } else if (options.includeNull) {
            obj[key] = nullptr;
        }
    }

    return obj;
}

std::string dump(const json& value, bool pretty, int indent) {
    return pretty ? value.dump(indent) : value.dump();
}

}  // namespace

json FormatConverter::valueToJSON(const Value& value) {
    switch (value.type()) {
        case Value::Type::Null:
            return nullptr;
        case Value::Type::Boolean:
            return value.asBool();
        case Value::Type::Integer:
            return value.asInt64();
        case Value::Type::Real:
            return value.asDouble();
        case Value::Type::Text:
            return value.asString();
        case Value::Type::Raw:
        default:
            return value.toString();
    }
}

std::vector<std::string> FormatConverter::collectColumns(const Rows& rows) {
    std::vector<std::string> columns;
    std::set<std::string> seen;

    for (const auto& row : rows) {
        for (const auto& entry : row) {
            if (seen.insert(entry.first).second) {
                columns.push_back(entry.first);
            }
        }
    }

    return columns;
}

std::string FormatConverter::toCSV(const Rows& rows, const CSVOptions& options) {
    return toCSV(collectColumns(rows), rows, options);
}

std::string FormatConverter::toCSV(const std::vector<std::string>& columns, const Rows& rows,
                                   const CSVOptions& options) {
    std::ostringstream out;

    // Header
    if (options.includeHeader) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;
            out << escapeCSVField(columns[i], options);
        }
        out << options.lineEnding;
    }

    // Rows
    for (const auto& row : rows) {
        for (size_t i = 0; i < columns.size(); ++i) {
            if (i > 0) out << options.delimiter;

            auto it = row.find(columns[i]);
            if (it != row.end() && !it->second.isNull()) {
                out << escapeCSVField(it->second.toString(), options);
            }
        }
        out << options.lineEnding;
    }

    return out.str();
}

std::string FormatConverter::toJSON(const Rows& rows, const JSONOptions& options) {
    json arr = json::array();

    for (const auto& row : rows) {
        arr.push_back(rowObject(row, options));
    }

    if (options.arrayFormat) {
        return dump(arr, options.pretty, options.indent);
    }

    json wrapper = json::object();
    wrapper["rows"] = std::move(arr);
    wrapper["count"] = rows.size();
    return dump(wrapper, options.pretty, options.indent);
}

std::string FormatConverter::rowToJSON(const Row& row, const JSONOptions& options) {
    return dump(rowObject(row, options), options.pretty, options.indent);
}

std::string FormatConverter::bindingsToJSON(const Bindings& bindings, bool pretty) {
    json arr = json::array();
    for (const auto& value : bindings) {
        arr.push_back(valueToJSON(value));
    }
    return dump(arr, pretty, 2);
}

std::string FormatConverter::escapeCSVField(const std::string& field,
                                            const CSVOptions& options) {
    bool needs_quoting = options.quoteAll;

    if (!needs_quoting) {
        for (char c : field) {
            if (c == options.delimiter || c == options.quote ||
                c == '\n' || c == '\r') {
                needs_quoting = true;
                break;
            }
        }
    }

    if (!needs_quoting) {
        return field;
    }

    std::string result;
    result.reserve(field.size() + 2);
    result += options.quote;

    for (char c : field) {
        if (c == options.quote) {
            result += options.quote;  // Double the quote
        }
        result += c;
    }

    result += options.quote;
    return result;
}

}  // namespace sqlquery
