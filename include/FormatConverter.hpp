#pragma once

#include "Value.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace sqlquery {

using json = nlohmann::json;

// Options structs declared outside the class to avoid default argument issues
struct CSVOptions {
    char delimiter = ',';
    char quote = '"';
    std::string lineEnding = "\n";
    bool includeHeader = true;
    bool quoteAll = false;
};

struct JSONOptions {
    bool pretty = true;
    int indent = 2;
    bool includeNull = true;
    bool arrayFormat = true;  // true = array of objects, false = object with rows array
};

// Renders query results and bindings for output
class FormatConverter {
public:
    // Rows as CSV; columns are the union of row keys in first-seen order
    static std::string toCSV(const Rows& rows, const CSVOptions& options = CSVOptions{});

    // Rows as CSV with an explicit column order; missing keys render empty
    static std::string toCSV(const std::vector<std::string>& columns, const Rows& rows,
                             const CSVOptions& options = CSVOptions{});

    static std::string toJSON(const Rows& rows, const JSONOptions& options = JSONOptions{});
    static std::string rowToJSON(const Row& row, const JSONOptions& options = JSONOptions{});

    // Positional bindings as a JSON array
    static std::string bindingsToJSON(const Bindings& bindings, bool pretty = false);

    static json valueToJSON(const Value& value);

    // Column names across all rows, first row's keys first
    static std::vector<std::string> collectColumns(const Rows& rows);

    // CSV utility functions
    static std::string escapeCSVField(const std::string& field,
                                      const CSVOptions& options = CSVOptions{});
};

}  // namespace sqlquery
