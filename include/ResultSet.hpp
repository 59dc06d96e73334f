#pragma once

#include "Value.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sqlquery {

// Forward-only cursor over the rows of one statement
class ResultSet {
public:
    virtual ~ResultSet() = default;

    virtual std::vector<std::string> columnNames() const = 0;

    // Advance to the next row; false once exhausted. Throws on driver errors.
    virtual bool next() = 0;

    // Value of a column in the current row
    virtual Value value(int column) const = 0;
};

using ResultSetPtr = std::unique_ptr<ResultSet>;

// Drain the remaining rows of a result set, keyed by column name
Rows scanRows(ResultSet& results);

// Outcome of a statement executed without a result set
class ExecResult {
public:
    ExecResult() = default;
    ExecResult(std::optional<int64_t> rowsAffected, std::optional<int64_t> lastInsertId)
        : m_rowsAffected(rowsAffected), m_lastInsertId(lastInsertId) {}

    // Both throw DatabaseException(Unsupported) when the driver has no value
    int64_t rowsAffected() const;
    int64_t lastInsertId() const;

private:
    std::optional<int64_t> m_rowsAffected;
    std::optional<int64_t> m_lastInsertId;
};

}  // namespace sqlquery
