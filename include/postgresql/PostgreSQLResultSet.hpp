#pragma once

/**
 * @file PostgreSQLResultSet.hpp
 * @brief RAII wrapper for PostgreSQL query results.
 *
 * This file provides the ResultSet implementation for libpq: it owns a
 * PGresult*, clears it on destruction, and converts text-format values to
 * typed Values based on each column's type Oid.
 */

#include "ResultSet.hpp"
#include <libpq-fe.h>
#include <string>
#include <vector>

namespace sqlquery {

/**
 * @class PostgreSQLResultSet
 * @brief RAII wrapper for a buffered PostgreSQL result.
 *
 * PostgreSQL loads the entire result into memory at once, so iteration is
 * a cursor over rows already on the client. next() advances the cursor
 * and value() converts the current row's field by type Oid:
 *
 * | Oid                         | Value          |
 * |-----------------------------|----------------|
 * | bool (16)                   | Boolean        |
 * | int2 / int4 / int8          | Integer        |
 * | float4 / float8             | Real           |
 * | bytea (17)                  | Text (decoded) |
 * | numeric and everything else | Text           |
 *
 * Usage:
 * @code
 *   auto results = conn->query("SELECT id, name FROM employees");
 *   while (results->next()) {
 *       int64_t id = results->value(0).asInt64();
 *       std::string name = results->value(1).asString();
 *   }
 * @endcode
 *
 * Thread Safety:
 * - Not thread-safe; each thread should have its own result set.
 */
class PostgreSQLResultSet : public ResultSet {
public:
    /**
     * @brief Construct a result set wrapper.
     * @param res PGresult handle to manage (takes ownership), or nullptr.
     */
    explicit PostgreSQLResultSet(PGresult* res = nullptr);

    /**
     * @brief Destructor - clears the result if still owned.
     */
    ~PostgreSQLResultSet() override;

    // Non-copyable
    PostgreSQLResultSet(const PostgreSQLResultSet&) = delete;
    PostgreSQLResultSet& operator=(const PostgreSQLResultSet&) = delete;

    // Movable
    PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept;
    PostgreSQLResultSet& operator=(PostgreSQLResultSet&& other) noexcept;

    /**
     * @brief Get the underlying PGresult handle.
     * @return Raw PGresult* pointer (still owned by this object).
     */
    PGresult* get() const { return m_res; }

    // ----- ResultSet -----

    std::vector<std::string> columnNames() const override;

    /**
     * @brief Advance to the next row.
     * @return true if a row is available, false when past last row.
     *
     * The first call positions on row 0.
     */
    bool next() override;

    /**
     * @brief Typed value of a field in the current row.
     * @param col Zero-based column index.
     * @return Null for SQL NULL or an out-of-range position.
     */
    Value value(int col) const override;

    // ----- Status checking -----

    /**
     * @brief Check if the result status indicates success.
     * @return true if status is PGRES_TUPLES_OK or PGRES_COMMAND_OK.
     */
    bool isOk() const;

    /**
     * @brief Get the error message if the query failed.
     * @return Error message string, or empty if no error.
     */
    const char* errorMessage() const;

    // ----- Row and column counts -----

    int numFields() const;
    int numRows() const;

    // ----- Direct value access -----

    /**
     * @brief Get the raw text of a value.
     * @param row Zero-based row index.
     * @param col Zero-based column index.
     * @return Value as C string, or nullptr if NULL or out of range.
     */
    const char* getValue(int row, int col) const;

    /**
     * @brief Check if a value is NULL (or out of range).
     */
    bool isNull(int row, int col) const;

    /**
     * @brief Get a column's type Oid.
     * @param col Zero-based column index.
     * @return PostgreSQL type Oid, InvalidOid if out of range.
     */
    Oid fieldType(int col) const;

private:
    PGresult* m_res;        ///< PostgreSQL result handle (owned)
    int m_currentRow = -1;  ///< Current row for cursor access
};

}  // namespace sqlquery
