#pragma once

/**
 * @file PostgreSQLGrammar.hpp
 * @brief PostgreSQL dialect: numbered placeholders ($1, $2, ...).
 */

#include "Grammar.hpp"

namespace sqlquery {

/**
 * @class PostgreSQLGrammar
 * @brief Grammar emitting PostgreSQL positional parameters.
 *
 * Identifier quoting is the ANSI double-quote form shared with the base
 * grammar. Placeholders are numbered from 1 in the order bindings are
 * appended, across every clause of one statement:
 *
 * @code
 *   UPDATE "users" SET "name" = $1, "status" = $2 WHERE "id" = $3
 * @endcode
 */
class PostgreSQLGrammar : public Grammar {
public:
    Dialect dialect() const override { return Dialect::PostgreSQL; }

    /**
     * @brief Placeholder for a zero-based binding position.
     * @return "$" followed by index + 1.
     */
    std::string parameter(size_t index) const override;
};

}  // namespace sqlquery
