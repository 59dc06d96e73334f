#pragma once

/**
 * @file SQLiteGrammar.hpp
 * @brief SQLite dialect: '?' placeholders, no TRUNCATE statement.
 */

#include "Grammar.hpp"

namespace sqlquery {

/**
 * @class SQLiteGrammar
 * @brief Grammar for SQLite databases.
 *
 * Quoting and placeholders are identical to the base grammar; the class
 * exists so callers can branch on Dialect::SQLite and so statements SQLite
 * does not understand can be rewritten.
 *
 * SQLite has no TRUNCATE. An unqualified DELETE triggers the truncate
 * optimization, which is the closest equivalent.
 */
class SQLiteGrammar : public Grammar {
public:
    Dialect dialect() const override { return Dialect::SQLite; }

    /**
     * @brief Compile a table truncation.
     * @return "DELETE FROM <table>" without bindings.
     */
    CompiledQuery compileTruncate(const QueryState& query) const override;
};

}  // namespace sqlquery
