#include "SQLiteGrammar.hpp"

namespace sqlquery {

CompiledQuery SQLiteGrammar::compileTruncate(const QueryState& query) const {
    return CompiledQuery{"DELETE FROM " + wrapTable(query.table), {}};
}

}  // namespace sqlquery
