#include "PostgreSQLGrammar.hpp"

namespace sqlquery {

std::string PostgreSQLGrammar::parameter(size_t index) const {
    return "$" + std::to_string(index + 1);
}

}  // namespace sqlquery
