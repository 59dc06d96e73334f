#include "Clauses.hpp"

namespace sqlquery {

const char* joinKeyword(JoinType type) {
    switch (type) {
        case JoinType::Inner: return "INNER";
        case JoinType::Left: return "LEFT";
        case JoinType::Right: return "RIGHT";
        case JoinType::Cross: return "CROSS";
    }
    return "INNER";
}

const char* connectiveKeyword(Connective connective) {
    return connective == Connective::Or ? "OR" : "AND";
}

}  // namespace sqlquery
