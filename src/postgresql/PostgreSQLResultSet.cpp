#include "PostgreSQLResultSet.hpp"
#include <cstdlib>

namespace sqlquery {

namespace {

// PostgreSQL OID constants for the types with a native Value mapping
constexpr Oid BOOLOID = 16;
constexpr Oid BYTEAOID = 17;
constexpr Oid INT8OID = 20;
constexpr Oid INT2OID = 21;
constexpr Oid INT4OID = 23;
constexpr Oid FLOAT4OID = 700;
constexpr Oid FLOAT8OID = 701;

Value decodeBytea(const char* text) {
    size_t length = 0;
    unsigned char* bytes = PQunescapeBytea(reinterpret_cast<const unsigned char*>(text), &length);
    if (!bytes) {
        return Value(std::string(text));
    }
    std::string decoded(reinterpret_cast<const char*>(bytes), length);
    PQfreemem(bytes);
    return Value(std::move(decoded));
}

}  // namespace

PostgreSQLResultSet::PostgreSQLResultSet(PGresult* res) : m_res(res), m_currentRow(-1) {}

PostgreSQLResultSet::~PostgreSQLResultSet() {
    if (m_res) {
        PQclear(m_res);
    }
}

PostgreSQLResultSet::PostgreSQLResultSet(PostgreSQLResultSet&& other) noexcept
    : m_res(other.m_res), m_currentRow(other.m_currentRow) {
    other.m_res = nullptr;
    other.m_currentRow = -1;
}

PostgreSQLResultSet& PostgreSQLResultSet::operator=(PostgreSQLResultSet&& other) noexcept {
    if (this != &other) {
        if (m_res) {
            PQclear(m_res);
        }
        m_res = other.m_res;
        m_currentRow = other.m_currentRow;
        other.m_res = nullptr;
        other.m_currentRow = -1;
    }
    return *this;
}

std::vector<std::string> PostgreSQLResultSet::columnNames() const {
    std::vector<std::string> names;
    if (!m_res) return names;

    int nFields = PQnfields(m_res);
    names.reserve(nFields);

    for (int i = 0; i < nFields; ++i) {
        const char* name = PQfname(m_res, i);
        names.emplace_back(name ? name : "");
    }

    return names;
}

bool PostgreSQLResultSet::next() {
    if (!m_res || PQresultStatus(m_res) != PGRES_TUPLES_OK) return false;
    if (m_currentRow >= numRows()) return false;

    m_currentRow++;
    return m_currentRow < numRows();
}

Value PostgreSQLResultSet::value(int col) const {
    const char* text = getValue(m_currentRow, col);
    if (!text) {
        return Value();
    }

    switch (fieldType(col)) {
        case BOOLOID:
            return Value(text[0] == 't');
        case INT2OID:
        case INT4OID:
        case INT8OID:
            return Value(static_cast<int64_t>(std::strtoll(text, nullptr, 10)));
        case FLOAT4OID:
        case FLOAT8OID:
            return Value(std::strtod(text, nullptr));
        case BYTEAOID:
            return decodeBytea(text);
        default:
            return Value(std::string(text, PQgetlength(m_res, m_currentRow, col)));
    }
}

bool PostgreSQLResultSet::isOk() const {
    if (!m_res) return false;
    ExecStatusType status = PQresultStatus(m_res);
    return status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK;
}

const char* PostgreSQLResultSet::errorMessage() const {
    return m_res ? PQresultErrorMessage(m_res) : "No result";
}

int PostgreSQLResultSet::numFields() const {
    return m_res ? PQnfields(m_res) : 0;
}

int PostgreSQLResultSet::numRows() const {
    return m_res ? PQntuples(m_res) : 0;
}

const char* PostgreSQLResultSet::getValue(int row, int col) const {
    if (isNull(row, col)) return nullptr;
    return PQgetvalue(m_res, row, col);
}

bool PostgreSQLResultSet::isNull(int row, int col) const {
    if (!m_res) return true;
    if (row < 0 || row >= numRows()) return true;
    if (col < 0 || col >= numFields()) return true;
    return PQgetisnull(m_res, row, col) != 0;
}

Oid PostgreSQLResultSet::fieldType(int col) const {
    if (!m_res || col < 0 || col >= numFields()) return InvalidOid;
    return PQftype(m_res, col);
}

}  // namespace sqlquery
