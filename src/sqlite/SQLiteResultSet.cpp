/**
 * @file SQLiteResultSet.cpp
 * @brief Implementation of RAII SQLite result set wrapper.
 *
 * Implements the SQLiteResultSet class which provides a safe wrapper around
 * sqlite3_stmt prepared statement handles with automatic finalization.
 * Uses the step() iteration pattern to retrieve rows one at a time.
 */

#include "SQLiteResultSet.hpp"
#include "ErrorHandler.hpp"

namespace sqlquery {

namespace {

// Virtual machine instructions between context checks
constexpr int kProgressInterval = 1000;

int progressHandler(void* arg) {
    return static_cast<const QueryContext*>(arg)->isExpired() ? 1 : 0;
}

}  // namespace

// ============================================================================
// Interrupt Guard
// ============================================================================

SQLiteInterruptGuard::SQLiteInterruptGuard(sqlite3* db, const QueryContext& context)
    : m_db(db) {
    if (m_db) {
        sqlite3_progress_handler(m_db, kProgressInterval, progressHandler,
                                 const_cast<QueryContext*>(&context));
    }
}

SQLiteInterruptGuard::~SQLiteInterruptGuard() {
    if (m_db) {
        sqlite3_progress_handler(m_db, 0, nullptr, nullptr);
    }
}

// ============================================================================
// Construction and Destruction
// ============================================================================

SQLiteResultSet::SQLiteResultSet(sqlite3_stmt* stmt, QueryContext context)
    : m_stmt(stmt), m_context(std::move(context)) {}

SQLiteResultSet::~SQLiteResultSet() {
    finalize();
}

// ============================================================================
// Move Operations
// ============================================================================

SQLiteResultSet::SQLiteResultSet(SQLiteResultSet&& other) noexcept
    : m_stmt(other.m_stmt), m_context(other.m_context), m_done(other.m_done) {
    other.m_stmt = nullptr;
}

SQLiteResultSet& SQLiteResultSet::operator=(SQLiteResultSet&& other) noexcept {
    if (this != &other) {
        finalize();
        m_stmt = other.m_stmt;
        m_context = other.m_context;
        m_done = other.m_done;
        other.m_stmt = nullptr;
    }
    return *this;
}

// ============================================================================
// Row Iteration
// ============================================================================

std::vector<std::string> SQLiteResultSet::columnNames() const {
    std::vector<std::string> names;
    int count = columnCount();
    names.reserve(count);
    for (int i = 0; i < count; ++i) {
        names.push_back(columnName(i));
    }
    return names;
}

bool SQLiteResultSet::next() {
    if (!m_stmt || m_done) return false;

    sqlite3* db = sqlite3_db_handle(m_stmt);
    int rc;
    {
        SQLiteInterruptGuard guard(db, m_context);
        rc = sqlite3_step(m_stmt);
    }

    // SQLITE_ROW indicates a row is available; SQLITE_DONE means no more rows
    if (rc == SQLITE_ROW) {
        return true;
    }

    m_done = true;
    if (rc == SQLITE_DONE) {
        return false;
    }

    if (rc == SQLITE_INTERRUPT) {
        m_context.check();
    }
    throw SQLiteException(rc, sqlite3_errmsg(db));
}

// ============================================================================
// Column Access
// ============================================================================

Value SQLiteResultSet::value(int index) const {
    if (!m_stmt) return Value();

    switch (sqlite3_column_type(m_stmt, index)) {
        case SQLITE_INTEGER:
            return Value(getInt64(index));
        case SQLITE_FLOAT:
            return Value(sqlite3_column_double(m_stmt, index));
        case SQLITE_TEXT:
        case SQLITE_BLOB:
            return Value(getString(index));
        case SQLITE_NULL:
        default:
            return Value();
    }
}

int SQLiteResultSet::columnCount() const {
    return m_stmt ? sqlite3_column_count(m_stmt) : 0;
}

std::string SQLiteResultSet::columnName(int index) const {
    if (!m_stmt) return "";
    const char* name = sqlite3_column_name(m_stmt, index);
    return name ? name : "";
}

std::string SQLiteResultSet::getString(int index) const {
    if (!m_stmt || isNull(index)) return "";

    if (sqlite3_column_type(m_stmt, index) == SQLITE_BLOB) {
        const void* blob = sqlite3_column_blob(m_stmt, index);
        int size = sqlite3_column_bytes(m_stmt, index);
        return blob ? std::string(static_cast<const char*>(blob), size) : "";
    }

    const unsigned char* text = sqlite3_column_text(m_stmt, index);
    int size = sqlite3_column_bytes(m_stmt, index);
    return text ? std::string(reinterpret_cast<const char*>(text), size) : "";
}

int64_t SQLiteResultSet::getInt64(int index) const {
    if (!m_stmt) return 0;
    return sqlite3_column_int64(m_stmt, index);
}

bool SQLiteResultSet::isNull(int index) const {
    if (!m_stmt) return true;
    return sqlite3_column_type(m_stmt, index) == SQLITE_NULL;
}

// ============================================================================
// Statement Management
// ============================================================================

void SQLiteResultSet::finalize() {
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
    }
}

}  // namespace sqlquery
