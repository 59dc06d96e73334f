#include "ResultSet.hpp"
#include "ErrorHandler.hpp"

namespace sqlquery {

Rows scanRows(ResultSet& results) {
    Rows rows;
    const auto columns = results.columnNames();

    while (results.next()) {
        Row row;
        for (size_t i = 0; i < columns.size(); ++i) {
            row[columns[i]] = results.value(static_cast<int>(i));
        }
        rows.push_back(std::move(row));
    }

    return rows;
}

int64_t ExecResult::rowsAffected() const {
    if (!m_rowsAffected) {
        throw DatabaseException(ErrorKind::Unsupported,
                                "RowsAffected is not supported by this driver");
    }
    return *m_rowsAffected;
}

int64_t ExecResult::lastInsertId() const {
    if (!m_lastInsertId) {
        throw DatabaseException(ErrorKind::Unsupported,
                                "LastInsertId is not supported by this driver");
    }
    return *m_lastInsertId;
}

}  // namespace sqlquery
