#include "QueryBuilder.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace sqlquery {

namespace {

std::string normalizeDirection(const std::string& direction) {
    std::string upper = direction;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper == "DESC" ? "DESC" : "ASC";
}

// Result rows are keyed by the bare column name, so "users.name" reads "name"
const Value* findColumn(const Row& row, const std::string& column) {
    auto it = row.find(column);
    if (it != row.end()) return &it->second;

    auto dot = column.rfind('.');
    if (dot != std::string::npos) {
        it = row.find(column.substr(dot + 1));
        if (it != row.end()) return &it->second;
    }
    return nullptr;
}

// Integer sent back as text by the driver (PostgreSQL NUMERIC, string ids)
int64_t parseInteger(const std::string& text, const std::string& what) {
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (text.empty() || errno != 0 || end != text.c_str() + text.size()) {
        throw DatabaseException(ErrorKind::Other,
                                what + " returned non-integer value '" + text + "'");
    }
    return static_cast<int64_t>(value);
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

QueryBuilder::QueryBuilder(std::shared_ptr<const Grammar> grammar, const std::string& table)
    : QueryBuilder(Executor(), std::move(grammar), table) {
}

QueryBuilder::QueryBuilder(Executor executor, std::shared_ptr<const Grammar> grammar,
                           const std::string& table)
    : m_executor(std::move(executor))
    , m_grammar(grammar ? std::move(grammar) : std::make_shared<const Grammar>()) {
    m_state.table = table;
}

// ============================================================================
// Projection
// ============================================================================

QueryBuilder& QueryBuilder::select(const std::vector<std::string>& columns) {
    if (!columns.empty()) {
        m_state.columns = columns;
    }
    return *this;
}

QueryBuilder& QueryBuilder::selectRaw(const std::string& expression, const Bindings& bindings) {
    m_state.columns.push_back(expression);
    m_state.selectBindings.insert(m_state.selectBindings.end(), bindings.begin(), bindings.end());
    return *this;
}

QueryBuilder& QueryBuilder::distinct() {
    m_state.distinct = true;
    return *this;
}

QueryBuilder& QueryBuilder::from(const std::string& table) {
    m_state.table = table;
    return *this;
}

// ============================================================================
// Joins
// ============================================================================

QueryBuilder& QueryBuilder::join(const std::string& table, const std::string& first,
                                 const std::string& op, const std::string& second) {
    return addJoin(JoinType::Inner, table, first, op, second);
}

QueryBuilder& QueryBuilder::leftJoin(const std::string& table, const std::string& first,
                                     const std::string& op, const std::string& second) {
    return addJoin(JoinType::Left, table, first, op, second);
}

QueryBuilder& QueryBuilder::rightJoin(const std::string& table, const std::string& first,
                                      const std::string& op, const std::string& second) {
    return addJoin(JoinType::Right, table, first, op, second);
}

QueryBuilder& QueryBuilder::crossJoin(const std::string& table) {
    return addJoin(JoinType::Cross, table, "", "", "");
}

QueryBuilder& QueryBuilder::addJoin(JoinType type, const std::string& table,
                                    const std::string& first, const std::string& op,
                                    const std::string& second) {
    m_state.joins.push_back(JoinClause{type, table, first, op, second});
    return *this;
}

// ============================================================================
// Conditions
// ============================================================================

QueryBuilder& QueryBuilder::where(const std::string& column, const std::string& op,
                                  const Value& value) {
    return addWhere(Connective::And, predicate::Basic{column, op, value});
}

QueryBuilder& QueryBuilder::orWhere(const std::string& column, const std::string& op,
                                    const Value& value) {
    return addWhere(Connective::Or, predicate::Basic{column, op, value});
}

QueryBuilder& QueryBuilder::whereIn(const std::string& column, const Bindings& values) {
    return addWhere(Connective::And, predicate::In{column, values});
}

QueryBuilder& QueryBuilder::whereNotIn(const std::string& column, const Bindings& values) {
    return addWhere(Connective::And, predicate::NotIn{column, values});
}

QueryBuilder& QueryBuilder::whereNull(const std::string& column) {
    return addWhere(Connective::And, predicate::Null{column});
}

QueryBuilder& QueryBuilder::whereNotNull(const std::string& column) {
    return addWhere(Connective::And, predicate::NotNull{column});
}

QueryBuilder& QueryBuilder::whereBetween(const std::string& column, const Value& low,
                                         const Value& high) {
    return addWhere(Connective::And, predicate::Between{column, low, high});
}

QueryBuilder& QueryBuilder::whereRaw(const std::string& sql, const Bindings& bindings) {
    return addWhere(Connective::And, predicate::Raw{sql, bindings});
}

QueryBuilder& QueryBuilder::addWhere(Connective boolean, Predicate predicate) {
    m_state.wheres.push_back(Condition{boolean, std::move(predicate)});
    return *this;
}

// ============================================================================
// Grouping
// ============================================================================

QueryBuilder& QueryBuilder::groupBy(const std::vector<std::string>& columns) {
    m_state.groups.insert(m_state.groups.end(), columns.begin(), columns.end());
    return *this;
}

QueryBuilder& QueryBuilder::having(const std::string& column, const std::string& op,
                                   const Value& value) {
    m_state.havings.push_back(Condition{Connective::And, predicate::Basic{column, op, value}});
    return *this;
}

QueryBuilder& QueryBuilder::havingRaw(const std::string& sql, const Bindings& bindings) {
    m_state.havings.push_back(Condition{Connective::And, predicate::Raw{sql, bindings}});
    return *this;
}

// ============================================================================
// Ordering and pagination
// ============================================================================

QueryBuilder& QueryBuilder::orderBy(const std::string& column, const std::string& direction) {
    OrderClause order;
    order.column = column;
    order.direction = normalizeDirection(direction);
    m_state.orders.push_back(std::move(order));
    return *this;
}

QueryBuilder& QueryBuilder::orderByDesc(const std::string& column) {
    return orderBy(column, "desc");
}

QueryBuilder& QueryBuilder::orderByRaw(const std::string& sql, const Bindings& bindings) {
    OrderClause order;
    order.raw = sql;
    order.bindings = bindings;
    m_state.orders.push_back(std::move(order));
    return *this;
}

QueryBuilder& QueryBuilder::limit(int64_t value) {
    m_state.limit = value;
    return *this;
}

QueryBuilder& QueryBuilder::offset(int64_t value) {
    m_state.offset = value;
    return *this;
}

QueryBuilder& QueryBuilder::forPage(int64_t page, int64_t perPage) {
    if (page < 1) {
        page = 1;
    }
    m_state.offset = (page - 1) * perPage;
    m_state.limit = perPage;
    return *this;
}

// ============================================================================
// Execution settings
// ============================================================================

QueryBuilder& QueryBuilder::withContext(const QueryContext& context) {
    m_context = context;
    return *this;
}

QueryBuilder& QueryBuilder::setError(std::exception_ptr error) {
    m_error = std::move(error);
    return *this;
}

// ============================================================================
// Reads
// ============================================================================

Rows QueryBuilder::get() {
    ErrorContext errorContext("select " + m_state.table);
    return query(m_grammar->compileSelect(m_state));
}

std::optional<Row> QueryBuilder::first() {
    m_state.limit = 1;

    Rows rows = get();
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::move(rows.front());
}

std::optional<Row> QueryBuilder::find(const Value& id) {
    return where("id", "=", id).first();
}

Value QueryBuilder::value(const std::string& column) {
    m_state.columns = {column};
    m_state.selectBindings.clear();

    auto row = first();
    if (!row) {
        return Value();
    }

    const Value* found = findColumn(*row, column);
    return found ? *found : Value();
}

std::vector<Value> QueryBuilder::pluck(const std::string& column) {
    m_state.columns = {column};
    m_state.selectBindings.clear();

    std::vector<Value> values;
    for (const auto& row : get()) {
        const Value* found = findColumn(row, column);
        values.push_back(found ? *found : Value());
    }
    return values;
}

bool QueryBuilder::exists() {
    return count() > 0;
}

bool QueryBuilder::doesntExist() {
    return !exists();
}

int64_t QueryBuilder::count() {
    Value result = aggregate("COUNT", "*");

    if (result.isNull()) return 0;
    if (result.isString()) return parseInteger(result.asString(), "COUNT");
    if (result.isDouble()) return static_cast<int64_t>(result.asDouble());
    return result.asInt64();
}

Value QueryBuilder::max(const std::string& column) {
    return aggregate("MAX", column);
}

Value QueryBuilder::min(const std::string& column) {
    return aggregate("MIN", column);
}

double QueryBuilder::sum(const std::string& column) {
    return numericAggregate("SUM", column);
}

double QueryBuilder::avg(const std::string& column) {
    return numericAggregate("AVG", column);
}

Value QueryBuilder::aggregate(const std::string& function, const std::string& column) const {
    ErrorContext errorContext(function + " " + m_state.table);

    // Runs on a copy so the receiver's projection and limit stay untouched
    QueryBuilder query = clone();
    std::string target = column == "*" ? column : m_grammar->wrapColumn(column);
    query.m_state.columns = {function + "(" + target + ") AS aggregate"};
    query.m_state.selectBindings.clear();
    query.m_state.offset.reset();
    if (query.m_state.groups.empty()) {
        query.m_state.orders.clear();
    }

    auto row = query.first();
    if (!row) {
        return Value();
    }

    auto it = row->find("aggregate");
    return it != row->end() ? it->second : Value();
}

double QueryBuilder::numericAggregate(const std::string& function, const std::string& column) const {
    Value result = aggregate(function, column);

    switch (result.type()) {
        case Value::Type::Null:
            return 0.0;
        case Value::Type::Integer:
        case Value::Type::Real:
            return result.asDouble();
        case Value::Type::Text:
            // NUMERIC columns arrive as text from PostgreSQL
            try {
                return std::stod(result.asString());
            } catch (const std::logic_error&) {
                throw DatabaseException(ErrorKind::Other,
                                        function + " returned non-numeric value '" +
                                        result.asString() + "'");
            }
        default:
            throw DatabaseException(ErrorKind::Other,
                                    function + " returned unexpected " +
                                    valueTypeName(result.type()) + " value");
    }
}

// ============================================================================
// Writes
// ============================================================================

int64_t QueryBuilder::insert(const ValueMap& values) {
    ErrorContext errorContext("insert " + m_state.table);
    return exec(m_grammar->compileInsert(m_state, values)).rowsAffected();
}

int64_t QueryBuilder::insertGetId(const ValueMap& values) {
    ErrorContext errorContext("insertGetId " + m_state.table);
    CompiledQuery compiled = m_grammar->compileInsert(m_state, values);

    // PostgreSQL has no last-insert-id; ask the statement for the key instead
    if (m_grammar->dialect() == Dialect::PostgreSQL) {
        compiled.sql += " RETURNING id";

        auto row = queryRow(compiled);
        if (!row) {
            throw DatabaseException(ErrorKind::NotFound, "sql: no rows in result set");
        }

        const Value* id = findColumn(*row, "id");
        if (!id || id->isNull()) {
            throw DatabaseException(ErrorKind::NotFound, "INSERT ... RETURNING id returned no id");
        }
        if (id->isString()) {
            return parseInteger(id->asString(), "INSERT ... RETURNING id");
        }
        if (!id->isInt()) {
            throw DatabaseException(ErrorKind::Other,
                                    std::string("INSERT ... RETURNING id returned ") +
                                    valueTypeName(id->type()) + " value");
        }
        return id->asInt64();
    }

    return exec(compiled).lastInsertId();
}

int64_t QueryBuilder::insertBatch(const std::vector<ValueMap>& records) {
    int64_t total = 0;

    for (const auto& record : records) {
        try {
            total += clone().insert(record);
        } catch (const std::exception& e) {
            // Rows already inserted stay inserted
            spdlog::warn("Batch insert into '{}' stopped after {} rows: {}",
                         m_state.table, total, e.what());
            throw;
        }
    }

    return total;
}

int64_t QueryBuilder::update(const ValueMap& values) {
    ErrorContext errorContext("update " + m_state.table);
    return exec(m_grammar->compileUpdate(m_state, values)).rowsAffected();
}

int64_t QueryBuilder::increment(const std::string& column, int64_t amount) {
    return update({{column, RawExpression{m_grammar->wrapColumn(column) + " + " +
                                          std::to_string(amount)}}});
}

int64_t QueryBuilder::decrement(const std::string& column, int64_t amount) {
    return update({{column, RawExpression{m_grammar->wrapColumn(column) + " - " +
                                          std::to_string(amount)}}});
}

int64_t QueryBuilder::remove() {
    ErrorContext errorContext("delete " + m_state.table);
    return exec(m_grammar->compileDelete(m_state)).rowsAffected();
}

void QueryBuilder::truncate() {
    ErrorContext errorContext("truncate " + m_state.table);
    exec(m_grammar->compileTruncate(m_state));
}

CompiledQuery QueryBuilder::toSql() const {
    return m_grammar->compileSelect(m_state);
}

// ============================================================================
// Execution
// ============================================================================

void QueryBuilder::checkError() const {
    if (m_error) {
        std::rethrow_exception(m_error);
    }
}

Rows QueryBuilder::query(const CompiledQuery& compiled) const {
    checkError();
    return m_executor.query(m_context, compiled);
}

std::optional<Row> QueryBuilder::queryRow(const CompiledQuery& compiled) const {
    checkError();
    return m_executor.queryRow(m_context, compiled);
}

ExecResult QueryBuilder::exec(const CompiledQuery& compiled) const {
    checkError();
    return m_executor.exec(m_context, compiled);
}

}  // namespace sqlquery
