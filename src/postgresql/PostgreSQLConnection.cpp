#include "PostgreSQLConnection.hpp"
#include "ErrorHandler.hpp"
#include <spdlog/spdlog.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <vector>

namespace sqlquery {

namespace {

// Poll slice while waiting for a statement, bounds cancel latency
constexpr int kPollSliceMs = 100;

// Quote a conninfo value, escaping quotes and backslashes
std::string quoteConnValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') quoted += '\\';
        quoted += c;
    }
    quoted += "'";
    return quoted;
}

std::string stripTrailingNewline(std::string message) {
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
    return message;
}

}  // namespace

// ============================================================================
// Construction and Destruction
// ============================================================================

PostgreSQLConnection::PostgreSQLConnection(std::string name, const std::string& conninfo)
    : Connection(std::move(name), "pgsql") {
    m_conn = PQconnectdb(conninfo.c_str());

    if (!m_conn || PQstatus(m_conn) != CONNECTION_OK) {
        std::string message = m_conn ? stripTrailingNewline(PQerrorMessage(m_conn))
                                     : "out of memory allocating PGconn";
        if (m_conn) {
            PQfinish(m_conn);
            m_conn = nullptr;
        }
        spdlog::error("Failed to connect to PostgreSQL [{}]: {}", this->name(), message);
        throw PostgreSQLException("08001", message);
    }

    if (PQsetClientEncoding(m_conn, "UTF8") != 0) {
        spdlog::warn("Could not set UTF8 client encoding on [{}]", this->name());
    }

    spdlog::info("Connected to PostgreSQL [{}] (server {})", this->name(),
                 PQserverVersion(m_conn));
}

PostgreSQLConnection::~PostgreSQLConnection() {
    close();
}

std::string PostgreSQLConnection::buildConnInfo(const ConnectionConfig& config) {
    std::ostringstream connInfo;

    connInfo << "host=" << quoteConnValue(config.host);
    connInfo << " port=" << (config.port == 0 ? 5432 : config.port);

    if (!config.username.empty()) {
        connInfo << " user=" << quoteConnValue(config.username);
    }

    if (!config.password.empty()) {
        connInfo << " password=" << quoteConnValue(config.password);
    }

    if (!config.database.empty()) {
        connInfo << " dbname=" << quoteConnValue(config.database);
    }

    // libpq takes whole seconds
    connInfo << " connect_timeout=" << std::max<int64_t>(1, config.connect_timeout.count() / 1000);

    connInfo << " sslmode=" << quoteConnValue(config.sslmode.empty() ? "disable" : config.sslmode);
    if (!config.ssl_ca.empty()) {
        connInfo << " sslrootcert=" << quoteConnValue(config.ssl_ca);
    }
    if (!config.ssl_cert.empty()) {
        connInfo << " sslcert=" << quoteConnValue(config.ssl_cert);
    }
    if (!config.ssl_key.empty()) {
        connInfo << " sslkey=" << quoteConnValue(config.ssl_key);
    }

    connInfo << " application_name=sql-query";

    return connInfo.str();
}

// ============================================================================
// Query Execution
// ============================================================================

ResultSetPtr PostgreSQLConnection::queryContext(const QueryContext& ctx, const std::string& sql,
                                                const Bindings& bindings) {
    return std::make_unique<PostgreSQLResultSet>(execute(ctx, sql, bindings));
}

ExecResult PostgreSQLConnection::execContext(const QueryContext& ctx, const std::string& sql,
                                             const Bindings& bindings) {
    PostgreSQLResultSet result = execute(ctx, sql, bindings);
    return ExecResult(affectedRows(result.get()), std::nullopt);
}

PostgreSQLResultSet PostgreSQLConnection::execute(const QueryContext& ctx, const std::string& sql,
                                                  const Bindings& bindings) {
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_conn) {
        throw DatabaseException(ErrorKind::Connection, "connection [" + name() + "] is closed");
    }
    ctx.check();

    // Text-format parameters; nullptr marks SQL NULL
    std::vector<std::string> texts(bindings.size());
    std::vector<const char*> values(bindings.size(), nullptr);
    for (size_t i = 0; i < bindings.size(); ++i) {
        const Value& value = bindings[i];
        if (value.isRaw()) {
            throw DatabaseException(ErrorKind::Unsupported,
                                    "raw expression cannot be bound as parameter $" +
                                    std::to_string(i + 1));
        }
        if (value.isNull()) continue;
        texts[i] = value.toString();
        values[i] = texts[i].c_str();
    }

    if (!PQsendQueryParams(m_conn, sql.c_str(), static_cast<int>(bindings.size()), nullptr,
                           values.data(), nullptr, nullptr, 0)) {
        std::string message = stripTrailingNewline(PQerrorMessage(m_conn));
        throw PostgreSQLException(PQstatus(m_conn) == CONNECTION_OK ? "" : "08006", message);
    }

    bool cancelled = false;
    try {
        cancelled = waitForResult(ctx);
    } catch (const DatabaseException& e) {
        // Results of the sent statement are still pending on a socket that
        // can no longer be read; the handle is unusable for further statements
        spdlog::warn("Dropping PostgreSQL connection [{}] after failed wait: {}", name(), e.what());
        PQfinish(m_conn);
        m_conn = nullptr;
        throw;
    }

    // One statement yields one result; drain anything after it
    PostgreSQLResultSet result(PQgetResult(m_conn));
    while (PGresult* extra = PQgetResult(m_conn)) {
        PQclear(extra);
    }

    if (!result.get()) {
        throw PostgreSQLException("", stripTrailingNewline(PQerrorMessage(m_conn)));
    }

    if (!result.isOk()) {
        const char* state = PQresultErrorField(result.get(), PG_DIAG_SQLSTATE);
        std::string sqlState = state ? state : "";
        std::string message = stripTrailingNewline(result.errorMessage());

        if (cancelled && sqlState == "57014") {
            ctx.check();
        }
        throw PostgreSQLException(sqlState, message);
    }

    return result;
}

bool PostgreSQLConnection::waitForResult(const QueryContext& ctx) {
    bool cancelRequested = false;

    while (PQisBusy(m_conn)) {
        if (!cancelRequested && ctx.isExpired()) {
            cancelRunning();
            cancelRequested = true;
        }

        int timeoutMs = kPollSliceMs;
        if (auto remaining = ctx.remaining(); remaining && !cancelRequested) {
            timeoutMs = static_cast<int>(std::min<int64_t>(kPollSliceMs, remaining->count()));
        }

        pollfd pfd{};
        pfd.fd = PQsocket(m_conn);
        pfd.events = POLLIN;
        if (pfd.fd < 0) {
            throw PostgreSQLException("08006", "connection socket is not open");
        }

        if (poll(&pfd, 1, timeoutMs) < 0 && errno != EINTR) {
            throw DatabaseException(ErrorKind::Connection,
                                    std::string("poll failed: ") + std::strerror(errno));
        }

        if (!PQconsumeInput(m_conn)) {
            throw PostgreSQLException("08006", stripTrailingNewline(PQerrorMessage(m_conn)));
        }
    }

    return cancelRequested;
}

void PostgreSQLConnection::cancelRunning() {
    PGcancel* cancel = PQgetCancel(m_conn);
    if (!cancel) {
        spdlog::warn("Cannot obtain cancel handle for [{}]", name());
        return;
    }

    char errbuf[256];
    if (!PQcancel(cancel, errbuf, sizeof(errbuf))) {
        spdlog::warn("Cancel request for [{}] failed: {}", name(), errbuf);
    } else {
        spdlog::debug("Cancel request sent for [{}]", name());
    }
    PQfreeCancel(cancel);
}

// ============================================================================
// Connection State
// ============================================================================

void PostgreSQLConnection::ping() {
    exec("SELECT 1");
}

bool PostgreSQLConnection::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_conn != nullptr && PQstatus(m_conn) == CONNECTION_OK;
}

void PostgreSQLConnection::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_conn) {
        PQfinish(m_conn);
        m_conn = nullptr;
        spdlog::debug("Closed PostgreSQL connection [{}]", name());
    }
}

std::string PostgreSQLConnection::error() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_conn) return "No connection";
    return PQerrorMessage(m_conn);
}

int64_t PostgreSQLConnection::affectedRows(PGresult* result) {
    if (!result) return 0;
    const char* affected = PQcmdTuples(result);
    if (!affected || !*affected) return 0;
    return std::strtoll(affected, nullptr, 10);
}

}  // namespace sqlquery
