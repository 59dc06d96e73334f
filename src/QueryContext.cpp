#include "QueryContext.hpp"
#include "ErrorHandler.hpp"

namespace sqlquery {

QueryContext::QueryContext()
    : m_cancelled(std::make_shared<std::atomic<bool>>(false)) {
}

QueryContext QueryContext::background() {
    return QueryContext();
}

QueryContext QueryContext::withTimeout(std::chrono::milliseconds timeout) {
    return withDeadline(Clock::now() + timeout);
}

QueryContext QueryContext::withDeadline(Clock::time_point deadline) {
    QueryContext ctx;
    ctx.m_deadline = deadline;
    return ctx;
}

void QueryContext::cancel() const {
    m_cancelled->store(true);
}

bool QueryContext::isCancelled() const {
    return m_cancelled->load();
}

bool QueryContext::isExpired() const {
    if (isCancelled()) return true;
    return m_deadline && Clock::now() >= *m_deadline;
}

std::optional<std::chrono::milliseconds> QueryContext::remaining() const {
    if (!m_deadline) return std::nullopt;

    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*m_deadline - Clock::now());
    if (left.count() < 0) return std::chrono::milliseconds(0);
    return left;
}

void QueryContext::check() const {
    if (isCancelled()) {
        throw DatabaseException(ErrorKind::Cancelled, "context canceled");
    }
    if (m_deadline && Clock::now() >= *m_deadline) {
        throw DatabaseException(ErrorKind::Timeout, "context deadline exceeded");
    }
}

}  // namespace sqlquery
