#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace sqlquery {

// Deadline and cancellation carried alongside a statement. Copies share the
// cancellation flag, so cancelling any copy cancels them all.
class QueryContext {
public:
    using Clock = std::chrono::steady_clock;

    QueryContext();

    // Never expires and cannot time out
    static QueryContext background();
    static QueryContext withTimeout(std::chrono::milliseconds timeout);
    static QueryContext withDeadline(Clock::time_point deadline);

    void cancel() const;
    bool isCancelled() const;
    bool isExpired() const;  // cancelled or past the deadline

    std::optional<Clock::time_point> deadline() const { return m_deadline; }

    // Time left before the deadline, zero once passed; nullopt without deadline
    std::optional<std::chrono::milliseconds> remaining() const;

    // Throws DatabaseException(Cancelled / Timeout) if expired
    void check() const;

private:
    std::optional<Clock::time_point> m_deadline;
    std::shared_ptr<std::atomic<bool>> m_cancelled;
};

}  // namespace sqlquery
