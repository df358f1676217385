#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace TCE {

/**
 * @brief Unit-granular cancellation flag with an optional wall-clock deadline
 *
 * Checked by the driver between stages and by the DegradationController
 * before every attempt. cancel() and setDeadline() may be called from any
 * thread.
 */
class CancellationToken {
public:
    using Clock = std::chrono::steady_clock;

    void cancel() {
        cancelled_.store(true);
    }

    bool isCancelled() const {
        return cancelled_.load();
    }

    void setDeadline(Clock::time_point deadline) {
        deadlineNanos_.store(deadline.time_since_epoch().count());
    }

    void setBudget(std::chrono::milliseconds budget) {
        setDeadline(Clock::now() + budget);
    }

    bool isExpired() const;

    /**
     * @brief Throw UnitCancelled if cancelled or past the deadline
     * @param where Checkpoint description used in the error message
     */
    void throwIfCancelled(const std::string &where) const;

private:
    std::atomic<bool> cancelled_{false};
    std::atomic<int64_t> deadlineNanos_{0};  // 0: no deadline
};

}  // namespace TCE
