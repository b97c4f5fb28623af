#pragma once

#include <chrono>
#include <string>

#include "runtime/config.hpp"

namespace hpipe {
namespace client {

// Reconnect budget of a client transport loop
// Backoff schedule with a circuit breaker, reset whenever the transfer makes progress
class RetryPolicy {
public:
    using Clock = std::chrono::steady_clock;

    explicit RetryPolicy(const runtime::RetryConfig &config, Clock::time_point now = Clock::now());

    // Record a failed attempt
    // Returns false once the budget is exhausted (too many attempts or too long without progress)
    bool record_failure(Clock::time_point now = Clock::now());

    // Bytes moved: resets attempts and the no-progress timer
    void record_progress(Clock::time_point now = Clock::now());

    // Delay before the next reconnect; the last schedule entry repeats
    // Returns 0 before the first failure
    int get_backoff_ms() const;

    int get_attempt_count() const { return attempt_count_; }
    bool is_exhausted() const { return exhausted_; }
    const std::string &exhausted_reason() const { return exhausted_reason_; }

private:
    runtime::RetryConfig config_;
    int attempt_count_ = 0;
    bool exhausted_ = false;
    std::string exhausted_reason_;
    Clock::time_point last_progress_;
};

}  // namespace client
}  // namespace hpipe
