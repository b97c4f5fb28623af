#include "retry_policy.hpp"

#include "logging/logger.hpp"

namespace hpipe {
namespace client {

RetryPolicy::RetryPolicy(const runtime::RetryConfig &config, Clock::time_point now)
    : config_(config), last_progress_(now) {}

bool RetryPolicy::record_failure(Clock::time_point now) {
    if (exhausted_) {
        return false;
    }

    attempt_count_++;

    if (attempt_count_ > config_.max_attempts) {
        exhausted_ = true;
        exhausted_reason_ = "exceeded " + std::to_string(config_.max_attempts) + " reconnect attempts";
        LOG_ERROR("[Retry] Giving up: " << exhausted_reason_);
        return false;
    }

    if (config_.max_retry_time_ms > 0) {
        auto stalled_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - last_progress_).count();
        if (stalled_ms >= config_.max_retry_time_ms) {
            exhausted_ = true;
            exhausted_reason_ = "no progress for " + std::to_string(stalled_ms) + "ms";
            LOG_ERROR("[Retry] Giving up: " << exhausted_reason_);
            return false;
        }
    }

    LOG_WARN("[Retry] Attempt " << attempt_count_ << "/" << config_.max_attempts << ", reconnecting in "
                                << get_backoff_ms() << "ms");
    return true;
}

void RetryPolicy::record_progress(Clock::time_point now) {
    if (attempt_count_ > 0 && !exhausted_) {
        LOG_INFO("[Retry] Transfer recovered after " << attempt_count_ << " reconnect attempt(s)");
    }
    attempt_count_ = 0;
    last_progress_ = now;
}

int RetryPolicy::get_backoff_ms() const {
    if (attempt_count_ == 0 || config_.backoff_ms.empty()) {
        return 0;
    }

    size_t index = static_cast<size_t>(attempt_count_ - 1);
    if (index >= config_.backoff_ms.size()) {
        index = config_.backoff_ms.size() - 1;
    }
    return config_.backoff_ms[index];
}

}  // namespace client
}  // namespace hpipe
