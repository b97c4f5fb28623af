#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "relay_error.hpp"
#include "runtime/config.hpp"

namespace hpipe {
namespace relay {

/**
 * @brief Resume-offset validation and grace-period policy
 *
 * Stateless apart from its configuration; the Session calls it under its own
 * lock to decide where a (re)connecting attachment starts and whether a
 * dropped attachment may still come back.
 *
 * Attachment lifecycle it arbitrates:
 *   ACTIVE -> DROPPED (connection ended without a clean outcome)
 *   DROPPED -> ACTIVE (reconnect presenting a valid offset, within grace)
 *   DROPPED -> CLOSED (grace expired)
 */
class ResumeCoordinator {
public:
    using Clock = std::chrono::steady_clock;

    struct Decision {
        RelayError error = RelayError::NONE;
        std::string message;
        uint64_t start_offset = 0;  // Where the attachment begins (valid when error == NONE)

        bool ok() const { return error == RelayError::NONE; }
    };

    explicit ResumeCoordinator(const runtime::RelayConfig &config);

    /**
     * @brief Validate a sender's offset against the session's total offset
     *
     * Absent offset means 0. The sender cannot rewrite accepted bytes, so only
     * an exact match continues the stream.
     */
    Decision validate_sender(std::optional<uint64_t> presented, uint64_t total_offset) const;

    /**
     * @brief Decide where a receiver starts
     *
     * Without an offset, a receiver joining before streaming began starts at the
     * window start; afterwards it starts live at total_offset (no backfill).
     * With an offset, it must lie within [window_start, total_offset].
     */
    Decision validate_receiver(std::optional<uint64_t> presented, uint64_t window_start, uint64_t total_offset,
                               bool streaming_started) const;

    bool sender_grace_expired(Clock::time_point dropped_at, Clock::time_point now) const;
    bool receiver_grace_expired(Clock::time_point dropped_at, Clock::time_point now) const;

    std::chrono::milliseconds sender_grace() const { return sender_grace_; }
    std::chrono::milliseconds receiver_grace() const { return receiver_grace_; }

private:
    std::chrono::milliseconds sender_grace_;
    std::chrono::milliseconds receiver_grace_;
};

}  // namespace relay
}  // namespace hpipe
