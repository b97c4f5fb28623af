#include "resume_coordinator.hpp"

namespace hpipe {
namespace relay {

ResumeCoordinator::ResumeCoordinator(const runtime::RelayConfig &config)
    : sender_grace_(config.sender_grace_ms), receiver_grace_(config.receiver_grace_ms) {}

ResumeCoordinator::Decision ResumeCoordinator::validate_sender(std::optional<uint64_t> presented,
                                                               uint64_t total_offset) const {
    Decision decision;
    uint64_t offset = presented.value_or(0);

    if (offset != total_offset) {
        decision.error = RelayError::RESUME_OFFSET_MISMATCH;
        if (offset < total_offset) {
            decision.message = "Sender offset " + std::to_string(offset) + " is behind accepted offset " +
                               std::to_string(total_offset) + ": bytes already forwarded";
        } else {
            decision.message = "Sender offset " + std::to_string(offset) + " is ahead of accepted offset " +
                               std::to_string(total_offset);
        }
        return decision;
    }

    decision.start_offset = total_offset;
    return decision;
}

ResumeCoordinator::Decision ResumeCoordinator::validate_receiver(std::optional<uint64_t> presented,
                                                                 uint64_t window_start, uint64_t total_offset,
                                                                 bool streaming_started) const {
    Decision decision;

    if (!presented) {
        decision.start_offset = streaming_started ? total_offset : window_start;
        return decision;
    }

    uint64_t offset = *presented;
    if (offset < window_start) {
        decision.error = RelayError::OFFSET_TOO_OLD;
        decision.message = "Receiver offset " + std::to_string(offset) + " already evicted (window starts at " +
                           std::to_string(window_start) + ")";
        return decision;
    }
    if (offset > total_offset) {
        decision.error = RelayError::RESUME_OFFSET_MISMATCH;
        decision.message = "Receiver offset " + std::to_string(offset) + " is past the stream end " +
                           std::to_string(total_offset);
        return decision;
    }

    decision.start_offset = offset;
    return decision;
}

bool ResumeCoordinator::sender_grace_expired(Clock::time_point dropped_at, Clock::time_point now) const {
    return now - dropped_at >= sender_grace_;
}

bool ResumeCoordinator::receiver_grace_expired(Clock::time_point dropped_at, Clock::time_point now) const {
    return now - dropped_at >= receiver_grace_;
}

}  // namespace relay
}  // namespace hpipe
