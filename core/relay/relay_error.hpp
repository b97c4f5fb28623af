#pragma once

#include <optional>
#include <string>

namespace hpipe {
namespace relay {

/**
 * @brief Failure kinds of the relay engine
 *
 * - ROLE_CONFLICT: a second sender tried to join a path that already has one
 * - RESUME_OFFSET_MISMATCH: a resume offset disagrees with the session's offsets
 * - OFFSET_TOO_OLD: a resuming receiver asked for bytes already evicted
 * - BUFFER_FULL: window has no free space (internal backpressure, never surfaced)
 * - UPSTREAM_GONE: the sender's reconnect grace expired
 * - CANCELLED: the attachment was detached or the registry shut down
 * - STALLED: a sender segment waited longer than the stall timeout for free
 *   space; ends that request, never the session
 */
enum class RelayError {
    NONE,
    ROLE_CONFLICT,
    RESUME_OFFSET_MISMATCH,
    OFFSET_TOO_OLD,
    BUFFER_FULL,
    UPSTREAM_GONE,
    CANCELLED,
    STALLED
};

inline std::string relay_error_to_string(RelayError error) {
    switch (error) {
        case RelayError::NONE:
            return "NONE";
        case RelayError::ROLE_CONFLICT:
            return "ROLE_CONFLICT";
        case RelayError::RESUME_OFFSET_MISMATCH:
            return "RESUME_OFFSET_MISMATCH";
        case RelayError::OFFSET_TOO_OLD:
            return "OFFSET_TOO_OLD";
        case RelayError::BUFFER_FULL:
            return "BUFFER_FULL";
        case RelayError::UPSTREAM_GONE:
            return "UPSTREAM_GONE";
        case RelayError::CANCELLED:
            return "CANCELLED";
        case RelayError::STALLED:
            return "STALLED";
        default:
            return "UNKNOWN";
    }
}

inline std::optional<RelayError> string_to_relay_error(const std::string &name) {
    if (name == "NONE") return RelayError::NONE;
    if (name == "ROLE_CONFLICT") return RelayError::ROLE_CONFLICT;
    if (name == "RESUME_OFFSET_MISMATCH") return RelayError::RESUME_OFFSET_MISMATCH;
    if (name == "OFFSET_TOO_OLD") return RelayError::OFFSET_TOO_OLD;
    if (name == "BUFFER_FULL") return RelayError::BUFFER_FULL;
    if (name == "UPSTREAM_GONE") return RelayError::UPSTREAM_GONE;
    if (name == "CANCELLED") return RelayError::CANCELLED;
    if (name == "STALLED") return RelayError::STALLED;
    return std::nullopt;
}

enum class Role { SENDER, RECEIVER };

inline std::string role_to_string(Role role) { return role == Role::SENDER ? "sender" : "receiver"; }

}  // namespace relay
}  // namespace hpipe
