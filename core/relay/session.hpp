#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "relay_error.hpp"
#include "resume_coordinator.hpp"
#include "runtime/config.hpp"
#include "window_buffer.hpp"

namespace hpipe {
namespace relay {

enum class SessionState { WAITING_FOR_PEERS, STREAMING, AWAITING_RECONNECT, CLOSED };

enum class AttachmentState { ACTIVE, DROPPED, CLOSED };

// Why an attachment left its session
enum class DetachReason {
    END_OF_STREAM,  // Sender signalled the end of the stream
    COMPLETED,      // Clean finish (receiver drained, or sender ended a segment)
    DROPPED         // Connection ended unexpectedly
};

enum class ReadStatus { DATA, TIMEOUT, END_OF_STREAM, FAILED };

std::string session_state_to_string(SessionState state);
std::string detach_reason_to_string(DetachReason reason);

struct ReadResult {
    ReadStatus status = ReadStatus::TIMEOUT;
    RelayError error = RelayError::NONE;  // Set when status == FAILED
    uint64_t offset = 0;                  // Offset of the first returned byte
};

// Point-in-time copy of session state for status reporting and tests
struct SessionSnapshot {
    std::string path;
    SessionState state = SessionState::WAITING_FOR_PEERS;
    uint64_t total_offset = 0;
    uint64_t window_start = 0;
    size_t buffered_bytes = 0;
    size_t capacity_bytes = 0;
    bool window_full = false;  // No free space and nothing evictable: the sender must wait for receivers
    bool sender_attached = false;
    bool sender_dropped = false;
    bool writes_closed = false;
    bool streaming_started = false;
    size_t active_receivers = 0;
    size_t dropped_receivers = 0;
    RelayError failure = RelayError::NONE;
    int64_t idle_ms = 0;
};

/**
 * @brief State for one named pipe
 *
 * Holds the path's attachments, the Byte Window Buffer and the offset counters,
 * and implements the relay transfer engine on top of them: the sender appends,
 * every receiver reads from its own acknowledged offset.
 *
 * Thread model:
 * - One worker thread per attachment calls into the session
 * - Every operation is serialized by the session mutex; distinct sessions share nothing
 * - append() blocks on space_cv_ while the window is full (backpressure)
 * - read() blocks on data_cv_ until bytes past the receiver's offset exist
 *
 * State machine:
 *   WAITING_FOR_PEERS -> STREAMING          sender (or finished stream) + >= 1 receiver
 *   STREAMING/WAITING -> AWAITING_RECONNECT sender detached without end-of-stream
 *   AWAITING_RECONNECT -> STREAMING         sender reconnects at the exact total offset
 *   AWAITING_RECONNECT -> CLOSED            sender grace expired (UPSTREAM_GONE)
 *   STREAMING -> CLOSED                     end-of-stream and every receiver drained
 */
class Session {
public:
    using Clock = std::chrono::steady_clock;

    Session(std::string path, const runtime::RelayConfig &config);

    // Non-copyable, non-movable (owns mutex and condition variables)
    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    const std::string &path() const { return path_; }

    /**
     * @brief Attach a sender or receiver under the given attachment id
     *
     * Returns CANCELLED if the session is already closed without failure, so the
     * caller can replace it with a fresh session.
     */
    ResumeCoordinator::Decision attach(uint64_t attachment_id, Role role, std::optional<uint64_t> resume_offset);

    void detach(uint64_t attachment_id, DetachReason reason);

    /**
     * @brief Accept bytes from the active sender
     *
     * Blocks while the window is full and nothing can be evicted. Returns once
     * every byte is in the window, or with STALLED / CANCELLED / the session's
     * failure. On error some prefix of data may already have been accepted.
     *
     * STALLED does not fail the session: it only bounds how long one request
     * stays suspended. The sender continues with a new segment at total_offset.
     */
    RelayError append(uint64_t attachment_id, const char *data, size_t len);

    /**
     * @brief Next bytes for a receiver, starting at its acknowledged offset
     *
     * Waits up to `wait` for new bytes. Does not advance the receiver; call
     * ack() once the bytes reached the connection.
     */
    ReadResult read(uint64_t attachment_id, std::string &out, size_t max_bytes, std::chrono::milliseconds wait);

    void ack(uint64_t attachment_id, uint64_t offset);

    /**
     * @brief Apply grace-period expiry
     * @return true if anything changed
     */
    bool expire(Clock::time_point now);

    // Wakes all waiters; every further operation reports CANCELLED
    void cancel();

    bool is_closed() const;
    bool is_idle(Clock::time_point now, std::chrono::milliseconds idle_timeout) const;
    RelayError failure() const;
    uint64_t total_offset() const;
    SessionState state() const;
    SessionSnapshot snapshot() const;

private:
    struct AttachmentRecord {
        uint64_t id = 0;
        Role role = Role::RECEIVER;
        AttachmentState state = AttachmentState::ACTIVE;
        uint64_t acked_offset = 0;
        Clock::time_point dropped_at;
    };

    // All helpers below expect mutex_ to be held
    void set_state_locked(SessionState next);
    void update_state_locked();
    void fail_locked(RelayError error);
    uint64_t eviction_pin_locked() const;
    bool can_accept_locked() const;
    bool receiver_has_work_locked(uint64_t attachment_id) const;
    size_t count_receivers_locked(AttachmentState state) const;
    void retire_dropped_receiver_locked(uint64_t resume_offset);

    const std::string path_;
    const runtime::RelayConfig config_;
    const ResumeCoordinator coordinator_;

    mutable std::mutex mutex_;
    std::condition_variable data_cv_;   // Receivers: new bytes or state change
    std::condition_variable space_cv_;  // Sender: window space or state change

    WindowBuffer window_;
    std::map<uint64_t, AttachmentRecord> attachments_;  // Ordered by attach sequence
    std::optional<uint64_t> sender_id_;
    bool sender_dropped_ = false;
    Clock::time_point sender_dropped_at_;

    SessionState state_ = SessionState::WAITING_FOR_PEERS;
    bool writes_closed_ = false;
    bool streaming_started_ = false;
    bool cancelled_ = false;
    RelayError failure_ = RelayError::NONE;
    Clock::time_point last_activity_;
};

}  // namespace relay
}  // namespace hpipe
