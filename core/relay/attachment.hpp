#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "relay_error.hpp"
#include "session.hpp"

namespace hpipe {
namespace relay {

/**
 * @brief One connection occupying the sender or receiver role of a session
 *
 * Handed out by EndpointRegistry::attach() and owned by the worker thread
 * serving the request. The session stays alive for as long as the handle does.
 *
 * Ending an attachment is one-shot: the first of finish(), complete(), drop()
 * or the destructor wins, later calls are no-ops. Destroying a handle that was
 * never ended counts as a dropped connection.
 */
class Attachment {
public:
    Attachment(std::shared_ptr<Session> session, uint64_t id, Role role, uint64_t start_offset);
    ~Attachment();

    Attachment(const Attachment &) = delete;
    Attachment &operator=(const Attachment &) = delete;

    // Sender only
    RelayError append(const char *data, size_t len);

    // Receiver only
    ReadResult read(std::string &out, size_t max_bytes, std::chrono::milliseconds wait);
    void ack(uint64_t offset);

    // Sender signalled end-of-stream
    void finish() { release(DetachReason::END_OF_STREAM); }

    // Clean end (receiver drained, or sender segment ended without end-of-stream)
    void complete() { release(DetachReason::COMPLETED); }

    // Connection lost
    void drop() { release(DetachReason::DROPPED); }

    void release(DetachReason reason);

    bool is_attached() const { return attached_.load(); }
    uint64_t id() const { return id_; }
    Role role() const { return role_; }
    uint64_t start_offset() const { return start_offset_; }
    uint64_t total_offset() const { return session_->total_offset(); }
    const std::string &path() const { return session_->path(); }
    const std::shared_ptr<Session> &session() const { return session_; }

private:
    std::shared_ptr<Session> session_;
    const uint64_t id_;
    const Role role_;
    const uint64_t start_offset_;
    std::atomic<bool> attached_{true};
};

struct AttachResult {
    RelayError error = RelayError::NONE;
    std::string message;
    std::unique_ptr<Attachment> attachment;

    bool ok() const { return error == RelayError::NONE && attachment != nullptr; }
};

}  // namespace relay
}  // namespace hpipe
