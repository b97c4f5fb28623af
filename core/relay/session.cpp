#include "session.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace hpipe {
namespace relay {

std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::WAITING_FOR_PEERS:
            return "WAITING_FOR_PEERS";
        case SessionState::STREAMING:
            return "STREAMING";
        case SessionState::AWAITING_RECONNECT:
            return "AWAITING_RECONNECT";
        case SessionState::CLOSED:
            return "CLOSED";
        default:
            return "UNKNOWN";
    }
}

std::string detach_reason_to_string(DetachReason reason) {
    switch (reason) {
        case DetachReason::END_OF_STREAM:
            return "end-of-stream";
        case DetachReason::COMPLETED:
            return "completed";
        case DetachReason::DROPPED:
            return "dropped";
        default:
            return "unknown";
    }
}

Session::Session(std::string path, const runtime::RelayConfig &config)
    : path_(std::move(path)),
      config_(config),
      coordinator_(config),
      window_(config.window_capacity_bytes),
      last_activity_(Clock::now()) {}

ResumeCoordinator::Decision Session::attach(uint64_t attachment_id, Role role,
                                            std::optional<uint64_t> resume_offset) {
    std::lock_guard<std::mutex> lock(mutex_);
    ResumeCoordinator::Decision decision;

    if (cancelled_) {
        decision.error = RelayError::CANCELLED;
        decision.message = "Relay is shutting down";
        return decision;
    }

    if (state_ == SessionState::CLOSED) {
        decision.error = failure_ != RelayError::NONE ? failure_ : RelayError::CANCELLED;
        decision.message = "Session '" + path_ + "' is closed";
        return decision;
    }

    if (role == Role::SENDER) {
        if (sender_id_) {
            decision.error = RelayError::ROLE_CONFLICT;
            decision.message = "Path '" + path_ + "' already has an active sender";
            return decision;
        }
        if (writes_closed_) {
            decision.error = RelayError::ROLE_CONFLICT;
            decision.message = "Stream on path '" + path_ + "' already ended";
            return decision;
        }

        decision = coordinator_.validate_sender(resume_offset, window_.end_offset());
        if (!decision.ok()) {
            return decision;
        }

        sender_id_ = attachment_id;
        if (sender_dropped_) {
            sender_dropped_ = false;
            LOG_INFO("[Session] '" << path_ << "' sender #" << attachment_id << " resumed at offset "
                                   << decision.start_offset);
        }
        set_state_locked(streaming_started_ ? SessionState::STREAMING : SessionState::WAITING_FOR_PEERS);
    } else {
        decision = coordinator_.validate_receiver(resume_offset, window_.start_offset(), window_.end_offset(),
                                                  streaming_started_);
        if (!decision.ok()) {
            return decision;
        }

        if (resume_offset) {
            retire_dropped_receiver_locked(*resume_offset);
        }
    }

    AttachmentRecord record;
    record.id = attachment_id;
    record.role = role;
    record.acked_offset = decision.start_offset;
    attachments_[attachment_id] = record;

    LOG_DEBUG("[Session] '" << path_ << "' " << role_to_string(role) << " #" << attachment_id << " attached at "
                            << decision.start_offset << (resume_offset ? " (resume)" : ""));

    last_activity_ = Clock::now();
    update_state_locked();
    data_cv_.notify_all();
    space_cv_.notify_all();
    return decision;
}

void Session::detach(uint64_t attachment_id, DetachReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = attachments_.find(attachment_id);
    if (it == attachments_.end()) {
        return;
    }

    AttachmentRecord &record = it->second;
    auto now = Clock::now();

    if (record.role == Role::SENDER) {
        if (sender_id_ && *sender_id_ == attachment_id) {
            sender_id_.reset();
        }
        attachments_.erase(it);

        if (reason == DetachReason::END_OF_STREAM) {
            writes_closed_ = true;
            LOG_INFO("[Session] '" << path_ << "' end of stream at offset " << window_.end_offset());
        } else if (state_ != SessionState::CLOSED && !cancelled_) {
            sender_dropped_ = true;
            sender_dropped_at_ = now;
            set_state_locked(SessionState::AWAITING_RECONNECT);
            if (reason == DetachReason::DROPPED) {
                LOG_WARN("[Session] '" << path_ << "' sender #" << attachment_id << " dropped at offset "
                                       << window_.end_offset() << ", waiting "
                                       << coordinator_.sender_grace().count() << "ms for reconnect");
            }
        }
    } else {
        if (reason == DetachReason::DROPPED && record.state == AttachmentState::ACTIVE &&
            state_ != SessionState::CLOSED && !cancelled_) {
            // Keep its offset pinned in the window until the grace period runs out
            record.state = AttachmentState::DROPPED;
            record.dropped_at = now;
            LOG_WARN("[Session] '" << path_ << "' receiver #" << attachment_id << " dropped at offset "
                                   << record.acked_offset);
        } else {
            LOG_DEBUG("[Session] '" << path_ << "' receiver #" << attachment_id << " detached ("
                                    << detach_reason_to_string(reason) << ") at offset " << record.acked_offset);
            attachments_.erase(it);
        }
    }

    last_activity_ = now;
    update_state_locked();
    data_cv_.notify_all();
    space_cv_.notify_all();
}

RelayError Session::append(uint64_t attachment_id, const char *data, size_t len) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto deadline = Clock::now() + std::chrono::milliseconds(config_.sender_stall_timeout_ms);

    while (len > 0) {
        if (cancelled_) {
            return RelayError::CANCELLED;
        }
        if (state_ == SessionState::CLOSED) {
            return failure_ != RelayError::NONE ? failure_ : RelayError::CANCELLED;
        }
        if (!sender_id_ || *sender_id_ != attachment_id) {
            return RelayError::CANCELLED;
        }

        window_.make_room(std::min(len, window_.capacity()), eviction_pin_locked());
        auto result = window_.append(data, len);
        if (result.error == RelayError::NONE) {
            size_t n = result.appended();
            data += n;
            len -= n;

            auto sender = attachments_.find(attachment_id);
            if (sender != attachments_.end()) {
                sender->second.acked_offset = result.end;
            }
            last_activity_ = Clock::now();
            data_cv_.notify_all();
            continue;
        }

        // BUFFER_FULL: wait for receivers to acknowledge (backpressure)
        if (!space_cv_.wait_until(lock, deadline, [this] { return can_accept_locked(); })) {
            LOG_WARN("[Session] '" << path_ << "' sender #" << attachment_id << " stalled for "
                                   << config_.sender_stall_timeout_ms << "ms on a full window");
            return RelayError::STALLED;
        }
    }

    return RelayError::NONE;
}

ReadResult Session::read(uint64_t attachment_id, std::string &out, size_t max_bytes,
                         std::chrono::milliseconds wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    ReadResult result;
    out.clear();

    if (!data_cv_.wait_for(lock, wait, [this, attachment_id] { return receiver_has_work_locked(attachment_id); })) {
        result.status = ReadStatus::TIMEOUT;
        return result;
    }

    if (cancelled_) {
        result.status = ReadStatus::FAILED;
        result.error = RelayError::CANCELLED;
        return result;
    }

    auto it = attachments_.find(attachment_id);
    if (it == attachments_.end() || it->second.state != AttachmentState::ACTIVE) {
        result.status = ReadStatus::FAILED;
        result.error = RelayError::CANCELLED;
        return result;
    }

    const uint64_t from = it->second.acked_offset;
    result.offset = from;

    // Bytes first: a receiver gets everything that was accepted, even from a failed session
    if (from < window_.end_offset()) {
        uint64_t to = std::min(window_.end_offset(), from + static_cast<uint64_t>(max_bytes));
        RelayError error = window_.read(from, to, out);
        if (error != RelayError::NONE) {
            result.status = ReadStatus::FAILED;
            result.error = error;
            return result;
        }
        result.status = ReadStatus::DATA;
        return result;
    }

    if (failure_ != RelayError::NONE) {
        result.status = ReadStatus::FAILED;
        result.error = failure_;
        return result;
    }

    if (writes_closed_) {
        result.status = ReadStatus::END_OF_STREAM;
        return result;
    }

    // Woken by a closed session without failure
    result.status = ReadStatus::FAILED;
    result.error = RelayError::CANCELLED;
    return result;
}

void Session::ack(uint64_t attachment_id, uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = attachments_.find(attachment_id);
    if (it == attachments_.end() || it->second.role != Role::RECEIVER) {
        return;
    }

    uint64_t clamped = std::min(offset, window_.end_offset());
    if (clamped > it->second.acked_offset) {
        it->second.acked_offset = clamped;
        last_activity_ = Clock::now();
        space_cv_.notify_all();
    }
}

bool Session::expire(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool changed = false;

    if (state_ == SessionState::AWAITING_RECONNECT && sender_dropped_ &&
        coordinator_.sender_grace_expired(sender_dropped_at_, now)) {
        LOG_WARN("[Session] '" << path_ << "' sender did not reconnect within "
                               << coordinator_.sender_grace().count() << "ms, releasing receivers");
        fail_locked(RelayError::UPSTREAM_GONE);
        changed = true;
    }

    for (auto it = attachments_.begin(); it != attachments_.end();) {
        const auto &record = it->second;
        if (record.role == Role::RECEIVER && record.state == AttachmentState::DROPPED &&
            (state_ == SessionState::CLOSED || coordinator_.receiver_grace_expired(record.dropped_at, now))) {
            LOG_DEBUG("[Session] '" << path_ << "' receiver #" << record.id << " grace expired at offset "
                                    << record.acked_offset);
            it = attachments_.erase(it);
            changed = true;
        } else {
            ++it;
        }
    }

    if (changed) {
        update_state_locked();
        data_cv_.notify_all();
        space_cv_.notify_all();
    }
    return changed;
}

void Session::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    data_cv_.notify_all();
    space_cv_.notify_all();
}

bool Session::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::CLOSED;
}

bool Session::is_idle(Clock::time_point now, std::chrono::milliseconds idle_timeout) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!attachments_.empty() || state_ == SessionState::AWAITING_RECONNECT) {
        return false;
    }
    return now - last_activity_ >= idle_timeout;
}

RelayError Session::failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

uint64_t Session::total_offset() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_.end_offset();
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SessionSnapshot Session::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionSnapshot snap;
    snap.path = path_;
    snap.state = state_;
    snap.total_offset = window_.end_offset();
    snap.window_start = window_.start_offset();
    snap.buffered_bytes = window_.size();
    snap.capacity_bytes = window_.capacity();
    snap.window_full = window_.free_space() == 0 && eviction_pin_locked() <= window_.start_offset();
    snap.sender_attached = sender_id_.has_value();
    snap.sender_dropped = sender_dropped_;
    snap.writes_closed = writes_closed_;
    snap.streaming_started = streaming_started_;
    snap.active_receivers = count_receivers_locked(AttachmentState::ACTIVE);
    snap.dropped_receivers = count_receivers_locked(AttachmentState::DROPPED);
    snap.failure = failure_;
    snap.idle_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - last_activity_).count();
    return snap;
}

void Session::set_state_locked(SessionState next) {
    if (state_ == next) {
        return;
    }
    // Segmented senders bounce through AWAITING_RECONNECT between uploads
    if (next == SessionState::CLOSED || state_ == SessionState::WAITING_FOR_PEERS) {
        LOG_INFO("[Session] '" << path_ << "' " << session_state_to_string(state_) << " -> "
                               << session_state_to_string(next));
    } else {
        LOG_DEBUG("[Session] '" << path_ << "' " << session_state_to_string(state_) << " -> "
                                << session_state_to_string(next));
    }
    state_ = next;
}

void Session::update_state_locked() {
    if (state_ == SessionState::CLOSED) {
        return;
    }

    const size_t active_receivers = count_receivers_locked(AttachmentState::ACTIVE);
    const bool sender_present = sender_id_.has_value() || writes_closed_;

    if (state_ == SessionState::WAITING_FOR_PEERS && sender_present && active_receivers > 0) {
        streaming_started_ = true;
        set_state_locked(SessionState::STREAMING);
    }

    // Finished stream: close once no receiver is still reading or within grace
    if (writes_closed_ && streaming_started_ && active_receivers == 0 &&
        count_receivers_locked(AttachmentState::DROPPED) == 0) {
        set_state_locked(SessionState::CLOSED);
    }
}

void Session::fail_locked(RelayError error) {
    failure_ = error;
    sender_dropped_ = false;
    set_state_locked(SessionState::CLOSED);
    data_cv_.notify_all();
    space_cv_.notify_all();
}

uint64_t Session::eviction_pin_locked() const {
    // Nobody has read anything yet: keep every byte for the first receivers
    if (!streaming_started_) {
        return window_.start_offset();
    }

    uint64_t pin = window_.end_offset();
    for (const auto &entry : attachments_) {
        const auto &record = entry.second;
        if (record.role == Role::RECEIVER &&
            (record.state == AttachmentState::ACTIVE || record.state == AttachmentState::DROPPED)) {
            pin = std::min(pin, record.acked_offset);
        }
    }
    return pin;
}

bool Session::can_accept_locked() const {
    if (cancelled_ || state_ == SessionState::CLOSED || !sender_id_) {
        return true;  // Not acceptance, but the waiter must wake up and notice
    }
    return window_.free_space() > 0 || eviction_pin_locked() > window_.start_offset();
}

bool Session::receiver_has_work_locked(uint64_t attachment_id) const {
    if (cancelled_ || state_ == SessionState::CLOSED || writes_closed_) {
        return true;
    }
    auto it = attachments_.find(attachment_id);
    if (it == attachments_.end() || it->second.state != AttachmentState::ACTIVE) {
        return true;
    }
    return it->second.acked_offset < window_.end_offset();
}

size_t Session::count_receivers_locked(AttachmentState state) const {
    size_t count = 0;
    for (const auto &entry : attachments_) {
        if (entry.second.role == Role::RECEIVER && entry.second.state == state) {
            ++count;
        }
    }
    return count;
}

void Session::retire_dropped_receiver_locked(uint64_t resume_offset) {
    // The reconnecting receiver is most likely the dropped one closest below its offset
    auto best = attachments_.end();
    for (auto it = attachments_.begin(); it != attachments_.end(); ++it) {
        const auto &record = it->second;
        if (record.role != Role::RECEIVER || record.state != AttachmentState::DROPPED ||
            record.acked_offset > resume_offset) {
            continue;
        }
        if (best == attachments_.end() || record.acked_offset > best->second.acked_offset) {
            best = it;
        }
    }

    if (best != attachments_.end()) {
        LOG_INFO("[Session] '" << path_ << "' receiver #" << best->second.id << " resumed at offset "
                               << resume_offset);
        attachments_.erase(best);
    }
}

}  // namespace relay
}  // namespace hpipe
