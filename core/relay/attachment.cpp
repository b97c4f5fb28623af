#include "attachment.hpp"

namespace hpipe {
namespace relay {

Attachment::Attachment(std::shared_ptr<Session> session, uint64_t id, Role role, uint64_t start_offset)
    : session_(std::move(session)), id_(id), role_(role), start_offset_(start_offset) {}

Attachment::~Attachment() { release(DetachReason::DROPPED); }

RelayError Attachment::append(const char *data, size_t len) {
    if (role_ != Role::SENDER || !attached_.load()) {
        return RelayError::CANCELLED;
    }
    return session_->append(id_, data, len);
}

ReadResult Attachment::read(std::string &out, size_t max_bytes, std::chrono::milliseconds wait) {
    if (role_ != Role::RECEIVER || !attached_.load()) {
        ReadResult result;
        result.status = ReadStatus::FAILED;
        result.error = RelayError::CANCELLED;
        return result;
    }
    return session_->read(id_, out, max_bytes, wait);
}

void Attachment::ack(uint64_t offset) {
    if (attached_.load()) {
        session_->ack(id_, offset);
    }
}

void Attachment::release(DetachReason reason) {
    bool expected = true;
    if (attached_.compare_exchange_strong(expected, false)) {
        session_->detach(id_, reason);
    }
}

}  // namespace relay
}  // namespace hpipe
