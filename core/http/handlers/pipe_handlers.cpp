#include <memory>
#include <string>

#include "../../logging/logger.hpp"
#include "../../relay/endpoint_registry.hpp"
#include "../json.hpp"
#include "../protocol.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace hpipe {
namespace http {

namespace {
void send_relay_error(httplib::Response &res, relay::RelayError error, const std::string &message) {
    send_error(res, status_for(error), message.empty() ? relay::relay_error_to_string(error) : message);
}
}  // namespace

//=============================================================================
// PUT /{path} - Sender segment
//=============================================================================
void HttpServer::handle_put_pipe(const httplib::Request &req, httplib::Response &res,
                                 const httplib::ContentReader &content_reader) {
    std::string path;
    if (!resolve_pipe_path(req, res, path)) {
        return;
    }

    std::optional<uint64_t> offset;
    std::string error;
    if (!parse_resume_offset(req, offset, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }
    const bool end_of_stream = req.get_header_value(kEofHeader) == "1";

    auto result = registry_.attach(path, relay::Role::SENDER, offset);
    if (!result.ok()) {
        LOG_INFO("[Pipe] Sender rejected on '" << path << "': " << relay::relay_error_to_string(result.error));
        send_relay_error(res, result.error, result.message);
        return;
    }

    relay::Attachment &attachment = *result.attachment;
    active_senders_++;

    relay::RelayError failure = relay::RelayError::NONE;
    uint64_t received = 0;
    bool body_complete = content_reader([&](const char *data, size_t len) {
        failure = attachment.append(data, len);
        if (failure != relay::RelayError::NONE) {
            return false;
        }
        received += len;
        return true;
    });

    active_senders_--;

    if (failure == relay::RelayError::STALLED) {
        // Backpressure, not a fault: end the segment cleanly at the accepted offset
        const uint64_t total = attachment.total_offset();
        LOG_INFO("[Pipe] Sender #" << attachment.id() << " on '" << path << "' suspended on a full window at offset "
                                   << total << ", ending segment");
        registry_.detach(attachment, relay::DetachReason::COMPLETED);
        res.set_header(kOffsetHeader, std::to_string(total));
        res.set_header(kBackpressureHeader, "1");
        // Rest of the body is unread; the connection cannot be reused
        res.set_header("Connection", "close");
        send_relay_error(res, failure, "Window full on '" + path + "', continue at offset " + std::to_string(total));
        return;
    }

    if (failure != relay::RelayError::NONE) {
        LOG_WARN("[Pipe] Sender #" << attachment.id() << " on '" << path << "' stopped after " << received
                                   << " bytes: " << relay::relay_error_to_string(failure));
        registry_.detach(attachment, relay::DetachReason::DROPPED);
        send_relay_error(res, failure, "Upload on '" + path + "' stopped: " + relay::relay_error_to_string(failure));
        return;
    }

    if (!body_complete) {
        // Connection ended mid-body; the client asks HEAD for the accepted offset
        LOG_WARN("[Pipe] Sender #" << attachment.id() << " on '" << path << "' lost connection after " << received
                                   << " bytes");
        registry_.detach(attachment, relay::DetachReason::DROPPED);
        send_error(res, StatusCode::INVALID_ARGUMENT, "Request body interrupted");
        return;
    }

    const uint64_t total = attachment.total_offset();
    registry_.detach(attachment, end_of_stream ? relay::DetachReason::END_OF_STREAM : relay::DetachReason::COMPLETED);

    LOG_DEBUG("[Pipe] Sender #" << attachment.id() << " segment on '" << path << "': " << received
                                << " bytes, total " << total << (end_of_stream ? " (end of stream)" : ""));

    res.set_header(kOffsetHeader, std::to_string(total));
    nlohmann::json response = {{"status", make_status(StatusCode::OK)}, {"offset", total}, {"eof", end_of_stream}};
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// GET /{path} - Receiver
//=============================================================================
void HttpServer::handle_get_pipe(const httplib::Request &req, httplib::Response &res) {
    std::string path;
    if (!resolve_pipe_path(req, res, path)) {
        return;
    }

    std::optional<uint64_t> offset;
    std::string error;
    if (!parse_resume_offset(req, offset, error)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    if (offset && !registry_.find(path)) {
        auto tombstone = registry_.get_tombstone(path);
        if (tombstone && tombstone->finished() && tombstone->total_offset == *offset) {
            // Receiver already has every byte; only the end of the body was lost
            LOG_DEBUG("[Pipe] Receiver on '" << path << "' resumed at the end of a finished stream");
            res.set_header(kOffsetHeader, std::to_string(*offset));
            res.set_content("", "application/octet-stream");
            return;
        }
    }

    auto result = registry_.attach(path, relay::Role::RECEIVER, offset);
    if (!result.ok()) {
        LOG_INFO("[Pipe] Receiver rejected on '" << path << "': " << relay::relay_error_to_string(result.error));
        send_relay_error(res, result.error, result.message);
        return;
    }

    // Shared with the content provider, which outlives this handler
    std::shared_ptr<relay::Attachment> attachment(result.attachment.release());
    active_receivers_++;

    res.set_header(kOffsetHeader, std::to_string(attachment->start_offset()));
    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");  // Disable proxy buffering

    const size_t max_chunk = relay_config_.max_chunk_bytes;
    const auto wait = std::chrono::milliseconds(relay_config_.read_wait_ms);
    auto buffer = std::make_shared<std::string>();

    res.set_chunked_content_provider(
        "application/octet-stream",
        [this, attachment, buffer, max_chunk, wait](size_t, httplib::DataSink &sink) {
            if (!running_.load()) {
                return false;
            }

            auto read = attachment->read(*buffer, max_chunk, wait);
            switch (read.status) {
                case relay::ReadStatus::DATA:
                    if (!sink.write(buffer->data(), buffer->size())) {
                        LOG_WARN("[Pipe] Write failed for receiver #" << attachment->id() << " at offset "
                                                                      << read.offset);
                        return false;
                    }
                    attachment->ack(read.offset + buffer->size());
                    return true;

                case relay::ReadStatus::TIMEOUT:
                    // Nothing new; give up only if the peer went away
                    return sink.is_writable();

                case relay::ReadStatus::END_OF_STREAM:
                    sink.done();
                    return true;

                case relay::ReadStatus::FAILED:
                default:
                    // Aborting the chunked body tells the client the stream did not end cleanly
                    LOG_WARN("[Pipe] Receiver #" << attachment->id() << " on '" << attachment->path()
                                                 << "' released: " << relay::relay_error_to_string(read.error));
                    return false;
            }
        },
        [this, attachment](bool success) {
            active_receivers_--;
            registry_.detach(*attachment, success ? relay::DetachReason::COMPLETED : relay::DetachReason::DROPPED);
        });
}

//=============================================================================
// HEAD /{path} - Progress query (used by reconnecting senders)
//=============================================================================
void HttpServer::handle_head_pipe(const httplib::Request &req, httplib::Response &res) {
    std::string path;
    if (!resolve_pipe_path(req, res, path)) {
        return;
    }

    auto snapshot = registry_.get_session_snapshot(path);
    if (!snapshot) {
        auto tombstone = registry_.get_tombstone(path);
        if (!tombstone) {
            res.status = status_code_to_http(StatusCode::NOT_FOUND);
        } else if (tombstone->finished()) {
            // Session already swept, but the stream ended cleanly at this offset
            res.status = status_code_to_http(StatusCode::OK);
            res.set_header(kOffsetHeader, std::to_string(tombstone->total_offset));
            res.set_header(kWindowStartHeader, std::to_string(tombstone->total_offset));
            res.set_header(kStateHeader, relay::session_state_to_string(relay::SessionState::CLOSED));
            res.set_header(kSenderHeader, kSenderFinished);
        } else {
            res.status = status_code_to_http(status_for(tombstone->failure));
            res.set_header(kErrorHeader, relay::relay_error_to_string(tombstone->failure));
        }
        return;
    }

    if (snapshot->failure != relay::RelayError::NONE) {
        res.status = status_code_to_http(status_for(snapshot->failure));
        res.set_header(kErrorHeader, relay::relay_error_to_string(snapshot->failure));
        return;
    }

    res.status = status_code_to_http(StatusCode::OK);
    res.set_header(kOffsetHeader, std::to_string(snapshot->total_offset));
    res.set_header(kWindowStartHeader, std::to_string(snapshot->window_start));
    res.set_header(kStateHeader, relay::session_state_to_string(snapshot->state));
    res.set_header(kSenderHeader, sender_presence(*snapshot));
    if (snapshot->window_full) {
        res.set_header(kBackpressureHeader, "1");
    }
}

}  // namespace http
}  // namespace hpipe
