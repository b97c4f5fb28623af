#include "transport_loop.hpp"

#include <httplib.h>

#include <algorithm>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

#include "http/protocol.hpp"
#include "logging/logger.hpp"
#include "relay/relay_error.hpp"

namespace hpipe {
namespace client {

namespace {
constexpr int kStatusOk = 200;
constexpr int kStatusNotFound = 404;
constexpr int kStatusConflict = 409;
constexpr int kStatusGone = 410;
constexpr size_t kMaxErrorBody = 4096;
constexpr auto kPollSlice = std::chrono::milliseconds(200);

std::optional<TransferOutcome> outcome_for(relay::RelayError error) {
    switch (error) {
        case relay::RelayError::ROLE_CONFLICT:
            return TransferOutcome::ROLE_CONFLICT;
        case relay::RelayError::RESUME_OFFSET_MISMATCH:
            return TransferOutcome::RESUME_OFFSET_MISMATCH;
        case relay::RelayError::OFFSET_TOO_OLD:
            return TransferOutcome::OFFSET_TOO_OLD;
        case relay::RelayError::UPSTREAM_GONE:
            return TransferOutcome::UPSTREAM_GONE;
        default:
            return std::nullopt;
    }
}

// Terminal outcome for a rejected request, or nullopt if the status is retryable
std::optional<TransferOutcome> classify_rejection(int status, const std::string &body, std::string &message) {
    if (status != kStatusConflict && status != kStatusGone) {
        return std::nullopt;
    }

    message = "HTTP " + std::to_string(status);
    try {
        auto envelope = nlohmann::json::parse(body);
        const auto &code = envelope.at("status").at("code").get_ref<const std::string &>();
        message = envelope.at("status").value("message", code);
        auto error = relay::string_to_relay_error(code);
        if (error) {
            auto outcome = outcome_for(*error);
            if (outcome) {
                return outcome;
            }
        }
    } catch (const nlohmann::json::exception &e) {
        LOG_DEBUG("[Client] Unparseable error body: " << e.what());
    }

    // Envelope missing (e.g. stripped by a proxy): fall back on the status alone
    return status == kStatusConflict ? TransferOutcome::RESUME_OFFSET_MISMATCH : TransferOutcome::UPSTREAM_GONE;
}

std::unique_ptr<httplib::Client> make_client(const PipeUrl &url, const runtime::ClientConfig &config) {
    auto client = std::make_unique<httplib::Client>(url.base);
    client->set_connection_timeout(std::chrono::milliseconds(config.connect_timeout_ms));
    client->set_read_timeout(std::chrono::milliseconds(config.io_timeout_ms));
    client->set_write_timeout(std::chrono::milliseconds(config.io_timeout_ms));
    client->set_keep_alive(true);
    return client;
}

bool sleep_interruptible(int backoff_ms, const InterruptCheck &interrupted) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(backoff_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (interrupted && interrupted()) {
            return false;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(std::min(left, std::chrono::milliseconds(kPollSlice)));
    }
    return !(interrupted && interrupted());
}

TransferResult fail(TransferOutcome outcome, std::string message, uint64_t offset, int reconnects) {
    TransferResult result;
    result.outcome = outcome;
    result.message = std::move(message);
    result.offset = offset;
    result.reconnects = reconnects;
    return result;
}
}  // namespace

std::string transfer_outcome_to_string(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::SUCCESS:
            return "SUCCESS";
        case TransferOutcome::ROLE_CONFLICT:
            return "ROLE_CONFLICT";
        case TransferOutcome::RESUME_OFFSET_MISMATCH:
            return "RESUME_OFFSET_MISMATCH";
        case TransferOutcome::OFFSET_TOO_OLD:
            return "OFFSET_TOO_OLD";
        case TransferOutcome::UPSTREAM_GONE:
            return "UPSTREAM_GONE";
        case TransferOutcome::RETRY_BUDGET_EXHAUSTED:
            return "RETRY_BUDGET_EXHAUSTED";
        case TransferOutcome::LOCAL_IO_ERROR:
            return "LOCAL_IO_ERROR";
        default:
            return "UNKNOWN";
    }
}

int transfer_outcome_to_exit_code(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::SUCCESS:
            return 0;
        case TransferOutcome::ROLE_CONFLICT:
            return 2;
        case TransferOutcome::RESUME_OFFSET_MISMATCH:
            return 3;
        case TransferOutcome::OFFSET_TOO_OLD:
            return 4;
        case TransferOutcome::UPSTREAM_GONE:
            return 5;
        case TransferOutcome::RETRY_BUDGET_EXHAUSTED:
            return 6;
        case TransferOutcome::LOCAL_IO_ERROR:
        default:
            return 7;
    }
}

//=============================================================================
// SenderLoop
//=============================================================================
SenderLoop::SenderLoop(PipeUrl url, const runtime::ClientConfig &config, ByteSource &source,
                       std::optional<uint64_t> initial_offset, InterruptCheck interrupted)
    : url_(std::move(url)),
      config_(config),
      source_(source),
      interrupted_(std::move(interrupted)),
      client_(make_client(url_, config_)),
      confirmed_(initial_offset.value_or(0)),
      have_offset_(initial_offset.has_value()) {}

SenderLoop::~SenderLoop() = default;

TransferResult SenderLoop::run() {
    RetryPolicy retry(config_.retry);
    int reconnects = 0;

    LOG_INFO("[Sender] Sending to " << url_.base << url_.path
                                    << (have_offset_ ? " from offset " + std::to_string(confirmed_) : ""));

    while (true) {
        Attempt attempt = upload_segment();

        switch (attempt.status) {
            case AttemptStatus::CONFIRMED:
                retry.record_progress();
                if (attempt.final_segment) {
                    LOG_INFO("[Sender] End of stream confirmed at offset " << confirmed_);
                    TransferResult result;
                    result.offset = confirmed_;
                    result.reconnects = reconnects;
                    return result;
                }
                continue;

            case AttemptStatus::SUSPENDED:
                // Waiting for receivers is not a fault; the relay stays reachable the whole time
                retry.record_progress();
                continue;

            case AttemptStatus::REJECTED:
            case AttemptStatus::LOCAL_ERROR:
                LOG_ERROR("[Sender] " << transfer_outcome_to_string(attempt.outcome) << ": " << attempt.message);
                return fail(attempt.outcome, attempt.message, confirmed_, reconnects);

            case AttemptStatus::TRANSPORT_FAULT:
            default:
                break;
        }

        LOG_WARN("[Sender] Upload failed at offset " << confirmed_ << " (" << pending_.size()
                                                     << " bytes unconfirmed): " << attempt.message);
        if (!retry.record_failure()) {
            return fail(TransferOutcome::RETRY_BUDGET_EXHAUSTED, retry.exhausted_reason(), confirmed_, reconnects);
        }
        if (!sleep_backoff(retry.get_backoff_ms())) {
            return fail(TransferOutcome::LOCAL_IO_ERROR, "Interrupted", confirmed_, reconnects);
        }

        TransferResult failure;
        if (!resync(retry, failure)) {
            failure.reconnects = reconnects;
            return failure;
        }
        reconnects++;
    }
}

SenderLoop::Attempt SenderLoop::upload_segment() {
    Attempt attempt;
    attempt.final_segment = source_eof_;

    httplib::Headers headers;
    if (have_offset_) {
        headers.emplace(http::kOffsetHeader, std::to_string(confirmed_));
    }
    if (attempt.final_segment) {
        headers.emplace(http::kEofHeader, "1");
    }

    const auto flush_interval = std::chrono::milliseconds(config_.flush_interval_ms);
    // An open segment with nothing to send still has to end before the relay's read timeout
    const auto keepalive = std::chrono::milliseconds(std::max(config_.io_timeout_ms / 2, config_.flush_interval_ms));

    size_t written = 0;  // Index into pending_ of the next byte to put on the wire
    bool local_error = false;
    bool interrupted = false;
    std::string local_message;
    auto last_input = std::chrono::steady_clock::now();
    std::vector<char> chunk(config_.read_chunk_bytes);

    auto provider = [&](size_t, httplib::DataSink &sink) -> bool {
        // Replay what the relay has not confirmed yet
        if (written < pending_.size()) {
            size_t n = std::min(pending_.size() - written, config_.read_chunk_bytes);
            if (!sink.write(pending_.data() + written, n)) {
                return false;
            }
            written += n;
            return true;
        }

        if (attempt.final_segment || written >= config_.segment_bytes) {
            sink.done();
            return true;
        }

        if (is_interrupted()) {
            interrupted = true;
            return false;
        }

        auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                          last_input);
        auto limit = written > 0 ? flush_interval : keepalive;
        if (idle >= limit) {
            sink.done();
            return true;
        }

        size_t capacity = std::min(chunk.size(), config_.segment_bytes - written);
        auto read = source_.read(chunk.data(), capacity, std::min(limit - idle, std::chrono::milliseconds(kPollSlice)));
        switch (read.status) {
            case SourceStatus::DATA:
                pending_.append(chunk.data(), read.bytes);
                last_input = std::chrono::steady_clock::now();
                if (!sink.write(chunk.data(), read.bytes)) {
                    return false;
                }
                written += read.bytes;
                return true;

            case SourceStatus::END_OF_FILE:
                source_eof_ = true;
                sink.done();
                return true;

            case SourceStatus::FAILED:
                local_error = true;
                local_message = read.error;
                return false;

            case SourceStatus::TIMEOUT:
            default:
                return true;
        }
    };

    auto res = client_->Put(url_.path, headers, provider, "application/octet-stream");

    if (local_error) {
        attempt.status = AttemptStatus::LOCAL_ERROR;
        attempt.outcome = TransferOutcome::LOCAL_IO_ERROR;
        attempt.message = "Reading input failed: " + local_message;
        return attempt;
    }
    if (interrupted) {
        attempt.status = AttemptStatus::LOCAL_ERROR;
        attempt.outcome = TransferOutcome::LOCAL_IO_ERROR;
        attempt.message = "Interrupted";
        return attempt;
    }
    if (!res) {
        attempt.message = "HTTP error: " + httplib::to_string(res.error());
        return attempt;
    }

    if (res->get_header_value(http::kBackpressureHeader) == "1") {
        uint64_t accepted = 0;
        if (http::parse_offset(res->get_header_value(http::kOffsetHeader), accepted) && accept_up_to(accepted)) {
            LOG_DEBUG("[Sender] Relay window full, segment ended at offset " << confirmed_ << " ("
                                                                             << pending_.size() << " bytes held)");
            attempt.status = AttemptStatus::SUSPENDED;
            return attempt;
        }
    }

    if (res->status != kStatusOk) {
        auto outcome = classify_rejection(res->status, res->body, attempt.message);
        if (outcome) {
            attempt.status = AttemptStatus::REJECTED;
            attempt.outcome = *outcome;
        } else {
            attempt.message = "HTTP " + std::to_string(res->status);
        }
        return attempt;
    }

    uint64_t accepted = 0;
    const uint64_t expected = confirmed_ + pending_.size();
    if (!http::parse_offset(res->get_header_value(http::kOffsetHeader), accepted) || accepted != expected) {
        attempt.status = AttemptStatus::REJECTED;
        attempt.outcome = TransferOutcome::RESUME_OFFSET_MISMATCH;
        attempt.message = "Relay confirmed offset '" + res->get_header_value(http::kOffsetHeader) +
                          "', expected " + std::to_string(expected);
        return attempt;
    }

    LOG_DEBUG("[Sender] Segment confirmed: " << pending_.size() << " bytes, offset " << accepted);
    confirmed_ = accepted;
    pending_.clear();
    have_offset_ = true;
    attempt.status = AttemptStatus::CONFIRMED;
    return attempt;
}

bool SenderLoop::resync(RetryPolicy &retry, TransferResult &result) {
    while (true) {
        auto res = client_->Head(url_.path);

        std::string problem;
        if (!res) {
            problem = "HEAD failed: " + httplib::to_string(res.error());
        } else if (res->status == kStatusNotFound) {
            // Session gone: only a stream that never got anything accepted can start over
            if (confirmed_ > 0) {
                result = fail(TransferOutcome::RESUME_OFFSET_MISMATCH,
                              "Relay no longer has a stream at offset " + std::to_string(confirmed_), confirmed_, 0);
                return false;
            }
            have_offset_ = false;
            LOG_INFO("[Sender] No session on relay, starting over with " << pending_.size() << " pending bytes");
            return true;
        } else if (res->status == kStatusGone) {
            std::string name = res->get_header_value(http::kErrorHeader);
            auto error = relay::string_to_relay_error(name);
            auto outcome = error ? outcome_for(*error) : std::nullopt;
            result = fail(outcome ? *outcome : TransferOutcome::UPSTREAM_GONE, "Relay reports " + name, confirmed_, 0);
            return false;
        } else if (res->status == kStatusOk) {
            std::string sender = res->get_header_value(http::kSenderHeader);
            uint64_t server_offset = 0;
            if (!http::parse_offset(res->get_header_value(http::kOffsetHeader), server_offset)) {
                problem = "HEAD returned no offset";
            } else if (sender == http::kSenderAttached) {
                // The relay has not noticed the broken upload yet
                problem = "previous upload still attached";
            } else if (sender == http::kSenderFinished) {
                if (source_eof_ && server_offset == confirmed_ + pending_.size()) {
                    // Final segment went through, only its response was lost
                    confirmed_ = server_offset;
                    pending_.clear();
                    result = TransferResult();
                    result.offset = confirmed_;
                    LOG_INFO("[Sender] End of stream already recorded at offset " << confirmed_);
                    return false;
                }
                result = fail(TransferOutcome::RESUME_OFFSET_MISMATCH, "Relay stream already ended", confirmed_, 0);
                return false;
            } else {
                const uint64_t held_end = confirmed_ + pending_.size();
                const uint64_t previous = confirmed_;
                if (!accept_up_to(server_offset)) {
                    result = fail(TransferOutcome::RESUME_OFFSET_MISMATCH,
                                  "Relay accepted offset " + std::to_string(server_offset) + ", client holds [" +
                                      std::to_string(previous) + ", " + std::to_string(held_end) + "]",
                                  confirmed_, 0);
                    return false;
                }

                // A full window means the relay is holding the stream for slow receivers
                if (server_offset > previous || res->get_header_value(http::kBackpressureHeader) == "1") {
                    retry.record_progress();
                }
                LOG_INFO("[Sender] Resuming at offset " << confirmed_ << " (" << pending_.size()
                                                        << " bytes to replay)");
                return true;
            }
        } else {
            problem = "HEAD returned HTTP " + std::to_string(res->status);
        }

        LOG_WARN("[Sender] Resync: " << problem);
        if (!retry.record_failure()) {
            result = fail(TransferOutcome::RETRY_BUDGET_EXHAUSTED, retry.exhausted_reason(), confirmed_, 0);
            return false;
        }
        if (!sleep_backoff(retry.get_backoff_ms())) {
            result = fail(TransferOutcome::LOCAL_IO_ERROR, "Interrupted", confirmed_, 0);
            return false;
        }
    }
}

bool SenderLoop::accept_up_to(uint64_t relay_offset) {
    if (relay_offset < confirmed_ || relay_offset > confirmed_ + pending_.size()) {
        return false;
    }
    // Bytes the relay already has need not be sent again
    pending_.erase(0, static_cast<size_t>(relay_offset - confirmed_));
    confirmed_ = relay_offset;
    have_offset_ = true;
    return true;
}

bool SenderLoop::sleep_backoff(int backoff_ms) { return sleep_interruptible(backoff_ms, interrupted_); }

//=============================================================================
// ReceiverLoop
//=============================================================================
ReceiverLoop::ReceiverLoop(PipeUrl url, const runtime::ClientConfig &config, ByteSink &sink,
                           std::optional<uint64_t> initial_offset, InterruptCheck interrupted)
    : url_(std::move(url)),
      config_(config),
      sink_(sink),
      interrupted_(std::move(interrupted)),
      client_(make_client(url_, config_)),
      offset_(initial_offset.value_or(0)),
      have_offset_(initial_offset.has_value()) {}

ReceiverLoop::~ReceiverLoop() = default;

TransferResult ReceiverLoop::run() {
    RetryPolicy retry(config_.retry);
    int reconnects = 0;

    LOG_INFO("[Receiver] Receiving from " << url_.base << url_.path
                                          << (have_offset_ ? " from offset " + std::to_string(offset_) : ""));

    while (true) {
        httplib::Headers headers;
        if (have_offset_) {
            headers.emplace(http::kOffsetHeader, std::to_string(offset_));
        }

        int status = 0;
        std::string error_body;
        std::string problem;
        bool local_error = false;
        bool interrupted = false;
        std::string local_message;

        auto res = client_->Get(
            url_.path, headers,
            [&](const httplib::Response &response) {
                status = response.status;
                if (status != kStatusOk) {
                    return true;  // Read the error envelope
                }

                uint64_t start = 0;
                if (!http::parse_offset(response.get_header_value(http::kOffsetHeader), start)) {
                    problem = "response has no start offset";
                    return false;
                }
                if (have_offset_ && start != offset_) {
                    problem = "relay started at " + std::to_string(start) + " instead of " + std::to_string(offset_);
                    return false;
                }
                offset_ = start;
                have_offset_ = true;
                LOG_DEBUG("[Receiver] Streaming from offset " << start);
                return true;
            },
            [&](const char *data, size_t len) {
                if (status != kStatusOk) {
                    if (error_body.size() < kMaxErrorBody) {
                        error_body.append(data, std::min(len, kMaxErrorBody - error_body.size()));
                    }
                    return true;
                }
                if (is_interrupted()) {
                    interrupted = true;
                    return false;
                }
                if (!sink_.write(data, len, local_message)) {
                    local_error = true;
                    return false;
                }
                offset_ += len;
                if (len > 0) {
                    retry.record_progress();
                }
                return true;
            });

        if (local_error) {
            LOG_ERROR("[Receiver] Writing output failed: " << local_message);
            return fail(TransferOutcome::LOCAL_IO_ERROR, "Writing output failed: " + local_message, offset_,
                        reconnects);
        }
        if (interrupted) {
            return fail(TransferOutcome::LOCAL_IO_ERROR, "Interrupted", offset_, reconnects);
        }

        if (res && status == kStatusOk && problem.empty()) {
            // Clean end of the chunked body: the sender finished and we drained everything
            if (!sink_.flush(local_message)) {
                return fail(TransferOutcome::LOCAL_IO_ERROR, "Flushing output failed: " + local_message, offset_,
                            reconnects);
            }
            LOG_INFO("[Receiver] End of stream at offset " << offset_);
            TransferResult result;
            result.offset = offset_;
            result.reconnects = reconnects;
            return result;
        }

        if (!problem.empty() && status == kStatusOk) {
            // The relay answered but with the wrong range: resuming would corrupt the output
            LOG_ERROR("[Receiver] " << problem);
            return fail(TransferOutcome::RESUME_OFFSET_MISMATCH, problem, offset_, reconnects);
        }

        if (status != 0 && status != kStatusOk) {
            std::string message;
            auto outcome = classify_rejection(status, error_body, message);
            if (outcome) {
                LOG_ERROR("[Receiver] " << transfer_outcome_to_string(*outcome) << ": " << message);
                return fail(*outcome, message, offset_, reconnects);
            }
            problem = "HTTP " + std::to_string(status);
        } else if (!res) {
            problem = "HTTP error: " + httplib::to_string(res.error());
        }

        LOG_WARN("[Receiver] Stream interrupted at offset " << offset_ << ": " << problem);
        if (!retry.record_failure()) {
            return fail(TransferOutcome::RETRY_BUDGET_EXHAUSTED, retry.exhausted_reason(), offset_, reconnects);
        }
        if (!sleep_backoff(retry.get_backoff_ms())) {
            return fail(TransferOutcome::LOCAL_IO_ERROR, "Interrupted", offset_, reconnects);
        }
        reconnects++;
    }
}

bool ReceiverLoop::sleep_backoff(int backoff_ms) { return sleep_interruptible(backoff_ms, interrupted_); }

}  // namespace client
}  // namespace hpipe
