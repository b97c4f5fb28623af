#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "byte_stream.hpp"
#include "pipe_url.hpp"
#include "retry_policy.hpp"
#include "runtime/config.hpp"

namespace httplib {
class Client;
}

namespace hpipe {
namespace client {

/**
 * @brief Final result of a client transfer
 *
 * Protocol violations reported by the relay are never retried. Transport
 * faults are retried until the retry budget runs out.
 */
enum class TransferOutcome {
    SUCCESS,
    ROLE_CONFLICT,
    RESUME_OFFSET_MISMATCH,
    OFFSET_TOO_OLD,
    UPSTREAM_GONE,
    RETRY_BUDGET_EXHAUSTED,
    LOCAL_IO_ERROR
};

std::string transfer_outcome_to_string(TransferOutcome outcome);

// Process exit status for an outcome (0 on success)
int transfer_outcome_to_exit_code(TransferOutcome outcome);

struct TransferResult {
    TransferOutcome outcome = TransferOutcome::SUCCESS;
    std::string message;
    uint64_t offset = 0;  // Last confirmed stream offset
    int reconnects = 0;

    bool ok() const { return outcome == TransferOutcome::SUCCESS; }
};

// Polled between blocking steps; returns true once the user asked to stop
using InterruptCheck = std::function<bool()>;

/**
 * @brief Sending side of a pipe
 *
 * Uploads the source as a series of PUT segments. Bytes stay in a local
 * pending buffer until a segment response confirms them, so at most one
 * segment is ever unconfirmed. After a fault the loop backs off, asks the
 * relay (HEAD) for the offset it actually accepted and continues from there.
 */
class SenderLoop {
public:
    SenderLoop(PipeUrl url, const runtime::ClientConfig &config, ByteSource &source,
               std::optional<uint64_t> initial_offset = std::nullopt, InterruptCheck interrupted = nullptr);
    ~SenderLoop();

    TransferResult run();

    uint64_t confirmed_offset() const { return confirmed_; }

private:
    // SUSPENDED: the relay ended the segment on a full window (backpressure)
    enum class AttemptStatus { CONFIRMED, SUSPENDED, REJECTED, TRANSPORT_FAULT, LOCAL_ERROR };

    struct Attempt {
        AttemptStatus status = AttemptStatus::TRANSPORT_FAULT;
        TransferOutcome outcome = TransferOutcome::SUCCESS;  // For REJECTED / LOCAL_ERROR
        std::string message;
        bool final_segment = false;
    };

    Attempt upload_segment();

    // Drop pending bytes the relay reports as accepted; false if offset is outside what we hold
    bool accept_up_to(uint64_t relay_offset);

    // Re-establish confirmed_ from the relay after a fault; false ends the transfer
    bool resync(RetryPolicy &retry, TransferResult &result);

    bool sleep_backoff(int backoff_ms);
    bool is_interrupted() const { return interrupted_ && interrupted_(); }

    PipeUrl url_;
    runtime::ClientConfig config_;
    ByteSource &source_;
    InterruptCheck interrupted_;
    std::unique_ptr<httplib::Client> client_;

    uint64_t confirmed_ = 0;
    bool have_offset_ = false;  // Present X-Pipe-Offset (false only for a fresh first segment)
    std::string pending_;       // Unconfirmed bytes starting at confirmed_
    bool source_eof_ = false;
};

/**
 * @brief Receiving side of a pipe
 *
 * Streams one GET response into the sink. After a fault it reconnects
 * presenting the offset of the last byte it wrote, so the relay replays
 * from exactly there.
 */
class ReceiverLoop {
public:
    ReceiverLoop(PipeUrl url, const runtime::ClientConfig &config, ByteSink &sink,
                 std::optional<uint64_t> initial_offset = std::nullopt, InterruptCheck interrupted = nullptr);
    ~ReceiverLoop();

    TransferResult run();

    uint64_t offset() const { return offset_; }

private:
    bool sleep_backoff(int backoff_ms);
    bool is_interrupted() const { return interrupted_ && interrupted_(); }

    PipeUrl url_;
    runtime::ClientConfig config_;
    ByteSink &sink_;
    InterruptCheck interrupted_;
    std::unique_ptr<httplib::Client> client_;

    uint64_t offset_ = 0;
    bool have_offset_ = false;
};

}  // namespace client
}  // namespace hpipe
