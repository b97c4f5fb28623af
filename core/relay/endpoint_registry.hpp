#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "attachment.hpp"
#include "relay_error.hpp"
#include "runtime/config.hpp"
#include "session.hpp"

namespace hpipe {
namespace relay {

/**
 * @brief Path -> Session map of the relay
 *
 * Creates sessions lazily on first reference and hands out Attachment handles.
 * Owned by the server runtime and passed by reference to the HTTP layer.
 *
 * Thread-safety:
 * - shared_mutex: lookups take a shared lock, attach/sweep an exclusive one
 * - Lock order is registry -> session; blocking session waits never hold the
 *   registry lock
 *
 * A path whose session ended leaves a tombstone for relay.tombstone_ttl_ms:
 * - failed (sender never came back): resuming clients learn UPSTREAM_GONE
 *   instead of silently starting a new stream
 * - finished cleanly: a sender that lost the response to its final segment
 *   can still learn that the relay recorded end-of-stream
 */
// What an ended stream left behind on its path
struct Tombstone {
    RelayError failure = RelayError::NONE;  // NONE: end-of-stream was delivered
    uint64_t total_offset = 0;
    std::chrono::steady_clock::time_point expires_at;

    bool finished() const { return failure == RelayError::NONE; }
};

class EndpointRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit EndpointRegistry(const runtime::RelayConfig &config);
    ~EndpointRegistry();

    EndpointRegistry(const EndpointRegistry &) = delete;
    EndpointRegistry &operator=(const EndpointRegistry &) = delete;

    /**
     * @brief Attach a sender or receiver to the session for path
     *
     * @param resume_offset Offset the client presented; absent for a fresh attach
     */
    AttachResult attach(const std::string &path, Role role, std::optional<uint64_t> resume_offset);

    void detach(Attachment &attachment, DetachReason reason);

    std::shared_ptr<Session> find(const std::string &path) const;
    std::optional<SessionSnapshot> get_session_snapshot(const std::string &path) const;
    std::vector<SessionSnapshot> get_all_snapshots() const;

    // Record of a recently ended stream on path, if its tombstone is still live
    std::optional<Tombstone> get_tombstone(const std::string &path) const;

    /**
     * @brief Expire grace periods and remove finished or idle sessions
     * @return Number of sessions removed
     */
    size_t sweep(Clock::time_point now);

    size_t session_count() const;

    // Cancels every session; blocked workers return CANCELLED
    void shutdown();
    bool is_shutdown() const { return shutdown_.load(); }

private:
    void bury_locked(const std::string &path, const Session &session, Clock::time_point now);

    AttachResult reject(RelayError error, std::string message) const;

    const runtime::RelayConfig config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
    std::unordered_map<std::string, Tombstone> tombstones_;

    std::atomic<uint64_t> next_attachment_id_{1};
    std::atomic<bool> shutdown_{false};
};

}  // namespace relay
}  // namespace hpipe
