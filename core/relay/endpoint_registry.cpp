#include "endpoint_registry.hpp"

#include <mutex>

#include "logging/logger.hpp"

namespace hpipe {
namespace relay {

EndpointRegistry::EndpointRegistry(const runtime::RelayConfig &config) : config_(config) {}

EndpointRegistry::~EndpointRegistry() { shutdown(); }

AttachResult EndpointRegistry::attach(const std::string &path, Role role, std::optional<uint64_t> resume_offset) {
    if (shutdown_.load()) {
        return reject(RelayError::CANCELLED, "Relay is shutting down");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto now = Clock::now();

    std::shared_ptr<Session> session;
    auto it = sessions_.find(path);
    if (it != sessions_.end()) {
        session = it->second;
    }

    // Second pass only happens after a closed session was replaced
    for (int pass = 0; pass < 2; ++pass) {
        if (!session) {
            if (resume_offset) {
                auto tomb = tombstones_.find(path);
                const bool buried = tomb != tombstones_.end() && tomb->second.expires_at > now;
                if (buried && !tomb->second.finished()) {
                    return reject(tomb->second.failure,
                                  "Stream on path '" + path + "' ended with " +
                                      relay_error_to_string(tomb->second.failure));
                }
                if (*resume_offset > 0) {
                    const std::string gone = buried ? "Stream on path '" + path + "' already ended at offset " +
                                                          std::to_string(tomb->second.total_offset)
                                                    : "No stream on path '" + path + "'";
                    if (role == Role::RECEIVER) {
                        return reject(RelayError::OFFSET_TOO_OLD,
                                      gone + ", no data retained at offset " + std::to_string(*resume_offset));
                    }
                    return reject(RelayError::RESUME_OFFSET_MISMATCH,
                                  gone + ", cannot resume at offset " + std::to_string(*resume_offset));
                }
            }

            session = std::make_shared<Session>(path, config_);
            sessions_[path] = session;
            tombstones_.erase(path);
            LOG_DEBUG("[Registry] Created session '" << path << "' (" << sessions_.size() << " active)");
        }

        const uint64_t id = next_attachment_id_.fetch_add(1);
        auto decision = session->attach(id, role, resume_offset);
        if (decision.ok()) {
            AttachResult result;
            result.attachment = std::make_unique<Attachment>(session, id, role, decision.start_offset);
            LOG_INFO("[Registry] " << role_to_string(role) << " #" << id << " attached to '" << path
                                   << "' at offset " << decision.start_offset);
            return result;
        }

        // A closed session only blocks resumes; a fresh attach starts a new stream on the path
        const bool closed = session->is_closed();
        const bool replaceable =
            closed && (decision.error == RelayError::CANCELLED || (!resume_offset && decision.error != RelayError::NONE));
        if (pass == 0 && replaceable) {
            if (session->failure() != RelayError::NONE) {
                bury_locked(path, *session, now);
            }
            LOG_DEBUG("[Registry] Replacing closed session '" << path << "'");
            sessions_.erase(path);
            session.reset();
            continue;
        }

        return reject(decision.error, decision.message);
    }

    return reject(RelayError::CANCELLED, "Session for path '" + path + "' could not be created");
}

void EndpointRegistry::detach(Attachment &attachment, DetachReason reason) {
    if (!attachment.is_attached()) {
        return;
    }
    LOG_DEBUG("[Registry] " << role_to_string(attachment.role()) << " #" << attachment.id() << " detaching from '"
                            << attachment.path() << "' (" << detach_reason_to_string(reason) << ")");
    attachment.release(reason);
}

std::shared_ptr<Session> EndpointRegistry::find(const std::string &path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(path);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::optional<SessionSnapshot> EndpointRegistry::get_session_snapshot(const std::string &path) const {
    auto session = find(path);
    if (!session) {
        return std::nullopt;
    }
    return session->snapshot();
}

std::vector<SessionSnapshot> EndpointRegistry::get_all_snapshots() const {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        sessions.reserve(sessions_.size());
        for (const auto &entry : sessions_) {
            sessions.push_back(entry.second);
        }
    }

    std::vector<SessionSnapshot> snapshots;
    snapshots.reserve(sessions.size());
    for (const auto &session : sessions) {
        snapshots.push_back(session->snapshot());
    }
    return snapshots;
}

std::optional<Tombstone> EndpointRegistry::get_tombstone(const std::string &path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = tombstones_.find(path);
    if (it == tombstones_.end() || it->second.expires_at <= Clock::now()) {
        return std::nullopt;
    }
    return it->second;
}

size_t EndpointRegistry::sweep(Clock::time_point now) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto idle_timeout = std::chrono::milliseconds(config_.idle_timeout_ms);
    size_t removed = 0;

    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto &session = it->second;
        session->expire(now);

        if (session->is_closed()) {
            RelayError failure = session->failure();
            if (failure != RelayError::NONE) {
                LOG_WARN("[Registry] Session '" << it->first << "' closed with " << relay_error_to_string(failure));
            } else {
                LOG_DEBUG("[Registry] Session '" << it->first << "' finished at offset " << session->total_offset());
            }
            bury_locked(it->first, *session, now);
            it = sessions_.erase(it);
            ++removed;
        } else if (session->is_idle(now, idle_timeout)) {
            LOG_INFO("[Registry] Session '" << it->first << "' idle for " << config_.idle_timeout_ms
                                            << "ms, removing");
            session->cancel();
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    for (auto it = tombstones_.begin(); it != tombstones_.end();) {
        if (it->second.expires_at <= now) {
            it = tombstones_.erase(it);
        } else {
            ++it;
        }
    }

    return removed;
}

size_t EndpointRegistry::session_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

void EndpointRegistry::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!sessions_.empty()) {
        LOG_INFO("[Registry] Shutting down, cancelling " << sessions_.size() << " session(s)");
    }
    for (auto &entry : sessions_) {
        entry.second->cancel();
    }
    sessions_.clear();
    tombstones_.clear();
}

void EndpointRegistry::bury_locked(const std::string &path, const Session &session, Clock::time_point now) {
    Tombstone tombstone;
    tombstone.failure = session.failure();
    tombstone.total_offset = session.total_offset();
    tombstone.expires_at = now + std::chrono::milliseconds(config_.tombstone_ttl_ms);
    tombstones_[path] = tombstone;
}

AttachResult EndpointRegistry::reject(RelayError error, std::string message) const {
    LOG_DEBUG("[Registry] Attach rejected: " << relay_error_to_string(error) << ": " << message);
    AttachResult result;
    result.error = error;
    result.message = std::move(message);
    return result;
}

}  // namespace relay
}  // namespace hpipe
