#include "json.hpp"

#include "protocol.hpp"

namespace hpipe {
namespace http {

std::string sender_presence(const relay::SessionSnapshot &snapshot) {
    if (snapshot.writes_closed) {
        return kSenderFinished;
    }
    return snapshot.sender_attached ? kSenderAttached : kSenderAbsent;
}

nlohmann::json encode_session_snapshot(const relay::SessionSnapshot &snapshot) {
    nlohmann::json result = {{"path", snapshot.path},
                             {"state", relay::session_state_to_string(snapshot.state)},
                             {"total_offset", snapshot.total_offset},
                             {"window_start", snapshot.window_start},
                             {"buffered_bytes", snapshot.buffered_bytes},
                             {"capacity_bytes", snapshot.capacity_bytes},
                             {"sender", sender_presence(snapshot)},
                             {"sender_dropped", snapshot.sender_dropped},
                             {"streaming_started", snapshot.streaming_started},
                             {"active_receivers", snapshot.active_receivers},
                             {"dropped_receivers", snapshot.dropped_receivers},
                             {"idle_ms", snapshot.idle_ms}};

    // failure only present for sessions that closed abnormally
    if (snapshot.failure != relay::RelayError::NONE) {
        result["failure"] = relay::relay_error_to_string(snapshot.failure);
    }

    return result;
}

nlohmann::json encode_session_list(const std::vector<relay::SessionSnapshot> &snapshots) {
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto &snapshot : snapshots) {
        sessions.push_back(encode_session_snapshot(snapshot));
    }
    return sessions;
}

}  // namespace http
}  // namespace hpipe
