#pragma once

#include <nlohmann/json.hpp>
#include <vector>

#include "relay/session.hpp"

namespace hpipe {
namespace http {

/**
 * @brief JSON encoding for status reporting
 *
 * Enum values are encoded by name; offsets and sizes as unsigned integers.
 */
nlohmann::json encode_session_snapshot(const relay::SessionSnapshot& snapshot);
nlohmann::json encode_session_list(const std::vector<relay::SessionSnapshot>& snapshots);

// "attached", "absent" or "finished"
std::string sender_presence(const relay::SessionSnapshot& snapshot);

} // namespace http
} // namespace hpipe
