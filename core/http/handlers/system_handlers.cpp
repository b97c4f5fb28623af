#include <chrono>

#include "../../relay/endpoint_registry.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace hpipe {
namespace http {

//=============================================================================
// GET /v0/status
//=============================================================================
void HttpServer::handle_get_status(const httplib::Request &, httplib::Response &res) {
    auto now = std::chrono::steady_clock::now();
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time_).count();

    auto snapshots = registry_.get_all_snapshots();

    nlohmann::json response = {{"status", make_status(StatusCode::OK)},
                               {"uptime_seconds", uptime},
                               {"session_count", snapshots.size()},
                               {"active_senders", active_senders_.load()},
                               {"active_receivers", active_receivers_.load()},
                               {"window_capacity_bytes", relay_config_.window_capacity_bytes},
                               {"sessions", encode_session_list(snapshots)}};

    send_json(res, StatusCode::OK, response);
}

}  // namespace http
}  // namespace hpipe
