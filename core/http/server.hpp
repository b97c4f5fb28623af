#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>
#include "runtime/config.hpp"

namespace hpipe {
namespace relay { class EndpointRegistry; }

namespace http {

/**
 * @brief HTTP front door of the relay
 *
 * Exposes the Endpoint Registry over plain HTTP:
 * - PUT  /{path}     sender segment (streaming request body)
 * - GET  /{path}     receiver (chunked response body)
 * - HEAD /{path}     offsets, state and sender presence
 * - GET  /v0/status  session listing
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Every request runs on a pool worker, which it keeps for the whole
 *   attachment; http.thread_pool_size bounds concurrent attachments
 * - All relay state lives in the registry and its sessions
 *
 * Lifecycle:
 * - start() binds to configured port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    HttpServer(const runtime::HttpConfig& config,
               const runtime::RelayConfig& relay_config,
               relay::EndpointRegistry& registry);

    ~HttpServer();

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string& error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times. Blocked receivers notice within
     * relay.read_wait_ms; the registry should be shut down first so that
     * blocked senders return immediately.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    // False once the listener thread has exited, whether stopped or failed
    bool is_listening() const { return listening_.load(); }
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    runtime::RelayConfig relay_config_;
    int port_ = 0;

    relay::EndpointRegistry& registry_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> listening_{false};
    std::chrono::steady_clock::time_point start_time_;

    std::atomic<int> active_receivers_{0};
    std::atomic<int> active_senders_{0};

    void setup_routes();

    // Route handlers (implemented in handlers/*.cpp)
    void handle_put_pipe(const httplib::Request& req, httplib::Response& res,
                         const httplib::ContentReader& content_reader);
    void handle_get_pipe(const httplib::Request& req, httplib::Response& res);
    void handle_head_pipe(const httplib::Request& req, httplib::Response& res);
    void handle_get_status(const httplib::Request& req, httplib::Response& res);

    bool resolve_pipe_path(const httplib::Request& req, httplib::Response& res, std::string& path) const;
};

} // namespace http
} // namespace hpipe
