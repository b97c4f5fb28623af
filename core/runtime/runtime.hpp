#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "config.hpp"
#include "http/server.hpp"
#include "relay/endpoint_registry.hpp"

namespace hpipe {
namespace runtime {

// Server mode: owns the endpoint registry and the HTTP front door
class Runtime {
public:
    explicit Runtime(const PipeConfig &config);
    ~Runtime();

    // Create the registry and start the HTTP server
    bool initialize(std::string &error);

    // Main loop (blocking): grace-period and idle sweeps until stopped or signalled
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Cancel all sessions and stop the HTTP server
    void shutdown();

    relay::EndpointRegistry &get_registry() { return *registry_; }

private:
    bool init_relay(std::string &error);
    bool init_http(std::string &error);

    PipeConfig config_;

    std::unique_ptr<relay::EndpointRegistry> registry_;
    std::unique_ptr<http::HttpServer> http_server_;

    std::atomic<bool> running_{false};
};

}  // namespace runtime
}  // namespace hpipe
