#include "runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace hpipe {
namespace runtime {

Runtime::Runtime(const PipeConfig &config) : config_(config) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing relay");

    if (!init_relay(error)) {
        return false;
    }

    if (!init_http(error)) {
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_relay(std::string &error) {
    if (!validate_config(config_, error)) {
        return false;
    }

    registry_ = std::make_unique<relay::EndpointRegistry>(config_.relay);
    LOG_INFO("[Runtime] Endpoint registry created (window " << config_.relay.window_capacity_bytes
                                                            << " bytes, sender grace " << config_.relay.sender_grace_ms
                                                            << "ms, receiver grace "
                                                            << config_.relay.receiver_grace_ms << "ms)");
    return true;
}

bool Runtime::init_http(std::string &error) {
    http_server_ = std::make_unique<http::HttpServer>(config_.http, config_.relay, *registry_);

    std::string http_error;
    if (!http_server_->start(http_error)) {
        error = "HTTP server failed to start: " + http_error;
        http_server_.reset();
        return false;
    }
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    const auto interval = std::chrono::milliseconds(config_.relay.sweep_interval_ms);

    // Main loop: grace-period expiry, idle sessions, tombstones
    while (running_) {
        std::this_thread::sleep_for(interval);

        // Check for shutdown signal
        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] " << SignalHandler::received_signal_name() << " received, stopping...");
            running_ = false;
            break;
        }

        if (!http_server_->is_listening()) {
            LOG_ERROR("[Runtime] HTTP listener stopped unexpectedly");
            SignalHandler::request_shutdown();
            continue;
        }

        size_t removed = registry_->sweep(std::chrono::steady_clock::now());
        if (removed > 0) {
            LOG_DEBUG("[Runtime] Swept " << removed << " session(s), " << registry_->session_count() << " active");
        }
    }

    LOG_INFO("[Runtime] Shutting down");
}

void Runtime::shutdown() {
    // Wake blocked workers first so the server's thread pool can drain
    if (registry_) {
        registry_->shutdown();
    }

    // Stop HTTP server
    if (http_server_) {
        LOG_INFO("[Runtime] Stopping HTTP server");
        http_server_->stop();
        http_server_.reset();
    }
}

}  // namespace runtime
}  // namespace hpipe
