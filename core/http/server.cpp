#include "server.hpp"

#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"
#include "protocol.hpp"
#include "relay/endpoint_registry.hpp"

namespace hpipe {
namespace http {

namespace {
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusPayloadTooLarge = 413;
constexpr int kStatusInternal = 500;
constexpr int kStatusUnavailable = 503;

// Pipe path: one non-empty segment
constexpr const char *kPipeRoute = R"(/([^/]+))";
}  // namespace

HttpServer::HttpServer(const runtime::HttpConfig &config, const runtime::RelayConfig &relay_config,
                       relay::EndpointRegistry &registry)
    : config_(config), relay_config_(relay_config), registry_(registry) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    // Create server
    server_ = std::make_unique<httplib::Server>();

    // Long-lived streams: idle senders and slow receivers need generous timeouts
    server_->set_read_timeout(config_.read_timeout_ms / 1000, (config_.read_timeout_ms % 1000) * 1000);
    server_->set_write_timeout(config_.write_timeout_ms / 1000, (config_.write_timeout_ms % 1000) * 1000);

    // Each attachment occupies a worker for its whole lifetime
    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Set up routes
    setup_routes();

    // Set error handler for JSON error responses (called for HTTP errors like 404)
    // Only override content if no content has been set
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty() || req.method == "HEAD") {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        } else if (res.status == kStatusPayloadTooLarge) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Request too large";
        } else if (res.status == kStatusUnavailable) {
            code = StatusCode::UNAVAILABLE;
            message = "Service unavailable";
        }

        nlohmann::json response = make_error_response(code, message);
        res.set_content(response.dump(), "application/json");
    });

    // Set exception handler
    server_->set_exception_handler([](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception");
        }

        nlohmann::json response = make_error_response(StatusCode::INTERNAL, msg);
        res.status = kStatusInternal;
        res.set_content(response.dump(), "application/json");
    });

    // Bind first so that a busy port is reported synchronously
    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;
    start_time_ = std::chrono::steady_clock::now();

    // Start server thread
    running_.store(true);
    listening_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        if (!server_->listen_after_bind() && running_.load()) {
            LOG_ERROR("[HTTP] Listener failed on " << config_.bind << ":" << config_.port);
        }
        listening_.store(false);
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << config_.port << " ("
                                           << config_.thread_pool_size << " workers)");
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

bool HttpServer::resolve_pipe_path(const httplib::Request &req, httplib::Response &res, std::string &path) const {
    if (!parse_pipe_path(req, path)) {
        send_error(res, StatusCode::INVALID_ARGUMENT, "Missing pipe path");
        return false;
    }
    if (path.size() > config_.max_path_length) {
        send_error(res, StatusCode::INVALID_ARGUMENT,
                   "Pipe path longer than " + std::to_string(config_.max_path_length) + " characters");
        return false;
    }
    return true;
}

void HttpServer::setup_routes() {
    // GET /v0/status - Session listing (registered before the pipe catch-all)
    server_->Get(kStatusPath,
                 [this](const httplib::Request &req, httplib::Response &res) { handle_get_status(req, res); });

    // PUT /{path} - Sender segment (body streamed through the content reader)
    server_->Put(kPipeRoute, [this](const httplib::Request &req, httplib::Response &res,
                                    const httplib::ContentReader &content_reader) {
        handle_put_pipe(req, res, content_reader);
    });

    // GET /{path} - Receiver; httplib routes HEAD here as well (progress query)
    server_->Get(kPipeRoute, [this](const httplib::Request &req, httplib::Response &res) {
        if (req.method == "HEAD") {
            handle_head_pipe(req, res);
        } else {
            handle_get_pipe(req, res);
        }
    });

    LOG_INFO("[HTTP] Routes configured:");
    LOG_INFO("[HTTP]   PUT  /{path}");
    LOG_INFO("[HTTP]   GET  /{path}");
    LOG_INFO("[HTTP]   HEAD /{path}");
    LOG_INFO("[HTTP]   GET  " << kStatusPath);
}

}  // namespace http
}  // namespace hpipe
