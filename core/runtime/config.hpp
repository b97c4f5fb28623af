#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hpipe {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct HttpConfig {
    std::string bind = "0.0.0.0";       // Bind address
    int port = 8080;                    // HTTP port
    int thread_pool_size = 64;          // Worker threads; every attachment holds one for its lifetime
    int read_timeout_ms = 300000;       // Socket read timeout (idle sender body)
    int write_timeout_ms = 300000;      // Socket write timeout (stalled receiver)
    size_t max_path_length = 1024;      // Longest accepted pipe path
};

// Relay engine tuning (relay: in YAML)
struct RelayConfig {
    size_t window_capacity_bytes = 4 * 1024 * 1024;  // Byte Window Buffer capacity per session
    size_t max_chunk_bytes = 64 * 1024;              // Largest single write to a receiver
    int sender_grace_ms = 30000;                     // AwaitingReconnect grace for a dropped sender
    int receiver_grace_ms = 30000;                   // Window pin kept for a dropped receiver
    int idle_timeout_ms = 300000;                    // Session with no attachment is destroyed after this
    int tombstone_ttl_ms = 300000;                   // How long an ended path still reports how it ended
    int sender_stall_timeout_ms = 10000;             // Longest one sender segment waits on a full window
                                                     // before the relay ends it (keep below client io timeout)
    int read_wait_ms = 1000;                         // Receiver wait slice before re-checking the socket
    int sweep_interval_ms = 100;                     // Runtime loop period for grace/idle sweeps
};

struct RetryConfig {
    int max_attempts = 10;                               // Reconnects allowed after consecutive failures
    std::vector<int> backoff_ms{250, 500, 1000, 2000, 4000, 8000};  // Last entry repeats
    int max_retry_time_ms = 300000;                      // Time without progress before giving up (0 = unlimited)
};

struct ClientConfig {
    int connect_timeout_ms = 5000;
    int io_timeout_ms = 300000;        // Read/write timeout on the relay connection
    size_t segment_bytes = 1024 * 1024;  // Max bytes per sender PUT (unconfirmed bytes held locally)
    int flush_interval_ms = 200;       // End a sender segment after this long without input
    size_t read_chunk_bytes = 64 * 1024;  // Local stdin read size
    RetryConfig retry;
};

struct PipeConfig {
    HttpConfig http;
    RelayConfig relay;
    ClientConfig client;
    LoggingConfig logging;
};

// Loads configuration from a YAML file (keys not present keep their defaults)
bool load_config(const std::string &config_path, PipeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const PipeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace hpipe
