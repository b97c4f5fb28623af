#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

#include "../logging/logger.hpp"

namespace hpipe {
namespace runtime {

namespace {

// Reads an optional scalar into target; absent keys keep the default
template <typename T>
void read_optional(const YAML::Node &section, const char *key, T &target) {
    if (section[key]) {
        target = section[key].as<T>();
    }
}

void warn_unknown_keys(const YAML::Node &node, const std::string &where, const std::vector<std::string> &valid_keys) {
    if (!node.IsMap()) {
        return;
    }
    for (const auto &key_node : node) {
        std::string key = key_node.first.as<std::string>();
        bool known = false;
        for (const auto &valid_key : valid_keys) {
            if (key == valid_key) {
                known = true;
                break;
            }
        }
        if (!known) {
            LOG_WARN("[Config] Unknown key: '" << where << key << "' (will be ignored)");
        }
    }
}

}  // namespace

bool validate_config(const PipeConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 2) {
        error = "HTTP thread_pool_size must be at least 2 (one sender and one receiver)";
        return false;
    }
    if (config.http.read_timeout_ms < 100 || config.http.write_timeout_ms < 100) {
        error = "HTTP read/write timeouts must be >= 100ms";
        return false;
    }
    if (config.http.max_path_length < 1) {
        error = "HTTP max_path_length must be at least 1";
        return false;
    }

    // Validate relay settings
    if (config.relay.window_capacity_bytes < 1024) {
        error = "relay.window_capacity_bytes must be >= 1024";
        return false;
    }
    if (config.relay.max_chunk_bytes < 1 || config.relay.max_chunk_bytes > config.relay.window_capacity_bytes) {
        error = "relay.max_chunk_bytes must be between 1 and window_capacity_bytes";
        return false;
    }
    if (config.relay.sender_grace_ms < 0 || config.relay.receiver_grace_ms < 0) {
        error = "relay grace periods must be >= 0";
        return false;
    }
    if (config.relay.idle_timeout_ms < 1000) {
        error = "relay.idle_timeout_ms must be >= 1000ms";
        return false;
    }
    if (config.relay.tombstone_ttl_ms < 0) {
        error = "relay.tombstone_ttl_ms must be >= 0";
        return false;
    }
    if (config.relay.sender_stall_timeout_ms < 100) {
        error = "relay.sender_stall_timeout_ms must be >= 100ms";
        return false;
    }
    if (config.relay.read_wait_ms < 10 || config.relay.read_wait_ms > 60000) {
        error = "relay.read_wait_ms must be between 10 and 60000";
        return false;
    }
    if (config.relay.sweep_interval_ms < 10) {
        error = "relay.sweep_interval_ms must be >= 10ms";
        return false;
    }

    // Validate client settings
    if (config.client.connect_timeout_ms < 100 || config.client.io_timeout_ms < 100) {
        error = "client timeouts must be >= 100ms";
        return false;
    }
    if (config.client.segment_bytes < 1) {
        error = "client.segment_bytes must be at least 1";
        return false;
    }
    if (config.client.read_chunk_bytes < 1) {
        error = "client.read_chunk_bytes must be at least 1";
        return false;
    }
    if (config.client.flush_interval_ms < 1) {
        error = "client.flush_interval_ms must be >= 1ms";
        return false;
    }

    // Validate retry policy
    const auto &retry = config.client.retry;
    if (retry.max_attempts < 1) {
        error = "client.retry.max_attempts must be >= 1";
        return false;
    }
    if (retry.backoff_ms.empty()) {
        error = "client.retry.backoff_ms cannot be empty";
        return false;
    }
    for (size_t i = 0; i < retry.backoff_ms.size(); ++i) {
        if (retry.backoff_ms[i] < 0) {
            error = "client.retry.backoff_ms[" + std::to_string(i) + "] must be >= 0";
            return false;
        }
    }
    if (retry.max_retry_time_ms < 0) {
        error = "client.retry.max_retry_time_ms must be >= 0";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, PipeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml.IsNull()) {
            // Empty file: defaults only
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        warn_unknown_keys(yaml, "", {"http", "relay", "client", "logging"});

        // Load HTTP config
        if (const auto http = yaml["http"]) {
            warn_unknown_keys(http, "http.",
                              {"bind", "port", "thread_pool_size", "read_timeout_ms", "write_timeout_ms",
                               "max_path_length"});
            read_optional(http, "bind", config.http.bind);
            read_optional(http, "port", config.http.port);
            read_optional(http, "thread_pool_size", config.http.thread_pool_size);
            read_optional(http, "read_timeout_ms", config.http.read_timeout_ms);
            read_optional(http, "write_timeout_ms", config.http.write_timeout_ms);
            read_optional(http, "max_path_length", config.http.max_path_length);
        }

        // Load relay config
        if (const auto relay = yaml["relay"]) {
            warn_unknown_keys(relay, "relay.",
                              {"window_capacity_bytes", "max_chunk_bytes", "sender_grace_ms", "receiver_grace_ms",
                               "idle_timeout_ms", "tombstone_ttl_ms", "sender_stall_timeout_ms", "read_wait_ms",
                               "sweep_interval_ms"});
            read_optional(relay, "window_capacity_bytes", config.relay.window_capacity_bytes);
            read_optional(relay, "max_chunk_bytes", config.relay.max_chunk_bytes);
            read_optional(relay, "sender_grace_ms", config.relay.sender_grace_ms);
            read_optional(relay, "receiver_grace_ms", config.relay.receiver_grace_ms);
            read_optional(relay, "idle_timeout_ms", config.relay.idle_timeout_ms);
            read_optional(relay, "tombstone_ttl_ms", config.relay.tombstone_ttl_ms);
            read_optional(relay, "sender_stall_timeout_ms", config.relay.sender_stall_timeout_ms);
            read_optional(relay, "read_wait_ms", config.relay.read_wait_ms);
            read_optional(relay, "sweep_interval_ms", config.relay.sweep_interval_ms);
        }

        // Load client config
        if (const auto client = yaml["client"]) {
            warn_unknown_keys(client, "client.",
                              {"connect_timeout_ms", "io_timeout_ms", "segment_bytes", "flush_interval_ms",
                               "read_chunk_bytes", "retry"});
            read_optional(client, "connect_timeout_ms", config.client.connect_timeout_ms);
            read_optional(client, "io_timeout_ms", config.client.io_timeout_ms);
            read_optional(client, "segment_bytes", config.client.segment_bytes);
            read_optional(client, "flush_interval_ms", config.client.flush_interval_ms);
            read_optional(client, "read_chunk_bytes", config.client.read_chunk_bytes);

            if (const auto retry = client["retry"]) {
                read_optional(retry, "max_attempts", config.client.retry.max_attempts);
                read_optional(retry, "max_retry_time_ms", config.client.retry.max_retry_time_ms);

                // Backoff schedule (supports scalar or sequence)
                if (const auto backoff = retry["backoff_ms"]) {
                    config.client.retry.backoff_ms.clear();
                    if (backoff.IsSequence()) {
                        for (const auto &value : backoff) {
                            config.client.retry.backoff_ms.push_back(value.as<int>());
                        }
                    } else if (backoff.IsScalar()) {
                        config.client.retry.backoff_ms.push_back(backoff.as<int>());
                    }
                }
            }
        }

        // Load logging config
        if (const auto logging = yaml["logging"]) {
            read_optional(logging, "level", config.logging.level);
        }

        if (!validate_config(config, error)) {
            return false;
        }

        LOG_INFO("[Config] Loaded " << config_path);
        LOG_DEBUG("[Config] HTTP: " << config.http.bind << ":" << config.http.port << " ("
                                    << config.http.thread_pool_size << " workers)");
        LOG_DEBUG("[Config] Relay window: " << config.relay.window_capacity_bytes << " bytes, sender grace "
                                            << config.relay.sender_grace_ms << "ms, receiver grace "
                                            << config.relay.receiver_grace_ms << "ms");

        std::stringstream retry_msg;
        retry_msg << "[Config] Client retry: max_attempts=" << config.client.retry.max_attempts << " backoff_ms=[";
        for (size_t i = 0; i < config.client.retry.backoff_ms.size(); ++i) {
            retry_msg << (i == 0 ? "" : ", ") << config.client.retry.backoff_ms[i];
        }
        retry_msg << "]";
        LOG_DEBUG(retry_msg.str());

        LOG_DEBUG("[Config] Log level: " << config.logging.level);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace hpipe
