// http-pipe
// Relay server (--server) or pipe client (<url>) with CLI argument parsing

#include <unistd.h>

#include <iostream>
#include <optional>
#include <string>
#include "client/byte_stream.hpp"
#include "client/pipe_url.hpp"
#include "client/transport_loop.hpp"
#include "http/protocol.hpp"
#include "runtime/runtime.hpp"
#include "runtime/config.hpp"
#include "runtime/signal_handler.hpp"
#include "logging/logger.hpp"

namespace
{
    constexpr int kExitUsage = 1;

    enum class ClientRole
    {
        AUTO,
        SEND,
        RECEIVE
    };

    void print_usage()
    {
        std::cerr << "Usage:\n";
        std::cerr << "  http-pipe --server <bind-address>[:port] [OPTIONS]\n";
        std::cerr << "  http-pipe [--send|--receive] [--offset=N] [OPTIONS] http://<host>[:port]/<path>\n\n";
        std::cerr << "Options:\n";
        std::cerr << "  --config=PATH    YAML config file (default: built-in defaults)\n";
        std::cerr << "  --debug          Log at debug level\n";
        std::cerr << "  --send           Send stdin (default when stdin is piped and stdout is a terminal)\n";
        std::cerr << "  --receive        Receive to stdout (default when stdin is a terminal)\n";
        std::cerr << "  --offset=N       Resume at stream offset N\n";
        std::cerr << "  --help, -h       Show this help\n";
    }

    // "host", "host:port", "[v6]:port" or ":port"
    bool parse_bind_address(const std::string &text, std::string &bind, int &port, std::string &error)
    {
        std::string host = text;
        std::string port_text;

        if (!text.empty() && text[0] == '[')
        {
            size_t close = text.find(']');
            if (close == std::string::npos)
            {
                error = "Unterminated IPv6 address: " + text;
                return false;
            }
            host = text.substr(1, close - 1);
            if (close + 1 < text.size())
            {
                if (text[close + 1] != ':')
                {
                    error = "Invalid bind address: " + text;
                    return false;
                }
                port_text = text.substr(close + 2);
            }
        }
        else
        {
            size_t colon = text.rfind(':');
            if (colon != std::string::npos)
            {
                host = text.substr(0, colon);
                port_text = text.substr(colon + 1);
            }
        }

        if (!host.empty())
        {
            bind = host;
        }
        if (!port_text.empty())
        {
            uint64_t value = 0;
            if (!hpipe::http::parse_offset(port_text, value) || value < 1 || value > 65535)
            {
                error = "Invalid port: " + port_text;
                return false;
            }
            port = static_cast<int>(value);
        }
        return true;
    }

    int run_server(hpipe::runtime::PipeConfig &config, const std::string &bind_address)
    {
        std::string error;
        if (!parse_bind_address(bind_address, config.http.bind, config.http.port, error))
        {
            LOG_ERROR(error);
            return kExitUsage;
        }

        LOG_INFO("http-pipe relay starting...");

        hpipe::runtime::Runtime runtime(config);
        if (!runtime.initialize(error))
        {
            LOG_ERROR("Runtime initialization failed: " + error);
            return kExitUsage;
        }

        LOG_INFO("Relay Ready");
        LOG_INFO("  Listening: " << config.http.bind << ":" << config.http.port);
        LOG_INFO("  Window: " << config.relay.window_capacity_bytes << " bytes per pipe");
        LOG_INFO("  Log level: " << hpipe::logging::level_to_string(hpipe::logging::Logger::level()));

        // Run main loop (blocking)
        runtime.run();
        runtime.shutdown();

        LOG_INFO("Shutdown complete");
        return 0;
    }

    int run_client(const hpipe::runtime::PipeConfig &config, const std::string &url, ClientRole role,
                   std::optional<uint64_t> offset)
    {
        hpipe::client::PipeUrl pipe_url;
        std::string error;
        if (!hpipe::client::parse_pipe_url(url, pipe_url, error))
        {
            LOG_ERROR(error);
            return kExitUsage;
        }

        if (role == ClientRole::AUTO)
        {
            const bool stdin_tty = ::isatty(STDIN_FILENO) != 0;
            const bool stdout_tty = ::isatty(STDOUT_FILENO) != 0;
            if (!stdin_tty && stdout_tty)
            {
                role = ClientRole::SEND;
            }
            else if (stdin_tty)
            {
                role = ClientRole::RECEIVE;
            }
            else
            {
                LOG_ERROR("Invalid usage: pipe either stdin or stdout, or pass --send/--receive");
                return kExitUsage;
            }
        }

        hpipe::logging::Logger::set_tag(role == ClientRole::SEND ? "send" : "receive");

        auto interrupted = []() { return hpipe::runtime::SignalHandler::is_shutdown_requested(); };

        hpipe::client::TransferResult result;
        if (role == ClientRole::SEND)
        {
            hpipe::client::FdByteSource source(STDIN_FILENO);
            hpipe::client::SenderLoop sender(pipe_url, config.client, source, offset, interrupted);
            result = sender.run();
        }
        else
        {
            hpipe::client::FdByteSink sink(STDOUT_FILENO);
            hpipe::client::ReceiverLoop receiver(pipe_url, config.client, sink, offset, interrupted);
            result = receiver.run();
        }

        if (!result.ok())
        {
            LOG_ERROR("Transfer failed (" << hpipe::client::transfer_outcome_to_string(result.outcome)
                                          << ") at offset " << result.offset << ": " << result.message);
        }
        else
        {
            LOG_DEBUG("Transfer complete: " << result.offset << " bytes, " << result.reconnects << " reconnect(s)");
        }
        return hpipe::client::transfer_outcome_to_exit_code(result.outcome);
    }
}

int main(int argc, char **argv)
{
    // Parse CLI arguments
    std::string config_path;
    std::string server_address;
    std::string url;
    bool server_mode = false;
    bool debug = false;
    ClientRole role = ClientRole::AUTO;
    std::optional<uint64_t> offset;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.substr(0, 9) == "--config=")
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--server" && i + 1 < argc)
        {
            server_mode = true;
            server_address = argv[++i];
        }
        else if (arg.substr(0, 9) == "--server=")
        {
            server_mode = true;
            server_address = arg.substr(9);
        }
        else if (arg == "--debug")
        {
            debug = true;
        }
        else if (arg == "--send")
        {
            role = ClientRole::SEND;
        }
        else if (arg == "--receive")
        {
            role = ClientRole::RECEIVE;
        }
        else if (arg.substr(0, 9) == "--offset=")
        {
            uint64_t value = 0;
            if (!hpipe::http::parse_offset(arg.substr(9), value))
            {
                std::cerr << "Invalid offset: " << arg.substr(9) << "\n";
                return kExitUsage;
            }
            offset = value;
        }
        else if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else if (!arg.empty() && arg[0] != '-' && url.empty())
        {
            url = arg;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return kExitUsage;
        }
    }

    if (server_mode == !url.empty())
    {
        print_usage();
        return kExitUsage;
    }
    if (server_mode && (role != ClientRole::AUTO || offset))
    {
        std::cerr << "--send, --receive and --offset only apply to client mode\n";
        return kExitUsage;
    }

    // Load configuration (defaults without --config)
    hpipe::runtime::PipeConfig config;
    std::string error;

    if (!config_path.empty() && !hpipe::runtime::load_config(config_path, config, error))
    {
        // Using cerr here as logger might not be configured yet
        std::cerr << "ERROR: Failed to load config: " << error << "\n";
        return kExitUsage;
    }

    // Initialize logger level
    hpipe::logging::Logger::set_level(debug ? hpipe::logging::Level::LVL_DEBUG
                                            : hpipe::logging::string_to_level(config.logging.level));

    // Install signal handler for graceful shutdown
    hpipe::runtime::SignalHandler::install();

    if (server_mode)
    {
        hpipe::logging::Logger::set_tag("server");
        return run_server(config, server_address);
    }
    return run_client(config, url, role, offset);
}
