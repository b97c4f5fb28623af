#include "signal_handler.hpp"

#include <csignal>

namespace hpipe {
namespace runtime {

namespace {
// Stored instead of a real signal number when shutdown is requested in-process
constexpr int kManualShutdown = -1;
}  // namespace

std::atomic<int> SignalHandler::received_signal_{0};

void SignalHandler::install() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);
}

bool SignalHandler::is_shutdown_requested() { return received_signal_.load() != 0; }

const char *SignalHandler::received_signal_name() {
    switch (received_signal_.load()) {
        case 0:
            return nullptr;
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        case kManualShutdown:
            return "shutdown request";
        default:
            return "signal";
    }
}

void SignalHandler::request_shutdown() { received_signal_.store(kManualShutdown); }

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: keep the first signal, nothing else
    int expected = 0;
    received_signal_.compare_exchange_strong(expected, signal);
}

}  // namespace runtime
}  // namespace hpipe
