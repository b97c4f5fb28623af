#pragma once

#include <atomic>

namespace hpipe
{
    namespace runtime
    {

        // SIGINT/SIGTERM set a flag that the server loop and the client loops poll.
        // SIGPIPE is ignored so that a closed stdout or a dropped socket surfaces
        // as a write error instead of killing the process.
        class SignalHandler
        {
        public:
            static void install();
            static bool is_shutdown_requested();

            // Name of the signal that requested shutdown, or nullptr if none arrived
            static const char *received_signal_name();

            // In-process shutdown, used when the HTTP listener dies
            static void request_shutdown();

        private:
            static void handle_signal(int signal);
            static std::atomic<int> received_signal_;
        };

    } // namespace runtime
} // namespace hpipe
