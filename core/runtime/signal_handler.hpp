#pragma once

#include <signal.h>

#include <atomic>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace linkerd_await
{
    namespace runtime
    {

        // SignalHandler turns asynchronous signal delivery into a pollable event
        // source. The installed sigaction handler only writes the signal number
        // to a non-blocking self-pipe; the event loop reads it back with wait().
        //
        // Only one SignalHandler may be installed per process at a time. The
        // previous dispositions are restored by uninstall() or the destructor.
        class SignalHandler
        {
        public:
            SignalHandler() = default;
            ~SignalHandler();

            SignalHandler(const SignalHandler &) = delete;
            SignalHandler &operator=(const SignalHandler &) = delete;

            bool install(const std::vector<int> &signals);
            void uninstall();

            bool is_installed() const { return read_fd_ >= 0; }

            // Waits up to timeout_ms (-1 = forever) for the next signal.
            // Returns std::nullopt on timeout or error (see last_error()).
            std::optional<int> wait(int timeout_ms);

            const std::string &last_error() const { return error_; }

        private:
            static void handle_signal(int signal);
            static std::atomic<int> write_fd_;

            int read_fd_ = -1;
            std::vector<std::pair<int, struct sigaction>> previous_;
            std::string error_;
        };

    } // namespace runtime
} // namespace linkerd_await
