#pragma once

#include <sys/types.h>

#include <optional>
#include <string>
#include <vector>

namespace linkerd_await {
namespace process {

// Result of supervising a spawned process. exit_code is set only when the
// child exited normally; a child killed by a signal has term_signal instead.
// Neither is set when the child could not be spawned.
struct ChildOutcome {
    std::optional<int> exit_code;
    std::optional<int> term_signal;
    std::string error;

    bool has_exit_code() const { return exit_code.has_value(); }

    static ChildOutcome from_wait_status(int status);
    static ChildOutcome spawn_failure(const std::string &error);
};

// ChildProcess manages the lifecycle of the supervised child process
// Responsibilities:
// - Spawn CMD (PATH lookup) with inherited stdio and environment
// - Report exec failures in the child back to the parent
// - Non-blocking and blocking reaping
// - Signal delivery
class ChildProcess {
public:
    ChildProcess(const std::string &command, const std::vector<std::string> &args = {});
    ~ChildProcess();

    // Delete copy/move
    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    // Fork and exec the command.
    // Returns true once the child is running CMD, false on failure (sets error_)
    bool spawn();

    // Check if the child has been spawned and not yet reaped
    bool is_running() const { return pid_ > 0; }

    // Reap the child if it has exited; std::nullopt while it is still running
    std::optional<ChildOutcome> try_wait();

    // Block until the child exits
    ChildOutcome wait();

    // Deliver a signal to the child. Returns false if it could not be sent.
    bool send_signal(int signal);

    pid_t pid() const { return pid_; }
    const std::string &command() const { return command_; }

    // Get last error
    const std::string &last_error() const { return error_; }

private:
    std::string command_;
    std::vector<std::string> args_;
    std::string error_;

    pid_t pid_;
};

}  // namespace process
}  // namespace linkerd_await
