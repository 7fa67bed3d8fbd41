#pragma once

#include <sys/types.h>

#include <atomic>
#include <string>
#include <vector>

#include "child_process.hpp"
#include "runtime/signal_handler.hpp"

namespace linkerd_await {
namespace process {

// ChildSupervisor runs CMD as a child and relays SIGTERM to it.
//
// The caller installs the SIGTERM/SIGCHLD handler before run() forks, so a
// signal that arrives while the child is starting is not lost, and keeps it
// installed for as long as a SIGTERM must not terminate this process. The
// loop races two events: the child exiting on its own, and SIGTERM reaching
// this process. On SIGTERM the same signal is sent to the child and the
// supervisor blocks on the child's exit only.
class ChildSupervisor {
public:
    ChildSupervisor() = default;

    ChildSupervisor(const ChildSupervisor &) = delete;
    ChildSupervisor &operator=(const ChildSupervisor &) = delete;

    // signals must be installed for SIGTERM and SIGCHLD
    ChildOutcome run(const std::string &command, const std::vector<std::string> &args,
                     runtime::SignalHandler &signals);

    // PID of the running child, or -1. Safe to read from other threads.
    pid_t child_pid() const { return child_pid_.load(); }

    // Number of signals relayed to the child by the last run
    int forwarded_signals() const { return forwarded_signals_.load(); }

private:
    std::atomic<pid_t> child_pid_{-1};
    std::atomic<int> forwarded_signals_{0};
};

}  // namespace process
}  // namespace linkerd_await
