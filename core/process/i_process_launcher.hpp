#pragma once

#include <string>
#include <vector>

#include "child_process.hpp"
#include "runtime/signal_handler.hpp"

namespace linkerd_await {
namespace process {

// The two ways of running CMD. Interface to enable mocking
class IProcessLauncher {
public:
    virtual ~IProcessLauncher() = default;

    // Replaces the current process image with CMD. Does not return on
    // success; on failure returns the exit code to terminate with.
    virtual int exec(const std::string &command, const std::vector<std::string> &args) = 0;

    // Runs CMD as a supervised child and returns once it has exited. SIGTERM
    // and SIGCHLD arrive through signals, which the caller owns.
    // Never throws; spawn failures are reported in the outcome.
    virtual ChildOutcome spawn_and_wait(const std::string &command, const std::vector<std::string> &args,
                                        runtime::SignalHandler &signals) = 0;
};

}  // namespace process
}  // namespace linkerd_await
