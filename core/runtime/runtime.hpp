#pragma once

#include <chrono>
#include <optional>

#include "config.hpp"
#include "process/i_process_launcher.hpp"
#include "proxy/i_admin_client.hpp"

namespace linkerd_await {
namespace runtime {

// Runtime composes the readiness gate, the process launcher and the shutdown
// notifier into one invocation and decides the exit code.
//
// Flow: disable override -> readiness poll raced against the optional
// deadline -> (no CMD: exit 0) -> exec CMD, or with shutdown enabled spawn
// and supervise CMD, notify the proxy, and exit with the child's code.
class Runtime {
public:
    Runtime(const AwaitConfig &config, proxy::IAdminClient &admin, process::IProcessLauncher &launcher);

    // Runs the invocation and returns the process exit code. In exec mode this
    // does not return unless the exec failed.
    int run();

    // Exit code for a supervised child: its own code when it exited normally,
    // EX_OSERR otherwise
    static int exit_code_for(const process::ChildOutcome &outcome);

private:
    // Returns false when the readiness deadline elapsed and is fatal
    bool await_gate();

    // Deadline for the readiness gate; absent when no non-zero timeout is set
    std::optional<std::chrono::steady_clock::time_point> gate_deadline() const;

    int supervise();

    const AwaitConfig &config_;
    proxy::IAdminClient &admin_;
    process::IProcessLauncher &launcher_;
};

}  // namespace runtime
}  // namespace linkerd_await
