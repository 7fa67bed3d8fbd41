#include "child_supervisor.hpp"

#include <signal.h>

#include <cstring>

#include "logging/logger.hpp"

namespace linkerd_await {
namespace process {

ChildOutcome ChildSupervisor::run(const std::string &command, const std::vector<std::string> &args,
                                  runtime::SignalHandler &signals) {
    forwarded_signals_.store(0);

    if (!signals.is_installed()) {
        LOG_ERROR("SIGTERM handler is not registered, refusing to fork " << command);
        return ChildOutcome::spawn_failure("signal handler not installed");
    }

    ChildProcess child(command, args);
    if (!child.spawn()) {
        LOG_ERROR("Failed to fork child program: " << command << ": " << child.last_error());
        return ChildOutcome::spawn_failure(child.last_error());
    }
    child_pid_.store(child.pid());

    ChildOutcome outcome;
    while (true) {
        // SIGCHLD may have been consumed already; always check the child first
        if (auto exited = child.try_wait()) {
            outcome = *exited;
            break;
        }

        auto received = signals.wait(-1);
        if (!received) {
            LOG_WARN("[Supervisor] Signal wait failed (" << signals.last_error() << "), waiting for child");
            outcome = child.wait();
            break;
        }

        if (*received == SIGCHLD) {
            continue;
        }

        // SIGTERM: kubelet uses it to start graceful shutdown
        LOG_INFO("[Supervisor] Received " << strsignal(*received) << ", forwarding to PID " << child.pid());
        if (child.send_signal(*received)) {
            forwarded_signals_.fetch_add(1);
        } else {
            LOG_WARN("Failed to forward " << strsignal(*received) << " to child process: " << child.last_error());
        }

        outcome = child.wait();
        break;
    }
    child_pid_.store(-1);

    if (outcome.exit_code) {
        LOG_INFO("[Supervisor] " << command << " exited with code " << *outcome.exit_code);
    } else if (outcome.term_signal) {
        LOG_WARN("[Supervisor] " << command << " terminated by signal " << *outcome.term_signal << " ("
                                 << strsignal(*outcome.term_signal) << ")");
    } else if (!outcome.error.empty()) {
        LOG_ERROR("[Supervisor] Could not determine exit status of " << command << ": " << outcome.error);
    }

    return outcome;
}

}  // namespace process
}  // namespace linkerd_await
