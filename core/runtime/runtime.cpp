#include "runtime.hpp"

#include <signal.h>
#include <sysexits.h>

#include "duration.hpp"
#include "logging/logger.hpp"
#include "proxy/readiness_poller.hpp"
#include "proxy/shutdown_notifier.hpp"
#include "signal_handler.hpp"

namespace linkerd_await {
namespace runtime {

Runtime::Runtime(const AwaitConfig &config, proxy::IAdminClient &admin, process::IProcessLauncher &launcher)
    : config_(config), admin_(admin), launcher_(launcher) {}

int Runtime::run() {
    // If linkerd is not explicitly disabled, wait until the proxy is ready
    // before running the application.
    if (config_.disabled_reason) {
        if (config_.verbose) {
            LOG_INFO("Linkerd readiness check skipped: " << *config_.disabled_reason);
        }
    } else if (!await_gate()) {
        return EX_UNAVAILABLE;
    }

    if (!config_.command) {
        return 0;
    }

    if (config_.shutdown) {
        return supervise();
    }

    // Without shutdown there is nothing to supervise, so hand the process
    // over to CMD entirely
    return launcher_.exec(*config_.command, config_.args);
}

bool Runtime::await_gate() {
    proxy::ReadinessPoller poller(admin_, config_.readiness.backoff);
    if (poller.await_ready(gate_deadline()) == proxy::ReadyOutcome::READY) {
        return true;
    }

    LOG_ERROR("linkerd-proxy failed to become ready within " << format_duration(*config_.readiness.timeout)
                                                             << " timeout");
    if (config_.readiness.timeout_fatal) {
        return false;
    }

    // A non-fatal timeout is treated exactly like readiness from here on
    LOG_WARN("Continuing without proxy readiness (timeout is not fatal)");
    return true;
}

std::optional<std::chrono::steady_clock::time_point> Runtime::gate_deadline() const {
    const auto &timeout = config_.readiness.timeout;
    if (!timeout || timeout->count() == 0) {
        return std::nullopt;
    }
    return std::chrono::steady_clock::now() + *timeout;
}

int Runtime::supervise() {
    // Installed before the fork and held until the proxy has been notified: a
    // SIGTERM after the child exits must not cut the notification short.
    SignalHandler signals;
    if (!signals.install({SIGTERM, SIGCHLD})) {
        LOG_ERROR("Failed to register SIGTERM handler: " << signals.last_error());
    }

    auto outcome = launcher_.spawn_and_wait(*config_.command, config_.args, signals);

    // Once the process completes, ask the proxy to shut down. The child has
    // been reaped at this point, whether or not its status is known.
    proxy::ShutdownNotifier notifier(admin_);
    notifier.notify();

    return exit_code_for(outcome);
}

int Runtime::exit_code_for(const process::ChildOutcome &outcome) {
    if (outcome.exit_code) {
        return *outcome.exit_code;
    }
    return EX_OSERR;
}

}  // namespace runtime
}  // namespace linkerd_await
