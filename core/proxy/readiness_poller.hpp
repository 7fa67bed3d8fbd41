#pragma once

#include <chrono>
#include <optional>

#include "i_admin_client.hpp"

namespace linkerd_await {
namespace proxy {

enum class ReadyOutcome { READY, DEADLINE_ELAPSED };

// ReadinessPoller blocks until the proxy reports ready.
//
// Each GET /ready is bounded by kAttemptTimeout. Any non-2xx status,
// connection error or attempt timeout counts as "not ready yet" and is
// followed by a constant backoff sleep. There is no attempt limit: the loop
// ends only when the proxy is ready or the optional deadline passes. Attempt
// timeouts and backoff sleeps are clipped to the deadline, so the gate never
// waits past it.
class ReadinessPoller {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kAttemptTimeout{5000};

    ReadinessPoller(IAdminClient &client, std::chrono::milliseconds backoff);

    ReadyOutcome await_ready(std::optional<Clock::time_point> deadline = std::nullopt);

    // Number of readiness requests issued by the last await_ready call
    int attempts() const { return attempts_; }

private:
    IAdminClient &client_;
    std::chrono::milliseconds backoff_;
    int attempts_ = 0;
};

}  // namespace proxy
}  // namespace linkerd_await
