#include "readiness_poller.hpp"

#include <algorithm>
#include <thread>

#include "logging/logger.hpp"

namespace linkerd_await {
namespace proxy {

ReadinessPoller::ReadinessPoller(IAdminClient &client, std::chrono::milliseconds backoff)
    : client_(client), backoff_(backoff) {}

ReadyOutcome ReadinessPoller::await_ready(std::optional<Clock::time_point> deadline) {
    attempts_ = 0;

    auto remaining = [&deadline]() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now());
    };

    while (true) {
        auto attempt_timeout = kAttemptTimeout;
        if (deadline) {
            auto left = remaining();
            if (left.count() <= 0) {
                return ReadyOutcome::DEADLINE_ELAPSED;
            }
            attempt_timeout = std::min(attempt_timeout, left);
        }

        ++attempts_;
        if (client_.check_ready(attempt_timeout)) {
            LOG_INFO("[Readiness] Proxy ready at " << client_.authority() << " after " << attempts_
                                                   << " attempt(s)");
            return ReadyOutcome::READY;
        }
        LOG_DEBUG("[Readiness] Attempt " << attempts_ << " not ready: " << client_.last_error());

        auto sleep_for = backoff_;
        if (deadline) {
            auto left = remaining();
            if (left.count() <= 0) {
                return ReadyOutcome::DEADLINE_ELAPSED;
            }
            sleep_for = std::min(sleep_for, left);
        }
        std::this_thread::sleep_for(sleep_for);
    }
}

}  // namespace proxy
}  // namespace linkerd_await
