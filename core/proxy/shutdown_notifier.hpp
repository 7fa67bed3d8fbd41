#pragma once

#include <chrono>

#include "i_admin_client.hpp"

namespace linkerd_await {
namespace proxy {

// ShutdownNotifier asks the proxy to shut down once the supervised child has
// exited. Fire-and-forget: the outcome of the POST is discarded, it is never
// retried, and it must not influence the exit code.
class ShutdownNotifier {
public:
    static constexpr std::chrono::milliseconds kRequestTimeout{5000};

    explicit ShutdownNotifier(IAdminClient &client);

    // Sends POST /shutdown at most once per notifier
    void notify();

    bool notified() const { return notified_; }

private:
    IAdminClient &client_;
    bool notified_ = false;
};

}  // namespace proxy
}  // namespace linkerd_await
