#include "shutdown_notifier.hpp"

#include "logging/logger.hpp"

namespace linkerd_await {
namespace proxy {

ShutdownNotifier::ShutdownNotifier(IAdminClient &client) : client_(client) {}

void ShutdownNotifier::notify() {
    if (notified_) {
        return;
    }
    notified_ = true;

    if (client_.request_shutdown(kRequestTimeout)) {
        LOG_INFO("[Shutdown] Proxy at " << client_.authority() << " acknowledged shutdown");
    } else {
        LOG_DEBUG("[Shutdown] Ignoring shutdown failure: " << client_.last_error());
    }
}

}  // namespace proxy
}  // namespace linkerd_await
