#pragma once

#include <chrono>
#include <string>

namespace linkerd_await {
namespace proxy {

// Interface to the local proxy admin server to enable mocking
class IAdminClient {
public:
    virtual ~IAdminClient() = default;

    // GET /ready. True only for a 2xx response received within timeout.
    virtual bool check_ready(std::chrono::milliseconds timeout) = 0;

    // POST /shutdown with an empty body. True only for a 2xx response.
    virtual bool request_shutdown(std::chrono::milliseconds timeout) = 0;

    // host:port of the admin server
    virtual const std::string &authority() const = 0;

    virtual const std::string &last_error() const = 0;
};

}  // namespace proxy
}  // namespace linkerd_await
