#pragma once

#include <chrono>
#include <string>

#include "i_admin_client.hpp"

namespace linkerd_await {
namespace proxy {

constexpr const char *kAdminHost = "localhost";
constexpr const char *kReadyPath = "/ready";
constexpr const char *kShutdownPath = "/shutdown";

// AdminClient talks plain HTTP/1.1 to the proxy admin server on localhost.
// The endpoint authority is resolved once at construction; a fresh
// connection is opened per request.
class AdminClient : public IAdminClient {
public:
    explicit AdminClient(int port, std::string host = kAdminHost);

    bool check_ready(std::chrono::milliseconds timeout) override;
    bool request_shutdown(std::chrono::milliseconds timeout) override;

    const std::string &authority() const override { return authority_; }
    const std::string &last_error() const override { return error_; }

    std::string ready_uri() const { return "http://" + authority_ + kReadyPath; }
    std::string shutdown_uri() const { return "http://" + authority_ + kShutdownPath; }

private:
    std::string host_;
    int port_;
    std::string authority_;
    std::string error_;
};

}  // namespace proxy
}  // namespace linkerd_await
