#include "admin_client.hpp"

#include <httplib.h>

#include <memory>
#include <utility>

namespace linkerd_await {
namespace proxy {

namespace {

std::unique_ptr<httplib::Client> make_client(const std::string &host, int port, std::chrono::milliseconds timeout) {
    auto client = std::make_unique<httplib::Client>(host, port);

    // httplib bounds each phase separately; the max timeout caps the whole
    // request, so a slowly trickling response cannot outlive the budget
    client->set_connection_timeout(timeout);
    client->set_read_timeout(timeout);
    client->set_write_timeout(timeout);
    client->set_max_timeout(timeout);
    client->set_keep_alive(false);
    return client;
}

bool is_success(int status) { return status >= 200 && status < 300; }

}  // namespace

AdminClient::AdminClient(int port, std::string host)
    : host_(std::move(host)), port_(port), authority_(host_ + ":" + std::to_string(port)) {}

bool AdminClient::check_ready(std::chrono::milliseconds timeout) {
    auto client = make_client(host_, port_, timeout);

    auto result = client->Get(kReadyPath);
    if (!result) {
        error_ = "GET " + ready_uri() + ": " + httplib::to_string(result.error());
        return false;
    }
    if (!is_success(result->status)) {
        error_ = "GET " + ready_uri() + ": HTTP " + std::to_string(result->status);
        return false;
    }

    error_.clear();
    return true;
}

bool AdminClient::request_shutdown(std::chrono::milliseconds timeout) {
    auto client = make_client(host_, port_, timeout);

    auto result = client->Post(kShutdownPath, std::string(), "text/plain");
    if (!result) {
        error_ = "POST " + shutdown_uri() + ": " + httplib::to_string(result.error());
        return false;
    }
    if (!is_success(result->status)) {
        error_ = "POST " + shutdown_uri() + ": HTTP " + std::to_string(result->status);
        return false;
    }

    error_.clear();
    return true;
}

}  // namespace proxy
}  // namespace linkerd_await
