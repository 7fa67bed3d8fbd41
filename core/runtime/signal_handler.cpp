#include "signal_handler.hpp"

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace linkerd_await {
namespace runtime {

std::atomic<int> SignalHandler::write_fd_{-1};

SignalHandler::~SignalHandler() { uninstall(); }

bool SignalHandler::install(const std::vector<int> &signals) {
    if (is_installed()) {
        error_ = "Signal handler already installed";
        return false;
    }
    if (write_fd_.load() >= 0) {
        error_ = "Another signal handler is installed";
        return false;
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC | O_NONBLOCK) < 0) {
        error_ = "Failed to create signal pipe: " + std::string(strerror(errno));
        return false;
    }
    read_fd_ = fds[0];
    write_fd_.store(fds[1]);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    for (int signal : signals) {
        struct sigaction previous;
        if (sigaction(signal, &action, &previous) < 0) {
            error_ = "Failed to register handler for signal " + std::to_string(signal) + ": " +
                     std::string(strerror(errno));
            uninstall();
            return false;
        }
        previous_.emplace_back(signal, previous);
    }

    return true;
}

void SignalHandler::uninstall() {
    for (auto it = previous_.rbegin(); it != previous_.rend(); ++it) {
        sigaction(it->first, &it->second, nullptr);
    }
    previous_.clear();

    if (read_fd_ >= 0) {
        int write_fd = write_fd_.exchange(-1);
        if (write_fd >= 0) {
            close(write_fd);
        }
        close(read_fd_);
        read_fd_ = -1;
    }
}

std::optional<int> SignalHandler::wait(int timeout_ms) {
    if (read_fd_ < 0) {
        error_ = "Signal handler not installed";
        return std::nullopt;
    }

    while (true) {
        unsigned char signal = 0;
        ssize_t n = read(read_fd_, &signal, 1);
        if (n == 1) {
            return static_cast<int>(signal);
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            error_ = "read failed: " + std::string(strerror(errno));
            return std::nullopt;
        }

        struct pollfd pfd;
        pfd.fd = read_fd_;
        pfd.events = POLLIN;
        pfd.revents = 0;
        int result = poll(&pfd, 1, timeout_ms);
        if (result < 0) {
            if (errno == EINTR) {
                // The signal that interrupted us is now in the pipe
                continue;
            }
            error_ = "poll failed: " + std::string(strerror(errno));
            return std::nullopt;
        }
        if (result == 0) {
            error_.clear();
            return std::nullopt;
        }
    }
}

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: only write(2) and errno are touched
    int saved_errno = errno;
    int fd = write_fd_.load();
    if (fd >= 0) {
        unsigned char byte = static_cast<unsigned char>(signal);
        ssize_t ignored = write(fd, &byte, 1);
        (void)ignored;
    }
    errno = saved_errno;
}

}  // namespace runtime
}  // namespace linkerd_await
