#include "child_process.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "logging/logger.hpp"

namespace linkerd_await {
namespace process {

ChildOutcome ChildOutcome::from_wait_status(int status) {
    ChildOutcome outcome;
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.term_signal = WTERMSIG(status);
    }
    return outcome;
}

ChildOutcome ChildOutcome::spawn_failure(const std::string &error) {
    ChildOutcome outcome;
    outcome.error = error;
    return outcome;
}

ChildProcess::ChildProcess(const std::string &command, const std::vector<std::string> &args)
    : command_(command), args_(args), pid_(-1) {}

ChildProcess::~ChildProcess() {
    // Supervision always reaps; this only runs on abnormal unwinding
    if (pid_ > 0) {
        LOG_WARN("[Child] Killing unreaped child (PID=" << pid_ << ")");
        kill(pid_, SIGKILL);
        int status;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }
}

bool ChildProcess::spawn() {
    error_.clear();

    if (command_.empty()) {
        error_ = "Empty command";
        return false;
    }

    // Exec failures in the child are reported through this pipe; a successful
    // exec closes it without writing.
    int error_pipe[2];
    if (pipe2(error_pipe, O_CLOEXEC) < 0) {
        error_ = "Failed to create error pipe: " + std::string(strerror(errno));
        return false;
    }

    // Construct argv before forking; only async-signal-safe calls after fork
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(command_.c_str()));
    for (const auto &arg : args_) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error_ = "fork failed: " + std::string(strerror(errno));
        close(error_pipe[0]);
        close(error_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Child process
        close(error_pipe[0]);

        // Drop the supervisor's handlers before exec
        signal(SIGTERM, SIG_DFL);
        signal(SIGCHLD, SIG_DFL);

        execvp(argv[0], argv.data());

        // If we get here, exec failed
        int err = errno;
        ssize_t ignored = write(error_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(error_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(error_pipe[0]);

    if (n > 0) {
        // The child never ran CMD; reap it so it does not linger
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        error_ = strerror(child_errno);
        return false;
    }

    pid_ = pid;
    LOG_INFO("[Child] Spawned " << command_ << " (PID=" << pid_ << ")");
    return true;
}

std::optional<ChildOutcome> ChildProcess::try_wait() {
    if (pid_ <= 0) {
        error_ = "No child to wait for";
        return ChildOutcome::spawn_failure(error_);
    }

    while (true) {
        int status;
        pid_t result = waitpid(pid_, &status, WNOHANG);
        if (result == pid_) {
            pid_ = -1;
            return ChildOutcome::from_wait_status(status);
        }
        if (result == 0) {
            return std::nullopt;
        }
        if (errno == EINTR) {
            continue;
        }
        // ECHILD: reaped elsewhere, the exit status is lost
        error_ = "waitpid failed: " + std::string(strerror(errno));
        pid_ = -1;
        ChildOutcome outcome;
            outcome.error = error_;
        return outcome;
    }
}

ChildOutcome ChildProcess::wait() {
    if (pid_ <= 0) {
        error_ = "No child to wait for";
        return ChildOutcome::spawn_failure(error_);
    }

    while (true) {
        int status;
        pid_t result = waitpid(pid_, &status, 0);
        if (result == pid_) {
            pid_ = -1;
            return ChildOutcome::from_wait_status(status);
        }
        if (result < 0 && errno == EINTR) {
            continue;
        }
        error_ = "waitpid failed: " + std::string(strerror(errno));
        pid_ = -1;
        ChildOutcome outcome;
            outcome.error = error_;
        return outcome;
    }
}

bool ChildProcess::send_signal(int signal) {
    if (pid_ <= 0) {
        error_ = "Child is not running";
        return false;
    }
    if (kill(pid_, signal) < 0) {
        error_ = strerror(errno);
        return false;
    }
    return true;
}

}  // namespace process
}  // namespace linkerd_await
