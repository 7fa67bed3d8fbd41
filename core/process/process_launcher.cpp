#include "process_launcher.hpp"

#include <sysexits.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "logging/logger.hpp"

namespace linkerd_await {
namespace process {

int exec_command(const std::string &command, const std::vector<std::string> &args) {
    std::vector<char *> argv;
    argv.push_back(const_cast<char *>(command.c_str()));
    for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    LOG_DEBUG("[Exec] Replacing process image with " << command);
    execvp(argv[0], argv.data());

    // If we get here, exec failed
    int err = errno;
    LOG_ERROR("Failed to exec child program: " << command << ": " << strerror(err));
    return EX_OSERR;
}

int ProcessLauncher::exec(const std::string &command, const std::vector<std::string> &args) {
    return exec_command(command, args);
}

ChildOutcome ProcessLauncher::spawn_and_wait(const std::string &command, const std::vector<std::string> &args,
                                             runtime::SignalHandler &signals) {
    return supervisor_.run(command, args, signals);
}

}  // namespace process
}  // namespace linkerd_await
