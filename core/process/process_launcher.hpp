#pragma once

#include <string>
#include <vector>

#include "child_supervisor.hpp"
#include "i_process_launcher.hpp"

namespace linkerd_await {
namespace process {

// execvp(3) CMD in place of this process. Returns EX_OSERR if the image could
// not be replaced.
int exec_command(const std::string &command, const std::vector<std::string> &args);

class ProcessLauncher : public IProcessLauncher {
public:
    int exec(const std::string &command, const std::vector<std::string> &args) override;
    ChildOutcome spawn_and_wait(const std::string &command, const std::vector<std::string> &args,
                                runtime::SignalHandler &signals) override;

private:
    ChildSupervisor supervisor_;
};

}  // namespace process
}  // namespace linkerd_await
