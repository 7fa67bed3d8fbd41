// linkerd-await
// Waits for the local Linkerd proxy to become ready before running a program

#include <sysexits.h>

#include <iostream>
#include <string>
#include <vector>

#include "logging/logger.hpp"
#include "process/process_launcher.hpp"
#include "proxy/admin_client.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"

#ifndef LINKERD_AWAIT_VERSION
#define LINKERD_AWAIT_VERSION "0.0.0"
#endif

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    linkerd_await::runtime::AwaitConfig config;
    linkerd_await::runtime::CliAction action;
    std::string error;

    if (!linkerd_await::runtime::build_config(args, linkerd_await::runtime::process_env(), config, action, error))
    {
        // Using cerr here as logger is not configured yet
        std::cerr << "error: " << error << "\n";
        std::cerr << "Use --help for usage information\n";
        return EX_USAGE;
    }

    if (action == linkerd_await::runtime::CliAction::HELP)
    {
        std::cout << linkerd_await::runtime::usage();
        return 0;
    }
    if (action == linkerd_await::runtime::CliAction::VERSION)
    {
        std::cout << "linkerd-await " << LINKERD_AWAIT_VERSION << "\n";
        return 0;
    }

    // Initialize logger level
    linkerd_await::logging::Logger::set_level(
        linkerd_await::logging::string_to_level(linkerd_await::runtime::effective_log_level(config)));

    LOG_DEBUG("linkerd-await " << LINKERD_AWAIT_VERSION << " starting");

    linkerd_await::proxy::AdminClient admin(config.admin.port);
    LOG_DEBUG("Admin endpoint: " << admin.authority());

    linkerd_await::process::ProcessLauncher launcher;
    linkerd_await::runtime::Runtime runtime(config, admin, launcher);

    return runtime.run();
}
