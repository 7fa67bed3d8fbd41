#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace linkerd_await {
namespace runtime {

constexpr int kDefaultAdminPort = 4191;

// Environment variables consulted once at startup
constexpr const char *kDisabledEnv = "LINKERD_AWAIT_DISABLED";
constexpr const char *kLegacyDisabledEnv = "LINKERD_DISABLED";
constexpr const char *kVerboseEnv = "LINKERD_AWAIT_VERBOSE";

struct AdminConfig {
    int port = kDefaultAdminPort;  // Local proxy admin server port (1-65535)
};

struct ReadinessConfig {
    std::chrono::milliseconds backoff{1000};         // Delay after a failed readiness check
    std::optional<std::chrono::milliseconds> timeout;  // Overall deadline; absent or zero = unbounded
    bool timeout_fatal = true;                         // Exit EX_UNAVAILABLE when the deadline elapses
};

struct LoggingConfig {
    std::string level;  // debug, info, warn, error; empty = derived from verbose
};

struct AwaitConfig {
    AdminConfig admin;
    ReadinessConfig readiness;
    LoggingConfig logging;

    bool shutdown = false;  // Fork CMD, forward SIGTERM, notify the proxy on exit
    bool verbose = false;

    // Set when --timeout-fatal appears on the command line; it requires CMD
    bool timeout_fatal_explicit = false;

    // Set by -v; the environment cannot turn verbose back off
    bool verbose_explicit = false;

    std::optional<std::string> command;
    std::vector<std::string> args;

    // First non-empty disable variable, resolved once at startup
    std::optional<std::string> disabled_reason;
};

// Returns the value of an environment variable, or nullptr when unset.
using EnvLookup = std::function<const char *(const char *)>;

// Environment lookup backed by std::getenv
EnvLookup process_env();

// What main should do after parsing the command line
enum class CliAction { RUN, HELP, VERSION };

// Loads YAML settings from config_path on top of config
bool load_config(const std::string &config_path, AwaitConfig &config, std::string &error);

// Applies LINKERD_AWAIT_VERBOSE and resolves the disable reason
void load_environment(const EnvLookup &env, AwaitConfig &config);

// Resolves the disable reason: LINKERD_AWAIT_DISABLED, then LINKERD_DISABLED.
// Empty values are ignored.
std::optional<std::string> disabled_reason(const EnvLookup &env);

// Parses argv (without the program name). A --config file is loaded before the
// remaining flags are applied so that flags take precedence over the file.
bool parse_command_line(const std::vector<std::string> &argv, AwaitConfig &config, CliAction &action,
                        std::string &error);

// Full startup pipeline: command line (with optional file), environment, validation
bool build_config(const std::vector<std::string> &argv, const EnvLookup &env, AwaitConfig &config,
                  CliAction &action, std::string &error);

// Validates the configuration
bool validate_config(const AwaitConfig &config, std::string &error);

// Effective log level: explicit level, else info when verbose, else warn
std::string effective_log_level(const AwaitConfig &config);

std::string usage();

}  // namespace runtime
}  // namespace linkerd_await
