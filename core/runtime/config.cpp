#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <sstream>

#include "../logging/logger.hpp"
#include "duration.hpp"

namespace linkerd_await {
namespace runtime {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool parse_port(const std::string &text, int &port, std::string &error) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        error = "Invalid port: '" + text + "'";
        return false;
    }
    if (text.size() > 5) {
        error = "Port must be between 1 and 65535";
        return false;
    }
    port = std::stoi(text);
    return true;
}

bool parse_duration_value(const std::string &name, const std::string &text, std::chrono::milliseconds &out,
                          std::string &error) {
    auto parsed = parse_duration(text);
    if (!parsed) {
        error = "Invalid duration for " + name + ": '" + text + "'";
        return false;
    }
    out = *parsed;
    return true;
}

bool parse_bool_value(const std::string &name, const std::string &text, bool &out, std::string &error) {
    if (text == "true") {
        out = true;
        return true;
    }
    if (text == "false") {
        out = false;
        return true;
    }
    error = "Invalid value for " + name + ": '" + text + "' (expected true or false)";
    return false;
}

// Values clap-style boolean environment flags treat as "off"
bool is_falsey(const std::string &value) {
    const std::string v = to_lower(value);
    return v.empty() || v == "0" || v == "false" || v == "no" || v == "off" || v == "n" || v == "f";
}

}  // namespace

EnvLookup process_env() {
    return [](const char *name) -> const char * { return std::getenv(name); };
}

std::optional<std::string> disabled_reason(const EnvLookup &env) {
    for (const char *name : {kDisabledEnv, kLegacyDisabledEnv}) {
        const char *value = env(name);
        if (value != nullptr && value[0] != '\0') {
            return std::string(value);
        }
    }
    return std::nullopt;
}

void load_environment(const EnvLookup &env, AwaitConfig &config) {
    // Overrides the YAML file in both directions; empty means unset
    const char *verbose = env(kVerboseEnv);
    if (verbose != nullptr && verbose[0] != '\0' && !config.verbose_explicit) {
        config.verbose = !is_falsey(verbose);
    }
    config.disabled_reason = disabled_reason(env);
}

bool validate_config(const AwaitConfig &config, std::string &error) {
    if (config.admin.port < 1 || config.admin.port > 65535) {
        error = "Port must be between 1 and 65535";
        return false;
    }

    if (config.readiness.backoff.count() < 0) {
        error = "Backoff must not be negative";
        return false;
    }

    if (config.shutdown && !config.command) {
        error = "--shutdown requires CMD";
        return false;
    }

    if (config.timeout_fatal_explicit && !config.command) {
        error = "--timeout-fatal requires CMD";
        return false;
    }

    const std::string &level = config.logging.level;
    if (!level.empty() && level != "debug" && level != "info" && level != "warn" && level != "error") {
        error = "Invalid log level: " + level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, AwaitConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (!yaml.IsMap()) {
            // An empty file parses as a null node
            if (yaml.IsNull()) {
                return true;
            }
            error = "Config root must be a mapping";
            return false;
        }

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"admin", "readiness", "shutdown", "verbose", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (yaml["admin"]) {
            if (yaml["admin"]["port"]) {
                config.admin.port = yaml["admin"]["port"].as<int>();
            }
        }

        if (yaml["readiness"]) {
            const auto &readiness = yaml["readiness"];
            if (readiness["backoff"]) {
                if (!parse_duration_value("readiness.backoff", readiness["backoff"].as<std::string>(),
                                          config.readiness.backoff, error)) {
                    return false;
                }
            }
            if (readiness["timeout"]) {
                std::chrono::milliseconds timeout{0};
                if (!parse_duration_value("readiness.timeout", readiness["timeout"].as<std::string>(), timeout,
                                          error)) {
                    return false;
                }
                config.readiness.timeout = timeout;
            }
            if (readiness["timeout_fatal"]) {
                config.readiness.timeout_fatal = readiness["timeout_fatal"].as<bool>();
            }
        }

        if (yaml["shutdown"]) {
            config.shutdown = yaml["shutdown"].as<bool>();
        }

        if (yaml["verbose"]) {
            config.verbose = yaml["verbose"].as<bool>();
        }

        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = to_lower(yaml["logging"]["level"].as<std::string>());
            }
        }

        LOG_DEBUG("[Config] Loaded " << config_path);
        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

bool parse_command_line(const std::vector<std::string> &argv, AwaitConfig &config, CliAction &action,
                        std::string &error) {
    action = CliAction::RUN;

    // The config file is the lowest-precedence explicit source, so load it first
    for (size_t i = 0; i < argv.size(); ++i) {
        const std::string &arg = argv[i];
        if (arg == "--") {
            break;
        }
        if (arg.rfind("--config=", 0) == 0) {
            if (!load_config(arg.substr(9), config, error)) {
                return false;
            }
        } else if (arg == "--config") {
            if (i + 1 >= argv.size()) {
                error = "--config requires a value";
                return false;
            }
            if (!load_config(argv[++i], config, error)) {
                return false;
            }
        } else if (!arg.empty() && arg[0] != '-') {
            // Options that take a value consume the next word, which may not
            // start with '-'; those are skipped in the second pass.
            const std::string prev = i > 0 ? argv[i - 1] : std::string();
            if (prev != "-p" && prev != "--port" && prev != "-b" && prev != "--backoff" && prev != "-t" &&
                prev != "--timeout" && prev != "--log-level") {
                break;
            }
        }
    }

    size_t i = 0;
    // Fetches the value of "--name VALUE" or "--name=VALUE"
    auto take_value = [&](const std::string &arg, const std::string &name, std::string &value) -> bool {
        if (arg.size() > name.size() && arg.compare(0, name.size() + 1, name + "=") == 0) {
            value = arg.substr(name.size() + 1);
            return true;
        }
        if (i + 1 >= argv.size()) {
            error = name + " requires a value";
            return false;
        }
        value = argv[++i];
        return true;
    };
    auto matches = [](const std::string &arg, const std::string &name) {
        return arg == name || arg.rfind(name + "=", 0) == 0;
    };

    for (; i < argv.size(); ++i) {
        const std::string &arg = argv[i];
        std::string value;

        if (arg == "--") {
            ++i;
            break;
        } else if (arg == "-h" || arg == "--help") {
            action = CliAction::HELP;
            return true;
        } else if (arg == "-V" || arg == "--version") {
            action = CliAction::VERSION;
            return true;
        } else if (arg == "-p" || matches(arg, "--port")) {
            if (!take_value(arg, arg == "-p" ? "-p" : "--port", value) ||
                !parse_port(value, config.admin.port, error)) {
                return false;
            }
        } else if (arg == "-b" || matches(arg, "--backoff")) {
            if (!take_value(arg, arg == "-b" ? "-b" : "--backoff", value) ||
                !parse_duration_value("--backoff", value, config.readiness.backoff, error)) {
                return false;
            }
        } else if (arg == "-t" || matches(arg, "--timeout")) {
            std::chrono::milliseconds timeout{0};
            if (!take_value(arg, arg == "-t" ? "-t" : "--timeout", value) ||
                !parse_duration_value("--timeout", value, timeout, error)) {
                return false;
            }
            config.readiness.timeout = timeout;
        } else if (arg == "--timeout-fatal") {
            // Bare flag means true; a value must be attached with '='
            config.readiness.timeout_fatal = true;
            config.timeout_fatal_explicit = true;
        } else if (arg.rfind("--timeout-fatal=", 0) == 0) {
            if (!parse_bool_value("--timeout-fatal", arg.substr(16), config.readiness.timeout_fatal, error)) {
                return false;
            }
            config.timeout_fatal_explicit = true;
        } else if (arg == "-S" || arg == "--shutdown") {
            config.shutdown = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
            config.verbose_explicit = true;
        } else if (matches(arg, "--log-level")) {
            if (!take_value(arg, "--log-level", value)) {
                return false;
            }
            config.logging.level = to_lower(value);
        } else if (matches(arg, "--config")) {
            // Already loaded above; skip the value
            if (!take_value(arg, "--config", value)) {
                return false;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown argument: " + arg;
            return false;
        } else {
            break;
        }
    }

    // Everything from the first positional on belongs to CMD
    if (i < argv.size()) {
        config.command = argv[i];
        config.args.assign(argv.begin() + static_cast<std::ptrdiff_t>(i) + 1, argv.end());
    }

    return true;
}

bool build_config(const std::vector<std::string> &argv, const EnvLookup &env, AwaitConfig &config,
                  CliAction &action, std::string &error) {
    if (!parse_command_line(argv, config, action, error)) {
        return false;
    }
    if (action != CliAction::RUN) {
        return true;
    }

    load_environment(env, config);

    return validate_config(config, error);
}

std::string effective_log_level(const AwaitConfig &config) {
    if (!config.logging.level.empty()) {
        return config.logging.level;
    }
    return config.verbose ? "info" : "warn";
}

std::string usage() {
    std::stringstream ss;
    ss << "Usage: linkerd-await [OPTIONS] [--] [CMD [ARGS...]]\n\n";
    ss << "Wait for linkerd to become ready before running a program.\n\n";
    ss << "Options:\n";
    ss << "  -p, --port <PORT>          The port of the local Linkerd proxy admin server (default: 4191)\n";
    ss << "  -b, --backoff <DURATION>   Time to wait after a failed readiness check (default: 1s)\n";
    ss << "  -t, --timeout <DURATION>   Fail when the timeout elapses before the proxy becomes ready\n";
    ss << "      --timeout-fatal[=BOOL] Whether a readiness timeout prevents CMD from running (default: true)\n";
    ss << "  -S, --shutdown             Fork CMD and trigger proxy shutdown on completion\n";
    ss << "  -v, --verbose              Print a message when the readiness check is disabled\n";
    ss << "      --config=PATH          Load settings from a YAML file\n";
    ss << "      --log-level=LEVEL      debug, info, warn or error\n";
    ss << "  -h, --help                 Show this help\n";
    ss << "  -V, --version              Show the version\n\n";
    ss << "Durations take a unit suffix: ms, s, m, h or d (e.g. 500ms, 30s, 2m).\n";
    ss << "Set " << kDisabledEnv << " or " << kLegacyDisabledEnv << " to skip the readiness check.\n";
    return ss.str();
}

}  // namespace runtime
}  // namespace linkerd_await
