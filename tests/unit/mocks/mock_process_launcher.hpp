#pragma once
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "process/i_process_launcher.hpp"

namespace linkerd_await::tests {

class MockProcessLauncher : public process::IProcessLauncher {
public:
    MOCK_METHOD(int, exec, (const std::string &, const std::vector<std::string> &), (override));
    MOCK_METHOD(process::ChildOutcome, spawn_and_wait,
                (const std::string &, const std::vector<std::string> &, runtime::SignalHandler &), (override));
};

inline process::ChildOutcome exited_with(int code) {
    process::ChildOutcome outcome;
    outcome.exit_code = code;
    return outcome;
}

inline process::ChildOutcome killed_by(int signal) {
    process::ChildOutcome outcome;
    outcome.term_signal = signal;
    return outcome;
}

}  // namespace linkerd_await::tests
