#include "runtime/signal_handler.hpp"

#include <gtest/gtest.h>
#include <signal.h>

#include <chrono>

using namespace linkerd_await::runtime;

namespace {

bool disposition_is_default(int signal) {
    struct sigaction current;
    sigaction(signal, nullptr, &current);
    return current.sa_handler == SIG_DFL;
}

}  // namespace

TEST(SignalHandlerTest, DeliversRaisedSignal) {
    SignalHandler handler;
    ASSERT_TRUE(handler.install({SIGUSR1})) << handler.last_error();
    EXPECT_TRUE(handler.is_installed());

    raise(SIGUSR1);

    auto received = handler.wait(1000);
    ASSERT_TRUE(received.has_value()) << handler.last_error();
    EXPECT_EQ(*received, SIGUSR1);
}

TEST(SignalHandlerTest, QueuesSignalsInOrder) {
    SignalHandler handler;
    ASSERT_TRUE(handler.install({SIGUSR1, SIGUSR2}));

    raise(SIGUSR2);
    raise(SIGUSR1);

    EXPECT_EQ(handler.wait(1000), SIGUSR2);
    EXPECT_EQ(handler.wait(1000), SIGUSR1);
}

TEST(SignalHandlerTest, WaitTimesOut) {
    SignalHandler handler;
    ASSERT_TRUE(handler.install({SIGUSR1}));

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(handler.wait(50).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
    EXPECT_TRUE(handler.last_error().empty());
}

TEST(SignalHandlerTest, OnlyOneInstallAtATime) {
    SignalHandler first;
    ASSERT_TRUE(first.install({SIGUSR1}));

    SignalHandler second;
    EXPECT_FALSE(second.install({SIGUSR2}));
    EXPECT_FALSE(second.last_error().empty());

    first.uninstall();
    EXPECT_TRUE(second.install({SIGUSR2})) << second.last_error();
}

TEST(SignalHandlerTest, UninstallRestoresPreviousDisposition) {
    ASSERT_TRUE(disposition_is_default(SIGUSR1));
    {
        SignalHandler handler;
        ASSERT_TRUE(handler.install({SIGUSR1}));
        EXPECT_FALSE(disposition_is_default(SIGUSR1));
    }
    EXPECT_TRUE(disposition_is_default(SIGUSR1));
}

TEST(SignalHandlerTest, WaitWithoutInstallFails) {
    SignalHandler handler;
    EXPECT_FALSE(handler.wait(0).has_value());
    EXPECT_FALSE(handler.last_error().empty());
}
