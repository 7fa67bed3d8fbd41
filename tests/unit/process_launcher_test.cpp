/**
 * process_launcher_test.cpp - ProcessLauncher unit tests
 *
 * Tests:
 * - Exec failures return EX_OSERR instead of replacing the process
 * - A successful exec hands the process over to CMD with its arguments
 * - Supervised mode returns the child's outcome
 */

#include "process/process_launcher.hpp"

#include <gtest/gtest.h>
#include <signal.h>
#include <sys/wait.h>
#include <sysexits.h>
#include <unistd.h>

using namespace linkerd_await::process;
using linkerd_await::runtime::SignalHandler;

/******************************************************************************
 * Exec Mode Tests
 ******************************************************************************/

TEST(ProcessLauncherTest, ExecMissingCommandReturnsOsErr) {
    EXPECT_EQ(ProcessLauncher().exec("/nonexistent/cmd", {}), EX_OSERR);
}

TEST(ProcessLauncherTest, ExecCommandNotOnPathReturnsOsErr) {
    EXPECT_EQ(exec_command("linkerd-await-test-no-such-command", {"--flag"}), EX_OSERR);
}

TEST(ProcessLauncherTest, ExecNonExecutableFileReturnsOsErr) {
    EXPECT_EQ(exec_command("/dev/null", {}), EX_OSERR);
}

TEST(ProcessLauncherTest, ExecReplacesProcessImage) {
    pid_t pid = fork();
    ASSERT_GE(pid, 0);
    if (pid == 0) {
        // Only reached in the child when exec failed
        _exit(exec_command("/bin/sh", {"-c", "exit $1", "sh", "5"}));
    }

    int status = 0;
    ASSERT_EQ(waitpid(pid, &status, 0), pid);
    ASSERT_TRUE(WIFEXITED(status));
    EXPECT_EQ(WEXITSTATUS(status), 5);
}

/******************************************************************************
 * Supervised Mode Tests
 ******************************************************************************/

TEST(ProcessLauncherTest, SpawnAndWaitReturnsChildOutcome) {
    SignalHandler signals;
    ASSERT_TRUE(signals.install({SIGTERM, SIGCHLD})) << signals.last_error();

    ProcessLauncher launcher;
    auto outcome = launcher.spawn_and_wait("/bin/sh", {"-c", "exit 3"}, signals);
    EXPECT_EQ(outcome.exit_code, 3);
}

TEST(ProcessLauncherTest, SpawnAndWaitReportsMissingCommand) {
    SignalHandler signals;
    ASSERT_TRUE(signals.install({SIGTERM, SIGCHLD})) << signals.last_error();

    ProcessLauncher launcher;
    auto outcome = launcher.spawn_and_wait("/nonexistent/cmd", {}, signals);
    EXPECT_FALSE(outcome.has_exit_code());
    EXPECT_FALSE(outcome.error.empty());
}
