#include <atomic>
#include <chrono>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/process_manager.hpp"
#include "test_support.hpp"

namespace {

using agentrt::core::errors::get_error;
using agentrt::core::errors::get_value;
using agentrt::core::errors::is_error;
using agentrt::runtime::LaunchSpec;
using agentrt::runtime::ProcessManager;
using agentrt::testing::CapturedLog;
using agentrt::testing::TempDir;
using agentrt::testing::wait_until;

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

TEST(ProcessManagerTest, RequiresCommand) {
    const ProcessManager processes;
    const auto started = processes.start_detached(LaunchSpec{});
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).code, "launch_failed");
}

TEST(ProcessManagerTest, TerminatesGracefully) {
    const ProcessManager processes;
    LaunchSpec spec;
    spec.argv = {"sleep", "30"};
    const auto started = processes.start_detached(spec);
    ASSERT_FALSE(is_error(started));
    const pid_t pid = get_value(started);
    EXPECT_TRUE(processes.is_alive(pid));

    const auto stopped = processes.terminate(pid, std::chrono::milliseconds(2000));
    ASSERT_FALSE(is_error(stopped));
    EXPECT_TRUE(get_value(stopped));
    EXPECT_FALSE(processes.is_alive(pid));
}

TEST(ProcessManagerTest, EscalatesToKillWhenTermIgnored) {
    const ProcessManager processes;
    LaunchSpec spec;
    spec.argv = {"sh", "-c", "trap '' TERM; exec sleep 30"};
    const auto started = processes.start_detached(spec);
    ASSERT_FALSE(is_error(started));
    const pid_t pid = get_value(started);
    // Give the shell time to install the trap.
    std::this_thread::sleep_for(std::chrono::milliseconds(300));

    const auto stopped = processes.terminate(pid, std::chrono::milliseconds(300));
    ASSERT_FALSE(is_error(stopped));
    EXPECT_FALSE(get_value(stopped));
    EXPECT_FALSE(processes.is_alive(pid));
}

TEST(ProcessManagerTest, RedirectsOutputAndEnvironment) {
    TempDir dir("process_manager");
    const ProcessManager processes;
    LaunchSpec spec;
    spec.argv = {"sh", "-c", "echo \"value=$AGENTRT_TEST_VALUE\"; pwd"};
    spec.environment["AGENTRT_TEST_VALUE"] = "forty-two";
    spec.working_directory = dir.root();
    spec.log_path = dir.root() / "child_{pid}.log";

    const auto started = processes.start_detached(spec);
    ASSERT_FALSE(is_error(started));
    const pid_t pid = get_value(started);
    ASSERT_TRUE(wait_until([&]() { return !processes.is_alive(pid); }));

    const auto log = read_file(dir.root() / ("child_" + std::to_string(pid) + ".log"));
    EXPECT_NE(log.find("value=forty-two"), std::string::npos);
    EXPECT_NE(log.find(dir.root().filename().string()), std::string::npos);
}

TEST(ProcessManagerTest, ChildIgnoresParentSignalMask) {
    const ProcessManager processes;
    LaunchSpec spec;
    spec.argv = {"sleep", "30"};

    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGTERM);
    sigaddset(&blocked, SIGINT);
    sigset_t previous;
    ASSERT_EQ(pthread_sigmask(SIG_BLOCK, &blocked, &previous), 0);
    const auto started = processes.start_detached(spec);
    ASSERT_EQ(pthread_sigmask(SIG_SETMASK, &previous, nullptr), 0);
    ASSERT_FALSE(is_error(started));

    const auto stopped = processes.terminate(get_value(started), std::chrono::milliseconds(1500));
    ASSERT_FALSE(is_error(stopped));
    EXPECT_TRUE(get_value(stopped));
}

TEST(ProcessManagerTest, LaunchesWhileAnotherThreadHoldsTheLogger) {
    TempDir dir("process_manager");
    CapturedLog log;
    std::atomic<bool> done{false};
    std::thread chatter([&]() {
        while (!done.load()) {
            AGENTRT_LOG_INFO(log.logger(), "parent thread is busy");
        }
    });

    const ProcessManager processes;
    std::vector<pid_t> children;
    for (int i = 0; i < 20; ++i) {
        LaunchSpec spec;
        spec.argv = {"true"};
        spec.log_path = dir.root() / "child_{pid}.log";
        const auto started = processes.start_detached(spec);
        ASSERT_FALSE(is_error(started));
        children.push_back(get_value(started));
    }

    for (const pid_t pid : children) {
        EXPECT_TRUE(wait_until([&]() { return !processes.is_alive(pid); }))
            << "child " << pid << " is stuck";
    }
    done.store(true);
    chatter.join();
}

TEST(ProcessManagerTest, ExpandsPidToken) {
    EXPECT_EQ(agentrt::runtime::expand_pid_token("/tmp/run_{pid}.log", 77), "/tmp/run_77.log");
    EXPECT_EQ(agentrt::runtime::expand_pid_token("/tmp/plain.log", 77), "/tmp/plain.log");
}

TEST(ProcessManagerTest, QueriesOwnStatus) {
    const ProcessManager processes;
    const auto status = processes.query_status(getpid());
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(get_value(status).pid, getpid());
    EXPECT_FALSE(get_value(status).state.empty());
    EXPECT_GT(get_value(status).rss_bytes, 0);
    EXPECT_GE(get_value(status).uptime_seconds, 0.0);
}

TEST(ProcessManagerTest, ReportsExitedProcess) {
    const ProcessManager processes;
    LaunchSpec spec;
    spec.argv = {"true"};
    const auto started = processes.start_detached(spec);
    ASSERT_FALSE(is_error(started));
    const pid_t pid = get_value(started);
    ASSERT_TRUE(wait_until([&]() { return !processes.is_alive(pid); }));

    const auto status = processes.query_status(pid);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "process_not_found");

    const auto stopped = processes.terminate(pid, std::chrono::milliseconds(100));
    ASSERT_FALSE(is_error(stopped));
    EXPECT_TRUE(get_value(stopped));
}

TEST(ProcessManagerTest, RejectsInvalidPid) {
    const ProcessManager processes;
    const auto stopped = processes.terminate(0, std::chrono::milliseconds(100));
    ASSERT_TRUE(is_error(stopped));
    EXPECT_EQ(get_error(stopped).code, "invalid_pid");
    EXPECT_FALSE(processes.is_alive(-1));
}

}  // namespace
