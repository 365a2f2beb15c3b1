#include <gtest/gtest.h>

#include "error.hpp"
#include "process_supervisor.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <optional>
#include <thread>
#include <vector>

using namespace tabmux;

namespace {

// Polls until pid is reaped or two seconds pass.
std::optional<ExitStatus> wait_exit(ProcessSupervisor &sup, pid_t pid) {
    for (int i = 0; i < 200; ++i) {
        for (auto &ex : sup.poll_exits()) {
            if (ex.pid == pid) return ex;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return std::nullopt;
}

}  // namespace

TEST(ProcessSupervisor, SpawnAndReap) {
    ProcessSupervisor sup;
    pid_t pid = sup.spawn({{"/bin/true"}, {}});
    EXPECT_GT(pid, 0);
    EXPECT_TRUE(sup.owns(pid));

    auto ex = wait_exit(sup, pid);
    ASSERT_TRUE(ex.has_value());
    EXPECT_TRUE(ex->exited);
    EXPECT_EQ(ex->code, 0);
    EXPECT_FALSE(sup.owns(pid));
    EXPECT_EQ(sup.process_count(), 0u);
}

TEST(ProcessSupervisor, ReportsExitCode) {
    ProcessSupervisor sup;
    pid_t pid = sup.spawn({{"sh", "-c", "exit 3"}, {}});
    auto ex = wait_exit(sup, pid);
    ASSERT_TRUE(ex.has_value());
    EXPECT_EQ(ex->code, 3);
}

TEST(ProcessSupervisor, SpawnFailures) {
    ProcessSupervisor sup;
    try {
        sup.spawn({{"/nonexistent/tabmux-client"}, {}});
        FAIL() << "spawn succeeded";
    } catch (const Error &e) {
        EXPECT_EQ(e.kind(), ErrorKind::SpawnError);
    }
    EXPECT_THROW(sup.spawn({{}, {}}), Error);
    EXPECT_EQ(sup.process_count(), 0u);
}

TEST(ProcessSupervisor, EmbedHintInEnvironmentAndArguments) {
    ProcessSupervisor sup;
    sup.set_embed_target(42);
    EXPECT_EQ(sup.expand_argv({"st", "-w", "{xid}", "--into={xid}"}),
              (std::vector<std::string>{"st", "-w", "42", "--into=42"}));

    pid_t pid = sup.spawn({{"sh", "-c", "test \"$TABMUX_XID\" = 42"}, {}});
    auto ex = wait_exit(sup, pid);
    ASSERT_TRUE(ex.has_value());
    EXPECT_EQ(ex->code, 0);
}

TEST(ProcessSupervisor, ExtraEnvironment) {
    ProcessSupervisor sup;
    pid_t pid = sup.spawn({{"sh", "-c", "test \"$TABMUX_TEST\" = yes"}, {{"TABMUX_TEST", "yes"}}});
    auto ex = wait_exit(sup, pid);
    ASSERT_TRUE(ex.has_value());
    EXPECT_EQ(ex->code, 0);
}

TEST(ProcessSupervisor, TerminateSendsSigterm) {
    ProcessSupervisor sup;
    pid_t pid = sup.spawn({{"sleep", "10"}, {}});
    EXPECT_TRUE(sup.terminate(pid));
    // repeated requests are harmless
    EXPECT_TRUE(sup.terminate(pid));

    auto ex = wait_exit(sup, pid);
    ASSERT_TRUE(ex.has_value());
    EXPECT_FALSE(ex->exited);
    EXPECT_EQ(ex->signal, SIGTERM);
    EXPECT_FALSE(sup.terminate(pid));
}

TEST(ProcessSupervisor, TerminateAll) {
    ProcessSupervisor sup;
    pid_t a = sup.spawn({{"sleep", "10"}, {}});
    pid_t b = sup.spawn({{"sleep", "10"}, {}});
    sup.terminate_all();

    std::vector<pid_t> reaped;
    for (int i = 0; i < 200 && reaped.size() < 2; ++i) {
        for (auto &ex : sup.poll_exits()) {
            EXPECT_EQ(ex.signal, SIGTERM);
            reaped.push_back(ex.pid);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    std::sort(reaped.begin(), reaped.end());
    std::vector<pid_t> expected{a, b};
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(reaped, expected);
}
