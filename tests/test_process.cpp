#include <gtest/gtest.h>
#include "process/process.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <signal.h>
#include <sstream>
#include <string>
#include <thread>
#include <type_traits>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// Builder whose commands don't write into the test output
Shell quiet_shell(const std::string& dir = "") {
    Shell shell(dir);
    shell.stdin_fd = -1;
    shell.stdout_fd = -1;
    shell.stderr_fd = -1;
    return shell;
}

Command sh(const Shell& shell, const std::string& script) {
    return shell.command("sh", {"-c", script});
}

int count_threads() {
    int n = 0;
    for (const auto& entry : fs::directory_iterator("/proc/self/task")) {
        (void)entry;
        ++n;
    }
    return n;
}

size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

class ProcessTest : public ::testing::Test {
protected:
    std::string temp_dir_;

    void SetUp() override {
        temp_dir_ = (fs::temp_directory_path() / ("procctl-test-" + std::to_string(::getpid()))).string();
        fs::create_directories(temp_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(temp_dir_, ec);
    }
};

// ── Run / Wait ──────────────────────────────────────────────

TEST_F(ProcessTest, RunExitZero) {
    auto err = Process::run(sh(quiet_shell(), "exit 0"));
    EXPECT_TRUE(err.ok()) << err.message;
}

TEST_F(ProcessTest, RunExitNonZero) {
    auto err = Process::run(sh(quiet_shell(), "exit 7"));
    EXPECT_FALSE(err.ok());
    EXPECT_EQ(err.kind, ProcError::Kind::ExitStatus);
    EXPECT_EQ(err.code, 7);
    EXPECT_EQ(err.message, "exit status 7");
}

TEST_F(ProcessTest, StartReportsPidAndResolvedPath) {
    auto started = Process::start(quiet_shell().command("true"));
    ASSERT_TRUE(started.process) << started.error.message;
    EXPECT_GT(started.process->pid(), 0);
    EXPECT_NE(started.process->command().path.find('/'), std::string::npos);
    EXPECT_TRUE(started.process->wait().ok());
    EXPECT_TRUE(started.process->exited());
}

TEST_F(ProcessTest, OnlyStartConstructsProcesses) {
    static_assert(!std::is_default_constructible<Process::Key>::value,
                  "Process::Key must stay private to Process");
    static_assert(!std::is_copy_constructible<Process>::value, "Process is not copyable");

    auto started = Process::start(quiet_shell().command("true"));
    ASSERT_TRUE(started.process) << started.error.message;
    EXPECT_TRUE(started.error.ok());
    EXPECT_TRUE(started.process->wait().ok());
}

TEST_F(ProcessTest, SecondWaitReturnsCachedResult) {
    auto started = Process::start(sh(quiet_shell(), "exit 7"));
    ASSERT_TRUE(started.process);

    auto first = started.process->wait();
    auto second = started.process->wait(Deadline::after(100ms));
    EXPECT_EQ(first.message, "exit status 7");
    EXPECT_EQ(second.kind, first.kind);
    EXPECT_EQ(second.code, first.code);
}

TEST_F(ProcessTest, WaitDeadlineKillsProcess) {
    auto started = Process::start(quiet_shell().command("sleep", {"5"}));
    ASSERT_TRUE(started.process);

    auto start = std::chrono::steady_clock::now();
    auto err = started.process->wait(Deadline::after(50ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(err.ok()) << err.message;
    EXPECT_LT(elapsed, 2s);
    EXPECT_TRUE(started.process->exited());
}

TEST_F(ProcessTest, WaitCancelFlagKillsProcess) {
    auto started = Process::start(quiet_shell().command("sleep", {"5"}));
    ASSERT_TRUE(started.process);

    std::atomic<bool> cancel{false};
    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        cancel.store(true);
    });

    auto start = std::chrono::steady_clock::now();
    auto err = started.process->wait(Deadline().with_cancel(&cancel));
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_TRUE(err.ok()) << err.message;
    EXPECT_LT(elapsed, 2s);
    EXPECT_TRUE(started.process->exited());
}

// ── Stop / Kill ─────────────────────────────────────────────

TEST_F(ProcessTest, StopAfterWaitReturnsOk) {
    auto started = Process::start(sh(quiet_shell(), "exit 0"));
    ASSERT_TRUE(started.process);

    EXPECT_TRUE(started.process->wait().ok());
    EXPECT_TRUE(started.process->stop().ok());
}

TEST_F(ProcessTest, StopAfterNonZeroExitReturnsOk) {
    auto started = Process::start(sh(quiet_shell(), "exit 3"));
    ASSERT_TRUE(started.process);

    EXPECT_FALSE(started.process->wait().ok());
    // Already reaped: nothing left to signal
    EXPECT_TRUE(started.process->stop().ok());
}

TEST_F(ProcessTest, StopInterruptsRunningProcess) {
    auto started = Process::start(quiet_shell().command("sleep", {"10"}));
    ASSERT_TRUE(started.process);

    auto start = std::chrono::steady_clock::now();
    auto err = started.process->stop(Deadline::after(5s));
    EXPECT_TRUE(err.ok()) << err.message;
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);

    // Wait after Stop sees the original terminal result
    auto waited = started.process->wait();
    EXPECT_TRUE(waited.is_signal(SIGINT)) << waited.message;
    EXPECT_EQ(waited.message, "signal: interrupt");
}

TEST_F(ProcessTest, StopEscalatesToKillWhenInterruptIgnored) {
    auto started = Process::start(sh(quiet_shell(), "trap '' INT; exec sleep 10"));
    ASSERT_TRUE(started.process);

    // Give the shell time to install the trap before interrupting it
    std::this_thread::sleep_for(200ms);

    auto start = std::chrono::steady_clock::now();
    auto err = started.process->stop(Deadline::after(100ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(err.ok()) << err.message;
    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 2s);
    EXPECT_TRUE(started.process->exited());
    EXPECT_TRUE(started.process->wait().is_signal(SIGKILL));
}

TEST_F(ProcessTest, StopSurfacesUnexpectedExit) {
    // Catches SIGINT and exits with its own status instead
    auto started = Process::start(sh(quiet_shell(), "trap 'exit 9' INT; while :; do sleep 0.05; done"));
    ASSERT_TRUE(started.process);
    std::this_thread::sleep_for(200ms);

    auto err = started.process->stop(Deadline::after(5s));
    EXPECT_EQ(err.kind, ProcError::Kind::ExitStatus);
    EXPECT_EQ(err.code, 9);
}

TEST_F(ProcessTest, KillRunningProcess) {
    auto started = Process::start(quiet_shell().command("sleep", {"10"}));
    ASSERT_TRUE(started.process);

    auto err = started.process->kill();
    EXPECT_TRUE(err.ok()) << err.message;
    EXPECT_TRUE(started.process->wait().is_signal(SIGKILL));
}

TEST_F(ProcessTest, ConcurrentStopsShareOneOutcome) {
    auto started = Process::start(quiet_shell().command("sleep", {"10"}));
    ASSERT_TRUE(started.process);
    Process& proc = *started.process;

    std::vector<ProcError> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] { results[i] = proc.stop(Deadline::after(5s)); });
    }
    for (auto& t : threads) t.join();

    for (const auto& r : results) {
        EXPECT_TRUE(r.ok()) << r.message;
    }
    EXPECT_TRUE(proc.kill().ok());
    EXPECT_TRUE(proc.exited());
}

TEST_F(ProcessTest, KillThenStopReturnsRecordedOutcome) {
    auto started = Process::start(quiet_shell().command("sleep", {"10"}));
    ASSERT_TRUE(started.process);

    EXPECT_TRUE(started.process->kill().ok());
    EXPECT_TRUE(started.process->stop(Deadline::after(100ms)).ok());
}

TEST_F(ProcessTest, WaitRacingStop) {
    auto started = Process::start(quiet_shell().command("sleep", {"10"}));
    ASSERT_TRUE(started.process);
    Process& proc = *started.process;

    ProcError waited;
    std::thread waiter([&] { waited = proc.wait(Deadline::after(5s)); });
    std::this_thread::sleep_for(50ms);
    EXPECT_TRUE(proc.stop(Deadline::after(5s)).ok());
    waiter.join();

    EXPECT_TRUE(waited.is_signal(SIGINT)) << waited.message;
}

// ── Launch failures ─────────────────────────────────────────

TEST_F(ProcessTest, StartMissingBinaryFails) {
    auto started = Process::start(quiet_shell().command("/nonexistent/binary"));
    EXPECT_FALSE(started.process);
    EXPECT_EQ(started.error.kind, ProcError::Kind::Launch);
    EXPECT_EQ(started.error.code, ENOENT);
}

TEST_F(ProcessTest, StartUnknownNameFails) {
    auto started = Process::start(quiet_shell().command("procctl-no-such-program"));
    EXPECT_FALSE(started.process);
    EXPECT_EQ(started.error.kind, ProcError::Kind::Launch);
    EXPECT_NE(started.error.message.find("not found"), std::string::npos);
}

TEST_F(ProcessTest, StartBadWorkingDirFails) {
    auto started = Process::start(sh(quiet_shell(temp_dir_ + "/missing"), "exit 0"));
    EXPECT_FALSE(started.process);
    EXPECT_EQ(started.error.kind, ProcError::Kind::Launch);
    EXPECT_EQ(started.error.code, ENOENT);
    EXPECT_NE(started.error.message.find("chdir"), std::string::npos);
}

TEST_F(ProcessTest, RunPropagatesLaunchFailure) {
    auto err = Process::run(quiet_shell().command("/nonexistent/binary"));
    EXPECT_EQ(err.kind, ProcError::Kind::Launch);
}

// ── Descriptor plumbing ─────────────────────────────────────

TEST_F(ProcessTest, ExplicitEnvironmentReplacesInherited) {
    setenv("PROCCTL_TEST_LEAK", "1", 1);
    Shell shell = quiet_shell();
    shell.env = {"PROCCTL_TEST_VALUE=hello"};

    auto err = Process::run(sh(shell, "test \"$PROCCTL_TEST_VALUE\" = hello && test -z \"$PROCCTL_TEST_LEAK\""));
    EXPECT_TRUE(err.ok()) << err.message;
    unsetenv("PROCCTL_TEST_LEAK");
}

TEST_F(ProcessTest, ExtraDescriptorsStartAtThree) {
    int fds[2];
    ASSERT_EQ(::pipe2(fds, O_CLOEXEC), 0);

    Command cmd = sh(quiet_shell(), "echo extra >&3");
    cmd.extra_fds = {fds[1]};
    auto err = Process::run(cmd);
    ::close(fds[1]);
    EXPECT_TRUE(err.ok()) << err.message;

    char buf[32] = {};
    ssize_t n = ::read(fds[0], buf, sizeof(buf) - 1);
    ::close(fds[0]);
    ASSERT_GT(n, 0);
    EXPECT_EQ(std::string(buf, n), "extra\n");
}

// ── Restart ─────────────────────────────────────────────────

TEST_F(ProcessTest, RestartRunsCommandAgain) {
    std::string out_path = temp_dir_ + "/out.txt";
    int out_fd = ::open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    ASSERT_GE(out_fd, 0);

    Shell shell = quiet_shell();
    shell.stdout_fd = out_fd;

    auto started = Process::start(sh(shell, "echo restart-ok"));
    ASSERT_TRUE(started.process);
    EXPECT_TRUE(started.process->wait().ok());

    auto next = started.process->restart();
    ASSERT_TRUE(next.process) << next.error.message;
    EXPECT_TRUE(next.process->wait().ok());
    ::close(out_fd);

    EXPECT_EQ(count_occurrences(read_file(out_path), "restart-ok"), 2u);
}

TEST_F(ProcessTest, RestartPreservesDirAndEnv) {
    const std::string token = "restart-token-123";
    std::string work_dir = temp_dir_ + "/work";
    fs::create_directories(work_dir);
    std::string out_path = temp_dir_ + "/fds.txt";
    int out_fd = ::open(out_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    ASSERT_GE(out_fd, 0);

    Shell shell = quiet_shell(work_dir);
    shell.stdout_fd = out_fd;
    shell.set_env("PROCCTL_RESTART_TOKEN", token);

    auto started = Process::start(sh(shell, "printf \"%s|%s\\n\" \"$PROCCTL_RESTART_TOKEN\" \"$(pwd -P)\""));
    ASSERT_TRUE(started.process);
    EXPECT_TRUE(started.process->wait().ok());

    auto next = started.process->restart();
    ASSERT_TRUE(next.process) << next.error.message;
    EXPECT_TRUE(next.process->wait().ok());
    ::close(out_fd);

    std::string expect = token + "|" + fs::canonical(work_dir).string();
    EXPECT_EQ(count_occurrences(read_file(out_path), expect), 2u);
}

TEST_F(ProcessTest, RestartStopsRunningProcess) {
    auto started = Process::start(quiet_shell().command("sleep", {"10"}));
    ASSERT_TRUE(started.process);
    pid_t first_pid = started.process->pid();

    auto next = started.process->restart(Deadline::after(5s));
    ASSERT_TRUE(next.process) << next.error.message;
    EXPECT_TRUE(started.process->exited());
    EXPECT_NE(next.process->pid(), first_pid);
    EXPECT_FALSE(next.process->exited());

    EXPECT_TRUE(next.process->stop(Deadline::after(5s)).ok());
}

// ── Reaper lifetime ─────────────────────────────────────────

TEST_F(ProcessTest, StartStopCyclesDoNotLeakReapers) {
    // Let reapers from earlier tests finish
    std::this_thread::sleep_for(100ms);
    int base_reapers = Process::active_reapers();
    int base_threads = count_threads();

    Shell shell = quiet_shell();
    for (int i = 0; i < 120; ++i) {
        auto started = Process::start(sh(shell, "exit 0"));
        ASSERT_TRUE(started.process) << started.error.message;
        std::this_thread::sleep_for(3ms);
        EXPECT_TRUE(started.process->stop().ok());
    }

    std::this_thread::sleep_for(200ms);

    EXPECT_LE(Process::active_reapers() - base_reapers, 0);
    EXPECT_LE(count_threads() - base_threads, 20);
}

TEST_F(ProcessTest, ReleasingControllerStopsChild) {
    pid_t pid;
    {
        auto started = Process::start(quiet_shell().command("sleep", {"10"}));
        ASSERT_TRUE(started.process);
        pid = started.process->pid();
    }
    // The reaper collected the child, so the pid no longer refers to it
    std::this_thread::sleep_for(100ms);
    EXPECT_NE(::kill(pid, 0), 0);
}
