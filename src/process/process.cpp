#include "process/process.hpp"
#include "process/exit_slot.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <mutex>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <vector>

extern char** environ;

struct Process::Handle {
    pid_t pid = -1;
    std::mutex mutex;     // orders signal delivery against reaping
    bool reaped = false;  // pid must not be signalled once set
    ExitSlot exit;
};

namespace {

std::atomic<int> g_active_reapers{0};

// Same grace the daemon used to give its child before SIGKILL
constexpr auto kDestroyGrace = std::chrono::seconds(5);

constexpr const char* kDefaultSearchPath = "/usr/local/bin:/usr/bin:/bin";

// ── Launch helpers ──────────────────────────────────────────

enum class ChildStage : int { Redirect = 1, Chdir, Exec };

struct ChildFailure {
    ChildStage stage;
    int err;
};

bool is_executable(const std::string& path) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

/// Resolve `name` against $PATH in the parent so the child only needs execve()
bool resolve_executable(const std::string& name, std::string& out) {
    if (name.empty()) return false;
    if (name.find('/') != std::string::npos) {
        out = name;
        return true;
    }

    const char* env_path = std::getenv("PATH");
    std::string search = (env_path && *env_path) ? env_path : kDefaultSearchPath;

    size_t start = 0;
    while (start <= search.size()) {
        size_t end = search.find(':', start);
        if (end == std::string::npos) end = search.size();
        std::string dir = search.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string candidate = dir + "/" + name;
        if (is_executable(candidate)) {
            out = candidate;
            return true;
        }
        start = end + 1;
    }
    return false;
}

// Only async-signal-safe calls from here on: we are in a forked child
[[noreturn]] void child_fail(int report_fd, ChildStage stage) {
    ChildFailure failure{stage, errno};
    ssize_t n = ::write(report_fd, &failure, sizeof(failure));
    (void)n;
    _exit(127);
}

void close_fd(int fd) {
    if (fd >= 0) ::close(fd);
}

/// fork + execve. Failures in the child are reported back through a
/// close-on-exec pipe, so a successful return means execve() succeeded.
ProcError spawn(const Command& cmd, const std::string& path, pid_t& pid_out) {
    std::vector<std::string> args = cmd.args;
    if (args.empty()) args.push_back(path);

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    char** envp_ptr = environ;
    if (cmd.env) {
        envp.reserve(cmd.env->size() + 1);
        for (const auto& entry : *cmd.env) envp.push_back(const_cast<char*>(entry.c_str()));
        envp.push_back(nullptr);
        envp_ptr = envp.data();
    }

    int null_fd = -1;
    if (cmd.stdin_fd < 0 || cmd.stdout_fd < 0 || cmd.stderr_fd < 0) {
        null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
        if (null_fd < 0) {
            return ProcError::launch(errno, "open /dev/null");
        }
    }

    // sources[i] becomes descriptor i in the child
    std::vector<int> sources = {
        cmd.stdin_fd < 0 ? null_fd : cmd.stdin_fd,
        cmd.stdout_fd < 0 ? null_fd : cmd.stdout_fd,
        cmd.stderr_fd < 0 ? null_fd : cmd.stderr_fd,
    };
    sources.insert(sources.end(), cmd.extra_fds.begin(), cmd.extra_fds.end());
    const int target_count = static_cast<int>(sources.size());

    int report[2];
    if (::pipe2(report, O_CLOEXEC) < 0) {
        int err = errno;
        close_fd(null_fd);
        return ProcError::launch(err, "pipe");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_fd(report[0]);
        close_fd(report[1]);
        close_fd(null_fd);
        return ProcError::launch(err, "fork/exec " + path);
    }

    if (pid == 0) {
        // Child process
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        int report_fd = ::fcntl(report[1], F_DUPFD_CLOEXEC, target_count);
        if (report_fd < 0) _exit(127);

        // Move every source above the target range first, so the dup2()
        // calls below never overwrite a source that is still needed
        for (int i = 0; i < target_count; ++i) {
            int fd = ::fcntl(sources[i], F_DUPFD_CLOEXEC, target_count);
            if (fd < 0) child_fail(report_fd, ChildStage::Redirect);
            sources[i] = fd;
        }
        for (int i = 0; i < target_count; ++i) {
            if (::dup2(sources[i], i) < 0) child_fail(report_fd, ChildStage::Redirect);
        }

        if (!cmd.dir.empty() && ::chdir(cmd.dir.c_str()) < 0) {
            child_fail(report_fd, ChildStage::Chdir);
        }

        ::execve(path.c_str(), argv.data(), envp_ptr);
        child_fail(report_fd, ChildStage::Exec);
    }

    // Parent process
    close_fd(report[1]);
    close_fd(null_fd);

    ChildFailure failure{};
    ssize_t n;
    do {
        n = ::read(report[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    close_fd(report[0]);

    if (n != static_cast<ssize_t>(sizeof(failure))) {
        pid_out = pid;
        return ProcError();
    }

    // The child never exec'd; collect it before reporting
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}

    switch (failure.stage) {
        case ChildStage::Chdir:
            return ProcError::launch(failure.err, "chdir " + cmd.dir);
        case ChildStage::Redirect:
            return ProcError::launch(failure.err, "redirect descriptors for " + path);
        case ChildStage::Exec:
            break;
    }
    return ProcError::launch(failure.err, "fork/exec " + path);
}

}  // namespace

// ── Reaper ──────────────────────────────────────────────────

void Process::reap(const std::shared_ptr<Handle>& handle) {
    // Observe the exit without collecting it, so the pid stays valid until
    // `reaped` is set under the mutex that send_signal() holds
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(handle->pid), &info, WEXITED | WNOWAIT);
    } while (rc < 0 && errno == EINTR);

    ProcError result;
    {
        std::lock_guard<std::mutex> lock(handle->mutex);
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(handle->pid, &status, 0);
        } while (r < 0 && errno == EINTR);
        handle->reaped = true;
        result = r < 0 ? ProcError::wait_failed(errno) : ProcError::from_wait_status(status);
    }

    handle->exit.put(result);
}

// ── Start ───────────────────────────────────────────────────

Process::Process(Key, Command cmd, std::shared_ptr<Handle> handle)
    : command_(std::move(cmd)), handle_(std::move(handle)) {}

Process::StartResult Process::start(const Command& cmd) {
    StartResult result;

    std::string path;
    if (!resolve_executable(cmd.path, path)) {
        result.error = ProcError::launch(0, "exec: \"" + cmd.path + "\": executable file not found in $PATH");
        return result;
    }

    pid_t pid = -1;
    result.error = spawn(cmd, path, pid);
    if (!result.error.ok()) {
        spdlog::debug("failed to start {}: {}", cmd.display(), result.error.message);
        return result;
    }

    auto handle = std::make_shared<Handle>();
    handle->pid = pid;

    g_active_reapers.fetch_add(1);
    try {
        std::thread([handle] {
            reap(handle);
            g_active_reapers.fetch_sub(1);
        }).detach();
    } catch (const std::system_error& e) {
        g_active_reapers.fetch_sub(1);
        // Without a reaper nobody would ever collect the child
        ::kill(pid, SIGKILL);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        result.error = ProcError::launch(e.code().value(), "spawn reaper thread for " + path);
        return result;
    }

    Command resolved = cmd;
    resolved.path = path;
    result.process = std::make_unique<Process>(Key(), std::move(resolved), std::move(handle));
    spdlog::debug("started {} (pid {})", cmd.display(), pid);
    return result;
}

ProcError Process::run(const Command& cmd, const Deadline& deadline) {
    auto started = start(cmd);
    if (!started.process) {
        return started.error;
    }
    return started.process->wait(deadline);
}

Process::~Process() {
    if (handle_->exit.ready() || terminate_once_.done()) {
        return;
    }
    ProcError err = stop(Deadline::after(kDestroyGrace));
    if (!err.ok()) {
        spdlog::warn("stopping {} (pid {}) on release: {}", command_.display(), handle_->pid, err.message);
    }
}

// ── Queries ─────────────────────────────────────────────────

pid_t Process::pid() const {
    return handle_->pid;
}

bool Process::exited() const {
    return handle_->exit.ready();
}

int Process::active_reapers() {
    return g_active_reapers.load();
}

// ── Termination ─────────────────────────────────────────────

Process::SendResult Process::send_signal(int signo, int& err) {
    std::lock_guard<std::mutex> lock(handle_->mutex);
    if (handle_->reaped) {
        return SendResult::Gone;
    }
    if (::kill(handle_->pid, signo) == 0) {
        return SendResult::Sent;
    }
    err = errno;
    return err == ESRCH ? SendResult::Gone : SendResult::Failed;
}

ProcError Process::wait(const Deadline& deadline) {
    if (auto result = handle_->exit.wait_until(deadline)) {
        return *result;
    }
    spdlog::info("deadline expired waiting for {} (pid {}), killing", command_.display(), handle_->pid);
    return kill();
}

ProcError Process::stop(const Deadline& deadline) {
    return terminate_once_.run([this, &deadline] { return do_stop(deadline); });
}

ProcError Process::kill() {
    return terminate_once_.run([this] { return do_kill(); });
}

ProcError Process::do_stop(const Deadline& deadline) {
    int signo = SIGINT;
    int err = 0;

    switch (send_signal(SIGINT, err)) {
        case SendResult::Gone:
            return ProcError();
        case SendResult::Sent:
            break;
        case SendResult::Failed:
            spdlog::warn("interrupting pid {} failed ({}), sending SIGKILL", handle_->pid, err);
            signo = SIGKILL;
            switch (send_signal(SIGKILL, err)) {
                case SendResult::Gone:
                    return ProcError();
                case SendResult::Failed:
                    return ProcError::signal_failed(err, SIGKILL);
                case SendResult::Sent:
                    break;
            }
            break;
    }

    auto result = handle_->exit.wait_until(deadline);
    if (!result) {
        spdlog::info("pid {} did not stop in time, killing", handle_->pid);
        return do_kill();
    }

    if (!result->ok() && !result->is_signal(signo)) {
        spdlog::debug("pid {} stopped with unexpected result: {}", handle_->pid, result->message);
        return *result;
    }
    return ProcError();
}

ProcError Process::do_kill() {
    int err = 0;
    switch (send_signal(SIGKILL, err)) {
        case SendResult::Gone:
            return ProcError();
        case SendResult::Failed:
            return ProcError::signal_failed(err, SIGKILL);
        case SendResult::Sent:
            break;
    }

    ProcError result = handle_->exit.wait();
    if (!result.ok() && !result.is_signal(SIGKILL)) {
        spdlog::debug("pid {} killed with unexpected result: {}", handle_->pid, result.message);
        return result;
    }
    return ProcError();
}

// ── Restart ─────────────────────────────────────────────────

Process::StartResult Process::restart(const Deadline& deadline) {
    StartResult result;
    result.error = stop(deadline);
    if (!result.error.ok()) {
        return result;
    }

    // args[0] names the program; the fresh command starts from the resolved path
    Command next = command_;
    next.args.clear();
    next.args.push_back(command_.path);
    if (command_.args.size() > 1) {
        next.args.insert(next.args.end(), command_.args.begin() + 1, command_.args.end());
    }
    spdlog::debug("restarting {}", next.display());
    return start(next);
}
