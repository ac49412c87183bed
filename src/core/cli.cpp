#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/deadline.hpp"
#include "core/logging.hpp"
#include "process/process.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstring>
#include <iostream>
#include <mutex>
#include <signal.h>
#include <stdexcept>
#include <thread>

#ifndef PROCCTL_VERSION
#define PROCCTL_VERSION "unknown"
#endif

using json = nlohmann::json;

namespace {

std::atomic<bool> g_stop_requested{false};

void stop_signal_handler(int /*sig*/) {
    g_stop_requested.store(true);
}

bool parse_ms(const char* text, int& out) {
    try {
        size_t used = 0;
        int value = std::stoi(text, &used);
        if (used != std::strlen(text) || value < 0) return false;
        out = value;
        return true;
    } catch (const std::logic_error&) {
        return false;
    }
}

int exit_code_for(const ProcError& err) {
    switch (err.kind) {
        case ProcError::Kind::None:       return 0;
        case ProcError::Kind::ExitStatus: return err.code;
        case ProcError::Kind::Signaled:   return 128 + err.code;
        case ProcError::Kind::Launch:     return CLI::kExitLaunchFailed;
        case ProcError::Kind::Signal:
        case ProcError::Kind::Wait:       return 1;
    }
    return 1;
}

}  // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) {
        cmd_help();
        return kExitUsage;
    }

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "config") == 0) {
        return cmd_config();
    }
    if (std::strcmp(cmd, "run") == 0) {
        return cmd_run(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'procctl help' for usage.\n";
    return kExitUsage;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "procctl — run a child process with graceful stop and kill escalation\n"
        "\n"
        "Usage:\n"
        "  procctl run [options] [--] <program> [args...]\n"
        "      -C, --dir <dir>         Working directory\n"
        "      -e, --env KEY=VALUE     Set an environment variable (repeatable)\n"
        "      -t, --timeout <ms>      Kill the program after this long\n"
        "      -g, --grace <ms>        On SIGINT/SIGTERM, wait this long before SIGKILL\n"
        "          --json              Print a JSON report when the program ends\n"
        "      -v, --verbose           Debug logging\n"
        "  procctl config              Show configuration file and values\n"
        "  procctl version             Show version\n"
        "  procctl help                Show this help\n"
        "\n"
        "Exit status is the program's own; 128+N if it died from signal N,\n"
        "124 on timeout, 127 if it could not be started.\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "procctl " << PROCCTL_VERSION << "\n";
    return 0;
}

// ── config ──────────────────────────────────────────────────

int CLI::cmd_config() {
    Config config;
    bool loaded = config.load();
    const auto& d = config.data();

    std::cout << "Config file:     " << Config::config_path()
              << (loaded ? "" : " (not found, using defaults)") << "\n";
    std::cout << "Working dir:     " << (d.work_dir.empty() ? "(inherit)" : d.work_dir) << "\n";
    std::cout << "Inherit env:     " << (d.inherit_env ? "yes" : "no") << "\n";
    for (const auto& kv : d.env) {
        std::cout << "  env            " << kv << "\n";
    }
    std::cout << "Stop timeout:    " << d.stop_timeout_ms << " ms\n";
    std::cout << "Run timeout:     ";
    if (d.run_timeout_ms > 0) {
        std::cout << d.run_timeout_ms << " ms\n";
    } else {
        std::cout << "none\n";
    }
    std::cout << "Log level:       " << d.log_level << "\n";
    return 0;
}

// ── run ─────────────────────────────────────────────────────

bool CLI::parse_run_options(int argc, char* argv[], int first,
                            RunOptions& opts, std::string& err) {
    int i = first;
    for (; i < argc; ++i) {
        const char* arg = argv[i];
        auto needs_value = [&](const char* name) -> const char* {
            if (i + 1 >= argc) {
                err = std::string("Missing value for ") + name;
                return nullptr;
            }
            return argv[++i];
        };

        if (std::strcmp(arg, "--") == 0) {
            ++i;
            break;
        }
        if (std::strcmp(arg, "-C") == 0 || std::strcmp(arg, "--dir") == 0) {
            const char* v = needs_value(arg);
            if (!v) return false;
            opts.dir = Config::expand_home(v);
        } else if (std::strcmp(arg, "-e") == 0 || std::strcmp(arg, "--env") == 0) {
            const char* v = needs_value(arg);
            if (!v) return false;
            if (std::strchr(v, '=') == nullptr || v[0] == '=') {
                err = std::string("Expected KEY=VALUE, got: ") + v;
                return false;
            }
            opts.env.emplace_back(v);
        } else if (std::strcmp(arg, "-t") == 0 || std::strcmp(arg, "--timeout") == 0) {
            const char* v = needs_value(arg);
            if (!v) return false;
            if (!parse_ms(v, opts.timeout_ms)) {
                err = std::string("Invalid timeout: ") + v;
                return false;
            }
        } else if (std::strcmp(arg, "-g") == 0 || std::strcmp(arg, "--grace") == 0) {
            const char* v = needs_value(arg);
            if (!v) return false;
            if (!parse_ms(v, opts.grace_ms)) {
                err = std::string("Invalid grace period: ") + v;
                return false;
            }
        } else if (std::strcmp(arg, "--json") == 0) {
            opts.json = true;
        } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
        } else if (arg[0] == '-' && arg[1] != '\0') {
            err = std::string("Unknown option: ") + arg;
            return false;
        } else {
            break;
        }
    }

    for (; i < argc; ++i) {
        opts.argv.emplace_back(argv[i]);
    }
    if (opts.argv.empty()) {
        err = "No program given";
        return false;
    }
    return true;
}

int CLI::cmd_run(int argc, char* argv[]) {
    RunOptions opts;
    std::string err;
    if (!parse_run_options(argc, argv, 2, opts, err)) {
        std::cerr << err << "\n";
        std::cerr << "Usage: procctl run [options] [--] <program> [args...]\n";
        return kExitUsage;
    }

    Config config;
    config.load();
    const auto& d = config.data();
    init_logging(opts.verbose ? "debug" : d.log_level);

    Shell shell = config.make_shell();
    if (!opts.dir.empty()) shell.dir = opts.dir;
    for (const auto& kv : opts.env) {
        auto eq = kv.find('=');
        shell.set_env(kv.substr(0, eq), kv.substr(eq + 1));
    }

    std::vector<std::string> args(opts.argv.begin() + 1, opts.argv.end());
    Command cmd = shell.command(opts.argv[0], args);

    const int timeout_ms = opts.timeout_ms >= 0 ? opts.timeout_ms : d.run_timeout_ms;
    const int grace_ms = opts.grace_ms >= 0 ? opts.grace_ms : d.stop_timeout_ms;

    json report;
    report["command"] = opts.argv;

    auto started_at = std::chrono::steady_clock::now();
    auto started = Process::start(cmd);
    if (!started.process) {
        std::cerr << "procctl: " << started.error.message << "\n";
        if (opts.json) {
            report["pid"] = nullptr;
            report["success"] = false;
            report["kind"] = ProcError::kind_name(started.error.kind);
            report["code"] = started.error.code;
            report["error"] = started.error.message;
            report["timed_out"] = false;
            report["stopped"] = false;
            report["elapsed_ms"] = 0;
            std::cout << report.dump() << "\n";
        }
        return kExitLaunchFailed;
    }
    Process& proc = *started.process;

    // Forward SIGINT/SIGTERM as a graceful stop
    g_stop_requested.store(false);
    struct sigaction sa;
    struct sigaction old_int;
    struct sigaction old_term;
    sa.sa_handler = stop_signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &old_int);
    sigaction(SIGTERM, &sa, &old_term);

    std::mutex done_mutex;
    std::condition_variable done_cv;
    bool done = false;
    bool stopped = false;
    ProcError stop_result;
    std::thread watcher([&] {
        std::unique_lock<std::mutex> lock(done_mutex);
        while (!done) {
            if (g_stop_requested.load()) {
                lock.unlock();
                spdlog::info("stop requested, giving {} {} ms", cmd.display(), grace_ms);
                stopped = true;
                stop_result = proc.stop(Deadline::after(std::chrono::milliseconds(grace_ms)));
                return;
            }
            // The signal handler cannot notify, so the flag is still polled
            done_cv.wait_for(lock, std::chrono::milliseconds(50));
        }
    });

    Deadline deadline = timeout_ms > 0
        ? Deadline::after(std::chrono::milliseconds(timeout_ms))
        : Deadline::none();
    ProcError result = proc.wait(deadline);
    // A deadline kill reports success; an exit status or foreign signal is
    // the child's own result even when it lands next to the deadline
    const bool own_exit = result.kind == ProcError::Kind::ExitStatus ||
                          result.kind == ProcError::Kind::Signaled;
    const bool deadline_hit = timeout_ms > 0 && !own_exit && deadline.expired();
    {
        std::lock_guard<std::mutex> lock(done_mutex);
        done = true;
    }
    done_cv.notify_one();
    watcher.join();

    sigaction(SIGINT, &old_int, nullptr);
    sigaction(SIGTERM, &old_term, nullptr);

    const bool timed_out = !stopped && deadline_hit;
    if (stopped) result = stop_result;

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);

    if (timed_out) {
        spdlog::warn("{} timed out after {} ms", cmd.display(), timeout_ms);
    } else if (!result.ok()) {
        spdlog::debug("{} finished: {}", cmd.display(), result.message);
    }

    if (opts.json) {
        report["pid"] = proc.pid();
        report["success"] = result.ok() && !timed_out;
        report["kind"] = ProcError::kind_name(result.kind);
        report["code"] = result.code;
        report["error"] = result.ok() ? json(nullptr) : json(result.message);
        report["timed_out"] = timed_out;
        report["stopped"] = stopped;
        report["elapsed_ms"] = elapsed.count();
        std::cout << report.dump() << "\n";
    }

    if (timed_out) return kExitTimeout;
    return exit_code_for(result);
}
