#pragma once

#include "core/command.hpp"
#include "core/deadline.hpp"
#include "core/proc_error.hpp"
#include "process/once_result.hpp"

#include <memory>
#include <sys/types.h>

/// Lifecycle controller for one launched child process.
///
/// A background reaper thread waits for the child and stores its result in
/// a one-shot exit slot; wait(), stop() and kill() only observe that slot.
/// stop() and kill() share one guard, so the termination sequence runs once
/// and every caller receives the same outcome.
class Process {
public:
    struct StartResult {
        std::unique_ptr<Process> process;  // null on failure
        ProcError error;
    };

    /// Launch the command. On failure no process and no reaper exist.
    static StartResult start(const Command& cmd);

    /// start() followed by wait()
    static ProcError run(const Command& cmd, const Deadline& deadline = Deadline());

    /// Only start() can name the key, so only start() constructs
    class Key {
        friend class Process;
        Key() {}
    };
    struct Handle;

    Process(Key, Command cmd, std::shared_ptr<Handle> handle);

    /// Stops the child (bounded grace, then kill) if it is still running
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// Wait for the child to exit. If the deadline expires first the child
    /// is killed and the result of kill() is returned.
    ProcError wait(const Deadline& deadline = Deadline());

    /// Interrupt the child, escalating to kill() if the deadline expires.
    /// Termination by the signal that was sent counts as success.
    ProcError stop(const Deadline& deadline = Deadline());

    /// Kill the child and wait for it to exit
    ProcError kill();

    /// Stop this process, then start a fresh one from the same command
    StartResult restart(const Deadline& deadline = Deadline());

    pid_t pid() const;

    /// The command this process was started from, with the executable resolved
    const Command& command() const { return command_; }

    /// True once the reaper has stored the exit result
    bool exited() const;

    /// Number of reaper threads currently alive in this process
    static int active_reapers();

private:
    /// Reaper thread body: the only place the child is waited for
    static void reap(const std::shared_ptr<Handle>& handle);

    enum class SendResult { Sent, Gone, Failed };
    SendResult send_signal(int signo, int& err);

    ProcError do_stop(const Deadline& deadline);
    ProcError do_kill();

    Command command_;
    std::shared_ptr<Handle> handle_;
    OnceResult terminate_once_;
};
