#pragma once

#include <string>

/// Result of a process operation. A default-constructed value means success.
struct ProcError {
    enum class Kind {
        None,        // success
        Launch,      // process could not be created
        Signal,      // signal delivery failed (code = errno)
        ExitStatus,  // exited with a non-zero status (code = status)
        Signaled,    // terminated by a signal (code = signal number)
        Wait         // waiting for the process failed (code = errno)
    };

    Kind kind = Kind::None;
    int code = 0;
    std::string message;

    bool ok() const { return kind == Kind::None; }

    /// True if the process was terminated by the given signal
    bool is_signal(int signo) const { return kind == Kind::Signaled && code == signo; }

    /// Classify a raw status as returned by waitpid()
    static ProcError from_wait_status(int status);

    static ProcError launch(int err, const std::string& what);
    static ProcError signal_failed(int err, int signo);
    static ProcError wait_failed(int err);

    /// Stable lower-case name, e.g. "exit_status"
    static const char* kind_name(Kind kind);
};
