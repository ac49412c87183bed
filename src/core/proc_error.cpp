#include "core/proc_error.hpp"

#include <cctype>
#include <cstring>
#include <sys/wait.h>

namespace {

// "Killed" -> "killed", matching the usual "signal: killed" wording
std::string signal_description(int signo) {
    const char* desc = strsignal(signo);
    std::string text = desc ? desc : ("signal " + std::to_string(signo));
    if (!text.empty()) {
        text[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(text[0])));
    }
    return text;
}

}  // namespace

ProcError ProcError::from_wait_status(int status) {
    ProcError err;
    if (WIFEXITED(status)) {
        int code = WEXITSTATUS(status);
        if (code == 0) return err;
        err.kind = Kind::ExitStatus;
        err.code = code;
        err.message = "exit status " + std::to_string(code);
        return err;
    }

    if (WIFSIGNALED(status)) {
        err.kind = Kind::Signaled;
        err.code = WTERMSIG(status);
        err.message = "signal: " + signal_description(err.code);
        if (WCOREDUMP(status)) {
            err.message += " (core dumped)";
        }
        return err;
    }

    err.kind = Kind::Wait;
    err.code = status;
    err.message = "unexpected wait status " + std::to_string(status);
    return err;
}

ProcError ProcError::launch(int err, const std::string& what) {
    ProcError e;
    e.kind = Kind::Launch;
    e.code = err;
    e.message = what;
    if (err != 0) {
        e.message += ": ";
        e.message += std::strerror(err);
    }
    return e;
}

ProcError ProcError::signal_failed(int err, int signo) {
    ProcError e;
    e.kind = Kind::Signal;
    e.code = err;
    e.message = "sending " + signal_description(signo) + " failed: " + std::strerror(err);
    return e;
}

ProcError ProcError::wait_failed(int err) {
    ProcError e;
    e.kind = Kind::Wait;
    e.code = err;
    e.message = std::string("wait: ") + std::strerror(err);
    return e;
}

const char* ProcError::kind_name(Kind kind) {
    switch (kind) {
        case Kind::None:       return "none";
        case Kind::Launch:     return "launch";
        case Kind::Signal:     return "signal";
        case Kind::ExitStatus: return "exit_status";
        case Kind::Signaled:   return "signaled";
        case Kind::Wait:       return "wait";
    }
    return "unknown";
}
