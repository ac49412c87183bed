#pragma once

#include <optional>
#include <string>
#include <vector>

/// Everything needed to launch one process. File descriptors are borrowed:
/// the caller keeps them open while any process started from this command
/// (including restarts) may still use them.
struct Command {
    std::string path;               // executable; searched in $PATH if it has no '/'
    std::vector<std::string> args;  // args[0] is the program name
    std::string dir;                // working directory, empty = inherit
    std::optional<std::vector<std::string>> env;  // KEY=VALUE entries, nullopt = inherit

    // Standard streams, -1 = the null device
    int stdin_fd = -1;
    int stdout_fd = -1;
    int stderr_fd = -1;

    /// Passed through to the child as descriptors 3, 4, ...
    std::vector<int> extra_fds;

    /// Space-joined argument vector for logs and reports
    std::string display() const;
};

/// Builds commands from a set of process-wide defaults.
class Shell {
public:
    /// Defaults: the given working directory, the current environment and
    /// the current process's own stdin/stdout/stderr.
    explicit Shell(const std::string& dir = "");

    /// Create a command for `name` populated with the current defaults
    Command command(const std::string& name, const std::vector<std::string>& args = {}) const;

    /// Set or replace KEY in the default environment
    void set_env(const std::string& key, const std::string& value);

    std::string dir;
    std::vector<std::string> env;
    int stdin_fd;
    int stdout_fd;
    int stderr_fd;

    /// Snapshot of the current process environment
    static std::vector<std::string> environment();
};
