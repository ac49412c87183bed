#pragma once

#include <string>
#include <vector>

class CLI {
public:
    /// Parse argv and dispatch to subcommand. Returns the process exit code.
    static int run(int argc, char* argv[]);

    struct RunOptions {
        std::string dir;
        std::vector<std::string> env;    // KEY=VALUE
        int timeout_ms = -1;             // -1 = from config
        int grace_ms = -1;               // -1 = from config
        bool json = false;
        bool verbose = false;
        std::vector<std::string> argv;   // program and its arguments
    };

    /// Parse `run` options from argv[first..]. Returns false with `err` set
    /// on a usage error.
    static bool parse_run_options(int argc, char* argv[], int first,
                                  RunOptions& opts, std::string& err);

    // Exit codes besides the child's own status
    static constexpr int kExitUsage = 1;
    static constexpr int kExitTimeout = 124;
    static constexpr int kExitLaunchFailed = 127;

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_config();
    static int cmd_run(int argc, char* argv[]);
};
