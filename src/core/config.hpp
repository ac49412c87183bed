#pragma once

#include "core/command.hpp"

#include <string>
#include <vector>

struct AppConfig {
    // Command defaults
    std::string work_dir;             // empty = inherit procctl's cwd
    bool inherit_env = true;
    std::vector<std::string> env;     // KEY=VALUE, applied on top

    // Termination
    int stop_timeout_ms = 5000;       // grace before stop escalates to kill
    int run_timeout_ms = 0;           // 0 = wait forever

    // Logging
    std::string log_level = "warn";
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    /// Command builder populated from the defaults section
    Shell make_shell() const;

    static bool is_privileged();
    static std::string config_dir();
    static std::string config_path();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
