#include "core/config.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

bool Config::is_privileged() {
    return geteuid() == 0;
}

std::string Config::config_dir() {
    if (is_privileged()) {
        return "/etc/procctl";
    }
    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/procctl";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        // Defaults section
        if (auto defaults = root["defaults"]) {
            config_.work_dir = expand_home(defaults["dir"].as<std::string>(config_.work_dir));
            config_.inherit_env = defaults["inherit_env"].as<bool>(config_.inherit_env);
            if (auto env = defaults["env"]) {
                config_.env.clear();
                for (const auto& entry : env) {
                    auto kv = entry.as<std::string>("");
                    if (kv.find('=') != std::string::npos) {
                        config_.env.push_back(kv);
                    }
                }
            }
        }

        // Termination section
        if (auto term = root["termination"]) {
            config_.stop_timeout_ms = term["stop_timeout_ms"].as<int>(config_.stop_timeout_ms);
            config_.run_timeout_ms = term["run_timeout_ms"].as<int>(config_.run_timeout_ms);
        }

        // Logging section
        if (auto logging = root["logging"]) {
            config_.log_level = logging["level"].as<std::string>(config_.log_level);
        }

        return true;
    } catch (const YAML::Exception& e) {
        // Parse failed, keep defaults
        spdlog::warn("ignoring malformed config {}: {}", path, e.what());
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    try {
        fs::create_directories(dir);

        YAML::Emitter out;
        out << YAML::BeginMap;

        // Defaults section
        out << YAML::Key << "defaults" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "dir" << YAML::Value << config_.work_dir;
        out << YAML::Key << "inherit_env" << YAML::Value << config_.inherit_env;
        out << YAML::Key << "env" << YAML::Value << YAML::BeginSeq;
        for (const auto& kv : config_.env) {
            out << kv;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        // Termination section
        out << YAML::Key << "termination" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "stop_timeout_ms" << YAML::Value << config_.stop_timeout_ms;
        out << YAML::Key << "run_timeout_ms" << YAML::Value << config_.run_timeout_ms;
        out << YAML::EndMap;

        // Logging section
        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "level" << YAML::Value << config_.log_level;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return true;
    } catch (const fs::filesystem_error& e) {
        spdlog::warn("cannot write config {}: {}", path, e.what());
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }

Shell Config::make_shell() const {
    Shell shell(config_.work_dir);
    if (!config_.inherit_env) {
        shell.env.clear();
    }
    for (const auto& kv : config_.env) {
        auto eq = kv.find('=');
        shell.set_env(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return shell;
}
