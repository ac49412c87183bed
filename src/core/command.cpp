#include "core/command.hpp"

#include <unistd.h>

extern char** environ;

std::string Command::display() const {
    const auto& words = args.empty() ? std::vector<std::string>{path} : args;
    std::string out;
    for (const auto& word : words) {
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

Shell::Shell(const std::string& dir)
    : dir(dir),
      env(environment()),
      stdin_fd(STDIN_FILENO),
      stdout_fd(STDOUT_FILENO),
      stderr_fd(STDERR_FILENO) {}

Command Shell::command(const std::string& name, const std::vector<std::string>& args) const {
    Command cmd;
    cmd.path = name;
    cmd.args.reserve(args.size() + 1);
    cmd.args.push_back(name);
    cmd.args.insert(cmd.args.end(), args.begin(), args.end());
    cmd.dir = dir;
    cmd.env = env;
    cmd.stdin_fd = stdin_fd;
    cmd.stdout_fd = stdout_fd;
    cmd.stderr_fd = stderr_fd;
    return cmd;
}

void Shell::set_env(const std::string& key, const std::string& value) {
    std::string prefix = key + "=";
    for (auto& entry : env) {
        if (entry.compare(0, prefix.size(), prefix) == 0) {
            entry = prefix + value;
            return;
        }
    }
    env.push_back(prefix + value);
}

std::vector<std::string> Shell::environment() {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        out.emplace_back(*e);
    }
    return out;
}
