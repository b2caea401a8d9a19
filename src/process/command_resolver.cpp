#include "pipemcp/process/command_resolver.hpp"
#include "pipemcp/process/environment.hpp"
#include "pipemcp/log/logger.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>

namespace pipemcp {

CommandResolver::CommandResolver(std::string path_env, std::vector<std::string> fallback_dirs) {
    search_dirs_ = split_path_list(path_env);
    search_dirs_.reserve(search_dirs_.size() + fallback_dirs.size());
    for (auto& dir : fallback_dirs) {
        if (!dir.empty()) {
            search_dirs_.push_back(std::move(dir));
        }
    }
}

CommandResolver CommandResolver::from_environment() {
    const char* path = std::getenv("PATH");
    return CommandResolver(
        path != nullptr ? std::string(path) : std::string{},
        default_fallback_directories(home_directory())
    );
}

std::vector<std::string> CommandResolver::default_fallback_directories(const std::string& home) {
    std::vector<std::string> dirs = kDefaultPathAdditions;
    if (!home.empty()) {
        dirs.push_back(home + "/.local/bin");
        dirs.push_back(home + "/bin");
    }
    return dirs;
}

std::string CommandResolver::resolve(const std::string& command) const {
    if (command.empty() || command.front() == '/') {
        return command;
    }

    for (const auto& dir : search_dirs_) {
        std::string candidate = dir;
        if (candidate.back() != '/') {
            candidate += '/';
        }
        candidate += command;
        if (is_executable_file(candidate)) {
            PIPEMCP_LOG_DEBUG("Resolved '{}' to {}", command, candidate);
            return candidate;
        }
    }

    PIPEMCP_LOG_DEBUG("Could not resolve '{}', leaving it to exec", command);
    return command;
}

bool is_executable_file(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::string resolve_command(const std::string& command) {
    return CommandResolver::from_environment().resolve(command);
}

}  // namespace pipemcp
