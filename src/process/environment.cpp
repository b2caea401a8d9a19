#include "pipemcp/process/environment.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include <pwd.h>
#include <unistd.h>

extern char** environ;

namespace pipemcp {

Environment capture_host_environment() {
    Environment env;
    if (environ == nullptr) {
        return env;
    }
    for (char** entry = environ; *entry != nullptr; ++entry) {
        std::string_view kv(*entry);
        const auto eq = kv.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            continue;
        }
        env.emplace(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
    }
    return env;
}

std::string home_directory() {
    const char* home = std::getenv("HOME");
    if (home != nullptr && home[0] != '\0') {
        return home;
    }

    long buffer_size = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (buffer_size <= 0) {
        buffer_size = 16384;
    }
    std::vector<char> buffer(static_cast<std::size_t>(buffer_size));
    struct passwd pwd{};
    struct passwd* result = nullptr;
    if (getpwuid_r(getuid(), &pwd, buffer.data(), buffer.size(), &result) == 0 &&
        result != nullptr && result->pw_dir != nullptr) {
        return result->pw_dir;
    }
    return {};
}

std::vector<std::string> split_path_list(std::string_view path_list) {
    std::vector<std::string> entries;
    std::size_t start = 0;
    while (start <= path_list.size()) {
        const auto colon = path_list.find(':', start);
        const auto end = (colon == std::string_view::npos) ? path_list.size() : colon;
        if (end > start) {
            entries.emplace_back(path_list.substr(start, end - start));
        }
        if (colon == std::string_view::npos) {
            break;
        }
        start = colon + 1;
    }
    return entries;
}

std::string augment_path(std::string_view current, const std::vector<std::string>& additions) {
    const auto existing = split_path_list(current);

    std::string prefix;
    for (const auto& dir : additions) {
        const bool present = std::find(existing.begin(), existing.end(), dir) != existing.end();
        const bool already_added =
            (":" + prefix + ":").find(":" + dir + ":") != std::string::npos;
        if (present || already_added || dir.empty()) {
            continue;
        }
        if (!prefix.empty()) {
            prefix += ':';
        }
        prefix += dir;
    }

    if (prefix.empty()) {
        return std::string(current);
    }
    if (current.empty()) {
        return prefix;
    }
    return prefix + ":" + std::string(current);
}

Environment build_child_environment(
    Environment base,
    const std::vector<std::string>& path_additions,
    const std::string& home
) {
    const auto path_it = base.find("PATH");
    const std::string current_path = (path_it != base.end()) ? path_it->second : std::string{};
    base["PATH"] = augment_path(current_path, path_additions);
    if (!home.empty()) {
        base["HOME"] = home;
    }
    return base;
}

std::vector<std::string> to_envp_strings(const Environment& env) {
    std::vector<std::string> entries;
    entries.reserve(env.size());
    for (const auto& [key, value] : env) {
        entries.push_back(key + "=" + value);
    }
    return entries;
}

std::vector<std::string> split_arguments(std::string_view args) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : args) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

bool has_flag(const std::vector<std::string>& args, std::string_view flag) {
    return std::any_of(args.begin(), args.end(), [flag](const std::string& arg) {
        if (arg == flag) {
            return true;
        }
        return arg.size() > flag.size() &&
               arg.compare(0, flag.size(), flag) == 0 &&
               arg[flag.size()] == '=';
    });
}

}  // namespace pipemcp
