#include "pipemcp/process/profile_auth.hpp"
#include "pipemcp/process/environment.hpp"
#include "pipemcp/log/logger.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace pipemcp {

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view kSpace = " \t\r\n";
    const auto begin = s.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(kSpace);
    return s.substr(begin, end - begin + 1);
}

bool is_quote(char c) {
    return c == '"' || c == '\'';
}

std::string clean_value(std::string_view raw) {
    auto value = trim(raw);
    if (!value.empty() && !is_quote(value.front())) {
        // unquoted: drop a trailing comment
        const auto hash = value.find('#');
        if (hash != std::string_view::npos) {
            value = trim(value.substr(0, hash));
        }
    }

    std::string cleaned;
    cleaned.reserve(value.size());
    for (char c : value) {
        if (!is_quote(c)) {
            cleaned += c;
        }
    }
    return std::string(trim(cleaned));
}

}  // namespace

std::filesystem::path default_profile_path(const std::string& home) {
    return std::filesystem::path(home) / ".akeyless" / "profiles" / "default.toml";
}

std::optional<AuthProfile> parse_profile_auth(std::string_view content, const ProfileAuthConfig& config) {
    std::optional<std::string> auth_type;
    std::optional<std::string> auth_id;

    std::istringstream lines{std::string(content)};
    std::string raw;
    while (std::getline(lines, raw)) {
        const auto line = trim(raw);
        if (line.empty() || line.front() == '#' || line.front() == '[') {
            continue;
        }

        const auto eq = line.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        const auto key = trim(line.substr(0, eq));
        if (key == config.type_key) {
            auth_type = clean_value(line.substr(eq + 1));
        } else if (key == config.id_key) {
            auth_id = clean_value(line.substr(eq + 1));
        }
    }

    if (!auth_type || !auth_id || auth_type->empty() || auth_id->empty()) {
        return std::nullopt;
    }
    return AuthProfile{std::move(*auth_type), std::move(*auth_id)};
}

ProfileAuthReader::ProfileAuthReader(ProfileAuthConfig config)
    : config_(std::move(config))
{}

std::filesystem::path ProfileAuthReader::profile_path() const {
    if (config_.profile_path) {
        return *config_.profile_path;
    }
    return default_profile_path(home_directory());
}

std::optional<AuthProfile> ProfileAuthReader::read() const {
    const auto path = profile_path();

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            PIPEMCP_LOG_WARN("Could not check profile {}: {}", path.string(), ec.message());
        } else {
            PIPEMCP_LOG_DEBUG("No profile at {}", path.string());
        }
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in) {
        PIPEMCP_LOG_WARN("Could not open profile {}", path.string());
        return std::nullopt;
    }

    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        PIPEMCP_LOG_WARN("Failed reading profile {}", path.string());
        return std::nullopt;
    }

    auto profile = parse_profile_auth(content.str(), config_);
    if (profile) {
        PIPEMCP_LOG_DEBUG("Found profile auth type '{}' in {}", profile->auth_type, path.string());
    } else {
        PIPEMCP_LOG_DEBUG("Profile {} has no complete auth pair", path.string());
    }
    return profile;
}

bool has_auth_flags(const std::vector<std::string>& args, const ProfileAuthConfig& config) {
    return has_flag(args, config.type_flag) || has_flag(args, config.id_flag);
}

bool inject_profile_auth(
    std::vector<std::string>& args,
    const ProfileAuthConfig& config,
    const std::optional<AuthProfile>& profile
) {
    if (!profile || has_auth_flags(args, config)) {
        return false;
    }
    args.push_back(config.type_flag);
    args.push_back(profile->auth_type);
    args.push_back(config.id_flag);
    args.push_back(profile->auth_id);
    PIPEMCP_LOG_INFO("Using profile auth ({})", profile->auth_type);
    return true;
}

}  // namespace pipemcp
