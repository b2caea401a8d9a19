#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Profile Authentication Discovery
// ═══════════════════════════════════════════════════════════════════════════
// Best-effort lookup of a default auth pair from a local CLI profile file.
// Every failure collapses to "no auto-injected auth".

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipemcp {

struct AuthProfile {
    std::string auth_type;
    std::string auth_id;
};

struct ProfileAuthConfig {
    bool enabled = true;

    /// Defaults to $HOME/.akeyless/profiles/default.toml
    std::optional<std::filesystem::path> profile_path;

    std::string type_key = "access_type";
    std::string id_key = "access_id";
    std::string type_flag = "--access-type";
    std::string id_flag = "--access-id";
};

[[nodiscard]] std::filesystem::path default_profile_path(const std::string& home);

/// Parses `key = value` profile text. Both keys must be present and non-empty.
[[nodiscard]] std::optional<AuthProfile> parse_profile_auth(
    std::string_view content,
    const ProfileAuthConfig& config
);

class ProfileAuthReader {
public:
    explicit ProfileAuthReader(ProfileAuthConfig config = {});

    [[nodiscard]] std::filesystem::path profile_path() const;

    /// Never throws; missing or unreadable files yield nullopt
    [[nodiscard]] std::optional<AuthProfile> read() const;

    [[nodiscard]] const ProfileAuthConfig& config() const noexcept { return config_; }

private:
    ProfileAuthConfig config_;
};

/// True if either auth flag already appears in `args`
[[nodiscard]] bool has_auth_flags(const std::vector<std::string>& args, const ProfileAuthConfig& config);

/// Appends the two auth flags when neither is present and a profile exists.
/// Returns true if flags were appended.
bool inject_profile_auth(
    std::vector<std::string>& args,
    const ProfileAuthConfig& config,
    const std::optional<AuthProfile>& profile
);

}  // namespace pipemcp
