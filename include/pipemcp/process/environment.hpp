#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Child Process Environment
// ═══════════════════════════════════════════════════════════════════════════
// The child inherits the full host environment. Hosts started from a desktop
// session often carry a minimal PATH, so a fixed set of common binary
// directories is prepended when missing, and HOME is always set.

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace pipemcp {

using Environment = std::map<std::string, std::string>;

/// Directories prepended to the child's PATH when not already present
inline const std::vector<std::string> kDefaultPathAdditions = {
    "/opt/homebrew/bin", "/usr/local/bin", "/usr/bin", "/bin"
};

/// Snapshot of `environ`
[[nodiscard]] Environment capture_host_environment();

/// $HOME, falling back to the password database entry of the current user.
/// Empty only when both are unavailable.
[[nodiscard]] std::string home_directory();

/// Split a PATH-style list on ':' dropping empty entries
[[nodiscard]] std::vector<std::string> split_path_list(std::string_view path_list);

/// Prepend every addition not already an entry of `current` (exact entry
/// comparison), keeping the order of `additions`.
[[nodiscard]] std::string augment_path(
    std::string_view current,
    const std::vector<std::string>& additions
);

/// Host environment + augmented PATH + HOME
[[nodiscard]] Environment build_child_environment(
    Environment base,
    const std::vector<std::string>& path_additions,
    const std::string& home
);

/// "KEY=VALUE" strings for execve
[[nodiscard]] std::vector<std::string> to_envp_strings(const Environment& env);

/// Whitespace-delimited split; runs of whitespace never produce empty tokens
[[nodiscard]] std::vector<std::string> split_arguments(std::string_view args);

/// True if `flag` appears as a whole token ("--flag") or as "--flag=value"
[[nodiscard]] bool has_flag(const std::vector<std::string>& args, std::string_view flag);

}  // namespace pipemcp
