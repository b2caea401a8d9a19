#pragma once

#include <string>
#include <vector>

namespace pipemcp {

// ═══════════════════════════════════════════════════════════════════════════
// Command Resolution
// ═══════════════════════════════════════════════════════════════════════════
// Turns a bare executable name into an absolute path. Resolution never fails:
// when nothing matches, the original token is returned and the spawn reports
// the OS error instead.

class CommandResolver {
public:
    CommandResolver(std::string path_env, std::vector<std::string> fallback_dirs);

    /// Reads PATH from the environment and uses default_fallback_directories()
    [[nodiscard]] static CommandResolver from_environment();

    /// /opt/homebrew/bin, /usr/local/bin, /usr/bin, /bin, then
    /// $HOME/.local/bin and $HOME/bin when `home` is non-empty
    [[nodiscard]] static std::vector<std::string> default_fallback_directories(const std::string& home);

    [[nodiscard]] std::string resolve(const std::string& command) const;

    [[nodiscard]] const std::vector<std::string>& search_directories() const noexcept {
        return search_dirs_;
    }

private:
    std::vector<std::string> search_dirs_;
};

/// Regular file with execute permission for the current user
[[nodiscard]] bool is_executable_file(const std::string& path);

/// CommandResolver::from_environment().resolve(command)
[[nodiscard]] std::string resolve_command(const std::string& command);

}  // namespace pipemcp
