#pragma once

#include "pipemcp/process/environment.hpp"
#include "pipemcp/process/stderr_monitor.hpp"
#include "pipemcp/transport.hpp"

#include <sys/types.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pipemcp {

// ═══════════════════════════════════════════════════════════════════════════
// Process Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct ProcessConfig {
    /// Executable path, or a bare name searched on the child's PATH
    std::string command;

    /// Arguments (not including the command itself)
    std::vector<std::string> args;

    std::optional<std::filesystem::path> working_directory;

    /// Full child environment; nullopt inherits the host environment as-is
    std::optional<Environment> environment;

    /// Time given to the child to fail fast before start() reports success
    std::chrono::milliseconds startup_grace{500};

    /// Time between SIGTERM and SIGKILL in terminate()
    std::chrono::milliseconds shutdown_timeout{2000};

    /// How long start() waits for stderr to drain after an immediate exit
    std::chrono::milliseconds stderr_drain_timeout{500};

    std::size_t stderr_tail_lines = 20;

    /// Longer stderr lines are cut at this size
    std::size_t stderr_max_line_length = StderrMonitor::kDefaultMaxLineLength;

    StderrMonitor::LineCallback on_stderr_line;
};

// ═══════════════════════════════════════════════════════════════════════════
// ProcessSupervisor
// ═══════════════════════════════════════════════════════════════════════════
// Owns one child process with stdin, stdout and stderr on separate pipes.
// The child runs in its own process group so terminate() also reaches any
// helpers it spawned.
//
// Descriptors stay open until destruction, so a reader blocked on stdout
// observes a dead process rather than a recycled descriptor.

class ProcessSupervisor {
public:
    explicit ProcessSupervisor(ProcessConfig config);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;
    ProcessSupervisor(ProcessSupervisor&&) = delete;
    ProcessSupervisor& operator=(ProcessSupervisor&&) = delete;

    /// Spawn the child and wait out the startup grace period.
    /// Single use: a second call fails with a Protocol error.
    [[nodiscard]] TransportResult<void> start();

    /// SIGTERM the process group, SIGKILL after shutdown_timeout, reap.
    /// Idempotent.
    void terminate();

    [[nodiscard]] bool is_alive() const;

    /// Exit status once reaped; negative values are terminating signals
    [[nodiscard]] std::optional<int> exit_code() const;

    [[nodiscard]] pid_t pid() const;
    [[nodiscard]] int stdin_fd() const noexcept { return stdin_fd_; }
    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }

    /// Last stderr lines joined with '\n'
    [[nodiscard]] std::string recent_stderr() const;

    /// Wait for the stderr stream to finish after the child died
    bool wait_for_stderr_eof(std::chrono::milliseconds timeout);

    [[nodiscard]] const ProcessConfig& config() const noexcept { return config_; }

private:
    /// Non-blocking reap; must be called with mutex_ held
    void poll_exit_locked() const;
    void record_status_locked(int status) const;
    void close_pipes();

    ProcessConfig config_;

    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    bool started_ = false;
    mutable bool reaped_ = false;
    mutable std::optional<int> exit_code_;

    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    std::unique_ptr<StderrMonitor> stderr_monitor_;
};

}  // namespace pipemcp
