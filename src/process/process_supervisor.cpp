#include "pipemcp/process/process_supervisor.hpp"
#include "pipemcp/log/logger.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

extern char** environ;

namespace pipemcp {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(10);
constexpr std::chrono::milliseconds kGraceSlice{50};

enum class ExecStage : int {
    ChangeDirectory = 1,
    Exec = 2
};

struct ExecFailure {
    int stage;
    int error;
};

std::once_flag g_sigpipe_once;

/// Writes to a dead child's stdin must fail with EPIPE instead of
/// terminating the host.
void ignore_sigpipe() {
    std::call_once(g_sigpipe_once, [] {
        struct sigaction sa{};
        sa.sa_handler = SIG_IGN;
        sigemptyset(&sa.sa_mask);
        ::sigaction(SIGPIPE, &sa, nullptr);
    });
}

bool make_pipe(std::array<int, 2>& fds) {
    if (::pipe(fds.data()) == -1) {
        return false;
    }
    for (int fd : fds) {
        ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    }
    return true;
}

void close_fd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

void close_pair(std::array<int, 2>& fds) {
    close_fd(fds[0]);
    close_fd(fds[1]);
}

// ─────────────────────────────────────────────────────────────────────────────
// Child-side helpers: async-signal-safe only, no allocation after fork()
// ─────────────────────────────────────────────────────────────────────────────

[[noreturn]] void report_and_exit(int status_fd, ExecStage stage, int error) {
    const ExecFailure failure{static_cast<int>(stage), error};
    if (::write(status_fd, &failure, sizeof(failure)) < 0) {
        // parent sees a plain exit status
    }
    ::_exit(127);
}

void redirect(int fd, int target) {
    if (fd == target) {
        ::fcntl(fd, F_SETFD, 0);
    } else {
        ::dup2(fd, target);
    }
}

std::string describe_exit(int code) {
    if (code < 0) {
        return "Terminated by signal " + std::to_string(-code);
    }
    return "Exit code " + std::to_string(code);
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(ProcessConfig config)
    : config_(std::move(config))
{}

ProcessSupervisor::~ProcessSupervisor() {
    terminate();
    stderr_monitor_.reset();
    close_pipes();
}

TransportResult<void> ProcessSupervisor::start() {
    {
        std::lock_guard lock(mutex_);
        if (started_) {
            return tl::unexpected(TransportError::protocol("Process already started"));
        }
        started_ = true;
    }

    if (config_.command.empty()) {
        return tl::unexpected(TransportError::protocol("No command given"));
    }

    ignore_sigpipe();

    // ─────────────────────────────────────────────────────────────────────────
    // Everything the child touches is allocated before fork()
    // ─────────────────────────────────────────────────────────────────────────
    std::vector<std::string> argv_storage;
    argv_storage.reserve(config_.args.size() + 1);
    argv_storage.push_back(config_.command);
    argv_storage.insert(argv_storage.end(), config_.args.begin(), config_.args.end());

    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> envp_storage;
    std::vector<char*> envp;
    if (config_.environment) {
        envp_storage = to_envp_strings(*config_.environment);
        envp.reserve(envp_storage.size() + 1);
        for (auto& entry : envp_storage) {
            envp.push_back(entry.data());
        }
        envp.push_back(nullptr);
    }

    const std::string workdir = config_.working_directory
        ? config_.working_directory->string()
        : std::string{};

    std::array<int, 2> stdin_pipe{-1, -1};
    std::array<int, 2> stdout_pipe{-1, -1};
    std::array<int, 2> stderr_pipe{-1, -1};
    std::array<int, 2> status_pipe{-1, -1};

    if (!make_pipe(stdin_pipe) || !make_pipe(stdout_pipe) ||
        !make_pipe(stderr_pipe) || !make_pipe(status_pipe)) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return tl::unexpected(TransportError::network("Failed to create pipes: " + reason));
    }

    const pid_t pid = ::fork();

    if (pid == -1) {
        const std::string reason = std::strerror(errno);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(status_pipe);
        return tl::unexpected(TransportError::network("Failed to fork: " + reason));
    }

    if (pid == 0) {
        ::setpgid(0, 0);

        struct sigaction sa{};
        sa.sa_handler = SIG_DFL;
        sigemptyset(&sa.sa_mask);
        ::sigaction(SIGPIPE, &sa, nullptr);

        if (!workdir.empty() && ::chdir(workdir.c_str()) != 0) {
            report_and_exit(status_pipe[1], ExecStage::ChangeDirectory, errno);
        }

        redirect(stdin_pipe[0], STDIN_FILENO);
        redirect(stdout_pipe[1], STDOUT_FILENO);
        redirect(stderr_pipe[1], STDERR_FILENO);

        if (!envp.empty()) {
            environ = envp.data();
        }
        ::execvp(argv[0], argv.data());
        report_and_exit(status_pipe[1], ExecStage::Exec, errno);
    }

    // Parent; the child may already have called setpgid itself
    ::setpgid(pid, pid);

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // The status pipe closes on successful exec, or carries the failure
    ExecFailure failure{};
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &failure, sizeof(failure));
    } while (n == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_pair(stdin_pipe);
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        {
            std::lock_guard lock(mutex_);
            pid_ = pid;
            reaped_ = true;
            record_status_locked(status);
        }

        std::string message;
        if (failure.stage == static_cast<int>(ExecStage::ChangeDirectory)) {
            message = "Failed to change directory to " + workdir + ": " + std::strerror(failure.error);
        } else {
            message = "Failed to start '" + config_.command + "': " + std::strerror(failure.error);
        }
        PIPEMCP_LOG_ERROR("{}", message);
        return tl::unexpected(TransportError::network(std::move(message)));
    }

    {
        std::lock_guard lock(mutex_);
        pid_ = pid;
        stdin_fd_ = stdin_pipe[1];
        stdout_fd_ = stdout_pipe[0];
    }

    stderr_monitor_ = std::make_unique<StderrMonitor>(
        stderr_pipe[0], config_.stderr_tail_lines, config_.on_stderr_line,
        config_.stderr_max_line_length);
    stderr_monitor_->start();

    PIPEMCP_LOG_INFO("Started process {} (pid {})", config_.command, pid);

    // ─────────────────────────────────────────────────────────────────────────
    // Startup grace: surface immediate-exit failures here
    // ─────────────────────────────────────────────────────────────────────────
    auto remaining = config_.startup_grace;
    while (remaining.count() > 0 && is_alive()) {
        const auto slice = std::min(remaining, kGraceSlice);
        std::this_thread::sleep_for(slice);
        remaining -= slice;
    }

    if (!is_alive()) {
        stderr_monitor_->wait_for_eof(config_.stderr_drain_timeout);
        const auto code = exit_code();
        std::string diagnostic = stderr_monitor_->recent_stderr();
        if (diagnostic.empty()) {
            diagnostic = code ? describe_exit(*code) : std::string("Process exited during startup");
        }
        PIPEMCP_LOG_ERROR("Process {} exited during startup: {}", config_.command, diagnostic);
        return tl::unexpected(TransportError::process_exited(std::move(diagnostic), code));
    }

    return {};
}

void ProcessSupervisor::terminate() {
    pid_t pid = -1;
    {
        std::lock_guard lock(mutex_);
        poll_exit_locked();
        if (pid_ > 0 && !reaped_) {
            pid = pid_;
        }
    }

    if (pid > 0) {
        if (::kill(-pid, SIGTERM) == -1) {
            ::kill(pid, SIGTERM);
        }

        const auto deadline = std::chrono::steady_clock::now() + config_.shutdown_timeout;
        bool exited = false;
        while (!exited) {
            {
                std::lock_guard lock(mutex_);
                poll_exit_locked();
                exited = reaped_;
            }
            if (exited || std::chrono::steady_clock::now() >= deadline) {
                break;
            }
            std::this_thread::sleep_for(kReapPollInterval);
        }

        if (!exited) {
            PIPEMCP_LOG_WARN("Process {} ignored SIGTERM, sending SIGKILL", pid);
            std::lock_guard lock(mutex_);
            if (!reaped_) {
                if (::kill(-pid, SIGKILL) == -1) {
                    ::kill(pid, SIGKILL);
                }
                int status = 0;
                pid_t result;
                do {
                    result = ::waitpid(pid, &status, 0);
                } while (result == -1 && errno == EINTR);
                reaped_ = true;
                if (result == pid) {
                    record_status_locked(status);
                }
            }
        }
        PIPEMCP_LOG_INFO("Stopped process {}", pid);
    }

    if (stderr_monitor_) {
        stderr_monitor_->stop();
    }
}

bool ProcessSupervisor::is_alive() const {
    std::lock_guard lock(mutex_);
    if (pid_ <= 0) {
        return false;
    }
    poll_exit_locked();
    return !reaped_;
}

std::optional<int> ProcessSupervisor::exit_code() const {
    std::lock_guard lock(mutex_);
    poll_exit_locked();
    return exit_code_;
}

pid_t ProcessSupervisor::pid() const {
    std::lock_guard lock(mutex_);
    return pid_;
}

std::string ProcessSupervisor::recent_stderr() const {
    return stderr_monitor_ ? stderr_monitor_->recent_stderr() : std::string{};
}

bool ProcessSupervisor::wait_for_stderr_eof(std::chrono::milliseconds timeout) {
    return stderr_monitor_ ? stderr_monitor_->wait_for_eof(timeout) : true;
}

void ProcessSupervisor::poll_exit_locked() const {
    if (pid_ <= 0 || reaped_) {
        return;
    }
    int status = 0;
    const pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        reaped_ = true;
        record_status_locked(status);
    } else if (result == -1 && errno == ECHILD) {
        reaped_ = true;
    }
}

void ProcessSupervisor::record_status_locked(int status) const {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -WTERMSIG(status);
    }
}

void ProcessSupervisor::close_pipes() {
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
}

}  // namespace pipemcp
