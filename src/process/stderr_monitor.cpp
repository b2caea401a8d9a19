#include "pipemcp/process/stderr_monitor.hpp"
#include "pipemcp/log/logger.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>

namespace pipemcp {

namespace {

constexpr int kPollIntervalMs = 50;
constexpr std::size_t kReadChunk = 4096;

const std::array<std::string_view, 4> kAuthKeywords = {
    "browser", "authentication", "login", "auth"
};

}  // namespace

StderrMonitor::StderrMonitor(int fd, std::size_t tail_lines, LineCallback on_line,
                             std::size_t max_line_length)
    : fd_(fd)
    , tail_lines_(tail_lines)
    , max_line_length_(std::max<std::size_t>(max_line_length, 1))
    , on_line_(std::move(on_line))
{}

StderrMonitor::~StderrMonitor() {
    stop();
    if (fd_ != -1) {
        ::close(fd_);
    }
}

void StderrMonitor::start() {
    std::lock_guard lock(thread_mutex_);
    if (thread_.joinable() || fd_ == -1 || stop_requested_.load()) {
        return;
    }
    thread_ = std::thread([this] { run(); });
}

void StderrMonitor::stop() {
    stop_requested_.store(true);
    // terminate() may reach here from disconnect() and the connecting thread
    std::lock_guard lock(thread_mutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool StderrMonitor::wait_for_eof(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return eof_cv_.wait_for(lock, timeout, [this] { return eof_; });
}

bool StderrMonitor::at_eof() const {
    std::lock_guard lock(mutex_);
    return eof_;
}

std::vector<std::string> StderrMonitor::recent_lines() const {
    std::lock_guard lock(mutex_);
    return {tail_.begin(), tail_.end()};
}

std::string StderrMonitor::recent_stderr() const {
    std::lock_guard lock(mutex_);
    std::string joined;
    for (const auto& line : tail_) {
        if (!joined.empty()) {
            joined += '\n';
        }
        joined += line;
    }
    return joined;
}

bool StderrMonitor::is_auth_hint(std::string_view line) {
    std::string lower(line);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return std::any_of(kAuthKeywords.begin(), kAuthKeywords.end(),
                       [&lower](std::string_view kw) { return lower.find(kw) != std::string::npos; });
}

void StderrMonitor::run() {
    std::string pending;
    bool overflowing = false;  // dropping the rest of a truncated line
    std::array<char, kReadChunk> buffer{};

    while (!stop_requested_.load()) {
        struct pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        const int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            PIPEMCP_LOG_DEBUG("stderr poll failed: {}", std::strerror(errno));
            break;
        }

        const ssize_t n = ::read(fd_, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            PIPEMCP_LOG_DEBUG("stderr read failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }

        std::string_view chunk(buffer.data(), static_cast<std::size_t>(n));
        if (overflowing) {
            const auto newline = chunk.find('\n');
            if (newline == std::string_view::npos) {
                continue;
            }
            chunk.remove_prefix(newline + 1);
            overflowing = false;
        }

        pending.append(chunk);
        std::size_t newline;
        while ((newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, std::min(newline, max_line_length_));
            pending.erase(0, newline + 1);
            handle_line(std::move(line));
        }

        if (pending.size() > max_line_length_) {
            pending.resize(max_line_length_);
            PIPEMCP_LOG_DEBUG("stderr line longer than {} bytes truncated", max_line_length_);
            handle_line(std::move(pending));
            pending.clear();
            overflowing = true;
        }
    }

    if (!pending.empty()) {
        handle_line(std::move(pending));
    }
    mark_eof();
}

void StderrMonitor::handle_line(std::string line) {
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.empty()) {
        return;
    }

    const bool auth_hint = is_auth_hint(line);
    PIPEMCP_LOG_INFO("MCP stderr: {}", line);
    if (auth_hint) {
        PIPEMCP_LOG_WARN("MCP server may be waiting for authentication: {}", line);
    }

    {
        std::lock_guard lock(mutex_);
        if (tail_lines_ > 0) {
            tail_.push_back(line);
            while (tail_.size() > tail_lines_) {
                tail_.pop_front();
            }
        }
    }

    if (on_line_) {
        on_line_(line, auth_hint);
    }
}

void StderrMonitor::mark_eof() {
    {
        std::lock_guard lock(mutex_);
        eof_ = true;
    }
    eof_cv_.notify_all();
}

}  // namespace pipemcp
