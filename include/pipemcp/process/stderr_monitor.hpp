#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace pipemcp {

// ═══════════════════════════════════════════════════════════════════════════
// StderrMonitor
// ═══════════════════════════════════════════════════════════════════════════
// Drains a child's stderr on a dedicated thread. Every line is logged; lines
// that mention browser/login/auth are flagged as a hint that the server is
// waiting for interactive authentication. The last N lines are kept for
// connection diagnostics.
//
// Read errors end the loop quietly. The monitor never influences the
// protocol exchange.

class StderrMonitor {
public:
    using LineCallback = std::function<void(const std::string& line, bool auth_hint)>;

    /// Longest stderr line kept; the remainder up to the newline is dropped
    static constexpr std::size_t kDefaultMaxLineLength = 64 * 1024;

    /// Takes ownership of `fd` and closes it on destruction
    StderrMonitor(int fd, std::size_t tail_lines, LineCallback on_line = {},
                  std::size_t max_line_length = kDefaultMaxLineLength);
    ~StderrMonitor();

    StderrMonitor(const StderrMonitor&) = delete;
    StderrMonitor& operator=(const StderrMonitor&) = delete;
    StderrMonitor(StderrMonitor&&) = delete;
    StderrMonitor& operator=(StderrMonitor&&) = delete;

    void start();

    /// Ask the reader thread to exit and join it. Idempotent and safe to
    /// call from several threads at once.
    void stop();

    /// Block until the stream reached end-of-file or `timeout` elapsed
    bool wait_for_eof(std::chrono::milliseconds timeout);

    [[nodiscard]] bool at_eof() const;

    [[nodiscard]] std::vector<std::string> recent_lines() const;

    /// Recent lines joined with '\n'
    [[nodiscard]] std::string recent_stderr() const;

    /// Case-insensitive match against browser, authentication, login, auth
    [[nodiscard]] static bool is_auth_hint(std::string_view line);

private:
    void run();
    void handle_line(std::string line);
    void mark_eof();

    int fd_;
    std::size_t tail_lines_;
    std::size_t max_line_length_;
    LineCallback on_line_;

    std::mutex thread_mutex_;
    std::thread thread_;
    std::atomic<bool> stop_requested_{false};

    mutable std::mutex mutex_;
    std::condition_variable eof_cv_;
    bool eof_ = false;
    std::deque<std::string> tail_;
};

}  // namespace pipemcp
