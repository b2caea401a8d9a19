#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <iterator>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace pipemcp {

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace,  // every line read or written on the pipes
    Debug,  // skipped lines, state changes
    Info,   // spawn, handshake, disconnect, child stderr
    Warn,   // auth hints, recoverable trouble
    Error,
    Fatal,
    Off
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    constexpr std::string_view names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};
    const auto index = static_cast<std::size_t>(level);
    return index < std::size(names) ? names[index] : std::string_view{"UNKNOWN"};
}

/// True when `level` passes a `threshold`. Off as a threshold passes nothing.
[[nodiscard]] constexpr bool level_passes(LogLevel level, LogLevel threshold) noexcept {
    return threshold != LogLevel::Off && level != LogLevel::Off && level >= threshold;
}

/// Case-insensitive; "warning" is accepted for Warn.
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Records and sinks
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    std::source_location location = std::source_location::current();
};

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(LogLevel level, std::string_view message,
               std::source_location where = std::source_location::current()) {
        if (should_log(level)) {
            log(LogRecord{level, std::string(message), std::chrono::system_clock::now(), where});
        }
    }

    using Where = std::source_location;
    void trace(std::string_view m, Where w = Where::current()) { write(LogLevel::Trace, m, w); }
    void debug(std::string_view m, Where w = Where::current()) { write(LogLevel::Debug, m, w); }
    void info(std::string_view m, Where w = Where::current())  { write(LogLevel::Info, m, w); }
    void warn(std::string_view m, Where w = Where::current())  { write(LogLevel::Warn, m, w); }
    void error(std::string_view m, Where w = Where::current()) { write(LogLevel::Error, m, w); }
    void fatal(std::string_view m, Where w = Where::current()) { write(LogLevel::Fatal, m, w); }
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord&) override {}
    [[nodiscard]] bool should_log(LogLevel) const noexcept override { return false; }
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────
// Readers hold a shared_ptr, so swapping the logger while another thread is
// mid-write is safe.

[[nodiscard]] std::shared_ptr<ILogger> current_logger() noexcept;

/// nullptr installs a NullLogger
void set_logger(std::shared_ptr<ILogger> logger) noexcept;

// Arguments after the format string are evaluated only when the level passes.
#define PIPEMCP_LOG_AT(level, ...)                                            \
    do {                                                                      \
        if (auto pipemcp_log_ = ::pipemcp::current_logger();                  \
            pipemcp_log_->should_log(level)) {                                \
            pipemcp_log_->write(level, std::format(__VA_ARGS__));             \
        }                                                                     \
    } while (false)

#define PIPEMCP_LOG_TRACE(...) PIPEMCP_LOG_AT(::pipemcp::LogLevel::Trace, __VA_ARGS__)
#define PIPEMCP_LOG_DEBUG(...) PIPEMCP_LOG_AT(::pipemcp::LogLevel::Debug, __VA_ARGS__)
#define PIPEMCP_LOG_INFO(...)  PIPEMCP_LOG_AT(::pipemcp::LogLevel::Info, __VA_ARGS__)
#define PIPEMCP_LOG_WARN(...)  PIPEMCP_LOG_AT(::pipemcp::LogLevel::Warn, __VA_ARGS__)
#define PIPEMCP_LOG_ERROR(...) PIPEMCP_LOG_AT(::pipemcp::LogLevel::Error, __VA_ARGS__)
#define PIPEMCP_LOG_FATAL(...) PIPEMCP_LOG_AT(::pipemcp::LogLevel::Fatal, __VA_ARGS__)

}  // namespace pipemcp
