#pragma once

#include "pipemcp/log/logger.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include <spdlog/logger.h>

namespace pipemcp {

// ─────────────────────────────────────────────────────────────────────────────
// Spdlog backend options
// ─────────────────────────────────────────────────────────────────────────────

/// Default line layout: time, level, source location, message
inline constexpr const char* kSpdlogPattern = "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

struct SpdlogOptions {
    LogLevel level = LogLevel::Info;

    /// Colored sink on stderr; stdout is reserved for command output
    bool console = true;

    /// Additional plain-text file sink
    std::optional<std::filesystem::path> file;

    /// Start the file empty instead of appending
    bool truncate_file = false;

    std::string pattern = kSpdlogPattern;
};

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Loggers stay out of spdlog's global registry, so several clients or test
// cases can each own one.

class SpdlogLogger final : public ILogger {
public:
    /// Builds the sinks described by `options`. Throws spdlog::spdlog_ex when
    /// the file sink cannot be opened.
    explicit SpdlogLogger(const SpdlogOptions& options = {});

    /// Adopts an existing spdlog logger and its current level
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept { return level_.load(); }

    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] const std::shared_ptr<spdlog::logger>& backend() const noexcept { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<LogLevel> level_;
};

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

/// Convenience for set_logger(make_spdlog_logger(...))
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogOptions& options = {});

}  // namespace pipemcp
