#include "pipemcp/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <stdexcept>
#include <vector>

namespace pipemcp {

namespace {

std::string next_logger_name() {
    static std::atomic<unsigned> sequence{0};
    return "pipemcp-" + std::to_string(sequence.fetch_add(1));
}

std::shared_ptr<spdlog::logger> build_backend(const SpdlogOptions& options) {
    std::vector<spdlog::sink_ptr> sinks;
    if (options.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (options.file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            options.file->string(), options.truncate_file));
    }

    auto logger = std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end());
    logger->set_level(to_spdlog_level(options.level));
    logger->set_pattern(options.pattern);
    // Warnings usually precede a hang on interactive auth; get them out now
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        default:                      return LogLevel::Off;
    }
}

SpdlogLogger::SpdlogLogger(const SpdlogOptions& options)
    : logger_(build_backend(options))
    , level_(options.level)
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , level_(LogLevel::Off)
{
    if (!logger_) {
        throw std::invalid_argument("SpdlogLogger needs a logger");
    }
    level_ = from_spdlog_level(logger_->level());
}

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }
    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    logger_->log(where, to_spdlog_level(record.level), "{}", record.message);
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return level_passes(level, level_.load());
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

std::unique_ptr<SpdlogLogger> make_spdlog_logger(const SpdlogOptions& options) {
    return std::make_unique<SpdlogLogger>(options);
}

}  // namespace pipemcp
