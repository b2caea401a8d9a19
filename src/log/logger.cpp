#include "pipemcp/log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <mutex>
#include <utility>

namespace pipemcp {

std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    const auto equals = [text](std::string_view name) {
        return std::equal(text.begin(), text.end(), name.begin(), name.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) == b;
                          });
    };

    static constexpr std::array<std::pair<std::string_view, LogLevel>, 8> kNames{{
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal},
        {"off", LogLevel::Off},
    }};
    for (const auto& [name, level] : kNames) {
        if (equals(name)) {
            return level;
        }
    }
    return std::nullopt;
}

namespace {

struct GlobalLogger {
    std::mutex mutex;
    std::shared_ptr<ILogger> logger = std::make_shared<NullLogger>();
};

GlobalLogger& global() {
    static GlobalLogger instance;
    return instance;
}

}  // namespace

std::shared_ptr<ILogger> current_logger() noexcept {
    auto& g = global();
    std::lock_guard lock(g.mutex);
    return g.logger;
}

void set_logger(std::shared_ptr<ILogger> logger) noexcept {
    if (!logger) {
        logger = std::make_shared<NullLogger>();
    }
    auto& g = global();
    std::lock_guard lock(g.mutex);
    g.logger.swap(logger);
}

}  // namespace pipemcp
