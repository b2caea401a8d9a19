#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Common Types
// ═══════════════════════════════════════════════════════════════════════════
// Error and result types shared by the process supervisor and the line
// transport.

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace pipemcp {

using Json = nlohmann::json;

struct TransportError {
    enum class Category {
        Network,        // pipe/fork/write failure, OS error text in message
        Timeout,        // deadline elapsed before a protocol line arrived
        Protocol,       // invalid use (not started, already running, ...)
        Closed,         // end of stream on the child's stdout
        ProcessExited   // child died while we were waiting
    };

    Category category{};
    std::string message;
    std::optional<int> exit_code{};

    [[nodiscard]] static TransportError network(std::string msg) {
        return {Category::Network, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError timeout(std::string msg) {
        return {Category::Timeout, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError protocol(std::string msg) {
        return {Category::Protocol, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError closed(std::string msg) {
        return {Category::Closed, std::move(msg), std::nullopt};
    }

    [[nodiscard]] static TransportError process_exited(std::string msg, std::optional<int> code) {
        return {Category::ProcessExited, std::move(msg), code};
    }
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:       return "Network";
        case TransportError::Category::Timeout:       return "Timeout";
        case TransportError::Category::Protocol:      return "Protocol";
        case TransportError::Category::Closed:        return "Closed";
        case TransportError::Category::ProcessExited: return "ProcessExited";
    }
    return "Unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

}  // namespace pipemcp
