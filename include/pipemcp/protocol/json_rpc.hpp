#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pipemcp {

using Json = nlohmann::json;

/// Value of the "jsonrpc" field on every message we write
inline constexpr std::string_view kJsonRpcVersion{"2.0"};

/// Field whose presence marks a stdout line as a protocol message
inline constexpr const char* kJsonRpcMarker = "jsonrpc";

/// Outgoing call; `id` is assigned by the client per connection
struct JsonRpcRequest {
    std::string method;
    std::int64_t id;
    std::optional<Json> params;

    JsonRpcRequest(std::string m, std::int64_t request_id, std::optional<Json> p = std::nullopt)
        : method(std::move(m)), id(request_id), params(std::move(p)) {}

    [[nodiscard]] Json to_json() const;
};

/// Request without an id; the peer never replies
struct JsonRpcNotification {
    std::string method;
    std::optional<Json> params;

    explicit JsonRpcNotification(std::string m, std::optional<Json> p = std::nullopt)
        : method(std::move(m)), params(std::move(p)) {}

    [[nodiscard]] Json to_json() const;
};

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;

    /// Lenient: missing code becomes 0, missing message becomes the dump of
    /// the whole error object.
    [[nodiscard]] static JsonRpcError from_json(const Json& error);
};

// ─────────────────────────────────────────────────────────────────────────────
// Message classification
// ─────────────────────────────────────────────────────────────────────────────

/// Object carrying the "jsonrpc" marker field
[[nodiscard]] bool is_protocol_message(const Json& message) noexcept;

/// Protocol message without a "method" field
[[nodiscard]] bool is_response(const Json& message) noexcept;

/// Integer id of a message, nullopt when absent, null or not an integer
[[nodiscard]] std::optional<std::int64_t> message_id(const Json& message) noexcept;

}  // namespace pipemcp
