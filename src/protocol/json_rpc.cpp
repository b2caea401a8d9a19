#include "pipemcp/protocol/json_rpc.hpp"

#include <type_traits>

namespace pipemcp {

namespace {

Json envelope(const std::string& method, const std::optional<Json>& params) {
    Json message{{kJsonRpcMarker, kJsonRpcVersion}, {"method", method}};
    if (params) {
        message["params"] = *params;
    }
    return message;
}

template <typename T>
std::optional<T> typed_field(const Json& object, const char* key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    const auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if constexpr (std::is_same_v<T, std::int64_t>) {
        if (!it->is_number_integer()) {
            return std::nullopt;
        }
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (!it->is_string()) {
            return std::nullopt;
        }
    }
    return it->template get<T>();
}

}  // namespace

Json JsonRpcRequest::to_json() const {
    auto message = envelope(method, params);
    message["id"] = id;
    return message;
}

Json JsonRpcNotification::to_json() const {
    return envelope(method, params);
}

Json JsonRpcError::to_json() const {
    Json out{{"code", code}, {"message", message}};
    if (data) {
        out["data"] = *data;
    }
    return out;
}

JsonRpcError JsonRpcError::from_json(const Json& error) {
    JsonRpcError parsed;
    parsed.code = typed_field<std::int64_t>(error, "code").value_or(0);
    parsed.message = typed_field<std::string>(error, "message").value_or(error.dump());
    if (error.is_object() && error.contains("data")) {
        parsed.data = error["data"];
    }
    return parsed;
}

bool is_protocol_message(const Json& message) noexcept {
    return message.is_object() && message.contains(kJsonRpcMarker);
}

bool is_response(const Json& message) noexcept {
    return is_protocol_message(message) && !message.contains("method");
}

std::optional<std::int64_t> message_id(const Json& message) noexcept {
    return typed_field<std::int64_t>(message, "id");
}

}  // namespace pipemcp
