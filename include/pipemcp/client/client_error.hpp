#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// MCP Client Error
// ═══════════════════════════════════════════════════════════════════════════
// Internal error type of the client. The public facade folds these into
// bool/optional results and the last-connection-error string.

#include "pipemcp/protocol/json_rpc.hpp"
#include "pipemcp/transport.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pipemcp {

enum class ClientErrorCode {
    NotConnected,     ///< No live connection
    TransportError,   ///< Pipe or OS-level failure
    ProtocolError,    ///< Malformed response or JSON-RPC error from the server
    Timeout,          ///< No response before the deadline
    ServerExited      ///< Child died or closed stdout mid-exchange
};

[[nodiscard]] constexpr std::string_view to_string(ClientErrorCode code) noexcept {
    constexpr std::string_view names[] = {
        "NotConnected", "TransportError", "ProtocolError", "Timeout", "ServerExited"};
    const auto index = static_cast<std::size_t>(code);
    return index < std::size(names) ? names[index] : std::string_view{"Unknown"};
}

struct ClientError {
    ClientErrorCode code;
    std::string message;
    std::optional<JsonRpcError> rpc_error{};

    [[nodiscard]] static ClientError not_connected() {
        return {ClientErrorCode::NotConnected, "Client is not connected"};
    }

    [[nodiscard]] static ClientError protocol_error(std::string msg) {
        return {ClientErrorCode::ProtocolError, std::move(msg)};
    }

    /// Server answered with an "error" member
    [[nodiscard]] static ClientError from_rpc_error(const JsonRpcError& err) {
        return {ClientErrorCode::ProtocolError, err.message, err};
    }

    [[nodiscard]] static ClientError from_transport(const TransportError& err) {
        using Category = TransportError::Category;
        ClientErrorCode code = ClientErrorCode::TransportError;
        if (err.category == Category::Timeout) {
            code = ClientErrorCode::Timeout;
        } else if (err.category == Category::Closed || err.category == Category::ProcessExited) {
            code = ClientErrorCode::ServerExited;
        } else if (err.category == Category::Protocol) {
            code = ClientErrorCode::ProtocolError;
        }
        return {code, err.message};
    }
};

template <typename T>
using ClientResult = tl::expected<T, ClientError>;

}  // namespace pipemcp
