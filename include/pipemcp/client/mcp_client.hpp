#pragma once

#include "pipemcp/client/client_error.hpp"
#include "pipemcp/client/request_serializer.hpp"
#include "pipemcp/process/environment.hpp"
#include "pipemcp/process/process_supervisor.hpp"
#include "pipemcp/process/profile_auth.hpp"
#include "pipemcp/process/stderr_monitor.hpp"
#include "pipemcp/protocol/mcp_types.hpp"
#include "pipemcp/transport/line_transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pipemcp {

// ═══════════════════════════════════════════════════════════════════════════
// MCP Client Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct McpClientConfig {
    // Client identification
    std::string client_name = "pipemcp";
    std::string client_version = "0.1.0";
    std::string protocol_version = kMcpProtocolVersion;

    /// initialize may wait on an interactive login in a browser
    std::chrono::milliseconds handshake_timeout{120000};

    /// tools/list and tools/call
    std::chrono::milliseconds request_timeout{30000};

    /// Pause after notifications/initialized before the first request
    std::chrono::milliseconds settle_delay{200};

    // Process supervision
    std::chrono::milliseconds startup_grace{500};
    std::chrono::milliseconds shutdown_timeout{2000};
    std::size_t stderr_tail_lines = 20;
    StderrMonitor::LineCallback on_stderr_line;

    LineTransportConfig transport;

    /// Prepended to the child's PATH when missing
    std::vector<std::string> path_additions = kDefaultPathAdditions;

    /// Searched after PATH when resolving the command; nullopt uses
    /// CommandResolver::default_fallback_directories()
    std::optional<std::vector<std::string>> fallback_directories;

    ProfileAuthConfig profile_auth;
};

/// Connection lifecycle. A dead process always reads as Disconnected.
enum class ConnectionState {
    Disconnected,
    Connecting,
    AwaitingInit,
    Ready
};

[[nodiscard]] constexpr std::string_view to_string(ConnectionState state) noexcept {
    switch (state) {
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Connecting:   return "Connecting";
        case ConnectionState::AwaitingInit: return "AwaitingInit";
        case ConnectionState::Ready:        return "Ready";
    }
    return "Unknown";
}

/// What to launch; args are already split into tokens
struct LaunchSpec {
    std::string command;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> working_directory;
};

/// Diagnostic used when the server never answered and left no stderr
inline constexpr const char* kNoResponseError = "No response from MCP server (timed out or auth failed)";

/// last_connection_error() when disconnect() interrupts connect()
inline constexpr const char* kDisconnectedDuringConnect = "Disconnected during connect";
inline constexpr const char* kDisconnectedDuringHandshake = "Disconnected during handshake";

// ═══════════════════════════════════════════════════════════════════════════
// MCP Client
// ═══════════════════════════════════════════════════════════════════════════
// Stdio MCP client owning one child process. Every exchange (the handshake
// included) runs under a single RequestSerializer, so at most one request
// is in flight on the pipe pair.
//
// No public operation throws. connect() reports failure through its return
// value and last_connection_error(); tool operations return empty/absent.
//
// Usage:
//   McpClient client;
//   if (client.connect("akeyless", "mcp --gateway-url https://api.akeyless.io")) {
//       for (const auto& tool : client.list_tools()) { ... }
//       auto response = client.call_tool("list_items", ToolArguments{{"path", std::string("/")}});
//   }
//   client.disconnect();

class McpClient {
public:
    explicit McpClient(McpClientConfig config = {});
    ~McpClient();

    McpClient(const McpClient&) = delete;
    McpClient& operator=(const McpClient&) = delete;
    McpClient(McpClient&&) = delete;
    McpClient& operator=(McpClient&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Connection Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Spawn `command` with whitespace-split `args` and run the handshake.
    /// Tears down any previous connection first. May block for up to the
    /// handshake timeout.
    [[nodiscard]] bool connect(
        const std::string& command,
        const std::optional<std::string>& args = std::nullopt,
        const std::optional<std::string>& working_directory = std::nullopt
    );

    [[nodiscard]] bool connect(const LaunchSpec& spec);

    /// Terminate the process and drop the connection. Idempotent; safe while
    /// another thread is blocked in an exchange.
    void disconnect();

    /// A process exists and is alive, whatever the handshake state
    [[nodiscard]] bool is_connected() const;

    [[nodiscard]] ConnectionState state() const;

    [[nodiscard]] std::optional<std::string> last_connection_error() const;

    /// Available once Ready
    [[nodiscard]] std::optional<Implementation> server_info() const;

    [[nodiscard]] const McpClientConfig& config() const noexcept { return config_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Tools API
    // ─────────────────────────────────────────────────────────────────────────

    /// Empty on any failure, including an error response
    [[nodiscard]] std::vector<ToolDescriptor> list_tools();

    /// Raw response object (with "result" or "error"), nullopt on failure
    [[nodiscard]] std::optional<Json> call_tool(const std::string& name, const ToolArguments& arguments = {});

    /// Same as above with pre-encoded arguments (object or null)
    [[nodiscard]] std::optional<Json> call_tool(const std::string& name, const Json& arguments);

    // ─────────────────────────────────────────────────────────────────────────
    // Low-Level Access
    // ─────────────────────────────────────────────────────────────────────────

    /// One gated request/response exchange; returns the whole response
    [[nodiscard]] ClientResult<Json> send_request(
        const std::string& method,
        std::optional<Json> params = std::nullopt
    );

private:
    struct Connection {
        std::unique_ptr<ProcessSupervisor> process;
        std::unique_ptr<LineTransport> transport;
        std::int64_t next_id = 1;
    };

    ClientResult<std::shared_ptr<Connection>> spawn(const LaunchSpec& spec);
    ClientResult<Implementation> handshake(Connection& conn);

    /// Write one request, read until its response. Gate must be held.
    ClientResult<Json> exchange(
        Connection& conn,
        const std::string& method,
        std::optional<Json> params,
        std::chrono::milliseconds timeout
    );

    ClientResult<Json> gated_request(
        const std::string& method,
        std::optional<Json> params,
        std::chrono::milliseconds timeout
    );

    void handle_server_exit(const std::shared_ptr<Connection>& conn);
    void abandon(const std::shared_ptr<Connection>& conn);
    void record_error(std::string message);

    [[nodiscard]] std::string diagnostic_for(Connection& conn, const ClientError& error) const;

    McpClientConfig config_;
    RequestSerializer gate_;

    mutable std::mutex state_mutex_;
    std::shared_ptr<Connection> connection_;
    std::optional<std::string> last_error_;
    std::optional<Implementation> server_info_;
    std::atomic<ConnectionState> state_{ConnectionState::Disconnected};
};

}  // namespace pipemcp
