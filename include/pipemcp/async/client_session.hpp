#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// ClientSession
// ═══════════════════════════════════════════════════════════════════════════
// Asynchronous front end for a host event loop. The blocking McpClient runs
// on a private single-threaded asio::thread_pool; tool operations are
// exposed as awaitables and connect() reports through a callback posted to
// the caller's executor.
//
// Usage:
//   asio::io_context io;
//   ClientSession session(io.get_executor());
//   session.connect("akeyless", "mcp", std::nullopt, [&](bool ok) {
//       if (ok) asio::co_spawn(io, show_tools(session), asio::detached);
//   });
//   io.run();

#include "pipemcp/client/mcp_client.hpp"

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/thread_pool.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pipemcp {

struct ClientSessionConfig {
    /// Caller-level bound on connect(); the underlying handshake is not
    /// interrupted when it fires
    std::chrono::milliseconds connect_timeout{150000};

    McpClientConfig client;
};

class ClientSession {
public:
    using ConnectHandler = std::function<void(bool connected)>;

    explicit ClientSession(asio::any_io_executor completion_executor, ClientSessionConfig config = {});
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;
    ClientSession(ClientSession&&) = delete;
    ClientSession& operator=(ClientSession&&) = delete;

    /// Starts the connection in the background. `handler` runs exactly once
    /// on the completion executor: with the connect result, or with false
    /// when connect_timeout elapses first.
    void connect(
        std::string command,
        std::optional<std::string> args,
        std::optional<std::string> working_directory,
        ConnectHandler handler
    );

    void disconnect();

    [[nodiscard]] bool is_connected() const;
    [[nodiscard]] std::optional<std::string> last_connection_error() const;

    [[nodiscard]] asio::awaitable<std::vector<ToolDescriptor>> list_tools();
    [[nodiscard]] asio::awaitable<std::optional<Json>> call_tool(std::string name, ToolArguments arguments);

    [[nodiscard]] McpClient& client() noexcept { return client_; }

private:
    asio::any_io_executor completion_executor_;
    ClientSessionConfig config_;
    McpClient client_;
    asio::thread_pool pool_{1};
};

}  // namespace pipemcp
