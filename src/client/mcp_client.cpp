#include "pipemcp/client/mcp_client.hpp"
#include "pipemcp/process/command_resolver.hpp"
#include "pipemcp/protocol/json_rpc.hpp"
#include "pipemcp/log/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <thread>

namespace pipemcp {

namespace {

constexpr std::chrono::milliseconds kStderrDrainTimeout{300};

}  // namespace

McpClient::McpClient(McpClientConfig config)
    : config_(std::move(config))
{}

McpClient::~McpClient() {
    disconnect();
}

// ─────────────────────────────────────────────────────────────────────────────
// Connection Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

bool McpClient::connect(
    const std::string& command,
    const std::optional<std::string>& args,
    const std::optional<std::string>& working_directory
) {
    LaunchSpec spec;
    spec.command = command;
    if (args) {
        spec.args = split_arguments(*args);
    }
    if (working_directory && !working_directory->empty()) {
        spec.working_directory = *working_directory;
    }
    return connect(spec);
}

bool McpClient::connect(const LaunchSpec& spec) {
    disconnect();

    auto gate = gate_.acquire();
    {
        std::lock_guard lock(state_mutex_);
        last_error_.reset();
        server_info_.reset();
        state_ = ConnectionState::Connecting;
    }

    std::shared_ptr<Connection> conn;
    Implementation server;
    try {
        auto spawned = spawn(spec);
        if (!spawned) {
            record_error(spawned.error().message);
            std::lock_guard lock(state_mutex_);
            state_ = ConnectionState::Disconnected;
            return false;
        }
        conn = std::move(*spawned);

        bool cancelled = false;
        {
            std::lock_guard lock(state_mutex_);
            // disconnect() during spawn found no connection to stop
            cancelled = state_ != ConnectionState::Connecting;
            if (!cancelled) {
                connection_ = conn;
                state_ = ConnectionState::AwaitingInit;
            }
        }
        if (cancelled) {
            conn->process->terminate();
            record_error(kDisconnectedDuringConnect);
            return false;
        }

        auto info = handshake(*conn);
        if (!info) {
            bool interrupted = false;
            {
                std::lock_guard lock(state_mutex_);
                interrupted = state_ == ConnectionState::Disconnected;
            }
            record_error(interrupted ? std::string(kDisconnectedDuringHandshake)
                                     : diagnostic_for(*conn, info.error()));
            abandon(conn);
            return false;
        }

        std::lock_guard lock(state_mutex_);
        if (state_ != ConnectionState::AwaitingInit || connection_ != conn) {
            last_error_ = kDisconnectedDuringHandshake;
            PIPEMCP_LOG_WARN("Handshake completed after disconnect");
            return false;
        }
        server = *info;
        server_info_ = std::move(*info);
        state_ = ConnectionState::Ready;
    } catch (const std::exception& e) {
        record_error(std::string("Connection failed: ") + e.what());
        if (conn) {
            abandon(conn);
        } else {
            state_ = ConnectionState::Disconnected;
        }
        return false;
    }

    PIPEMCP_LOG_INFO("Connected to MCP server {} {}",
                     server.name.empty() ? "(unnamed)" : server.name, server.version);
    return true;
}

void McpClient::disconnect() {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard lock(state_mutex_);
        conn = connection_;
        state_ = ConnectionState::Disconnected;
    }
    if (!conn) {
        return;
    }

    // Kill first so an exchange blocked on stdout returns and frees the gate
    conn->process->terminate();

    auto gate = gate_.acquire();
    {
        std::lock_guard lock(state_mutex_);
        if (connection_ == conn) {
            connection_.reset();
            server_info_.reset();
        }
    }
    PIPEMCP_LOG_INFO("MCP client disconnected");
}

bool McpClient::is_connected() const {
    std::lock_guard lock(state_mutex_);
    return connection_ && connection_->process->is_alive();
}

ConnectionState McpClient::state() const {
    std::lock_guard lock(state_mutex_);
    const auto current = state_.load();
    if (current == ConnectionState::Disconnected) {
        return current;
    }
    if (connection_ && !connection_->process->is_alive()) {
        return ConnectionState::Disconnected;
    }
    return current;
}

std::optional<std::string> McpClient::last_connection_error() const {
    std::lock_guard lock(state_mutex_);
    return last_error_;
}

std::optional<Implementation> McpClient::server_info() const {
    std::lock_guard lock(state_mutex_);
    return server_info_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Tools API
// ─────────────────────────────────────────────────────────────────────────────

std::vector<ToolDescriptor> McpClient::list_tools() {
    auto response = gated_request("tools/list", std::nullopt, config_.request_timeout);
    if (!response) {
        PIPEMCP_LOG_WARN("tools/list failed: {}", response.error().message);
        return {};
    }

    const auto error_it = response->find("error");
    if (error_it != response->end()) {
        PIPEMCP_LOG_WARN("tools/list returned an error: {}", JsonRpcError::from_json(*error_it).message);
        return {};
    }

    const auto result_it = response->find("result");
    if (result_it == response->end()) {
        PIPEMCP_LOG_WARN("tools/list response has no result");
        return {};
    }

    auto tools = parse_tool_list(*result_it);
    if (!tools) {
        PIPEMCP_LOG_WARN("tools/list result has no tools array");
        return {};
    }

    PIPEMCP_LOG_DEBUG("Server lists {} tools", tools->size());
    return std::move(*tools);
}

std::optional<Json> McpClient::call_tool(const std::string& name, const ToolArguments& arguments) {
    return call_tool(name, encode_arguments(arguments));
}

std::optional<Json> McpClient::call_tool(const std::string& name, const Json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        PIPEMCP_LOG_ERROR("Arguments for tool '{}' must be an object", name);
        return std::nullopt;
    }

    CallToolParams params;
    params.name = name;
    if (arguments.is_object()) {
        params.arguments = arguments;
    }

    auto response = gated_request("tools/call", params.to_json(), config_.request_timeout);
    if (!response) {
        PIPEMCP_LOG_WARN("tools/call '{}' failed: {}", name, response.error().message);
        return std::nullopt;
    }
    return std::move(*response);
}

ClientResult<Json> McpClient::send_request(const std::string& method, std::optional<Json> params) {
    return gated_request(method, std::move(params), config_.request_timeout);
}

// ─────────────────────────────────────────────────────────────────────────────
// Internal helpers
// ─────────────────────────────────────────────────────────────────────────────

ClientResult<std::shared_ptr<McpClient::Connection>> McpClient::spawn(const LaunchSpec& spec) {
    const std::string home = home_directory();

    const char* host_path = std::getenv("PATH");
    CommandResolver resolver(
        host_path != nullptr ? std::string(host_path) : std::string{},
        config_.fallback_directories.value_or(CommandResolver::default_fallback_directories(home))
    );

    ProcessConfig process_config;
    process_config.command = resolver.resolve(spec.command);
    process_config.args = spec.args;
    if (config_.profile_auth.enabled) {
        inject_profile_auth(process_config.args, config_.profile_auth,
                            ProfileAuthReader(config_.profile_auth).read());
    }
    process_config.working_directory = spec.working_directory;
    process_config.environment = build_child_environment(
        capture_host_environment(), config_.path_additions, home);
    process_config.startup_grace = config_.startup_grace;
    process_config.shutdown_timeout = config_.shutdown_timeout;
    process_config.stderr_tail_lines = config_.stderr_tail_lines;
    process_config.on_stderr_line = config_.on_stderr_line;

    PIPEMCP_LOG_INFO("Launching {} with {} argument(s)", process_config.command, process_config.args.size());

    auto conn = std::make_shared<Connection>();
    conn->process = std::make_unique<ProcessSupervisor>(std::move(process_config));

    auto started = conn->process->start();
    if (!started) {
        return tl::unexpected(ClientError::from_transport(started.error()));
    }

    ProcessSupervisor* process = conn->process.get();
    conn->transport = std::make_unique<LineTransport>(
        process->stdin_fd(),
        process->stdout_fd(),
        [process] { return process->is_alive(); },
        config_.transport
    );
    return conn;
}

ClientResult<Implementation> McpClient::handshake(Connection& conn) {
    InitializeParams params;
    params.protocol_version = config_.protocol_version;
    params.client_info = {config_.client_name, config_.client_version};

    auto response = exchange(conn, "initialize", params.to_json(), config_.handshake_timeout);
    if (!response) {
        return tl::unexpected(response.error());
    }

    const auto error_it = response->find("error");
    if (error_it != response->end()) {
        return tl::unexpected(ClientError::from_rpc_error(JsonRpcError::from_json(*error_it)));
    }

    const auto result_it = response->find("result");
    if (result_it == response->end()) {
        return tl::unexpected(ClientError::protocol_error("Invalid initialize response: " + response->dump()));
    }

    const auto init = InitializeResult::from_json(*result_it);

    auto notified = conn.transport->send(JsonRpcNotification("notifications/initialized").to_json());
    if (!notified) {
        return tl::unexpected(ClientError::from_transport(notified.error()));
    }

    if (config_.settle_delay.count() > 0) {
        std::this_thread::sleep_for(config_.settle_delay);
    }
    return init.server_info;
}

ClientResult<Json> McpClient::exchange(
    Connection& conn,
    const std::string& method,
    std::optional<Json> params,
    std::chrono::milliseconds timeout
) {
    const std::int64_t id = conn.next_id++;
    const JsonRpcRequest request(method, id, std::move(params));

    auto sent = conn.transport->send(request.to_json());
    if (!sent) {
        return tl::unexpected(ClientError::from_transport(sent.error()));
    }
    PIPEMCP_LOG_DEBUG("-> {} (id {})", method, id);

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        auto message = conn.transport->receive(std::max(remaining, std::chrono::milliseconds::zero()));
        if (!message) {
            return tl::unexpected(ClientError::from_transport(message.error()));
        }

        if (!is_response(*message)) {
            PIPEMCP_LOG_DEBUG("Ignoring server message {} while waiting for {}",
                              message->at("method").dump(), method);
            continue;
        }

        const auto response_id = message_id(*message);
        if (response_id && *response_id != id) {
            PIPEMCP_LOG_WARN("Ignoring response id {} while waiting for id {}", *response_id, id);
            continue;
        }

        PIPEMCP_LOG_DEBUG("<- {} (id {})", method, id);
        return std::move(*message);
    }
}

ClientResult<Json> McpClient::gated_request(
    const std::string& method,
    std::optional<Json> params,
    std::chrono::milliseconds timeout
) {
    if (state_.load() != ConnectionState::Ready) {
        return tl::unexpected(ClientError::not_connected());
    }

    auto gate = gate_.acquire();

    std::shared_ptr<Connection> conn;
    {
        std::lock_guard lock(state_mutex_);
        if (state_.load() != ConnectionState::Ready || !connection_) {
            return tl::unexpected(ClientError::not_connected());
        }
        conn = connection_;
    }

    try {
        auto response = exchange(*conn, method, std::move(params), timeout);
        if (!response && response.error().code == ClientErrorCode::ServerExited) {
            handle_server_exit(conn);
        }
        return response;
    } catch (const std::exception& e) {
        return tl::unexpected(ClientError::protocol_error(method + " failed: " + e.what()));
    }
}

void McpClient::handle_server_exit(const std::shared_ptr<Connection>& conn) {
    conn->process->wait_for_stderr_eof(kStderrDrainTimeout);
    const auto stderr_tail = conn->process->recent_stderr();
    if (!stderr_tail.empty()) {
        PIPEMCP_LOG_ERROR("MCP server exited. Last stderr:\n{}", stderr_tail);
    } else {
        PIPEMCP_LOG_ERROR("MCP server exited");
    }

    std::lock_guard lock(state_mutex_);
    if (connection_ == conn) {
        state_ = ConnectionState::Disconnected;
        connection_.reset();
    }
}

void McpClient::abandon(const std::shared_ptr<Connection>& conn) {
    conn->process->terminate();
    std::lock_guard lock(state_mutex_);
    if (connection_ == conn) {
        connection_.reset();
    }
    state_ = ConnectionState::Disconnected;
}

void McpClient::record_error(std::string message) {
    PIPEMCP_LOG_ERROR("MCP connection failed: {}", message);
    std::lock_guard lock(state_mutex_);
    last_error_ = std::move(message);
}

std::string McpClient::diagnostic_for(Connection& conn, const ClientError& error) const {
    // The server answered or the OS refused: that text is the diagnostic
    if (error.rpc_error || error.code == ClientErrorCode::TransportError) {
        return error.message;
    }

    // A closed stdout means the child is on its way out even if not yet reaped
    if (error.code == ClientErrorCode::ServerExited || !conn.process->is_alive()) {
        conn.process->wait_for_stderr_eof(kStderrDrainTimeout);
    }
    auto stderr_tail = conn.process->recent_stderr();
    if (!stderr_tail.empty()) {
        return stderr_tail;
    }
    if (error.code == ClientErrorCode::ProtocolError) {
        return error.message;
    }
    return kNoResponseError;
}

}  // namespace pipemcp
