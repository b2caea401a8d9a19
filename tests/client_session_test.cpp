// ─────────────────────────────────────────────────────────────────────────────
// ClientSession Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "pipemcp/async/client_session.hpp"
#include "mocks/mock_server.hpp"

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <future>
#include <thread>

using namespace pipemcp;
using namespace std::chrono_literals;
using pipemcp::testing::MockBehavior;
using pipemcp::testing::MockServer;

// ═══════════════════════════════════════════════════════════════════════════
// Test Helpers
// ═══════════════════════════════════════════════════════════════════════════

namespace {

/// Run a coroutine to completion on `io` and return its result
template <typename T>
T run_sync(asio::io_context& io, asio::awaitable<T> coro) {
    std::promise<T> promise;
    auto future = promise.get_future();

    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        try {
            promise.set_value(co_await std::move(coro));
        } catch (...) {
            promise.set_exception(std::current_exception());
        }
    }, asio::detached);

    io.run();
    io.restart();

    return future.get();
}

ClientSessionConfig session_config() {
    ClientSessionConfig config;
    config.connect_timeout = 5s;
    config.client.startup_grace = 100ms;
    config.client.settle_delay = 0ms;
    config.client.handshake_timeout = 3s;
    config.client.request_timeout = 3s;
    config.client.shutdown_timeout = 500ms;
    config.client.profile_auth.enabled = false;
    return config;
}

MockBehavior tool_server() {
    MockBehavior behavior;
    behavior.on_tools_list = R"(reply '"result":{"tools":[{"name":"t1","description":"d"}]}')";
    behavior.on_tools_call = R"(reply '"result":{"content":[{"type":"text","text":"X"}]}')";
    return behavior;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connect
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ClientSession connect reports success once", "[async][session]") {
    MockServer server(tool_server());
    asio::io_context io;
    ClientSession session(io.get_executor(), session_config());

    int calls = 0;
    bool result = false;
    session.connect(server.command(), std::nullopt, std::nullopt, [&](bool connected) {
        ++calls;
        result = connected;
    });
    io.run();

    REQUIRE(calls == 1);
    REQUIRE(result);
    REQUIRE(session.is_connected());
}

TEST_CASE("ClientSession connect reports failure with the error", "[async][session]") {
    asio::io_context io;
    ClientSession session(io.get_executor(), session_config());

    std::optional<bool> result;
    session.connect("/nonexistent/pipemcp-server", "mcp", std::nullopt, [&](bool connected) {
        result = connected;
    });
    io.run();

    REQUIRE(result == false);
    REQUIRE(session.last_connection_error().has_value());
    REQUIRE_FALSE(session.is_connected());
}

TEST_CASE("ClientSession connect times out without waiting for the handshake", "[async][session][timeout]") {
    MockBehavior silent;
    silent.on_initialize = "";
    MockServer server(silent);

    auto config = session_config();
    config.connect_timeout = 200ms;
    asio::io_context io;
    ClientSession session(io.get_executor(), config);

    int calls = 0;
    std::optional<bool> result;
    const auto start = std::chrono::steady_clock::now();
    session.connect(server.command(), std::nullopt, std::nullopt, [&](bool connected) {
        ++calls;
        result = connected;
    });
    io.run();

    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
    REQUIRE(calls == 1);
    REQUIRE(result == false);

    // The background handshake finishes after disconnect; the handler stays silent
    session.disconnect();
    std::this_thread::sleep_for(200ms);
    io.restart();
    io.run();
    REQUIRE(calls == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ClientSession tool operations run off the caller's loop", "[async][session][tools]") {
    MockServer server(tool_server());
    asio::io_context io;
    ClientSession session(io.get_executor(), session_config());

    bool connected = false;
    session.connect(server.command(), std::nullopt, std::nullopt, [&](bool ok) { connected = ok; });
    io.run();
    io.restart();
    REQUIRE(connected);

    const auto tools = run_sync(io, session.list_tools());
    REQUIRE(tools.size() == 1);
    REQUIRE(tools[0].name == "t1");

    const auto response = run_sync(io, session.call_tool("t1", {}));
    REQUIRE(response.has_value());
    REQUIRE((*response)["result"]["content"][0]["text"] == "X");
}

TEST_CASE("ClientSession tool operations are empty when disconnected", "[async][session][tools]") {
    asio::io_context io;
    ClientSession session(io.get_executor(), session_config());

    REQUIRE(run_sync(io, session.list_tools()).empty());
    REQUIRE_FALSE(run_sync(io, session.call_tool("t1", {})).has_value());
}
