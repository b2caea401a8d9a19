// ─────────────────────────────────────────────────────────────────────────────
// McpClient Tests
// ─────────────────────────────────────────────────────────────────────────────
// End-to-end against mock servers written as sh scripts.

#include <catch2/catch_test_macros.hpp>

#include "pipemcp/client/mcp_client.hpp"
#include "mocks/mock_server.hpp"

#include <filesystem>
#include <mutex>
#include <sstream>
#include <thread>

using namespace pipemcp;
using namespace std::chrono_literals;
using pipemcp::testing::MockBehavior;
using pipemcp::testing::MockServer;
using pipemcp::testing::ScopedCapture;
using pipemcp::testing::TempDir;
using pipemcp::testing::read_file;

namespace {

McpClientConfig test_config() {
    McpClientConfig config;
    config.startup_grace = 100ms;
    config.settle_delay = 0ms;
    config.handshake_timeout = 3s;
    config.request_timeout = 3s;
    config.shutdown_timeout = 500ms;
    config.profile_auth.enabled = false;
    return config;
}

MockBehavior tool_server() {
    MockBehavior behavior;
    behavior.on_tools_list = R"(reply '"result":{"tools":[{"name":"t1","description":"d"}]}')";
    behavior.on_tools_call = R"(reply '"result":{"content":[{"type":"text","text":"X"}]}')";
    return behavior;
}

std::vector<Json> read_json_lines(const std::filesystem::path& path) {
    std::vector<Json> lines;
    std::istringstream in(read_file(path));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            lines.push_back(Json::parse(line));
        }
    }
    return lines;
}

std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::istringstream in(read_file(path));
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Connecting
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("connect completes the handshake", "[client][connect]") {
    MockServer server(tool_server());
    McpClient client(test_config());

    REQUIRE(client.connect(server.command()));
    REQUIRE(client.is_connected());
    REQUIRE(client.state() == ConnectionState::Ready);
    REQUIRE_FALSE(client.last_connection_error().has_value());

    const auto info = client.server_info();
    REQUIRE(info.has_value());
    REQUIRE(info->name == "mock-server");
    REQUIRE(info->version == "1.2.3");

    client.disconnect();
    REQUIRE_FALSE(client.is_connected());
    REQUIRE(client.state() == ConnectionState::Disconnected);
    REQUIRE_FALSE(client.server_info().has_value());
}

TEST_CASE("connect sends initialize then the initialized notification", "[client][connect]") {
    TempDir logs;
    auto behavior = tool_server();
    behavior.request_log = logs.file("requests.jsonl").string();
    MockServer server(behavior);

    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));
    REQUIRE(client.list_tools().size() == 1);

    const auto requests = read_json_lines(behavior.request_log);
    REQUIRE(requests.size() == 3);

    REQUIRE(requests[0]["method"] == "initialize");
    REQUIRE(requests[0]["id"] == 1);
    REQUIRE(requests[0]["jsonrpc"] == "2.0");
    REQUIRE(requests[0]["params"]["protocolVersion"] == kMcpProtocolVersion);
    REQUIRE(requests[0]["params"]["clientInfo"]["name"] == "pipemcp");
    REQUIRE(requests[0]["params"]["capabilities"] == Json::object());

    REQUIRE(requests[1]["method"] == "notifications/initialized");
    REQUIRE_FALSE(requests[1].contains("id"));

    REQUIRE(requests[2]["method"] == "tools/list");
    REQUIRE(requests[2]["id"] == 2);
}

TEST_CASE("connect skips banners and stray JSON on stdout", "[client][connect]") {
    auto behavior = tool_server();
    behavior.preamble = "echo 'Connected to vault'";
    behavior.on_initialize =
        "echo 'Connected to vault'\n"
        "echo '{\"level\":\"info\",\"msg\":\"ready\"}'\n" + MockBehavior{}.on_initialize;
    MockServer server(behavior);

    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));
    REQUIRE(client.server_info()->name == "mock-server");
}

TEST_CASE("connect reports a JSON-RPC error message", "[client][connect][errors]") {
    MockBehavior behavior;
    behavior.on_initialize = R"(reply '"error":{"code":-32000,"message":"auth failed"}')";
    MockServer server(behavior);

    McpClient client(test_config());
    REQUIRE_FALSE(client.connect(server.command()));
    REQUIRE(client.last_connection_error() == "auth failed");
    REQUIRE_FALSE(client.is_connected());
    REQUIRE(client.state() == ConnectionState::Disconnected);
}

TEST_CASE("connect reports stderr of a server that exits immediately", "[client][connect][errors]") {
    MockServer server(std::string("echo 'Error: access denied' >&2\nexit 1"));

    McpClient client(test_config());
    REQUIRE_FALSE(client.connect(server.command()));
    REQUIRE(client.last_connection_error() == "Error: access denied");
    REQUIRE_FALSE(client.is_connected());
}

TEST_CASE("connect reports a command that cannot be started", "[client][connect][errors]") {
    McpClient client(test_config());
    REQUIRE_FALSE(client.connect("/nonexistent/pipemcp-server", "mcp"));

    const auto error = client.last_connection_error();
    REQUIRE(error.has_value());
    REQUIRE(error->find("Failed to start '/nonexistent/pipemcp-server'") != std::string::npos);
}

TEST_CASE("connect reports stderr when the server dies during the handshake", "[client][connect][errors]") {
    MockBehavior behavior;
    behavior.on_initialize = "echo 'panic: token expired' >&2\nexit 2";
    MockServer server(behavior);

    McpClient client(test_config());
    REQUIRE_FALSE(client.connect(server.command()));
    REQUIRE(client.last_connection_error() == "panic: token expired");
}

TEST_CASE("connect times out against a silent server", "[client][connect][timeout]") {
    MockBehavior behavior;
    behavior.on_initialize = "";
    MockServer server(behavior);

    auto config = test_config();
    config.handshake_timeout = 500ms;
    McpClient client(config);

    const auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(client.connect(server.command()));
    REQUIRE(std::chrono::steady_clock::now() - start < 3s);

    REQUIRE(client.last_connection_error() == kNoResponseError);
    REQUIRE_FALSE(client.is_connected());
}

TEST_CASE("connect timeout prefers the server's stderr", "[client][connect][timeout]") {
    MockBehavior behavior;
    behavior.preamble = "echo 'Open this URL in your browser to authenticate' >&2";
    behavior.on_initialize = "";
    MockServer server(behavior);

    auto config = test_config();
    config.handshake_timeout = 500ms;
    McpClient client(config);

    REQUIRE_FALSE(client.connect(server.command()));
    REQUIRE(client.last_connection_error() == "Open this URL in your browser to authenticate");
}

TEST_CASE("connect clears the previous error on success", "[client][connect]") {
    McpClient client(test_config());
    REQUIRE_FALSE(client.connect("/nonexistent/pipemcp-server"));
    REQUIRE(client.last_connection_error().has_value());

    MockServer server(tool_server());
    REQUIRE(client.connect(server.command()));
    REQUIRE_FALSE(client.last_connection_error().has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Launch details
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("connect splits args and uses the working directory", "[client][launch]") {
    TempDir out;
    TempDir workdir;
    const auto args_file = out.file("args.txt");
    const auto pwd_file = out.file("pwd.txt");

    auto behavior = tool_server();
    behavior.preamble =
        "printf '%s\\n' \"$@\" > '" + args_file.string() + "'\n"
        "pwd > '" + pwd_file.string() + "'";
    MockServer server(behavior);

    McpClient client(test_config());
    REQUIRE(client.connect(server.command(), "  mcp \t--gateway-url   https://gw ",
                           workdir.path().string()));

    REQUIRE(read_lines(args_file) == std::vector<std::string>{"mcp", "--gateway-url", "https://gw"});
    REQUIRE(read_file(pwd_file) == std::filesystem::canonical(workdir.path()).string() + "\n");
}

TEST_CASE("connect gives the child an augmented PATH and HOME", "[client][launch]") {
    TempDir out;
    const auto env_file = out.file("env.txt");

    auto behavior = tool_server();
    behavior.preamble = "printf '%s\\n%s\\n' \"$PATH\" \"$HOME\" > '" + env_file.string() + "'";
    MockServer server(behavior);

    auto config = test_config();
    config.path_additions = {"/pipemcp/extra/bin", "/usr/bin"};
    McpClient client(config);
    REQUIRE(client.connect(server.command()));

    const auto lines = read_lines(env_file);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].rfind("/pipemcp/extra/bin:", 0) == 0);
    REQUIRE(lines[1] == home_directory());
}

TEST_CASE("connect resolves a bare command through fallback directories", "[client][launch]") {
    MockServer server(tool_server());

    auto config = test_config();
    config.fallback_directories = std::vector<std::string>{server.dir().path().string()};
    McpClient client(config);

    REQUIRE(client.connect("server.sh"));
    REQUIRE(client.is_connected());
}

TEST_CASE("connect injects profile auth unless flags are given", "[client][launch][profile]") {
    TempDir out;
    const auto args_file = out.file("args.txt");
    const auto profile = out.write("default.toml", "access_type = \"saml\"\naccess_id = \"p-9\"\n");

    auto behavior = tool_server();
    behavior.preamble = "printf '%s\\n' \"$@\" > '" + args_file.string() + "'";
    MockServer server(behavior);

    auto config = test_config();
    config.profile_auth.enabled = true;
    config.profile_auth.profile_path = profile;
    McpClient client(config);

    SECTION("no explicit auth") {
        REQUIRE(client.connect(server.command(), "mcp"));
        REQUIRE(read_lines(args_file) ==
                std::vector<std::string>{"mcp", "--access-type", "saml", "--access-id", "p-9"});
    }

    SECTION("explicit access id") {
        REQUIRE(client.connect(server.command(), "mcp --access-id p-explicit"));
        REQUIRE(read_lines(args_file) ==
                std::vector<std::string>{"mcp", "--access-id", "p-explicit"});
    }
}

TEST_CASE("server stderr reaches the configured callback", "[client][launch][stderr]") {
    auto behavior = tool_server();
    behavior.preamble = "echo 'waiting for login' >&2";
    MockServer server(behavior);

    std::mutex mutex;
    std::vector<std::pair<std::string, bool>> seen;

    auto config = test_config();
    config.on_stderr_line = [&](const std::string& line, bool hint) {
        std::lock_guard lock(mutex);
        seen.emplace_back(line, hint);
    };
    McpClient client(config);
    REQUIRE(client.connect(server.command()));

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        {
            std::lock_guard lock(mutex);
            if (!seen.empty()) {
                break;
            }
        }
        std::this_thread::sleep_for(20ms);
    }
    client.disconnect();

    std::lock_guard lock(mutex);
    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0] == std::make_pair(std::string("waiting for login"), true));
}

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("list_tools returns descriptors", "[client][tools]") {
    MockServer server(tool_server());
    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));

    const auto tools = client.list_tools();
    REQUIRE(tools.size() == 1);
    REQUIRE(tools[0].name == "t1");
    REQUIRE(tools[0].description == "d");
    REQUIRE(tools[0].arguments.empty());
}

TEST_CASE("list_tools is empty on error responses and odd results", "[client][tools]") {
    MockBehavior behavior;

    SECTION("error response") {
        behavior.on_tools_list = R"(reply '"error":{"code":-32601,"message":"Method not found"}')";
    }
    SECTION("no tools array") {
        behavior.on_tools_list = R"(reply '"result":{"items":[]}')";
    }

    MockServer server(behavior);
    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));

    REQUIRE(client.list_tools().empty());
    REQUIRE(client.is_connected());
}

TEST_CASE("responses for other ids and server notifications are skipped", "[client][tools]") {
    MockBehavior behavior;
    behavior.on_tools_list =
        "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"method\":\"notifications/message\",\"params\":{\"level\":\"info\"}}'\n"
        "printf '%s\\n' '{\"jsonrpc\":\"2.0\",\"id\":99,\"result\":{\"tools\":[{\"name\":\"stale\"}]}}'\n"
        R"(reply '"result":{"tools":[{"name":"real"}]}')";
    MockServer server(behavior);

    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));

    const auto tools = client.list_tools();
    REQUIRE(tools.size() == 1);
    REQUIRE(tools[0].name == "real");
}

TEST_CASE("call_tool returns the raw response", "[client][tools]") {
    MockServer server(tool_server());
    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));

    const auto response = client.call_tool("t1");
    REQUIRE(response.has_value());
    REQUIRE((*response)["id"] == 2);
    REQUIRE((*response)["result"] == Json::parse(R"({"content":[{"type":"text","text":"X"}]})"));
}

TEST_CASE("call_tool returns error responses unchanged", "[client][tools]") {
    MockBehavior behavior;
    behavior.on_tools_call = R"(reply '"error":{"code":-32602,"message":"Unknown tool"}')";
    MockServer server(behavior);

    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));

    const auto response = client.call_tool("missing");
    REQUIRE(response.has_value());
    REQUIRE((*response)["error"]["message"] == "Unknown tool");
}

TEST_CASE("call_tool encodes arguments", "[client][tools]") {
    TempDir logs;
    auto behavior = tool_server();
    behavior.request_log = logs.file("requests.jsonl").string();
    MockServer server(behavior);

    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));

    REQUIRE(client.call_tool("get_secret_value", ToolArguments{
        {"names", std::vector<std::string>{"/prod/db"}},
        {"json", true},
        {"limit", std::int64_t{5}}
    }).has_value());
    REQUIRE(client.call_tool("list_items").has_value());

    const auto requests = read_json_lines(behavior.request_log);
    REQUIRE(requests.size() == 4);
    REQUIRE(requests[2]["params"] == Json::parse(R"({
        "name": "get_secret_value",
        "arguments": {"names": ["/prod/db"], "json": true, "limit": 5}
    })"));
    REQUIRE(requests[3]["params"] == Json::parse(R"({"name":"list_items","arguments":{}})"));
    REQUIRE(requests[3]["id"] == 3);
}

TEST_CASE("call_tool rejects non-object JSON arguments", "[client][tools]") {
    MockServer server(tool_server());
    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));

    REQUIRE_FALSE(client.call_tool("t1", Json::array({1, 2})).has_value());
    REQUIRE(client.call_tool("t1", Json()).has_value());
    REQUIRE(client.call_tool("t1", Json{{"path", "/"}}).has_value());
}

TEST_CASE("call_tool gives up after the request timeout", "[client][tools][timeout]") {
    MockBehavior behavior;
    MockServer server(behavior);

    auto config = test_config();
    config.request_timeout = 1s;
    McpClient client(config);
    REQUIRE(client.connect(server.command()));

    const auto start = std::chrono::steady_clock::now();
    const auto response = client.call_tool("slow");
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(response.has_value());
    REQUIRE(elapsed >= 900ms);
    REQUIRE(elapsed < 3s);
    REQUIRE(client.is_connected());
}

TEST_CASE("tool operations return immediately when not connected", "[client][tools]") {
    McpClient client(test_config());

    const auto start = std::chrono::steady_clock::now();
    REQUIRE(client.list_tools().empty());
    REQUIRE_FALSE(client.call_tool("t1").has_value());
    REQUIRE(std::chrono::steady_clock::now() - start < 100ms);

    const auto raw = client.send_request("tools/list");
    REQUIRE_FALSE(raw.has_value());
    REQUIRE(raw.error().code == ClientErrorCode::NotConnected);
}

TEST_CASE("a server that exits mid-call drops the connection", "[client][tools][errors]") {
    ScopedCapture capture;

    MockBehavior behavior;
    behavior.on_tools_call = "echo 'fatal: session revoked' >&2\nexit 3";
    MockServer server(behavior);

    {
        McpClient client(test_config());
        REQUIRE(client.connect(server.command()));

        REQUIRE_FALSE(client.call_tool("t1").has_value());
        REQUIRE_FALSE(client.is_connected());
        REQUIRE(client.state() == ConnectionState::Disconnected);
        REQUIRE(client.list_tools().empty());
    }

    REQUIRE(capture.logger().contains(LogLevel::Error, "MCP server exited. Last stderr:\nfatal: session revoked"));
}

// ═══════════════════════════════════════════════════════════════════════════
// Serialization and lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("concurrent calls never overlap on the pipe", "[client][concurrency]") {
    // tee records each request as it arrives; while answering id N the
    // server checks whether id N+1 was already written.
    TempDir dir;
    const auto arrivals = dir.file("arrivals").string();
    const auto overlap = dir.file("overlap");

    MockServer server(
        "tee -a '" + arrivals + "' | while IFS= read -r line; do\n"
        R"(  id=$(printf '%s\n' "$line" | sed -n 's/^{"id":\([0-9]*\).*/\1/p'))" "\n"
        "  case \"$line\" in\n"
        "    *'\"method\":\"initialize\"'*)\n"
        R"(      printf '{"jsonrpc":"2.0","id":%s,"result":{"serverInfo":{"name":"slow","version":"1"}}}\n' "$id" ;;)" "\n"
        "    *'\"method\":\"tools/call\"'*)\n"
        "      sleep 0.4\n"
        "      next=$((id + 1))\n"
        "      if grep -q \"^{\\\"id\\\":$next,\" '" + arrivals + "'; then echo \"$next\" >> '" + overlap.string() + "'; fi\n"
        R"(      printf '{"jsonrpc":"2.0","id":%s,"result":{"content":[]}}\n' "$id" ;;)" "\n"
        "  esac\n"
        "done"
    );

    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));

    std::optional<Json> first;
    std::optional<Json> second;
    std::thread a([&] { first = client.call_tool("a"); });
    std::this_thread::sleep_for(100ms);
    std::thread b([&] { second = client.call_tool("b"); });
    a.join();
    b.join();

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE((*first)["id"] != (*second)["id"]);
    REQUIRE_FALSE(std::filesystem::exists(overlap));
}

TEST_CASE("disconnect is idempotent", "[client][lifecycle]") {
    McpClient never_connected(test_config());
    never_connected.disconnect();
    never_connected.disconnect();
    REQUIRE_FALSE(never_connected.is_connected());

    MockServer server(tool_server());
    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));
    client.disconnect();
    client.disconnect();
    REQUIRE_FALSE(client.is_connected());
    REQUIRE(client.state() == ConnectionState::Disconnected);
}

TEST_CASE("disconnect interrupts a call in flight", "[client][lifecycle]") {
    MockBehavior behavior;
    MockServer server(behavior);

    auto config = test_config();
    config.request_timeout = 20s;
    McpClient client(config);
    REQUIRE(client.connect(server.command()));

    std::optional<Json> response = Json::object();
    const auto start = std::chrono::steady_clock::now();
    std::thread caller([&] { response = client.call_tool("stuck"); });

    std::this_thread::sleep_for(300ms);
    client.disconnect();
    caller.join();

    REQUIRE_FALSE(response.has_value());
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE_FALSE(client.is_connected());
}

TEST_CASE("disconnect during the startup grace cancels connect", "[client][lifecycle]") {
    MockServer server(tool_server());

    auto config = test_config();
    config.startup_grace = 800ms;
    McpClient client(config);

    bool connected = true;
    std::thread connecting([&] { connected = client.connect(server.command()); });

    std::this_thread::sleep_for(200ms);
    client.disconnect();
    connecting.join();

    REQUIRE_FALSE(connected);
    REQUIRE_FALSE(client.is_connected());
    REQUIRE(client.state() == ConnectionState::Disconnected);
    REQUIRE(client.last_connection_error() == kDisconnectedDuringConnect);
    REQUIRE(client.list_tools().empty());
}

TEST_CASE("disconnect during a silent initialize cancels connect", "[client][lifecycle]") {
    MockBehavior behavior;
    behavior.on_initialize = "";
    MockServer server(behavior);

    auto config = test_config();
    config.handshake_timeout = 20s;
    McpClient client(config);

    bool connected = true;
    const auto start = std::chrono::steady_clock::now();
    std::thread connecting([&] { connected = client.connect(server.command()); });

    std::this_thread::sleep_for(500ms);
    client.disconnect();
    connecting.join();

    REQUIRE_FALSE(connected);
    REQUIRE(std::chrono::steady_clock::now() - start < 5s);
    REQUIRE_FALSE(client.is_connected());
    REQUIRE(client.state() == ConnectionState::Disconnected);
    REQUIRE(client.last_connection_error() == kDisconnectedDuringHandshake);
}

TEST_CASE("reconnecting starts ids at 1 again", "[client][lifecycle]") {
    TempDir logs;
    auto behavior = tool_server();
    behavior.request_log = logs.file("requests.jsonl").string();
    MockServer server(behavior);

    McpClient client(test_config());
    REQUIRE(client.connect(server.command()));
    REQUIRE(client.call_tool("t1").has_value());
    client.disconnect();

    REQUIRE(client.connect(server.command()));
    REQUIRE(client.list_tools().size() == 1);

    std::vector<Json> with_ids;
    for (const auto& request : read_json_lines(behavior.request_log)) {
        if (request.contains("id")) {
            with_ids.push_back(request);
        }
    }
    REQUIRE(with_ids.size() == 4);
    REQUIRE(with_ids[0]["id"] == 1);
    REQUIRE(with_ids[1]["id"] == 2);
    REQUIRE(with_ids[2]["method"] == "initialize");
    REQUIRE(with_ids[2]["id"] == 1);
    REQUIRE(with_ids[3]["id"] == 2);
}

TEST_CASE("connect replaces a live connection", "[client][lifecycle]") {
    MockServer first(tool_server());
    MockServer second(tool_server());

    McpClient client(test_config());
    REQUIRE(client.connect(first.command()));
    REQUIRE(client.connect(LaunchSpec{second.command(), {}, std::nullopt}));
    REQUIRE(client.is_connected());
    REQUIRE(client.list_tools().size() == 1);
}
