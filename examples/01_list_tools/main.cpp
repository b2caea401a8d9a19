// Example 01: List tools from a stdio MCP server
//
// Connects through ClientSession from an asio event loop, lists the tools,
// and optionally calls one of them.
//
//   01_list_tools [command] [args] [tool]

#include <pipemcp/async/client_session.hpp>
#include <pipemcp/log/spdlog_logger.hpp>

#include <asio/co_spawn.hpp>
#include <asio/detached.hpp>
#include <asio/io_context.hpp>

#include <iostream>
#include <string>

using namespace pipemcp;

asio::awaitable<void> show_tools(ClientSession& session, std::string tool_to_call) {
    const auto tools = co_await session.list_tools();

    std::cout << "Server provides " << tools.size() << " tool(s):\n";
    for (const auto& tool : tools) {
        std::cout << "  - " << tool.name;
        if (tool.description) {
            std::cout << ": " << *tool.description;
        }
        std::cout << "\n";
    }

    if (!tool_to_call.empty()) {
        std::cout << "\nCalling " << tool_to_call << "...\n";
        const auto response = co_await session.call_tool(tool_to_call, {});
        if (response) {
            std::cout << response->dump(2) << "\n";
        } else {
            std::cerr << "No response\n";
        }
    }

    session.disconnect();
}

int main(int argc, char* argv[]) {
    const std::string command = argc > 1 ? argv[1] : "akeyless";
    const std::string args = argc > 2 ? argv[2] : "mcp --gateway-url https://api.akeyless.io";
    const std::string tool = argc > 3 ? argv[3] : "";

    set_logger(make_spdlog_logger());

    asio::io_context io;
    ClientSession session(io.get_executor());

    int exit_code = 0;
    std::cout << "Starting " << command << " " << args << "\n";

    session.connect(command, args, std::nullopt, [&](bool connected) {
        if (!connected) {
            std::cerr << "Connect failed: "
                      << session.last_connection_error().value_or("timed out") << "\n";
            exit_code = 1;
            session.disconnect();
            return;
        }
        asio::co_spawn(io, show_tools(session, tool), asio::detached);
    });

    io.run();
    return exit_code;
}
