// ─────────────────────────────────────────────────────────────────────────────
// pipemcp-cli - Stdio MCP Client
// ─────────────────────────────────────────────────────────────────────────────
// Launches an MCP server as a child process and talks JSON-RPC to it over
// stdin/stdout.
//
// Usage:
//   pipemcp-cli --list-tools
//   pipemcp-cli --command akeyless --args "mcp --gateway-url https://api.akeyless.io" -i
//   pipemcp-cli --call-tool list_items --tool-args '{"path": "/"}' --json
//
// Environment:
//   PIPEMCP_COMMAND, PIPEMCP_ARGS, PIPEMCP_LOG_LEVEL supply defaults for
//   --command, --args and --log-level.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "pipemcp/client/mcp_client.hpp"
#include "pipemcp/log/logger.hpp"
#include "pipemcp/log/spdlog_logger.hpp"

#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

using namespace pipemcp;

namespace {

// ═══════════════════════════════════════════════════════════════════════════
// Terminal styling
// ═══════════════════════════════════════════════════════════════════════════

enum class Tone { Plain, Strong, Faint, Bad, Good, Accent, Prompt };

class Terminal {
public:
    void set_colors(bool on) noexcept { colors_ = on; }
    [[nodiscard]] bool colors() const noexcept { return colors_; }

    [[nodiscard]] std::string paint(std::string_view text, Tone tone) const {
        if (!colors_ || tone == Tone::Plain) {
            return std::string(text);
        }
        return std::string(escape(tone)) + std::string(text) + "\033[0m";
    }

    void fail(const std::string& what) const {
        std::cerr << paint("error:", Tone::Bad) << " " << what << "\n";
    }

    void ok(const std::string& what) const {
        std::cout << paint("ok", Tone::Good) << "  " << what << "\n";
    }

    void section(const std::string& title) const {
        std::cout << "\n" << paint("== " + title + " ==", Tone::Accent) << "\n";
    }

private:
    static std::string_view escape(Tone tone) noexcept {
        switch (tone) {
            case Tone::Strong: return "\033[1m";
            case Tone::Faint:  return "\033[2m";
            case Tone::Bad:    return "\033[1;31m";
            case Tone::Good:   return "\033[32m";
            case Tone::Accent: return "\033[1;36m";
            case Tone::Prompt: return "\033[36m";
            case Tone::Plain:  break;
        }
        return "";
    }

    bool colors_ = true;
};

Terminal term;

void dump(const Json& value) {
    std::cout << value.dump(2) << "\n";
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? std::string(value) : fallback;
}

std::optional<std::string> string_field(const Json& object, const char* key) {
    if (!object.is_object()) {
        return std::nullopt;
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int show_tools(McpClient& client, bool raw) {
    const auto tools = client.list_tools();

    if (raw) {
        Json list = Json::array();
        for (const auto& tool : tools) {
            list.push_back(tool.to_json());
        }
        dump(list);
        return 0;
    }

    term.section("Tools (" + std::to_string(tools.size()) + ")");
    for (const auto& tool : tools) {
        std::cout << term.paint(tool.name, Tone::Strong) << "\n";
        if (tool.description) {
            std::cout << "    " << term.paint(*tool.description, Tone::Faint) << "\n";
        }
        std::string params;
        for (const auto& [param, schema] : tool.arguments) {
            params += params.empty() ? "" : ", ";
            params += param;
            if (auto type = string_field(schema, "type")) {
                params += ":" + *type;
            }
        }
        if (!params.empty()) {
            std::cout << "    params " << params << "\n";
        }
    }
    return 0;
}

int invoke_tool(McpClient& client, const std::string& name, const std::string& args_text, bool raw) {
    Json args = args_text.empty() ? Json::object() : Json::parse(args_text, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
        term.fail("tool arguments must be a JSON object");
        return 1;
    }

    const auto response = client.call_tool(name, args);
    if (!response) {
        term.fail("no response for tool '" + name + "'");
        return 1;
    }

    const bool rpc_failed = response->contains("error");
    if (raw) {
        dump(*response);
        return rpc_failed ? 1 : 0;
    }
    if (rpc_failed) {
        term.fail(JsonRpcError::from_json((*response)["error"]).message);
        return 1;
    }

    const Json result = response->value("result", Json::object());
    term.section(name);

    const auto content = result.find("content");
    if (content != result.end() && content->is_array()) {
        for (const auto& part : *content) {
            const auto text = string_field(part, "text");
            if (text && string_field(part, "type") == "text") {
                std::cout << *text << "\n";
            } else {
                dump(part);
            }
        }
    } else {
        dump(result);
    }

    const auto flag = result.find("isError");
    if (flag != result.end() && flag->is_boolean() && flag->get<bool>()) {
        term.fail("tool reported an error");
        return 1;
    }
    return 0;
}

int show_status(const McpClient& client, bool raw) {
    const auto info = client.server_info();
    const std::string state(to_string(client.state()));

    if (raw) {
        Json status{{"state", state}, {"connected", client.is_connected()}};
        if (info) {
            status["serverInfo"] = info->to_json();
        }
        dump(status);
        return 0;
    }

    term.section("Status");
    std::cout << term.paint("state  ", Tone::Strong) << state << "\n";
    if (info) {
        std::cout << term.paint("server ", Tone::Strong) << info->name << " " << info->version << "\n";
    }
    return 0;
}

void show_last_error(const McpClient& client) {
    const auto error = client.last_connection_error();
    std::cout << (error ? *error : term.paint("no connection error recorded", Tone::Faint)) << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Interactive mode
// ═══════════════════════════════════════════════════════════════════════════

struct ReplCommand {
    const char* usage;
    const char* summary;
    std::function<void(std::istringstream&)> run;
};

std::string rest_of_line(std::istringstream& in) {
    std::string rest;
    std::getline(in, rest);
    const auto start = rest.find_first_not_of(" \t");
    return start == std::string::npos ? std::string{} : rest.substr(start);
}

int interactive(McpClient& client) {
    std::map<std::string, ReplCommand> commands;
    commands["tools"] = {"tools", "list the server's tools",
                         [&](std::istringstream&) { show_tools(client, false); }};
    commands["call"] = {"call <tool> [json]", "call a tool",
                        [&](std::istringstream& in) {
                            std::string tool;
                            if (!(in >> tool)) {
                                term.fail("usage: call <tool> [json]");
                                return;
                            }
                            invoke_tool(client, tool, rest_of_line(in), false);
                        }};
    commands["status"] = {"status", "connection state",
                          [&](std::istringstream&) { show_status(client, false); }};
    commands["error"] = {"error", "last connection error",
                         [&](std::istringstream&) { show_last_error(client); }};
    commands["help"] = {"help", "this list", [&](std::istringstream&) {
                            for (const auto& [name, command] : commands) {
                                std::cout << "  " << term.paint(command.usage, Tone::Strong)
                                          << "  " << command.summary << "\n";
                            }
                            std::cout << "  " << term.paint("quit", Tone::Strong) << "  leave\n";
                        }};

    const auto info = client.server_info();
    std::cout << "Session with " << (info ? info->name : std::string("MCP server"))
              << ". 'help' lists commands.\n";

    std::string line;
    for (;;) {
        std::cout << term.paint("pipemcp> ", Tone::Prompt) << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }
        std::istringstream in(line);
        std::string word;
        if (!(in >> word)) {
            continue;
        }
        if (word == "quit" || word == "exit" || word == "q") {
            break;
        }

        const auto found = commands.find(word);
        if (found == commands.end()) {
            term.fail("unknown command '" + word + "'");
        } else {
            found->second.run(in);
        }

        if (!client.is_connected()) {
            term.fail("MCP server is no longer running");
            return 1;
        }
    }
    return 0;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options cli("pipemcp-cli", "Talk to an MCP server over its stdin/stdout");
    cli.add_options("Server")
        ("c,command", "Server executable (name or path)",
            cxxopts::value<std::string>()->default_value(env_or("PIPEMCP_COMMAND", "akeyless")))
        ("a,args", "Server arguments, whitespace separated",
            cxxopts::value<std::string>()->default_value(
                env_or("PIPEMCP_ARGS", "mcp --gateway-url https://api.akeyless.io")))
        ("w,workdir", "Server working directory", cxxopts::value<std::string>())
        ("connect-timeout", "Seconds to wait for the handshake", cxxopts::value<int>()->default_value("120"))
        ("no-profile-auth", "Skip auth flags from the local CLI profile");
    cli.add_options("Actions")
        ("list-tools", "Print the server's tools")
        ("call-tool", "Call the named tool", cxxopts::value<std::string>())
        ("tool-args", "Tool arguments as a JSON object", cxxopts::value<std::string>()->default_value("{}"))
        ("i,interactive", "Read commands from stdin");
    cli.add_options("Output")
        ("j,json", "Print raw JSON")
        ("no-color", "Plain output")
        ("log-level", "trace|debug|info|warn|error|fatal|off",
            cxxopts::value<std::string>()->default_value(env_or("PIPEMCP_LOG_LEVEL", "warn")))
        ("log-file", "Append logs to this file as well", cxxopts::value<std::string>())
        ("h,help", "Show usage");

    try {
        const auto opts = cli.parse(argc, argv);
        if (opts.count("help")) {
            std::cout << cli.help({"Server", "Actions", "Output"}) << "\n";
            return 0;
        }

        term.set_colors(opts.count("no-color") == 0);
        const bool raw = opts.count("json") > 0;

        const auto level_text = opts["log-level"].as<std::string>();
        const auto level = parse_log_level(level_text);
        if (!level) {
            term.fail("unknown log level '" + level_text + "'");
            return 1;
        }
        SpdlogOptions logging;
        logging.level = *level;
        if (opts.count("log-file")) {
            logging.file = opts["log-file"].as<std::string>();
        }
        if (!term.colors()) {
            logging.pattern = "[%H:%M:%S.%e] [%l] [%s:%#] %v";
        }
        set_logger(make_spdlog_logger(logging));

        const int timeout_seconds = opts["connect-timeout"].as<int>();
        if (timeout_seconds <= 0) {
            term.fail("--connect-timeout must be positive");
            return 1;
        }

        McpClientConfig config;
        config.client_name = "pipemcp-cli";
        config.handshake_timeout = std::chrono::seconds(timeout_seconds);
        config.profile_auth.enabled = opts.count("no-profile-auth") == 0;

        std::optional<std::string> workdir;
        if (opts.count("workdir")) {
            workdir = opts["workdir"].as<std::string>();
        }

        McpClient client(config);
        const auto command = opts["command"].as<std::string>();
        if (!raw) {
            std::cout << term.paint("launching " + command, Tone::Faint) << "\n";
        }
        if (!client.connect(command, opts["args"].as<std::string>(), workdir)) {
            term.fail("connect failed: " + client.last_connection_error().value_or("unknown error"));
            return 1;
        }
        if (!raw) {
            const auto info = client.server_info();
            term.ok(info && !info->name.empty() ? "connected to " + info->name : std::string("connected"));
        }

        int status = 0;
        if (opts.count("interactive")) {
            status = interactive(client);
        } else if (opts.count("call-tool")) {
            status = invoke_tool(client, opts["call-tool"].as<std::string>(),
                                 opts["tool-args"].as<std::string>(), raw);
        } else if (opts.count("list-tools")) {
            status = show_tools(client, raw);
        } else {
            status = show_status(client, raw);
        }

        client.disconnect();
        return status;

    } catch (const cxxopts::exceptions::exception& e) {
        term.fail(e.what());
        return 1;
    } catch (const spdlog::spdlog_ex& e) {
        term.fail(std::string("cannot open log file: ") + e.what());
        return 1;
    }
}
