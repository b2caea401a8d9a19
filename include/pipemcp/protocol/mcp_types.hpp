#ifndef PIPEMCP_PROTOCOL_MCP_TYPES_HPP
#define PIPEMCP_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace pipemcp {

using Json = nlohmann::json;

/// Protocol revision sent in initialize
inline constexpr const char* kMcpProtocolVersion = "2024-11-05";

namespace detail {

/// j[key] when j is an object holding a string there
inline std::optional<std::string> string_member(const Json& j, const char* key) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    const auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    static Implementation from_json(const Json& j) {
        return {detail::string_member(j, "name").value_or(""),
                detail::string_member(j, "version").value_or("")};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialization
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeParams {
    std::string protocol_version = kMcpProtocolVersion;
    Implementation client_info;
    Json capabilities = Json::object();  // we advertise none

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities},
            {"clientInfo", client_info.to_json()}
        };
    }
};

struct InitializeResult {
    std::string protocol_version;
    Implementation server_info;
    Json capabilities = Json::object();
    std::optional<std::string> instructions;

    static InitializeResult from_json(const Json& j) {
        InitializeResult result;
        if (!j.is_object()) {
            return result;
        }
        result.protocol_version = detail::string_member(j, "protocolVersion").value_or("");
        result.instructions = detail::string_member(j, "instructions");
        if (const auto info = j.find("serverInfo"); info != j.end()) {
            result.server_info = Implementation::from_json(*info);
        }
        if (const auto caps = j.find("capabilities"); caps != j.end() && caps->is_object()) {
            result.capabilities = *caps;
        }
        return result;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

/// One entry of a tools/list result. `arguments` maps parameter name to its
/// schema object (at least "type", optionally "description"), taken from
/// inputSchema.properties.
struct ToolDescriptor {
    std::string name;
    std::optional<std::string> description;
    std::map<std::string, Json> arguments;

    /// nullopt for entries that are not objects or lack a string "name"
    static std::optional<ToolDescriptor> from_json(const Json& j) {
        auto name = detail::string_member(j, "name");
        if (!name) {
            return std::nullopt;
        }

        ToolDescriptor tool;
        tool.name = std::move(*name);
        tool.description = detail::string_member(j, "description");

        const auto schema_it = j.find("inputSchema");
        if (schema_it != j.end() && schema_it->is_object()) {
            const auto props_it = schema_it->find("properties");
            if (props_it != schema_it->end() && props_it->is_object()) {
                for (const auto& [param, schema] : props_it->items()) {
                    tool.arguments.emplace(param, schema);
                }
            }
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        Json properties = Json::object();
        for (const auto& [param, schema] : arguments) {
            properties[param] = schema;
        }
        Json out{{"name", name},
                 {"inputSchema", {{"type", "object"}, {"properties", std::move(properties)}}}};
        if (description) {
            out["description"] = *description;
        }
        return out;
    }
};

/// Maps result.tools into descriptors, dropping malformed entries.
/// Returns nullopt when `result` carries no "tools" array.
inline std::optional<std::vector<ToolDescriptor>> parse_tool_list(const Json& result) {
    if (result.is_object() == false) {
        return std::nullopt;
    }
    const auto tools_it = result.find("tools");
    if (tools_it == result.end() || tools_it->is_array() == false) {
        return std::nullopt;
    }

    std::vector<ToolDescriptor> tools;
    tools.reserve(tools_it->size());
    for (const auto& entry : *tools_it) {
        if (auto tool = ToolDescriptor::from_json(entry)) {
            tools.push_back(std::move(*tool));
        }
    }
    return tools;
}

// ═══════════════════════════════════════════════════════════════════════════
// Tool Call Arguments
// ═══════════════════════════════════════════════════════════════════════════

/// Value of a single tools/call argument. Scalars pass through, lists become
/// JSON arrays, Json is sent as-is.
using ArgumentValue = std::variant<
    std::string,
    std::int64_t,
    double,
    bool,
    std::vector<std::string>,
    std::vector<std::int64_t>,
    std::vector<double>,
    Json
>;

using ToolArguments = std::map<std::string, ArgumentValue>;

[[nodiscard]] inline Json encode_argument(const ArgumentValue& value) {
    return std::visit([](const auto& v) -> Json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Json>) {
            return v;
        } else if constexpr (std::is_same_v<T, std::vector<std::string>> ||
                             std::is_same_v<T, std::vector<std::int64_t>> ||
                             std::is_same_v<T, std::vector<double>>) {
            Json array = Json::array();
            for (const auto& item : v) {
                array.push_back(item);
            }
            return array;
        } else {
            return Json(v);
        }
    }, value);
}

/// Always an object, `{}` for no arguments
[[nodiscard]] inline Json encode_arguments(const ToolArguments& arguments) {
    Json encoded = Json::object();
    for (const auto& [name, value] : arguments) {
        encoded[name] = encode_argument(value);
    }
    return encoded;
}

struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"arguments", arguments}};
    }
};

}  // namespace pipemcp

#endif  // PIPEMCP_PROTOCOL_MCP_TYPES_HPP
