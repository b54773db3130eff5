#ifndef DAXMCP_PROTOCOL_MCP_TYPES_HPP
#define DAXMCP_PROTOCOL_MCP_TYPES_HPP

#include "daxmcp/protocol/json_rpc.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <vector>

namespace daxmcp {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// ═══════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════

// Standard JSON-RPC error codes
namespace ErrorCode {
    inline constexpr int ParseError = -32700;
    inline constexpr int InvalidRequest = -32600;
    inline constexpr int MethodNotFound = -32601;
    inline constexpr int InvalidParams = -32602;
    inline constexpr int InternalError = -32603;
}

struct McpError {
    int code{ErrorCode::InternalError};
    std::string message;

    [[nodiscard]] static McpError parse_error(const std::string& detail) {
        return {ErrorCode::ParseError, "Parse error: " + detail};
    }

    [[nodiscard]] static McpError method_not_found(const std::string& method) {
        return {ErrorCode::MethodNotFound, "Method not found: " + method};
    }

    [[nodiscard]] static McpError invalid_params(std::string msg) {
        return {ErrorCode::InvalidParams, std::move(msg)};
    }

    [[nodiscard]] static McpError internal_error(std::string msg) {
        return {ErrorCode::InternalError, std::move(msg)};
    }

    [[nodiscard]] JsonRpcError to_rpc_error() const {
        return JsonRpcError{code, message, std::nullopt};
    }

    [[nodiscard]] Json to_json() const {
        return {{"code", code}, {"message", message}};
    }
};

template <typename T>
using McpResult = tl::expected<T, McpError>;

// ═══════════════════════════════════════════════════════════════════════════
// Client/Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }

    // Lenient: clientInfo is informational only
    static Implementation from_json(const Json& j) {
        Implementation info;
        if (j.is_object() == false) {
            return info;
        }
        const auto name_it = j.find("name");
        if ((name_it != j.end()) && name_it->is_string()) {
            info.name = name_it->get<std::string>();
        }
        const auto version_it = j.find("version");
        if ((version_it != j.end()) && version_it->is_string()) {
            info.version = version_it->get<std::string>();
        }
        return info;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

struct ServerCapabilities {
    struct Tools {
        bool list_changed = false;
    };

    std::optional<Tools> tools;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (tools) {
            // A static tool list is advertised as a bare object
            j["tools"] = Json::object();
            if (tools->list_changed) {
                j["tools"]["listChanged"] = true;
            }
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeResult {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ServerCapabilities capabilities;
    Implementation server_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"serverInfo", server_info.to_json()}
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

struct Tool {
    std::string name;
    std::optional<std::string> description;
    Json input_schema;  // JSON Schema for tool arguments

    [[nodiscard]] Json to_json() const {
        Json j = {{"name", name}};
        if (description) {
            j["description"] = *description;
        }
        if (!input_schema.empty()) {
            j["inputSchema"] = input_schema;
        }
        return j;
    }
};

struct ListToolsResult {
    std::vector<Tool> tools;

    [[nodiscard]] Json to_json() const {
        Json list = Json::array();
        for (const auto& tool : tools) {
            list.push_back(tool.to_json());
        }
        return {{"tools", std::move(list)}};
    }
};

// tools/call parameters: {"name": "...", "arguments": {...}}
struct CallToolParams {
    std::string name;
    Json arguments = Json::object();

    /// Shape check only; "params" must already be known to be present.
    static McpResult<CallToolParams> from_json(const Json& j) {
        const auto bad_shape = [] {
            return tl::unexpected(McpError::invalid_params("Invalid tool call request"));
        };

        if (j.is_object() == false) {
            return bad_shape();
        }
        const auto name_it = j.find("name");
        if ((name_it == j.end()) || (name_it->is_string() == false)) {
            return bad_shape();
        }

        CallToolParams params;
        params.name = name_it->get<std::string>();

        const auto args_it = j.find("arguments");
        if ((args_it != j.end()) && (args_it->is_null() == false)) {
            if (args_it->is_object() == false) {
                return bad_shape();
            }
            params.arguments = *args_it;
        }
        return params;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Content
// ═══════════════════════════════════════════════════════════════════════════

struct TextContent {
    std::string text;

    [[nodiscard]] Json to_json() const {
        return {{"type", "text"}, {"text", text}};
    }
};

struct CallToolResult {
    std::vector<TextContent> content;
    bool is_error = false;

    [[nodiscard]] static CallToolResult text(std::string body) {
        CallToolResult result;
        result.content.push_back(TextContent{std::move(body)});
        return result;
    }

    [[nodiscard]] Json to_json() const {
        Json items = Json::array();
        for (const auto& c : content) {
            items.push_back(c.to_json());
        }
        Json j = {{"content", std::move(items)}};
        if (is_error) {
            j["isError"] = true;
        }
        return j;
    }
};

}  // namespace daxmcp

#endif  // DAXMCP_PROTOCOL_MCP_TYPES_HPP
