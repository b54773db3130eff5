#pragma once

#include "daxmcp/formatter/formatter_client.hpp"
#include "daxmcp/protocol/json_rpc.hpp"
#include "daxmcp/protocol/mcp_types.hpp"
#include "daxmcp/server/format_tools.hpp"
#include "daxmcp/server/server_config.hpp"

#include <asio/awaitable.hpp>

#include <optional>
#include <string_view>

namespace daxmcp {

class StdioTransport;

// ═══════════════════════════════════════════════════════════════════════════
// Method surface
// ═══════════════════════════════════════════════════════════════════════════

enum class Method {
    Initialize,
    ToolsList,
    ToolsCall,
    ResourcesList,
    PromptsList
};

[[nodiscard]] std::string_view to_string(Method method) noexcept;
[[nodiscard]] std::optional<Method> method_from_string(std::string_view name) noexcept;

inline constexpr std::string_view kNotificationPrefix = "notifications/";

/// No response is owed: reserved prefix, or no identifier at all.
[[nodiscard]] bool is_notification(const JsonRpcRequest& request) noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// McpServer
// ═══════════════════════════════════════════════════════════════════════════
// Decodes one line at a time, routes it and produces at most one response.
// Nothing thrown by a handler escapes: it becomes an internal-error response,
// or a log entry for notifications.

class McpServer {
public:
    McpServer(ServerConfig config, IFormatterClient& client);

    /// Response to send for one input line; nullopt for notifications.
    [[nodiscard]] std::optional<JsonRpcResponse> handle_line(std::string_view line);

    [[nodiscard]] std::optional<JsonRpcResponse> handle_request(const JsonRpcRequest& request);

    /// Protocol loop: reads until end of input, answering in order.
    asio::awaitable<void> run(StdioTransport& transport);

    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] McpResult<Json> dispatch(Method method, const std::optional<Json>& params);

    [[nodiscard]] McpResult<Json> handle_initialize(const std::optional<Json>& params);
    [[nodiscard]] McpResult<Json> handle_tools_list();
    [[nodiscard]] McpResult<Json> handle_tools_call(const std::optional<Json>& params);

    void handle_notification(const JsonRpcRequest& request);

    ServerConfig config_;
    FormatTools tools_;
};

}  // namespace daxmcp
