#include "daxmcp/server/mcp_server.hpp"

#include "daxmcp/log/logger.hpp"
#include "daxmcp/transport/stdio_transport.hpp"

#include <exception>

namespace daxmcp {

namespace {

JsonRpcResponse error_response(const std::optional<JsonRpcId>& id, const McpError& error) {
    return JsonRpcResponse::failure(id, error.to_rpc_error());
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Method names
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::Initialize:    return "initialize";
        case Method::ToolsList:     return "tools/list";
        case Method::ToolsCall:     return "tools/call";
        case Method::ResourcesList: return "resources/list";
        case Method::PromptsList:   return "prompts/list";
    }
    return "unknown";
}

std::optional<Method> method_from_string(std::string_view name) noexcept {
    for (const auto method : {Method::Initialize, Method::ToolsList, Method::ToolsCall,
                              Method::ResourcesList, Method::PromptsList}) {
        if (to_string(method) == name) {
            return method;
        }
    }
    return std::nullopt;
}

bool is_notification(const JsonRpcRequest& request) noexcept {
    return (request.has_id() == false) ||
           (request.method().rfind(kNotificationPrefix, 0) == 0);
}

// ─────────────────────────────────────────────────────────────────────────────
// McpServer
// ─────────────────────────────────────────────────────────────────────────────

McpServer::McpServer(ServerConfig config, IFormatterClient& client)
    : config_(std::move(config))
    , tools_(client)
{}

std::optional<JsonRpcResponse> McpServer::handle_line(std::string_view line) {
    get_logger().debug_fmt("Received: {}", line);

    auto request = decode_request(line);
    if (!request) {
        get_logger().warn_fmt("Rejecting malformed message: {}", request.error().message);
        return error_response(std::nullopt, McpError::parse_error(request.error().message));
    }
    return handle_request(*request);
}

std::optional<JsonRpcResponse> McpServer::handle_request(const JsonRpcRequest& request) {
    if (is_notification(request)) {
        handle_notification(request);
        return std::nullopt;
    }

    const auto method = method_from_string(request.method());
    if (method.has_value() == false) {
        return error_response(request.id(), McpError::method_not_found(request.method()));
    }

    try {
        auto result = dispatch(*method, request.params());
        if (!result) {
            get_logger().debug_fmt("{} failed: {} ({})", request.method(),
                                   result.error().message, result.error().code);
            return error_response(request.id(), result.error());
        }
        return JsonRpcResponse::success(request.id(), std::move(*result));
    } catch (const std::exception& e) {
        get_logger().error_fmt("Unhandled exception in {}: {}", request.method(), e.what());
        return error_response(request.id(),
                              McpError::internal_error(std::string("Internal error: ") + e.what()));
    }
}

void McpServer::handle_notification(const JsonRpcRequest& request) {
    get_logger().debug_fmt("Notification: {}", request.method());

    // An id-less call to a known method still runs; its outcome is dropped
    const auto method = method_from_string(request.method());
    if (method.has_value() == false) {
        return;
    }
    try {
        auto result = dispatch(*method, request.params());
        if (!result) {
            get_logger().debug_fmt("Notification {} failed: {}", request.method(), result.error().message);
        }
    } catch (const std::exception& e) {
        get_logger().error_fmt("Unhandled exception in notification {}: {}", request.method(), e.what());
    }
}

McpResult<Json> McpServer::dispatch(Method method, const std::optional<Json>& params) {
    switch (method) {
        case Method::Initialize:    return handle_initialize(params);
        case Method::ToolsList:     return handle_tools_list();
        case Method::ToolsCall:     return handle_tools_call(params);
        case Method::ResourcesList: return Json{{"resources", Json::array()}};
        case Method::PromptsList:   return Json{{"prompts", Json::array()}};
    }
    return tl::unexpected(McpError::internal_error("Unhandled method"));
}

McpResult<Json> McpServer::handle_initialize(const std::optional<Json>& params) {
    if (params.has_value() && params->is_object()) {
        const auto client_it = params->find("clientInfo");
        if (client_it != params->end()) {
            const auto client = Implementation::from_json(*client_it);
            get_logger().info_fmt("Client connected: {} {}", client.name, client.version);
        }
    }

    InitializeResult result;
    result.capabilities.tools = ServerCapabilities::Tools{};
    result.server_info = Implementation{config_.server_name, config_.server_version};
    return result.to_json();
}

McpResult<Json> McpServer::handle_tools_list() {
    ListToolsResult result;
    result.tools = format_tool_descriptors();
    return result.to_json();
}

McpResult<Json> McpServer::handle_tools_call(const std::optional<Json>& params) {
    if ((params.has_value() == false) || params->is_null()) {
        return tl::unexpected(McpError::invalid_params("Invalid params"));
    }

    auto call = CallToolParams::from_json(*params);
    if (!call) {
        return tl::unexpected(call.error());
    }

    const auto kind = tool_from_name(call->name);
    if (kind.has_value() == false) {
        return tl::unexpected(McpError::invalid_params("Unknown tool: " + call->name));
    }

    get_logger().debug_fmt("Calling tool {}", call->name);
    auto result = tools_.call(*kind, call->arguments);
    if (!result) {
        return tl::unexpected(result.error());
    }
    return result->to_json();
}

asio::awaitable<void> McpServer::run(StdioTransport& transport) {
    get_logger().info_fmt("{} {} ready", config_.server_name, config_.server_version);

    for (;;) {
        auto line = co_await transport.async_read_line();

        std::optional<JsonRpcResponse> response;
        if (line.has_value()) {
            response = handle_line(*line);
        } else if (line.error().category == TransportError::Category::Network) {
            get_logger().info_fmt("Input closed ({}), shutting down", line.error().message);
            co_return;
        } else {
            get_logger().warn_fmt("Rejecting input line: {}", line.error().message);
            response = error_response(std::nullopt, McpError::parse_error(line.error().message));
        }

        if (response.has_value() == false) {
            continue;
        }

        const Json payload = response->to_json();
        get_logger().debug_fmt("Sending: {}", encode(payload));
        auto written = co_await transport.async_write_line(payload);
        if (!written) {
            get_logger().error_fmt("Failed to write response: {}", written.error().message);
        }
    }
}

}  // namespace daxmcp
