#include "daxmcp/protocol/json_rpc.hpp"

#include "daxmcp/json/fast_json.hpp"

#include <limits>

namespace daxmcp {
namespace {

tl::unexpected<JsonError> json_error(JsonError::Code code, std::string message) {
    return tl::unexpected(JsonError{code, std::move(message)});
}

std::optional<JsonError> check_version(const Json& payload) {
    const bool has_version_field = payload.contains("jsonrpc");
    if (has_version_field == false) {
        return std::nullopt;
    }
    const Json& version_node = payload.at("jsonrpc");
    const bool version_is_string = version_node.is_string();
    if ((version_is_string == false) || (version_node.get<std::string>() != kJsonRpcVersion)) {
        return JsonError{JsonError::Code::InvalidVersion, "jsonrpc must equal \"2.0\""};
    }
    return std::nullopt;
}

// A missing id and an explicit null id are both "no id".
JsonResult<std::optional<JsonRpcId>> parse_optional_id(const Json& payload) {
    const auto it = payload.find("id");
    if ((it == payload.end()) || it->is_null()) {
        return std::optional<JsonRpcId>{};
    }
    auto parsed = JsonRpcId::from_json(*it);
    if (!parsed) {
        return tl::unexpected(parsed.error());
    }
    return std::optional<JsonRpcId>{std::move(*parsed)};
}

Json id_or_null(const std::optional<JsonRpcId>& id) {
    if (id.has_value()) {
        return id->to_json();
    }
    return Json(nullptr);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcId
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcId JsonRpcId::integer(std::int64_t value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::number(double value) {
    return JsonRpcId{value};
}

JsonRpcId JsonRpcId::string(std::string value) {
    return JsonRpcId{std::move(value)};
}

Json JsonRpcId::to_json() const {
    return std::visit([](const auto& id_value) { return Json(id_value); }, value);
}

JsonResult<JsonRpcId> JsonRpcId::from_json(const Json& node) {
    if (node.is_string()) {
        return JsonRpcId::string(node.get<std::string>());
    }
    if (node.is_number_unsigned()) {
        const auto raw = node.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return JsonRpcId::number(static_cast<double>(raw));
        }
        return JsonRpcId::integer(static_cast<std::int64_t>(raw));
    }
    if (node.is_number_integer()) {
        return JsonRpcId::integer(node.get<std::int64_t>());
    }
    if (node.is_number_float()) {
        return JsonRpcId::number(node.get<double>());
    }
    return json_error(JsonError::Code::InvalidId, "id must be a string or a number");
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcRequest
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcRequest::JsonRpcRequest(std::string method,
                               std::optional<JsonRpcId> id,
                               std::optional<Json> params)
    : method_(std::move(method)),
      id_(std::move(id)),
      params_(std::move(params)) {}

const std::string& JsonRpcRequest::method() const noexcept {
    return method_;
}

const std::optional<JsonRpcId>& JsonRpcRequest::id() const noexcept {
    return id_;
}

const std::optional<Json>& JsonRpcRequest::params() const noexcept {
    return params_;
}

Json JsonRpcRequest::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["method"] = method_;
    if (id_.has_value()) {
        payload["id"] = id_->to_json();
    }
    if (params_.has_value()) {
        payload["params"] = *params_;
    }
    return payload;
}

JsonResult<JsonRpcRequest> JsonRpcRequest::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return json_error(JsonError::Code::NotAnObject, "message must be a JSON object");
    }

    if (auto version_error = check_version(payload)) {
        return tl::unexpected(*version_error);
    }

    const auto method_it = payload.find("method");
    if (method_it == payload.end()) {
        return json_error(JsonError::Code::MissingField, "missing method field");
    }
    if (method_it->is_string() == false) {
        return json_error(JsonError::Code::InvalidField, "method must be a string");
    }

    auto parsed_id = parse_optional_id(payload);
    if (!parsed_id) {
        return tl::unexpected(parsed_id.error());
    }

    // params is opaque here; each handler validates its own shape
    std::optional<Json> parsed_params;
    const auto params_it = payload.find("params");
    if (params_it != payload.end()) {
        parsed_params = *params_it;
    }

    return JsonRpcRequest(
        method_it->get<std::string>(),
        std::move(*parsed_id),
        std::move(parsed_params));
}

JsonResult<JsonRpcRequest> decode_request(std::string_view line) {
    auto parsed = fast_parse(line);
    if (!parsed) {
        return json_error(JsonError::Code::Syntax, parsed.error().message);
    }
    return JsonRpcRequest::from_json(*parsed);
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcError
// ─────────────────────────────────────────────────────────────────────────────

Json JsonRpcError::to_json() const {
    Json payload = Json::object();
    payload["code"] = code;
    payload["message"] = message;
    if (data.has_value()) {
        payload["data"] = *data;
    }
    return payload;
}

JsonResult<JsonRpcError> JsonRpcError::from_json(const Json& node) {
    if (node.is_object() == false) {
        return json_error(JsonError::Code::NotAnObject, "error must be a JSON object");
    }
    const auto code_it = node.find("code");
    if ((code_it == node.end()) || (code_it->is_number_integer() == false)) {
        return json_error(JsonError::Code::InvalidField, "error.code must be an integer");
    }
    const auto message_it = node.find("message");
    if ((message_it == node.end()) || (message_it->is_string() == false)) {
        return json_error(JsonError::Code::InvalidField, "error.message must be a string");
    }

    JsonRpcError error;
    error.code = code_it->get<std::int64_t>();
    error.message = message_it->get<std::string>();
    const auto data_it = node.find("data");
    if (data_it != node.end()) {
        error.data = *data_it;
    }
    return error;
}

// ─────────────────────────────────────────────────────────────────────────────
// JsonRpcResponse
// ─────────────────────────────────────────────────────────────────────────────

JsonRpcResponse JsonRpcResponse::success(std::optional<JsonRpcId> id, Json result) {
    return JsonRpcResponse(std::move(id), std::variant<Json, JsonRpcError>(std::move(result)));
}

JsonRpcResponse JsonRpcResponse::failure(std::optional<JsonRpcId> id, JsonRpcError error) {
    return JsonRpcResponse(std::move(id), std::variant<Json, JsonRpcError>(std::move(error)));
}

Json JsonRpcResponse::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    payload["id"] = id_or_null(id_);
    if (is_error()) {
        payload["error"] = error().to_json();
    } else {
        payload["result"] = result();
    }
    return payload;
}

JsonResult<JsonRpcResponse> JsonRpcResponse::from_json(const Json& payload) {
    if (payload.is_object() == false) {
        return json_error(JsonError::Code::NotAnObject, "message must be a JSON object");
    }

    if (auto version_error = check_version(payload)) {
        return tl::unexpected(*version_error);
    }

    auto parsed_id = parse_optional_id(payload);
    if (!parsed_id) {
        return tl::unexpected(parsed_id.error());
    }

    const bool has_result = payload.contains("result");
    const bool has_error = payload.contains("error");
    if (has_result == has_error) {
        return json_error(JsonError::Code::InvalidField,
                          "response must carry exactly one of result or error");
    }

    if (has_error) {
        auto error = JsonRpcError::from_json(payload.at("error"));
        if (!error) {
            return tl::unexpected(error.error());
        }
        return failure(std::move(*parsed_id), std::move(*error));
    }
    return success(std::move(*parsed_id), payload.at("result"));
}

std::string encode(const Json& message) {
    return message.dump(-1, ' ', false, Json::error_handler_t::replace);
}

}  // namespace daxmcp
