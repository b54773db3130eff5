#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <tl/expected.hpp>

namespace daxmcp {

using Json = nlohmann::json;

inline constexpr std::string_view kJsonRpcVersion{"2.0"};

// ─────────────────────────────────────────────────────────────────────────────
// Decode errors
// ─────────────────────────────────────────────────────────────────────────────

struct JsonError {
    enum class Code {
        Syntax,          // not JSON at all, or trailing content
        NotAnObject,
        InvalidVersion,
        MissingField,
        InvalidId,
        InvalidField
    };

    Code code{Code::Syntax};
    std::string message;
};

template <typename T>
using JsonResult = tl::expected<T, JsonError>;

// ─────────────────────────────────────────────────────────────────────────────
// Identifier
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcId {
    std::variant<std::int64_t, double, std::string> value;

    static JsonRpcId integer(std::int64_t v);
    static JsonRpcId number(double v);
    static JsonRpcId string(std::string v);

    [[nodiscard]] Json to_json() const;
    [[nodiscard]] static JsonResult<JsonRpcId> from_json(const Json& node);

    friend bool operator==(const JsonRpcId&, const JsonRpcId&) = default;
};

// ─────────────────────────────────────────────────────────────────────────────
// Request envelope
// ─────────────────────────────────────────────────────────────────────────────
// One class covers requests and notifications: a missing id marks a
// notification.

class JsonRpcRequest {
public:
    JsonRpcRequest(std::string method,
                   std::optional<JsonRpcId> id,
                   std::optional<Json> params = std::nullopt);

    [[nodiscard]] const std::string& method() const noexcept;
    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept;
    [[nodiscard]] const std::optional<Json>& params() const noexcept;

    [[nodiscard]] bool has_id() const noexcept { return id_.has_value(); }

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcRequest> from_json(const Json& payload);

private:
    std::string method_;
    std::optional<JsonRpcId> id_;
    std::optional<Json> params_;
};

/// Parse one transport line into a request envelope.
[[nodiscard]] JsonResult<JsonRpcRequest> decode_request(std::string_view line);

// ─────────────────────────────────────────────────────────────────────────────
// Error object
// ─────────────────────────────────────────────────────────────────────────────

struct JsonRpcError {
    std::int64_t code{};
    std::string message;
    std::optional<Json> data{};

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcError> from_json(const Json& node);
};

// ─────────────────────────────────────────────────────────────────────────────
// Response envelope
// ─────────────────────────────────────────────────────────────────────────────
// Exactly one of result or error; the variant makes "both" and "neither"
// unrepresentable.

class JsonRpcResponse {
public:
    [[nodiscard]] static JsonRpcResponse success(std::optional<JsonRpcId> id, Json result);
    [[nodiscard]] static JsonRpcResponse failure(std::optional<JsonRpcId> id, JsonRpcError error);

    [[nodiscard]] const std::optional<JsonRpcId>& id() const noexcept { return id_; }

    [[nodiscard]] bool is_error() const noexcept {
        return std::holds_alternative<JsonRpcError>(body_);
    }

    /// Precondition: !is_error()
    [[nodiscard]] const Json& result() const { return std::get<Json>(body_); }

    /// Precondition: is_error()
    [[nodiscard]] const JsonRpcError& error() const { return std::get<JsonRpcError>(body_); }

    [[nodiscard]] Json to_json() const;
    static JsonResult<JsonRpcResponse> from_json(const Json& payload);

private:
    JsonRpcResponse(std::optional<JsonRpcId> id, std::variant<Json, JsonRpcError> body)
        : id_(std::move(id)), body_(std::move(body)) {}

    std::optional<JsonRpcId> id_;
    std::variant<Json, JsonRpcError> body_;
};

/// Serialize to a single line without the trailing newline. Invalid UTF-8
/// is replaced, so this never throws on string content.
[[nodiscard]] std::string encode(const Json& message);

}  // namespace daxmcp
