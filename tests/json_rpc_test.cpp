#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include "daxmcp/protocol/json_rpc.hpp"

using namespace daxmcp;
using json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("JsonRpcRequest serializes ids and params deterministically", "[json-rpc][request]") {
    auto params = json::object({{"name", "format_dax"}, {"arguments", {{"dax", "1+1"}}}});
    JsonRpcRequest request{"tools/call", JsonRpcId::integer(42), params};

    auto j = request.to_json();

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["method"] == "tools/call");
    REQUIRE(j["id"] == 42);
    REQUIRE(j["params"] == params);
}

TEST_CASE("decode_request accepts every identifier kind", "[json-rpc][request]") {
    SECTION("integer") {
        auto req = decode_request(R"({"jsonrpc":"2.0","id":7,"method":"tools/list"})");
        REQUIRE(req.has_value());
        REQUIRE(req->id() == JsonRpcId::integer(7));
    }

    SECTION("string") {
        auto req = decode_request(R"({"jsonrpc":"2.0","id":"req-001","method":"initialize","params":{}})");
        REQUIRE(req.has_value());
        REQUIRE(req->id() == JsonRpcId::string("req-001"));
        REQUIRE(req->params().has_value());
        REQUIRE(req->params()->is_object());
    }

    SECTION("fractional number") {
        auto req = decode_request(R"({"jsonrpc":"2.0","id":1.5,"method":"tools/list"})");
        REQUIRE(req.has_value());
        REQUIRE(req->id() == JsonRpcId::number(1.5));
    }
}

TEST_CASE("decode_request tolerates absent optional members", "[json-rpc][request]") {
    auto req = decode_request(R"({"method":"notifications/initialized"})");

    REQUIRE(req.has_value());
    REQUIRE(req->method() == "notifications/initialized");
    REQUIRE(req->has_id() == false);
    REQUIRE(req->params().has_value() == false);
}

TEST_CASE("decode_request treats a null id as absent", "[json-rpc][request]") {
    auto req = decode_request(R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})");

    REQUIRE(req.has_value());
    REQUIRE(req->has_id() == false);
}

TEST_CASE("decode_request keeps params opaque", "[json-rpc][request]") {
    auto req = decode_request(R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":null})");

    REQUIRE(req.has_value());
    REQUIRE(req->params().has_value());
    REQUIRE(req->params()->is_null());
}

TEST_CASE("decode_request rejects malformed envelopes", "[json-rpc][request]") {
    SECTION("truncated JSON") {
        auto req = decode_request(R"({"jsonrpc":"2.0","id":1,"method":"tools/li)");
        REQUIRE(req.has_value() == false);
        REQUIRE(req.error().code == JsonError::Code::Syntax);
    }

    SECTION("not an object") {
        auto req = decode_request(R"([1, 2, 3])");
        REQUIRE(req.has_value() == false);
        REQUIRE(req.error().code == JsonError::Code::NotAnObject);
    }

    SECTION("wrong version") {
        auto req = decode_request(R"({"jsonrpc":"1.0","id":1,"method":"tools/list"})");
        REQUIRE(req.has_value() == false);
        REQUIRE(req.error().code == JsonError::Code::InvalidVersion);
    }

    SECTION("missing method") {
        auto req = decode_request(R"({"jsonrpc":"2.0","id":1})");
        REQUIRE(req.has_value() == false);
        REQUIRE(req.error().code == JsonError::Code::MissingField);
    }

    SECTION("method is not a string") {
        auto req = decode_request(R"({"jsonrpc":"2.0","id":1,"method":12})");
        REQUIRE(req.has_value() == false);
        REQUIRE(req.error().code == JsonError::Code::InvalidField);
    }

    SECTION("id is neither string nor number") {
        auto req = decode_request(R"({"jsonrpc":"2.0","id":{"x":1},"method":"tools/list"})");
        REQUIRE(req.has_value() == false);
        REQUIRE(req.error().code == JsonError::Code::InvalidId);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Success responses omit the error member", "[json-rpc][response]") {
    auto response = JsonRpcResponse::success(JsonRpcId::integer(1), json{{"tools", json::array()}});
    auto j = response.to_json();

    REQUIRE(j["jsonrpc"] == "2.0");
    REQUIRE(j["id"] == 1);
    REQUIRE(j.contains("result"));
    REQUIRE(j.contains("error") == false);
}

TEST_CASE("Error responses omit the result member", "[json-rpc][response]") {
    auto response = JsonRpcResponse::failure(JsonRpcId::string("abc"),
                                             JsonRpcError{-32601, "Method not found: foo", std::nullopt});
    auto j = response.to_json();

    REQUIRE(j["id"] == "abc");
    REQUIRE(j["error"]["code"] == -32601);
    REQUIRE(j["error"]["message"] == "Method not found: foo");
    REQUIRE(j["error"].contains("data") == false);
    REQUIRE(j.contains("result") == false);
}

TEST_CASE("A response without an id encodes id as null", "[json-rpc][response]") {
    auto response = JsonRpcResponse::failure(std::nullopt, JsonRpcError{-32700, "Parse error: x", std::nullopt});
    auto j = response.to_json();

    REQUIRE(j.contains("id"));
    REQUIRE(j["id"].is_null());
}

TEST_CASE("Encoded responses keep result XOR error", "[json-rpc][response]") {
    const std::vector<JsonRpcResponse> responses = {
        JsonRpcResponse::success(JsonRpcId::integer(3), json{{"content", json::array()}}),
        JsonRpcResponse::success(JsonRpcId::string("x"), json(nullptr)),
        JsonRpcResponse::failure(JsonRpcId::integer(4), JsonRpcError{-32602, "Invalid params", std::nullopt}),
        JsonRpcResponse::failure(std::nullopt, JsonRpcError{-32700, "Parse error", std::nullopt}),
    };

    for (const auto& response : responses) {
        auto decoded = JsonRpcResponse::from_json(json::parse(encode(response.to_json())));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->is_error() == response.is_error());
        REQUIRE(decoded->id() == response.id());
    }
}

TEST_CASE("JsonRpcResponse::from_json rejects both or neither body", "[json-rpc][response]") {
    REQUIRE(JsonRpcResponse::from_json(json{{"jsonrpc", "2.0"}, {"id", 1}}).has_value() == false);
    REQUIRE(JsonRpcResponse::from_json(
        json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", 1}, {"error", {{"code", 1}, {"message", "m"}}}}
    ).has_value() == false);
}

TEST_CASE("encode never emits a raw newline", "[json-rpc][encode]") {
    json message = {{"text", "Formatted DAX:\n\n```dax\nSUM ( Sales[Amount] )\n```"}};
    const std::string line = encode(message);

    REQUIRE(line.find('\n') == std::string::npos);
    REQUIRE(json::parse(line) == message);
}

TEST_CASE("encode replaces invalid UTF-8 instead of throwing", "[json-rpc][encode]") {
    json message = {{"text", std::string("bad \xff byte")}};

    std::string line;
    REQUIRE_NOTHROW(line = encode(message));
    REQUIRE(line.find("bad") != std::string::npos);
}
