#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON Parser (simdjson on-demand, producing nlohmann::json)
// ─────────────────────────────────────────────────────────────────────────────
// Inbound protocol lines and formatter service replies are parsed here.
// Outgoing messages are built and serialized with nlohmann::json directly.
//
//   auto doc = daxmcp::fast_parse(line);
//   if (!doc) { /* doc.error().message */ }
//
// A document must be the only thing in the input: trailing non-whitespace
// content is an error ("one JSON document per line").

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <string>
#include <string_view>

namespace daxmcp {

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using FastJsonResult = tl::expected<nlohmann::json, JsonParseError>;

struct FastJsonConfig {
    std::size_t max_depth{64};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    [[nodiscard]] FastJsonResult parse(std::string_view json_str);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] FastJsonResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] FastJsonResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] FastJsonResult convert_array(simdjson::ondemand::array arr, std::size_t depth);
    [[nodiscard]] FastJsonResult convert_scalar_document(simdjson::ondemand::document& doc);

    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;
};

/// Thread-local parser with the default configuration.
[[nodiscard]] FastJsonResult fast_parse(std::string_view json_str);

}  // namespace daxmcp
