#include "daxmcp/json/fast_json.hpp"

namespace daxmcp {

namespace {

[[nodiscard]] tl::unexpected<JsonParseError> simd_error(simdjson::error_code code) {
    return tl::unexpected(JsonParseError(std::string(simdjson::error_message(code))));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// FastJsonParser
// ─────────────────────────────────────────────────────────────────────────────

FastJsonResult FastJsonParser::parse(std::string_view json_str) {
    // simdjson reads past the end of the buffer; padded_string adds the slack
    simdjson::padded_string padded(json_str);

    auto doc_result = parser_.iterate(padded);
    if (doc_result.error() != simdjson::SUCCESS) {
        return simd_error(doc_result.error());
    }

    try {
        auto doc = std::move(doc_result).value();

        FastJsonResult converted;
        auto is_scalar = doc.is_scalar();
        if (is_scalar.error() != simdjson::SUCCESS) {
            return simd_error(is_scalar.error());
        }
        if (is_scalar.value()) {
            converted = convert_scalar_document(doc);
        } else {
            auto value = doc.get_value();
            if (value.error() != simdjson::SUCCESS) {
                return simd_error(value.error());
            }
            converted = convert(value.value(), 0);
        }

        if (!converted) {
            return converted;
        }
        if (doc.at_end() == false) {
            return tl::unexpected(JsonParseError("Trailing content after JSON document"));
        }
        return converted;
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError(e.what()));
    }
}

FastJsonResult FastJsonParser::convert_scalar_document(simdjson::ondemand::document& doc) {
    auto type_result = doc.type();
    if (type_result.error() != simdjson::SUCCESS) {
        return simd_error(type_result.error());
    }

    switch (type_result.value()) {
        case simdjson::ondemand::json_type::string: {
            auto str = doc.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return simd_error(str.error());
            }
            return nlohmann::json(std::string(str.value()));
        }
        case simdjson::ondemand::json_type::number: {
            auto int_val = doc.get_int64();
            if (int_val.error() == simdjson::SUCCESS) {
                return nlohmann::json(int_val.value());
            }
            auto double_val = doc.get_double();
            if (double_val.error() == simdjson::SUCCESS) {
                return nlohmann::json(double_val.value());
            }
            return simd_error(double_val.error());
        }
        case simdjson::ondemand::json_type::boolean: {
            auto bool_val = doc.get_bool();
            if (bool_val.error() != simdjson::SUCCESS) {
                return simd_error(bool_val.error());
            }
            return nlohmann::json(bool_val.value());
        }
        case simdjson::ondemand::json_type::null: {
            auto is_null = doc.is_null();
            if ((is_null.error() != simdjson::SUCCESS) || (is_null.value() == false)) {
                return tl::unexpected(JsonParseError("Invalid literal"));
            }
            return nlohmann::json(nullptr);
        }
        default:
            break;
    }
    return tl::unexpected(JsonParseError("Unexpected top-level JSON type"));
}

FastJsonResult FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    auto type_result = value.type();
    if (type_result.error() != simdjson::SUCCESS) {
        return simd_error(type_result.error());
    }

    switch (type_result.value()) {
        case simdjson::ondemand::json_type::object: {
            auto obj = value.get_object();
            if (obj.error() != simdjson::SUCCESS) {
                return simd_error(obj.error());
            }
            return convert_object(obj.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::array: {
            auto arr = value.get_array();
            if (arr.error() != simdjson::SUCCESS) {
                return simd_error(arr.error());
            }
            return convert_array(arr.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::string: {
            auto str = value.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return simd_error(str.error());
            }
            return nlohmann::json(std::string(str.value()));
        }

        case simdjson::ondemand::json_type::number: {
            // int64 first, so ids like 7 stay integral
            auto int_val = value.get_int64();
            if (int_val.error() == simdjson::SUCCESS) {
                return nlohmann::json(int_val.value());
            }
            auto uint_val = value.get_uint64();
            if (uint_val.error() == simdjson::SUCCESS) {
                return nlohmann::json(uint_val.value());
            }
            auto double_val = value.get_double();
            if (double_val.error() == simdjson::SUCCESS) {
                return nlohmann::json(double_val.value());
            }
            return simd_error(double_val.error());
        }

        case simdjson::ondemand::json_type::boolean: {
            auto bool_val = value.get_bool();
            if (bool_val.error() != simdjson::SUCCESS) {
                return simd_error(bool_val.error());
            }
            return nlohmann::json(bool_val.value());
        }

        case simdjson::ondemand::json_type::null: {
            auto is_null = value.is_null();
            if ((is_null.error() != simdjson::SUCCESS) || (is_null.value() == false)) {
                return tl::unexpected(JsonParseError("Invalid literal"));
            }
            return nlohmann::json(nullptr);
        }
    }

    return tl::unexpected(JsonParseError("Unknown JSON type"));
}

FastJsonResult FastJsonParser::convert_object(simdjson::ondemand::object obj, std::size_t depth) {
    nlohmann::json result = nlohmann::json::object();

    for (auto field : obj) {
        if (field.error() != simdjson::SUCCESS) {
            return simd_error(field.error());
        }
        auto key_result = field.unescaped_key();
        if (key_result.error() != simdjson::SUCCESS) {
            return simd_error(key_result.error());
        }
        std::string key(key_result.value());

        auto val_result = field.value();
        if (val_result.error() != simdjson::SUCCESS) {
            return simd_error(val_result.error());
        }

        auto converted = convert(val_result.value(), depth);
        if (!converted) {
            return converted;
        }
        result[std::move(key)] = std::move(*converted);
    }

    return result;
}

FastJsonResult FastJsonParser::convert_array(simdjson::ondemand::array arr, std::size_t depth) {
    nlohmann::json result = nlohmann::json::array();

    for (auto element : arr) {
        if (element.error() != simdjson::SUCCESS) {
            return simd_error(element.error());
        }
        auto converted = convert(element.value(), depth);
        if (!converted) {
            return converted;
        }
        result.push_back(std::move(*converted));
    }

    return result;
}

FastJsonResult fast_parse(std::string_view json_str) {
    thread_local FastJsonParser parser;
    return parser.parse(json_str);
}

}  // namespace daxmcp
