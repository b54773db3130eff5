#include "daxmcp/formatter/formatter_types.hpp"

#include "daxmcp/transport/http_types.hpp"

#include <algorithm>

namespace daxmcp {

namespace {

const Json* find_member(const Json& object, std::string_view name) {
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (iequals(it.key(), name)) {
            return &it.value();
        }
    }
    return nullptr;
}

tl::expected<DaxSyntaxError, std::string> syntax_error_from_wire(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(std::string("error entry is not an object"));
    }

    DaxSyntaxError error;
    if (const Json* line = find_member(j, "line"); (line != nullptr) && line->is_number_integer()) {
        error.line = line->get<int>();
    }
    if (const Json* column = find_member(j, "column"); (column != nullptr) && column->is_number_integer()) {
        error.column = column->get<int>();
    }
    if (const Json* message = find_member(j, "message"); (message != nullptr) && message->is_string()) {
        error.message = message->get<std::string>();
    }
    return error;
}

void write_caller(Json& body, const CallerInfo& caller) {
    if (caller.app.empty() == false) {
        body["CallerApp"] = caller.app;
    }
    if (caller.version.empty() == false) {
        body["CallerVersion"] = caller.version;
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Enumerations
// ─────────────────────────────────────────────────────────────────────────────

std::string_view to_string(LineStyle style) noexcept {
    switch (style) {
        case LineStyle::ShortLine:    return "ShortLine";
        case LineStyle::LongLine:     return "LongLine";
        case LineStyle::VeryLongLine: return "VeryLongLine";
    }
    return "LongLine";
}

std::string_view to_string(SpacingStyle style) noexcept {
    switch (style) {
        case SpacingStyle::BestPractice:         return "BestPractice";
        case SpacingStyle::NoSpaceAfterFunction: return "False";
    }
    return "BestPractice";
}

std::optional<LineStyle> line_style_from_string(std::string_view name) noexcept {
    if (name == "ShortLine") return LineStyle::ShortLine;
    if (name == "LongLine") return LineStyle::LongLine;
    if (name == "VeryLongLine") return LineStyle::VeryLongLine;
    return std::nullopt;
}

std::optional<SpacingStyle> spacing_style_from_string(std::string_view name) noexcept {
    if (name == "BestPractice") return SpacingStyle::BestPractice;
    if (name == "False") return SpacingStyle::NoSpaceAfterFunction;
    return std::nullopt;
}

std::string first_character(std::string_view text) {
    if (text.empty()) {
        return {};
    }
    const auto lead = static_cast<unsigned char>(text.front());
    std::size_t length = 1;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
    }
    return std::string(text.substr(0, std::min(length, text.size())));
}

// ─────────────────────────────────────────────────────────────────────────────
// Wire encoding
// ─────────────────────────────────────────────────────────────────────────────
// "MaxLineLenght" is the service's own spelling.

void FormattingOptions::write_wire(Json& body) const {
    if (max_line_length) {
        body["MaxLineLenght"] = static_cast<int>(*max_line_length);
    }
    if (skip_space_after_function_name) {
        body["SkipSpaceAfterFunctionName"] = static_cast<int>(*skip_space_after_function_name);
    }
    if (list_separator) {
        body["ListSeparator"] = *list_separator;
    }
    if (decimal_separator) {
        body["DecimalSeparator"] = *decimal_separator;
    }
    if (database_name) {
        body["DatabaseName"] = *database_name;
    }
    if (server_name) {
        body["ServerName"] = *server_name;
    }
}

Json FormatSingleRequest::to_wire(const CallerInfo& caller) const {
    Json body = {{"Dax", dax}};
    options.write_wire(body);
    write_caller(body, caller);
    return body;
}

Json FormatMultipleRequest::to_wire(const CallerInfo& caller) const {
    Json body = {{"Dax", dax}};
    options.write_wire(body);
    write_caller(body, caller);
    return body;
}

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

std::string DaxSyntaxError::describe() const {
    return "(line " + std::to_string(line) + ", column " + std::to_string(column) + ") " + message;
}

std::string DaxFormatterResponse::error_summary() const {
    std::string summary;
    for (const auto& error : errors) {
        if (summary.empty() == false) {
            summary += "; ";
        }
        summary += error.describe();
    }
    return summary;
}

tl::expected<DaxFormatterResponse, std::string> DaxFormatterResponse::from_wire(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(std::string("formatter reply is not an object"));
    }

    DaxFormatterResponse response;

    const Json* formatted = find_member(j, "formatted");
    if ((formatted != nullptr) && (formatted->is_null() == false)) {
        if (formatted->is_string() == false) {
            return tl::unexpected(std::string("formatted must be a string"));
        }
        response.formatted = formatted->get<std::string>();
    }

    const Json* errors = find_member(j, "errors");
    if ((errors != nullptr) && (errors->is_null() == false)) {
        if (errors->is_array() == false) {
            return tl::unexpected(std::string("errors must be an array"));
        }
        for (const auto& entry : *errors) {
            auto parsed = syntax_error_from_wire(entry);
            if (!parsed) {
                return tl::unexpected(parsed.error());
            }
            response.errors.push_back(std::move(*parsed));
        }
    }

    return response;
}

}  // namespace daxmcp
