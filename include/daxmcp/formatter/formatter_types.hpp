#pragma once

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace daxmcp {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Option enumerations
// ─────────────────────────────────────────────────────────────────────────────
// Wire values are the integers the DAX Formatter service expects. Zero is the
// service default in both enumerations.

enum class LineStyle {
    LongLine = 0,
    ShortLine = 1,
    VeryLongLine = 2
};

enum class SpacingStyle {
    BestPractice = 0,
    NoSpaceAfterFunction = 1   // "False" on the tool surface
};

[[nodiscard]] std::string_view to_string(LineStyle style) noexcept;
[[nodiscard]] std::string_view to_string(SpacingStyle style) noexcept;

/// Exact, case-sensitive match against the advertised names.
[[nodiscard]] std::optional<LineStyle> line_style_from_string(std::string_view name) noexcept;
[[nodiscard]] std::optional<SpacingStyle> spacing_style_from_string(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// FormattingOptions
// ─────────────────────────────────────────────────────────────────────────────
// Every field is independently optional. An unset field is not sent, so the
// service applies its own default.

struct FormattingOptions {
    std::optional<LineStyle> max_line_length;
    std::optional<SpacingStyle> skip_space_after_function_name;
    std::optional<std::string> list_separator;     // one UTF-8 character
    std::optional<std::string> decimal_separator;  // one UTF-8 character
    std::optional<std::string> database_name;
    std::optional<std::string> server_name;

    [[nodiscard]] bool empty() const noexcept {
        return !max_line_length && !skip_space_after_function_name &&
               !list_separator && !decimal_separator &&
               !database_name && !server_name;
    }

    FormattingOptions& with_max_line_length(LineStyle style) {
        max_line_length = style;
        return *this;
    }

    FormattingOptions& with_spacing(SpacingStyle style) {
        skip_space_after_function_name = style;
        return *this;
    }

    FormattingOptions& with_list_separator(std::string separator) {
        list_separator = std::move(separator);
        return *this;
    }

    FormattingOptions& with_decimal_separator(std::string separator) {
        decimal_separator = std::move(separator);
        return *this;
    }

    /// Adds the supplied options to a service request body.
    void write_wire(Json& body) const;

    friend bool operator==(const FormattingOptions&, const FormattingOptions&) = default;
};

/// First UTF-8 encoded character of `text` (empty for empty input).
[[nodiscard]] std::string first_character(std::string_view text);

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

struct CallerInfo {
    std::string app;
    std::string version;
};

struct FormatSingleRequest {
    std::string dax;
    FormattingOptions options;

    [[nodiscard]] Json to_wire(const CallerInfo& caller) const;
};

struct FormatMultipleRequest {
    std::vector<std::string> dax;
    FormattingOptions options;

    [[nodiscard]] Json to_wire(const CallerInfo& caller) const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────────────────────────────────────

struct DaxSyntaxError {
    int line{0};
    int column{0};
    std::string message;

    /// "(line L, column C) message"
    [[nodiscard]] std::string describe() const;
};

struct DaxFormatterResponse {
    std::string formatted;
    std::vector<DaxSyntaxError> errors;

    [[nodiscard]] bool has_errors() const noexcept { return errors.empty() == false; }

    /// All errors, separated by "; "
    [[nodiscard]] std::string error_summary() const;

    /// Service member names are matched case-insensitively.
    static tl::expected<DaxFormatterResponse, std::string> from_wire(const Json& j);
};

}  // namespace daxmcp
