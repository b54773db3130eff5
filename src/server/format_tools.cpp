#include "daxmcp/server/format_tools.hpp"

#include "daxmcp/log/logger.hpp"

#include <exception>

namespace daxmcp {

namespace {

constexpr std::string_view kFormatDaxName = "format_dax";
constexpr std::string_view kFormatDaxMultipleName = "format_dax_multiple";

Json options_schema() {
    return {
        {"type", "object"},
        {"description", "Optional formatting options"},
        {"properties", {
            {"maxLineLength", {
                {"type", "string"},
                {"description", "Maximum line length (ShortLine, LongLine, or VeryLongLine)"},
                {"enum", {"ShortLine", "LongLine", "VeryLongLine"}},
                {"default", "LongLine"}
            }},
            {"skipSpaceAfterFunctionName", {
                {"type", "string"},
                {"description", "Spacing after function names (BestPractice or False)"},
                {"enum", {"BestPractice", "False"}},
                {"default", "BestPractice"}
            }},
            {"listSeparator", {
                {"type", "string"},
                {"description", "List separator character"},
                {"default", ","}
            }},
            {"decimalSeparator", {
                {"type", "string"},
                {"description", "Decimal separator character"},
                {"default", "."}
            }},
            {"databaseName", {
                {"type", "string"},
                {"description", "Database name for context"}
            }},
            {"serverName", {
                {"type", "string"},
                {"description", "Server name for context"}
            }}
        }}
    };
}

// Absent, null and "" all mean "not supplied"
McpResult<std::optional<std::string>> optional_string(const Json& options, const char* key) {
    const auto it = options.find(key);
    if ((it == options.end()) || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (it->is_string() == false) {
        return tl::unexpected(McpError::invalid_params(
            std::string("Invalid options: ") + key + " must be a string"));
    }
    auto value = it->get<std::string>();
    if (value.empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{std::move(value)};
}

std::string batch_header(std::size_t count, bool fallback) {
    std::string header = "Formatted " + std::to_string(count) + " DAX expressions";
    if (fallback) {
        header += " (fallback mode)";
    }
    return header + ":\n\n";
}

std::string join_blocks(const std::vector<std::string>& blocks) {
    std::string joined;
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) {
            joined += "\n\n";
        }
        joined += blocks[i];
    }
    return joined;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Tool identity and descriptors
// ─────────────────────────────────────────────────────────────────────────────

std::string_view tool_name(ToolKind kind) noexcept {
    switch (kind) {
        case ToolKind::FormatDax:         return kFormatDaxName;
        case ToolKind::FormatDaxMultiple: return kFormatDaxMultipleName;
    }
    return kFormatDaxName;
}

std::optional<ToolKind> tool_from_name(std::string_view name) noexcept {
    if (name == kFormatDaxName) return ToolKind::FormatDax;
    if (name == kFormatDaxMultipleName) return ToolKind::FormatDaxMultiple;
    return std::nullopt;
}

std::vector<Tool> format_tool_descriptors() {
    Tool single;
    single.name = std::string(kFormatDaxName);
    single.description = "Format a single DAX expression according to SQL BI formatting standards";
    single.input_schema = {
        {"type", "object"},
        {"properties", {
            {"dax", {
                {"type", "string"},
                {"description", "The DAX expression to format"}
            }},
            {"options", options_schema()}
        }},
        {"required", Json::array({"dax"})}
    };

    Tool multiple;
    multiple.name = std::string(kFormatDaxMultipleName);
    multiple.description = "Format multiple DAX expressions in a single request";
    multiple.input_schema = {
        {"type", "object"},
        {"properties", {
            {"expressions", {
                {"type", "array"},
                {"description", "Array of DAX expressions to format"},
                {"items", {{"type", "string"}}},
                {"minItems", 1}
            }},
            {"options", options_schema()}
        }},
        {"required", Json::array({"expressions"})}
    };

    return {std::move(single), std::move(multiple)};
}

// ─────────────────────────────────────────────────────────────────────────────
// Argument decoding
// ─────────────────────────────────────────────────────────────────────────────

McpResult<std::optional<FormattingOptions>> decode_options(const Json& arguments) {
    const auto it = arguments.find("options");
    if ((it == arguments.end()) || it->is_null()) {
        return std::optional<FormattingOptions>{};
    }
    if (it->is_object() == false) {
        return tl::unexpected(McpError::invalid_params("Invalid options: expected an object"));
    }
    const Json& raw = *it;

    FormattingOptions options;

    auto line_length = optional_string(raw, "maxLineLength");
    if (!line_length) return tl::unexpected(line_length.error());
    if (line_length->has_value()) {
        options.max_line_length = line_style_from_string(**line_length);
        if (options.max_line_length.has_value() == false) {
            get_logger().warn_fmt("Ignoring unknown maxLineLength '{}'", **line_length);
        }
    }

    auto spacing = optional_string(raw, "skipSpaceAfterFunctionName");
    if (!spacing) return tl::unexpected(spacing.error());
    if (spacing->has_value()) {
        options.skip_space_after_function_name = spacing_style_from_string(**spacing);
        if (options.skip_space_after_function_name.has_value() == false) {
            get_logger().warn_fmt("Ignoring unknown skipSpaceAfterFunctionName '{}'", **spacing);
        }
    }

    auto list_separator = optional_string(raw, "listSeparator");
    if (!list_separator) return tl::unexpected(list_separator.error());
    if (list_separator->has_value()) {
        options.list_separator = first_character(**list_separator);
    }

    auto decimal_separator = optional_string(raw, "decimalSeparator");
    if (!decimal_separator) return tl::unexpected(decimal_separator.error());
    if (decimal_separator->has_value()) {
        options.decimal_separator = first_character(**decimal_separator);
    }

    auto database_name = optional_string(raw, "databaseName");
    if (!database_name) return tl::unexpected(database_name.error());
    options.database_name = std::move(*database_name);

    auto server_name = optional_string(raw, "serverName");
    if (!server_name) return tl::unexpected(server_name.error());
    options.server_name = std::move(*server_name);

    return std::optional<FormattingOptions>{std::move(options)};
}

McpResult<FormatDaxArgs> FormatDaxArgs::from_json(const Json& arguments) {
    const auto dax_it = arguments.find("dax");
    const bool usable = (dax_it != arguments.end()) &&
                        dax_it->is_string() &&
                        (dax_it->get_ref<const std::string&>().empty() == false);
    if (usable == false) {
        return tl::unexpected(McpError::invalid_params("Invalid DAX expression provided"));
    }

    auto options = decode_options(arguments);
    if (!options) {
        return tl::unexpected(options.error());
    }
    return FormatDaxArgs{dax_it->get<std::string>(), std::move(*options)};
}

McpResult<FormatDaxMultipleArgs> FormatDaxMultipleArgs::from_json(const Json& arguments) {
    const auto invalid = [] {
        return tl::unexpected(McpError::invalid_params("Invalid expressions provided"));
    };

    const auto list_it = arguments.find("expressions");
    if ((list_it == arguments.end()) || (list_it->is_array() == false) || list_it->empty()) {
        return invalid();
    }

    FormatDaxMultipleArgs args;
    args.expressions.reserve(list_it->size());
    for (const auto& item : *list_it) {
        if (item.is_string() == false) {
            return invalid();
        }
        args.expressions.push_back(item.get<std::string>());
    }

    auto options = decode_options(arguments);
    if (!options) {
        return tl::unexpected(options.error());
    }
    args.options = std::move(*options);
    return args;
}

// ─────────────────────────────────────────────────────────────────────────────
// Rendering
// ─────────────────────────────────────────────────────────────────────────────

std::string render_formatted(std::string_view formatted) {
    return "Formatted DAX:\n\n```dax\n" + std::string(formatted) + "\n```";
}

std::string render_block(std::size_t position, std::string_view formatted) {
    return "**Expression " + std::to_string(position) + ":**\n```dax\n" +
           std::string(formatted) + "\n```";
}

std::string render_error_block(std::size_t position, std::string_view message) {
    return "**Expression " + std::to_string(position) + " (Error):**\n```\nError: " +
           std::string(message) + "\n```";
}

// ─────────────────────────────────────────────────────────────────────────────
// FormatTools
// ─────────────────────────────────────────────────────────────────────────────

FormatTools::FormatTools(IFormatterClient& client)
    : client_(client)
{}

McpResult<CallToolResult> FormatTools::call(ToolKind kind, const Json& arguments) {
    switch (kind) {
        case ToolKind::FormatDax:         return format_dax(arguments);
        case ToolKind::FormatDaxMultiple: return format_dax_multiple(arguments);
    }
    return tl::unexpected(McpError::internal_error("Unhandled tool"));
}

FormatterResult<DaxFormatterResponse> FormatTools::format_one(
    const std::string& dax,
    const std::optional<FormattingOptions>& options
) {
    if (options.has_value()) {
        return client_.format(FormatSingleRequest{dax, *options});
    }
    return client_.format(dax);
}

McpResult<CallToolResult> FormatTools::format_dax(const Json& arguments) {
    auto args = FormatDaxArgs::from_json(arguments);
    if (!args) {
        return tl::unexpected(args.error());
    }

    try {
        auto formatted = format_one(args->dax, args->options);
        if (!formatted) {
            get_logger().debug_fmt("format_dax failed: {} ({})",
                formatted.error().message, to_string(formatted.error().code));
            return tl::unexpected(McpError::internal_error(
                "Error formatting DAX: " + formatted.error().message));
        }
        return CallToolResult::text(render_formatted(formatted->formatted));
    } catch (const std::exception& e) {
        get_logger().error_fmt("format_dax threw: {}", e.what());
        return tl::unexpected(McpError::internal_error(
            std::string("Error formatting DAX: ") + e.what()));
    }
}

McpResult<CallToolResult> FormatTools::format_dax_multiple(const Json& arguments) {
    auto args = FormatDaxMultipleArgs::from_json(arguments);
    if (!args) {
        return tl::unexpected(args.error());
    }

    if (auto batch = try_batch(*args)) {
        return std::move(*batch);
    }
    return format_sequentially(*args);
}

std::optional<CallToolResult> FormatTools::try_batch(const FormatDaxMultipleArgs& args) {
    FormatterResult<std::vector<DaxFormatterResponse>> responses =
        tl::unexpected(FormatterError::invalid_request("batch call not attempted"));
    try {
        responses = client_.format(FormatMultipleRequest{
            args.expressions,
            args.options.value_or(FormattingOptions{})
        });
    } catch (const std::exception& e) {
        get_logger().warn_fmt("Batch formatting threw, falling back to individual formatting: {}", e.what());
        return std::nullopt;
    }

    if (!responses) {
        get_logger().warn_fmt("Batch formatting failed, falling back to individual formatting: {}",
                              responses.error().message);
        return std::nullopt;
    }
    if (responses->size() != args.expressions.size()) {
        get_logger().warn_fmt("Batch formatting returned {} results for {} expressions, "
                              "falling back to individual formatting",
                              responses->size(), args.expressions.size());
        return std::nullopt;
    }

    std::vector<std::string> blocks;
    blocks.reserve(responses->size());
    for (std::size_t i = 0; i < responses->size(); ++i) {
        const auto& item = (*responses)[i];
        if (item.has_errors()) {
            blocks.push_back(render_error_block(
                i + 1, FormatterError::syntax_error(item.error_summary()).message));
        } else {
            blocks.push_back(render_block(i + 1, item.formatted));
        }
    }
    return CallToolResult::text(batch_header(responses->size(), false) + join_blocks(blocks));
}

McpResult<CallToolResult> FormatTools::format_sequentially(const FormatDaxMultipleArgs& args) {
    try {
        std::vector<std::string> blocks;
        blocks.reserve(args.expressions.size());

        std::size_t failures = 0;
        for (std::size_t i = 0; i < args.expressions.size(); ++i) {
            const std::size_t position = i + 1;
            std::string message;
            try {
                auto formatted = format_one(args.expressions[i], args.options);
                if (formatted) {
                    blocks.push_back(render_block(position, formatted->formatted));
                    continue;
                }
                message = formatted.error().message;
            } catch (const std::exception& e) {
                message = e.what();
            }
            ++failures;
            get_logger().debug_fmt("Expression {} failed in fallback mode: {}", position, message);
            blocks.push_back(render_error_block(position, message));
        }

        get_logger().info_fmt("Fallback formatting finished: {} of {} expressions failed",
                              failures, args.expressions.size());
        return CallToolResult::text(batch_header(args.expressions.size(), true) + join_blocks(blocks));
    } catch (const std::exception& e) {
        get_logger().error_fmt("Fallback formatting aborted: {}", e.what());
        return tl::unexpected(McpError::internal_error(
            std::string("Error formatting multiple DAX expressions: ") + e.what()));
    }
}

}  // namespace daxmcp
