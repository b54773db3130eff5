#pragma once

#include "daxmcp/formatter/formatter_client.hpp"
#include "daxmcp/formatter/formatter_types.hpp"
#include "daxmcp/protocol/mcp_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace daxmcp {

// ═══════════════════════════════════════════════════════════════════════════
// Tool identity
// ═══════════════════════════════════════════════════════════════════════════

enum class ToolKind {
    FormatDax,
    FormatDaxMultiple
};

[[nodiscard]] std::string_view tool_name(ToolKind kind) noexcept;
[[nodiscard]] std::optional<ToolKind> tool_from_name(std::string_view name) noexcept;

/// Descriptors advertised by tools/list, single-expression tool first.
[[nodiscard]] std::vector<Tool> format_tool_descriptors();

// ═══════════════════════════════════════════════════════════════════════════
// Typed arguments
// ═══════════════════════════════════════════════════════════════════════════
// Decoded from the weakly typed "arguments" object. A decode failure is an
// invalid-params error carrying the message sent back to the caller.

/// Reads arguments["options"]. Absent or null gives nullopt; an object (even
/// empty) gives a bundle. Unknown enumeration values are dropped with a warning.
[[nodiscard]] McpResult<std::optional<FormattingOptions>> decode_options(const Json& arguments);

struct FormatDaxArgs {
    std::string dax;
    std::optional<FormattingOptions> options;

    static McpResult<FormatDaxArgs> from_json(const Json& arguments);
};

struct FormatDaxMultipleArgs {
    std::vector<std::string> expressions;
    std::optional<FormattingOptions> options;

    static McpResult<FormatDaxMultipleArgs> from_json(const Json& arguments);
};

// ═══════════════════════════════════════════════════════════════════════════
// Result text
// ═══════════════════════════════════════════════════════════════════════════
// Positions are 1-based.

[[nodiscard]] std::string render_formatted(std::string_view formatted);
[[nodiscard]] std::string render_block(std::size_t position, std::string_view formatted);
[[nodiscard]] std::string render_error_block(std::size_t position, std::string_view message);

// ═══════════════════════════════════════════════════════════════════════════
// FormatTools
// ═══════════════════════════════════════════════════════════════════════════
// format_dax:          one collaborator call, failures become -32603.
// format_dax_multiple: one batch call; if it fails or returns the wrong
//                      number of results, one call per expression in order,
//                      each failure confined to its own block.

class FormatTools {
public:
    explicit FormatTools(IFormatterClient& client);

    [[nodiscard]] McpResult<CallToolResult> call(ToolKind kind, const Json& arguments);

    [[nodiscard]] McpResult<CallToolResult> format_dax(const Json& arguments);
    [[nodiscard]] McpResult<CallToolResult> format_dax_multiple(const Json& arguments);

private:
    [[nodiscard]] FormatterResult<DaxFormatterResponse> format_one(
        const std::string& dax, const std::optional<FormattingOptions>& options);

    // nullopt when the batch call failed; the reason is logged
    [[nodiscard]] std::optional<CallToolResult> try_batch(const FormatDaxMultipleArgs& args);
    [[nodiscard]] McpResult<CallToolResult> format_sequentially(const FormatDaxMultipleArgs& args);

    IFormatterClient& client_;
};

}  // namespace daxmcp
