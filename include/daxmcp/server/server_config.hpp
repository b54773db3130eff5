#pragma once

#include "daxmcp/formatter/formatter_client.hpp"
#include "daxmcp/log/logger.hpp"

#include <tl/expected.hpp>

#include <cstddef>
#include <optional>
#include <string>

namespace daxmcp {

// ═══════════════════════════════════════════════════════════════════════════
// ServerConfig
// ═══════════════════════════════════════════════════════════════════════════

struct LoggingConfig {
    LogLevel level{LogLevel::Info};
    /// Also (or, unless verbose, only) log to this file
    std::optional<std::string> file;
    bool verbose{false};
};

struct ServerConfig {
    std::string server_name = "dax-formatter-mcp";
    std::string server_version = "1.0.0";

    FormatterClientConfig formatter;

    /// Longest accepted input line, in bytes
    std::size_t max_line_length{1 << 20};

    LoggingConfig logging;

    ServerConfig& with_server_info(const std::string& name, const std::string& version) {
        server_name = name;
        server_version = version;
        return *this;
    }

    ServerConfig& with_formatter(FormatterClientConfig config) {
        formatter = std::move(config);
        return *this;
    }

    ServerConfig& with_max_line_length(std::size_t bytes) {
        max_line_length = bytes;
        return *this;
    }

    ServerConfig& with_log_level(LogLevel level) {
        logging.level = level;
        return *this;
    }

    ServerConfig& with_log_file(const std::string& path) {
        logging.file = path;
        return *this;
    }

    /// Empty when the configuration is usable.
    [[nodiscard]] std::string validation_error() const;
};

/// Defaults overlaid with DAXMCP_LOG_LEVEL, DAXMCP_LOG_FILE and the
/// formatter variables read by formatter_config_from_env().
[[nodiscard]] tl::expected<ServerConfig, std::string> server_config_from_env();

}  // namespace daxmcp
