#include "daxmcp/server/server_config.hpp"

#include <cstdlib>

namespace daxmcp {

namespace {

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

}  // namespace

std::string ServerConfig::validation_error() const {
    if (server_name.empty()) {
        return "Server name must not be empty";
    }
    if (max_line_length == 0) {
        return "Maximum line length must be positive";
    }
    if (logging.file.has_value() && logging.file->empty()) {
        return "Log file path must not be empty";
    }
    return formatter.validation_error();
}

tl::expected<ServerConfig, std::string> server_config_from_env() {
    auto formatter = formatter_config_from_env();
    if (!formatter) {
        return tl::unexpected(formatter.error());
    }

    ServerConfig config;
    config.formatter = std::move(*formatter);

    const std::string level = get_env("DAXMCP_LOG_LEVEL");
    if (level.empty() == false) {
        const auto parsed = log_level_from_string(level);
        if (parsed.has_value() == false) {
            return tl::unexpected("DAXMCP_LOG_LEVEL is not a log level: '" + level + "'");
        }
        config.logging.level = *parsed;
    }

    const std::string file = get_env("DAXMCP_LOG_FILE");
    if (file.empty() == false) {
        config.logging.file = file;
    }

    return config;
}

}  // namespace daxmcp
