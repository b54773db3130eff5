#include <catch2/catch_test_macros.hpp>

#include "daxmcp/server/server_config.hpp"

#include <cstdlib>

using namespace daxmcp;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
};

void clear_environment() {
    for (const char* name : {"DAXMCP_LOG_LEVEL", "DAXMCP_LOG_FILE",
                             "DAX_FORMATTER_URL", "DAX_FORMATTER_TIMEOUT_MS"}) {
        ::unsetenv(name);
    }
}

}  // namespace

TEST_CASE("Default server config is valid", "[config]") {
    ServerConfig config;

    REQUIRE(config.validation_error().empty());
    REQUIRE(config.server_name == "dax-formatter-mcp");
    REQUIRE(config.server_version == "1.0.0");
    REQUIRE(config.logging.level == LogLevel::Info);
    REQUIRE(config.logging.file.has_value() == false);
    REQUIRE(config.formatter.base_url == "https://www.daxformatter.com");
}

TEST_CASE("Builders chain", "[config]") {
    ServerConfig config;
    config.with_server_info("gateway", "2.0.0")
          .with_max_line_length(4096)
          .with_log_level(LogLevel::Debug)
          .with_log_file("/tmp/daxmcp.log");

    REQUIRE(config.server_name == "gateway");
    REQUIRE(config.max_line_length == 4096);
    REQUIRE(config.logging.level == LogLevel::Debug);
    REQUIRE(config.logging.file == "/tmp/daxmcp.log");
    REQUIRE(config.validation_error().empty());
}

TEST_CASE("Invalid server settings are reported", "[config]") {
    SECTION("empty name") {
        ServerConfig config;
        config.with_server_info("", "1.0.0");
        REQUIRE(config.validation_error() == "Server name must not be empty");
    }

    SECTION("zero line length") {
        ServerConfig config;
        config.with_max_line_length(0);
        REQUIRE(config.validation_error() == "Maximum line length must be positive");
    }

    SECTION("empty log file") {
        ServerConfig config;
        config.with_log_file("");
        REQUIRE(config.validation_error() == "Log file path must not be empty");
    }

    SECTION("formatter errors surface") {
        ServerConfig config;
        FormatterClientConfig formatter;
        formatter.with_connect_timeout(std::chrono::milliseconds{0});
        config.with_formatter(formatter);
        REQUIRE(config.validation_error() == "Connect timeout must be positive");
    }
}

TEST_CASE("Environment supplies logging settings", "[config][env]") {
    clear_environment();

    SECTION("nothing set") {
        auto config = server_config_from_env();
        REQUIRE(config.has_value());
        REQUIRE(config->logging.level == LogLevel::Info);
        REQUIRE(config->logging.file.has_value() == false);
    }

    SECTION("level and file") {
        ScopedEnv level("DAXMCP_LOG_LEVEL", "warning");
        ScopedEnv file("DAXMCP_LOG_FILE", "/var/log/daxmcp.log");

        auto config = server_config_from_env();
        REQUIRE(config.has_value());
        REQUIRE(config->logging.level == LogLevel::Warn);
        REQUIRE(config->logging.file == "/var/log/daxmcp.log");
    }

    SECTION("unknown level") {
        ScopedEnv level("DAXMCP_LOG_LEVEL", "chatty");

        auto config = server_config_from_env();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error() == "DAXMCP_LOG_LEVEL is not a log level: 'chatty'");
    }

    SECTION("formatter variables are included") {
        ScopedEnv url("DAX_FORMATTER_URL", "http://localhost:5000");

        auto config = server_config_from_env();
        REQUIRE(config.has_value());
        REQUIRE(config->formatter.base_url == "http://localhost:5000");
    }

    SECTION("formatter errors propagate") {
        ScopedEnv timeout("DAX_FORMATTER_TIMEOUT_MS", "-5");

        auto config = server_config_from_env();
        REQUIRE_FALSE(config.has_value());
        REQUIRE(config.error().find("DAX_FORMATTER_TIMEOUT_MS") != std::string::npos);
    }
}
