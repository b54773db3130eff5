// ─────────────────────────────────────────────────────────────────────────────
// dax-formatter-mcp - DAX formatting over the Model Context Protocol
// ─────────────────────────────────────────────────────────────────────────────
// Speaks newline-delimited JSON-RPC on stdin/stdout and forwards formatting
// requests to the DAX Formatter web service. Diagnostics go to stderr or a
// log file, never to stdout.
//
// Usage:
//   dax-formatter-mcp
//   dax-formatter-mcp --log-level debug --log-file /tmp/dax-mcp.log
//   dax-formatter-mcp --url http://localhost:8080 --read-timeout 5000
//
// Environment:
//   DAX_FORMATTER_URL, DAX_FORMATTER_TIMEOUT_MS, DAXMCP_LOG_LEVEL, DAXMCP_LOG_FILE
//   (command-line flags take precedence)

#include <cxxopts.hpp>

#include "daxmcp/formatter/formatter_client.hpp"
#include "daxmcp/log/spdlog_logger.hpp"
#include "daxmcp/server/mcp_server.hpp"
#include "daxmcp/server/server_config.hpp"
#include "daxmcp/transport/stdio_transport.hpp"

#include <asio/co_spawn.hpp>
#include <asio/use_future.hpp>

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

using namespace daxmcp;

namespace {

void print_error(const std::string& msg) {
    std::cerr << "Error: " << msg << "\n";
}

std::unique_ptr<ILogger> make_logger(const LoggingConfig& logging) {
    const LogLevel level = logging.verbose ? LogLevel::Debug : logging.level;
    if (logging.file.has_value() == false) {
        return make_spdlog_stderr_logger(level);
    }
    if (logging.verbose) {
        return make_spdlog_stderr_file_logger(*logging.file, level);
    }
    return make_spdlog_file_logger(*logging.file, level);
}

// Flags override whatever the environment supplied
std::string apply_flags(const cxxopts::ParseResult& result, ServerConfig& config) {
    if (result.count("url")) {
        config.formatter.with_base_url(result["url"].as<std::string>());
    }
    if (result.count("connect-timeout")) {
        config.formatter.with_connect_timeout(
            std::chrono::milliseconds{result["connect-timeout"].as<long>()});
    }
    if (result.count("read-timeout")) {
        config.formatter.with_read_timeout(
            std::chrono::milliseconds{result["read-timeout"].as<long>()});
    }
    if (result.count("max-retries")) {
        const int retries = result["max-retries"].as<int>();
        if (retries < 0) {
            return "--max-retries must not be negative";
        }
        config.formatter.with_max_retries(static_cast<std::size_t>(retries));
    }
    if (result.count("no-circuit-breaker")) {
        config.formatter.with_circuit_breaker(false);
    }
    if (result.count("log-level")) {
        const auto name = result["log-level"].as<std::string>();
        const auto level = log_level_from_string(name);
        if (level.has_value() == false) {
            return "--log-level is not a log level: '" + name + "'";
        }
        config.with_log_level(*level);
    }
    if (result.count("log-file")) {
        config.with_log_file(result["log-file"].as<std::string>());
    }
    config.logging.verbose = result.count("verbose") > 0;
    return "";
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("dax-formatter-mcp", "DAX formatter MCP server (stdio)");

    options.add_options()
        // Formatter service
        ("u,url", "DAX Formatter base URL (or DAX_FORMATTER_URL)", cxxopts::value<std::string>())
        ("connect-timeout", "Connect timeout in milliseconds", cxxopts::value<long>())
        ("read-timeout", "Read timeout in milliseconds (or DAX_FORMATTER_TIMEOUT_MS)", cxxopts::value<long>())
        ("max-retries", "Retries after a failed request", cxxopts::value<int>())
        ("no-circuit-breaker", "Call the service even after repeated failures")

        // Diagnostics
        ("log-level", "trace, debug, info, warn, error or fatal (or DAXMCP_LOG_LEVEL)", cxxopts::value<std::string>())
        ("log-file", "Write logs to this file instead of stderr (or DAXMCP_LOG_FILE)", cxxopts::value<std::string>())
        ("v,verbose", "Debug logging, to stderr as well as any log file")

        ("version", "Print version")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        auto config = server_config_from_env();
        if (!config) {
            print_error(config.error());
            return 1;
        }

        if (result.count("version")) {
            std::cout << config->server_name << " " << config->server_version << "\n";
            return 0;
        }

        const std::string flag_error = apply_flags(result, *config);
        if (flag_error.empty() == false) {
            print_error(flag_error);
            return 1;
        }

        const std::string invalid = config->validation_error();
        if (invalid.empty() == false) {
            print_error(invalid);
            return 1;
        }

        set_logger(make_logger(config->logging));

        config->formatter.with_caller(config->server_name, config->server_version);
        DaxFormatterClient formatter(config->formatter);

        StdioTransport transport(StdioTransportConfig{
            &std::cin,
            &std::cout,
            true,
            config->max_line_length
        });
        McpServer server(*config, formatter);

        transport.start();
        try {
            asio::co_spawn(transport.executor(), server.run(transport), asio::use_future).get();
        } catch (const std::exception& e) {
            DAXMCP_LOG_FATAL(std::string("Protocol loop failed: ") + e.what());
            if (transport.reader_finished() == false) {
                // The reader is parked in std::cin and would never be joined
                std::cout.flush();
                std::_Exit(1);
            }
            transport.stop();
            return 1;
        }
        transport.stop();
        return 0;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::exception& e) {
        print_error(e.what());
        return 1;
    }
}
