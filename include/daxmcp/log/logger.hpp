#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace daxmcp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as accepted on the command line ("debug", "WARN", ...).
/// "warning" is accepted as an alias of "warn".
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────
// Every backend writes to the diagnostic side channel (stderr or a file).
// stdout carries protocol traffic only and is never touched from here.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        emit(LogLevel::Fatal, msg, loc);
    }

    // std::format helpers; arguments are only formatted when the level is enabled
    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        emit_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

private:
    void emit(LogLevel level, std::string_view msg, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    template<typename... Args>
    void emit_fmt(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(LogRecord(level, std::format(fmt, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards everything (the default)
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

/// Global logger (a NullLogger until set_logger() is called).
[[nodiscard]] ILogger& get_logger() noexcept;

/// Replace the global logger; nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define DAXMCP_LOG_TRACE(msg) \
    do { if (::daxmcp::get_logger().should_log(::daxmcp::LogLevel::Trace)) \
         ::daxmcp::get_logger().trace(msg); } while(false)

#define DAXMCP_LOG_DEBUG(msg) \
    do { if (::daxmcp::get_logger().should_log(::daxmcp::LogLevel::Debug)) \
         ::daxmcp::get_logger().debug(msg); } while(false)

#define DAXMCP_LOG_INFO(msg) \
    do { if (::daxmcp::get_logger().should_log(::daxmcp::LogLevel::Info)) \
         ::daxmcp::get_logger().info(msg); } while(false)

#define DAXMCP_LOG_WARN(msg) \
    do { if (::daxmcp::get_logger().should_log(::daxmcp::LogLevel::Warn)) \
         ::daxmcp::get_logger().warn(msg); } while(false)

#define DAXMCP_LOG_ERROR(msg) \
    do { if (::daxmcp::get_logger().should_log(::daxmcp::LogLevel::Error)) \
         ::daxmcp::get_logger().error(msg); } while(false)

#define DAXMCP_LOG_FATAL(msg) \
    do { if (::daxmcp::get_logger().should_log(::daxmcp::LogLevel::Fatal)) \
         ::daxmcp::get_logger().fatal(msg); } while(false)

}  // namespace daxmcp
