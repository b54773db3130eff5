#ifndef DAXMCP_TESTS_MOCKS_CAPTURE_LOGGER_HPP
#define DAXMCP_TESTS_MOCKS_CAPTURE_LOGGER_HPP

#include "daxmcp/log/logger.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

namespace daxmcp::testing {

// ─────────────────────────────────────────────────────────────────────────────
// CaptureLogger - Keeps every record at or above the minimum level
// ─────────────────────────────────────────────────────────────────────────────

class CaptureLogger final : public ILogger {
public:
    explicit CaptureLogger(LogLevel min_level = LogLevel::Trace)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(record);
    }

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    [[nodiscard]] std::vector<LogRecord> records() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

    [[nodiscard]] bool contains(LogLevel level, std::string_view fragment) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& record : records_) {
            if ((record.level == level) && (record.message.find(fragment) != std::string::npos)) {
                return true;
            }
        }
        return false;
    }

private:
    LogLevel min_level_;
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

// Installs a CaptureLogger as the global logger for the enclosing scope
class ScopedCaptureLogger {
public:
    explicit ScopedCaptureLogger(LogLevel min_level = LogLevel::Trace) {
        auto logger = std::make_unique<CaptureLogger>(min_level);
        logger_ = logger.get();
        set_logger(std::move(logger));
    }

    ~ScopedCaptureLogger() { set_logger(nullptr); }

    ScopedCaptureLogger(const ScopedCaptureLogger&) = delete;
    ScopedCaptureLogger& operator=(const ScopedCaptureLogger&) = delete;

    CaptureLogger& operator*() const noexcept { return *logger_; }
    CaptureLogger* operator->() const noexcept { return logger_; }

private:
    CaptureLogger* logger_{nullptr};
};

}  // namespace daxmcp::testing

#endif  // DAXMCP_TESTS_MOCKS_CAPTURE_LOGGER_HPP
