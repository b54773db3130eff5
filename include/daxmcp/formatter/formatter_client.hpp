#pragma once

#include "daxmcp/formatter/formatter_error.hpp"
#include "daxmcp/formatter/formatter_types.hpp"
#include "daxmcp/resilience/circuit_breaker.hpp"
#include "daxmcp/transport/backoff_policy.hpp"
#include "daxmcp/transport/http_client.hpp"
#include "daxmcp/transport/retry_policy.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace daxmcp {

// ═══════════════════════════════════════════════════════════════════════════
// IFormatterClient
// ═══════════════════════════════════════════════════════════════════════════
// The gateway's only view of the formatting service. Calls are issued one at
// a time from the protocol loop.

class IFormatterClient {
public:
    virtual ~IFormatterClient() = default;

    /// Expression only; every setting left at the service default.
    [[nodiscard]] virtual FormatterResult<DaxFormatterResponse> format(const std::string& dax) = 0;

    [[nodiscard]] virtual FormatterResult<DaxFormatterResponse> format(
        const FormatSingleRequest& request) = 0;

    /// One response per expression, in request order. Per-item syntax errors
    /// are reported inside the responses, not as a failure of the call.
    [[nodiscard]] virtual FormatterResult<std::vector<DaxFormatterResponse>> format(
        const FormatMultipleRequest& request) = 0;
};

// ═══════════════════════════════════════════════════════════════════════════
// FormatterClientConfig
// ═══════════════════════════════════════════════════════════════════════════

struct FormatterClientConfig {
    std::string base_url = "https://www.daxformatter.com";

    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds read_timeout{30000};

    /// Retries after the initial request
    std::size_t max_retries{2};

    bool enable_circuit_breaker{true};
    CircuitBreakerConfig circuit_breaker;

    /// Reported to the service as CallerApp / CallerVersion
    std::string caller_app = "dax-formatter-mcp";
    std::string caller_version = "1.0.0";

    bool verify_ssl{true};

    /// Optional overrides (tests inject NoBackoff here)
    std::shared_ptr<IBackoffPolicy> backoff_policy;
    std::shared_ptr<RetryPolicy> retry_policy;

    FormatterClientConfig& with_base_url(const std::string& url) {
        base_url = url;
        return *this;
    }

    FormatterClientConfig& with_connect_timeout(std::chrono::milliseconds timeout) {
        connect_timeout = timeout;
        return *this;
    }

    FormatterClientConfig& with_read_timeout(std::chrono::milliseconds timeout) {
        read_timeout = timeout;
        return *this;
    }

    FormatterClientConfig& with_max_retries(std::size_t retries) {
        max_retries = retries;
        return *this;
    }

    FormatterClientConfig& with_circuit_breaker(bool enabled) {
        enable_circuit_breaker = enabled;
        return *this;
    }

    FormatterClientConfig& with_caller(const std::string& app, const std::string& version) {
        caller_app = app;
        caller_version = version;
        return *this;
    }

    FormatterClientConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
        backoff_policy = std::move(policy);
        return *this;
    }

    FormatterClientConfig& with_retry_policy(std::shared_ptr<RetryPolicy> policy) {
        retry_policy = std::move(policy);
        return *this;
    }

    /// Empty when the configuration is usable.
    [[nodiscard]] std::string validation_error() const;
};

// ═══════════════════════════════════════════════════════════════════════════
// DaxFormatterClient
// ═══════════════════════════════════════════════════════════════════════════
// JSON over HTTPS to the public DAX Formatter API.
//
//   POST /api/daxformatter/DaxTextFormat       single expression
//   POST /api/daxformatter/DaxTextFormatMulti  ordered list of expressions

class DaxFormatterClient final : public IFormatterClient {
public:
    static constexpr const char* kSinglePath = "/api/daxformatter/DaxTextFormat";
    static constexpr const char* kMultiplePath = "/api/daxformatter/DaxTextFormatMulti";

    /// Uses the default (cpr) HTTP client.
    explicit DaxFormatterClient(FormatterClientConfig config);

    DaxFormatterClient(FormatterClientConfig config, std::unique_ptr<IHttpClient> http);

    DaxFormatterClient(const DaxFormatterClient&) = delete;
    DaxFormatterClient& operator=(const DaxFormatterClient&) = delete;

    [[nodiscard]] FormatterResult<DaxFormatterResponse> format(const std::string& dax) override;
    [[nodiscard]] FormatterResult<DaxFormatterResponse> format(
        const FormatSingleRequest& request) override;
    [[nodiscard]] FormatterResult<std::vector<DaxFormatterResponse>> format(
        const FormatMultipleRequest& request) override;

    /// nullptr when the breaker is disabled
    [[nodiscard]] CircuitBreaker* circuit_breaker() noexcept { return circuit_breaker_.get(); }

    [[nodiscard]] const FormatterClientConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] FormatterResult<DaxFormatterResponse> format_single(const Json& body);

    // Circuit breaker, retries, status check and JSON parse of the reply
    [[nodiscard]] FormatterResult<Json> post_json(const std::string& path, const Json& body);
    [[nodiscard]] FormatterResult<HttpClientResponse> post_with_retry(
        const std::string& path, const std::string& body);

    [[nodiscard]] std::chrono::milliseconds retry_delay(
        std::size_t attempt, const HttpClientResponse* response);

    FormatterClientConfig config_;
    CallerInfo caller_;
    std::unique_ptr<IHttpClient> http_;
    std::shared_ptr<IBackoffPolicy> backoff_policy_;
    std::shared_ptr<RetryPolicy> retry_policy_;
    std::unique_ptr<CircuitBreaker> circuit_breaker_;
};

/// Defaults overlaid with DAX_FORMATTER_URL and DAX_FORMATTER_TIMEOUT_MS
/// (read timeout, in milliseconds). A malformed timeout is an error.
[[nodiscard]] tl::expected<FormatterClientConfig, std::string> formatter_config_from_env();

}  // namespace daxmcp
