#include "daxmcp/formatter/formatter_client.hpp"

#include "daxmcp/json/fast_json.hpp"
#include "daxmcp/log/logger.hpp"
#include "daxmcp/transport/http_types.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <stdexcept>
#include <thread>

namespace daxmcp {

namespace {

constexpr std::chrono::milliseconds kMaxRetryAfter{30000};

std::string get_env(const char* name, const std::string& fallback = "") {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

std::optional<long long> parse_positive(std::string_view text) {
    long long value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    const bool consumed_all = (ptr == text.data() + text.size());
    if ((ec != std::errc{}) || (consumed_all == false) || (value <= 0)) {
        return std::nullopt;
    }
    return value;
}

std::string serialize(const Json& body) {
    return body.dump(-1, ' ', false, Json::error_handler_t::replace);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────────────────────────────

std::string FormatterClientConfig::validation_error() const {
    const auto url = parse_url(base_url);
    if (url.has_value() == false) {
        return "Formatter URL must be an absolute http(s) URL: '" + base_url + "'";
    }
    if (url->query.empty() == false) {
        return "Formatter URL must not carry a query string: '" + base_url + "'";
    }
    if (connect_timeout.count() <= 0) {
        return "Connect timeout must be positive";
    }
    if (read_timeout.count() <= 0) {
        return "Read timeout must be positive";
    }
    if (enable_circuit_breaker && (circuit_breaker.failure_threshold == 0)) {
        return "Circuit breaker failure threshold must be at least 1";
    }
    return "";
}

tl::expected<FormatterClientConfig, std::string> formatter_config_from_env() {
    FormatterClientConfig config;

    const std::string url = get_env("DAX_FORMATTER_URL");
    if (url.empty() == false) {
        config.base_url = url;
    }

    const std::string timeout = get_env("DAX_FORMATTER_TIMEOUT_MS");
    if (timeout.empty() == false) {
        const auto millis = parse_positive(timeout);
        if (millis.has_value() == false) {
            return tl::unexpected(
                "DAX_FORMATTER_TIMEOUT_MS must be a positive integer, got '" + timeout + "'");
        }
        config.read_timeout = std::chrono::milliseconds{*millis};
    }

    return config;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

DaxFormatterClient::DaxFormatterClient(FormatterClientConfig config)
    : DaxFormatterClient(std::move(config), make_http_client())
{}

DaxFormatterClient::DaxFormatterClient(FormatterClientConfig config, std::unique_ptr<IHttpClient> http)
    : config_(std::move(config))
    , caller_{config_.caller_app, config_.caller_version}
    , http_(std::move(http))
{
    const std::string error = config_.validation_error();
    if (error.empty() == false) {
        throw std::invalid_argument("Invalid FormatterClientConfig: " + error);
    }
    if (http_ == nullptr) {
        throw std::invalid_argument("DaxFormatterClient: HTTP client cannot be null");
    }

    const auto url = parse_url(config_.base_url);
    http_->set_base_url(url->origin() + (url->path == "/" ? std::string{} : url->path));
    http_->set_default_headers({{"Accept", "application/json"}});
    http_->set_connect_timeout(config_.connect_timeout);
    http_->set_read_timeout(config_.read_timeout);
    http_->set_verify_ssl(config_.verify_ssl);

    backoff_policy_ = config_.backoff_policy ? config_.backoff_policy
                                             : std::make_shared<ExponentialBackoff>();
    if (config_.retry_policy) {
        retry_policy_ = config_.retry_policy;
    } else {
        retry_policy_ = std::make_shared<RetryPolicy>();
        retry_policy_->with_max_attempts(config_.max_retries);
    }

    if (config_.enable_circuit_breaker) {
        circuit_breaker_ = std::make_unique<CircuitBreaker>(config_.circuit_breaker);
        circuit_breaker_->on_state_change([name = config_.circuit_breaker.name](
                                              CircuitState from, CircuitState to) {
            get_logger().warn_fmt("Circuit breaker '{}': {} -> {}", name, to_string(from), to_string(to));
        });
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// IFormatterClient
// ─────────────────────────────────────────────────────────────────────────────

FormatterResult<DaxFormatterResponse> DaxFormatterClient::format(const std::string& dax) {
    return format_single(FormatSingleRequest{dax, {}}.to_wire(caller_));
}

FormatterResult<DaxFormatterResponse> DaxFormatterClient::format(const FormatSingleRequest& request) {
    return format_single(request.to_wire(caller_));
}

FormatterResult<std::vector<DaxFormatterResponse>> DaxFormatterClient::format(
    const FormatMultipleRequest& request
) {
    if (request.dax.empty()) {
        return tl::unexpected(FormatterError::invalid_request("No expressions to format"));
    }

    auto reply = post_json(kMultiplePath, request.to_wire(caller_));
    if (!reply) {
        return tl::unexpected(reply.error());
    }
    if (reply->is_array() == false) {
        return tl::unexpected(FormatterError::invalid_response("expected an array"));
    }

    std::vector<DaxFormatterResponse> responses;
    responses.reserve(reply->size());
    for (const auto& item : *reply) {
        auto parsed = DaxFormatterResponse::from_wire(item);
        if (!parsed) {
            return tl::unexpected(FormatterError::invalid_response(parsed.error()));
        }
        responses.push_back(std::move(*parsed));
    }
    return responses;
}

FormatterResult<DaxFormatterResponse> DaxFormatterClient::format_single(const Json& body) {
    auto reply = post_json(kSinglePath, body);
    if (!reply) {
        return tl::unexpected(reply.error());
    }

    auto parsed = DaxFormatterResponse::from_wire(*reply);
    if (!parsed) {
        return tl::unexpected(FormatterError::invalid_response(parsed.error()));
    }
    if (parsed->has_errors()) {
        return tl::unexpected(FormatterError::syntax_error(parsed->error_summary()));
    }
    return std::move(*parsed);
}

// ─────────────────────────────────────────────────────────────────────────────
// HTTP
// ─────────────────────────────────────────────────────────────────────────────

FormatterResult<Json> DaxFormatterClient::post_json(const std::string& path, const Json& body) {
    if (circuit_breaker_ && (circuit_breaker_->allow_request() == false)) {
        get_logger().debug_fmt("Circuit open, not calling {}", path);
        return tl::unexpected(FormatterError::circuit_open());
    }

    auto response = post_with_retry(path, serialize(body));

    if (circuit_breaker_) {
        const bool service_failed = (!response) && response.error().is_service_failure();
        if (service_failed) {
            circuit_breaker_->record_failure();
        } else {
            circuit_breaker_->record_success();
        }
    }

    if (!response) {
        return tl::unexpected(response.error());
    }

    auto parsed = fast_parse(response->body);
    if (!parsed) {
        return tl::unexpected(FormatterError::invalid_response(parsed.error().message));
    }
    return std::move(*parsed);
}

FormatterResult<HttpClientResponse> DaxFormatterClient::post_with_retry(
    const std::string& path,
    const std::string& body
) {
    for (std::size_t attempt = 0; ; ++attempt) {
        auto result = http_->post(path, body, "application/json");

        std::chrono::milliseconds delay{0};
        if (result.has_value()) {
            if (result->is_success()) {
                backoff_policy_->reset();
                return std::move(*result);
            }

            const int status = result->status_code;
            if (retry_policy_->should_retry_http_status(status, attempt) == false) {
                get_logger().debug_fmt("Not retrying HTTP {} (attempt {})", status, attempt);
                return tl::unexpected(FormatterError::http_error(status, result->body));
            }
            delay = retry_delay(attempt, &*result);
            get_logger().info_fmt("HTTP {} from formatter service, retrying in {}ms (attempt {}/{})",
                status, delay.count(), attempt + 1, retry_policy_->max_attempts());
        } else {
            const auto& error = result.error();
            if (retry_policy_->should_retry(error.code, attempt) == false) {
                get_logger().debug_fmt("Not retrying: attempt={}, error={}", attempt, error.message);
                return tl::unexpected(FormatterError::from_http(error));
            }
            delay = retry_delay(attempt, nullptr);
            get_logger().info_fmt("Formatter request failed ({}), retrying in {}ms (attempt {}/{})",
                error.message, delay.count(), attempt + 1, retry_policy_->max_attempts());
        }

        std::this_thread::sleep_for(delay);
    }
}

std::chrono::milliseconds DaxFormatterClient::retry_delay(
    std::size_t attempt,
    const HttpClientResponse* response
) {
    // Retry-After in delta-seconds form; HTTP-date values fall back to backoff
    if (response != nullptr) {
        const auto retry_after = get_header(response->headers, "Retry-After");
        if (retry_after.has_value()) {
            const auto seconds = parse_positive(*retry_after);
            if (seconds.has_value()) {
                const auto capped = std::min<long long>(*seconds, kMaxRetryAfter.count() / 1000);
                return std::chrono::milliseconds{capped * 1000};
            }
        }
    }
    return backoff_policy_->next_delay(attempt);
}

}  // namespace daxmcp
