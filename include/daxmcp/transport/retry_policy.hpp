#ifndef DAXMCP_TRANSPORT_RETRY_POLICY_HPP
#define DAXMCP_TRANSPORT_RETRY_POLICY_HPP

#include "daxmcp/transport/http_client.hpp"

#include <cstddef>
#include <set>

namespace daxmcp {

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Which failed formatter calls are worth repeating.
//
// Retried by default: connection failures, timeouts, HTTP 429 and 5xx.
// Never retried: SSL errors, unclassified failures, other 4xx.
//
//   RetryPolicy policy;
//   policy.with_max_attempts(5).with_retry_on_timeout(false);

class RetryPolicy {
public:
    RetryPolicy()
        : max_attempts_(2)
        , retry_on_connection_error_(true)
        , retry_on_timeout_(true)
        , retry_on_ssl_error_(false)
        , retryable_http_statuses_{429, 500, 502, 503, 504}
    {}

    /// Retries after the initial request (0 disables retrying).
    RetryPolicy& with_max_attempts(std::size_t attempts) {
        max_attempts_ = attempts;
        return *this;
    }

    RetryPolicy& with_retry_on_connection_error(bool enable) {
        retry_on_connection_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_timeout(bool enable) {
        retry_on_timeout_ = enable;
        return *this;
    }

    RetryPolicy& with_retry_on_ssl_error(bool enable) {
        retry_on_ssl_error_ = enable;
        return *this;
    }

    RetryPolicy& with_retryable_status(int status_code) {
        retryable_http_statuses_.insert(status_code);
        return *this;
    }

    RetryPolicy& without_retryable_status(int status_code) {
        retryable_http_statuses_.erase(status_code);
        return *this;
    }

    [[nodiscard]] std::size_t max_attempts() const noexcept {
        return max_attempts_;
    }

    /// @param attempt 0 for the first retry after the initial failure
    [[nodiscard]] bool should_retry(HttpClientError::Code code, std::size_t attempt) const {
        const bool within_limit = (attempt < max_attempts_);
        if (within_limit == false) {
            return false;
        }

        switch (code) {
            case HttpClientError::Code::ConnectionFailed:
                return retry_on_connection_error_;

            case HttpClientError::Code::Timeout:
                return retry_on_timeout_;

            case HttpClientError::Code::SslError:
                return retry_on_ssl_error_;

            case HttpClientError::Code::Unknown:
                return false;
        }

        return false;
    }

    [[nodiscard]] bool should_retry_http_status(int status_code, std::size_t attempt) const {
        const bool within_limit = (attempt < max_attempts_);
        return within_limit && retryable_http_statuses_.contains(status_code);
    }

private:
    std::size_t max_attempts_;
    bool retry_on_connection_error_;
    bool retry_on_timeout_;
    bool retry_on_ssl_error_;
    std::set<int> retryable_http_statuses_;
};

}  // namespace daxmcp

#endif  // DAXMCP_TRANSPORT_RETRY_POLICY_HPP
