#include <catch2/catch_test_macros.hpp>

#include "daxmcp/transport/backoff_policy.hpp"
#include "daxmcp/transport/retry_policy.hpp"

#include <chrono>

using namespace daxmcp;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// RetryPolicy
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RetryPolicy default configuration", "[retry][policy]") {
    RetryPolicy policy;

    SECTION("Two retries after the first request") {
        REQUIRE(policy.max_attempts() == 2);
    }

    SECTION("Connection failures and timeouts are retryable") {
        REQUIRE(policy.should_retry(HttpClientError::Code::ConnectionFailed, 0));
        REQUIRE(policy.should_retry(HttpClientError::Code::Timeout, 0));
    }

    SECTION("SSL errors are not retryable") {
        REQUIRE_FALSE(policy.should_retry(HttpClientError::Code::SslError, 0));
    }

    SECTION("Unclassified failures are never retried") {
        REQUIRE_FALSE(policy.should_retry(HttpClientError::Code::Unknown, 0));
    }
}

TEST_CASE("RetryPolicy respects max attempts", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_max_attempts(3);

    REQUIRE(policy.should_retry(HttpClientError::Code::ConnectionFailed, 2));
    REQUIRE_FALSE(policy.should_retry(HttpClientError::Code::ConnectionFailed, 3));

    policy.with_max_attempts(0);
    REQUIRE_FALSE(policy.should_retry(HttpClientError::Code::ConnectionFailed, 0));
}

TEST_CASE("RetryPolicy HTTP status code handling", "[retry][policy]") {
    RetryPolicy policy;

    SECTION("Throttling and server errors are retryable") {
        for (const int status : {429, 500, 502, 503, 504}) {
            REQUIRE(policy.should_retry_http_status(status, 0));
        }
    }

    SECTION("Client errors are not retryable") {
        for (const int status : {400, 401, 403, 404, 415}) {
            REQUIRE_FALSE(policy.should_retry_http_status(status, 0));
        }
    }

    SECTION("Status retries stop at the limit") {
        REQUIRE_FALSE(policy.should_retry_http_status(503, 2));
    }
}

TEST_CASE("RetryPolicy builder pattern", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_max_attempts(5)
          .with_retry_on_timeout(false)
          .with_retry_on_ssl_error(true)
          .with_retryable_status(408)
          .without_retryable_status(500);

    REQUIRE(policy.max_attempts() == 5);
    REQUIRE_FALSE(policy.should_retry(HttpClientError::Code::Timeout, 0));
    REQUIRE(policy.should_retry(HttpClientError::Code::SslError, 0));
    REQUIRE(policy.should_retry_http_status(408, 0));
    REQUIRE_FALSE(policy.should_retry_http_status(500, 0));
}

// ═══════════════════════════════════════════════════════════════════════════
// Backoff
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ExponentialBackoff grows and caps without jitter", "[retry][backoff]") {
    ExponentialBackoff backoff(100ms, 2.0, 500ms, 0.0);

    REQUIRE(backoff.next_delay(0) == 100ms);
    REQUIRE(backoff.next_delay(1) == 200ms);
    REQUIRE(backoff.next_delay(2) == 400ms);
    REQUIRE(backoff.next_delay(3) == 500ms);
    REQUIRE(backoff.next_delay(10) == 500ms);
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[retry][backoff]") {
    ExponentialBackoff backoff;

    for (int i = 0; i < 50; ++i) {
        const auto delay = backoff.next_delay(0);
        REQUIRE(delay >= 150ms);
        REQUIRE(delay <= 250ms);
    }
    REQUIRE(backoff.next_delay(20) <= 6250ms);
}

TEST_CASE("NoBackoff never waits", "[retry][backoff]") {
    NoBackoff backoff;

    REQUIRE(backoff.next_delay(0) == 0ms);
    REQUIRE(backoff.next_delay(7) == 0ms);
}
