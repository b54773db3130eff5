// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "daxmcp/resilience/circuit_breaker.hpp"

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

using namespace daxmcp;
using namespace std::chrono_literals;

namespace {

CircuitBreakerConfig quick_config(std::size_t threshold, std::chrono::milliseconds recovery) {
    CircuitBreakerConfig config;
    config.failure_threshold = threshold;
    config.recovery_timeout = recovery;
    return config;
}

void fail_once(CircuitBreaker& breaker) {
    (void)breaker.allow_request();
    breaker.record_failure();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// State transitions
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreaker starts closed with service defaults", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker;

    REQUIRE(breaker.is_closed());
    REQUIRE(to_string(breaker.state()) == "Closed");
    REQUIRE(breaker.config().failure_threshold == 5);
    REQUIRE(breaker.config().recovery_timeout == 30000ms);
    REQUIRE(breaker.config().name == "daxformatter");
    REQUIRE(breaker.allow_request());
}

TEST_CASE("CircuitBreaker opens after consecutive failures", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(3, 1h));

    fail_once(breaker);
    fail_once(breaker);
    REQUIRE(breaker.is_closed());

    fail_once(breaker);
    REQUIRE(breaker.state() == CircuitState::Open);

    REQUIRE_FALSE(breaker.allow_request());
    REQUIRE_FALSE(breaker.allow_request());
}

TEST_CASE("CircuitBreaker success resets the failure streak", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(3, 1h));

    fail_once(breaker);
    fail_once(breaker);
    (void)breaker.allow_request();
    breaker.record_success();
    fail_once(breaker);
    fail_once(breaker);

    REQUIRE(breaker.is_closed());
}

TEST_CASE("CircuitBreaker lets one trial request through after recovery", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1, 20ms));
    fail_once(breaker);
    REQUIRE(breaker.state() == CircuitState::Open);

    std::this_thread::sleep_for(40ms);

    REQUIRE(breaker.allow_request());
    REQUIRE(breaker.state() == CircuitState::HalfOpen);
    REQUIRE_FALSE(breaker.allow_request());

    SECTION("successful trial closes the circuit") {
        breaker.record_success();
        REQUIRE(breaker.is_closed());
        REQUIRE(breaker.allow_request());
    }

    SECTION("failed trial reopens the circuit") {
        breaker.record_failure();
        REQUIRE(breaker.state() == CircuitState::Open);
        REQUIRE_FALSE(breaker.allow_request());
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Callbacks
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("CircuitBreaker reports every transition", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1, 10ms));

    std::vector<std::pair<CircuitState, CircuitState>> seen;
    breaker.on_state_change([&seen](CircuitState from, CircuitState to) {
        seen.emplace_back(from, to);
    });

    fail_once(breaker);
    std::this_thread::sleep_for(30ms);
    REQUIRE(breaker.allow_request());
    breaker.record_success();

    REQUIRE(seen.size() == 3);
    REQUIRE(seen[0] == std::make_pair(CircuitState::Closed, CircuitState::Open));
    REQUIRE(seen[1] == std::make_pair(CircuitState::Open, CircuitState::HalfOpen));
    REQUIRE(seen[2] == std::make_pair(CircuitState::HalfOpen, CircuitState::Closed));
}

TEST_CASE("CircuitBreaker callbacks may query the breaker", "[resilience][circuit_breaker]") {
    CircuitBreaker breaker(quick_config(1, 1h));

    CircuitState observed = CircuitState::Closed;
    breaker.on_state_change([&breaker, &observed](CircuitState, CircuitState) {
        observed = breaker.state();
    });

    fail_once(breaker);

    REQUIRE(observed == CircuitState::Open);
}
