#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker
// ═══════════════════════════════════════════════════════════════════════════
// Guards calls to the formatter service. While the service is down the
// gateway answers immediately instead of paying a full timeout per call.
//
//   Closed ──(failure_threshold consecutive failures)──▶ Open
//   Open ──(recovery_timeout elapsed, next request)──▶ HalfOpen
//   HalfOpen ──(success_threshold successes)──▶ Closed
//   HalfOpen ──(any failure)──▶ Open
//
// Only transport-level failures count. A DAX syntax error reported by the
// service is a successful round trip.

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace daxmcp {

enum class CircuitState {
    Closed,
    Open,
    HalfOpen
};

[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::Closed:   return "Closed";
        case CircuitState::Open:     return "Open";
        case CircuitState::HalfOpen: return "HalfOpen";
    }
    return "Unknown";
}

struct CircuitBreakerConfig {
    std::size_t failure_threshold{5};
    std::chrono::milliseconds recovery_timeout{30000};
    std::size_t success_threshold{1};
    std::string name{"daxformatter"};
};

class CircuitBreaker {
public:
    using StateChangeCallback = std::function<void(CircuitState old_state, CircuitState new_state)>;

    CircuitBreaker() = default;
    explicit CircuitBreaker(CircuitBreakerConfig config);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker() = default;

    /// False while open. In HalfOpen a single trial request is let through.
    [[nodiscard]] bool allow_request();

    void record_success();
    void record_failure();

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] bool is_closed() const;
    [[nodiscard]] const CircuitBreakerConfig& config() const noexcept { return config_; }

    /// Callbacks run outside the internal lock and may query the breaker.
    void on_state_change(StateChangeCallback callback);

private:
    struct Transition {
        CircuitState from{CircuitState::Closed};
        CircuitState to{CircuitState::Closed};
        std::vector<StateChangeCallback> callbacks;

        void fire() const {
            for (const auto& callback : callbacks) {
                callback(from, to);
            }
        }
    };

    // Caller holds mutex_
    [[nodiscard]] Transition move_to(CircuitState next);
    [[nodiscard]] bool recovery_elapsed() const;

    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    CircuitState state_{CircuitState::Closed};
    std::size_t consecutive_failures_{0};
    std::size_t consecutive_successes_{0};
    std::chrono::steady_clock::time_point opened_at_{std::chrono::steady_clock::now()};
    bool trial_in_flight_{false};

    std::vector<StateChangeCallback> state_change_callbacks_;
};

}  // namespace daxmcp
