#include "daxmcp/resilience/circuit_breaker.hpp"

#include <optional>
#include <utility>

namespace daxmcp {

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config)
    : config_(std::move(config))
{}

CircuitBreaker::Transition CircuitBreaker::move_to(CircuitState next) {
    Transition transition{state_, next, state_change_callbacks_};
    state_ = next;

    if (next == CircuitState::Open) {
        opened_at_ = std::chrono::steady_clock::now();
    }
    consecutive_successes_ = 0;
    if (next == CircuitState::Closed) {
        consecutive_failures_ = 0;
    }
    return transition;
}

bool CircuitBreaker::recovery_elapsed() const {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - opened_at_
    );
    return elapsed >= config_.recovery_timeout;
}

// ─────────────────────────────────────────────────────────────────────────────
// Core Operations
// ─────────────────────────────────────────────────────────────────────────────

bool CircuitBreaker::allow_request() {
    std::optional<Transition> transition;
    bool allowed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case CircuitState::Closed:
                allowed = true;
                break;

            case CircuitState::Open:
                if (recovery_elapsed()) {
                    transition = move_to(CircuitState::HalfOpen);
                    trial_in_flight_ = true;
                    allowed = true;
                }
                break;

            case CircuitState::HalfOpen:
                if (trial_in_flight_ == false) {
                    trial_in_flight_ = true;
                    allowed = true;
                }
                break;
        }
    }

    if (transition) {
        transition->fire();
    }
    return allowed;
}

void CircuitBreaker::record_success() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consecutive_failures_ = 0;
        trial_in_flight_ = false;

        if (state_ == CircuitState::HalfOpen) {
            consecutive_successes_++;
            if (consecutive_successes_ >= config_.success_threshold) {
                transition = move_to(CircuitState::Closed);
            }
        }
    }

    if (transition) {
        transition->fire();
    }
}

void CircuitBreaker::record_failure() {
    std::optional<Transition> transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consecutive_successes_ = 0;
        consecutive_failures_++;
        trial_in_flight_ = false;

        switch (state_) {
            case CircuitState::Closed:
                if (consecutive_failures_ >= config_.failure_threshold) {
                    transition = move_to(CircuitState::Open);
                }
                break;

            case CircuitState::HalfOpen:
                transition = move_to(CircuitState::Open);
                break;

            case CircuitState::Open:
                break;
        }
    }

    if (transition) {
        transition->fire();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// State Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool CircuitBreaker::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CircuitState::Closed;
}

void CircuitBreaker::on_state_change(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_change_callbacks_.push_back(std::move(callback));
}

}  // namespace daxmcp
