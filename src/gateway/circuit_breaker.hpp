/*
 * Copyright 2025 httpgate Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// httpgate Circuit Breaker - Header
// Per-target health tracking: stops sending traffic to failing upstreams

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string_view>
#include <variant>

#include "../core/deadline.hpp"

namespace httpgate::gateway {

/// Circuit breaker state
enum class CircuitState : uint8_t {
    CLOSED,     // Normal operation, requests allowed
    OPEN,       // Circuit protecting backend, requests rejected
    HALF_OPEN   // Testing recovery, one trial request allowed
};

/// Circuit breaker configuration
struct CircuitBreakerConfig {
    /// Consecutive failures within window_ms that open the circuit
    uint32_t failure_threshold = 5;

    /// Sliding window in milliseconds for counting failures
    uint32_t window_ms = 10000;

    /// Time in milliseconds before OPEN → HALF_OPEN transition
    uint32_t cooldown_ms = 30000;

    /// Cool-down growth factor for each consecutive failed trial (1.0 = fixed)
    double backoff_multiplier = 2.0;

    /// Upper bound for the grown cool-down
    uint32_t max_cooldown_ms = 300000;
};

/// Outcome of asking the breaker for permission to send a request
enum class Permit : uint8_t {
    Denied,   // Circuit open (or trial already in flight)
    Granted,  // Circuit closed
    Probe,    // The single HALF_OPEN trial request
    Forced    // Sent despite the circuit (every candidate unhealthy)
};

/// Called on every state change, outside the breaker lock
using TransitionListener = std::function<void(CircuitState from, CircuitState to)>;

/// Circuit breaker for preventing cascading failures
///
/// State machine:
///   CLOSED → OPEN (failure_threshold consecutive failures within window_ms)
///   OPEN → HALF_OPEN (after the cool-down, lazily on the next try_acquire)
///   HALF_OPEN → CLOSED (trial succeeded)
///   HALF_OPEN → OPEN (trial failed, cool-down grows by backoff_multiplier)
///
/// Outcomes are recorded together with the permit they were sent under, so
/// results of requests admitted before the circuit changed state do not
/// decide the trial.
///
/// Thread-safety: all methods may be called concurrently.
class CircuitBreaker {
public:
    using TimePoint = core::Clock::time_point;

    explicit CircuitBreaker(CircuitBreakerConfig config, TransitionListener listener = {});
    ~CircuitBreaker() = default;

    // Non-copyable, non-movable (shared via UpstreamTarget)
    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    /// Claim permission to send one request (may claim the HALF_OPEN trial)
    [[nodiscard]] Permit try_acquire(TimePoint now = core::Clock::now());

    /// Like try_acquire, but returns Forced instead of Denied
    [[nodiscard]] Permit force_acquire(TimePoint now = core::Clock::now());

    /// Record successful request completion
    void record_success(Permit permit, std::chrono::microseconds latency = {});

    /// Record failed request (transport failure, timeout or 5xx)
    void record_failure(Permit permit, TimePoint now = core::Clock::now());

    /// Give back a permit whose request ended without an upstream verdict
    void release_probe(Permit permit);

    /// Read-only eligibility check used by route resolution
    [[nodiscard]] bool is_routable(TimePoint now = core::Clock::now()) const;

    /// Get current circuit state
    [[nodiscard]] CircuitState state() const;

    /// Cool-down that applies to the current (or next) OPEN period
    [[nodiscard]] std::chrono::milliseconds current_cooldown() const;

    /// Smoothed upstream latency (EWMA of successful requests)
    [[nodiscard]] std::chrono::microseconds smoothed_latency() const;

    /// Replace the transition listener
    void set_listener(TransitionListener listener);

    [[nodiscard]] uint64_t get_total_failures() const noexcept {
        return total_failures_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t get_total_successes() const noexcept {
        return total_successes_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t get_rejected_requests() const noexcept {
        return rejected_requests_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] uint64_t get_state_transitions() const noexcept {
        return state_transitions_.load(std::memory_order_relaxed);
    }

    /// Get configuration
    [[nodiscard]] CircuitBreakerConfig config() const;

    /// Apply new thresholds (reload); current state and history are kept
    void reconfigure(const CircuitBreakerConfig& config);

private:
    struct Closed {
        std::deque<TimePoint> failures;  // Consecutive failures, oldest first
    };

    struct Open {
        TimePoint until;
        std::chrono::milliseconds cooldown;
    };

    struct HalfOpen {
        bool probe_in_flight = false;
        std::chrono::milliseconds cooldown;  // Cool-down of the OPEN period that preceded
    };

    using State = std::variant<Closed, Open, HalfOpen>;

    struct Transition {
        CircuitState from;
        CircuitState to;
    };

    [[nodiscard]] static CircuitState state_of(const State& state) noexcept;

    /// Swap state under lock; returns the transition to report
    Transition transition_to(State next);

    [[nodiscard]] std::chrono::milliseconds next_cooldown(std::chrono::milliseconds prev) const;

    void notify(const Transition& t);

    CircuitBreakerConfig config_;

    mutable std::mutex mutex_;
    State state_{Closed{}};
    double latency_ewma_us_ = 0.0;
    TransitionListener listener_;

    // Metrics (atomic for lock-free observability)
    std::atomic<uint64_t> total_failures_{0};
    std::atomic<uint64_t> total_successes_{0};
    std::atomic<uint64_t> rejected_requests_{0};
    std::atomic<uint64_t> state_transitions_{0};
};

/// Convert circuit state to string for logging
[[nodiscard]] constexpr std::string_view to_string(CircuitState state) noexcept {
    switch (state) {
        case CircuitState::CLOSED:
            return "CLOSED";
        case CircuitState::OPEN:
            return "OPEN";
        case CircuitState::HALF_OPEN:
            return "HALF_OPEN";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view to_string(Permit permit) noexcept {
    switch (permit) {
        case Permit::Denied:
            return "denied";
        case Permit::Granted:
            return "granted";
        case Permit::Probe:
            return "probe";
        case Permit::Forced:
            return "forced";
    }
    return "unknown";
}

} // namespace httpgate::gateway
