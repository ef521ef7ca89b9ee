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

// Unit tests for the circuit breaker

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <vector>

#include "gateway/circuit_breaker.hpp"

using namespace httpgate::gateway;
using namespace std::chrono_literals;

namespace {

CircuitBreakerConfig test_config() {
    CircuitBreakerConfig config;
    config.failure_threshold = 3;
    config.window_ms = 10000;
    config.cooldown_ms = 1000;
    config.backoff_multiplier = 2.0;
    config.max_cooldown_ms = 3000;
    return config;
}

void open_circuit(CircuitBreaker& breaker, CircuitBreaker::TimePoint now) {
    for (uint32_t i = 0; i < breaker.config().failure_threshold; ++i) {
        breaker.record_failure(Permit::Granted, now);
    }
}

}  // namespace

TEST_CASE("CircuitBreaker - Basic construction", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());

    REQUIRE(breaker.state() == CircuitState::CLOSED);
    REQUIRE(breaker.get_total_failures() == 0);
    REQUIRE(breaker.get_total_successes() == 0);
    REQUIRE(breaker.get_rejected_requests() == 0);
    REQUIRE(breaker.current_cooldown() == 1000ms);
}

TEST_CASE("CircuitBreaker - to_string conversion", "[circuit_breaker]") {
    REQUIRE(to_string(CircuitState::CLOSED) == "CLOSED");
    REQUIRE(to_string(CircuitState::OPEN) == "OPEN");
    REQUIRE(to_string(CircuitState::HALF_OPEN) == "HALF_OPEN");
}

TEST_CASE("CircuitBreaker - Grants requests while closed", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());

    REQUIRE(breaker.try_acquire() == Permit::Granted);
    REQUIRE(breaker.try_acquire() == Permit::Granted);
    REQUIRE(breaker.is_routable());
}

TEST_CASE("CircuitBreaker - Opens after consecutive failures", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());
    auto now = CircuitBreaker::TimePoint{} + 1h;

    breaker.record_failure(Permit::Granted, now);
    breaker.record_failure(Permit::Granted, now);
    REQUIRE(breaker.state() == CircuitState::CLOSED);

    breaker.record_failure(Permit::Granted, now);
    REQUIRE(breaker.state() == CircuitState::OPEN);
    REQUIRE(breaker.get_total_failures() == 3);

    REQUIRE(breaker.try_acquire(now + 10ms) == Permit::Denied);
    REQUIRE_FALSE(breaker.is_routable(now + 10ms));
    REQUIRE(breaker.get_rejected_requests() == 1);
}

TEST_CASE("CircuitBreaker - Success resets the failure streak", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());
    auto now = CircuitBreaker::TimePoint{} + 1h;

    breaker.record_failure(Permit::Granted, now);
    breaker.record_failure(Permit::Granted, now);
    breaker.record_success(Permit::Granted, 100us);
    breaker.record_failure(Permit::Granted, now);
    breaker.record_failure(Permit::Granted, now);

    REQUIRE(breaker.state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker - Failures outside the window are forgotten", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());
    auto start = CircuitBreaker::TimePoint{} + 1h;

    breaker.record_failure(Permit::Granted, start);
    breaker.record_failure(Permit::Granted, start);
    breaker.record_failure(Permit::Granted, start + 11s);

    REQUIRE(breaker.state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker - Single trial after cool-down", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());
    auto now = CircuitBreaker::TimePoint{} + 1h;
    open_circuit(breaker, now);

    REQUIRE(breaker.try_acquire(now + 999ms) == Permit::Denied);

    // Cool-down elapsed: eligible again, first caller gets the trial
    REQUIRE(breaker.is_routable(now + 1s));
    REQUIRE(breaker.try_acquire(now + 1s) == Permit::Probe);
    REQUIRE(breaker.state() == CircuitState::HALF_OPEN);

    // Only one trial at a time
    REQUIRE_FALSE(breaker.is_routable(now + 1s));
    REQUIRE(breaker.try_acquire(now + 1s) == Permit::Denied);

    SECTION("successful trial closes the circuit") {
        breaker.record_success(Permit::Probe, 250us);
        REQUIRE(breaker.state() == CircuitState::CLOSED);
        REQUIRE(breaker.try_acquire(now + 1s) == Permit::Granted);
    }

    SECTION("failed trial reopens with a longer cool-down") {
        breaker.record_failure(Permit::Probe, now + 1s);
        REQUIRE(breaker.state() == CircuitState::OPEN);
        REQUIRE(breaker.current_cooldown() == 2000ms);
        REQUIRE(breaker.try_acquire(now + 2s) == Permit::Denied);
        REQUIRE(breaker.try_acquire(now + 3s) == Permit::Probe);

        // Growth is capped at max_cooldown_ms
        breaker.record_failure(Permit::Probe, now + 3s);
        REQUIRE(breaker.current_cooldown() == 3000ms);
    }

    SECTION("released trial can be claimed again") {
        breaker.release_probe(Permit::Probe);
        REQUIRE(breaker.state() == CircuitState::HALF_OPEN);
        REQUIRE(breaker.try_acquire(now + 1s) == Permit::Probe);
    }
}

TEST_CASE("CircuitBreaker - Outcomes without the trial permit do not decide", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());
    auto now = CircuitBreaker::TimePoint{} + 1h;
    open_circuit(breaker, now);
    REQUIRE(breaker.try_acquire(now + 1s) == Permit::Probe);

    // Late results of requests admitted while CLOSED
    breaker.record_failure(Permit::Granted, now + 1s);
    REQUIRE(breaker.state() == CircuitState::HALF_OPEN);
    breaker.record_success(Permit::Granted);
    REQUIRE(breaker.state() == CircuitState::HALF_OPEN);

    // Releasing a non-trial permit changes nothing
    breaker.release_probe(Permit::Granted);
    REQUIRE(breaker.try_acquire(now + 1s) == Permit::Denied);
}

TEST_CASE("CircuitBreaker - Forced requests", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());
    auto now = CircuitBreaker::TimePoint{} + 1h;

    REQUIRE(breaker.force_acquire(now) == Permit::Granted);

    open_circuit(breaker, now);
    REQUIRE(breaker.force_acquire(now + 10ms) == Permit::Forced);

    // A forced answer shortens the cool-down but never closes the circuit
    breaker.record_success(Permit::Forced, 1ms);
    REQUIRE(breaker.state() == CircuitState::HALF_OPEN);

    REQUIRE(breaker.try_acquire(now + 20ms) == Permit::Probe);
    REQUIRE(breaker.try_acquire(now + 20ms) == Permit::Denied);
    breaker.record_success(Permit::Probe, 1ms);
    REQUIRE(breaker.state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker - Late success while open keeps it open", "[circuit_breaker]") {
    auto config = test_config();
    config.failure_threshold = 2;
    config.cooldown_ms = 60000;
    CircuitBreaker breaker(config);
    auto now = CircuitBreaker::TimePoint{} + 1h;

    auto first = breaker.try_acquire(now);
    auto second = breaker.try_acquire(now);
    auto slow = breaker.try_acquire(now);
    REQUIRE(slow == Permit::Granted);

    breaker.record_failure(first, now);
    breaker.record_failure(second, now + 1ms);
    REQUIRE(breaker.state() == CircuitState::OPEN);

    // Request admitted before the circuit opened answers late
    breaker.record_success(slow, 5ms);
    REQUIRE(breaker.state() == CircuitState::OPEN);
    REQUIRE(breaker.try_acquire(now + 10s) == Permit::Denied);
    REQUIRE_FALSE(breaker.is_routable(now + 10s));

    // Only the trial after the cool-down closes it
    REQUIRE(breaker.try_acquire(now + 61s) == Permit::Probe);
    breaker.record_success(Permit::Probe, 5ms);
    REQUIRE(breaker.state() == CircuitState::CLOSED);
}

TEST_CASE("CircuitBreaker - Transition listener", "[circuit_breaker]") {
    std::vector<std::pair<CircuitState, CircuitState>> transitions;
    CircuitBreaker breaker(test_config(), [&transitions](CircuitState from, CircuitState to) {
        transitions.emplace_back(from, to);
    });
    auto now = CircuitBreaker::TimePoint{} + 1h;

    open_circuit(breaker, now);
    REQUIRE(breaker.try_acquire(now + 1s) == Permit::Probe);
    breaker.record_success(Permit::Probe);

    REQUIRE(transitions.size() == 3);
    REQUIRE(transitions[0] == std::pair{CircuitState::CLOSED, CircuitState::OPEN});
    REQUIRE(transitions[1] == std::pair{CircuitState::OPEN, CircuitState::HALF_OPEN});
    REQUIRE(transitions[2] == std::pair{CircuitState::HALF_OPEN, CircuitState::CLOSED});
    REQUIRE(breaker.get_state_transitions() == 3);
}

TEST_CASE("CircuitBreaker - Latency smoothing", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());

    breaker.record_success(Permit::Granted, 1000us);
    REQUIRE(breaker.smoothed_latency() == 1000us);

    // 0.8 * 1000 + 0.2 * 2000
    breaker.record_success(Permit::Granted, 2000us);
    auto smoothed = breaker.smoothed_latency().count();
    REQUIRE(smoothed >= 1199);
    REQUIRE(smoothed <= 1200);
}

TEST_CASE("CircuitBreaker - Reconfigure keeps state", "[circuit_breaker]") {
    CircuitBreaker breaker(test_config());
    auto now = CircuitBreaker::TimePoint{} + 1h;
    open_circuit(breaker, now);

    auto config = test_config();
    config.failure_threshold = 10;
    breaker.reconfigure(config);

    REQUIRE(breaker.state() == CircuitState::OPEN);
    REQUIRE(breaker.config().failure_threshold == 10);
}
