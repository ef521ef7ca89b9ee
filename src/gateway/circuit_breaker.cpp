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

// httpgate Circuit Breaker - Implementation

#include "circuit_breaker.hpp"

#include <algorithm>
#include <optional>

namespace httpgate::gateway {

namespace {

// Weight of a new latency sample in the moving average
constexpr double kLatencySmoothing = 0.2;

}  // namespace

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig config, TransitionListener listener)
    : config_(config), listener_(std::move(listener)) {}

CircuitState CircuitBreaker::state_of(const State& state) noexcept {
    if (std::holds_alternative<Open>(state)) {
        return CircuitState::OPEN;
    }
    if (std::holds_alternative<HalfOpen>(state)) {
        return CircuitState::HALF_OPEN;
    }
    return CircuitState::CLOSED;
}

CircuitBreaker::Transition CircuitBreaker::transition_to(State next) {
    Transition t{state_of(state_), state_of(next)};
    state_ = std::move(next);
    state_transitions_.fetch_add(1, std::memory_order_relaxed);
    return t;
}

std::chrono::milliseconds CircuitBreaker::next_cooldown(std::chrono::milliseconds prev) const {
    auto grown = static_cast<double>(prev.count()) * config_.backoff_multiplier;
    auto capped = std::min(grown, static_cast<double>(config_.max_cooldown_ms));
    return std::chrono::milliseconds(static_cast<int64_t>(capped));
}

void CircuitBreaker::notify(const Transition& t) {
    TransitionListener listener;
    {
        std::lock_guard lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(t.from, t.to);
    }
}

Permit CircuitBreaker::try_acquire(TimePoint now) {
    std::optional<Transition> transition;
    Permit permit = Permit::Denied;

    {
        std::lock_guard lock(mutex_);

        if (std::holds_alternative<Closed>(state_)) {
            permit = Permit::Granted;
        } else if (auto* open = std::get_if<Open>(&state_)) {
            if (now >= open->until) {
                // Cool-down over: this request becomes the trial
                auto cooldown = open->cooldown;
                transition = transition_to(HalfOpen{true, cooldown});
                permit = Permit::Probe;
            }
        } else if (auto* half = std::get_if<HalfOpen>(&state_)) {
            if (!half->probe_in_flight) {
                half->probe_in_flight = true;
                permit = Permit::Probe;
            }
        }
    }

    if (permit == Permit::Denied) {
        rejected_requests_.fetch_add(1, std::memory_order_relaxed);
    }
    if (transition) {
        notify(*transition);
    }
    return permit;
}

Permit CircuitBreaker::force_acquire(TimePoint now) {
    auto permit = try_acquire(now);
    return permit == Permit::Denied ? Permit::Forced : permit;
}

void CircuitBreaker::record_success(Permit permit, std::chrono::microseconds latency) {
    total_successes_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Transition> transition;
    {
        std::lock_guard lock(mutex_);

        auto sample = static_cast<double>(latency.count());
        latency_ewma_us_ = latency_ewma_us_ == 0.0
                               ? sample
                               : latency_ewma_us_ * (1.0 - kLatencySmoothing) +
                                     sample * kLatencySmoothing;

        if (auto* closed = std::get_if<Closed>(&state_)) {
            closed->failures.clear();
        } else if (auto* open = std::get_if<Open>(&state_)) {
            // A forced answer ends the cool-down early, a trial still decides
            if (permit == Permit::Forced) {
                auto cooldown = open->cooldown;
                transition = transition_to(HalfOpen{false, cooldown});
            }
        } else if (std::holds_alternative<HalfOpen>(state_) && permit == Permit::Probe) {
            transition = transition_to(Closed{});
        }
    }

    if (transition) {
        notify(*transition);
    }
}

void CircuitBreaker::record_failure(Permit permit, TimePoint now) {
    total_failures_.fetch_add(1, std::memory_order_relaxed);

    std::optional<Transition> transition;
    {
        std::lock_guard lock(mutex_);

        if (auto* closed = std::get_if<Closed>(&state_)) {
            auto cutoff = now - std::chrono::milliseconds(config_.window_ms);
            while (!closed->failures.empty() && closed->failures.front() < cutoff) {
                closed->failures.pop_front();
            }
            closed->failures.push_back(now);

            if (closed->failures.size() >= config_.failure_threshold) {
                auto cooldown = std::chrono::milliseconds(config_.cooldown_ms);
                transition = transition_to(Open{now + cooldown, cooldown});
            }
        } else if (auto* half = std::get_if<HalfOpen>(&state_)) {
            if (permit == Permit::Probe) {
                auto cooldown = next_cooldown(half->cooldown);
                transition = transition_to(Open{now + cooldown, cooldown});
            }
        }
        // OPEN: already protecting the backend, nothing to do
    }

    if (transition) {
        notify(*transition);
    }
}

void CircuitBreaker::release_probe(Permit permit) {
    if (permit != Permit::Probe) {
        return;
    }
    std::lock_guard lock(mutex_);
    if (auto* half = std::get_if<HalfOpen>(&state_)) {
        half->probe_in_flight = false;
    }
}

bool CircuitBreaker::is_routable(TimePoint now) const {
    std::lock_guard lock(mutex_);
    if (const auto* open = std::get_if<Open>(&state_)) {
        return now >= open->until;
    }
    if (const auto* half = std::get_if<HalfOpen>(&state_)) {
        return !half->probe_in_flight;
    }
    return true;
}

CircuitState CircuitBreaker::state() const {
    std::lock_guard lock(mutex_);
    return state_of(state_);
}

std::chrono::milliseconds CircuitBreaker::current_cooldown() const {
    std::lock_guard lock(mutex_);
    if (const auto* open = std::get_if<Open>(&state_)) {
        return open->cooldown;
    }
    if (const auto* half = std::get_if<HalfOpen>(&state_)) {
        return next_cooldown(half->cooldown);
    }
    return std::chrono::milliseconds(config_.cooldown_ms);
}

std::chrono::microseconds CircuitBreaker::smoothed_latency() const {
    std::lock_guard lock(mutex_);
    return std::chrono::microseconds(static_cast<int64_t>(latency_ewma_us_));
}

CircuitBreakerConfig CircuitBreaker::config() const {
    std::lock_guard lock(mutex_);
    return config_;
}

void CircuitBreaker::reconfigure(const CircuitBreakerConfig& config) {
    std::lock_guard lock(mutex_);
    config_ = config;
}

void CircuitBreaker::set_listener(TransitionListener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

} // namespace httpgate::gateway
