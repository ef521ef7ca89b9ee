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

// httpgate Events - Header
// Observability output: one event per completed request and per health transition

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <system_error>

#include "circuit_breaker.hpp"

namespace httpgate::gateway {

/// One completed (or abandoned) client request
struct RequestEvent {
    std::string method;
    std::string host;
    std::string path;
    std::string route;   // Route id ("" when unresolved)
    std::string target;  // Last target tried ("" when none)
    uint16_t status = 0; // Status sent to the client (0 = none)
    uint32_t retries = 0;
    std::chrono::microseconds latency{0};
    std::error_code error;  // GatewayError or system error; empty on success
    std::string correlation_id;

    /// "ok" or the error name
    [[nodiscard]] std::string outcome() const;
};

/// Target circuit state change
struct HealthEvent {
    std::string target;  // "group/host:port"
    CircuitState from = CircuitState::CLOSED;
    CircuitState to = CircuitState::CLOSED;
};

/// Receiver of gateway events (must be thread-safe)
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_request(const RequestEvent& event) = 0;
    virtual void on_health(const HealthEvent& event) = 0;
};

/// Default sink: writes events through the process logger
class LogEventSink final : public EventSink {
public:
    void on_request(const RequestEvent& event) override;
    void on_health(const HealthEvent& event) override;
};

}  // namespace httpgate::gateway
