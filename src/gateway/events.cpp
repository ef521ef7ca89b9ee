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

// httpgate Events - Implementation

#include "events.hpp"

#include "../core/logging.hpp"

namespace httpgate::gateway {

std::string RequestEvent::outcome() const {
    return error ? error.message() : std::string("ok");
}

void LogEventSink::on_request(const RequestEvent& event) {
    auto* logger = logging::get_logger();
    if (!logger) {
        return;
    }

    if (event.error && event.status >= 500) {
        LOG_ERROR_CTX(logger, "Request failed", event.correlation_id, event.status,
                      event.outcome());
    }

    LOG_REQUEST(logger, event.method, event.host, event.path, event.route, event.target,
                event.status, event.retries, event.latency.count(), event.outcome(),
                event.correlation_id);
}

void LogEventSink::on_health(const HealthEvent& event) {
    auto* logger = logging::get_logger();
    if (!logger) {
        return;
    }

    if (event.to == CircuitState::OPEN) {
        LOG_WARNING(logger, "Circuit breaker {} {} -> {}", event.target, to_string(event.from),
                    to_string(event.to));
    } else {
        LOG_INFO(logger, "Circuit breaker {} {} -> {}", event.target, to_string(event.from),
                 to_string(event.to));
    }
}

}  // namespace httpgate::gateway
