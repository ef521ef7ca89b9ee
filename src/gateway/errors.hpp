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

// httpgate Gateway Errors - Header
// std::error_code category for request-level failures

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "../http/http.hpp"

namespace httpgate::gateway {

/// Request-level failure taxonomy.
/// All of these are recovered at the forwarding/session boundary.
enum class GatewayError {
    NoRoute = 1,             // No rule matched (404)
    PoolExhausted,           // No pooled connection before the deadline (503)
    Rejected,                // Admission ceiling reached (503 + Retry-After)
    UpstreamUnreachable,     // Connect or pre-response transport failure (502)
    UpstreamTimeout,         // Deadline elapsed waiting on upstream (504)
    ClientDisconnected,      // Client went away; no response is sent
    PartialResponseFailure,  // Upstream failed after response bytes reached the client
    BadRequest,              // Malformed client request (400)
    HeadersTooLarge,         // Request head over max_header_size (431)
    UpstreamProtocolError,   // Upstream sent an unparsable response (502)
};

[[nodiscard]] const std::error_category& gateway_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(GatewayError e) noexcept {
    return {static_cast<int>(e), gateway_category()};
}

[[nodiscard]] std::string_view to_string(GatewayError e) noexcept;

/// Client-visible status for an error, std::nullopt when nothing is sent
[[nodiscard]] std::optional<http::StatusCode> status_for(GatewayError e) noexcept;

/// Status for any error code reaching the session boundary
[[nodiscard]] std::optional<http::StatusCode> status_for(const std::error_code& ec) noexcept;

/// Gateway-generated response for an error; empty when nothing is sent.
/// Rejected responses carry Retry-After.
[[nodiscard]] std::string build_error_response(const std::error_code& ec, bool keep_alive);

}  // namespace httpgate::gateway

template <>
struct std::is_error_code_enum<httpgate::gateway::GatewayError> : std::true_type {};
