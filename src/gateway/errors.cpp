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

// httpgate Gateway Errors - Implementation

#include "errors.hpp"

#include <string>

namespace httpgate::gateway {

namespace {

class GatewayErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "httpgate.gateway"; }

    std::string message(int ev) const override {
        return std::string(to_string(static_cast<GatewayError>(ev)));
    }
};

}  // namespace

const std::error_category& gateway_category() noexcept {
    static const GatewayErrorCategory category;
    return category;
}

std::string_view to_string(GatewayError e) noexcept {
    switch (e) {
        case GatewayError::NoRoute:
            return "no_route";
        case GatewayError::PoolExhausted:
            return "pool_exhausted";
        case GatewayError::Rejected:
            return "rejected";
        case GatewayError::UpstreamUnreachable:
            return "upstream_unreachable";
        case GatewayError::UpstreamTimeout:
            return "upstream_timeout";
        case GatewayError::ClientDisconnected:
            return "client_disconnected";
        case GatewayError::PartialResponseFailure:
            return "partial_response_failure";
        case GatewayError::BadRequest:
            return "bad_request";
        case GatewayError::HeadersTooLarge:
            return "headers_too_large";
        case GatewayError::UpstreamProtocolError:
            return "upstream_protocol_error";
    }
    return "unknown";
}

std::optional<http::StatusCode> status_for(GatewayError e) noexcept {
    switch (e) {
        case GatewayError::NoRoute:
            return http::StatusCode::NotFound;
        case GatewayError::PoolExhausted:
        case GatewayError::Rejected:
            return http::StatusCode::ServiceUnavailable;
        case GatewayError::UpstreamUnreachable:
        case GatewayError::UpstreamProtocolError:
            return http::StatusCode::BadGateway;
        case GatewayError::UpstreamTimeout:
            return http::StatusCode::GatewayTimeout;
        case GatewayError::BadRequest:
            return http::StatusCode::BadRequest;
        case GatewayError::HeadersTooLarge:
            return http::StatusCode::RequestHeaderFieldsTooLarge;
        case GatewayError::ClientDisconnected:
        case GatewayError::PartialResponseFailure:
            return std::nullopt;
    }
    return http::StatusCode::InternalServerError;
}

std::optional<http::StatusCode> status_for(const std::error_code& ec) noexcept {
    if (!ec) {
        return std::nullopt;
    }
    if (ec.category() == gateway_category()) {
        return status_for(static_cast<GatewayError>(ec.value()));
    }
    return http::StatusCode::BadGateway;
}

std::string build_error_response(const std::error_code& ec, bool keep_alive) {
    auto status = status_for(ec);
    if (!status) {
        return {};
    }
    if (ec == GatewayError::Rejected) {
        return http::build_simple_response(*status, keep_alive, "Retry-After: 1\r\n");
    }
    return http::build_simple_response(*status, keep_alive);
}

}  // namespace httpgate::gateway
