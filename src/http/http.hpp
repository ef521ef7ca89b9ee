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

// httpgate HTTP Protocol - Header
// HTTP/1.x value types for proxied message heads

#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace httpgate::http {

/// HTTP methods
enum class Method : uint8_t {
    GET,
    POST,
    PUT,
    DELETE,
    HEAD,
    OPTIONS,
    PATCH,
    CONNECT,
    TRACE,
    UNKNOWN
};

/// HTTP version
enum class Version : uint8_t { HTTP_1_0, HTTP_1_1, UNKNOWN };

/// HTTP status codes the gateway produces or inspects
enum class StatusCode : uint16_t {
    Continue = 100,
    SwitchingProtocols = 101,

    OK = 200,
    NoContent = 204,
    NotModified = 304,

    BadRequest = 400,
    NotFound = 404,
    RequestTimeout = 408,
    PayloadTooLarge = 413,
    RequestHeaderFieldsTooLarge = 431,

    InternalServerError = 500,
    NotImplemented = 501,
    BadGateway = 502,
    ServiceUnavailable = 503,
    GatewayTimeout = 504,
};

/// HTTP header (owned, since heads outlive the socket buffer they came from)
struct Header {
    std::string name;
    std::string value;
};

using HeaderList = std::vector<Header>;

/// Find header by name (case-insensitive), first occurrence
[[nodiscard]] const Header* find_header(const HeaderList& headers, std::string_view name) noexcept;

/// Parsed request line and headers
struct RequestHead {
    Method method = Method::UNKNOWN;
    std::string method_name;  // Raw token, forwarded verbatim (covers extension methods)
    Version version = Version::HTTP_1_1;

    std::string target;  // Request-target as received
    std::string path;    // Target without query string
    std::string query;   // Query string (if present)

    HeaderList headers;

    bool keep_alive = true;  // Per llhttp_should_keep_alive()
    bool has_body = false;   // Content-Length > 0 or chunked

    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept {
        return http::find_header(headers, name);
    }

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;
};

/// Parsed status line and headers
struct ResponseHead {
    Version version = Version::HTTP_1_1;
    uint16_t status = 0;
    std::string reason;

    HeaderList headers;

    bool keep_alive = true;

    [[nodiscard]] const Header* find_header(std::string_view name) const noexcept {
        return http::find_header(headers, name);
    }

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool is_informational() const noexcept { return status >= 100 && status < 200; }
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert Version to string
[[nodiscard]] std::string_view to_string(Version version) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

/// Offset just past the blank line ending a message head, or 0 if the head
/// is not complete yet. Accepts CRLF CRLF and bare LF LF terminators.
[[nodiscard]] size_t find_head_end(std::span<const uint8_t> data) noexcept;

/// Hop-by-hop header check (RFC 9110 section 7.6.1).
/// `connection_value` is the message's Connection header; names listed there
/// are connection-specific too. Transfer-Encoding is not included: the gateway
/// relays message framing unchanged.
[[nodiscard]] bool is_hop_by_hop(std::string_view name, std::string_view connection_value) noexcept;

/// Host without a trailing ":port", lowercased (IPv6 literals keep their brackets)
[[nodiscard]] std::string normalize_host(std::string_view host);

/// Minimal gateway-generated response with a text/plain body
[[nodiscard]] std::string build_simple_response(StatusCode code,
                                                bool keep_alive,
                                                std::string_view extra_headers = {});

}  // namespace httpgate::http
