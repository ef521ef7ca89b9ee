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

// httpgate HTTP Protocol - Implementation

#include "http.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace httpgate::http {

const Header* find_header(const HeaderList& headers, std::string_view name) noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.name, name)) {
            return &header;
        }
    }
    return nullptr;
}

std::string_view RequestHead::get_header(std::string_view name,
                                         std::string_view default_value) const noexcept {
    const auto* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

std::string_view ResponseHead::get_header(std::string_view name,
                                          std::string_view default_value) const noexcept {
    const auto* header = find_header(name);
    return header ? std::string_view(header->value) : default_value;
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::CONNECT:
            return "CONNECT";
        case Method::TRACE:
            return "TRACE";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    if (str == "CONNECT")
        return Method::CONNECT;
    if (str == "TRACE")
        return Method::TRACE;
    return Method::UNKNOWN;
}

std::string_view to_string(Version version) noexcept {
    switch (version) {
        case Version::HTTP_1_0:
            return "HTTP/1.0";
        case Version::HTTP_1_1:
            return "HTTP/1.1";
        case Version::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::Continue:
            return "Continue";
        case StatusCode::SwitchingProtocols:
            return "Switching Protocols";
        case StatusCode::OK:
            return "OK";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::NotModified:
            return "Not Modified";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::RequestTimeout:
            return "Request Timeout";
        case StatusCode::PayloadTooLarge:
            return "Payload Too Large";
        case StatusCode::RequestHeaderFieldsTooLarge:
            return "Request Header Fields Too Large";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::NotImplemented:
            return "Not Implemented";
        case StatusCode::BadGateway:
            return "Bad Gateway";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
        case StatusCode::GatewayTimeout:
            return "Gateway Timeout";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

size_t find_head_end(std::span<const uint8_t> data) noexcept {
    for (size_t i = 0; i < data.size(); ++i) {
        if (data[i] != '\n') {
            continue;
        }
        // "\n\n" or "\n\r\n" ends the head
        if (i + 1 < data.size() && data[i + 1] == '\n') {
            return i + 2;
        }
        if (i + 2 < data.size() && data[i + 1] == '\r' && data[i + 2] == '\n') {
            return i + 3;
        }
    }
    return 0;
}

bool is_hop_by_hop(std::string_view name, std::string_view connection_value) noexcept {
    static constexpr std::string_view kHopByHop[] = {
        "Connection", "Keep-Alive", "Proxy-Connection", "TE", "Trailer", "Upgrade"};

    for (auto hop : kHopByHop) {
        if (header_name_equals(name, hop)) {
            return true;
        }
    }

    // Connection: close, X-Foo  ->  X-Foo is connection-specific
    while (!connection_value.empty()) {
        size_t comma = connection_value.find(',');
        std::string_view token = connection_value.substr(0, comma);
        while (!token.empty() && (token.front() == ' ' || token.front() == '\t')) {
            token.remove_prefix(1);
        }
        while (!token.empty() && (token.back() == ' ' || token.back() == '\t')) {
            token.remove_suffix(1);
        }
        if (!token.empty() && header_name_equals(name, token)) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        connection_value.remove_prefix(comma + 1);
    }
    return false;
}

std::string normalize_host(std::string_view host) {
    if (!host.empty() && host.front() == '[') {
        // [::1]:8080 -> [::1]
        size_t close = host.find(']');
        if (close != std::string_view::npos) {
            host = host.substr(0, close + 1);
        }
    } else if (size_t colon = host.find(':'); colon != std::string_view::npos) {
        host = host.substr(0, colon);
    }

    std::string result{host};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string build_simple_response(StatusCode code, bool keep_alive,
                                  std::string_view extra_headers) {
    auto reason = to_reason_phrase(code);
    return fmt::format(
        "HTTP/1.1 {} {}\r\n"
        "Content-Type: text/plain; charset=utf-8\r\n"
        "Content-Length: {}\r\n"
        "Connection: {}\r\n"
        "{}"
        "\r\n"
        "{}\n",
        static_cast<uint16_t>(code), reason, reason.size() + 1,
        keep_alive ? "keep-alive" : "close", extra_headers, reason);
}

}  // namespace httpgate::http
