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

// httpgate Forwarding Engine - Header
// Orchestrates one request end to end: route, admit, lease, relay, record

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>

#include "../core/buffer.hpp"
#include "../core/containers.hpp"
#include "../core/deadline.hpp"
#include "../http/http.hpp"
#include "../http/parser.hpp"
#include "admission.hpp"
#include "events.hpp"
#include "route_table.hpp"

namespace httpgate::gateway {

/// Client side of one request, as handed over by the connection loop.
///
/// The request parser has consumed the head; `input` holds client bytes not
/// yet consumed (the start of the body and possibly pipelined requests).
struct ClientExchange {
    int fd = -1;
    std::string_view peer_address;
    const http::RequestHead& head;
    http::Parser& parser;
    core::IoBuffer& input;
    std::string correlation_id;
    bool draining = false;  // Gateway shutting down: close after this response
};

/// What happened to one request
struct ForwardResult {
    uint16_t status = 0;            // Status sent to the client (0 = none)
    bool response_started = false;  // Response bytes reached the client
    bool close_connection = false;  // Client connection must not be reused
    std::error_code error;
    uint32_t retries = 0;
    std::string route_id;
    std::string target;
};

/// Forwarding engine (shared by all workers; per-request state lives on the caller's stack)
class ForwardingEngine {
public:
    ForwardingEngine(std::shared_ptr<RouteTable> routes,
                     std::shared_ptr<AdmissionController> admission,
                     std::shared_ptr<EventSink> events);

    ForwardingEngine(const ForwardingEngine&) = delete;
    ForwardingEngine& operator=(const ForwardingEngine&) = delete;

    /// Forward one request and relay the response (or an error response) to the client.
    /// Never throws; every lease and admission slot is released before returning.
    [[nodiscard]] ForwardResult forward(ClientExchange& client);

    /// Build the request head sent upstream
    [[nodiscard]] static std::string build_upstream_head(const ClientExchange& client,
                                                         const UpstreamTarget& target);

    /// Build the response head sent to the client
    [[nodiscard]] static std::string build_client_head(const http::ResponseHead& response,
                                                       bool keep_alive, bool interim);

    [[nodiscard]] const std::shared_ptr<EventSink>& events() const noexcept { return events_; }

private:
    struct RequestState;
    struct AttemptResult;

    [[nodiscard]] AttemptResult exchange(RequestState& state, const UpstreamTarget& target,
                                         int upstream_fd, core::Deadline attempt_deadline);

    [[nodiscard]] std::error_code send_request(RequestState& state, const UpstreamTarget& target,
                                               int upstream_fd, core::Deadline attempt_deadline,
                                               bool& client_fault);

    [[nodiscard]] std::error_code pull_body(RequestState& state, std::vector<uint8_t>& chunk);

    /// Start index for degraded resolutions (round-robin per route)
    [[nodiscard]] size_t next_rotation(const std::string& route_id);

    void finish(RequestState& state, ForwardResult& result);

    std::shared_ptr<RouteTable> routes_;
    std::shared_ptr<AdmissionController> admission_;
    std::shared_ptr<EventSink> events_;

    std::mutex rotation_mutex_;
    core::fast_map<std::string, uint64_t> rotation_;
};

}  // namespace httpgate::gateway
