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

// httpgate Forwarding Engine - Implementation

#include "forwarder.hpp"

#include <algorithm>
#include <vector>

#include "../core/logging.hpp"
#include "../core/socket.hpp"
#include "errors.hpp"

namespace httpgate::gateway {

namespace {

constexpr size_t kIoChunk = 16384;
constexpr size_t kMaxResponseHead = 65536;
constexpr std::chrono::milliseconds kErrorWriteTimeout{5000};

/// Who is to blame for a failed attempt (decides the health verdict)
enum class Fault : uint8_t {
    Upstream,        // Counts against the target's circuit
    Client,          // Client went away or sent garbage; no verdict
    StaleConnection  // Reused pooled connection died before answering; no verdict
};

}  // namespace

struct ForwardingEngine::RequestState {
    RequestState(ClientExchange& c, core::Deadline d)
        : client(c), deadline(d), cancel([this] { return client_gone(); }) {}

    // A client half-close only means it is gone while request bytes are still owed
    [[nodiscard]] bool half_close_counts() const { return !body_done && client.input.empty(); }
    [[nodiscard]] bool client_gone() const {
        return core::peer_closed(client.fd, half_close_counts());
    }

    ClientExchange& client;
    core::Deadline deadline;
    core::CancelToken cancel;
    core::Clock::time_point started = core::Clock::now();

    // Request body: bytes already read from the client, kept for replay
    std::vector<uint8_t> replay;
    size_t replay_limit = 0;
    bool replay_overflow = false;
    bool body_done = false;
    bool expect_continue = false;
    bool continue_sent = false;

    // Response to the client
    bool response_started = false;
    uint16_t status = 0;
    bool close_client = false;
};

struct ForwardingEngine::AttemptResult {
    std::error_code error;
    Fault fault = Fault::Upstream;
    bool upstream_reusable = false;
};

ForwardingEngine::ForwardingEngine(std::shared_ptr<RouteTable> routes,
                                   std::shared_ptr<AdmissionController> admission,
                                   std::shared_ptr<EventSink> events)
    : routes_(std::move(routes)), admission_(std::move(admission)), events_(std::move(events)) {}

std::string ForwardingEngine::build_upstream_head(const ClientExchange& client,
                                                  const UpstreamTarget& target) {
    const auto& head = client.head;
    std::string connection_value{head.get_header("Connection")};

    std::string req;
    req.reserve(512 + head.target.size() + head.headers.size() * 48);

    // Request line: METHOD target HTTP/1.1
    req += head.method_name;
    req += ' ';
    req += head.target;
    req += " HTTP/1.1\r\n";

    bool has_host = false;
    bool has_forwarded_host = false;
    bool has_request_id = false;
    std::string forwarded_for;
    std::string_view host_value;

    for (const auto& header : head.headers) {
        if (http::is_hop_by_hop(header.name, connection_value)) {
            continue;
        }

        // 100-continue is answered by the gateway itself
        if (http::header_name_equals(header.name, "Expect")) {
            continue;
        }

        if (http::header_name_equals(header.name, "X-Forwarded-For")) {
            if (!forwarded_for.empty()) {
                forwarded_for += ", ";
            }
            forwarded_for += header.value;
            continue;
        }

        if (http::header_name_equals(header.name, "Host")) {
            has_host = true;
            host_value = header.value;
        } else if (http::header_name_equals(header.name, "X-Forwarded-Host")) {
            has_forwarded_host = true;
        } else if (http::header_name_equals(header.name, "X-Request-Id")) {
            has_request_id = true;
        }

        req += header.name;
        req += ": ";
        req += header.value;
        req += "\r\n";
    }

    if (!has_host) {
        req += "Host: ";
        req += target.address();
        req += "\r\n";
    }

    req += "X-Forwarded-For: ";
    if (!forwarded_for.empty()) {
        req += forwarded_for;
        req += ", ";
    }
    req += client.peer_address;
    req += "\r\n";

    if (!has_forwarded_host && !host_value.empty()) {
        req += "X-Forwarded-Host: ";
        req += host_value;
        req += "\r\n";
    }

    if (!has_request_id && !client.correlation_id.empty()) {
        req += "X-Request-Id: ";
        req += client.correlation_id;
        req += "\r\n";
    }

    // Keep upstream connections poolable
    req += "Connection: keep-alive\r\n\r\n";
    return req;
}

std::string ForwardingEngine::build_client_head(const http::ResponseHead& response,
                                                bool keep_alive, bool interim) {
    std::string connection_value{response.get_header("Connection")};

    std::string out;
    out.reserve(256 + response.headers.size() * 48);

    out += "HTTP/1.1 ";
    out += std::to_string(response.status);
    out += ' ';
    out += response.reason;
    out += "\r\n";

    for (const auto& header : response.headers) {
        if (http::is_hop_by_hop(header.name, connection_value)) {
            continue;
        }
        out += header.name;
        out += ": ";
        out += header.value;
        out += "\r\n";
    }

    if (!interim) {
        out += keep_alive ? "Connection: keep-alive\r\n" : "Connection: close\r\n";
    }
    out += "\r\n";
    return out;
}

std::error_code ForwardingEngine::pull_body(RequestState& state, std::vector<uint8_t>& chunk) {
    chunk.clear();
    auto& input = state.client.input;

    while (true) {
        if (!input.empty()) {
            auto [result, consumed] = state.client.parser.feed(input.readable());
            if (result == http::ParseResult::Error) {
                return GatewayError::BadRequest;
            }

            // Relay the consumed bytes verbatim (chunk framing included)
            auto body = input.readable().first(consumed);
            chunk.assign(body.begin(), body.end());
            input.consume(consumed);

            // Client did not wait for 100 Continue
            if (consumed > 0) {
                state.expect_continue = false;
            }

            if (result == http::ParseResult::Complete) {
                state.body_done = true;
            }
            if (!chunk.empty() || state.body_done) {
                return {};
            }
        }

        if (state.expect_continue && !state.continue_sent) {
            state.continue_sent = true;
            if (core::send_all(state.client.fd, std::string_view("HTTP/1.1 100 Continue\r\n\r\n"),
                               state.deadline)) {
                return GatewayError::ClientDisconnected;
            }
        }

        std::error_code ec;
        ssize_t n = core::recv_some(state.client.fd, input.prepare(kIoChunk), state.deadline, ec);
        if (n < 0 && ec == std::errc::timed_out) {
            return GatewayError::UpstreamTimeout;
        }
        if (n <= 0) {
            return GatewayError::ClientDisconnected;
        }
        input.commit(static_cast<size_t>(n));
    }
}

std::error_code ForwardingEngine::send_request(RequestState& state, const UpstreamTarget& target,
                                               int upstream_fd, core::Deadline attempt_deadline,
                                               bool& client_fault) {
    client_fault = false;
    int client_fd = state.client.fd;

    std::string head = build_upstream_head(state.client, target);
    if (auto ec = core::send_all(upstream_fd, head, attempt_deadline, client_fd,
                                 state.half_close_counts())) {
        return ec;
    }

    // Body bytes an earlier attempt already took from the client
    if (!state.replay.empty()) {
        if (auto ec = core::send_all(upstream_fd, std::span<const uint8_t>(state.replay),
                                     attempt_deadline, client_fd, state.half_close_counts())) {
            return ec;
        }
    }

    std::vector<uint8_t> chunk;
    while (!state.body_done) {
        if (auto ec = pull_body(state, chunk)) {
            client_fault = true;
            return ec;
        }

        if (!state.replay_overflow) {
            if (state.replay.size() + chunk.size() <= state.replay_limit) {
                state.replay.insert(state.replay.end(), chunk.begin(), chunk.end());
            } else {
                // Too large to replay: this request can no longer be retried
                state.replay_overflow = true;
                state.replay.clear();
                state.replay.shrink_to_fit();
            }
        }

        if (!chunk.empty()) {
            if (auto ec = core::send_all(upstream_fd, std::span<const uint8_t>(chunk),
                                         attempt_deadline, client_fd, state.half_close_counts())) {
                return ec;
            }
        }
    }

    return {};
}

ForwardingEngine::AttemptResult ForwardingEngine::exchange(RequestState& state,
                                                           const UpstreamTarget& target,
                                                           int upstream_fd,
                                                           core::Deadline attempt_deadline) {
    const int client_fd = state.client.fd;
    bool received_any = false;

    auto transport_failure = [&](std::error_code ec) -> AttemptResult {
        if (ec == std::errc::operation_canceled) {
            return {GatewayError::ClientDisconnected, Fault::Client};
        }
        if (state.response_started) {
            return {GatewayError::PartialResponseFailure, Fault::Upstream};
        }
        if (ec == std::errc::timed_out) {
            return {GatewayError::UpstreamTimeout, Fault::Upstream};
        }
        return {GatewayError::UpstreamUnreachable,
                received_any ? Fault::Upstream : Fault::StaleConnection};
    };

    auto protocol_failure = [&]() -> AttemptResult {
        if (state.response_started) {
            return {GatewayError::PartialResponseFailure, Fault::Upstream};
        }
        return {GatewayError::UpstreamProtocolError, Fault::Upstream};
    };

    bool client_fault = false;
    if (auto ec = send_request(state, target, upstream_fd, attempt_deadline, client_fault)) {
        if (client_fault) {
            return {ec, Fault::Client};
        }
        return transport_failure(ec);
    }

    http::Parser parser(http::MessageKind::Response);
    parser.set_expect_no_body(state.client.head.method == http::Method::HEAD);

    core::IoBuffer buffer(kIoChunk);
    bool head_done = false;
    bool eof_body = false;

    while (true) {
        if (!head_done && !buffer.empty()) {
            size_t head_end = http::find_head_end(buffer.readable());
            if (head_end == 0 && buffer.size() > kMaxResponseHead) {
                return protocol_failure();
            }

            if (head_end > 0) {
                auto [result, consumed] = parser.feed(buffer.readable().first(head_end));
                if (result == http::ParseResult::Error) {
                    return protocol_failure();
                }
                buffer.consume(consumed);

                const auto& response = parser.response();
                if (response.is_informational()) {
                    // Upgrade is never forwarded, so 101 is a protocol violation
                    if (response.status == 101) {
                        return protocol_failure();
                    }
                    // 100 Continue was already answered by the gateway
                    if (response.status != 100) {
                        auto interim = build_client_head(response, true, true);
                        if (core::send_all(client_fd, interim, state.deadline)) {
                            return {GatewayError::ClientDisconnected, Fault::Client};
                        }
                        state.response_started = true;
                    }
                    parser.reset();
                    continue;
                }

                head_done = true;
                eof_body = parser.needs_eof();
                state.status = response.status;

                bool keep_alive = state.client.head.keep_alive && !state.client.draining &&
                                  !eof_body && state.body_done;
                state.close_client = !keep_alive;

                auto client_head = build_client_head(response, keep_alive, false);
                if (core::send_all(client_fd, client_head, state.deadline)) {
                    return {GatewayError::ClientDisconnected, Fault::Client};
                }
                state.response_started = true;

                if (result == http::ParseResult::Complete) {
                    return {{}, Fault::Upstream, parser.response().keep_alive && buffer.empty()};
                }
                continue;
            }
        }

        if (head_done && !buffer.empty()) {
            auto [result, consumed] = parser.feed(buffer.readable());
            if (result == http::ParseResult::Error) {
                return protocol_failure();
            }

            if (consumed > 0 &&
                core::send_all(client_fd, buffer.readable().first(consumed), state.deadline)) {
                return {GatewayError::ClientDisconnected, Fault::Client};
            }
            buffer.consume(consumed);

            if (result == http::ParseResult::Complete) {
                // Trailing bytes after the response mean the connection is out of sync
                bool reusable = !eof_body && parser.response().keep_alive && buffer.empty();
                return {{}, Fault::Upstream, reusable};
            }
        }

        std::error_code ec;
        ssize_t n = core::recv_some(upstream_fd, buffer.prepare(kIoChunk), attempt_deadline, ec,
                                    client_fd, state.half_close_counts());
        if (n < 0) {
            return transport_failure(ec);
        }
        if (n == 0) {
            if (head_done && eof_body && parser.finish() == http::ParseResult::Complete) {
                return {{}, Fault::Upstream, false};
            }
            return transport_failure(std::make_error_code(std::errc::connection_reset));
        }

        buffer.commit(static_cast<size_t>(n));
        received_any = true;
    }
}

size_t ForwardingEngine::next_rotation(const std::string& route_id) {
    std::lock_guard lock(rotation_mutex_);
    return static_cast<size_t>(rotation_[route_id]++);
}

ForwardResult ForwardingEngine::forward(ClientExchange& client) {
    ForwardResult result;
    std::string_view host = client.head.get_header("Host");

    std::error_code ec;
    auto resolution = routes_->resolve(host, client.head.path, ec);

    RoutePolicy policy = resolution ? resolution->rule->policy : RoutePolicy{};
    RequestState state(client, core::Clock::now() + policy.timeout);
    state.replay_limit = policy.retry_buffer_bytes;
    state.body_done = client.parser.message_complete();
    state.expect_continue = !state.body_done && client.head.version == http::Version::HTTP_1_1 &&
                            http::header_name_equals(client.head.get_header("Expect"),
                                                     "100-continue");

    if (!resolution) {
        result.error = ec;
        finish(state, result);
        return result;
    }

    const auto& rule = *resolution->rule;
    result.route_id = rule.id;

    // Admission: gateway-wide first, then the route
    auto global_slot = admission_->acquire(AdmissionScope::global(), state.deadline, ec,
                                           &state.cancel);
    if (!global_slot) {
        result.error = ec;
        finish(state, result);
        return result;
    }

    auto route_slot = admission_->acquire(AdmissionScope::route(rule.id), state.deadline, ec,
                                          &state.cancel);
    if (!route_slot) {
        global_slot->release();
        result.error = ec;
        finish(state, result);
        return result;
    }

    const auto& candidates = resolution->candidates;
    const size_t count = candidates.size();
    const size_t start = resolution->degraded ? next_rotation(rule.id) % count : 0;
    const uint32_t max_attempts = 1 + policy.max_retries;

    std::error_code last_error;
    bool stale_retry_used = false;
    uint32_t attempt = 0;
    size_t index = start;

    while (attempt < max_attempts) {
        if (core::expired(state.deadline)) {
            last_error = GatewayError::UpstreamTimeout;
            break;
        }
        if (state.cancel.is_cancelled()) {
            last_error = GatewayError::ClientDisconnected;
            break;
        }

        const auto& target = candidates[index % count];
        result.target = target->address();

        Permit permit = resolution->degraded ? target->circuit().force_acquire()
                                             : target->circuit().try_acquire();
        if (permit == Permit::Denied) {
            // Circuit opened since resolution
            last_error = GatewayError::UpstreamUnreachable;
            ++attempt;
            ++index;
            continue;
        }

        target->total_requests.fetch_add(1, std::memory_order_relaxed);

        core::Deadline attempt_deadline = state.deadline;
        if (policy.attempt_timeout.count() > 0) {
            attempt_deadline = std::min(state.deadline, core::Clock::now() + policy.attempt_timeout);
        }

        auto lease = target->pool().acquire(attempt_deadline, ec, &state.cancel);
        if (!lease) {
            if (ec == GatewayError::UpstreamUnreachable || ec == GatewayError::UpstreamTimeout) {
                target->circuit().record_failure(permit);
                target->total_failures.fetch_add(1, std::memory_order_relaxed);
            } else {
                target->circuit().release_probe(permit);
            }

            last_error = ec;
            if (ec == GatewayError::ClientDisconnected || core::expired(state.deadline)) {
                break;
            }
            if (auto* logger = logging::get_logger()) {
                LOG_UPSTREAM(logger, "connect_failed", target->address(), ec.message(),
                             client.correlation_id);
            }
            ++attempt;
            ++index;
            continue;
        }

        auto attempt_start = core::Clock::now();
        bool reused = lease->reused();
        AttemptResult outcome = exchange(state, *target, lease->fd(), attempt_deadline);

        if (!outcome.error) {
            auto latency = std::chrono::duration_cast<std::chrono::microseconds>(
                core::Clock::now() - attempt_start);
            if (state.status >= 500) {
                target->circuit().record_failure(permit);
                target->total_failures.fetch_add(1, std::memory_order_relaxed);
            } else {
                target->circuit().record_success(permit, latency);
            }
            lease->release(outcome.upstream_reusable ? ReleaseOutcome::Reusable
                                                     : ReleaseOutcome::Failed);
            last_error.clear();
            break;
        }

        lease->release(ReleaseOutcome::Failed);
        last_error = outcome.error;

        bool stale = outcome.fault == Fault::StaleConnection && reused;
        if (outcome.fault == Fault::Upstream ||
            (outcome.fault == Fault::StaleConnection && !reused)) {
            target->circuit().record_failure(permit);
            target->total_failures.fetch_add(1, std::memory_order_relaxed);
        } else {
            target->circuit().release_probe(permit);
        }

        bool retryable = outcome.fault != Fault::Client && !state.response_started &&
                         !state.replay_overflow && !core::expired(state.deadline) &&
                         (outcome.error == GatewayError::UpstreamUnreachable ||
                          outcome.error == GatewayError::UpstreamTimeout);
        if (!retryable) {
            break;
        }

        if (auto* logger = logging::get_logger()) {
            LOG_UPSTREAM(logger, stale ? "stale_connection" : "retry", target->address(),
                         outcome.error.message(), client.correlation_id);
        }

        if (stale && !stale_retry_used) {
            // A pooled connection closed by the upstream while idle: retry the
            // same target on a fresh connection without spending the budget
            stale_retry_used = true;
            continue;
        }

        ++attempt;
        ++index;
    }

    result.retries = attempt > 0 ? std::min(attempt, max_attempts - 1) : 0;

    route_slot->release();
    global_slot->release();

    result.error = last_error;
    finish(state, result);
    return result;
}

void ForwardingEngine::finish(RequestState& state, ForwardResult& result) {
    auto& client = state.client;
    result.response_started = state.response_started;

    if (!result.error) {
        result.status = state.status;
        result.close_connection = state.close_client;
    } else if (state.response_started) {
        // Response already under way: the only signal left is closing the connection
        if (result.error != GatewayError::ClientDisconnected) {
            result.error = GatewayError::PartialResponseFailure;
        }
        result.status = state.status;
        result.close_connection = true;
    } else {
        // Unread request body would be parsed as the next request
        bool keep_alive = client.head.keep_alive && !client.draining && state.body_done &&
                          result.error != GatewayError::BadRequest;

        auto response = build_error_response(result.error, keep_alive);
        if (!response.empty()) {
            auto status = status_for(result.error);
            if (core::send_all(client.fd, response, core::deadline_after(kErrorWriteTimeout))) {
                keep_alive = false;
            } else if (status) {
                result.status = static_cast<uint16_t>(*status);
            }
        } else {
            keep_alive = false;
        }
        result.close_connection = !keep_alive;
    }

    if (events_) {
        RequestEvent event;
        event.method = client.head.method_name;
        event.host = std::string(client.head.get_header("Host"));
        event.path = client.head.path;
        event.route = result.route_id;
        event.target = result.target;
        event.status = result.status;
        event.retries = result.retries;
        event.latency = std::chrono::duration_cast<std::chrono::microseconds>(
            core::Clock::now() - state.started);
        event.error = result.error;
        event.correlation_id = client.correlation_id;
        events_->on_request(event);
    }
}

}  // namespace httpgate::gateway
