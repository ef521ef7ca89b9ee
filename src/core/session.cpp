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

// httpgate Client Session - Implementation

#include "session.hpp"

#include <algorithm>

#include "../gateway/forwarder.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace httpgate::core {

namespace {

constexpr size_t kReadChunk = 16384;
constexpr size_t kMaxCorrelationIdLength = 128;
constexpr std::chrono::milliseconds kDrainCheckInterval{100};
constexpr std::chrono::milliseconds kRejectWriteTimeout{1000};

}  // namespace

ClientSession::ClientSession(int fd, std::string peer_address,
                             gateway::ForwardingEngine& engine, const SessionLimits& limits,
                             const std::atomic<bool>& draining)
    : fd_(fd),
      peer_address_(std::move(peer_address)),
      engine_(engine),
      limits_(limits),
      draining_(draining),
      input_(kReadChunk) {}

void ClientSession::run() {
    while (true) {
        parser_.reset();

        switch (read_head()) {
            case HeadStatus::Ready:
                break;
            case HeadStatus::Closed:
                return;
            case HeadStatus::TooLarge:
                reject(http::StatusCode::RequestHeaderFieldsTooLarge);
                return;
            case HeadStatus::Malformed:
                reject(http::StatusCode::BadRequest);
                return;
            case HeadStatus::TimedOut:
                reject(http::StatusCode::RequestTimeout);
                return;
        }

        const auto& head = parser_.request();
        gateway::ClientExchange exchange{
            .fd = fd_,
            .peer_address = peer_address_,
            .head = head,
            .parser = parser_,
            .input = input_,
            .correlation_id = correlation_id_for(head),
            .draining = draining_.load(std::memory_order_acquire),
        };

        auto result = engine_.forward(exchange);
        ++requests_served_;

        if (result.close_connection || !head.keep_alive || !parser_.message_complete()) {
            return;
        }
    }
}

ClientSession::HeadStatus ClientSession::read_head() {
    bool started = !input_.empty();
    Deadline deadline = Clock::now() + (started ? limits_.read_timeout : limits_.idle_timeout);

    while (true) {
        if (!input_.empty()) {
            auto data = input_.readable();
            size_t head_end = http::find_head_end(data);

            if (head_end == 0) {
                if (data.size() >= limits_.max_header_size) {
                    return HeadStatus::TooLarge;
                }
            } else {
                if (head_end > limits_.max_header_size) {
                    return HeadStatus::TooLarge;
                }

                // Only the head goes through the parser here; the body is the forwarder's
                auto [result, consumed] = parser_.feed(data.first(head_end));
                if (result == http::ParseResult::Error || !parser_.headers_complete()) {
                    if (auto* logger = logging::get_logger()) {
                        LOG_DEBUG(logger, "Malformed request from {}: {}", peer_address_,
                                  parser_.error_message());
                    }
                    return HeadStatus::Malformed;
                }
                input_.consume(consumed);
                return HeadStatus::Ready;
            }
        }

        // Between requests a drain closes the connection right away
        if (!started && draining_.load(std::memory_order_acquire)) {
            return HeadStatus::Closed;
        }

        Deadline slice = std::min(deadline, Clock::now() + kDrainCheckInterval);
        std::error_code ec;
        ssize_t n = recv_some(fd_, input_.prepare(kReadChunk), slice, ec);

        if (n == 0) {
            return HeadStatus::Closed;
        }
        if (n < 0) {
            if (ec != std::errc::timed_out) {
                return HeadStatus::Closed;
            }
            if (expired(deadline)) {
                return started ? HeadStatus::TimedOut : HeadStatus::Closed;
            }
            continue;
        }

        input_.commit(static_cast<size_t>(n));
        if (!started) {
            started = true;
            deadline = Clock::now() + limits_.read_timeout;
        }
    }
}

void ClientSession::reject(http::StatusCode code) {
    auto response = http::build_simple_response(code, false);
    if (auto ec = send_all(fd_, response, deadline_after(kRejectWriteTimeout))) {
        if (auto* logger = logging::get_logger()) {
            LOG_DEBUG(logger, "Could not send {} to {}: {}", static_cast<int>(code),
                      peer_address_, ec.message());
        }
    }
}

std::string ClientSession::correlation_id_for(const http::RequestHead& head) const {
    std::string_view supplied = head.get_header("X-Request-Id");
    if (!supplied.empty() && supplied.size() <= kMaxCorrelationIdLength) {
        return std::string(supplied);
    }
    return logging::generate_correlation_id();
}

} // namespace httpgate::core
