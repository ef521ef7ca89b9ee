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

// httpgate Client Session - Header
// Per-connection HTTP/1.x keep-alive loop run on a worker thread

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "../http/parser.hpp"
#include "buffer.hpp"
#include "deadline.hpp"

namespace httpgate::gateway {
class ForwardingEngine;
}

namespace httpgate::core {

/// Timeouts and limits applied while reading client requests
struct SessionLimits {
    std::chrono::milliseconds idle_timeout{60000};  // Waiting for the next request
    std::chrono::milliseconds read_timeout{30000};  // Completing a request head once started
    size_t max_header_size = 16384;
};

/// One client connection, served until either side ends keep-alive.
///
/// The session reads and parses request heads; everything after the head
/// (body, response, errors) is the forwarding engine's job. Bytes the client
/// pipelined behind a request stay in the input buffer for the next turn.
/// The session does not own the socket; the listener closes it.
class ClientSession {
public:
    ClientSession(int fd, std::string peer_address, gateway::ForwardingEngine& engine,
                  const SessionLimits& limits, const std::atomic<bool>& draining);

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    /// Serve requests until the connection should close
    void run();

    [[nodiscard]] uint64_t requests_served() const noexcept { return requests_served_; }

private:
    enum class HeadStatus : uint8_t {
        Ready,      // A complete head was parsed
        Closed,     // Peer closed, idle timeout or drain between requests
        TooLarge,   // Head exceeded max_header_size
        Malformed,  // Parser rejected the head
        TimedOut    // Head started but not completed within read_timeout
    };

    [[nodiscard]] HeadStatus read_head();

    /// Send a gateway-generated response on a connection that is about to close
    void reject(http::StatusCode code);

    [[nodiscard]] std::string correlation_id_for(const http::RequestHead& head) const;

    int fd_;
    std::string peer_address_;
    gateway::ForwardingEngine& engine_;
    SessionLimits limits_;
    const std::atomic<bool>& draining_;

    IoBuffer input_;
    http::Parser parser_{http::MessageKind::Request};
    uint64_t requests_served_ = 0;
};

} // namespace httpgate::core
