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

// httpgate Listener - Header
// epoll accept loop feeding client connections to the worker pool

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include "containers.hpp"
#include "session.hpp"
#include "worker_pool.hpp"

namespace httpgate::gateway {
class ForwardingEngine;
}

namespace httpgate::core {

struct ListenerConfig {
    std::string address = "0.0.0.0";
    uint16_t port = 8080;
    int backlog = 512;
    uint32_t worker_threads = 0;    // 0 = default_worker_count()
    size_t max_connections = 10000;  // Queued plus in-service client connections
    std::chrono::milliseconds shutdown_timeout{30000};
    SessionLimits session;
};

/// Accepts client connections and runs one ClientSession per connection on
/// the worker pool. Connections beyond max_connections get a 503 and are closed.
///
/// Lifecycle: bind() -> run(running) on the main thread -> drain().
class Listener {
public:
    Listener(ListenerConfig config, std::shared_ptr<gateway::ForwardingEngine> engine);
    ~Listener();

    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    /// Bind and listen; starts the worker pool
    [[nodiscard]] std::error_code bind();

    /// Accept until `running` turns false. `tick` runs on this thread between
    /// epoll waits (at least every 100ms) for signal-driven housekeeping.
    [[nodiscard]] std::error_code run(const std::atomic<bool>& running,
                                      const std::function<void()>& tick = {});

    /// Stop accepting, give in-flight requests shutdown_timeout to finish,
    /// then shut down the remaining client sockets and join the workers.
    /// Returns the number of connections that had to be force-closed.
    size_t drain();

    /// Port actually bound (useful with port 0)
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    [[nodiscard]] bool draining() const noexcept { return draining_.load(); }
    [[nodiscard]] size_t active_connections() const;
    [[nodiscard]] uint64_t accepted() const noexcept { return accepted_.load(); }
    [[nodiscard]] uint64_t rejected() const noexcept { return rejected_.load(); }

private:
    void accept_pending();
    void serve(int fd, const std::string& peer);
    void reject_over_capacity(int fd);

    ListenerConfig config_;
    std::shared_ptr<gateway::ForwardingEngine> engine_;

    int listen_fd_ = -1;
    int epoll_fd_ = -1;
    uint16_t port_ = 0;

    std::unique_ptr<WorkerPool> workers_;
    std::atomic<bool> draining_{false};

    // Client sockets handed to the pool; drain() shuts these down on timeout
    mutable std::mutex connections_mutex_;
    std::condition_variable connections_cv_;
    fast_set<int> connections_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace httpgate::core
