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

// httpgate Gateway - Upstream Connection Pool
// Per-target bounded pool of reusable upstream connections, shared by all workers

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "../core/deadline.hpp"

namespace httpgate::gateway {

/// Pool limits for one upstream target
struct PoolConfig {
    size_t max_size = 64;  // Connections in use, idle or being established
    std::chrono::milliseconds idle_timeout{60000};
    std::chrono::milliseconds connect_timeout{3000};
    size_t max_requests_per_connection = 0;  // 0 = unlimited
};

/// Pooled upstream connection with metadata
struct PooledConnection {
    int fd = -1;
    core::Clock::time_point last_used;
    size_t request_count = 0;  // Number of requests served by this connection

    /// Check if connection has been idle too long
    [[nodiscard]] bool is_stale(core::Clock::time_point now,
                                std::chrono::milliseconds max_idle) const noexcept {
        return (now - last_used) > max_idle;
    }

    /// Check if connection has served too many requests (needs recycling)
    [[nodiscard]] bool needs_recycling(size_t max_requests) const noexcept {
        return max_requests > 0 && request_count >= max_requests;
    }

    /// Liveness probe: recv(MSG_PEEK | MSG_DONTWAIT) must report "no data yet"
    [[nodiscard]] bool is_healthy() const noexcept;
};

/// Establishes outbound transport connections (replaceable in tests)
class Connector {
public:
    virtual ~Connector() = default;

    /// Returns a connected fd, or -1 with ec set (std::errc::timed_out on deadline)
    [[nodiscard]] virtual int connect(const std::string& host, uint16_t port,
                                      core::Deadline deadline, std::error_code& ec) = 0;
};

/// Plain TCP connector (non-blocking connect bounded by the deadline)
class TcpConnector final : public Connector {
public:
    [[nodiscard]] int connect(const std::string& host, uint16_t port, core::Deadline deadline,
                              std::error_code& ec) override;
};

/// How a leased connection comes back to the pool
enum class ReleaseOutcome : uint8_t {
    Reusable,  // Response fully read, connection may serve another request
    Failed     // Transport error, protocol violation, close-delimited body
};

class ConnectionPool;

/// Exclusive use of one pooled connection by one in-flight request.
///
/// Move-only. Destroying a lease that was not released discards the
/// connection, so error paths never return a broken socket to the pool.
class ConnectionLease {
public:
    ConnectionLease() = default;
    ~ConnectionLease();

    ConnectionLease(const ConnectionLease&) = delete;
    ConnectionLease& operator=(const ConnectionLease&) = delete;
    ConnectionLease(ConnectionLease&& other) noexcept;
    ConnectionLease& operator=(ConnectionLease&& other) noexcept;

    [[nodiscard]] int fd() const noexcept { return conn_.fd; }
    [[nodiscard]] bool reused() const noexcept { return reused_; }
    [[nodiscard]] size_t request_count() const noexcept { return conn_.request_count; }
    [[nodiscard]] explicit operator bool() const noexcept { return pool_ != nullptr; }

    /// Hand the connection back; second and later calls are no-ops
    void release(ReleaseOutcome outcome);

private:
    friend class ConnectionPool;
    ConnectionLease(ConnectionPool* pool, PooledConnection conn, bool reused)
        : pool_(pool), conn_(conn), reused_(reused) {}

    ConnectionPool* pool_ = nullptr;
    PooledConnection conn_;
    bool reused_ = false;
};

/// Upstream connection pool (LIFO idle stack, mutex + condition variable)
///
/// Invariant: idle + leased + connecting <= max_size. Acquirers at the cap
/// block until a release, the deadline or cancellation.
/// The pool must outlive every lease it hands out.
class ConnectionPool {
public:
    ConnectionPool(std::string host, uint16_t port, PoolConfig config,
                   std::shared_ptr<Connector> connector);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    /// Lease a connection: reuse a healthy idle one, or establish a new one
    /// below the cap, or wait for a release.
    /// Errors (GatewayError): PoolExhausted, UpstreamUnreachable, UpstreamTimeout,
    /// ClientDisconnected.
    [[nodiscard]] std::optional<ConnectionLease> acquire(core::Deadline deadline,
                                                         std::error_code& ec,
                                                         const core::CancelToken* cancel = nullptr);

    /// Apply new limits (reload); excess connections drain as they are released
    void reconfigure(const PoolConfig& config);

    /// Close all idle connections
    void clear();

    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }
    [[nodiscard]] PoolConfig config() const;

    // Statistics
    [[nodiscard]] size_t idle_count() const;
    [[nodiscard]] size_t leased_count() const;
    [[nodiscard]] size_t total_count() const;
    [[nodiscard]] size_t peak_total() const;
    [[nodiscard]] size_t hits() const;
    [[nodiscard]] size_t misses() const;
    [[nodiscard]] size_t health_fails() const;
    [[nodiscard]] size_t evictions() const;
    [[nodiscard]] size_t exhausted() const;

    /// Log pool statistics
    void log_stats() const;

private:
    friend class ConnectionLease;

    void release(PooledConnection conn, ReleaseOutcome outcome);

    /// Close idle connections past idle_timeout (caller holds mutex_)
    void reap_stale_locked(core::Clock::time_point now);

    /// Close a connection that is leaving the pool (caller holds mutex_)
    void drop_locked(PooledConnection& conn);

    const std::string host_;
    const uint16_t port_;
    std::shared_ptr<Connector> connector_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    PoolConfig config_;
    std::vector<PooledConnection> idle_;  // LIFO stack (back = most recently used)
    size_t leased_ = 0;
    size_t connecting_ = 0;
    size_t total_ = 0;  // idle + leased + connecting

    // Statistics
    size_t peak_total_ = 0;
    size_t hits_ = 0;          // Pool hit (reused connection)
    size_t misses_ = 0;        // Pool miss (created new connection)
    size_t health_fails_ = 0;  // Liveness probe failures
    size_t evictions_ = 0;     // Recycled after max_requests_per_connection or idle expiry
    size_t exhausted_ = 0;     // Acquires that hit the deadline at the cap
};

}  // namespace httpgate::gateway
