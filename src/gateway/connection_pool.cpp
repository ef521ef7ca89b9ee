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

// httpgate Gateway - Upstream Connection Pool Implementation

#include "connection_pool.hpp"

#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <utility>

#include "../core/logging.hpp"
#include "../core/socket.hpp"
#include "errors.hpp"

using httpgate::core::close_fd;

namespace httpgate::gateway {

bool PooledConnection::is_healthy() const noexcept {
    if (fd < 0)
        return false;

    // recv() with MSG_PEEK|MSG_DONTWAIT on an idle connection returns:
    // - <0 with EAGAIN/EWOULDBLOCK: nothing pending, connection is alive
    // - 0: remote end closed (FIN received)
    // - >0: unsolicited bytes that would be read as the next response
    // - <0 with other errors: connection is broken
    char buf[1];
    ssize_t result = recv(fd, buf, 1, MSG_PEEK | MSG_DONTWAIT);
    if (result < 0) {
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
    return false;
}

int TcpConnector::connect(const std::string& host, uint16_t port, core::Deadline deadline,
                          std::error_code& ec) {
    return core::connect_with_deadline(host, port, deadline, ec);
}

// ConnectionLease

ConnectionLease::~ConnectionLease() {
    release(ReleaseOutcome::Failed);
}

ConnectionLease::ConnectionLease(ConnectionLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr)), conn_(other.conn_), reused_(other.reused_) {
    other.conn_.fd = -1;
}

ConnectionLease& ConnectionLease::operator=(ConnectionLease&& other) noexcept {
    if (this != &other) {
        release(ReleaseOutcome::Failed);
        pool_ = std::exchange(other.pool_, nullptr);
        conn_ = other.conn_;
        reused_ = other.reused_;
        other.conn_.fd = -1;
    }
    return *this;
}

void ConnectionLease::release(ReleaseOutcome outcome) {
    if (pool_ == nullptr) {
        return;
    }
    auto* pool = std::exchange(pool_, nullptr);
    pool->release(conn_, outcome);
    conn_.fd = -1;
}

// ConnectionPool

ConnectionPool::ConnectionPool(std::string host, uint16_t port, PoolConfig config,
                               std::shared_ptr<Connector> connector)
    : host_(std::move(host)),
      port_(port),
      connector_(std::move(connector)),
      config_(config) {
    idle_.reserve(config_.max_size);
}

ConnectionPool::~ConnectionPool() {
    clear();
}

std::optional<ConnectionLease> ConnectionPool::acquire(core::Deadline deadline,
                                                       std::error_code& ec,
                                                       const core::CancelToken* cancel) {
    std::unique_lock lock(mutex_);

    while (true) {
        if (cancel != nullptr && cancel->is_cancelled()) {
            ec = GatewayError::ClientDisconnected;
            return std::nullopt;
        }

        auto now = core::Clock::now();
        reap_stale_locked(now);

        // Most recently used first
        while (!idle_.empty()) {
            PooledConnection conn = idle_.back();
            idle_.pop_back();

            if (!conn.is_healthy()) {
                ++health_fails_;
                drop_locked(conn);
                continue;
            }

            ++leased_;
            ++hits_;
            return ConnectionLease(this, conn, true);
        }

        if (total_ < config_.max_size) {
            break;
        }

        if (now >= deadline) {
            ++exhausted_;
            ec = GatewayError::PoolExhausted;
            return std::nullopt;
        }

        // Wake up periodically to notice cancellation
        available_.wait_until(lock, std::min(deadline, now + core::kCancelCheckInterval));
    }

    // Reserve the slot, then connect without holding the lock
    ++total_;
    ++connecting_;
    ++misses_;
    peak_total_ = std::max(peak_total_, total_);
    auto connect_deadline = std::min(deadline, core::Clock::now() + config_.connect_timeout);
    lock.unlock();

    std::error_code connect_ec;
    int fd = connector_->connect(host_, port_, connect_deadline, connect_ec);

    lock.lock();
    --connecting_;

    if (fd < 0) {
        --total_;
        lock.unlock();
        available_.notify_one();

        if (core::expired(deadline)) {
            ec = GatewayError::UpstreamTimeout;
        } else {
            ec = GatewayError::UpstreamUnreachable;
        }

        if (auto* logger = logging::get_logger()) {
            LOG_DEBUG(logger, "[POOL] connect {}:{} failed: {}", host_, port_,
                      connect_ec.message());
        }
        return std::nullopt;
    }

    ++leased_;
    PooledConnection conn;
    conn.fd = fd;
    conn.last_used = core::Clock::now();
    return ConnectionLease(this, conn, false);
}

void ConnectionPool::release(PooledConnection conn, ReleaseOutcome outcome) {
    {
        std::lock_guard lock(mutex_);
        --leased_;
        ++conn.request_count;

        if (outcome == ReleaseOutcome::Failed) {
            drop_locked(conn);
        } else if (conn.needs_recycling(config_.max_requests_per_connection) ||
                   total_ > config_.max_size) {
            ++evictions_;
            drop_locked(conn);
        } else {
            conn.last_used = core::Clock::now();
            idle_.push_back(conn);
        }
    }
    available_.notify_one();
}

void ConnectionPool::reap_stale_locked(core::Clock::time_point now) {
    auto it = std::remove_if(idle_.begin(), idle_.end(), [&](PooledConnection& conn) {
        if (conn.is_stale(now, config_.idle_timeout)) {
            ++evictions_;
            close_fd(conn.fd);
            --total_;
            return true;
        }
        return false;
    });
    idle_.erase(it, idle_.end());
}

void ConnectionPool::drop_locked(PooledConnection& conn) {
    close_fd(conn.fd);
    conn.fd = -1;
    --total_;
}

void ConnectionPool::reconfigure(const PoolConfig& config) {
    {
        std::lock_guard lock(mutex_);
        config_ = config;
        while (!idle_.empty() && total_ > config_.max_size) {
            drop_locked(idle_.front());
            idle_.erase(idle_.begin());
        }
    }
    available_.notify_all();
}

void ConnectionPool::clear() {
    {
        std::lock_guard lock(mutex_);
        for (auto& conn : idle_) {
            drop_locked(conn);
        }
        idle_.clear();
    }
    available_.notify_all();
}

PoolConfig ConnectionPool::config() const {
    std::lock_guard lock(mutex_);
    return config_;
}

size_t ConnectionPool::idle_count() const {
    std::lock_guard lock(mutex_);
    return idle_.size();
}

size_t ConnectionPool::leased_count() const {
    std::lock_guard lock(mutex_);
    return leased_;
}

size_t ConnectionPool::total_count() const {
    std::lock_guard lock(mutex_);
    return total_;
}

size_t ConnectionPool::peak_total() const {
    std::lock_guard lock(mutex_);
    return peak_total_;
}

size_t ConnectionPool::hits() const {
    std::lock_guard lock(mutex_);
    return hits_;
}

size_t ConnectionPool::misses() const {
    std::lock_guard lock(mutex_);
    return misses_;
}

size_t ConnectionPool::health_fails() const {
    std::lock_guard lock(mutex_);
    return health_fails_;
}

size_t ConnectionPool::evictions() const {
    std::lock_guard lock(mutex_);
    return evictions_;
}

size_t ConnectionPool::exhausted() const {
    std::lock_guard lock(mutex_);
    return exhausted_;
}

void ConnectionPool::log_stats() const {
    auto* logger = logging::get_logger();
    if (!logger) {
        return;
    }

    std::lock_guard lock(mutex_);
    LOG_INFO(logger,
             "[POOL] {}:{} stats: idle={}, leased={}, total={}/{}, hits={}, misses={}, "
             "health_fails={}, evictions={}, exhausted={}",
             host_, port_, idle_.size(), leased_, total_, config_.max_size, hits_, misses_,
             health_fails_, evictions_, exhausted_);
}

}  // namespace httpgate::gateway
