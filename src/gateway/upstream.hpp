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

// httpgate Upstream - Header
// Upstream targets (address + pool + health) and the registry that shares them

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "circuit_breaker.hpp"
#include "connection_pool.hpp"

namespace httpgate::gateway {

/// One upstream server: network address, weight, health state and connection pool.
///
/// Targets are shared between route snapshots, so a reload that keeps an
/// address keeps its pool and its health history.
class UpstreamTarget {
public:
    UpstreamTarget(std::string group, std::string host, uint16_t port, uint32_t weight,
                   const PoolConfig& pool_config, const CircuitBreakerConfig& circuit_config,
                   std::shared_ptr<Connector> connector);

    UpstreamTarget(const UpstreamTarget&) = delete;
    UpstreamTarget& operator=(const UpstreamTarget&) = delete;

    [[nodiscard]] const std::string& group() const noexcept { return group_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] uint16_t port() const noexcept { return port_; }

    /// "host:port"
    [[nodiscard]] const std::string& address() const noexcept { return address_; }

    /// Registry key: "group/host:port"
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    [[nodiscard]] uint32_t weight() const noexcept {
        return weight_.load(std::memory_order_relaxed);
    }
    void set_weight(uint32_t weight) noexcept { weight_.store(weight, std::memory_order_relaxed); }

    [[nodiscard]] CircuitBreaker& circuit() noexcept { return circuit_; }
    [[nodiscard]] const CircuitBreaker& circuit() const noexcept { return circuit_; }

    [[nodiscard]] ConnectionPool& pool() noexcept { return pool_; }
    [[nodiscard]] const ConnectionPool& pool() const noexcept { return pool_; }

    /// Eligible for normal (non-degraded) routing
    [[nodiscard]] bool is_routable(core::Clock::time_point now = core::Clock::now()) const {
        return circuit_.is_routable(now);
    }

    // Statistics
    std::atomic<uint64_t> total_requests{0};
    std::atomic<uint64_t> total_failures{0};

    /// Build the registry key for an address in a group
    [[nodiscard]] static std::string make_key(std::string_view group, std::string_view host,
                                              uint16_t port);

private:
    std::string group_;
    std::string host_;
    uint16_t port_;
    std::string address_;
    std::string key_;
    std::atomic<uint32_t> weight_;
    CircuitBreaker circuit_;
    ConnectionPool pool_;
};

/// Observer for target health transitions
using TargetHealthListener =
    std::function<void(const UpstreamTarget& target, CircuitState from, CircuitState to)>;

/// Upstream manager (registry of all targets, keyed by group and address)
class UpstreamManager {
public:
    explicit UpstreamManager(std::shared_ptr<Connector> connector = std::make_shared<TcpConnector>());
    ~UpstreamManager() = default;

    // Non-copyable, non-movable
    UpstreamManager(const UpstreamManager&) = delete;
    UpstreamManager& operator=(const UpstreamManager&) = delete;

    /// Return the existing target for (group, host, port) with its settings
    /// updated, or create a new one
    [[nodiscard]] std::shared_ptr<UpstreamTarget> get_or_create(
        std::string_view group, const std::string& host, uint16_t port, uint32_t weight,
        const PoolConfig& pool_config, const CircuitBreakerConfig& circuit_config);

    /// Find target by key ("group/host:port")
    [[nodiscard]] std::shared_ptr<UpstreamTarget> find(std::string_view key) const;

    /// Drop targets of a group whose keys are not in keep.
    /// In-flight requests holding a dropped target keep it alive until they finish.
    size_t prune(std::string_view group, const core::fast_set<std::string>& keep);

    /// Drop one target by key. Returns true if it was registered.
    bool remove(std::string_view key);

    /// Observe health transitions of every target (current and future)
    void set_health_listener(TargetHealthListener listener);

    /// Snapshot of all registered targets
    [[nodiscard]] std::vector<std::shared_ptr<UpstreamTarget>> targets() const;

    [[nodiscard]] size_t size() const;

    /// Log pool and health statistics for every target
    void log_stats() const;

private:
    struct ListenerSlot {
        std::mutex mutex;
        TargetHealthListener listener;
    };

    std::shared_ptr<Connector> connector_;
    std::shared_ptr<ListenerSlot> listener_slot_;

    mutable std::mutex mutex_;
    core::fast_map<std::string, std::shared_ptr<UpstreamTarget>> targets_;
};

}  // namespace httpgate::gateway
