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

// httpgate Devbox Routing - Header
// Host-pattern route source: <uniqueID>-<port>.<domain_suffix> -> in-cluster service

#pragma once

#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "../core/containers.hpp"
#include "route_table.hpp"
#include "upstream.hpp"

namespace httpgate::gateway {

/// Information about a registered devbox
struct DevboxInfo {
    std::string namespace_name;
};

/// Thread-safe registry mapping uniqueID to devbox info
class DevboxRegistry {
public:
    DevboxRegistry() = default;

    DevboxRegistry(const DevboxRegistry&) = delete;
    DevboxRegistry& operator=(const DevboxRegistry&) = delete;

    /// Register or update a devbox. Returns true if the id is new.
    bool register_devbox(std::string unique_id, std::string namespace_name);

    /// Returns true if the id was registered
    bool unregister_devbox(std::string_view unique_id);

    void clear();

    /// Swap in a whole new set of registrations at once (reload)
    void replace_all(core::fast_map<std::string, DevboxInfo> entries);

    /// Copy of the entry, so no lock is held by the caller
    [[nodiscard]] std::optional<DevboxInfo> get(std::string_view unique_id) const;

    [[nodiscard]] size_t size() const;
    [[nodiscard]] bool empty() const;

private:
    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, DevboxInfo> entries_;
};

/// Parsed devbox host
struct DevboxHost {
    std::string unique_id;
    uint16_t port = 0;
};

/// Parse "<uniqueID>-<port>.<anything>[:port]".
/// uniqueID: [a-z0-9-], not starting or ending with '-'; port: 1-65535.
/// The host is matched case-insensitively.
[[nodiscard]] std::optional<DevboxHost> parse_devbox_host(std::string_view host);

/// Devbox route settings
struct DevboxSettings {
    bool enabled = true;
    std::string domain_suffix = "devbox.example.com";
    std::string cluster_domain = "cluster.local";
    RoutePolicy policy;
    PoolConfig pool;
    CircuitBreakerConfig circuit;
    size_t max_targets = 1024;  // Cached rules and targets; least recently used are dropped
};

/// Route id shared by all devbox traffic (one admission gate)
inline constexpr std::string_view kDevboxRouteId = "devbox";

/// Upstream group of devbox targets in the UpstreamManager
inline constexpr std::string_view kDevboxGroup = "devbox";

/// Resolves devbox hosts to synthesized single-target route rules.
/// Targets are created on demand through the UpstreamManager, so each gets
/// a connection pool and a circuit breaker. At most max_targets are kept;
/// the least recently used rule and its target are dropped beyond that.
class DevboxResolver final : public RouteSource {
public:
    DevboxResolver(std::shared_ptr<DevboxRegistry> registry,
                   std::shared_ptr<UpstreamManager> upstreams, DevboxSettings settings);

    /// host: normalized (lowercase, no port)
    [[nodiscard]] std::shared_ptr<const RouteRule> lookup(std::string_view host,
                                                          std::string_view path) override;

    /// Replace settings (reload); cached rules are rebuilt on next use
    void configure(DevboxSettings settings);

    /// Drop cached rules and targets of devboxes no longer registered
    void prune_unregistered();

    [[nodiscard]] DevboxSettings settings() const;
    [[nodiscard]] size_t cached_rules() const;

    [[nodiscard]] const std::shared_ptr<DevboxRegistry>& registry() const noexcept {
        return registry_;
    }

private:
    struct CachedRule {
        std::string unique_id;
        std::shared_ptr<const RouteRule> rule;
        std::list<std::string>::iterator lru_pos;
    };

    /// Drop least recently used rules over the cap. Caller holds mutex_.
    void evict_over_cap();

    std::shared_ptr<DevboxRegistry> registry_;
    std::shared_ptr<UpstreamManager> upstreams_;

    mutable std::mutex mutex_;
    DevboxSettings settings_;
    core::fast_map<std::string, CachedRule> cache_;  // "host:port" -> rule
    std::list<std::string> lru_;                     // Most recently used first
};

}  // namespace httpgate::gateway
