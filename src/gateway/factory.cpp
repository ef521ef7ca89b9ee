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

// Gateway Component Factory - Implementation

#include "factory.hpp"

#include "../core/containers.hpp"
#include "../core/logging.hpp"
#include "../http/http.hpp"

namespace httpgate::gateway {

static_assert(kDevboxRouteId == control::kReservedDevboxRouteId);

PoolConfig to_pool_config(const control::PoolConfigSchema& config) {
    PoolConfig pool;
    pool.max_size = config.max_size;
    pool.idle_timeout = std::chrono::milliseconds(config.idle_timeout_ms);
    pool.connect_timeout = std::chrono::milliseconds(config.connect_timeout_ms);
    pool.max_requests_per_connection = config.max_requests_per_connection;
    return pool;
}

CircuitBreakerConfig to_circuit_config(const control::CircuitBreakerConfigSchema& config) {
    CircuitBreakerConfig cb;
    cb.failure_threshold = config.failure_threshold;
    cb.window_ms = config.window_ms;
    cb.cooldown_ms = config.cooldown_ms;
    cb.backoff_multiplier = config.backoff_multiplier;
    cb.max_cooldown_ms = config.max_cooldown_ms;
    return cb;
}

RoutePolicy to_route_policy(const control::RouteConfig& config) {
    RoutePolicy policy;
    policy.timeout = std::chrono::milliseconds(config.timeout_ms);
    policy.attempt_timeout = std::chrono::milliseconds(config.attempt_timeout_ms);
    policy.max_retries = config.max_retries;
    policy.max_concurrency = config.max_concurrency;
    policy.retry_buffer_bytes = config.retry_buffer_bytes;
    return policy;
}

DevboxSettings to_devbox_settings(const control::DevboxConfig& config) {
    DevboxSettings settings;
    settings.enabled = config.enabled;
    settings.domain_suffix = http::normalize_host(config.domain_suffix);
    settings.cluster_domain = config.cluster_domain;
    settings.policy.timeout = std::chrono::milliseconds(config.timeout_ms);
    settings.policy.attempt_timeout = std::chrono::milliseconds(config.attempt_timeout_ms);
    settings.policy.max_retries = config.max_retries;
    settings.policy.max_concurrency = config.max_concurrency;
    settings.policy.retry_buffer_bytes = config.retry_buffer_bytes;
    settings.pool = to_pool_config(config.pool);
    settings.circuit = to_circuit_config(config.circuit_breaker);
    settings.max_targets = config.max_targets;
    return settings;
}

std::string route_id_for(const control::RouteConfig& config, size_t index) {
    return config.id.empty() ? "route_" + std::to_string(index) : config.id;
}

std::shared_ptr<const RouteSnapshot> build_route_snapshot(const control::Config& config,
                                                          UpstreamManager& upstreams) {
    core::fast_map<std::string, const control::UpstreamConfig*> by_name;
    for (const auto& upstream : config.upstreams) {
        by_name.emplace(upstream.name, &upstream);
    }

    std::vector<RouteRule> rules;
    rules.reserve(config.routes.size());

    for (size_t i = 0; i < config.routes.size(); ++i) {
        const auto& route_config = config.routes[i];

        auto it = by_name.find(route_config.upstream);
        if (it == by_name.end()) {
            if (auto* logger = logging::get_logger()) {
                LOG_WARNING(logger, "Route {} references unknown upstream {}, skipped",
                            route_id_for(route_config, i), route_config.upstream);
            }
            continue;
        }
        const auto& upstream_config = *it->second;

        RouteRule rule;
        rule.id = route_id_for(route_config, i);
        rule.host_pattern = route_config.host;
        rule.path_prefix = route_config.path;
        rule.policy = to_route_policy(route_config);

        auto pool = to_pool_config(upstream_config.pool);
        auto circuit = to_circuit_config(upstream_config.circuit_breaker);
        for (const auto& backend : upstream_config.backends) {
            rule.targets.push_back(upstreams.get_or_create(upstream_config.name, backend.host,
                                                           backend.port, backend.weight, pool,
                                                           circuit));
        }

        rules.push_back(std::move(rule));
    }

    return std::make_shared<const RouteSnapshot>(std::move(rules));
}

size_t prune_static_targets(const control::Config& config, UpstreamManager& upstreams) {
    core::fast_set<std::string> keep;
    for (const auto& upstream : config.upstreams) {
        for (const auto& backend : upstream.backends) {
            keep.insert(UpstreamTarget::make_key(upstream.name, backend.host, backend.port));
        }
    }

    core::fast_set<std::string> groups;
    for (const auto& target : upstreams.targets()) {
        if (target->group() != kDevboxGroup) {
            groups.insert(target->group());
        }
    }

    size_t pruned = 0;
    for (const auto& group : groups) {
        pruned += upstreams.prune(group, keep);
    }
    return pruned;
}

void apply_admission(const control::Config& config, AdmissionController& admission) {
    admission.set_global_limit(config.admission.max_in_flight, config.admission.max_queue);

    core::fast_set<std::string> keep;
    for (size_t i = 0; i < config.routes.size(); ++i) {
        auto id = route_id_for(config.routes[i], i);
        admission.configure_route(id, config.routes[i].max_concurrency);
        keep.insert(std::move(id));
    }

    admission.configure_route(std::string(kDevboxRouteId), config.devbox.max_concurrency);
    keep.insert(std::string(kDevboxRouteId));

    admission.retain_routes(keep);
}

void load_devbox_registrations(const control::DevboxConfig& config, DevboxRegistry& registry) {
    core::fast_map<std::string, DevboxInfo> entries;
    for (const auto& registration : config.registrations) {
        entries.insert_or_assign(registration.id, DevboxInfo{registration.namespace_name});
    }
    registry.replace_all(std::move(entries));
}

}  // namespace httpgate::gateway
