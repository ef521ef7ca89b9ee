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

// httpgate Upstream - Implementation

#include "upstream.hpp"

#include <fmt/format.h>

#include "../core/logging.hpp"

namespace httpgate::gateway {

// UpstreamTarget implementation

UpstreamTarget::UpstreamTarget(std::string group, std::string host, uint16_t port,
                               uint32_t weight, const PoolConfig& pool_config,
                               const CircuitBreakerConfig& circuit_config,
                               std::shared_ptr<Connector> connector)
    : group_(std::move(group)),
      host_(std::move(host)),
      port_(port),
      address_(fmt::format("{}:{}", host_, port_)),
      key_(make_key(group_, host_, port_)),
      weight_(weight),
      circuit_(circuit_config),
      pool_(host_, port_, pool_config, std::move(connector)) {}

std::string UpstreamTarget::make_key(std::string_view group, std::string_view host,
                                     uint16_t port) {
    return fmt::format("{}/{}:{}", group, host, port);
}

// UpstreamManager implementation

UpstreamManager::UpstreamManager(std::shared_ptr<Connector> connector)
    : connector_(std::move(connector)), listener_slot_(std::make_shared<ListenerSlot>()) {}

std::shared_ptr<UpstreamTarget> UpstreamManager::get_or_create(
    std::string_view group, const std::string& host, uint16_t port, uint32_t weight,
    const PoolConfig& pool_config, const CircuitBreakerConfig& circuit_config) {
    auto key = UpstreamTarget::make_key(group, host, port);

    std::lock_guard lock(mutex_);
    if (auto it = targets_.find(key); it != targets_.end()) {
        auto& target = it->second;
        target->set_weight(weight);
        target->pool().reconfigure(pool_config);
        target->circuit().reconfigure(circuit_config);
        return target;
    }

    auto target = std::make_shared<UpstreamTarget>(std::string(group), host, port, weight,
                                                   pool_config, circuit_config, connector_);

    // The breaker is owned by the target, so the raw pointer outlives the callback
    UpstreamTarget* self = target.get();
    target->circuit().set_listener(
        [slot = listener_slot_, self](CircuitState from, CircuitState to) {
            TargetHealthListener listener;
            {
                std::lock_guard slot_lock(slot->mutex);
                listener = slot->listener;
            }
            if (listener) {
                listener(*self, from, to);
            }
        });

    targets_.emplace(std::move(key), target);
    return target;
}

std::shared_ptr<UpstreamTarget> UpstreamManager::find(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = targets_.find(std::string(key));
    return it != targets_.end() ? it->second : nullptr;
}

size_t UpstreamManager::prune(std::string_view group, const core::fast_set<std::string>& keep) {
    std::vector<std::string> doomed;

    std::lock_guard lock(mutex_);
    for (const auto& [key, target] : targets_) {
        if (target->group() == group && !keep.contains(key)) {
            doomed.push_back(key);
        }
    }
    for (const auto& key : doomed) {
        targets_.erase(key);
    }
    return doomed.size();
}

bool UpstreamManager::remove(std::string_view key) {
    std::lock_guard lock(mutex_);
    auto it = targets_.find(std::string(key));
    if (it == targets_.end()) {
        return false;
    }
    targets_.erase(it);
    return true;
}

void UpstreamManager::set_health_listener(TargetHealthListener listener) {
    std::lock_guard lock(listener_slot_->mutex);
    listener_slot_->listener = std::move(listener);
}

std::vector<std::shared_ptr<UpstreamTarget>> UpstreamManager::targets() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<UpstreamTarget>> result;
    result.reserve(targets_.size());
    for (const auto& [key, target] : targets_) {
        result.push_back(target);
    }
    return result;
}

size_t UpstreamManager::size() const {
    std::lock_guard lock(mutex_);
    return targets_.size();
}

void UpstreamManager::log_stats() const {
    auto* logger = logging::get_logger();
    if (!logger) {
        return;
    }

    for (const auto& target : targets()) {
        LOG_INFO(logger, "[UPSTREAM] {} state={} requests={} failures={} latency_us={}",
                 target->key(), to_string(target->circuit().state()),
                 target->total_requests.load(std::memory_order_relaxed),
                 target->total_failures.load(std::memory_order_relaxed),
                 target->circuit().smoothed_latency().count());
        target->pool().log_stats();
    }
}

}  // namespace httpgate::gateway
