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

// Gateway Component Factory - Header
// Builds gateway components (targets, route snapshots, admission gates) from configuration

#pragma once

#include <memory>
#include <string>

#include "../control/config.hpp"
#include "admission.hpp"
#include "devbox.hpp"
#include "route_table.hpp"
#include "upstream.hpp"

namespace httpgate::gateway {

[[nodiscard]] PoolConfig to_pool_config(const control::PoolConfigSchema& config);

[[nodiscard]] CircuitBreakerConfig to_circuit_config(
    const control::CircuitBreakerConfigSchema& config);

[[nodiscard]] RoutePolicy to_route_policy(const control::RouteConfig& config);

[[nodiscard]] DevboxSettings to_devbox_settings(const control::DevboxConfig& config);

/// Route id as published ("route_<index>" when the config leaves it empty)
[[nodiscard]] std::string route_id_for(const control::RouteConfig& config, size_t index);

/// Build a route snapshot, reusing targets already known to the manager.
/// Routes naming an unknown upstream are skipped (validation reports them).
[[nodiscard]] std::shared_ptr<const RouteSnapshot> build_route_snapshot(
    const control::Config& config, UpstreamManager& upstreams);

/// Drop static targets no longer referenced by configuration
size_t prune_static_targets(const control::Config& config, UpstreamManager& upstreams);

/// Apply gateway-wide and per-route concurrency limits
void apply_admission(const control::Config& config, AdmissionController& admission);

/// Replace the devbox registry contents with the configured registrations
void load_devbox_registrations(const control::DevboxConfig& config, DevboxRegistry& registry);

}  // namespace httpgate::gateway
