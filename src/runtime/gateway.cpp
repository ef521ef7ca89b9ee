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

// httpgate Runtime - Implementation

#include "gateway.hpp"

#include "../core/logging.hpp"
#include "../gateway/factory.hpp"

namespace httpgate::runtime {

core::ListenerConfig to_listener_config(const control::ServerConfig& server) {
    core::ListenerConfig config;
    config.address = server.listen_address;
    config.port = server.listen_port;
    config.backlog = static_cast<int>(server.backlog);
    config.worker_threads = server.worker_threads;
    config.max_connections = server.max_connections;
    config.shutdown_timeout = std::chrono::milliseconds(server.shutdown_timeout);
    config.session.idle_timeout = std::chrono::milliseconds(server.idle_timeout);
    config.session.read_timeout = std::chrono::milliseconds(server.read_timeout);
    config.session.max_header_size = server.max_header_size;
    return config;
}

Gateway::Gateway(std::shared_ptr<gateway::EventSink> events,
                 std::shared_ptr<gateway::Connector> connector)
    : events_(std::move(events)),
      upstreams_(std::make_shared<gateway::UpstreamManager>(std::move(connector))),
      routes_(std::make_shared<gateway::RouteTable>()),
      admission_(std::make_shared<gateway::AdmissionController>(0, 1024)),
      devbox_registry_(std::make_shared<gateway::DevboxRegistry>()),
      devbox_(std::make_shared<gateway::DevboxResolver>(devbox_registry_, upstreams_,
                                                        gateway::DevboxSettings{})),
      engine_(std::make_shared<gateway::ForwardingEngine>(routes_, admission_, events_)) {
    // The sink outlives every target: targets are owned by upstreams_, a member of this object
    upstreams_->set_health_listener([sink = events_](const gateway::UpstreamTarget& target,
                                                     gateway::CircuitState from,
                                                     gateway::CircuitState to) {
        sink->on_health(gateway::HealthEvent{target.key(), from, to});
    });
    routes_->set_fallback(devbox_);
}

void Gateway::apply(const control::Config& config) {
    std::lock_guard lock(apply_mutex_);

    gateway::apply_admission(config, *admission_);

    // Build first; the static snapshot and the devbox registry then switch back to back
    auto snapshot = gateway::build_route_snapshot(config, *upstreams_);
    size_t rule_count = snapshot->rules().size();
    auto devbox_settings = gateway::to_devbox_settings(config.devbox);

    routes_->publish(std::move(snapshot));
    gateway::load_devbox_registrations(config.devbox, *devbox_registry_);
    devbox_->configure(std::move(devbox_settings));

    // Requests holding the old snapshot keep their targets alive until they finish
    size_t pruned = gateway::prune_static_targets(config, *upstreams_);
    devbox_->prune_unregistered();

    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger,
                 "Configuration applied: version={}, routes={}, targets={}, pruned={}, "
                 "devbox_registrations={}, snapshot={}",
                 config.version, rule_count, upstreams_->size(), pruned,
                 devbox_registry_->size(), routes_->version());
    }
}

std::error_code Gateway::start(const control::ServerConfig& server) {
    listener_ = std::make_unique<core::Listener>(to_listener_config(server), engine_);
    return listener_->bind();
}

std::error_code Gateway::run(const std::atomic<bool>& running,
                             const std::function<void()>& tick) {
    if (!listener_) {
        return std::make_error_code(std::errc::not_connected);
    }
    return listener_->run(running, tick);
}

size_t Gateway::shutdown() {
    if (!listener_) {
        return 0;
    }
    size_t forced = listener_->drain();
    upstreams_->log_stats();
    return forced;
}

uint16_t Gateway::port() const noexcept {
    return listener_ ? listener_->port() : 0;
}

}  // namespace httpgate::runtime
