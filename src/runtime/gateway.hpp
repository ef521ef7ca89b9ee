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

// httpgate Runtime - Header
// Owns the gateway components and rebuilds them from configuration snapshots

#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>

#include "../control/config.hpp"
#include "../core/listener.hpp"
#include "../gateway/admission.hpp"
#include "../gateway/devbox.hpp"
#include "../gateway/events.hpp"
#include "../gateway/forwarder.hpp"
#include "../gateway/route_table.hpp"
#include "../gateway/upstream.hpp"

namespace httpgate::runtime {

/// Listener settings from the server section
[[nodiscard]] core::ListenerConfig to_listener_config(const control::ServerConfig& server);

/// The running gateway.
///
/// apply() may be called at any time (initial load and every reload): it
/// publishes a new route snapshot that reuses existing upstream targets, so
/// their pools and circuit state survive a reload. The server section is read
/// once by start(); changing it requires a restart.
class Gateway {
public:
    explicit Gateway(
        std::shared_ptr<gateway::EventSink> events = std::make_shared<gateway::LogEventSink>(),
        std::shared_ptr<gateway::Connector> connector = std::make_shared<gateway::TcpConnector>());
    ~Gateway() = default;

    Gateway(const Gateway&) = delete;
    Gateway& operator=(const Gateway&) = delete;

    /// Rebuild routes, admission limits and devbox settings from config
    void apply(const control::Config& config);

    /// Create the listener and bind it
    [[nodiscard]] std::error_code start(const control::ServerConfig& server);

    /// Serve until running turns false (see core::Listener::run)
    [[nodiscard]] std::error_code run(const std::atomic<bool>& running,
                                      const std::function<void()>& tick = {});

    /// Graceful drain; returns the number of force-closed connections
    size_t shutdown();

    [[nodiscard]] uint16_t port() const noexcept;

    [[nodiscard]] const std::shared_ptr<gateway::UpstreamManager>& upstreams() const noexcept {
        return upstreams_;
    }
    [[nodiscard]] const std::shared_ptr<gateway::RouteTable>& routes() const noexcept {
        return routes_;
    }
    [[nodiscard]] const std::shared_ptr<gateway::AdmissionController>& admission() const noexcept {
        return admission_;
    }
    [[nodiscard]] const std::shared_ptr<gateway::DevboxRegistry>& devbox_registry() const noexcept {
        return devbox_registry_;
    }
    [[nodiscard]] const std::shared_ptr<gateway::DevboxResolver>& devbox() const noexcept {
        return devbox_;
    }
    [[nodiscard]] const std::shared_ptr<gateway::ForwardingEngine>& engine() const noexcept {
        return engine_;
    }

private:
    std::shared_ptr<gateway::EventSink> events_;
    std::shared_ptr<gateway::UpstreamManager> upstreams_;
    std::shared_ptr<gateway::RouteTable> routes_;
    std::shared_ptr<gateway::AdmissionController> admission_;
    std::shared_ptr<gateway::DevboxRegistry> devbox_registry_;
    std::shared_ptr<gateway::DevboxResolver> devbox_;
    std::shared_ptr<gateway::ForwardingEngine> engine_;
    std::unique_ptr<core::Listener> listener_;  // Declared last: drains before the rest goes away

    std::mutex apply_mutex_;  // Serializes apply() calls
};

}  // namespace httpgate::runtime
