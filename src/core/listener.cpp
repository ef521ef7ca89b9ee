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

// httpgate Listener - Implementation

#include "listener.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/epoll.h>
#include <sys/socket.h>

#include <cerrno>

#include "../gateway/forwarder.hpp"
#include "../http/http.hpp"
#include "core.hpp"
#include "logging.hpp"
#include "socket.hpp"

namespace httpgate::core {

namespace {

constexpr int kMaxEvents = 64;
constexpr int kTickIntervalMs = 100;
constexpr std::chrono::milliseconds kRejectWriteTimeout{100};

std::error_code last_error() {
    return std::error_code(errno, std::system_category());
}

}  // namespace

Listener::Listener(ListenerConfig config, std::shared_ptr<gateway::ForwardingEngine> engine)
    : config_(std::move(config)), engine_(std::move(engine)) {}

Listener::~Listener() {
    if (workers_) {
        drain();
    }
    if (listen_fd_ >= 0) {
        close_fd(listen_fd_);
    }
    if (epoll_fd_ >= 0) {
        close_fd(epoll_fd_);
    }
}

std::error_code Listener::bind() {
    std::error_code ec;
    listen_fd_ = create_listening_socket(config_.address, config_.port, config_.backlog, ec);
    if (listen_fd_ < 0) {
        return ec;
    }
    port_ = local_port(listen_fd_);

    epoll_fd_ = epoll_create1(EPOLL_CLOEXEC);
    if (epoll_fd_ < 0) {
        return last_error();
    }

    epoll_event ev{};
    ev.events = EPOLLIN;
    ev.data.fd = listen_fd_;
    if (epoll_ctl(epoll_fd_, EPOLL_CTL_ADD, listen_fd_, &ev) < 0) {
        return last_error();
    }

    uint32_t threads = config_.worker_threads > 0 ? config_.worker_threads
                                                  : default_worker_count();
    workers_ = std::make_unique<WorkerPool>(threads, config_.max_connections);

    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Listening on {}:{} ({} workers, max_connections={})", config_.address,
                 port_, threads, config_.max_connections);
    }
    return {};
}

std::error_code Listener::run(const std::atomic<bool>& running,
                              const std::function<void()>& tick) {
    if (listen_fd_ < 0 || !workers_) {
        return std::make_error_code(std::errc::bad_file_descriptor);
    }

    epoll_event events[kMaxEvents];

    while (running.load(std::memory_order_acquire)) {
        int n = epoll_wait(epoll_fd_, events, kMaxEvents, kTickIntervalMs);
        if (n < 0 && errno != EINTR) {
            return last_error();
        }

        for (int i = 0; i < n; ++i) {
            if (events[i].data.fd == listen_fd_) {
                accept_pending();
            }
        }

        if (tick) {
            tick();
        }
    }

    return {};
}

void Listener::accept_pending() {
    while (true) {
        sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);
        int client_fd = accept4(listen_fd_, reinterpret_cast<sockaddr*>(&client_addr),
                                &addr_len, SOCK_NONBLOCK | SOCK_CLOEXEC);

        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                if (auto* logger = logging::get_logger()) {
                    LOG_WARNING(logger, "accept failed: {}", last_error().message());
                }
            }
            return;
        }

        (void)set_nodelay(client_fd);
        accepted_.fetch_add(1, std::memory_order_relaxed);

        char ip_str[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &client_addr.sin_addr, ip_str, sizeof(ip_str));
        std::string peer{ip_str};

        {
            std::lock_guard lock(connections_mutex_);
            connections_.insert(client_fd);
        }

        bool queued = workers_->submit([this, client_fd, peer] { serve(client_fd, peer); });
        if (!queued) {
            {
                std::lock_guard lock(connections_mutex_);
                connections_.erase(client_fd);
            }
            reject_over_capacity(client_fd);
        }
    }
}

void Listener::serve(int fd, const std::string& peer) {
    ClientSession session(fd, peer, *engine_, config_.session, draining_);
    session.run();

    // Unregister before closing so drain() never touches a recycled descriptor
    {
        std::lock_guard lock(connections_mutex_);
        connections_.erase(fd);
        close_fd(fd);
    }
    connections_cv_.notify_all();
}

void Listener::reject_over_capacity(int fd) {
    rejected_.fetch_add(1, std::memory_order_relaxed);

    auto response = http::build_simple_response(http::StatusCode::ServiceUnavailable, false,
                                                "Retry-After: 1\r\n");
    (void)send_all(fd, response, deadline_after(kRejectWriteTimeout));
    close_fd(fd);

    if (auto* logger = logging::get_logger()) {
        LOG_WARNING(logger, "Connection limit reached ({}), rejected connection",
                    config_.max_connections);
    }
}

size_t Listener::active_connections() const {
    std::lock_guard lock(connections_mutex_);
    return connections_.size();
}

size_t Listener::drain() {
    if (!workers_) {
        return 0;
    }

    draining_.store(true, std::memory_order_release);

    if (listen_fd_ >= 0) {
        if (epoll_fd_ >= 0) {
            epoll_ctl(epoll_fd_, EPOLL_CTL_DEL, listen_fd_, nullptr);
        }
        close_fd(listen_fd_);
        listen_fd_ = -1;
    }

    auto* logger = logging::get_logger();
    size_t forced = 0;
    {
        std::unique_lock lock(connections_mutex_);
        if (logger && !connections_.empty()) {
            LOG_INFO(logger, "Draining {} active connections (timeout: {}ms)",
                     connections_.size(), config_.shutdown_timeout.count());
        }

        bool drained = connections_cv_.wait_for(lock, config_.shutdown_timeout,
                                                [this] { return connections_.empty(); });
        if (!drained) {
            // Wakes every blocked session; their requests see the client as gone
            for (int fd : connections_) {
                ::shutdown(fd, SHUT_RDWR);
            }
            forced = connections_.size();
        }
    }

    workers_->shutdown();
    workers_.reset();

    if (logger) {
        if (forced > 0) {
            LOG_WARNING(logger, "Drain timeout: force-closed {} connections", forced);
        } else {
            LOG_INFO(logger, "All connections drained");
        }
    }
    return forced;
}

} // namespace httpgate::core
