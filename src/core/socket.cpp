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

// httpgate Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace httpgate::core {

namespace {

/// A half-closed peer may still have request bytes queued for us
bool has_unread_bytes(int fd) noexcept {
    int pending = 0;
    return ioctl(fd, FIONREAD, &pending) == 0 && pending > 0;
}

std::error_code last_error() {
    return std::error_code(errno, std::system_category());
}

// Resolve host to an IPv4 address: literal first, then getaddrinfo.
// Pod addresses change under the same service name, so results are not cached.
std::error_code resolve_ipv4(const std::string& host, uint16_t port, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port = htons(port);

    if (inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
        return {};
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    int rc = getaddrinfo(host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        if (result) {
            freeaddrinfo(result);
        }
        return std::make_error_code(std::errc::host_unreachable);
    }

    out.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return {};
}

}  // namespace

int create_listening_socket(std::string_view address, uint16_t port, int backlog,
                            std::error_code& ec) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        ec = last_error();
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        ec = last_error();
        close_fd(fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    std::string addr_str{address};
    if (inet_pton(AF_INET, addr_str.c_str(), &addr.sin_addr) <= 0) {
        ec = std::make_error_code(std::errc::invalid_argument);
        close_fd(fd);
        return -1;
    }

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ec = last_error();
        close_fd(fd);
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        ec = last_error();
        close_fd(fd);
        return -1;
    }

    if (ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return -1;
    }

    return fd;
}

uint16_t local_port(int fd) noexcept {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return last_error();
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return last_error();
    }

    return {};
}

std::error_code set_nodelay(int fd) {
    int opt = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        return last_error();
    }
    return {};
}

void close_fd(int fd) {
    if (fd >= 0) {
        close(fd);
    }
}

int connect_with_deadline(const std::string& host, uint16_t port, Deadline deadline,
                          std::error_code& ec) {
    sockaddr_in addr{};
    if (ec = resolve_ipv4(host, port, addr); ec) {
        return -1;
    }

    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        ec = last_error();
        return -1;
    }

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        if (errno != EINPROGRESS) {
            ec = last_error();
            close_fd(fd);
            return -1;
        }

        switch (wait_fd(fd, POLLOUT, deadline)) {
            case IoWait::Ready:
                break;
            case IoWait::Timeout:
                ec = std::make_error_code(std::errc::timed_out);
                close_fd(fd);
                return -1;
            case IoWait::PeerClosed:
            case IoWait::Error:
                ec = last_error();
                close_fd(fd);
                return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            ec = last_error();
            close_fd(fd);
            return -1;
        }
        if (so_error != 0) {
            ec = std::error_code(so_error, std::system_category());
            close_fd(fd);
            return -1;
        }
    }

    // Latency matters more than packet count for proxied request heads
    (void)set_nodelay(fd);

    ec.clear();
    return fd;
}

IoWait wait_fd(int fd, short events, Deadline deadline, int watch_fd, bool watch_half_close) {
    pollfd fds[2];
    fds[0] = pollfd{fd, events, 0};
    nfds_t count = 1;
    if (watch_fd >= 0) {
        // POLLHUP and POLLERR are always reported, even with no events requested
        fds[1] = pollfd{watch_fd, static_cast<short>(watch_half_close ? POLLRDHUP : 0), 0};
        count = 2;
    }

    while (true) {
        int timeout = poll_timeout_ms(deadline);
        int rc = poll(fds, count, timeout);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return IoWait::Error;
        }

        if (count == 2 && (fds[1].revents & (POLLHUP | POLLERR | POLLNVAL))) {
            return IoWait::PeerClosed;
        }
        if (count == 2 && (fds[1].revents & POLLRDHUP)) {
            if (!has_unread_bytes(watch_fd)) {
                return IoWait::PeerClosed;
            }
            // Still readable: stop watching the half-close, keep watching for hang-up
            fds[1].events = 0;
        }

        // Errors and hangups on fd itself surface through the following read/write
        if (fds[0].revents != 0) {
            return IoWait::Ready;
        }

        if (rc == 0 || timeout == 0) {
            return IoWait::Timeout;
        }
    }
}

bool peer_closed(int fd, bool half_close_counts) noexcept {
    pollfd pfd{fd, static_cast<short>(half_close_counts ? POLLRDHUP : 0), 0};
    int rc = poll(&pfd, 1, 0);
    if (rc <= 0) {
        return false;
    }
    if ((pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) != 0) {
        return true;
    }
    return (pfd.revents & POLLRDHUP) != 0 && !has_unread_bytes(fd);
}

std::error_code send_all(int fd, std::span<const uint8_t> data, Deadline deadline,
                         int watch_fd, bool watch_half_close) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }

        if (n < 0 && errno == EINTR) {
            continue;
        }

        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            switch (wait_fd(fd, POLLOUT, deadline, watch_fd, watch_half_close)) {
                case IoWait::Ready:
                    continue;
                case IoWait::Timeout:
                    return std::make_error_code(std::errc::timed_out);
                case IoWait::PeerClosed:
                    return std::make_error_code(std::errc::operation_canceled);
                case IoWait::Error:
                    return last_error();
            }
        }

        return n < 0 ? last_error() : std::make_error_code(std::errc::broken_pipe);
    }
    return {};
}

std::error_code send_all(int fd, std::string_view data, Deadline deadline, int watch_fd,
                         bool watch_half_close) {
    return send_all(fd,
                    std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(data.data()),
                                             data.size()),
                    deadline, watch_fd, watch_half_close);
}

ssize_t recv_some(int fd, std::span<uint8_t> buffer, Deadline deadline, std::error_code& ec,
                  int watch_fd, bool watch_half_close) {
    while (true) {
        ssize_t n = recv(fd, buffer.data(), buffer.size(), 0);
        if (n >= 0) {
            ec.clear();
            return n;
        }

        if (errno == EINTR) {
            continue;
        }

        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            ec = last_error();
            return -1;
        }

        switch (wait_fd(fd, POLLIN, deadline, watch_fd, watch_half_close)) {
            case IoWait::Ready:
                continue;
            case IoWait::Timeout:
                ec = std::make_error_code(std::errc::timed_out);
                return -1;
            case IoWait::PeerClosed:
                ec = std::make_error_code(std::errc::operation_canceled);
                return -1;
            case IoWait::Error:
                ec = last_error();
                return -1;
        }
    }
}

}  // namespace httpgate::core
