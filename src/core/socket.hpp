// httpgate Socket Utilities - Header

#pragma once

#include <sys/types.h>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

#include "deadline.hpp"

namespace httpgate::core {

/// Create non-blocking IPv4 listening socket (SO_REUSEADDR).
/// Returns -1 and sets ec on failure (bad address, bind, listen).
[[nodiscard]] int create_listening_socket(std::string_view address,
                                          uint16_t port,
                                          int backlog,
                                          std::error_code& ec);

/// Local port a socket is bound to (0 on error)
[[nodiscard]] uint16_t local_port(int fd) noexcept;

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_nodelay(int fd);

void close_fd(int fd);

/// Open a non-blocking TCP connection to host:port, waiting at most until deadline.
/// host may be a dotted IPv4 literal or a DNS name.
/// Returns the connected fd, or -1 with ec set (std::errc::timed_out on deadline).
[[nodiscard]] int connect_with_deadline(const std::string& host,
                                        uint16_t port,
                                        Deadline deadline,
                                        std::error_code& ec);

/// Result of waiting on a socket
enum class IoWait : uint8_t {
    Ready,       // Requested events (or an error/hangup on fd itself) are pending
    Timeout,     // Deadline elapsed
    PeerClosed,  // The watched peer socket hung up
    Error        // poll() failed
};

/// Wait for events on fd until deadline.
/// If watch_fd >= 0 it is monitored for hang-up at the same time, so a client
/// disconnect interrupts a wait on the upstream socket. A peer that only shut
/// down its write side counts once nothing is left to read from it, and not
/// at all with watch_half_close false.
[[nodiscard]] IoWait wait_fd(int fd, short events, Deadline deadline, int watch_fd = -1,
                             bool watch_half_close = true);

/// True if the peer of fd has closed or reset the connection (non-blocking check).
/// half_close_counts: a peer that only shut down its write side counts as closed
/// once nothing is left to read from it.
[[nodiscard]] bool peer_closed(int fd, bool half_close_counts = true) noexcept;

/// Write all bytes. Errors: std::errc::timed_out, std::errc::operation_canceled
/// (watched peer hung up), or the errno from send().
[[nodiscard]] std::error_code send_all(int fd,
                                       std::span<const uint8_t> data,
                                       Deadline deadline,
                                       int watch_fd = -1,
                                       bool watch_half_close = true);

[[nodiscard]] std::error_code send_all(int fd,
                                       std::string_view data,
                                       Deadline deadline,
                                       int watch_fd = -1,
                                       bool watch_half_close = true);

/// Read whatever is available (waiting until deadline).
/// Returns bytes read, 0 on orderly EOF, -1 on error with ec set as for send_all.
[[nodiscard]] ssize_t recv_some(int fd,
                                std::span<uint8_t> buffer,
                                Deadline deadline,
                                std::error_code& ec,
                                int watch_fd = -1,
                                bool watch_half_close = true);

} // namespace httpgate::core
