// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_UTIL_SOCKET_UTILS_H_
#define GUISE_UTIL_SOCKET_UTILS_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "guise/util/platform.h"

namespace guise {
namespace util {

// Create a non-blocking, close-on-exec TCP socket
// Returns socket on success, kInvalidSocket on error
socket_t CreateTcpSocket(bool ipv6);

// TCP_NODELAY, SO_KEEPALIVE and 256KB buffers
void ConfigureSocket(socket_t sock);

// Pins the socket to a network interface (SO_BINDTODEVICE).
// Returns false and fills *error on failure.
bool BindToInterface(socket_t sock, const std::string& interface_name,
                     std::string* error);

// Binds the socket to a local source address with an ephemeral port.
// The address family must match the socket's.
bool BindToAddress(socket_t sock, std::string_view ip, bool ipv6,
                   std::string* error);

// Start non-blocking connect to the given IP and port
// Returns 0 if connect completed immediately, -1 on error, 1 if in progress
int ConnectNonBlocking(socket_t sock, std::string_view ip, uint16_t port,
                       bool ipv6);

// Check if a non-blocking connect has completed
// Call after socket becomes writable; on failure errno holds the reason
bool IsConnected(socket_t sock);

// Returns bytes sent, -1 if would block, -2 on error
ssize_t SendNonBlocking(socket_t sock, const void* data, size_t len);

// Returns bytes received, 0 on EOF, -1 if would block, -2 on error
ssize_t RecvNonBlocking(socket_t sock, void* buf, size_t len);

// True if the peer has not closed its side. Used to detect half-closed
// idle connections without consuming data.
bool IsPeerOpen(socket_t sock);

}  // namespace util
}  // namespace guise

#endif  // GUISE_UTIL_SOCKET_UTILS_H_
