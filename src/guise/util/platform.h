// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

// POSIX socket primitives shared by the dialer and the connection layer.

#ifndef GUISE_UTIL_PLATFORM_H_
#define GUISE_UTIL_PLATFORM_H_

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <string>

namespace guise {
namespace util {

using socket_t = int;
inline constexpr socket_t kInvalidSocket = -1;

bool SetNonBlocking(socket_t sock);
bool SetCloseOnExec(socket_t sock);
void CloseSocket(socket_t sock);

int GetLastSocketError();
std::string GetSocketErrorString(int error);
std::string GetLastSocketErrorString();

inline bool IsWouldBlock(int error) {
  return error == EAGAIN || error == EWOULDBLOCK;
}

}  // namespace util
}  // namespace guise

#endif  // GUISE_UTIL_PLATFORM_H_
