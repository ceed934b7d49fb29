// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/util/platform.h"

#include <fcntl.h>

#include <cstring>

namespace guise {
namespace util {

bool SetNonBlocking(socket_t sock) {
  int flags = fcntl(sock, F_GETFL, 0);
  if (flags < 0) {
    return false;
  }
  return fcntl(sock, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool SetCloseOnExec(socket_t sock) {
  int flags = fcntl(sock, F_GETFD, 0);
  if (flags < 0) {
    return false;
  }
  return fcntl(sock, F_SETFD, flags | FD_CLOEXEC) == 0;
}

void CloseSocket(socket_t sock) {
  if (sock != kInvalidSocket) {
    close(sock);
  }
}

int GetLastSocketError() { return errno; }

std::string GetSocketErrorString(int error) {
  char buf[256];
  // GNU strerror_r may return a static string instead of filling buf
  const char* msg = strerror_r(error, buf, sizeof(buf));
  return std::string(msg);
}

std::string GetLastSocketErrorString() {
  return GetSocketErrorString(GetLastSocketError());
}

}  // namespace util
}  // namespace guise
