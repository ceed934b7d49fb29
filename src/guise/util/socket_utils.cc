// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/util/socket_utils.h"

#include <net/if.h>

#include <cstring>

namespace guise {
namespace util {

namespace {

bool CopyIp(std::string_view ip, char* out, size_t out_len) {
  // Max IPv6 length is 45 chars (e.g., "::ffff:255.255.255.255")
  if (ip.size() >= out_len) return false;
  std::memcpy(out, ip.data(), ip.size());
  out[ip.size()] = '\0';
  return true;
}

}  // namespace

socket_t CreateTcpSocket(bool ipv6) {
  int domain = ipv6 ? AF_INET6 : AF_INET;

#if defined(SOCK_NONBLOCK) && defined(SOCK_CLOEXEC)
  socket_t sock = socket(domain, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (sock >= 0) {
    return sock;
  }
#endif
  sock = socket(domain, SOCK_STREAM, 0);
  if (sock < 0) {
    return kInvalidSocket;
  }

  if (!SetNonBlocking(sock) || !SetCloseOnExec(sock)) {
    CloseSocket(sock);
    return kInvalidSocket;
  }
  return sock;
}

void ConfigureSocket(socket_t sock) {
  int flag = 1;
  setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag));
  setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &flag, sizeof(flag));

  int bufsize = 256 * 1024;
  setsockopt(sock, SOL_SOCKET, SO_RCVBUF, &bufsize, sizeof(bufsize));
  setsockopt(sock, SOL_SOCKET, SO_SNDBUF, &bufsize, sizeof(bufsize));
}

bool BindToInterface(socket_t sock, const std::string& interface_name,
                     std::string* error) {
  if (interface_name.empty() || interface_name.size() >= IFNAMSIZ) {
    *error = "invalid interface name '" + interface_name + "'";
    return false;
  }
#ifdef SO_BINDTODEVICE
  if (setsockopt(sock, SOL_SOCKET, SO_BINDTODEVICE, interface_name.c_str(),
                 static_cast<socklen_t>(interface_name.size() + 1)) != 0) {
    *error = "SO_BINDTODEVICE " + interface_name + ": " +
             GetLastSocketErrorString();
    return false;
  }
  return true;
#else
  *error = "binding to an interface is not supported on this platform";
  return false;
#endif
}

bool BindToAddress(socket_t sock, std::string_view ip, bool ipv6,
                   std::string* error) {
  char ip_buf[46];
  if (!CopyIp(ip, ip_buf, sizeof(ip_buf))) {
    *error = "invalid bind address";
    return false;
  }

  int ret;
  if (ipv6) {
    sockaddr_in6 addr{};
    addr.sin6_family = AF_INET6;
    if (inet_pton(AF_INET6, ip_buf, &addr.sin6_addr) != 1) {
      *error = std::string("bind address ") + ip_buf + " is not IPv6";
      return false;
    }
    ret = bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  } else {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    if (inet_pton(AF_INET, ip_buf, &addr.sin_addr) != 1) {
      *error = std::string("bind address ") + ip_buf + " is not IPv4";
      return false;
    }
    ret = bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  }

  if (ret != 0) {
    *error = std::string("bind ") + ip_buf + ": " + GetLastSocketErrorString();
    return false;
  }
  return true;
}

int ConnectNonBlocking(socket_t sock, std::string_view ip, uint16_t port,
                       bool ipv6) {
  char ip_buf[46];
  if (!CopyIp(ip, ip_buf, sizeof(ip_buf))) return -1;

  int ret;
  if (ipv6) {
    sockaddr_in6 addr{};
    addr.sin6_family = AF_INET6;
    addr.sin6_port = htons(port);
    if (inet_pton(AF_INET6, ip_buf, &addr.sin6_addr) != 1) {
      return -1;
    }
    ret = connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  } else {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip_buf, &addr.sin_addr) != 1) {
      return -1;
    }
    ret = connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  }

  if (ret == 0) {
    return 0;
  }
  if (errno == EINPROGRESS || IsWouldBlock(errno)) {
    return 1;
  }
  return -1;
}

bool IsConnected(socket_t sock) {
  int error = 0;
  socklen_t len = sizeof(error);
  if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &error, &len) < 0) {
    return false;
  }
  if (error != 0) {
    errno = error;
    return false;
  }
  return true;
}

ssize_t SendNonBlocking(socket_t sock, const void* data, size_t len) {
  ssize_t ret = send(sock, data, len, MSG_NOSIGNAL);
  if (ret < 0) {
    return IsWouldBlock(errno) ? -1 : -2;
  }
  return ret;
}

ssize_t RecvNonBlocking(socket_t sock, void* buf, size_t len) {
  ssize_t ret = recv(sock, buf, len, 0);
  if (ret < 0) {
    return IsWouldBlock(errno) ? -1 : -2;
  }
  return ret;
}

bool IsPeerOpen(socket_t sock) {
  if (sock == kInvalidSocket) return false;
  char byte;
  ssize_t ret = recv(sock, &byte, 1, MSG_PEEK | MSG_DONTWAIT);
  if (ret == 0) return false;  // orderly shutdown
  if (ret < 0) return IsWouldBlock(errno);
  // Unsolicited bytes on an idle connection are fine for h2 (PING, SETTINGS)
  return true;
}

}  // namespace util
}  // namespace guise
