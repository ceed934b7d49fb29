// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

// SOCKS protocol constants (RFC 1928, RFC 1929, SOCKS4/4a de facto standard)

#ifndef GUISE_PROXY_SOCKS_CONSTANTS_H_
#define GUISE_PROXY_SOCKS_CONSTANTS_H_

#include <cstddef>
#include <cstdint>

namespace guise {
namespace proxy {

constexpr uint8_t kSocks4Version = 0x04;
constexpr uint8_t kSocks5Version = 0x05;

namespace socks5 {

// Authentication methods
constexpr uint8_t kAuthNone = 0x00;
constexpr uint8_t kAuthPassword = 0x02;
constexpr uint8_t kAuthNoAcceptable = 0xFF;

// Username/password subnegotiation (RFC 1929)
constexpr uint8_t kAuthPasswordVersion = 0x01;
constexpr uint8_t kAuthSuccess = 0x00;

constexpr uint8_t kCmdConnect = 0x01;

// Address types
constexpr uint8_t kAtypIpv4 = 0x01;
constexpr uint8_t kAtypDomain = 0x03;
constexpr uint8_t kAtypIpv6 = 0x04;

// Reply field
constexpr uint8_t kRepSucceeded = 0x00;
constexpr uint8_t kRepGeneralFailure = 0x01;
constexpr uint8_t kRepConnectionNotAllowed = 0x02;
constexpr uint8_t kRepNetworkUnreachable = 0x03;
constexpr uint8_t kRepHostUnreachable = 0x04;
constexpr uint8_t kRepConnectionRefused = 0x05;
constexpr uint8_t kRepTtlExpired = 0x06;
constexpr uint8_t kRepCommandNotSupported = 0x07;
constexpr uint8_t kRepAddressTypeNotSupported = 0x08;

constexpr uint8_t kReserved = 0x00;

inline const char* ReplyCodeToString(uint8_t code) {
  switch (code) {
    case kRepSucceeded: return "succeeded";
    case kRepGeneralFailure: return "general SOCKS server failure";
    case kRepConnectionNotAllowed: return "connection not allowed by ruleset";
    case kRepNetworkUnreachable: return "network unreachable";
    case kRepHostUnreachable: return "host unreachable";
    case kRepConnectionRefused: return "connection refused";
    case kRepTtlExpired: return "TTL expired";
    case kRepCommandNotSupported: return "command not supported";
    case kRepAddressTypeNotSupported: return "address type not supported";
    default: return "unknown error";
  }
}

}  // namespace socks5

namespace socks4 {

constexpr uint8_t kCmdConnect = 0x01;

constexpr uint8_t kRepGranted = 0x5A;
constexpr uint8_t kRepRejected = 0x5B;
constexpr uint8_t kRepNoIdentd = 0x5C;
constexpr uint8_t kRepIdentdMismatch = 0x5D;

// Reply: VN | CD | DSTPORT | DSTIP
constexpr size_t kReplySize = 8;

inline const char* ReplyCodeToString(uint8_t code) {
  switch (code) {
    case kRepGranted: return "request granted";
    case kRepRejected: return "request rejected or failed";
    case kRepNoIdentd: return "cannot connect to client identd";
    case kRepIdentdMismatch: return "client identd user mismatch";
    default: return "unknown error";
  }
}

}  // namespace socks4

}  // namespace proxy
}  // namespace guise

#endif  // GUISE_PROXY_SOCKS_CONSTANTS_H_
