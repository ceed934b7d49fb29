// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/proxy/socks_proxy.h"

#include <arpa/inet.h>

#include <algorithm>

#include "guise/proxy/socks_constants.h"

namespace guise {
namespace proxy {

namespace {

constexpr size_t kMaxField = 255;

void AppendPort(std::vector<uint8_t>* out, uint16_t port) {
  out->push_back(static_cast<uint8_t>((port >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(port & 0xFF));
}

// Length-prefixed field, as RFC 1928/1929 frame names and credentials
void AppendField(std::vector<uint8_t>* out, std::string_view value) {
  size_t len = std::min(value.size(), kMaxField);
  out->push_back(static_cast<uint8_t>(len));
  out->insert(out->end(), value.begin(), value.begin() + len);
}

}  // namespace

SocksProxyTunnel::SocksProxyTunnel(pool::ProxyScheme scheme,
                                   std::string_view target_host,
                                   uint16_t target_port,
                                   std::string_view target_ip,
                                   std::string_view proxy_username,
                                   std::string_view proxy_password)
    : scheme_(scheme),
      target_host_(target_host),
      target_port_(target_port),
      target_ip_(target_ip),
      proxy_username_(proxy_username),
      proxy_password_(proxy_password) {}

TunnelResult SocksProxyTunnel::Start() {
  if (state_ != TunnelState::kIdle) {
    return Fail("SOCKS tunnel already started");
  }
  if (scheme_ == pool::ProxyScheme::kHttp ||
      scheme_ == pool::ProxyScheme::kHttps) {
    return Fail("Unsupported proxy type");
  }
  state_ = TunnelState::kHandshaking;

  if (IsSocks5()) {
    Queue(BuildSocks5Greeting());
    step_ = SocksStep::kMethod;
    return TunnelResult::kWantWrite;
  }
  return SendConnect();
}

TunnelResult SocksProxyTunnel::Parse() {
  switch (step_) {
    case SocksStep::kMethod:
      return ParseSocks5Method();
    case SocksStep::kAuth:
      return ParseSocks5Auth();
    case SocksStep::kConnectReply:
      return IsSocks5() ? ParseSocks5ConnectReply() : ParseSocks4Reply();
    default:
      return Fail("Unexpected data from SOCKS proxy");
  }
}

TunnelResult SocksProxyTunnel::SendConnect() {
  std::vector<uint8_t> msg;
  bool ok = IsSocks5() ? BuildSocks5Connect(&msg) : BuildSocks4Connect(&msg);
  if (!ok) {
    return TunnelResult::kError;
  }
  Queue(std::move(msg));
  step_ = SocksStep::kConnectReply;
  return TunnelResult::kWantWrite;
}

// SOCKS5

std::vector<uint8_t> SocksProxyTunnel::BuildSocks5Greeting() const {
  // VER | NMETHODS | METHODS
  std::vector<uint8_t> msg = {kSocks5Version};
  if (!proxy_username_.empty()) {
    msg.push_back(2);
    msg.push_back(socks5::kAuthNone);
    msg.push_back(socks5::kAuthPassword);
  } else {
    msg.push_back(1);
    msg.push_back(socks5::kAuthNone);
  }
  return msg;
}

std::vector<uint8_t> SocksProxyTunnel::BuildSocks5Auth() const {
  // VER | ULEN | UNAME | PLEN | PASSWD
  std::vector<uint8_t> msg = {socks5::kAuthPasswordVersion};
  AppendField(&msg, proxy_username_);
  AppendField(&msg, proxy_password_);
  return msg;
}

bool SocksProxyTunnel::BuildSocks5Connect(std::vector<uint8_t>* out) {
  // VER | CMD | RSV | ATYP | DST.ADDR | DST.PORT
  out->push_back(kSocks5Version);
  out->push_back(socks5::kCmdConnect);
  out->push_back(socks5::kReserved);

  if (scheme_ == pool::ProxyScheme::kSocks5h) {
    if (target_host_.size() > kMaxField) {
      Fail("Target host name too long for SOCKS5");
      return false;
    }
    out->push_back(socks5::kAtypDomain);
    AppendField(out, target_host_);
  } else {
    uint8_t addr[16];
    if (inet_pton(AF_INET, target_ip_.c_str(), addr) == 1) {
      out->push_back(socks5::kAtypIpv4);
      out->insert(out->end(), addr, addr + 4);
    } else if (inet_pton(AF_INET6, target_ip_.c_str(), addr) == 1) {
      out->push_back(socks5::kAtypIpv6);
      out->insert(out->end(), addr, addr + 16);
    } else {
      Fail("SOCKS5 requires a resolved target address");
      return false;
    }
  }

  AppendPort(out, target_port_);
  return true;
}

TunnelResult SocksProxyTunnel::ParseSocks5Method() {
  // VER | METHOD
  if (recv_buf_.size() < 2) {
    return Progress();
  }
  if (recv_buf_[0] != kSocks5Version) {
    return Fail("Invalid SOCKS5 version from proxy");
  }

  uint8_t method = recv_buf_[1];
  Erase(2);

  if (method == socks5::kAuthNone) {
    return SendConnect();
  }
  if (method == socks5::kAuthPassword) {
    if (proxy_username_.empty()) {
      return Fail("SOCKS5 proxy requires authentication but no credentials");
    }
    Queue(BuildSocks5Auth());
    step_ = SocksStep::kAuth;
    return TunnelResult::kWantWrite;
  }
  if (method == socks5::kAuthNoAcceptable) {
    return Fail("SOCKS5 proxy: no acceptable authentication method");
  }
  return Fail("SOCKS5 proxy selected unsupported auth method");
}

TunnelResult SocksProxyTunnel::ParseSocks5Auth() {
  // VER | STATUS
  if (recv_buf_.size() < 2) {
    return Progress();
  }
  if (recv_buf_[0] != socks5::kAuthPasswordVersion) {
    return Fail("Invalid SOCKS5 auth version");
  }
  if (recv_buf_[1] != socks5::kAuthSuccess) {
    return Fail("SOCKS5 authentication failed");
  }
  Erase(2);
  return SendConnect();
}

TunnelResult SocksProxyTunnel::ParseSocks5ConnectReply() {
  // VER | REP | RSV | ATYP | BND.ADDR | BND.PORT
  if (recv_buf_.size() < 4) {
    return Progress();
  }
  if (recv_buf_[0] != kSocks5Version) {
    return Fail("Invalid SOCKS5 version in connect reply");
  }

  uint8_t rep = recv_buf_[1];
  if (rep != socks5::kRepSucceeded) {
    return Fail(std::string("SOCKS5 connect failed: ") +
                socks5::ReplyCodeToString(rep));
  }

  size_t required_len = 4;
  switch (recv_buf_[3]) {
    case socks5::kAtypIpv4:
      required_len += 4 + 2;
      break;
    case socks5::kAtypIpv6:
      required_len += 16 + 2;
      break;
    case socks5::kAtypDomain:
      if (recv_buf_.size() < 5) {
        return Progress();
      }
      required_len += 1 + recv_buf_[4] + 2;
      break;
    default:
      return Fail("Unknown address type in SOCKS5 reply");
  }

  if (recv_buf_.size() < required_len) {
    return Progress();
  }

  Erase(required_len);
  step_ = SocksStep::kDone;
  state_ = TunnelState::kConnected;
  return TunnelResult::kOk;
}

// SOCKS4/4a

bool SocksProxyTunnel::BuildSocks4Connect(std::vector<uint8_t>* out) {
  // VN | CD | DSTPORT | DSTIP | USERID | NULL [| HOST | NULL]
  out->push_back(kSocks4Version);
  out->push_back(socks4::kCmdConnect);
  AppendPort(out, target_port_);

  bool socks4a = scheme_ == pool::ProxyScheme::kSocks4a;
  if (socks4a) {
    // 0.0.0.x marks a host name after the user id
    out->insert(out->end(), {0x00, 0x00, 0x00, 0x01});
  } else {
    uint8_t addr[4];
    if (inet_pton(AF_INET, target_ip_.c_str(), addr) != 1) {
      Fail("SOCKS4 requires a resolved IPv4 target address");
      return false;
    }
    out->insert(out->end(), addr, addr + 4);
  }

  out->insert(out->end(), proxy_username_.begin(), proxy_username_.end());
  out->push_back(0x00);

  if (socks4a) {
    out->insert(out->end(), target_host_.begin(), target_host_.end());
    out->push_back(0x00);
  }
  return true;
}

TunnelResult SocksProxyTunnel::ParseSocks4Reply() {
  if (recv_buf_.size() < socks4::kReplySize) {
    return Progress();
  }

  // VN is 0; some proxies echo 4
  if (recv_buf_[0] != 0x00 && recv_buf_[0] != kSocks4Version) {
    return Fail("Invalid SOCKS4 version in reply");
  }

  uint8_t cd = recv_buf_[1];
  if (cd != socks4::kRepGranted) {
    return Fail(std::string("SOCKS4 connect failed: ") +
                socks4::ReplyCodeToString(cd));
  }

  Erase(socks4::kReplySize);
  step_ = SocksStep::kDone;
  state_ = TunnelState::kConnected;
  return TunnelResult::kOk;
}

}  // namespace proxy
}  // namespace guise
