// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/proxy/proxy_tunnel.h"

#include "guise/proxy/http_proxy.h"
#include "guise/proxy/socks_proxy.h"

namespace guise {
namespace proxy {

TunnelResult ProxyTunnel::Feed(const uint8_t* data, size_t len) {
  if (state_ != TunnelState::kHandshaking) {
    return Fail("Proxy tunnel is not handshaking");
  }
  if (recv_buf_.size() + len > kMaxRecvSize) {
    return Fail("Proxy response too large");
  }
  recv_buf_.insert(recv_buf_.end(), data, data + len);
  return Parse();
}

void ProxyTunnel::ConsumeOutput(size_t len) {
  send_offset_ += len;
  if (send_offset_ >= send_buf_.size()) {
    send_buf_.clear();
    send_offset_ = 0;
  }
}

TunnelResult ProxyTunnel::Fail(std::string msg) {
  last_error_ = std::move(msg);
  state_ = TunnelState::kError;
  return TunnelResult::kError;
}

void ProxyTunnel::Queue(std::vector<uint8_t> msg) {
  send_buf_.insert(send_buf_.end(), msg.begin(), msg.end());
}

void ProxyTunnel::Erase(size_t len) {
  recv_buf_.erase(recv_buf_.begin(),
                  recv_buf_.begin() + static_cast<std::ptrdiff_t>(len));
}

std::unique_ptr<ProxyTunnel> CreateTunnel(const pool::ProxyDescriptor& proxy,
                                          std::string_view target_host,
                                          uint16_t target_port,
                                          std::string_view target_ip,
                                          std::string_view user_agent) {
  switch (proxy.scheme) {
    case pool::ProxyScheme::kHttp:
    case pool::ProxyScheme::kHttps:
      return std::make_unique<HttpProxyTunnel>(target_host, target_port,
                                               proxy.username, proxy.password,
                                               user_agent);
    case pool::ProxyScheme::kSocks4:
    case pool::ProxyScheme::kSocks4a:
    case pool::ProxyScheme::kSocks5:
    case pool::ProxyScheme::kSocks5h:
      return std::make_unique<SocksProxyTunnel>(proxy.scheme, target_host,
                                                target_port, target_ip,
                                                proxy.username, proxy.password);
  }
  return nullptr;
}

}  // namespace proxy
}  // namespace guise
