// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

// SOCKS4/4a/5/5h tunnel.

#ifndef GUISE_PROXY_SOCKS_PROXY_H_
#define GUISE_PROXY_SOCKS_PROXY_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "guise/pool/identity_key.h"
#include "guise/proxy/proxy_tunnel.h"

namespace guise {
namespace proxy {

enum class SocksStep {
  kIdle,
  kMethod,        // SOCKS5: greeting sent, awaiting chosen method
  kAuth,          // SOCKS5: credentials sent, awaiting status
  kConnectReply,  // CONNECT sent, awaiting reply
  kDone,
};

class SocksProxyTunnel : public ProxyTunnel {
 public:
  // `target_ip` is needed for SOCKS4 (IPv4 only) and SOCKS5; the 4a and 5h
  // variants send the host name and let the proxy resolve it.
  SocksProxyTunnel(pool::ProxyScheme scheme, std::string_view target_host,
                   uint16_t target_port, std::string_view target_ip = "",
                   std::string_view proxy_username = "",
                   std::string_view proxy_password = "");

  TunnelResult Start() override;

  SocksStep step() const { return step_; }

 protected:
  TunnelResult Parse() override;

 private:
  bool IsSocks5() const {
    return scheme_ == pool::ProxyScheme::kSocks5 ||
           scheme_ == pool::ProxyScheme::kSocks5h;
  }

  std::vector<uint8_t> BuildSocks5Greeting() const;
  std::vector<uint8_t> BuildSocks5Auth() const;
  bool BuildSocks5Connect(std::vector<uint8_t>* out);
  bool BuildSocks4Connect(std::vector<uint8_t>* out);

  TunnelResult ParseSocks5Method();
  TunnelResult ParseSocks5Auth();
  TunnelResult ParseSocks5ConnectReply();
  TunnelResult ParseSocks4Reply();

  TunnelResult SendConnect();

  pool::ProxyScheme scheme_;
  std::string target_host_;
  uint16_t target_port_;
  std::string target_ip_;
  std::string proxy_username_;
  std::string proxy_password_;

  SocksStep step_ = SocksStep::kIdle;
};

}  // namespace proxy
}  // namespace guise

#endif  // GUISE_PROXY_SOCKS_PROXY_H_
