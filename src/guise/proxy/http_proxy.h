// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

// HTTP CONNECT tunnel through an HTTP or HTTPS proxy.

#ifndef GUISE_PROXY_HTTP_PROXY_H_
#define GUISE_PROXY_HTTP_PROXY_H_

#include <cstdint>
#include <string>
#include <string_view>

#include "guise/proxy/proxy_tunnel.h"

namespace guise {
namespace proxy {

class HttpProxyTunnel : public ProxyTunnel {
 public:
  HttpProxyTunnel(std::string_view target_host, uint16_t target_port,
                  std::string_view proxy_username = "",
                  std::string_view proxy_password = "",
                  std::string_view user_agent = "");

  TunnelResult Start() override;

  // Status code of the proxy's reply, 0 before it arrived
  int status_code() const { return status_code_; }

  // Standard base64 with padding
  static std::string Base64Encode(std::string_view input);

 protected:
  TunnelResult Parse() override;

 private:
  std::string BuildRequest() const;

  std::string target_host_;
  uint16_t target_port_;
  std::string proxy_username_;
  std::string proxy_password_;
  std::string user_agent_;
  int status_code_ = 0;
};

}  // namespace proxy
}  // namespace guise

#endif  // GUISE_PROXY_HTTP_PROXY_H_
