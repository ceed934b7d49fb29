// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/proxy/http_proxy.h"

#include <openssl/base64.h>

#include <vector>

namespace guise {
namespace proxy {

namespace {

// host:port, with IPv6 literals bracketed
std::string TargetAuthority(std::string_view host, uint16_t port) {
  std::string out;
  if (host.find(':') != std::string_view::npos) {
    out = "[" + std::string(host) + "]";
  } else {
    out = std::string(host);
  }
  out += ":" + std::to_string(port);
  return out;
}

}  // namespace

HttpProxyTunnel::HttpProxyTunnel(std::string_view target_host,
                                 uint16_t target_port,
                                 std::string_view proxy_username,
                                 std::string_view proxy_password,
                                 std::string_view user_agent)
    : target_host_(target_host),
      target_port_(target_port),
      proxy_username_(proxy_username),
      proxy_password_(proxy_password),
      user_agent_(user_agent) {}

TunnelResult HttpProxyTunnel::Start() {
  if (state_ != TunnelState::kIdle) {
    return Fail("Tunnel already started");
  }

  std::string request = BuildRequest();
  Queue(std::vector<uint8_t>(request.begin(), request.end()));
  state_ = TunnelState::kHandshaking;
  return TunnelResult::kWantWrite;
}

std::string HttpProxyTunnel::BuildRequest() const {
  std::string authority = TargetAuthority(target_host_, target_port_);

  std::string request = "CONNECT " + authority + " HTTP/1.1\r\n";
  request += "Host: " + authority + "\r\n";

  if (!proxy_username_.empty()) {
    request += "Proxy-Authorization: Basic ";
    request += Base64Encode(proxy_username_ + ":" + proxy_password_);
    request += "\r\n";
  }

  // Same browser as the tunnelled traffic
  if (!user_agent_.empty()) {
    request += "User-Agent: " + user_agent_ + "\r\n";
  }
  request += "Proxy-Connection: keep-alive\r\n";
  request += "\r\n";
  return request;
}

TunnelResult HttpProxyTunnel::Parse() {
  std::string_view response(reinterpret_cast<const char*>(recv_buf_.data()),
                            recv_buf_.size());
  size_t header_end = response.find("\r\n\r\n");
  if (header_end == std::string_view::npos) {
    return Progress();
  }

  // HTTP/1.x SP STATUS SP REASON
  if (response.substr(0, 5) != "HTTP/") {
    return Fail("Invalid proxy response");
  }
  size_t first_space = response.find(' ');
  if (first_space == std::string_view::npos || first_space > 12 ||
      first_space + 4 > header_end) {
    return Fail("Invalid proxy response");
  }

  std::string_view status_str = response.substr(first_space + 1, 3);
  int status_code = 0;
  for (char c : status_str) {
    if (c < '0' || c > '9') {
      return Fail("Invalid status code");
    }
    status_code = status_code * 10 + (c - '0');
  }
  status_code_ = status_code;

  if (status_code / 100 == 2) {
    Erase(header_end + 4);
    state_ = TunnelState::kConnected;
    return TunnelResult::kOk;
  }

  switch (status_code) {
    case 407:
      return Fail("Proxy authentication required");
    case 403:
      return Fail("Proxy denied access");
    case 502:
      return Fail("Proxy bad gateway");
    case 503:
      return Fail("Proxy service unavailable");
    default:
      return Fail("Proxy returned status " + std::to_string(status_code));
  }
}

std::string HttpProxyTunnel::Base64Encode(std::string_view input) {
  size_t encoded_len = 0;
  if (!EVP_EncodedLength(&encoded_len, input.size())) {
    return {};
  }
  std::string output(encoded_len, '\0');
  size_t written = EVP_EncodeBlock(
      reinterpret_cast<uint8_t*>(output.data()),
      reinterpret_cast<const uint8_t*>(input.data()), input.size());
  output.resize(written);
  return output;
}

}  // namespace proxy
}  // namespace guise
