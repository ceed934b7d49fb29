// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

// Proxy handshakes as byte-driven state machines. The connection moves
// bytes between the tunnel and whatever carries it (a plain socket or a
// TLS session to an HTTPS proxy).

#ifndef GUISE_PROXY_PROXY_TUNNEL_H_
#define GUISE_PROXY_PROXY_TUNNEL_H_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "guise/pool/identity_key.h"

namespace guise {
namespace proxy {

enum class TunnelState {
  kIdle,
  kHandshaking,
  kConnected,
  kError,
};

enum class TunnelResult {
  kOk,         // Tunnel established
  kWantWrite,  // Output pending, see PendingOutput()
  kWantRead,   // Waiting for the proxy
  kError,
};

class ProxyTunnel {
 public:
  virtual ~ProxyTunnel() = default;

  // Queues the first message. Call once the transport to the proxy is up.
  virtual TunnelResult Start() = 0;

  // Feeds bytes received from the proxy. Bytes past the final reply are
  // kept in leftover().
  TunnelResult Feed(const uint8_t* data, size_t len);

  const uint8_t* PendingOutput() const { return send_buf_.data() + send_offset_; }
  size_t PendingOutputSize() const { return send_buf_.size() - send_offset_; }
  void ConsumeOutput(size_t len);
  bool WantsWrite() const { return PendingOutputSize() > 0; }

  TunnelState state() const { return state_; }
  bool IsConnected() const { return state_ == TunnelState::kConnected; }
  bool HasError() const { return state_ == TunnelState::kError; }
  const std::string& last_error() const { return last_error_; }

  // Target bytes that arrived together with the final proxy reply
  const std::vector<uint8_t>& leftover() const { return recv_buf_; }

 protected:
  ProxyTunnel() = default;

  // Parses recv_buf_. Erases what it consumed.
  virtual TunnelResult Parse() = 0;

  TunnelResult Fail(std::string msg);
  TunnelResult Progress() const {
    return WantsWrite() ? TunnelResult::kWantWrite : TunnelResult::kWantRead;
  }

  void Queue(std::vector<uint8_t> msg);
  void Erase(size_t len);

  TunnelState state_ = TunnelState::kIdle;
  std::string last_error_;
  std::vector<uint8_t> recv_buf_;

 private:
  static constexpr size_t kMaxRecvSize = 4096;

  std::vector<uint8_t> send_buf_;
  size_t send_offset_ = 0;
};

// Builds the tunnel for `proxy` to reach target_host:target_port.
// `target_ip` is the locally resolved address, required by SOCKS4 and
// SOCKS5 (the variants that do not resolve at the proxy). `user_agent`
// goes into the HTTP CONNECT request.
std::unique_ptr<ProxyTunnel> CreateTunnel(const pool::ProxyDescriptor& proxy,
                                          std::string_view target_host,
                                          uint16_t target_port,
                                          std::string_view target_ip,
                                          std::string_view user_agent);

}  // namespace proxy
}  // namespace guise

#endif  // GUISE_PROXY_PROXY_TUNNEL_H_
