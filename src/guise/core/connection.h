// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_CORE_CONNECTION_H_
#define GUISE_CORE_CONNECTION_H_

#include "guise/util/platform.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "guise/config.h"
#include "guise/core/reactor.h"
#include "guise/error.h"
#include "guise/http1/h1_session.h"
#include "guise/http2/h2_session.h"
#include "guise/pool/identity_key.h"
#include "guise/pool/transport.h"
#include "guise/profile/impersonation_profile.h"
#include "guise/proxy/proxy_tunnel.h"
#include "guise/tls/client_hello_builder.h"
#include "guise/tls/tls_connection.h"
#include "guise/tls/tls_context.h"
#include "guise/util/dns_resolver.h"

namespace guise {
namespace core {

// Stream close code for requests failed by transport loss. Outside the
// HTTP/2 error code space.
inline constexpr uint32_t kStreamConnectionLost = 0x1000;

// Connection state machine
enum class ConnectionState {
  kIdle,          // Not started
  kConnecting,    // TCP connect in progress
  kProxyTls,      // TLS handshake with an HTTPS proxy
  kProxyTunnel,   // CONNECT / SOCKS handshake
  kTlsHandshake,  // TLS handshake with the origin
  kConnected,     // Ready for requests
  kClosed,
  kError,
};

// Everything a connection needs to reach one identity
struct ConnectionParams {
  pool::IdentityKey key;
  const profile::ImpersonationProfile* profile = nullptr;
  std::shared_ptr<tls::TlsContext> tls_context;
  HttpVersionPref http_version = HttpVersionPref::kAll;

  // Addresses of the proxy if there is one, else of the destination.
  // Tried in order.
  std::vector<util::ResolvedAddress> addresses;

  // Destination address resolved locally, for SOCKS4 and SOCKS5
  std::string target_ip;
};

// An HTTP/1.1 transport taken out of the client for a protocol upgrade.
// Owns the socket and closes it unless released.
struct DetachedTransport {
  DetachedTransport() = default;
  ~DetachedTransport();

  DetachedTransport(DetachedTransport&& other) noexcept;
  DetachedTransport& operator=(DetachedTransport&& other) noexcept;
  DetachedTransport(const DetachedTransport&) = delete;
  DetachedTransport& operator=(const DetachedTransport&) = delete;

  util::socket_t fd = util::kInvalidSocket;
  std::unique_ptr<tls::TlsConnection> tls;
};

// Completion of Establish(). Error::Ok() on success.
using EstablishCallback = std::function<void(const Error& error)>;

// TLS connection to one identity, shaped by an impersonation profile.
// Establishment runs connect, optional proxy TLS, the proxy handshake, the
// origin handshake and the HTTP/2 preface. Afterwards it carries one
// HTTP/2 or HTTP/1.1 session.
//
// Lives on its reactor's thread. Callbacks into the owner are posted, so
// the owner may destroy the connection from any of them.
class Connection : public EventHandler, public pool::Transport {
 public:
  Connection(Reactor* reactor, ConnectionParams params);
  ~Connection() override;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;
  Connection(Connection&&) = delete;
  Connection& operator=(Connection&&) = delete;

  // Starts establishment. `on_established` runs once, on the loop, unless
  // the connection is destroyed first.
  void Establish(EstablishCallback on_established);

  // Stage a failure right now would be reported under
  DialStage stage() const { return stage_; }

  // Submits a request. Returns the stream id, or -1 if the session cannot
  // take one. Stream callbacks run synchronously from the connection's I/O.
  int32_t SendRequest(const http2::H2Request& request,
                      http2::H2StreamCallbacks callbacks);

  // RST_STREAM(CANCEL) on HTTP/2. On HTTP/1.1 the exchange is the
  // connection, so it is aborted and the connection becomes unusable.
  void CancelStream(int32_t stream_id);

  bool CanSubmitRequest() const;

  // Maps a stream close code to the error reported to the caller
  Error StreamError(uint32_t error_code) const;

  // Hands over an idle HTTP/1.1 connection's socket and TLS session. Fails
  // for HTTP/2, with a request in flight, or through an HTTPS proxy.
  Result<DetachedTransport> DetachForUpgrade();

  // pool::Transport
  bool IsUsable() const override;
  void Close() override;
  std::string_view alpn() const override { return alpn_; }

  // EventHandler
  int fd() const override { return fd_; }
  void OnReadable() override;
  void OnWritable() override;
  void OnError(int error_code) override;
  void OnClose() override;

  ConnectionState state() const { return state_; }
  bool IsConnected() const { return state_ == ConnectionState::kConnected; }
  bool IsHttp2() const { return h2_ != nullptr; }

  const pool::IdentityKey& key() const { return params_.key; }
  const tls::ClientHelloPlan& hello_plan() const { return plan_; }
  bool session_resumed() const;

  // Akamai HTTP/2 fingerprint of what this connection sent, empty for h1
  std::string Akamai() const;

  const Error& failure() const { return failure_; }

 private:
  enum class IoStatus {
    kOk,
    kWouldBlock,
    kEof,
    kError,
  };

  // Connect stages
  void StartConnect();
  void HandleConnecting();
  void OnTcpConnected();
  void StartProxyTls();
  void HandleProxyTls();
  void StartTunnel();
  void HandleProxyTunnel();
  void StartTls();
  void HandleTlsHandshake();
  void OnHandshakeDone();
  bool StartSession();

  // Established
  void HandleConnected();
  bool FeedSession(const uint8_t* data, size_t len);
  bool FlushSendBuffer();
  void OnPeerClosed();
  void OnTransportLost(Error error);

  // Runs the handler for the current state, then re-arms the poll
  void Drive();
  void ScheduleDrive();
  void UpdateInterest();

  // Bytes below the origin TLS: the socket, or the proxy TLS session
  IoStatus RawRead(uint8_t* buf, size_t len, size_t* n);
  IoStatus RawWrite(const uint8_t* data, size_t len, size_t* written);

  // Moves ciphertext between the origin TLS BIO pair and RawRead/RawWrite.
  // PumpInbound returns 1 on progress, 0 if nothing moved, -1 on error.
  int PumpInbound();
  IoStatus PumpOutbound();

  void Fail(Error error);
  void FailDial(const std::string& msg) { Fail(Error::Dial(stage_, msg)); }
  void Finish(Error error);
  void CloseSocket();

  Reactor* reactor_;
  ConnectionParams params_;
  const pool::ProxyDescriptor* proxy_ = nullptr;  // into params_

  util::socket_t fd_ = util::kInvalidSocket;
  ConnectionState state_ = ConnectionState::kIdle;
  DialStage stage_ = DialStage::kConnect;
  EventType events_ = EventType::kNone;
  bool write_blocked_ = false;
  bool drive_scheduled_ = false;

  size_t next_address_ = 0;
  std::string connect_error_;

  std::unique_ptr<tls::TlsConnection> proxy_tls_;
  std::unique_ptr<proxy::ProxyTunnel> tunnel_;

  tls::ClientHelloPlan plan_;
  std::string session_key_;
  std::unique_ptr<tls::TlsConnection> tls_;

  // Origin TLS runs on a BIO pair (inside proxy TLS, or after leftover
  // tunnel bytes)
  bool buffered_ = false;
  std::vector<uint8_t> inbound_pending_;
  bool inbound_eof_ = false;
  std::vector<uint8_t> outbound_pending_;
  size_t outbound_offset_ = 0;

  std::unique_ptr<http2::H2Session> h2_;
  std::unique_ptr<http1::H1Session> h1_;
  std::string alpn_;

  EstablishCallback on_established_;
  Error failure_;

  // Cleared in the destructor so posted work does not touch a dead object
  std::shared_ptr<bool> alive_;
};

}  // namespace core
}  // namespace guise

#endif  // GUISE_CORE_CONNECTION_H_
