// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/core/connection.h"

#include <nghttp2/nghttp2.h>
#include <openssl/bio.h>
#include <spdlog/spdlog.h>
#include <uv.h>

#include <algorithm>
#include <utility>

#include "guise/http2/h2_preface.h"
#include "guise/tls/grease.h"
#include "guise/tls/session_cache.h"
#include "guise/util/socket_utils.h"

namespace guise {
namespace core {

namespace {

// Limit iterations to prevent starving other connections
constexpr int kMaxReadsPerCallback = 4;
constexpr int kMaxWritesPerFlush = 4;
constexpr size_t kReadBufferSize = 16384;

// Everything that scopes a TLS ticket, credentials included. Only ever
// hashed, never logged.
std::string SessionMaterial(const pool::IdentityKey& key) {
  std::string m = key.profile;
  m += '|';
  m += key.Authority();
  if (key.proxy) {
    const auto& p = *key.proxy;
    m += '|';
    m += pool::ProxySchemeName(p.scheme);
    m += "://";
    m += p.username;
    m += ':';
    m += p.password;
    m += '@';
    m += p.host;
    m += ':';
    m += std::to_string(p.port);
  }
  if (key.local_path) {
    m += "|bind=";
    m += key.local_path->bind_address.value_or("");
    m += "|if=";
    m += key.local_path->interface_name.value_or("");
  }
  return m;
}

bool IsIpv6Literal(std::string_view ip) {
  return ip.find(':') != std::string_view::npos;
}

bool Offers(const std::vector<std::string>& list, std::string_view proto) {
  return std::find(list.begin(), list.end(), proto) != list.end();
}

}  // namespace

// DetachedTransport

DetachedTransport::~DetachedTransport() {
  tls.reset();
  if (fd != util::kInvalidSocket) {
    util::CloseSocket(fd);
  }
}

DetachedTransport::DetachedTransport(DetachedTransport&& other) noexcept
    : fd(other.fd), tls(std::move(other.tls)) {
  other.fd = util::kInvalidSocket;
}

DetachedTransport& DetachedTransport::operator=(
    DetachedTransport&& other) noexcept {
  if (this != &other) {
    tls.reset();
    if (fd != util::kInvalidSocket) {
      util::CloseSocket(fd);
    }
    fd = other.fd;
    tls = std::move(other.tls);
    other.fd = util::kInvalidSocket;
  }
  return *this;
}

// Connection

Connection::Connection(Reactor* reactor, ConnectionParams params)
    : reactor_(reactor),
      params_(std::move(params)),
      alive_(std::make_shared<bool>(true)) {
  if (params_.key.proxy) {
    proxy_ = &*params_.key.proxy;
  }
  session_key_ = tls::MakeSessionKey(SessionMaterial(params_.key));
}

Connection::~Connection() {
  *alive_ = false;
  on_established_ = nullptr;
  Close();
}

void Connection::Establish(EstablishCallback on_established) {
  on_established_ = std::move(on_established);
  SPDLOG_DEBUG("connecting {} via {} address(es)", params_.key.ToString(),
               params_.addresses.size());
  StartConnect();
  UpdateInterest();
}

// Connect stages

void Connection::StartConnect() {
  stage_ = DialStage::kConnect;
  const uint16_t port = proxy_ ? proxy_->port : params_.key.port;
  const auto& local = params_.key.local_path;

  while (next_address_ < params_.addresses.size()) {
    const util::ResolvedAddress& addr = params_.addresses[next_address_++];

    // A source address only binds sockets of its own family
    if (local && local->bind_address &&
        IsIpv6Literal(*local->bind_address) != addr.is_ipv6) {
      connect_error_ = "no route from " + *local->bind_address + " to " +
                       addr.ip;
      continue;
    }

    fd_ = util::CreateTcpSocket(addr.is_ipv6);
    if (fd_ == util::kInvalidSocket) {
      connect_error_ = "socket: " + util::GetLastSocketErrorString();
      continue;
    }
    util::ConfigureSocket(fd_);

    std::string bind_error;
    if (local && local->interface_name &&
        !util::BindToInterface(fd_, *local->interface_name, &bind_error)) {
      connect_error_ = bind_error;
      CloseSocket();
      continue;
    }
    if (local && local->bind_address &&
        !util::BindToAddress(fd_, *local->bind_address, addr.is_ipv6,
                             &bind_error)) {
      connect_error_ = bind_error;
      CloseSocket();
      continue;
    }

    int ret = util::ConnectNonBlocking(fd_, addr.ip, port, addr.is_ipv6);
    if (ret < 0) {
      connect_error_ = "connect to " + addr.ip + ": " +
                       util::GetLastSocketErrorString();
      CloseSocket();
      continue;
    }

    // Watch for writable to know when connect completes
    if (!reactor_->Add(this, EventType::kWrite)) {
      CloseSocket();
      Fail(Error::Internal("failed to register socket with reactor"));
      return;
    }
    events_ = EventType::kWrite;
    state_ = ConnectionState::kConnecting;

    // Connect completed immediately (localhost)
    if (ret == 0) {
      OnTcpConnected();
    }
    return;
  }

  FailDial(connect_error_.empty() ? "no address to connect to"
                                  : connect_error_);
}

void Connection::HandleConnecting() {
  if (util::IsConnected(fd_)) {
    OnTcpConnected();
    return;
  }

  connect_error_ = "connect failed: " + util::GetLastSocketErrorString();
  SPDLOG_DEBUG("{}: {}", params_.key.ToString(), connect_error_);
  CloseSocket();
  StartConnect();
}

void Connection::OnTcpConnected() {
  if (proxy_ == nullptr) {
    StartTls();
  } else if (proxy_->scheme == pool::ProxyScheme::kHttps) {
    StartProxyTls();
  } else {
    StartTunnel();
  }
}

void Connection::StartProxyTls() {
  stage_ = DialStage::kProxyConnect;

  // The proxy sees the same fingerprint, speaking HTTP/1.1 for CONNECT
  tls::ClientHelloBuilder builder(tls::TlsEngineCapabilities::BoringSsl(),
                                  HttpVersionPref::kHttp1);
  std::string proxy_key = "proxy|" + SessionMaterial(params_.key);
  proxy_key = tls::MakeSessionKey(proxy_key);

  tls::TlsSessionCache* cache = params_.tls_context->session_cache();
  bool resumption = cache != nullptr && cache->Has(proxy_key);

  auto plan = builder.Build(*params_.profile, proxy_->host, resumption,
                            tls::GreaseSeed());
  if (!plan) {
    Fail(plan.error());
    return;
  }

  proxy_tls_ = std::make_unique<tls::TlsConnection>(params_.tls_context.get(),
                                                    std::move(proxy_key));
  if (!proxy_tls_->Attach(plan.value(), fd_)) {
    FailDial("TLS to proxy: " + proxy_tls_->last_error());
    return;
  }
  state_ = ConnectionState::kProxyTls;
  HandleProxyTls();
}

void Connection::HandleProxyTls() {
  switch (proxy_tls_->DoHandshake()) {
    case tls::TlsResult::kOk:
      SPDLOG_DEBUG("TLS to proxy {} established", proxy_->ToString());
      StartTunnel();
      break;

    case tls::TlsResult::kWantRead:
      break;

    case tls::TlsResult::kWantWrite:
      write_blocked_ = true;
      break;

    case tls::TlsResult::kEof:
      FailDial("proxy closed the connection during the TLS handshake");
      break;

    case tls::TlsResult::kError:
      FailDial("TLS to proxy: " + proxy_tls_->last_error());
      break;
  }
}

void Connection::StartTunnel() {
  stage_ = DialStage::kProxyConnect;
  tunnel_ = proxy::CreateTunnel(*proxy_, params_.key.host, params_.key.port,
                                params_.target_ip,
                                params_.profile->headers.user_agent);
  if (!tunnel_) {
    FailDial("unsupported proxy scheme");
    return;
  }
  if (tunnel_->Start() == proxy::TunnelResult::kError) {
    FailDial(tunnel_->last_error());
    return;
  }
  state_ = ConnectionState::kProxyTunnel;
  HandleProxyTunnel();
}

void Connection::HandleProxyTunnel() {
  uint8_t buf[4096];

  for (;;) {
    while (tunnel_->WantsWrite()) {
      size_t written = 0;
      IoStatus s = RawWrite(tunnel_->PendingOutput(),
                            tunnel_->PendingOutputSize(), &written);
      tunnel_->ConsumeOutput(written);
      if (s == IoStatus::kWouldBlock) {
        write_blocked_ = true;
        return;
      }
      if (s != IoStatus::kOk) {
        FailDial("write to proxy failed: " + connect_error_);
        return;
      }
    }

    if (tunnel_->IsConnected()) {
      SPDLOG_DEBUG("proxy tunnel to {} established", params_.key.Authority());
      // Origin bytes that arrived with the proxy's reply
      inbound_pending_ = tunnel_->leftover();
      tunnel_.reset();
      StartTls();
      return;
    }

    size_t n = 0;
    IoStatus s = RawRead(buf, sizeof(buf), &n);
    if (s == IoStatus::kWouldBlock) {
      return;
    }
    if (s == IoStatus::kEof) {
      FailDial("proxy closed the connection during the handshake");
      return;
    }
    if (s == IoStatus::kError) {
      FailDial("read from proxy failed: " + connect_error_);
      return;
    }

    if (tunnel_->Feed(buf, n) == proxy::TunnelResult::kError) {
      FailDial(tunnel_->last_error());
      return;
    }
  }
}

void Connection::StartTls() {
  stage_ = DialStage::kTlsHandshake;

  tls::TlsSessionCache* cache = params_.tls_context->session_cache();
  bool resumption = cache != nullptr && cache->Has(session_key_);

  tls::ClientHelloBuilder builder(tls::TlsEngineCapabilities::BoringSsl(),
                                  params_.http_version);
  auto plan = builder.Build(*params_.profile, params_.key.host, resumption,
                            tls::GreaseSeed());
  if (!plan) {
    Fail(plan.error());
    return;
  }
  plan_ = std::move(plan).value();

  tls_ = std::make_unique<tls::TlsConnection>(params_.tls_context.get(),
                                              session_key_);
  buffered_ = proxy_tls_ != nullptr || !inbound_pending_.empty();
  bool attached = buffered_ ? tls_->AttachBuffered(plan_)
                            : tls_->Attach(plan_, fd_);
  if (!attached) {
    FailDial(tls_->last_error());
    return;
  }

  state_ = ConnectionState::kTlsHandshake;
  HandleTlsHandshake();
}

void Connection::HandleTlsHandshake() {
  for (;;) {
    tls::TlsResult result = tls_->DoHandshake();

    if (buffered_) {
      IoStatus s = PumpOutbound();
      if (s == IoStatus::kError || s == IoStatus::kEof) {
        FailDial("write to proxy tunnel failed: " + connect_error_);
        return;
      }
    }

    switch (result) {
      case tls::TlsResult::kOk:
        OnHandshakeDone();
        return;

      case tls::TlsResult::kWantRead:
        if (buffered_) {
          int progress = PumpInbound();
          if (progress < 0) {
            FailDial("read from proxy tunnel failed: " + connect_error_);
            return;
          }
          if (progress > 0) {
            continue;
          }
        }
        return;

      case tls::TlsResult::kWantWrite:
        write_blocked_ = true;
        return;

      case tls::TlsResult::kEof:
        FailDial("connection closed during the TLS handshake");
        return;

      case tls::TlsResult::kError:
        FailDial(tls_->last_error());
        return;
    }
  }
}

void Connection::OnHandshakeDone() {
  stage_ = DialStage::kAlpnMismatch;

  std::string_view negotiated = tls_->AlpnProtocol();
  if (negotiated.empty()) {
    // No ALPN answer means HTTP/1.1
    if (params_.http_version == HttpVersionPref::kHttp2) {
      FailDial("server did not negotiate h2");
      return;
    }
    alpn_ = "http/1.1";
  } else if (!plan_.alpn_protocols.empty() &&
             !Offers(plan_.alpn_protocols, negotiated)) {
    FailDial("server selected '" + std::string(negotiated) +
             "', which was not offered");
    return;
  } else if (negotiated != "h2" && negotiated != "http/1.1") {
    FailDial("unsupported application protocol '" + std::string(negotiated) +
             "'");
    return;
  } else {
    alpn_ = std::string(negotiated);
  }

  if (!StartSession()) {
    return;
  }

  state_ = ConnectionState::kConnected;
  if (!FlushSendBuffer()) {
    Finish(Error::Dial(stage_, failure_.message()));
    return;
  }

  SPDLOG_DEBUG("connected {} alpn={} resumed={}", params_.key.ToString(),
               alpn_, tls_->SessionResumed());
  Finish(Error::Ok());
}

bool Connection::StartSession() {
  if (alpn_ == "h2") {
    stage_ = DialStage::kH2Preface;

    http2::H2SessionCallbacks callbacks;
    callbacks.on_error = [this](int code, const std::string& msg) {
      SPDLOG_DEBUG("h2 session error {} on {}: {}", code,
                   params_.key.Authority(), msg);
    };
    callbacks.on_goaway = [this](int32_t last_stream_id, uint32_t code) {
      SPDLOG_DEBUG("GOAWAY from {} last_stream={} code={}",
                   params_.key.Authority(), last_stream_id,
                   nghttp2_http2_strerror(code));
    };

    h2_ = std::make_unique<http2::H2Session>(
        http2::Http2PrefaceBuilder::Build(params_.profile->http2),
        std::move(callbacks));
    if (!h2_->Initialize()) {
      FailDial(h2_->last_error());
      return false;
    }
    return true;
  }

  http1::H1Session::SessionCallbacks callbacks;
  callbacks.on_error = [this](int code, const std::string& msg) {
    SPDLOG_DEBUG("h1 session error {} on {}: {}", code,
                 params_.key.Authority(), msg);
  };
  h1_ = std::make_unique<http1::H1Session>(
      std::move(callbacks), params_.profile->headers.http1_title_case);
  return true;
}

// Requests

int32_t Connection::SendRequest(const http2::H2Request& request,
                                http2::H2StreamCallbacks callbacks) {
  if (!CanSubmitRequest()) {
    return -1;
  }

  int32_t stream_id = h2_ ? h2_->SubmitRequest(request, std::move(callbacks))
                          : h1_->SubmitRequest(request, std::move(callbacks));
  if (stream_id < 0) {
    return -1;
  }

  FlushSendBuffer();
  UpdateInterest();
  return stream_id;
}

void Connection::CancelStream(int32_t stream_id) {
  if (h2_) {
    h2_->ResetStream(stream_id, NGHTTP2_CANCEL);
    if (state_ == ConnectionState::kConnected) {
      FlushSendBuffer();
      UpdateInterest();
    }
  } else if (h1_) {
    h1_->Abort(http1::kCloseCancelled);
  }
}

bool Connection::CanSubmitRequest() const {
  if (state_ != ConnectionState::kConnected) return false;
  if (h2_) return h2_->CanSubmitRequest();
  if (h1_) return h1_->CanSubmitRequest();
  return false;
}

Error Connection::StreamError(uint32_t error_code) const {
  if (error_code == 0) {
    return Error::Ok();
  }
  if (error_code == kStreamConnectionLost) {
    return failure_ ? failure_ : Error::Broken("connection closed");
  }
  if (h2_) {
    return Error::Http2(std::string("stream closed with ") +
                        nghttp2_http2_strerror(error_code));
  }
  if (h1_ && error_code == http1::kCloseCancelled) {
    return Error::Cancelled();
  }
  if (h1_ && !h1_->last_error().empty()) {
    return Error::Http1(h1_->last_error());
  }
  return Error::Http1("malformed response");
}

Result<DetachedTransport> Connection::DetachForUpgrade() {
  if (state_ != ConnectionState::kConnected || !h1_) {
    return Error::Internal("only established HTTP/1.1 connections detach");
  }
  if (h1_->InFlight()) {
    return Error::Internal("cannot detach with a request in flight");
  }
  if (buffered_) {
    return Error::Internal(
        "cannot detach a connection tunnelled through TLS to a proxy");
  }

  reactor_->Remove(this);
  events_ = EventType::kNone;

  DetachedTransport out;
  out.fd = fd_;
  out.tls = std::move(tls_);
  fd_ = util::kInvalidSocket;
  h1_.reset();
  state_ = ConnectionState::kClosed;

  SPDLOG_DEBUG("detached {} for upgrade", params_.key.ToString());
  return Result<DetachedTransport>(std::move(out));
}

bool Connection::IsUsable() const {
  if (state_ != ConnectionState::kConnected || !tls_ || !tls_->IsUsable()) {
    return false;
  }
  // Peer FIN not yet seen by the loop
  if (!util::IsPeerOpen(fd_)) return false;
  if (h2_) return h2_->IsAlive();
  if (h1_) return h1_->IsAlive() && h1_->KeepAlive();
  return false;
}

bool Connection::session_resumed() const {
  return tls_ && tls_->SessionResumed();
}

std::string Connection::Akamai() const { return h2_ ? h2_->Akamai() : ""; }

void Connection::Close() {
  if (state_ == ConnectionState::kConnected && tls_ && !buffered_) {
    // close_notify, best effort
    tls_->Shutdown();
  }
  CloseSocket();
  if (state_ != ConnectionState::kError) {
    state_ = ConnectionState::kClosed;
  }

  if (h2_) {
    h2_->FailAllStreams(kStreamConnectionLost);
  }
  if (h1_) {
    h1_->Abort(kStreamConnectionLost);
  }
}

void Connection::CloseSocket() {
  if (fd_ == util::kInvalidSocket) {
    return;
  }
  if (reactor_->Contains(fd_)) {
    reactor_->Remove(this);
  }
  events_ = EventType::kNone;
  util::CloseSocket(fd_);
  fd_ = util::kInvalidSocket;
}

// Established

void Connection::HandleConnected() {
  uint8_t buf[kReadBufferSize];
  int reads = 0;

  while (state_ == ConnectionState::kConnected) {
    if (reads >= kMaxReadsPerCallback) {
      // Records may already sit decrypted inside the TLS engine, where the
      // poll cannot see them
      ScheduleDrive();
      break;
    }

    tls::TlsResult result;
    ssize_t n = tls_->ReadRaw(buf, sizeof(buf), &result);
    if (n > 0) {
      ++reads;
      if (!FeedSession(buf, static_cast<size_t>(n))) {
        return;
      }
      continue;
    }

    if (result == tls::TlsResult::kWantRead) {
      if (buffered_) {
        int progress = PumpInbound();
        if (progress < 0) {
          OnTransportLost(Error::Broken("proxy tunnel read failed: " +
                                        connect_error_));
          return;
        }
        if (progress > 0) {
          continue;
        }
      }
      break;
    }
    if (result == tls::TlsResult::kWantWrite) {
      write_blocked_ = true;
      break;
    }
    if (result == tls::TlsResult::kEof) {
      OnPeerClosed();
      return;
    }
    OnTransportLost(Error::Broken("TLS read failed: " + tls_->last_error()));
    return;
  }

  if (state_ == ConnectionState::kConnected) {
    FlushSendBuffer();
  }
}

bool Connection::FeedSession(const uint8_t* data, size_t len) {
  if (h2_) {
    if (h2_->Receive(data, len) < 0) {
      OnTransportLost(Error::Http2(h2_->last_error()));
      return false;
    }
    return true;
  }

  if (h1_->Receive(data, len) < 0) {
    OnTransportLost(Error::Http1(h1_->last_error()));
    return false;
  }
  return true;
}

bool Connection::FlushSendBuffer() {
  if (state_ != ConnectionState::kConnected || !tls_ || (!h2_ && !h1_)) {
    return state_ == ConnectionState::kConnected;
  }

  int writes = 0;
  while (writes < kMaxWritesPerFlush) {
    auto [data, len] = h2_ ? h2_->GetPendingData() : h1_->GetPendingData();
    if (len == 0) {
      break;
    }

    size_t written = 0;
    tls::TlsResult result = tls_->Write(data, len, &written);
    if (written > 0) {
      if (h2_) {
        h2_->DataSent(written);
      } else {
        h1_->DataSent(written);
      }
      ++writes;
    }

    if (result == tls::TlsResult::kError || result == tls::TlsResult::kEof) {
      OnTransportLost(Error::Broken("TLS write failed: " + tls_->last_error()));
      return false;
    }

    if (buffered_) {
      IoStatus s = PumpOutbound();
      if (s == IoStatus::kError || s == IoStatus::kEof) {
        OnTransportLost(Error::Broken("proxy tunnel write failed: " +
                                      connect_error_));
        return false;
      }
      if (s == IoStatus::kWouldBlock) {
        break;
      }
      // The BIO pair drained, so a stalled engine write can go again
      if (written == 0 && result == tls::TlsResult::kWantWrite) {
        ++writes;
        continue;
      }
    }

    if (written == 0 && result != tls::TlsResult::kOk) {
      write_blocked_ = true;
      break;
    }
  }

  // Hit the limit with more to send; stay armed for write
  bool wants = h2_ ? h2_->WantsWrite() : h1_->WantsWrite();
  if (wants && writes >= kMaxWritesPerFlush) {
    write_blocked_ = true;
  }

  // A failed mem_send leaves the session fatal
  if (h2_ && !h2_->last_error().empty()) {
    OnTransportLost(Error::Http2(h2_->last_error()));
    return false;
  }
  return true;
}

void Connection::OnPeerClosed() {
  SPDLOG_DEBUG("peer closed {}", params_.key.ToString());
  if (failure_.ok()) {
    failure_ = Error::Broken("connection closed by peer");
  }
  state_ = ConnectionState::kClosed;
  CloseSocket();

  if (h1_) {
    h1_->OnPeerClosed(kStreamConnectionLost);
  }
  if (h2_) {
    h2_->FailAllStreams(kStreamConnectionLost);
  }
}

void Connection::OnTransportLost(Error error) {
  if (state_ != ConnectionState::kConnected) {
    return;
  }
  SPDLOG_DEBUG("lost {}: {}", params_.key.ToString(), error.ToString());
  failure_ = std::move(error);
  state_ = ConnectionState::kError;
  CloseSocket();

  if (h2_) {
    h2_->FailAllStreams(kStreamConnectionLost);
  }
  if (h1_) {
    h1_->Abort(kStreamConnectionLost);
  }
}

// Event dispatch

void Connection::OnReadable() { Drive(); }

void Connection::OnWritable() {
  write_blocked_ = false;
  Drive();
}

void Connection::OnError(int error_code) {
  std::string msg = std::string("socket error: ") + uv_strerror(-error_code);
  if (state_ == ConnectionState::kConnected) {
    OnTransportLost(Error::Broken(msg));
  } else if (state_ == ConnectionState::kConnecting) {
    // Try the next address
    connect_error_ = msg;
    CloseSocket();
    StartConnect();
    UpdateInterest();
  } else {
    FailDial(msg);
  }
}

void Connection::OnClose() { Drive(); }

void Connection::Drive() {
  switch (state_) {
    case ConnectionState::kConnecting:
      HandleConnecting();
      break;
    case ConnectionState::kProxyTls:
      HandleProxyTls();
      break;
    case ConnectionState::kProxyTunnel:
      HandleProxyTunnel();
      break;
    case ConnectionState::kTlsHandshake:
      HandleTlsHandshake();
      break;
    case ConnectionState::kConnected:
      HandleConnected();
      break;
    default:
      return;
  }
  UpdateInterest();
}

void Connection::ScheduleDrive() {
  if (drive_scheduled_) {
    return;
  }
  drive_scheduled_ = true;
  reactor_->Post([this, alive = alive_] {
    if (!*alive) {
      return;
    }
    drive_scheduled_ = false;
    Drive();
  });
}

void Connection::UpdateInterest() {
  if (fd_ == util::kInvalidSocket || !reactor_->Contains(fd_)) {
    return;
  }

  EventType events = EventType::kRead;
  switch (state_) {
    case ConnectionState::kConnecting:
      events = EventType::kWrite;
      break;
    case ConnectionState::kProxyTunnel:
      if (write_blocked_ || (tunnel_ && tunnel_->WantsWrite())) {
        events = EventType::kReadWrite;
      }
      break;
    case ConnectionState::kProxyTls:
    case ConnectionState::kTlsHandshake:
      if (write_blocked_ || outbound_offset_ < outbound_pending_.size()) {
        events = EventType::kReadWrite;
      }
      break;
    case ConnectionState::kConnected: {
      bool wants = (h2_ && h2_->WantsWrite()) || (h1_ && h1_->WantsWrite());
      if (write_blocked_ || wants ||
          outbound_offset_ < outbound_pending_.size()) {
        events = EventType::kReadWrite;
      }
      break;
    }
    default:
      return;
  }

  if (events != events_) {
    reactor_->Modify(this, events);
    events_ = events;
  }
}

// Raw I/O below the origin TLS

Connection::IoStatus Connection::RawRead(uint8_t* buf, size_t len, size_t* n) {
  *n = 0;
  if (proxy_tls_) {
    tls::TlsResult result;
    ssize_t got = proxy_tls_->ReadRaw(buf, len, &result);
    if (got > 0) {
      *n = static_cast<size_t>(got);
      return IoStatus::kOk;
    }
    switch (result) {
      case tls::TlsResult::kWantRead:
        return IoStatus::kWouldBlock;
      case tls::TlsResult::kWantWrite:
        write_blocked_ = true;
        return IoStatus::kWouldBlock;
      case tls::TlsResult::kEof:
        return IoStatus::kEof;
      default:
        connect_error_ = proxy_tls_->last_error();
        return IoStatus::kError;
    }
  }

  ssize_t got = util::RecvNonBlocking(fd_, buf, len);
  if (got > 0) {
    *n = static_cast<size_t>(got);
    return IoStatus::kOk;
  }
  if (got == 0) {
    return IoStatus::kEof;
  }
  if (got == -1) {
    return IoStatus::kWouldBlock;
  }
  connect_error_ = util::GetLastSocketErrorString();
  return IoStatus::kError;
}

Connection::IoStatus Connection::RawWrite(const uint8_t* data, size_t len,
                                          size_t* written) {
  *written = 0;
  if (proxy_tls_) {
    tls::TlsResult result = proxy_tls_->Write(data, len, written);
    if (*written > 0 || result == tls::TlsResult::kOk) {
      return IoStatus::kOk;
    }
    if (result == tls::TlsResult::kWantWrite ||
        result == tls::TlsResult::kWantRead) {
      return IoStatus::kWouldBlock;
    }
    connect_error_ = proxy_tls_->last_error();
    return IoStatus::kError;
  }

  ssize_t sent = util::SendNonBlocking(fd_, data, len);
  if (sent > 0) {
    *written = static_cast<size_t>(sent);
    return IoStatus::kOk;
  }
  if (sent == -1 || sent == 0) {
    return IoStatus::kWouldBlock;
  }
  connect_error_ = util::GetLastSocketErrorString();
  return IoStatus::kError;
}

int Connection::PumpInbound() {
  BIO* bio = tls_->network_bio();
  bool progress = false;

  for (;;) {
    if (!inbound_pending_.empty()) {
      size_t room = BIO_ctrl_get_write_guarantee(bio);
      if (room == 0) {
        break;
      }
      size_t n = std::min(room, inbound_pending_.size());
      int w = BIO_write(bio, inbound_pending_.data(), static_cast<int>(n));
      if (w <= 0) {
        break;
      }
      inbound_pending_.erase(inbound_pending_.begin(),
                             inbound_pending_.begin() + w);
      progress = true;
      continue;
    }

    if (inbound_eof_ || BIO_ctrl_get_write_guarantee(bio) == 0) {
      break;
    }

    uint8_t buf[kReadBufferSize];
    size_t n = 0;
    IoStatus s = RawRead(buf, sizeof(buf), &n);
    if (s == IoStatus::kWouldBlock) {
      break;
    }
    if (s == IoStatus::kEof) {
      // The origin engine reads EOF once the pair is drained
      inbound_eof_ = true;
      BIO_shutdown_wr(bio);
      progress = true;
      break;
    }
    if (s == IoStatus::kError) {
      return -1;
    }
    inbound_pending_.assign(buf, buf + n);
  }
  return progress ? 1 : 0;
}

Connection::IoStatus Connection::PumpOutbound() {
  BIO* bio = tls_->network_bio();

  for (;;) {
    while (outbound_offset_ < outbound_pending_.size()) {
      size_t written = 0;
      IoStatus s = RawWrite(outbound_pending_.data() + outbound_offset_,
                            outbound_pending_.size() - outbound_offset_,
                            &written);
      outbound_offset_ += written;
      if (s == IoStatus::kWouldBlock || (s == IoStatus::kOk && written == 0)) {
        write_blocked_ = true;
        return IoStatus::kWouldBlock;
      }
      if (s != IoStatus::kOk) {
        return IoStatus::kError;
      }
    }
    outbound_pending_.clear();
    outbound_offset_ = 0;

    size_t available = BIO_ctrl_pending(bio);
    if (available == 0) {
      return IoStatus::kOk;
    }
    outbound_pending_.resize(available);
    int r = BIO_read(bio, outbound_pending_.data(), static_cast<int>(available));
    if (r <= 0) {
      outbound_pending_.clear();
      return IoStatus::kOk;
    }
    outbound_pending_.resize(static_cast<size_t>(r));
  }
}

// Establishment outcome

void Connection::Fail(Error error) {
  SPDLOG_DEBUG("dial {} failed: {}", params_.key.ToString(), error.ToString());
  failure_ = error;
  state_ = ConnectionState::kError;
  CloseSocket();
  Finish(std::move(error));
}

void Connection::Finish(Error error) {
  if (!on_established_) {
    return;
  }
  auto callback = std::move(on_established_);
  on_established_ = nullptr;
  reactor_->Post([alive = alive_, callback = std::move(callback),
                  error = std::move(error)] {
    if (*alive) {
      callback(error);
    }
  });
}

}  // namespace core
}  // namespace guise
