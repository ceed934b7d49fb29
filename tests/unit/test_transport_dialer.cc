// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/transport/transport_dialer.h"

#include <arpa/inet.h>
#include <uv.h>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <memory>
#include <optional>
#include <print>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

using namespace guise;
using core::Reactor;
using pool::DialRequest;
using pool::IdentityKey;
using pool::ProxyDescriptor;
using pool::ProxyScheme;
using pool::Transport;
using profile::ImpersonationProfile;
using profile::ProfileRegistry;
using transport::TransportDialer;
using util::DnsResolver;

namespace {

using Overrides = std::unordered_map<std::string, std::vector<std::string>>;

// Reactor, resolver and TLS contexts behind one dialer
struct Harness {
  explicit Harness(Overrides overrides = {},
                   const ProfileRegistry* registry = &ProfileRegistry::Builtin())
      : contexts(TlsConfig{}) {
    assert(reactor.Initialize());
    resolver =
        std::make_unique<DnsResolver>(reactor.loop(), std::move(overrides));
    dialer = std::make_unique<TransportDialer>(
        &reactor, resolver.get(), &contexts, registry, HttpVersionPref::kAll);
  }

  // Dials and runs the loop until the callback fires
  Result<std::unique_ptr<Transport>> Dial(
      const IdentityKey& key,
      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    std::optional<Result<std::unique_ptr<Transport>>> outcome;
    DialRequest request;
    request.key = key;
    request.timeout = timeout;
    dialer->Dial(request, [&](Result<std::unique_ptr<Transport>> result) {
      outcome.emplace(std::move(result));
      // Synchronous failures must not leave a stop pending for the next run
      if (reactor.running()) reactor.Stop();
    });
    if (!outcome) {
      reactor.RunFor(static_cast<int>(timeout.count()) + 2000);
    }
    assert(outcome.has_value());
    return std::move(*outcome);
  }

  Reactor reactor;
  std::unique_ptr<DnsResolver> resolver;
  tls::TlsContextStore contexts;
  std::unique_ptr<TransportDialer> dialer;
};

// What a LoopbackServer does with the first bytes a client sends
enum class Reply {
  kHangUp,   // close at once
  kGarbage,  // answer in plaintext, then close
  kSilent,   // read and never answer
};

// TCP listener on 127.0.0.1 sharing the reactor's loop
class LoopbackServer {
 public:
  LoopbackServer(uv_loop_t* loop, Reply reply) : reply_(reply) {
    listener_ = new uv_tcp_t;
    assert(uv_tcp_init(loop, listener_) == 0);
    listener_->data = this;

    sockaddr_in addr{};
    assert(uv_ip4_addr("127.0.0.1", 0, &addr) == 0);
    assert(uv_tcp_bind(listener_, reinterpret_cast<const sockaddr*>(&addr),
                       0) == 0);
    assert(uv_listen(reinterpret_cast<uv_stream_t*>(listener_), 16,
                     OnConnection) == 0);

    sockaddr_storage bound{};
    int len = sizeof(bound);
    assert(uv_tcp_getsockname(listener_, reinterpret_cast<sockaddr*>(&bound),
                              &len) == 0);
    port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
  }

  ~LoopbackServer() {
    while (!clients_.empty()) {
      CloseClient(clients_.back());
    }
    uv_close(reinterpret_cast<uv_handle_t*>(listener_), FreeHandle);
  }

  LoopbackServer(const LoopbackServer&) = delete;
  LoopbackServer& operator=(const LoopbackServer&) = delete;

  uint16_t port() const { return port_; }
  int accepted() const { return accepted_; }
  size_t bytes_received() const { return bytes_received_; }

 private:
  static void FreeHandle(uv_handle_t* handle) {
    delete reinterpret_cast<uv_tcp_t*>(handle);
  }

  static void OnConnection(uv_stream_t* listener, int status) {
    auto* self = static_cast<LoopbackServer*>(listener->data);
    if (status < 0) {
      return;
    }
    auto* client = new uv_tcp_t;
    uv_tcp_init(listener->loop, client);
    client->data = self;
    if (uv_accept(listener, reinterpret_cast<uv_stream_t*>(client)) != 0) {
      uv_close(reinterpret_cast<uv_handle_t*>(client), FreeHandle);
      return;
    }
    ++self->accepted_;
    self->clients_.push_back(client);
    uv_read_start(reinterpret_cast<uv_stream_t*>(client), OnAlloc, OnRead);
  }

  static void OnAlloc(uv_handle_t* handle, size_t, uv_buf_t* buf) {
    auto* self = static_cast<LoopbackServer*>(handle->data);
    *buf = uv_buf_init(self->buffer_, sizeof(self->buffer_));
  }

  static void OnRead(uv_stream_t* stream, ssize_t nread, const uv_buf_t*) {
    auto* self = static_cast<LoopbackServer*>(stream->data);
    auto* client = reinterpret_cast<uv_tcp_t*>(stream);
    if (nread < 0) {
      self->CloseClient(client);
      return;
    }
    self->bytes_received_ += static_cast<size_t>(nread);
    if (nread == 0 || self->reply_ == Reply::kSilent) {
      return;
    }
    if (self->reply_ == Reply::kGarbage) {
      char text[] = "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\n\r\n";
      uv_buf_t out = uv_buf_init(text, sizeof(text) - 1);
      uv_try_write(stream, &out, 1);
    }
    self->CloseClient(client);
  }

  void CloseClient(uv_tcp_t* client) {
    clients_.erase(std::remove(clients_.begin(), clients_.end(), client),
                   clients_.end());
    uv_close(reinterpret_cast<uv_handle_t*>(client), FreeHandle);
  }

  Reply reply_;
  uv_tcp_t* listener_ = nullptr;
  std::vector<uv_tcp_t*> clients_;
  uint16_t port_ = 0;
  int accepted_ = 0;
  size_t bytes_received_ = 0;
  char buffer_[4096];
};

IdentityKey Key(std::string host, uint16_t port,
                std::string profile = "Chrome143") {
  return pool::MakeIdentityKey(std::move(host), port, std::nullopt,
                               std::nullopt, std::move(profile));
}

IdentityKey ViaProxy(ProxyScheme scheme, uint16_t proxy_port,
                     std::string host) {
  ProxyDescriptor proxy;
  proxy.scheme = scheme;
  proxy.host = "127.0.0.1";
  proxy.port = proxy_port;
  return pool::MakeIdentityKey(std::move(host), 443, proxy, std::nullopt,
                               "Chrome143");
}

void AssertDialFailed(const Result<std::unique_ptr<Transport>>& result,
                      DialStage stage) {
  assert(!result);
  assert(result.error().code() == ErrorCode::kDialFailed);
  assert(result.error().stage() == stage);
}

}  // namespace

void TestConfigurationErrorsBeforeIo() {
  std::print("Testing configuration errors before any I/O... ");

  // Same fingerprint, but a floor the engine cannot negotiate
  ImpersonationProfile legacy =
      *ProfileRegistry::Builtin().Lookup("Chrome143").value();
  legacy.name = "LegacyFloor";
  legacy.tls.min_version = 0x0300;
  auto registry = ProfileRegistry::Create({legacy});
  assert(registry);

  Harness h({}, registry.value().get());

  bool called = false;
  DialRequest request;
  request.key = Key("example.com", 443, "LegacyFloor");
  h.dialer->Dial(request, [&](Result<std::unique_ptr<Transport>> result) {
    called = true;
    assert(!result);
    assert(result.error().code() == ErrorCode::kUnsupportedTlsVersion);
  });
  assert(called);
  assert(h.resolver->CacheMisses() == 0);
  assert(h.resolver->CacheHits() == 0);
  assert(h.dialer->pending() == 0);
  assert(h.contexts.size() == 0);

  called = false;
  request.key = Key("example.com", 443, "NoSuchProfile");
  h.dialer->Dial(request, [&](Result<std::unique_ptr<Transport>> result) {
    called = true;
    assert(!result);
    assert(result.error().code() == ErrorCode::kUnknownProfile);
  });
  assert(called);
  assert(h.resolver->CacheMisses() == 0);
  assert(h.dialer->pending() == 0);

  std::println("PASSED");
}

void TestResolveFailures() {
  std::print("Testing resolve stage failures... ");

  Harness h({{"nowhere.test", {}}, {"v6only.test", {"::1"}}});

  auto result = h.Dial(Key("nowhere.test", 443));
  AssertDialFailed(result, DialStage::kResolve);
  assert(h.dialer->pending() == 0);

  // SOCKS4 carries an IPv4 address; the proxy itself resolves fine
  result = h.Dial(ViaProxy(ProxyScheme::kSocks4, 1080, "v6only.test"));
  AssertDialFailed(result, DialStage::kResolve);
  assert(result.error().message().find("IPv4") != std::string::npos);
  assert(h.dialer->pending() == 0);

  std::println("PASSED");
}

void TestProxyHangsUpDuringGreeting() {
  std::print("Testing proxy closing during the SOCKS greeting... ");

  Harness h;
  LoopbackServer proxy(h.reactor.loop(), Reply::kHangUp);

  auto result = h.Dial(ViaProxy(ProxyScheme::kSocks5h, proxy.port(),
                                "example.com"));
  AssertDialFailed(result, DialStage::kProxyConnect);
  assert(proxy.accepted() == 1);
  // Method negotiation: version, one method, no auth
  assert(proxy.bytes_received() == 3);
  assert(h.dialer->pending() == 0);

  std::println("PASSED");
}

void TestPlaintextPeerFailsHandshake() {
  std::print("Testing TLS handshake against a plaintext peer... ");

  Harness h;
  LoopbackServer server(h.reactor.loop(), Reply::kGarbage);

  auto result = h.Dial(Key("127.0.0.1", server.port()));
  AssertDialFailed(result, DialStage::kTlsHandshake);
  assert(server.accepted() == 1);
  // The ClientHello went out before the peer answered
  assert(server.bytes_received() > 0);
  assert(h.dialer->pending() == 0);

  std::println("PASSED");
}

void TestHandshakeTimeoutKeepsStage() {
  std::print("Testing dial timeout during the handshake... ");

  Harness h;
  LoopbackServer server(h.reactor.loop(), Reply::kSilent);

  auto result =
      h.Dial(Key("127.0.0.1", server.port()), std::chrono::milliseconds(100));
  AssertDialFailed(result, DialStage::kTlsHandshake);
  assert(result.error().message().find("timed out") != std::string::npos);
  assert(h.dialer->pending() == 0);

  std::println("PASSED");
}

void TestConnectRefused() {
  std::print("Testing refused connections... ");

  Harness h;
  uint16_t port = 0;
  {
    // Bind, learn the port, then close so nothing listens there
    LoopbackServer server(h.reactor.loop(), Reply::kHangUp);
    port = server.port();
  }
  h.reactor.RunFor(10);

  auto result = h.Dial(Key("127.0.0.1", port));
  AssertDialFailed(result, DialStage::kConnect);
  assert(h.dialer->pending() == 0);

  std::println("PASSED");
}

int main() {
  std::println("=== Transport Dialer Unit Tests ===\n");

  TestConfigurationErrorsBeforeIo();
  TestResolveFailures();
  TestProxyHangsUpDuringGreeting();
  TestPlaintextPeerFailsHandshake();
  TestHandshakeTimeoutKeepsStage();
  TestConnectRefused();

  std::println("\nAll transport dialer tests passed!");
  return 0;
}
