// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/proxy/socks_proxy.h"

#include <cassert>
#include <cstring>
#include <print>
#include <vector>

#include "guise/proxy/socks_constants.h"

using namespace guise;
using namespace guise::proxy;
using pool::ProxyScheme;

namespace {

using Bytes = std::vector<uint8_t>;

// Takes everything the tunnel wants to send
Bytes Drain(ProxyTunnel& tunnel) {
  Bytes out(tunnel.PendingOutput(),
            tunnel.PendingOutput() + tunnel.PendingOutputSize());
  tunnel.ConsumeOutput(out.size());
  return out;
}

TunnelResult Reply(ProxyTunnel& tunnel, const Bytes& bytes) {
  return tunnel.Feed(bytes.data(), bytes.size());
}

const Bytes kSocks5Ipv4Ok = {0x05, 0x00, 0x00, 0x01, 10, 0, 0, 1, 0x01, 0xBB};

}  // namespace

void TestSocks5hNoAuth() {
  std::print("Testing SOCKS5h handshake without auth... ");

  SocksProxyTunnel tunnel(ProxyScheme::kSocks5h, "example.com", 443);
  assert(!tunnel.IsConnected());
  assert(!tunnel.HasError());

  assert(tunnel.Start() == TunnelResult::kWantWrite);
  assert(tunnel.step() == SocksStep::kMethod);
  assert(Drain(tunnel) == Bytes({0x05, 0x01, 0x00}));
  assert(!tunnel.WantsWrite());

  // Method choice arrives in pieces
  const uint8_t first = 0x05;
  assert(tunnel.Feed(&first, 1) == TunnelResult::kWantRead);
  const uint8_t second = 0x00;
  assert(tunnel.Feed(&second, 1) == TunnelResult::kWantWrite);
  assert(tunnel.step() == SocksStep::kConnectReply);

  // Host name goes to the proxy for resolution
  Bytes expected = {0x05, 0x01, 0x00, 0x03, 11};
  for (char c : std::string("example.com")) {
    expected.push_back(static_cast<uint8_t>(c));
  }
  expected.push_back(0x01);
  expected.push_back(0xBB);
  assert(Drain(tunnel) == expected);

  assert(Reply(tunnel, kSocks5Ipv4Ok) == TunnelResult::kOk);
  assert(tunnel.IsConnected());
  assert(tunnel.step() == SocksStep::kDone);
  assert(tunnel.leftover().empty());

  std::println("PASSED");
}

void TestSocks5WithAuth() {
  std::print("Testing SOCKS5 username/password auth... ");

  SocksProxyTunnel tunnel(ProxyScheme::kSocks5h, "example.com", 443, "",
                          "user", "pw");
  assert(tunnel.Start() == TunnelResult::kWantWrite);
  assert(Drain(tunnel) == Bytes({0x05, 0x02, 0x00, 0x02}));

  assert(Reply(tunnel, {0x05, 0x02}) == TunnelResult::kWantWrite);
  assert(tunnel.step() == SocksStep::kAuth);
  assert(Drain(tunnel) ==
         Bytes({0x01, 4, 'u', 's', 'e', 'r', 2, 'p', 'w'}));

  assert(Reply(tunnel, {0x01, 0x00}) == TunnelResult::kWantWrite);
  assert(tunnel.step() == SocksStep::kConnectReply);
  Drain(tunnel);

  assert(Reply(tunnel, kSocks5Ipv4Ok) == TunnelResult::kOk);
  assert(tunnel.IsConnected());

  std::println("PASSED");
}

void TestSocks5AuthRejected() {
  std::print("Testing SOCKS5 auth rejection... ");

  SocksProxyTunnel tunnel(ProxyScheme::kSocks5h, "example.com", 443, "",
                          "user", "wrong");
  tunnel.Start();
  Drain(tunnel);
  Reply(tunnel, {0x05, 0x02});
  Drain(tunnel);
  assert(Reply(tunnel, {0x01, 0x01}) == TunnelResult::kError);
  assert(tunnel.HasError());
  assert(tunnel.last_error() == "SOCKS5 authentication failed");

  // Proxy wants credentials we do not have
  SocksProxyTunnel anonymous(ProxyScheme::kSocks5h, "example.com", 443);
  anonymous.Start();
  Drain(anonymous);
  assert(Reply(anonymous, {0x05, 0x02}) == TunnelResult::kError);

  SocksProxyTunnel refused(ProxyScheme::kSocks5h, "example.com", 443);
  refused.Start();
  Drain(refused);
  assert(Reply(refused, {0x05, 0xFF}) == TunnelResult::kError);

  std::println("PASSED");
}

void TestSocks5LocalResolution() {
  std::print("Testing SOCKS5 with locally resolved address... ");

  SocksProxyTunnel v4(ProxyScheme::kSocks5, "example.com", 8443,
                      "93.184.216.34");
  v4.Start();
  Drain(v4);
  Reply(v4, {0x05, 0x00});
  assert(Drain(v4) ==
         Bytes({0x05, 0x01, 0x00, 0x01, 93, 184, 216, 34, 0x20, 0xFB}));

  SocksProxyTunnel v6(ProxyScheme::kSocks5, "example.com", 443, "::1");
  v6.Start();
  Drain(v6);
  Reply(v6, {0x05, 0x00});
  Bytes request = Drain(v6);
  assert(request.size() == 4 + 16 + 2);
  assert(request[3] == socks5::kAtypIpv6);
  assert(request[19] == 1);

  // SOCKS5 without an address cannot send CONNECT
  SocksProxyTunnel missing(ProxyScheme::kSocks5, "example.com", 443);
  missing.Start();
  Drain(missing);
  assert(Reply(missing, {0x05, 0x00}) == TunnelResult::kError);
  assert(missing.HasError());

  std::println("PASSED");
}

void TestSocks5ConnectFailure() {
  std::print("Testing SOCKS5 connect failure... ");

  SocksProxyTunnel tunnel(ProxyScheme::kSocks5h, "example.com", 443);
  tunnel.Start();
  Drain(tunnel);
  Reply(tunnel, {0x05, 0x00});
  Drain(tunnel);

  assert(Reply(tunnel, {0x05, socks5::kRepConnectionRefused, 0x00, 0x01}) ==
         TunnelResult::kError);
  assert(tunnel.last_error() == "SOCKS5 connect failed: connection refused");

  std::println("PASSED");
}

void TestSocks5DomainReplyAndLeftover() {
  std::print("Testing SOCKS5 domain reply with trailing bytes... ");

  SocksProxyTunnel tunnel(ProxyScheme::kSocks5h, "example.com", 443);
  tunnel.Start();
  Drain(tunnel);
  Reply(tunnel, {0x05, 0x00});
  Drain(tunnel);

  // Bound address as a 3-byte name, then two bytes of the origin's data
  Bytes reply = {0x05, 0x00, 0x00, 0x03, 3, 'p', 'x', 'y', 0x04, 0x38,
                 0x16, 0x03};
  assert(Reply(tunnel, Bytes(reply.begin(), reply.begin() + 6)) ==
         TunnelResult::kWantRead);
  assert(Reply(tunnel, Bytes(reply.begin() + 6, reply.end())) ==
         TunnelResult::kOk);
  assert(tunnel.leftover() == Bytes({0x16, 0x03}));

  std::println("PASSED");
}

void TestSocks4() {
  std::print("Testing SOCKS4... ");

  SocksProxyTunnel tunnel(ProxyScheme::kSocks4, "example.com", 80,
                          "93.184.216.34", "bob");
  assert(tunnel.Start() == TunnelResult::kWantWrite);
  assert(tunnel.step() == SocksStep::kConnectReply);
  assert(Drain(tunnel) ==
         Bytes({0x04, 0x01, 0x00, 0x50, 93, 184, 216, 34, 'b', 'o', 'b', 0}));

  Bytes granted = {0x00, socks4::kRepGranted, 0, 0, 0, 0, 0, 0};
  assert(Reply(tunnel, granted) == TunnelResult::kOk);
  assert(tunnel.IsConnected());

  // SOCKS4 cannot carry a name or an IPv6 address
  SocksProxyTunnel unresolved(ProxyScheme::kSocks4, "example.com", 443);
  assert(unresolved.Start() == TunnelResult::kError);
  assert(unresolved.HasError());
  SocksProxyTunnel v6(ProxyScheme::kSocks4, "example.com", 443, "::1");
  assert(v6.Start() == TunnelResult::kError);

  SocksProxyTunnel rejected(ProxyScheme::kSocks4, "example.com", 443,
                            "10.0.0.1");
  rejected.Start();
  Drain(rejected);
  assert(Reply(rejected, {0x00, socks4::kRepRejected, 0, 0, 0, 0, 0, 0}) ==
         TunnelResult::kError);
  assert(rejected.last_error() ==
         "SOCKS4 connect failed: request rejected or failed");

  std::println("PASSED");
}

void TestSocks4a() {
  std::print("Testing SOCKS4a... ");

  SocksProxyTunnel tunnel(ProxyScheme::kSocks4a, "a.io", 443);
  assert(tunnel.Start() == TunnelResult::kWantWrite);
  assert(Drain(tunnel) == Bytes({0x04, 0x01, 0x01, 0xBB, 0, 0, 0, 1, 0, 'a',
                                 '.', 'i', 'o', 0}));

  assert(Reply(tunnel, {0x04, socks4::kRepGranted, 0, 0, 0, 0, 0, 0}) ==
         TunnelResult::kOk);

  std::println("PASSED");
}

void TestMisuse() {
  std::print("Testing tunnel misuse... ");

  SocksProxyTunnel tunnel(ProxyScheme::kSocks5h, "example.com", 443);
  const uint8_t byte = 0x05;
  // Not started
  assert(tunnel.Feed(&byte, 1) == TunnelResult::kError);

  SocksProxyTunnel twice(ProxyScheme::kSocks5h, "example.com", 443);
  twice.Start();
  assert(twice.Start() == TunnelResult::kError);

  SocksProxyTunnel bad_version(ProxyScheme::kSocks5h, "example.com", 443);
  bad_version.Start();
  Drain(bad_version);
  assert(Reply(bad_version, {0x04, 0x00}) == TunnelResult::kError);

  std::println("PASSED");
}

void TestReplyStrings() {
  std::print("Testing reply strings... ");

  assert(std::strcmp(socks5::ReplyCodeToString(socks5::kRepSucceeded),
                     "succeeded") == 0);
  assert(std::strcmp(socks5::ReplyCodeToString(0x7F), "unknown error") == 0);
  assert(std::strcmp(socks4::ReplyCodeToString(socks4::kRepGranted),
                     "request granted") == 0);

  std::println("PASSED");
}

int main() {
  std::println("=== SOCKS Proxy Unit Tests ===\n");

  TestSocks5hNoAuth();
  TestSocks5WithAuth();
  TestSocks5AuthRejected();
  TestSocks5LocalResolution();
  TestSocks5ConnectFailure();
  TestSocks5DomainReplyAndLeftover();
  TestSocks4();
  TestSocks4a();
  TestMisuse();
  TestReplyStrings();

  std::println("\nAll SOCKS proxy tests passed!");
  return 0;
}
