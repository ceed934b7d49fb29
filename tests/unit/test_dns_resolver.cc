// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/util/dns_resolver.h"

#include <cassert>
#include <print>

#include "guise/core/reactor.h"

using namespace guise;
using guise::util::DnsResolver;
using guise::util::ResolvedAddress;

void TestOverridesWin() {
  std::print("Testing overrides... ");

  core::Reactor reactor;
  assert(reactor.Initialize());
  DnsResolver resolver(reactor.loop(),
                       {{"pinned.test", {"192.0.2.7", "2001:db8::7"}}});

  bool called = false;
  resolver.ResolveAsync(
      "pinned.test",
      [&](const std::vector<ResolvedAddress>& addrs, const std::string& err) {
        called = true;
        assert(err.empty());
        assert(addrs.size() == 2);
        assert(addrs[0].ip == "192.0.2.7");
        assert(!addrs[0].is_ipv6);
        assert(addrs[1].is_ipv6);
      });
  // Answered without running the loop
  assert(called);
  assert(resolver.CacheMisses() == 0);

  std::println("PASSED");
}

void TestLiterals() {
  std::print("Testing IP literals... ");

  core::Reactor reactor;
  assert(reactor.Initialize());
  DnsResolver resolver(reactor.loop());

  int calls = 0;
  resolver.ResolveAsync(
      "10.1.2.3",
      [&](const std::vector<ResolvedAddress>& addrs, const std::string& err) {
        ++calls;
        assert(err.empty());
        assert(addrs.size() == 1 && addrs[0].ip == "10.1.2.3");
      });
  resolver.ResolveAsync(
      "::1",
      [&](const std::vector<ResolvedAddress>& addrs, const std::string&) {
        ++calls;
        assert(addrs.size() == 1 && addrs[0].is_ipv6);
      });
  assert(calls == 2);

  std::println("PASSED");
}

void TestSystemResolverAndCache() {
  std::print("Testing system resolver and cache... ");

  core::Reactor reactor;
  assert(reactor.Initialize());
  DnsResolver resolver(reactor.loop());

  std::string error = "pending";
  std::vector<ResolvedAddress> found;
  resolver.ResolveAsync(
      "localhost",
      [&](const std::vector<ResolvedAddress>& addrs, const std::string& err) {
        error = err;
        found = addrs;
        reactor.Stop();
      });
  reactor.Run();
  assert(error.empty());
  assert(!found.empty());
  assert(resolver.CacheMisses() == 1);

  bool cached = false;
  resolver.ResolveAsync(
      "localhost",
      [&](const std::vector<ResolvedAddress>& addrs, const std::string&) {
        cached = addrs.size() == found.size();
      });
  assert(cached);
  assert(resolver.CacheHits() == 1);

  std::println("PASSED");
}

int main() {
  std::println("=== DNS Resolver Unit Tests ===\n");

  TestOverridesWin();
  TestLiterals();
  TestSystemResolverAndCache();

  std::println("\nAll DNS resolver tests passed!");
  return 0;
}
