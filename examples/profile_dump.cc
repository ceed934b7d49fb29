// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

// Example: print what each built-in profile puts on the wire
//
// For every profile (or the ones named on the command line) this prints the
// ClientHello extension order, cipher suites, ALPN and the Akamai HTTP/2
// fingerprint, without opening a connection.
//
// Usage: ./profile_dump [profile...]

#include <print>
#include <string>
#include <vector>

#include "guise/profile/profile_registry.h"
#include "guise/http2/h2_preface.h"
#include "guise/tls/client_hello_builder.h"
#include "guise/tls/grease.h"

using namespace guise;

namespace {

std::string JoinIds(const std::vector<uint16_t>& ids) {
  std::string out;
  for (uint16_t id : ids) {
    if (!out.empty()) out += '-';
    out += tls::IsGreaseValue(id) ? std::string("GREASE") : std::to_string(id);
  }
  return out;
}

std::string JoinStrings(const std::vector<std::string>& items) {
  std::string out;
  for (const auto& item : items) {
    if (!out.empty()) out += ',';
    out += item;
  }
  return out;
}

bool Dump(const profile::ProfileRegistry& registry, const std::string& name) {
  auto profile = registry.Lookup(name);
  if (!profile) {
    std::println(stderr, "{}", profile.error().ToString());
    return false;
  }
  const profile::ImpersonationProfile& p = *profile.value();

  tls::ClientHelloBuilder builder;
  auto plan = builder.Build(p, "example.com", false, tls::GreaseSeed());
  if (!plan) {
    std::println(stderr, "{}: {}", name, plan.error().ToString());
    return false;
  }

  http2::Http2Preface preface = http2::Http2PrefaceBuilder::Build(p.http2);

  std::println("{}", p.name);
  std::println("  ciphers:    {}", JoinIds(plan.value().cipher_suites));
  std::println("  extensions: {}", JoinIds(plan.value().ExtensionTypes()));
  std::println("  groups:     {}", JoinIds(plan.value().supported_groups));
  std::println("  alpn:       {}", JoinStrings(plan.value().alpn_protocols));
  std::println("  permute:    {}", plan.value().permute_extensions);
  std::println("  akamai:     {}", http2::AkamaiFingerprint(preface));
  std::println("");
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  const auto& registry = profile::ProfileRegistry::Builtin();

  std::vector<std::string> names;
  for (int i = 1; i < argc; ++i) {
    names.emplace_back(argv[i]);
  }
  if (names.empty()) {
    names = registry.Names();
  }

  int failures = 0;
  for (const auto& name : names) {
    if (!Dump(registry, name)) {
      ++failures;
    }
  }
  return failures == 0 ? 0 : 1;
}
