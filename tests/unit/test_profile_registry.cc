// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/profile/profile_registry.h"

#include <cassert>
#include <print>
#include <vector>

using namespace guise;
using namespace guise::profile;

namespace {

// Minimal valid profile: one cipher, one group, [SNI, GREASE, groups, ALPN]
ImpersonationProfile MakeProfile(std::string name) {
  ImpersonationProfile p;
  p.name = std::move(name);
  p.tls.cipher_suites = {0x1301};
  p.tls.supported_groups = {0x001d};
  p.tls.key_share_groups = {0x001d};
  p.tls.extensions = {ext::kServerName, kGreasePlaceholder,
                      ext::kSupportedGroups, ext::kAlpn};
  p.tls.alpn_protocols = {"h2", "http/1.1"};
  p.http2.settings = {{h2setting::kHeaderTableSize, 100},
                      {h2setting::kMaxConcurrentStreams, 0}};
  return p;
}

}  // namespace

void TestBuiltinProfiles() {
  std::print("Testing built-in profiles... ");

  const auto& registry = ProfileRegistry::Builtin();
  assert(registry.size() >= 6);
  assert(registry.Contains("Chrome143"));
  assert(registry.Contains("Firefox133"));
  assert(registry.Contains("Safari17_5"));

  auto chrome = registry.Lookup("Chrome143");
  assert(chrome);
  assert(chrome.value()->name == "Chrome143");
  assert(chrome.value()->tls.permute_extensions);

  // Every built-in profile passes its own validation
  for (const auto& name : registry.Names()) {
    auto p = registry.Lookup(name);
    assert(p);
    assert(ProfileRegistry::Validate(*p.value()));
  }

  std::println("PASSED");
}

void TestUnknownProfile() {
  std::print("Testing unknown profile lookup... ");

  auto missing = ProfileRegistry::Builtin().Lookup("NoSuchProfile");
  assert(!missing);
  assert(missing.error().code() == ErrorCode::kUnknownProfile);

  // Ids are exact, no aliases or case folding
  assert(!ProfileRegistry::Builtin().Lookup("chrome143"));
  assert(!ProfileRegistry::Builtin().Lookup("Chrome"));

  std::println("PASSED");
}

void TestNamesSorted() {
  std::print("Testing registry names... ");

  auto created =
      ProfileRegistry::Create({MakeProfile("Zeta"), MakeProfile("Alpha")});
  assert(created);
  auto names = created.value()->Names();
  assert(names.size() == 2);
  assert(names[0] == "Alpha");
  assert(names[1] == "Zeta");

  std::println("PASSED");
}

void TestInvalidProfileRejectsSet() {
  std::print("Testing invalid profile rejects the whole set... ");

  ImpersonationProfile bad = MakeProfile("Bad");
  bad.tls.extensions.push_back(ext::kServerName);  // duplicate

  auto created = ProfileRegistry::Create({MakeProfile("Good"), bad});
  assert(!created);
  assert(created.error().code() == ErrorCode::kInvalidProfile);

  std::println("PASSED");
}

void TestDuplicateNames() {
  std::print("Testing duplicate profile names... ");

  auto created =
      ProfileRegistry::Create({MakeProfile("Same"), MakeProfile("Same")});
  assert(!created);
  assert(created.error().code() == ErrorCode::kInvalidProfile);

  std::println("PASSED");
}

void TestValidateRules() {
  std::print("Testing profile validation rules... ");

  assert(ProfileRegistry::Validate(MakeProfile("Ok")));

  ImpersonationProfile p = MakeProfile("NoCiphers");
  p.tls.cipher_suites = {kGreasePlaceholder};
  assert(!ProfileRegistry::Validate(p));

  p = MakeProfile("NoGroups");
  p.tls.supported_groups.clear();
  assert(!ProfileRegistry::Validate(p));

  p = MakeProfile("Versions");
  p.tls.min_version = version::kTls13;
  p.tls.max_version = version::kTls12;
  assert(!ProfileRegistry::Validate(p));

  p = MakeProfile("Pseudo");
  p.http2.pseudo_header_order = {PseudoHeader::kMethod, PseudoHeader::kMethod,
                                 PseudoHeader::kScheme, PseudoHeader::kPath};
  assert(!ProfileRegistry::Validate(p));

  p = MakeProfile("KeyShare");
  p.tls.key_share_groups = {0x0017};
  assert(!ProfileRegistry::Validate(p));

  p = MakeProfile("Grease");
  p.tls.extensions.push_back(kGreasePlaceholder);
  assert(ProfileRegistry::Validate(p));  // two GREASE slots are fine
  p.tls.extensions.push_back(kGreasePlaceholder);
  assert(!ProfileRegistry::Validate(p));

  p = MakeProfile("Settings");
  p.http2.settings.push_back({h2setting::kHeaderTableSize, 4096});
  assert(!ProfileRegistry::Validate(p));

  p = MakeProfile("Alpn");
  p.tls.alpn_protocols.clear();
  assert(!ProfileRegistry::Validate(p));

  // Wire weight byte is weight - 1, so 0 and 257 cannot be sent
  p = MakeProfile("Weight");
  p.http2.priority.weight = 0;
  assert(!ProfileRegistry::Validate(p));
  p.http2.priority.weight = 257;
  assert(!ProfileRegistry::Validate(p));
  p.http2.priority.weight = 256;
  assert(ProfileRegistry::Validate(p));

  p = MakeProfile("FrameWeight");
  p.http2.initial_priority_frames.push_back({3, {0, 0, false}});
  assert(!ProfileRegistry::Validate(p));

  std::println("PASSED");
}

void TestPseudoHeaderOrderString() {
  std::print("Testing pseudo-header order string... ");

  PseudoHeaderOrder chrome = {PseudoHeader::kMethod, PseudoHeader::kAuthority,
                              PseudoHeader::kScheme, PseudoHeader::kPath};
  PseudoHeaderOrder firefox = {PseudoHeader::kMethod, PseudoHeader::kPath,
                               PseudoHeader::kAuthority, PseudoHeader::kScheme};
  assert(PseudoHeaderOrderString(chrome) == "m,a,s,p");
  assert(PseudoHeaderOrderString(firefox) == "m,p,a,s");
  assert(IsValidPseudoHeaderOrder(firefox));

  // Out-of-range enum values are rejected, not shifted
  PseudoHeaderOrder bogus = chrome;
  bogus[2] = static_cast<PseudoHeader>(40);
  assert(!IsValidPseudoHeaderOrder(bogus));

  std::println("PASSED");
}

int main() {
  std::println("=== Profile Registry Unit Tests ===");

  TestBuiltinProfiles();
  TestUnknownProfile();
  TestNamesSorted();
  TestInvalidProfileRejectsSet();
  TestDuplicateNames();
  TestValidateRules();
  TestPseudoHeaderOrderString();

  std::println("\nAll profile registry tests passed!");
  return 0;
}
