// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_TLS_CLIENT_HELLO_BUILDER_H_
#define GUISE_TLS_CLIENT_HELLO_BUILDER_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "guise/config.h"
#include "guise/error.h"
#include "guise/profile/impersonation_profile.h"
#include "guise/tls/grease.h"

namespace guise {
namespace tls {

// What the TLS engine can be made to send.
struct TlsEngineCapabilities {
  uint16_t min_version = profile::version::kTls10;
  uint16_t max_version = profile::version::kTls13;

  // The engine decides where GREASE goes: first in the cipher, group,
  // key share and version lists, and as the first and last extension
  // (only padding and pre_shared_key may follow the last one). Profiles
  // asking for anything else cannot be reproduced.
  bool fixed_grease_layout = false;

  static TlsEngineCapabilities BoringSsl() {
    TlsEngineCapabilities caps;
    caps.fixed_grease_layout = true;
    return caps;
  }
};

// A GREASE slot's `type` is the value drawn from the plan's GreaseSeed.
// BoringSSL draws its own GREASE values per handshake, so for that engine
// the drawn values are advisory: positions match the wire, values do not.
struct PlannedExtension {
  uint16_t type = 0;
  bool grease = false;
};

// The recipe a TLS engine is driven with for one handshake. Not a parsed
// ClientHello: the engine produces the bytes, the plan fixes what goes in
// and in which order.
struct ClientHelloPlan {
  std::string server_name;  // empty for IP literals (no SNI)
  uint16_t min_version = 0;
  uint16_t max_version = 0;

  std::vector<uint16_t> cipher_suites;
  std::vector<PlannedExtension> extensions;

  std::vector<uint16_t> supported_groups;
  std::vector<uint16_t> key_share_groups;
  std::vector<uint16_t> signature_algorithms;
  std::vector<uint16_t> supported_versions;
  std::vector<uint8_t> psk_modes;
  std::vector<std::string> alpn_protocols;
  std::vector<std::string> alps_protocols;
  uint16_t alps_codepoint = 0;
  std::vector<profile::CertCompression> cert_compression;
  std::vector<uint16_t> delegated_credentials;
  uint16_t record_size_limit = 0;
  bool ech_grease = false;
  bool permute_extensions = false;
  bool offers_psk = false;

  // Extension ids in wire order, GREASE slots as their drawn values
  std::vector<uint16_t> ExtensionTypes() const;

  bool HasExtension(uint16_t type) const;

  // "11-23-45-..." without GREASE, for SSL_CTX_set_extension_order
  std::string ExtensionOrderString() const;

  // Length-prefixed ALPN list for SSL_set_alpn_protos
  std::vector<uint8_t> AlpnWire() const;

  // Real (non-GREASE) key shares the engine should generate
  size_t KeyShareCount() const;
};

// Turns a profile into a ClientHelloPlan for one connection.
// Pure: no I/O, no engine calls.
class ClientHelloBuilder {
 public:
  explicit ClientHelloBuilder(
      TlsEngineCapabilities caps = TlsEngineCapabilities::BoringSsl(),
      HttpVersionPref http_version = HttpVersionPref::kAll);

  // Fails with kUnsupportedTlsVersion if the profile's version range is not
  // negotiable by the engine, and with kInvalidProfile if the engine cannot
  // place GREASE where the profile does. The PSK slot is kept iff
  // resumption is available; GREASE slots are filled from `seed`.
  Result<ClientHelloPlan> Build(const profile::ImpersonationProfile& p,
                                std::string_view host,
                                bool resumption_available,
                                const GreaseSeed& seed) const;

  const TlsEngineCapabilities& capabilities() const { return caps_; }
  HttpVersionPref http_version() const { return http_version_; }

 private:
  Result<void> CheckVersions(const profile::TlsProfile& tls) const;
  Result<void> CheckGreaseLayout(const profile::ImpersonationProfile& p) const;
  Result<void> NarrowAlpn(const profile::ImpersonationProfile& p,
                          ClientHelloPlan* plan) const;

  TlsEngineCapabilities caps_;
  HttpVersionPref http_version_;
};

// Resolves GREASE placeholders in an id list to `value`
std::vector<uint16_t> ResolveGrease(const std::vector<uint16_t>& ids,
                                    uint16_t value);

}  // namespace tls
}  // namespace guise

#endif  // GUISE_TLS_CLIENT_HELLO_BUILDER_H_
