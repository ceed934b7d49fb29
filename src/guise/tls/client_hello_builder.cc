// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/tls/client_hello_builder.h"

#include <algorithm>
#include <format>

#include "guise/util/url_parser.h"

namespace guise {
namespace tls {

namespace {

constexpr std::string_view kH2 = "h2";
constexpr std::string_view kHttp11 = "http/1.1";

bool Contains(const std::vector<std::string>& list, std::string_view value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

size_t CountGrease(const std::vector<uint16_t>& ids) {
  return static_cast<size_t>(
      std::count(ids.begin(), ids.end(), profile::kGreasePlaceholder));
}

// Empty, or one GREASE placeholder in front
bool GreaseLeads(const std::vector<uint16_t>& ids) {
  return ids.empty() ||
         (ids.front() == profile::kGreasePlaceholder && CountGrease(ids) == 1);
}

// Extensions the engine always writes after its last GREASE extension
bool TrailsGrease(uint16_t id) {
  return id == profile::ext::kPadding || id == profile::ext::kPreSharedKey;
}

}  // namespace

std::vector<uint16_t> ResolveGrease(const std::vector<uint16_t>& ids,
                                    uint16_t value) {
  std::vector<uint16_t> out;
  out.reserve(ids.size());
  for (uint16_t id : ids) {
    out.push_back(id == profile::kGreasePlaceholder ? value : id);
  }
  return out;
}

// ClientHelloPlan

std::vector<uint16_t> ClientHelloPlan::ExtensionTypes() const {
  std::vector<uint16_t> types;
  types.reserve(extensions.size());
  for (const auto& e : extensions) {
    types.push_back(e.type);
  }
  return types;
}

bool ClientHelloPlan::HasExtension(uint16_t type) const {
  return std::any_of(extensions.begin(), extensions.end(),
                     [type](const PlannedExtension& e) {
                       return !e.grease && e.type == type;
                     });
}

std::string ClientHelloPlan::ExtensionOrderString() const {
  std::string out;
  for (const auto& e : extensions) {
    if (e.grease) continue;
    if (!out.empty()) out += '-';
    out += std::to_string(e.type);
  }
  return out;
}

std::vector<uint8_t> ClientHelloPlan::AlpnWire() const {
  std::vector<uint8_t> wire;
  for (const auto& proto : alpn_protocols) {
    wire.push_back(static_cast<uint8_t>(proto.size()));
    wire.insert(wire.end(), proto.begin(), proto.end());
  }
  return wire;
}

size_t ClientHelloPlan::KeyShareCount() const {
  return static_cast<size_t>(std::count_if(
      key_share_groups.begin(), key_share_groups.end(),
      [](uint16_t g) { return !IsGreaseValue(g); }));
}

// ClientHelloBuilder

ClientHelloBuilder::ClientHelloBuilder(TlsEngineCapabilities caps,
                                       HttpVersionPref http_version)
    : caps_(caps), http_version_(http_version) {}

Result<void> ClientHelloBuilder::CheckVersions(
    const profile::TlsProfile& tls) const {
  if (tls.min_version < caps_.min_version ||
      tls.max_version > caps_.max_version) {
    return Error::UnsupportedTlsVersion(
        std::format("profile range {:#06x}-{:#06x} outside engine range "
                    "{:#06x}-{:#06x}",
                    tls.min_version, tls.max_version, caps_.min_version,
                    caps_.max_version));
  }
  for (uint16_t v : tls.supported_versions) {
    if (v == profile::kGreasePlaceholder) continue;
    if (v < caps_.min_version || v > caps_.max_version) {
      return Error::UnsupportedTlsVersion(
          std::format("supported_versions lists {:#06x}", v));
    }
  }
  return {};
}

Result<void> ClientHelloBuilder::CheckGreaseLayout(
    const profile::ImpersonationProfile& p) const {
  if (!caps_.fixed_grease_layout) {
    return {};
  }
  const profile::TlsProfile& tls = p.tls;
  const size_t in_lists =
      CountGrease(tls.cipher_suites) + CountGrease(tls.supported_groups) +
      CountGrease(tls.key_share_groups) + CountGrease(tls.supported_versions);
  const size_t in_extensions = CountGrease(tls.extensions);
  if (in_lists == 0 && in_extensions == 0) {
    return {};
  }

  // One switch turns every GREASE slot on
  if (!GreaseLeads(tls.cipher_suites) || !GreaseLeads(tls.supported_groups) ||
      !GreaseLeads(tls.key_share_groups) ||
      !GreaseLeads(tls.supported_versions) || tls.cipher_suites.empty() ||
      tls.supported_groups.empty()) {
    return Error::InvalidProfile(
        "profile '" + p.name +
        "': the TLS engine puts GREASE first in every id list, or nowhere");
  }

  const auto& ext = tls.extensions;
  size_t last = ext.size();
  while (last > 0 && TrailsGrease(ext[last - 1])) {
    --last;
  }
  if (in_extensions != 2 || ext.front() != profile::kGreasePlaceholder ||
      last < 2 || ext[last - 1] != profile::kGreasePlaceholder) {
    return Error::InvalidProfile(
        "profile '" + p.name +
        "': the TLS engine sends exactly two GREASE extensions, first and "
        "last before padding and pre_shared_key");
  }
  return {};
}

Result<void> ClientHelloBuilder::NarrowAlpn(
    const profile::ImpersonationProfile& p, ClientHelloPlan* plan) const {
  const auto& offered = p.tls.alpn_protocols;

  switch (http_version_) {
    case HttpVersionPref::kAll:
      plan->alpn_protocols = offered;
      plan->alps_protocols = p.tls.alps_protocols;
      return {};

    case HttpVersionPref::kHttp2:
      if (!offered.empty() && !Contains(offered, kH2)) {
        return Error::InvalidProfile("profile '" + p.name +
                                     "' does not offer h2");
      }
      if (!offered.empty()) plan->alpn_protocols = {std::string(kH2)};
      plan->alps_protocols = p.tls.alps_protocols;
      return {};

    case HttpVersionPref::kHttp1:
      if (!offered.empty() && !Contains(offered, kHttp11)) {
        return Error::InvalidProfile("profile '" + p.name +
                                     "' does not offer http/1.1");
      }
      if (!offered.empty()) plan->alpn_protocols = {std::string(kHttp11)};
      // Settings follow the protocol that will be negotiated
      if (!p.tls.alps_protocols.empty()) {
        plan->alps_protocols = {std::string(kHttp11)};
      }
      return {};
  }
  return {};
}

Result<ClientHelloPlan> ClientHelloBuilder::Build(
    const profile::ImpersonationProfile& p, std::string_view host,
    bool resumption_available, const GreaseSeed& seed) const {
  const profile::TlsProfile& tls = p.tls;

  auto versions_ok = CheckVersions(tls);
  if (!versions_ok) {
    return versions_ok.error();
  }

  auto grease_ok = CheckGreaseLayout(p);
  if (!grease_ok) {
    return grease_ok.error();
  }

  ClientHelloPlan plan;
  plan.min_version = tls.min_version;
  plan.max_version = tls.max_version;
  if (!util::IsIpLiteral(host)) {
    plan.server_name = std::string(host);
  }

  auto alpn_ok = NarrowAlpn(p, &plan);
  if (!alpn_ok) {
    return alpn_ok.error();
  }

  // PSK needs TLS 1.3 and must be declared by the profile
  plan.offers_psk = resumption_available &&
                    tls.max_version >= profile::version::kTls13;

  int grease_extensions = 0;
  plan.extensions.reserve(tls.extensions.size());
  for (uint16_t id : tls.extensions) {
    if (id == profile::kGreasePlaceholder) {
      plan.extensions.push_back({seed.ExtensionValue(grease_extensions), true});
      ++grease_extensions;
      continue;
    }
    if (id == profile::ext::kPreSharedKey && !plan.offers_psk) {
      continue;
    }
    if (id == profile::ext::kServerName && plan.server_name.empty()) {
      continue;
    }
    plan.extensions.push_back({id, false});
  }
  if (std::none_of(tls.extensions.begin(), tls.extensions.end(), [](uint16_t id) {
        return id == profile::ext::kPreSharedKey;
      })) {
    plan.offers_psk = false;
  }

  const uint16_t group_grease = seed.Value(GreaseIndex::kGroup);
  plan.cipher_suites =
      ResolveGrease(tls.cipher_suites, seed.Value(GreaseIndex::kCipher));
  plan.supported_groups = ResolveGrease(tls.supported_groups, group_grease);
  plan.key_share_groups = ResolveGrease(tls.key_share_groups, group_grease);
  plan.supported_versions =
      ResolveGrease(tls.supported_versions, seed.Value(GreaseIndex::kVersion));
  plan.signature_algorithms = tls.signature_algorithms;
  plan.psk_modes = tls.psk_modes;
  plan.alps_codepoint = tls.alps_codepoint;
  plan.cert_compression = tls.cert_compression;
  plan.delegated_credentials = tls.delegated_credentials;
  plan.record_size_limit = tls.record_size_limit;
  plan.ech_grease = tls.ech_grease;
  plan.permute_extensions = tls.permute_extensions;

  return plan;
}

}  // namespace tls
}  // namespace guise
