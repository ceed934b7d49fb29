// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/profile/profile_registry.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>
#include <stdexcept>

namespace guise {
namespace profile {

namespace {

Error Invalid(const ImpersonationProfile& p, std::string_view what) {
  return Error::InvalidProfile("profile '" + p.name + "': " + std::string(what));
}

bool HasRealEntry(const std::vector<uint16_t>& ids) {
  return std::any_of(ids.begin(), ids.end(),
                     [](uint16_t id) { return id != kGreasePlaceholder; });
}

bool IsValidWeight(const StreamPriority& priority) {
  return priority.weight >= 1 && priority.weight <= 256;
}

}  // namespace

std::string PseudoHeaderOrderString(const PseudoHeaderOrder& order) {
  std::string out;
  for (PseudoHeader h : order) {
    if (!out.empty()) out += ',';
    switch (h) {
      case PseudoHeader::kMethod:
        out += 'm';
        break;
      case PseudoHeader::kAuthority:
        out += 'a';
        break;
      case PseudoHeader::kScheme:
        out += 's';
        break;
      case PseudoHeader::kPath:
        out += 'p';
        break;
    }
  }
  return out;
}

bool IsValidPseudoHeaderOrder(const PseudoHeaderOrder& order) {
  unsigned seen = 0;
  for (PseudoHeader h : order) {
    if (static_cast<unsigned>(h) > 3) {
      return false;
    }
    auto bit = 1u << static_cast<unsigned>(h);
    if ((seen & bit) != 0) {
      return false;
    }
    seen |= bit;
  }
  return seen == 0xf;
}

ProfileRegistry::ProfileRegistry(
    std::map<std::string, ImpersonationProfile, std::less<>> profiles)
    : profiles_(std::move(profiles)) {}

const ProfileRegistry& ProfileRegistry::Builtin() {
  static const std::shared_ptr<const ProfileRegistry> registry = [] {
    auto created = Create(BuiltinProfiles());
    if (!created) {
      throw std::runtime_error("built-in profile table is invalid: " +
                               created.error().message());
    }
    return std::move(created).value();
  }();
  return *registry;
}

Result<void> ProfileRegistry::Validate(const ImpersonationProfile& p) {
  if (p.name.empty()) {
    return Error::InvalidProfile("profile with empty name");
  }

  const TlsProfile& tls = p.tls;
  if (!HasRealEntry(tls.cipher_suites)) {
    return Invalid(p, "empty cipher suite list");
  }
  if (!HasRealEntry(tls.supported_groups)) {
    return Invalid(p, "empty supported groups list");
  }
  if (tls.extensions.empty()) {
    return Invalid(p, "empty extension list");
  }

  // GREASE slots may repeat, real extension ids may not
  std::set<uint16_t> seen;
  int grease_slots = 0;
  for (uint16_t id : tls.extensions) {
    if (id == kGreasePlaceholder) {
      // Browsers send at most two, and the two must differ
      if (++grease_slots > 2) {
        return Invalid(p, "more than two GREASE extensions");
      }
      continue;
    }
    if (!seen.insert(id).second) {
      return Invalid(p, "duplicate extension " + std::to_string(id));
    }
  }

  if (tls.min_version > tls.max_version) {
    return Invalid(p, "min_version above max_version");
  }

  for (uint16_t group : tls.key_share_groups) {
    if (group != kGreasePlaceholder &&
        std::find(tls.supported_groups.begin(), tls.supported_groups.end(),
                  group) == tls.supported_groups.end()) {
      return Invalid(p, "key share group not in supported groups");
    }
  }

  if (seen.count(ext::kAlpn) != 0 && tls.alpn_protocols.empty()) {
    return Invalid(p, "ALPN extension without protocols");
  }

  if (!IsValidPseudoHeaderOrder(p.http2.pseudo_header_order)) {
    return Invalid(p, "pseudo-header order is not a permutation");
  }

  std::set<uint16_t> settings_seen;
  for (const auto& setting : p.http2.settings) {
    if (!settings_seen.insert(setting.id).second) {
      return Invalid(p, "duplicate SETTINGS id " + std::to_string(setting.id));
    }
  }

  // Weight goes on the wire as weight - 1 in one byte
  if (!IsValidWeight(p.http2.priority)) {
    return Invalid(p, "stream priority weight outside 1..256");
  }
  for (const auto& frame : p.http2.initial_priority_frames) {
    if (!IsValidWeight(frame.priority)) {
      return Invalid(p, "PRIORITY frame weight outside 1..256");
    }
  }

  if (p.http2.padded && p.http2.padding_block == 0) {
    return Invalid(p, "padded profile without padding block");
  }

  return {};
}

Result<std::shared_ptr<const ProfileRegistry>> ProfileRegistry::Create(
    std::vector<ImpersonationProfile> profiles) {
  std::map<std::string, ImpersonationProfile, std::less<>> table;

  for (auto& p : profiles) {
    auto valid = Validate(p);
    if (!valid) {
      SPDLOG_ERROR("rejecting profile set: {}", valid.error().message());
      return valid.error();
    }
    if (table.count(p.name) != 0) {
      return Error::InvalidProfile("duplicate profile name '" + p.name + "'");
    }
    std::string name = p.name;
    table.emplace(std::move(name), std::move(p));
  }

  return std::shared_ptr<const ProfileRegistry>(
      new ProfileRegistry(std::move(table)));
}

Result<const ImpersonationProfile*> ProfileRegistry::Lookup(
    std::string_view id) const {
  auto it = profiles_.find(id);
  if (it == profiles_.end()) {
    return Error::UnknownProfile(id);
  }
  return &it->second;
}

bool ProfileRegistry::Contains(std::string_view id) const {
  return profiles_.find(id) != profiles_.end();
}

std::vector<std::string> ProfileRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(profiles_.size());
  for (const auto& [name, p] : profiles_) {
    names.push_back(name);
  }
  return names;
}

}  // namespace profile
}  // namespace guise
