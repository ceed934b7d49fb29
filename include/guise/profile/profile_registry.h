// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_PROFILE_PROFILE_REGISTRY_H_
#define GUISE_PROFILE_PROFILE_REGISTRY_H_

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "guise/error.h"
#include "guise/profile/impersonation_profile.h"

namespace guise {
namespace profile {

// Immutable table of impersonation profiles keyed by name.
// Built once and read concurrently without locking.
class ProfileRegistry {
 public:
  // Process-wide registry of the built-in profiles.
  static const ProfileRegistry& Builtin();

  // Validates every profile and builds a registry. On the first invalid
  // profile no registry is produced.
  static Result<std::shared_ptr<const ProfileRegistry>> Create(
      std::vector<ImpersonationProfile> profiles);

  // Checks one profile: non-empty ciphers and groups, no duplicate
  // extension, min <= max version, a valid pseudo-header permutation.
  static Result<void> Validate(const ImpersonationProfile& profile);

  // Fails with kUnknownProfile for unregistered ids
  Result<const ImpersonationProfile*> Lookup(std::string_view id) const;

  bool Contains(std::string_view id) const;

  // Sorted profile names
  std::vector<std::string> Names() const;

  size_t size() const { return profiles_.size(); }

  ProfileRegistry(const ProfileRegistry&) = delete;
  ProfileRegistry& operator=(const ProfileRegistry&) = delete;
  ProfileRegistry(ProfileRegistry&&) = delete;
  ProfileRegistry& operator=(ProfileRegistry&&) = delete;

 private:
  explicit ProfileRegistry(std::map<std::string, ImpersonationProfile,
                                    std::less<>> profiles);

  const std::map<std::string, ImpersonationProfile, std::less<>> profiles_;
};

// The static table behind ProfileRegistry::Builtin()
std::vector<ImpersonationProfile> BuiltinProfiles();

}  // namespace profile
}  // namespace guise

#endif  // GUISE_PROFILE_PROFILE_REGISTRY_H_
