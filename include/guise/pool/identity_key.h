// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_POOL_IDENTITY_KEY_H_
#define GUISE_POOL_IDENTITY_KEY_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "guise/error.h"

namespace guise {
namespace pool {

enum class ProxyScheme {
  kHttp,
  kHttps,
  kSocks4,
  kSocks4a,
  kSocks5,
  kSocks5h,
};

std::string_view ProxySchemeName(ProxyScheme scheme);

// Upstream proxy. Equality covers scheme, address and credentials, never
// connection state.
struct ProxyDescriptor {
  ProxyScheme scheme = ProxyScheme::kHttp;
  std::string host;
  uint16_t port = 0;
  std::string username;
  std::string password;

  bool HasCredentials() const { return !username.empty(); }

  // SOCKS4a and SOCKS5h resolve the target name at the proxy
  bool ResolvesRemotely() const {
    return scheme == ProxyScheme::kSocks4a || scheme == ProxyScheme::kSocks5h ||
           scheme == ProxyScheme::kHttp || scheme == ProxyScheme::kHttps;
  }

  bool IsSocks() const {
    return scheme != ProxyScheme::kHttp && scheme != ProxyScheme::kHttps;
  }

  // "socks5h://host:1080", credentials replaced by "***"
  std::string ToString() const;

  bool operator==(const ProxyDescriptor& other) const = default;
};

// Parses "scheme://[user[:password]@]host[:port]". The port defaults to 80
// for http, 443 for https and 1080 for SOCKS. Userinfo is percent-decoded.
Result<ProxyDescriptor> ParseProxyUrl(std::string_view url);

// Local egress selection. Either or both may be set.
struct LocalPath {
  std::optional<std::string> bind_address;
  std::optional<std::string> interface_name;

  bool empty() const { return !bind_address && !interface_name; }

  bool operator==(const LocalPath& other) const = default;
};

// Connection pool key. Two requests may share a connection iff their keys
// compare equal.
struct IdentityKey {
  std::string host;
  uint16_t port = 443;
  std::optional<ProxyDescriptor> proxy;
  std::optional<LocalPath> local_path;
  std::string profile;

  // host:port, with IPv6 literals bracketed
  std::string Authority() const;

  // Stable log form without credentials
  std::string ToString() const;

  size_t Hash() const;

  bool operator==(const IdentityKey& other) const = default;
};

struct IdentityKeyHash {
  size_t operator()(const IdentityKey& key) const { return key.Hash(); }
};

// Builds a key, folding an empty LocalPath into "no local path" so both
// spellings pool together.
IdentityKey MakeIdentityKey(std::string host, uint16_t port,
                            std::optional<ProxyDescriptor> proxy,
                            std::optional<LocalPath> local_path,
                            std::string profile);

}  // namespace pool
}  // namespace guise

#endif  // GUISE_POOL_IDENTITY_KEY_H_
