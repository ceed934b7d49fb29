// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/pool/identity_key.h"

#include "guise/util/url_parser.h"

namespace guise {
namespace pool {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

void HashBytes(uint64_t* hash, std::string_view bytes) {
  for (char c : bytes) {
    *hash ^= static_cast<uint64_t>(static_cast<unsigned char>(c));
    *hash *= kFnvPrime;
  }
  // Field separator so ("ab","c") and ("a","bc") differ
  *hash ^= 0xff;
  *hash *= kFnvPrime;
}

void HashInt(uint64_t* hash, uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    *hash ^= (value >> (i * 8)) & 0xff;
    *hash *= kFnvPrime;
  }
}

std::string BracketHost(const std::string& host) {
  return host.find(':') != std::string::npos ? "[" + host + "]" : host;
}

}  // namespace

std::string_view ProxySchemeName(ProxyScheme scheme) {
  switch (scheme) {
    case ProxyScheme::kHttp:
      return "http";
    case ProxyScheme::kHttps:
      return "https";
    case ProxyScheme::kSocks4:
      return "socks4";
    case ProxyScheme::kSocks4a:
      return "socks4a";
    case ProxyScheme::kSocks5:
      return "socks5";
    case ProxyScheme::kSocks5h:
      return "socks5h";
  }
  return "unknown";
}

std::string ProxyDescriptor::ToString() const {
  std::string out(ProxySchemeName(scheme));
  out += "://";
  if (HasCredentials()) {
    out += "***@";
  }
  out += BracketHost(host);
  out += ':';
  out += std::to_string(port);
  return out;
}

Result<ProxyDescriptor> ParseProxyUrl(std::string_view url) {
  util::ParsedUrl parsed;
  if (!util::ParseUrl(url, &parsed)) {
    return Error::InvalidUrl("malformed proxy url");
  }

  ProxyDescriptor proxy;
  if (parsed.scheme == "http") {
    proxy.scheme = ProxyScheme::kHttp;
  } else if (parsed.scheme == "https") {
    proxy.scheme = ProxyScheme::kHttps;
  } else if (parsed.scheme == "socks4") {
    proxy.scheme = ProxyScheme::kSocks4;
  } else if (parsed.scheme == "socks4a") {
    proxy.scheme = ProxyScheme::kSocks4a;
  } else if (parsed.scheme == "socks5") {
    proxy.scheme = ProxyScheme::kSocks5;
  } else if (parsed.scheme == "socks5h") {
    proxy.scheme = ProxyScheme::kSocks5h;
  } else {
    return Error::InvalidUrl("unsupported proxy scheme: " + parsed.scheme);
  }

  proxy.host = std::move(parsed.host);
  proxy.port = parsed.port;
  proxy.username = std::move(parsed.username);
  proxy.password = std::move(parsed.password);
  return proxy;
}

std::string IdentityKey::Authority() const {
  return BracketHost(host) + ":" + std::to_string(port);
}

std::string IdentityKey::ToString() const {
  std::string out = Authority();
  out += " profile=";
  out += profile;
  out += " proxy=";
  out += proxy ? proxy->ToString() : "direct";
  if (local_path) {
    if (local_path->interface_name) {
      out += " iface=";
      out += *local_path->interface_name;
    }
    if (local_path->bind_address) {
      out += " bind=";
      out += *local_path->bind_address;
    }
  }
  return out;
}

size_t IdentityKey::Hash() const {
  uint64_t hash = kFnvOffset;
  HashBytes(&hash, host);
  HashInt(&hash, port);
  HashBytes(&hash, profile);
  if (proxy) {
    HashInt(&hash, static_cast<uint64_t>(proxy->scheme) + 1);
    HashBytes(&hash, proxy->host);
    HashInt(&hash, proxy->port);
    HashBytes(&hash, proxy->username);
    HashBytes(&hash, proxy->password);
  } else {
    HashInt(&hash, 0);
  }
  if (local_path) {
    HashBytes(&hash, local_path->bind_address.value_or(""));
    HashBytes(&hash, local_path->interface_name.value_or(""));
  }
  return static_cast<size_t>(hash);
}

IdentityKey MakeIdentityKey(std::string host, uint16_t port,
                            std::optional<ProxyDescriptor> proxy,
                            std::optional<LocalPath> local_path,
                            std::string profile) {
  IdentityKey key;
  key.host = std::move(host);
  key.port = port;
  key.proxy = std::move(proxy);
  if (local_path && !local_path->empty()) {
    key.local_path = std::move(local_path);
  }
  key.profile = std::move(profile);
  return key;
}

}  // namespace pool
}  // namespace guise
