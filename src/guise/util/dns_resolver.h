// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_UTIL_DNS_RESOLVER_H_
#define GUISE_UTIL_DNS_RESOLVER_H_

#include <uv.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace guise {
namespace util {

struct ResolvedAddress {
  std::string ip;
  bool is_ipv6 = false;
};

// Invoked on the loop thread. `error` is empty on success.
using DnsCallback = std::function<void(
    const std::vector<ResolvedAddress>& addresses, const std::string& error)>;

inline constexpr size_t kMaxAddressesPerEntry = 8;
inline constexpr uint64_t kDefaultCacheTtlMs = 60000;

// Async resolver on libuv's getaddrinfo thread pool.
// Overrides (host -> IPs) are consulted before the cache and the system
// resolver; IP literals resolve to themselves. Not thread-safe: one
// resolver per loop.
class DnsResolver {
 public:
  explicit DnsResolver(
      uv_loop_t* loop,
      std::unordered_map<std::string, std::vector<std::string>> overrides = {},
      uint64_t cache_ttl_ms = kDefaultCacheTtlMs);
  ~DnsResolver();

  DnsResolver(const DnsResolver&) = delete;
  DnsResolver& operator=(const DnsResolver&) = delete;
  DnsResolver(DnsResolver&&) = delete;
  DnsResolver& operator=(DnsResolver&&) = delete;

  // The callback may run synchronously for overrides, literals and cache hits
  void ResolveAsync(const std::string& hostname, DnsCallback callback);

  void ClearCache() { cache_.clear(); }

  size_t CacheHits() const { return cache_hits_; }
  size_t CacheMisses() const { return cache_misses_; }

 private:
  struct CacheEntry {
    std::vector<ResolvedAddress> addresses;
    uint64_t expires_at_ms = 0;
  };

  struct Request;

  static void OnResolved(uv_getaddrinfo_t* req, int status,
                         struct addrinfo* res);
  static std::vector<ResolvedAddress> ParseAddrinfo(struct addrinfo* res);

  void Store(const std::string& hostname,
             const std::vector<ResolvedAddress>& addresses);

  uv_loop_t* loop_;
  std::unordered_map<std::string, std::vector<ResolvedAddress>> overrides_;
  uint64_t cache_ttl_ms_;
  std::unordered_map<std::string, CacheEntry> cache_;
  size_t cache_hits_ = 0;
  size_t cache_misses_ = 0;

  // Cleared in the destructor so late completions do not touch a dead resolver
  std::shared_ptr<bool> alive_;
};

}  // namespace util
}  // namespace guise

#endif  // GUISE_UTIL_DNS_RESOLVER_H_
