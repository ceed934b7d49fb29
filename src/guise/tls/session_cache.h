// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_TLS_SESSION_CACHE_H_
#define GUISE_TLS_SESSION_CACHE_H_

#include <openssl/ssl.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace guise {
namespace tls {

// Cached TLS session, serialized to ASN.1 DER.
struct SessionEntry {
  std::string cache_key;
  std::vector<uint8_t> session_data;
  std::chrono::steady_clock::time_point receipt_time;
  uint32_t lifetime_hint_seconds = 0;

  bool IsExpired(std::chrono::steady_clock::time_point now) const {
    return now - receipt_time >= std::chrono::seconds(lifetime_hint_seconds);
  }
};

// Thread-safe external session cache with LRU eviction, one per profile
// context. Keys are opaque strings built from the full identity key, so a
// ticket obtained through one proxy or source address is never presented
// through another.
//
// Usage:
//   1. SSL_CTX_sess_set_new_cb() forwards new tickets to Store()
//   2. Before a handshake, Lookup() and SSL_set_session() when the
//      ClientHello plan offers PSK
class TlsSessionCache {
 public:
  // ctx is used for deserialization and must outlive the cache
  explicit TlsSessionCache(SSL_CTX* ctx, size_t max_entries = 1024);
  ~TlsSessionCache();

  TlsSessionCache(const TlsSessionCache&) = delete;
  TlsSessionCache& operator=(const TlsSessionCache&) = delete;
  TlsSessionCache(TlsSessionCache&&) = delete;
  TlsSessionCache& operator=(TlsSessionCache&&) = delete;

  void Store(const std::string& key, SSL_SESSION* session);

  // Returns a new reference the caller must SSL_SESSION_free(), or nullptr
  SSL_SESSION* Lookup(const std::string& key);

  // True if a live ticket exists, without deserializing it
  bool Has(const std::string& key);

  void Remove(const std::string& key);

  // Returns number of sessions removed
  size_t PurgeExpired();

  size_t Size() const;

  size_t Hits() const { return hits_.load(std::memory_order_relaxed); }
  size_t Misses() const { return misses_.load(std::memory_order_relaxed); }

 private:
  using LruList = std::list<SessionEntry>;

  void EraseLocked(LruList::iterator it);

  SSL_CTX* ctx_;
  mutable std::mutex mutex_;

  // front = most recently used
  LruList lru_;
  std::unordered_map<std::string, LruList::iterator> index_;
  size_t max_entries_;

  std::atomic<size_t> hits_{0};
  std::atomic<size_t> misses_{0};
};

// ex_data slots shared by all contexts. The SSL slot holds a
// const std::string* naming the cache key of that handshake.
int GetSessionCacheIndex();
int GetSessionKeyIndex();

// Opaque cache key: hex SHA-256 of `material`. Callers pass the full
// identity (credentials included), which must never reach a log line.
std::string MakeSessionKey(std::string_view material);

}  // namespace tls
}  // namespace guise

#endif  // GUISE_TLS_SESSION_CACHE_H_
