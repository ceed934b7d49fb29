// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/tls/session_cache.h"

#include <openssl/err.h>
#include <openssl/sha.h>

namespace guise {
namespace tls {

int GetSessionCacheIndex() {
  static const int index =
      SSL_CTX_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
  return index;
}

int GetSessionKeyIndex() {
  static const int index =
      SSL_get_ex_new_index(0, nullptr, nullptr, nullptr, nullptr);
  return index;
}

std::string MakeSessionKey(std::string_view material) {
  uint8_t digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const uint8_t*>(material.data()), material.size(),
         digest);

  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(sizeof(digest) * 2);
  for (uint8_t b : digest) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0f]);
  }
  return out;
}

TlsSessionCache::TlsSessionCache(SSL_CTX* ctx, size_t max_entries)
    : ctx_(ctx), max_entries_(max_entries == 0 ? 1 : max_entries) {}

TlsSessionCache::~TlsSessionCache() = default;

void TlsSessionCache::EraseLocked(LruList::iterator it) {
  index_.erase(it->cache_key);
  lru_.erase(it);
}

void TlsSessionCache::Store(const std::string& key, SSL_SESSION* session) {
  if (session == nullptr) return;

  uint8_t* data = nullptr;
  size_t len = 0;
  if (!SSL_SESSION_to_bytes(session, &data, &len)) {
    ERR_clear_error();
    return;
  }

  SessionEntry entry;
  entry.cache_key = key;
  entry.session_data.assign(data, data + len);
  entry.receipt_time = std::chrono::steady_clock::now();
  entry.lifetime_hint_seconds = SSL_SESSION_get_timeout(session);
  OPENSSL_free(data);

  std::lock_guard<std::mutex> lock(mutex_);

  auto existing = index_.find(key);
  if (existing != index_.end()) {
    EraseLocked(existing->second);
  }
  while (lru_.size() >= max_entries_) {
    EraseLocked(std::prev(lru_.end()));
  }

  lru_.push_front(std::move(entry));
  index_[key] = lru_.begin();
}

SSL_SESSION* TlsSessionCache::Lookup(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = index_.find(key);
  if (it == index_.end()) {
    misses_.fetch_add(1, std::memory_order_relaxed);
    return nullptr;
  }

  auto entry = it->second;
  if (entry->IsExpired(std::chrono::steady_clock::now())) {
    EraseLocked(entry);
    misses_.fetch_add(1, std::memory_order_relaxed);
    return nullptr;
  }

  SSL_SESSION* session = SSL_SESSION_from_bytes(
      entry->session_data.data(), entry->session_data.size(), ctx_);
  if (session == nullptr) {
    // Corrupted entry
    ERR_clear_error();
    EraseLocked(entry);
    misses_.fetch_add(1, std::memory_order_relaxed);
    return nullptr;
  }

  lru_.splice(lru_.begin(), lru_, entry);
  hits_.fetch_add(1, std::memory_order_relaxed);
  return session;
}

bool TlsSessionCache::Has(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(key);
  return it != index_.end() &&
         !it->second->IsExpired(std::chrono::steady_clock::now());
}

void TlsSessionCache::Remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(key);
  if (it != index_.end()) {
    EraseLocked(it->second);
  }
}

size_t TlsSessionCache::PurgeExpired() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = std::chrono::steady_clock::now();

  size_t removed = 0;
  for (auto it = lru_.begin(); it != lru_.end();) {
    auto next = std::next(it);
    if (it->IsExpired(now)) {
      EraseLocked(it);
      ++removed;
    }
    it = next;
  }
  return removed;
}

size_t TlsSessionCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return lru_.size();
}

}  // namespace tls
}  // namespace guise
