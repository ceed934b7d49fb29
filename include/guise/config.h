// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_CONFIG_H_
#define GUISE_CONFIG_H_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "guise/pool/identity_key.h"

namespace guise {

// Application protocols the client is willing to offer in ALPN.
// Narrowing never reorders the profile's own ALPN list.
enum class HttpVersionPref {
  kAll,    // whatever the profile offers (usually h2 + http/1.1)
  kHttp2,  // h2 only
  kHttp1,  // http/1.1 only
};

// TLS configuration. The fingerprint itself comes from the profile.
struct TlsConfig {
  // Certificate verification
  bool verify_certificates = true;
  std::string ca_bundle_path;  // Empty = system default

  // Session resumption, per profile and scoped to the full identity key
  bool enable_session_cache = true;
  size_t session_cache_size = 1024;

  // 0-RTT early data. Requests are not replay-safe, so off by default.
  bool enable_early_data = false;
};

// Identity-aware connection pool configuration
struct PoolConfig {
  // Idle connections kept per identity key
  size_t max_idle_per_key = 6;

  // Concurrent dials per identity key; further acquires queue
  size_t max_dials_per_key = 6;

  // Global cap on live connections (idle + lent + dialing)
  size_t max_total_connections = 256;

  std::chrono::milliseconds idle_timeout{90000};
  std::chrono::milliseconds acquire_timeout{30000};  // wait budget when queued
  std::chrono::milliseconds connect_timeout{30000};  // resolve .. h2 preface

  // Period of the idle sweep and waiter expiry
  std::chrono::milliseconds maintenance_interval{1000};
};

// Threading configuration
struct ThreadConfig {
  // Number of reactor threads (0 = auto-detect CPU cores)
  size_t num_workers = 1;

  // Pin worker threads to CPU cores
  bool pin_to_cores = false;
};

// DNS configuration
struct DnsConfig {
  // host -> addresses, consulted before the system resolver
  std::unordered_map<std::string, std::vector<std::string>> overrides;

  // Positive cache lifetime
  std::chrono::seconds cache_ttl{60};
};

enum class LogLevel {
  kTrace,
  kDebug,
  kInfo,
  kWarn,
  kError,
  kOff,
};

// Main client configuration
struct ClientConfig {
  // Default impersonation profile id; requests may override it
  std::string profile = "Chrome143";

  // Default egress; requests may override either
  std::optional<pool::ProxyDescriptor> proxy;
  std::optional<pool::LocalPath> local_path;

  TlsConfig tls;
  PoolConfig pool;
  ThreadConfig threads;
  DnsConfig dns;

  HttpVersionPref http_version = HttpVersionPref::kAll;

  // Default request timeout (acquire + response)
  std::chrono::milliseconds default_timeout{30000};

  // Send the profile's default headers with every request
  bool apply_profile_headers = true;

  LogLevel log_level = LogLevel::kInfo;

  // Factory methods for common configurations
  static ClientConfig Default();
  static ClientConfig ForProfile(std::string profile_id);
};

// Runtime statistics
struct ClientStats {
  // Connection statistics
  size_t live_connections = 0;
  size_t idle_connections = 0;
  size_t dialing = 0;
  size_t waiting = 0;
  size_t connections_dialed = 0;
  size_t connections_reused = 0;
  size_t connections_evicted = 0;
  size_t dials_failed = 0;

  // Request statistics
  size_t requests_sent = 0;
  size_t requests_completed = 0;
  size_t requests_failed = 0;
};

}  // namespace guise

#endif  // GUISE_CONFIG_H_
