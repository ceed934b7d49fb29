// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_CORE_REACTOR_MANAGER_H_
#define GUISE_CORE_REACTOR_MANAGER_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "guise/config.h"
#include "guise/core/reactor.h"
#include "guise/pool/connection_pool.h"
#include "guise/pool/identity_key.h"
#include "guise/profile/profile_registry.h"
#include "guise/tls/tls_context.h"
#include "guise/transport/transport_dialer.h"
#include "guise/util/dns_resolver.h"

namespace guise {
namespace core {

// Configuration for ReactorManager
struct ReactorManagerConfig {
  // Number of reactor threads (0 = auto-detect CPU cores)
  size_t num_reactors = 1;

  // Pin threads to CPU cores (improves cache locality)
  bool pin_to_cores = false;
};

// Per-reactor thread context with all resources. Members are destroyed
// bottom-up: the pool goes before the dialer it calls, the reactor last.
struct ReactorContext {
  std::unique_ptr<Reactor> reactor;
  std::unique_ptr<std::thread> thread;

  std::unique_ptr<util::DnsResolver> dns_resolver;
  std::unique_ptr<transport::TransportDialer> dialer;
  std::unique_ptr<pool::ConnectionPool> connection_pool;

  TimerId maintenance_timer = 0;
  size_t index = 0;
  std::atomic<bool> running{false};
};

// Runs N reactor threads, each with its own resolver, dialer and pool.
// Every connection for an IdentityKey lives on the reactor the key hashes
// to, so a connection is only ever touched from one loop.
class ReactorManager {
 public:
  explicit ReactorManager(const ReactorManagerConfig& config = {});
  ~ReactorManager();

  ReactorManager(const ReactorManager&) = delete;
  ReactorManager& operator=(const ReactorManager&) = delete;
  ReactorManager(ReactorManager&&) = delete;
  ReactorManager& operator=(ReactorManager&&) = delete;

  // Builds per-reactor resources. Must be called before Start().
  // `registry` must outlive the manager.
  bool Initialize(const ClientConfig& config,
                  const profile::ProfileRegistry* registry);
  std::string_view last_error() const { return last_error_; }

  void Start();

  // Shuts the pools down, then stops and joins every reactor thread
  void Stop();

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }
  size_t NumReactors() const { return contexts_.size(); }

  ReactorContext* GetReactorForKey(const pool::IdentityKey& key);
  ReactorContext* GetReactor(size_t index);

  // Thread-safe
  void Post(size_t reactor_index, std::function<void()> callback);
  void PostAll(std::function<void()> callback);

  // Blocks until every reactor has drained the callbacks posted before it.
  // Must not be called from a reactor thread.
  void Barrier();

  // Sums over all reactors
  pool::PoolStats TotalStats() const;

 private:
  void RunReactor(ReactorContext* ctx);
  void RunMaintenance(ReactorContext* ctx);

  ReactorManagerConfig config_;
  std::unique_ptr<tls::TlsContextStore> tls_contexts_;

  std::vector<std::unique_ptr<ReactorContext>> contexts_;
  std::atomic<bool> running_{false};
  bool initialized_ = false;
  std::string last_error_;
};

}  // namespace core
}  // namespace guise

#endif  // GUISE_CORE_REACTOR_MANAGER_H_
