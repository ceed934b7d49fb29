// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/pool/connection_pool.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace guise {
namespace pool {

ConnectionPool::ConnectionPool(const PoolConfig& config, Dialer* dialer,
                               Clock clock)
    : config_(config), dialer_(dialer), clock_(std::move(clock)) {
  config_.max_dials_per_key = std::max<size_t>(1, config_.max_dials_per_key);
  config_.max_total_connections =
      std::max<size_t>(1, config_.max_total_connections);
}

ConnectionPool::~ConnectionPool() { Shutdown(); }

std::shared_ptr<ConnectionPool::KeyPool> ConnectionPool::GetOrCreate(
    const IdentityKey& key) {
  std::lock_guard<std::mutex> lock(map_mutex_);
  auto it = pools_.find(key);
  if (it != pools_.end()) {
    return it->second;
  }
  auto kp = std::make_shared<KeyPool>(key);
  pools_.emplace(key, kp);
  return kp;
}

std::vector<std::shared_ptr<ConnectionPool::KeyPool>> ConnectionPool::Snapshot()
    const {
  std::lock_guard<std::mutex> lock(map_mutex_);
  std::vector<std::shared_ptr<KeyPool>> out;
  out.reserve(pools_.size());
  for (const auto& [key, kp] : pools_) {
    out.push_back(kp);
  }
  return out;
}

bool ConnectionPool::IsExpired(const PooledConnection& conn,
                               uint64_t now_ms) const {
  uint64_t timeout = static_cast<uint64_t>(config_.idle_timeout.count());
  return now_ms >= conn.last_used_ms && now_ms - conn.last_used_ms >= timeout;
}

bool ConnectionPool::TryReserveSlot() {
  size_t current = live_.load(std::memory_order_relaxed);
  while (current < config_.max_total_connections) {
    if (live_.compare_exchange_weak(current, current + 1,
                                    std::memory_order_acq_rel)) {
      return true;
    }
  }
  return false;
}

void ConnectionPool::ReleaseSlots(size_t n) {
  if (n > 0) {
    live_.fetch_sub(n, std::memory_order_acq_rel);
  }
}

size_t ConnectionPool::ReserveDialsLocked(KeyPool* kp) {
  size_t n = 0;
  while (kp->waiters.size() > kp->dialing &&
         kp->dialing < config_.max_dials_per_key && TryReserveSlot()) {
    ++kp->dialing;
    ++n;
  }
  return n;
}

bool ConnectionPool::StarvedLocked(const KeyPool& kp) const {
  return kp.waiters.size() > kp.dialing &&
         kp.dialing < config_.max_dials_per_key;
}

bool ConnectionPool::ReclaimIdleSlot(const KeyPool* requester) {
  std::shared_ptr<KeyPool> victim_pool;
  const PooledConnection* victim = nullptr;
  uint64_t oldest = 0;

  for (const auto& kp : Snapshot()) {
    if (kp.get() == requester) {
      continue;
    }
    std::lock_guard<std::mutex> lock(kp->mutex);
    // front = least recently released for this key
    if (!kp->idle.empty() &&
        (victim == nullptr || kp->idle.front()->last_used_ms < oldest)) {
      victim_pool = kp;
      victim = kp->idle.front().get();
      oldest = victim->last_used_ms;
    }
  }
  if (!victim_pool) {
    return false;
  }

  ConnectionPtr conn;
  {
    std::lock_guard<std::mutex> lock(victim_pool->mutex);
    auto it = std::find_if(
        victim_pool->idle.begin(), victim_pool->idle.end(),
        [victim](const ConnectionPtr& c) { return c.get() == victim; });
    if (it != victim_pool->idle.end()) {
      conn = std::move(*it);
      victim_pool->idle.erase(it);
      ReleaseSlots(1);
    }
  }
  // Lent out meanwhile: the caller looks again
  if (conn) {
    evicted_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_DEBUG("pool: closing idle connection to {} to make room",
                 conn->key.ToString());
    conn.reset();
  }
  return true;
}

void ConnectionPool::RebalanceIfFull() {
  if (live_.load(std::memory_order_acquire) >= config_.max_total_connections) {
    PumpAll();
  }
}

AcquireTicket ConnectionPool::Acquire(const IdentityKey& key,
                                      AcquireCallback callback,
                                      std::chrono::milliseconds wait_budget) {
  if (shutdown_.load(std::memory_order_acquire)) {
    callback(Error::PoolShutdown());
    return 0;
  }

  const uint64_t now = clock_();
  std::shared_ptr<KeyPool> kp;
  std::vector<ConnectionPtr> stale;
  ConnectionPtr found;
  AcquireTicket ticket = 0;
  size_t dials = 0;
  bool starved = false;
  bool rejected = false;

  for (;;) {
    kp = GetOrCreate(key);
    std::lock_guard<std::mutex> lock(kp->mutex);
    if (kp->retired) {
      continue;
    }
    if (shutdown_.load(std::memory_order_acquire)) {
      rejected = true;
      break;
    }

    // Most recently released first
    while (!kp->idle.empty()) {
      ConnectionPtr conn = std::move(kp->idle.back());
      kp->idle.pop_back();
      if (conn->IsUsable() && !IsExpired(*conn, now)) {
        found = std::move(conn);
        break;
      }
      stale.push_back(std::move(conn));
    }
    ReleaseSlots(stale.size());

    if (!found) {
      ticket = next_ticket_.fetch_add(1, std::memory_order_relaxed);
      kp->waiters.push_back(
          {ticket, std::move(callback),
           now + static_cast<uint64_t>(std::max<int64_t>(0, wait_budget.count()))});
      dials = ReserveDialsLocked(kp.get());
      starved = StarvedLocked(*kp);
    }
    break;
  }

  if (!stale.empty()) {
    evicted_.fetch_add(stale.size(), std::memory_order_relaxed);
    CloseConnections(std::move(stale), "stale on acquire");
  }

  if (rejected) {
    callback(Error::PoolShutdown());
    return 0;
  }

  if (found) {
    reused_.fetch_add(1, std::memory_order_relaxed);
    ++found->reuse_count;
    found->last_used_ms = now;
    SPDLOG_DEBUG("pool: reusing connection to {}", key.ToString());
    callback(std::move(found));
    return 0;
  }

  if (dials == 0) {
    SPDLOG_DEBUG("pool: queued acquire for {} (ticket {})", key.ToString(),
                 ticket);
  }
  for (size_t i = 0; i < dials; ++i) {
    StartDial(kp);
  }
  if (starved) {
    PumpWaiters(kp);
  }
  return ticket;
}

bool ConnectionPool::Cancel(AcquireTicket ticket) {
  if (ticket == 0) {
    return false;
  }
  for (const auto& kp : Snapshot()) {
    AcquireCallback dropped;
    {
      std::lock_guard<std::mutex> lock(kp->mutex);
      auto it = std::find_if(
          kp->waiters.begin(), kp->waiters.end(),
          [ticket](const Waiter& w) { return w.ticket == ticket; });
      if (it == kp->waiters.end()) {
        continue;
      }
      // Destroy the callback outside the lock
      dropped = std::move(it->callback);
      kp->waiters.erase(it);
    }
    return true;
  }
  return false;
}

void ConnectionPool::StartDial(std::shared_ptr<KeyPool> kp) {
  SPDLOG_DEBUG("pool: dialing {}", kp->key.ToString());

  DialRequest request{kp->key, config_.connect_timeout};
  dialer_->Dial(request,
                [this, kp](Result<std::unique_ptr<Transport>> result) {
                  OnDialComplete(kp, std::move(result));
                });
}

void ConnectionPool::OnDialComplete(const std::shared_ptr<KeyPool>& kp,
                                    Result<std::unique_ptr<Transport>> result) {
  const uint64_t now = clock_();
  const bool failed = !result.ok();

  Error error;
  ConnectionPtr conn;
  if (failed) {
    error = result.error();
    dials_failed_.fetch_add(1, std::memory_order_relaxed);
    SPDLOG_WARN("pool: dial {} failed: {}", kp->key.ToString(),
                error.ToString());
  } else {
    dialed_.fetch_add(1, std::memory_order_relaxed);
    conn = std::make_unique<PooledConnection>(kp->key,
                                              std::move(result).value(), now);
  }

  AcquireCallback waiter;
  bool slot_freed = false;
  bool idled = false;
  {
    std::lock_guard<std::mutex> lock(kp->mutex);
    if (kp->dialing > 0) {
      --kp->dialing;
    }

    if (failed) {
      slot_freed = true;
      if (!kp->waiters.empty()) {
        waiter = std::move(kp->waiters.front().callback);
        kp->waiters.pop_front();
      }
    } else if (shutdown_.load(std::memory_order_acquire)) {
      slot_freed = true;
    } else if (!kp->waiters.empty()) {
      waiter = std::move(kp->waiters.front().callback);
      kp->waiters.pop_front();
    } else if (kp->idle.size() < config_.max_idle_per_key) {
      kp->idle.push_back(std::move(conn));
      idled = true;
    } else {
      slot_freed = true;
    }

    if (slot_freed) {
      ReleaseSlots(1);
    }
  }

  if (conn && !waiter) {
    SPDLOG_DEBUG("pool: closing surplus connection to {}", kp->key.ToString());
    conn.reset();
  }

  if (waiter) {
    if (failed) {
      waiter(error);
    } else {
      waiter(std::move(conn));
    }
  }

  PumpWaiters(kp);
  if (slot_freed) {
    PumpAll();
  } else if (idled) {
    RebalanceIfFull();
  }
}

void ConnectionPool::PumpWaiters(const std::shared_ptr<KeyPool>& kp) {
  for (;;) {
    size_t dials = 0;
    bool starved = false;
    {
      std::lock_guard<std::mutex> lock(kp->mutex);
      if (kp->retired || shutdown_.load(std::memory_order_acquire)) {
        return;
      }
      dials = ReserveDialsLocked(kp.get());
      starved = StarvedLocked(*kp);
    }
    for (size_t i = 0; i < dials; ++i) {
      StartDial(kp);
    }
    // Blocked only by the global cap: idle connections of other keys give
    // way to waiting callers
    if (!starved || !ReclaimIdleSlot(kp.get())) {
      return;
    }
  }
}

void ConnectionPool::PumpAll() {
  if (shutdown_.load(std::memory_order_acquire)) {
    return;
  }
  for (const auto& kp : Snapshot()) {
    PumpWaiters(kp);
  }
}

void ConnectionPool::Release(ConnectionPtr conn) {
  if (!conn) {
    return;
  }

  // An unfinished exchange leaves the transport in an unknown state
  const bool busy = conn->in_flight_streams > 0;
  if (busy || !conn->IsUsable()) {
    SPDLOG_DEBUG("pool: closing {} connection to {}",
                 busy ? "busy" : (conn->broken() ? "broken" : "unusable"),
                 conn->key.ToString());
    conn.reset();
    ReleaseSlots(1);
    PumpAll();
    return;
  }

  conn->last_used_ms = clock_();

  AcquireCallback waiter;
  bool close = false;
  bool idled = false;
  for (;;) {
    auto kp = GetOrCreate(conn->key);
    std::lock_guard<std::mutex> lock(kp->mutex);
    if (kp->retired) {
      continue;
    }
    if (shutdown_.load(std::memory_order_acquire)) {
      close = true;
    } else if (!kp->waiters.empty()) {
      waiter = std::move(kp->waiters.front().callback);
      kp->waiters.pop_front();
    } else if (kp->idle.size() < config_.max_idle_per_key) {
      kp->idle.push_back(std::move(conn));
      idled = true;
    } else {
      close = true;
    }
    break;
  }

  if (idled) {
    RebalanceIfFull();
    return;
  }

  if (waiter) {
    reused_.fetch_add(1, std::memory_order_relaxed);
    ++conn->reuse_count;
    waiter(std::move(conn));
    return;
  }

  if (close) {
    SPDLOG_DEBUG("pool: closing surplus connection to {}",
                 conn->key.ToString());
    conn.reset();
    ReleaseSlots(1);
    PumpAll();
  }
}

std::unique_ptr<Transport> ConnectionPool::Detach(ConnectionPtr conn) {
  if (!conn) {
    return nullptr;
  }
  SPDLOG_DEBUG("pool: detaching connection to {}", conn->key.ToString());
  std::unique_ptr<Transport> transport = conn->DetachTransport();
  conn.reset();
  ReleaseSlots(1);
  PumpAll();
  return transport;
}

size_t ConnectionPool::EvictIdle(uint64_t now_ms) {
  size_t total = 0;

  for (const auto& kp : Snapshot()) {
    std::vector<ConnectionPtr> expired;
    {
      std::lock_guard<std::mutex> lock(kp->mutex);
      for (auto& conn : kp->idle) {
        if (!conn->IsUsable() || IsExpired(*conn, now_ms)) {
          expired.push_back(std::move(conn));
        }
      }
      kp->idle.erase(std::remove(kp->idle.begin(), kp->idle.end(), nullptr),
                     kp->idle.end());
      ReleaseSlots(expired.size());
    }
    total += expired.size();
    CloseConnections(std::move(expired), "idle");
  }

  // Unlink keys with nothing left. Lock order is map, then key.
  {
    std::lock_guard<std::mutex> map_lock(map_mutex_);
    for (auto it = pools_.begin(); it != pools_.end();) {
      std::lock_guard<std::mutex> lock(it->second->mutex);
      if (it->second->Empty()) {
        it->second->retired = true;
        it = pools_.erase(it);
      } else {
        ++it;
      }
    }
  }

  if (total > 0) {
    evicted_.fetch_add(total, std::memory_order_relaxed);
    SPDLOG_DEBUG("pool: evicted {} idle connection(s)", total);
    PumpAll();
  }
  return total;
}

size_t ConnectionPool::ExpireWaiters(uint64_t now_ms) {
  std::vector<AcquireCallback> expired;

  for (const auto& kp : Snapshot()) {
    std::lock_guard<std::mutex> lock(kp->mutex);
    // The first `dialing` waiters are served by dials already running,
    // which carry their own connect timeout
    size_t covered = std::min(kp->dialing, kp->waiters.size());
    for (auto it = kp->waiters.begin() + static_cast<std::ptrdiff_t>(covered);
         it != kp->waiters.end();) {
      if (it->deadline_ms <= now_ms) {
        expired.push_back(std::move(it->callback));
        it = kp->waiters.erase(it);
      } else {
        ++it;
      }
    }
  }

  for (auto& callback : expired) {
    callback(Error::PoolExhausted(
        "no connection became available within the wait budget"));
  }
  return expired.size();
}

void ConnectionPool::Shutdown() {
  if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  std::vector<ConnectionPtr> idle;
  std::vector<AcquireCallback> waiters;
  for (const auto& kp : Snapshot()) {
    std::lock_guard<std::mutex> lock(kp->mutex);
    ReleaseSlots(kp->idle.size());
    for (auto& conn : kp->idle) {
      idle.push_back(std::move(conn));
    }
    kp->idle.clear();
    for (auto& waiter : kp->waiters) {
      waiters.push_back(std::move(waiter.callback));
    }
    kp->waiters.clear();
  }

  SPDLOG_DEBUG("pool: shutdown, closing {} idle, failing {} waiter(s)",
               idle.size(), waiters.size());
  CloseConnections(std::move(idle), "shutdown");
  for (auto& callback : waiters) {
    callback(Error::PoolShutdown());
  }
}

PoolStats ConnectionPool::Stats() const {
  PoolStats stats;
  auto pools = Snapshot();
  stats.keys = pools.size();
  for (const auto& kp : pools) {
    std::lock_guard<std::mutex> lock(kp->mutex);
    stats.idle += kp->idle.size();
    stats.dialing += kp->dialing;
    stats.waiting += kp->waiters.size();
  }
  stats.live = live_.load(std::memory_order_acquire);
  stats.dialed = dialed_.load(std::memory_order_relaxed);
  stats.dials_failed = dials_failed_.load(std::memory_order_relaxed);
  stats.reused = reused_.load(std::memory_order_relaxed);
  stats.evicted = evicted_.load(std::memory_order_relaxed);
  return stats;
}

size_t ConnectionPool::IdleCount(const IdentityKey& key) const {
  std::shared_ptr<KeyPool> kp;
  {
    std::lock_guard<std::mutex> lock(map_mutex_);
    auto it = pools_.find(key);
    if (it == pools_.end()) {
      return 0;
    }
    kp = it->second;
  }
  std::lock_guard<std::mutex> lock(kp->mutex);
  return kp->idle.size();
}

void ConnectionPool::CloseConnections(std::vector<ConnectionPtr> conns,
                                      const char* reason) {
  for (auto& conn : conns) {
    SPDLOG_DEBUG("pool: closing connection to {} ({})", conn->key.ToString(),
                 reason);
    conn.reset();
  }
}

}  // namespace pool
}  // namespace guise
