// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_POOL_CONNECTION_POOL_H_
#define GUISE_POOL_CONNECTION_POOL_H_

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "guise/config.h"
#include "guise/error.h"
#include "guise/pool/dialer.h"
#include "guise/pool/identity_key.h"
#include "guise/pool/pooled_connection.h"

namespace guise {
namespace pool {

// Receives a lent connection or the reason none is coming
using AcquireCallback = std::function<void(Result<ConnectionPtr>)>;

// Identifies a queued Acquire(). 0 means the callback already ran.
using AcquireTicket = uint64_t;

struct PoolStats {
  size_t live = 0;  // idle + lent + dialing
  size_t idle = 0;
  size_t dialing = 0;
  size_t waiting = 0;
  size_t keys = 0;

  size_t dialed = 0;
  size_t dials_failed = 0;
  size_t reused = 0;
  size_t evicted = 0;
};

// Connection pool keyed by the full egress identity: two requests share a
// connection only if host, port, proxy, local path and profile all match.
//
// Locking: map_mutex_ only guards key lookup and insertion. Everything
// about one key runs under that key's mutex. Callbacks always run with no
// lock held, so they may re-enter the pool.
class ConnectionPool {
 public:
  using Clock = std::function<uint64_t()>;

  // `dialer` must outlive the pool. `clock` returns monotonic milliseconds.
  ConnectionPool(const PoolConfig& config, Dialer* dialer, Clock clock);
  ~ConnectionPool();

  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;
  ConnectionPool(ConnectionPool&&) = delete;
  ConnectionPool& operator=(ConnectionPool&&) = delete;

  // Lends a healthy idle connection synchronously (returns 0), otherwise
  // queues the caller FIFO and dials if the per-key and global caps allow.
  // A dial that fails fast may complete the callback before this returns.
  // A queued caller not served within `wait_budget` gets kPoolExhausted.
  AcquireTicket Acquire(const IdentityKey& key, AcquireCallback callback,
                        std::chrono::milliseconds wait_budget);

  // Removes a queued acquire without invoking its callback. A dial it
  // triggered keeps going and serves the next waiter or the idle list.
  bool Cancel(AcquireTicket ticket);

  // Returns a lent connection. Broken or unusable connections, and those
  // with streams still open, are closed. A healthy one goes to the key's
  // oldest waiter, else the idle list; at the global cap it may instead be
  // closed so another key's waiter can dial.
  void Release(ConnectionPtr conn);

  // Takes a lent connection out of the pool for good, e.g. for a protocol
  // upgrade. Frees its slot.
  std::unique_ptr<Transport> Detach(ConnectionPtr conn);

  // Closes idle connections past the idle timeout or no longer usable.
  // Returns the number closed.
  size_t EvictIdle(uint64_t now_ms);

  // Fails queued acquires whose wait budget elapsed. Returns the count.
  size_t ExpireWaiters(uint64_t now_ms);

  // Closes idle connections, fails queued acquires and rejects new ones.
  // Lent connections are closed when released.
  void Shutdown();

  bool is_shutdown() const { return shutdown_.load(std::memory_order_acquire); }

  PoolStats Stats() const;

  // Idle connections currently held for `key`
  size_t IdleCount(const IdentityKey& key) const;

  const PoolConfig& config() const { return config_; }

 private:
  struct Waiter {
    AcquireTicket ticket = 0;
    AcquireCallback callback;
    uint64_t deadline_ms = 0;
  };

  struct KeyPool {
    explicit KeyPool(IdentityKey k) : key(std::move(k)) {}

    const IdentityKey key;
    std::mutex mutex;
    std::vector<ConnectionPtr> idle;  // back = most recently released
    std::deque<Waiter> waiters;
    size_t dialing = 0;
    bool retired = false;  // unlinked from the map, look up again

    bool Empty() const {
      return idle.empty() && waiters.empty() && dialing == 0;
    }
  };

  std::shared_ptr<KeyPool> GetOrCreate(const IdentityKey& key);
  std::vector<std::shared_ptr<KeyPool>> Snapshot() const;

  bool IsExpired(const PooledConnection& conn, uint64_t now_ms) const;

  // Reserve a live slot under the global cap
  bool TryReserveSlot();
  void ReleaseSlots(size_t n);

  // Starts as many dials as the waiters of `key` need and the caps allow
  void PumpWaiters(const std::shared_ptr<KeyPool>& kp);

  // Gives keys that were blocked on the global cap a chance to dial
  void PumpAll();

  // Caller holds kp->mutex. Returns the number of dials to start.
  size_t ReserveDialsLocked(KeyPool* kp);

  // Caller holds kp->mutex. True if waiters need a dial the per-key cap
  // allows but the global cap does not.
  bool StarvedLocked(const KeyPool& kp) const;

  // Closes the least recently used idle connection of a key other than
  // `requester` to free a global slot. False if no key has one.
  bool ReclaimIdleSlot(const KeyPool* requester);

  // After a connection went idle at the global cap
  void RebalanceIfFull();

  void StartDial(std::shared_ptr<KeyPool> kp);
  void OnDialComplete(const std::shared_ptr<KeyPool>& kp,
                      Result<std::unique_ptr<Transport>> result);

  void CloseConnections(std::vector<ConnectionPtr> conns, const char* reason);

  PoolConfig config_;
  Dialer* dialer_;
  Clock clock_;

  mutable std::mutex map_mutex_;
  std::unordered_map<IdentityKey, std::shared_ptr<KeyPool>, IdentityKeyHash>
      pools_;

  std::atomic<size_t> live_{0};
  std::atomic<uint64_t> next_ticket_{1};
  std::atomic<bool> shutdown_{false};

  std::atomic<size_t> dialed_{0};
  std::atomic<size_t> dials_failed_{0};
  std::atomic<size_t> reused_{0};
  std::atomic<size_t> evicted_{0};
};

}  // namespace pool
}  // namespace guise

#endif  // GUISE_POOL_CONNECTION_POOL_H_
