// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/pool/connection_pool.h"

#include <cassert>
#include <deque>
#include <memory>
#include <print>
#include <string>
#include <vector>

#include "guise/pool/acquire_awaitable.h"

using namespace guise;
using namespace guise::pool;

namespace {

struct TransportState {
  bool usable = true;
  int closes = 0;
};

class FakeTransport : public Transport {
 public:
  explicit FakeTransport(std::shared_ptr<TransportState> state)
      : state_(std::move(state)) {}

  bool IsUsable() const override {
    return state_->usable && state_->closes == 0;
  }
  void Close() override { ++state_->closes; }
  std::string_view alpn() const override { return "h2"; }

 private:
  std::shared_ptr<TransportState> state_;
};

// Records dials; the test decides when and how each one completes
class FakeDialer : public Dialer {
 public:
  void Dial(const DialRequest& request, DialCallback callback) override {
    pending.push_back({request, std::move(callback)});
  }

  // Completes the oldest dial with a fresh transport
  std::shared_ptr<TransportState> Succeed() {
    assert(!pending.empty());
    auto entry = std::move(pending.front());
    pending.pop_front();
    auto state = std::make_shared<TransportState>();
    states.push_back(state);
    entry.second(std::unique_ptr<Transport>(new FakeTransport(state)));
    return state;
  }

  void Fail(DialStage stage) {
    assert(!pending.empty());
    auto entry = std::move(pending.front());
    pending.pop_front();
    entry.second(Error::Dial(stage, "refused"));
  }

  std::deque<std::pair<DialRequest, DialCallback>> pending;
  std::vector<std::shared_ptr<TransportState>> states;
};

// Collects acquire outcomes in completion order
struct Sink {
  std::vector<Result<ConnectionPtr>> results;
  std::vector<int> order;

  AcquireCallback Make(int tag) {
    return [this, tag](Result<ConnectionPtr> r) {
      results.push_back(std::move(r));
      order.push_back(tag);
    };
  }

  ConnectionPtr Take(size_t i) {
    assert(i < results.size());
    assert(results[i].ok());
    return std::move(results[i].value());
  }
};

IdentityKey KeyFor(const std::string& host) {
  return MakeIdentityKey(host, 443, std::nullopt, std::nullopt, "Chrome143");
}

IdentityKey KeyVia(const std::string& host, const std::string& proxy_host) {
  ProxyDescriptor proxy;
  proxy.scheme = ProxyScheme::kSocks5h;
  proxy.host = proxy_host;
  proxy.port = 1080;
  return MakeIdentityKey(host, 443, proxy, std::nullopt, "Chrome143");
}

PoolConfig SmallConfig() {
  PoolConfig config;
  config.max_idle_per_key = 4;
  config.max_dials_per_key = 4;
  config.max_total_connections = 16;
  config.idle_timeout = std::chrono::milliseconds(1000);
  return config;
}

constexpr std::chrono::milliseconds kBudget{5000};

}  // namespace

void TestDialThenReuse() {
  std::print("Testing dial then reuse... ");

  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(SmallConfig(), &dialer, [&now] { return now; });
  Sink sink;

  AcquireTicket ticket = pool.Acquire(KeyFor("a.test"), sink.Make(1), kBudget);
  assert(ticket != 0);
  assert(dialer.pending.size() == 1);
  assert(dialer.pending.front().first.key == KeyFor("a.test"));
  dialer.Succeed();
  assert(sink.results.size() == 1);

  ConnectionPtr conn = sink.Take(0);
  Transport* first = conn->transport.get();
  now = 10;
  pool.Release(std::move(conn));
  assert(pool.IdleCount(KeyFor("a.test")) == 1);

  // Served synchronously from the idle list, no dial
  ticket = pool.Acquire(KeyFor("a.test"), sink.Make(2), kBudget);
  assert(ticket == 0);
  assert(dialer.pending.empty());
  assert(sink.results.size() == 2);
  ConnectionPtr again = sink.Take(1);
  assert(again->transport.get() == first);
  assert(again->reuse_count == 1);

  PoolStats stats = pool.Stats();
  assert(stats.dialed == 1);
  assert(stats.reused == 1);
  assert(stats.live == 1);

  pool.Release(std::move(again));
  std::println("PASSED");
}

void TestIdentityIsolation() {
  std::print("Testing proxy and profile isolation... ");

  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(SmallConfig(), &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("a.test"), sink.Make(1), kBudget);
  dialer.Succeed();
  pool.Release(sink.Take(0));
  assert(pool.IdleCount(KeyFor("a.test")) == 1);

  // Same host through a proxy never gets the direct connection
  AcquireTicket t1 =
      pool.Acquire(KeyVia("a.test", "10.0.0.1"), sink.Make(2), kBudget);
  assert(t1 != 0);
  assert(dialer.pending.size() == 1);

  // Nor does another proxy, or another profile
  pool.Acquire(KeyVia("a.test", "10.0.0.2"), sink.Make(3), kBudget);
  IdentityKey firefox = MakeIdentityKey("a.test", 443, std::nullopt,
                                        std::nullopt, "Firefox133");
  pool.Acquire(firefox, sink.Make(4), kBudget);
  assert(dialer.pending.size() == 3);
  assert(pool.IdleCount(KeyFor("a.test")) == 1);

  dialer.Succeed();
  ConnectionPtr via = sink.Take(1);
  assert(via->key == KeyVia("a.test", "10.0.0.1"));
  pool.Release(std::move(via));

  std::println("PASSED");
}

void TestPerKeyDialCapQueuesFifo() {
  std::print("Testing per-key dial cap and FIFO waiters... ");

  PoolConfig config = SmallConfig();
  config.max_dials_per_key = 1;
  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(config, &dialer, [&now] { return now; });
  Sink sink;

  for (int tag = 1; tag <= 3; ++tag) {
    pool.Acquire(KeyFor("a.test"), sink.Make(tag), kBudget);
  }
  assert(dialer.pending.size() == 1);
  assert(pool.Stats().waiting == 3);

  dialer.Succeed();
  assert(sink.order == std::vector<int>({1}));
  // Remaining waiters start the next dial
  assert(dialer.pending.size() == 1);

  // A release goes to the oldest waiter before any idle list
  pool.Release(sink.Take(0));
  assert(sink.order == std::vector<int>({1, 2}));

  dialer.Succeed();
  assert(sink.order == std::vector<int>({1, 2, 3}));
  assert(dialer.pending.empty());
  assert(pool.Stats().waiting == 0);

  pool.Release(sink.Take(1));
  pool.Release(sink.Take(2));
  assert(pool.IdleCount(KeyFor("a.test")) == 2);

  std::println("PASSED");
}

void TestGlobalCapReclaimsIdle() {
  std::print("Testing global cap gives idle slots to new keys... ");

  PoolConfig config = SmallConfig();
  config.max_total_connections = 1;
  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(config, &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("a.test"), sink.Make(1), kBudget);
  pool.Acquire(KeyFor("b.test"), sink.Make(2), kBudget);
  assert(dialer.pending.size() == 1);

  // b waits while a's connection is lent
  dialer.Succeed();
  assert(sink.order == std::vector<int>({1}));
  assert(dialer.pending.empty());
  assert(pool.Stats().waiting == 1);

  // Released at the cap with b waiting: closed to make room
  pool.Release(sink.Take(0));
  assert(dialer.states[0]->closes == 1);
  assert(pool.IdleCount(KeyFor("a.test")) == 0);
  assert(dialer.pending.size() == 1);
  assert(dialer.pending.front().first.key == KeyFor("b.test"));

  dialer.Succeed();
  assert(sink.order == std::vector<int>({1, 2}));
  now = 10;
  pool.Release(sink.Take(1));
  assert(pool.IdleCount(KeyFor("b.test")) == 1);
  assert(dialer.states[1]->closes == 0);

  // A new proxy for the same host dials at once instead of waiting for
  // the idle timeout
  AcquireTicket ticket =
      pool.Acquire(KeyVia("b.test", "10.0.0.9"), sink.Make(3), kBudget);
  assert(ticket != 0);
  assert(dialer.states[1]->closes == 1);
  assert(dialer.pending.size() == 1);
  assert(dialer.pending.front().first.key == KeyVia("b.test", "10.0.0.9"));
  assert(pool.Stats().live == 1);
  assert(pool.Stats().evicted == 2);

  dialer.Succeed();
  assert(sink.order == std::vector<int>({1, 2, 3}));
  pool.Release(sink.Take(2));

  std::println("PASSED");
}

void TestReclaimPicksLeastRecentlyUsed() {
  std::print("Testing idle reclaim picks the oldest connection... ");

  PoolConfig config = SmallConfig();
  config.max_total_connections = 2;
  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(config, &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("old.test"), sink.Make(1), kBudget);
  pool.Acquire(KeyFor("new.test"), sink.Make(2), kBudget);
  auto old_state = dialer.Succeed();
  auto new_state = dialer.Succeed();

  now = 100;
  pool.Release(sink.Take(0));
  now = 200;
  pool.Release(sink.Take(1));
  assert(old_state->closes == 0 && new_state->closes == 0);

  pool.Acquire(KeyFor("third.test"), sink.Make(3), kBudget);
  assert(old_state->closes == 1);
  assert(new_state->closes == 0);
  assert(pool.IdleCount(KeyFor("new.test")) == 1);
  assert(dialer.pending.size() == 1);

  // With no one waiting both connections stay idle under the cap
  dialer.Succeed();
  pool.Release(sink.Take(2));
  assert(pool.Stats().live == 2);

  std::println("PASSED");
}

void TestIdleEviction() {
  std::print("Testing idle eviction... ");

  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(SmallConfig(), &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("a.test"), sink.Make(1), kBudget);
  auto state = dialer.Succeed();
  pool.Release(sink.Take(0));

  assert(pool.EvictIdle(999) == 0);
  assert(state->closes == 0);
  assert(pool.EvictIdle(1000) == 1);
  assert(state->closes == 1);

  PoolStats stats = pool.Stats();
  assert(stats.live == 0);
  assert(stats.evicted == 1);
  assert(stats.keys == 0);  // empty key pools are dropped

  // An expired connection is never lent even before a sweep runs
  pool.Acquire(KeyFor("a.test"), sink.Make(2), kBudget);
  auto second = dialer.Succeed();
  pool.Release(sink.Take(1));
  now = 5000;
  AcquireTicket ticket = pool.Acquire(KeyFor("a.test"), sink.Make(3), kBudget);
  assert(ticket != 0);
  assert(second->closes == 1);
  assert(dialer.pending.size() == 1);

  std::println("PASSED");
}

void TestUnusableAndBroken() {
  std::print("Testing unusable and broken connections... ");

  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(SmallConfig(), &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("a.test"), sink.Make(1), kBudget);
  auto state = dialer.Succeed();
  pool.Release(sink.Take(0));

  // Peer went away while idle
  state->usable = false;
  pool.Acquire(KeyFor("a.test"), sink.Make(2), kBudget);
  assert(state->closes == 1);
  assert(dialer.pending.size() == 1);
  assert(pool.Stats().evicted == 1);

  dialer.Succeed();
  ConnectionPtr conn = sink.Take(1);
  conn->MarkBroken();
  pool.Release(std::move(conn));
  assert(dialer.states[1]->closes == 1);
  assert(pool.IdleCount(KeyFor("a.test")) == 0);
  assert(pool.Stats().live == 0);

  // Released with a stream still open: closed, not idled
  pool.Acquire(KeyFor("a.test"), sink.Make(3), kBudget);
  auto busy_state = dialer.Succeed();
  ConnectionPtr busy = sink.Take(2);
  ++busy->in_flight_streams;
  pool.Release(std::move(busy));
  assert(busy_state->closes == 1);
  assert(pool.IdleCount(KeyFor("a.test")) == 0);
  assert(pool.Stats().live == 0);

  std::println("PASSED");
}

void TestDialFailure() {
  std::print("Testing dial failure... ");

  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(SmallConfig(), &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("a.test"), sink.Make(1), kBudget);
  dialer.Fail(DialStage::kTlsHandshake);

  assert(sink.results.size() == 1);
  assert(!sink.results[0].ok());
  assert(sink.results[0].error().code() == ErrorCode::kDialFailed);
  assert(sink.results[0].error().stage() == DialStage::kTlsHandshake);

  PoolStats stats = pool.Stats();
  assert(stats.dials_failed == 1);
  assert(stats.live == 0);
  assert(stats.waiting == 0);

  std::println("PASSED");
}

void TestCancel() {
  std::print("Testing cancel... ");

  PoolConfig config = SmallConfig();
  config.max_dials_per_key = 1;
  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(config, &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("a.test"), sink.Make(1), kBudget);
  AcquireTicket second = pool.Acquire(KeyFor("a.test"), sink.Make(2), kBudget);
  assert(second != 0);

  assert(pool.Cancel(second));
  assert(!pool.Cancel(second));
  assert(!pool.Cancel(0));

  dialer.Succeed();
  assert(sink.order == std::vector<int>({1}));
  assert(dialer.pending.empty());

  pool.Release(sink.Take(0));
  assert(sink.order == std::vector<int>({1}));
  assert(pool.IdleCount(KeyFor("a.test")) == 1);

  std::println("PASSED");
}

void TestExpireWaiters() {
  std::print("Testing waiter expiry... ");

  PoolConfig config = SmallConfig();
  config.max_dials_per_key = 1;
  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(config, &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("a.test"), sink.Make(1), std::chrono::milliseconds(100));
  pool.Acquire(KeyFor("a.test"), sink.Make(2), std::chrono::milliseconds(100));

  assert(pool.ExpireWaiters(99) == 0);
  // The first waiter is covered by the running dial
  assert(pool.ExpireWaiters(100) == 1);
  assert(sink.order == std::vector<int>({2}));
  assert(sink.results[0].error().code() == ErrorCode::kPoolExhausted);

  dialer.Succeed();
  assert(sink.order == std::vector<int>({2, 1}));
  assert(sink.results[1].ok());
  pool.Release(sink.Take(1));

  std::println("PASSED");
}

void TestShutdown() {
  std::print("Testing shutdown... ");

  PoolConfig config = SmallConfig();
  config.max_dials_per_key = 1;
  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(config, &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("idle.test"), sink.Make(1), kBudget);
  auto idle_state = dialer.Succeed();
  pool.Release(sink.Take(0));

  pool.Acquire(KeyFor("lent.test"), sink.Make(2), kBudget);
  auto lent_state = dialer.Succeed();
  ConnectionPtr lent = sink.Take(1);

  pool.Acquire(KeyFor("wait.test"), sink.Make(3), kBudget);
  pool.Acquire(KeyFor("wait.test"), sink.Make(4), kBudget);
  assert(dialer.pending.size() == 1);

  pool.Shutdown();
  assert(pool.is_shutdown());
  assert(idle_state->closes == 1);
  assert(lent_state->closes == 0);
  assert(sink.order == std::vector<int>({1, 2, 3, 4}));
  assert(sink.results[2].error().code() == ErrorCode::kPoolShutdown);
  assert(sink.results[3].error().code() == ErrorCode::kPoolShutdown);

  // New acquires are rejected inline
  assert(pool.Acquire(KeyFor("idle.test"), sink.Make(5), kBudget) == 0);
  assert(sink.results[4].error().code() == ErrorCode::kPoolShutdown);

  // Late dials and late releases are closed
  auto late = dialer.Succeed();
  assert(late->closes == 1);
  pool.Release(std::move(lent));
  assert(lent_state->closes == 1);
  assert(pool.Stats().live == 0);

  std::println("PASSED");
}

void TestDetach() {
  std::print("Testing detach... ");

  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(SmallConfig(), &dialer, [&now] { return now; });
  Sink sink;

  pool.Acquire(KeyFor("a.test"), sink.Make(1), kBudget);
  auto state = dialer.Succeed();
  std::unique_ptr<Transport> transport = pool.Detach(sink.Take(0));
  assert(transport != nullptr);
  assert(state->closes == 0);
  assert(pool.Stats().live == 0);
  assert(pool.IdleCount(KeyFor("a.test")) == 0);

  transport.reset();
  assert(state->closes == 0);  // the new owner decides

  std::println("PASSED");
}

Task<bool> AcquireOnce(ConnectionPool& pool, IdentityKey key,
                       ConnectionPtr* out) {
  auto result = co_await AcquireAwaitable(pool, std::move(key), kBudget);
  if (!result) {
    co_return false;
  }
  *out = std::move(result).value();
  co_return true;
}

void TestAcquireAwaitable() {
  std::print("Testing co_await acquire... ");

  FakeDialer dialer;
  uint64_t now = 0;
  ConnectionPool pool(SmallConfig(), &dialer, [&now] { return now; });

  // Suspends until the dial completes
  ConnectionPtr conn;
  Task<bool> task = AcquireOnce(pool, KeyFor("a.test"), &conn);
  task.Start();
  assert(!task.done());
  dialer.Succeed();
  assert(task.done());
  assert(task.result());
  assert(conn != nullptr);
  pool.Release(std::move(conn));

  // Idle connection: completes without suspending
  Task<bool> reuse = AcquireOnce(pool, KeyFor("a.test"), &conn);
  reuse.Start();
  assert(reuse.done());
  assert(reuse.result());
  assert(conn != nullptr);
  pool.Release(std::move(conn));

  pool.Shutdown();
  Task<bool> rejected = AcquireOnce(pool, KeyFor("a.test"), &conn);
  rejected.Start();
  assert(rejected.done());
  assert(!rejected.result());

  std::println("PASSED");
}

int main() {
  std::println("=== ConnectionPool Unit Tests ===\n");

  TestDialThenReuse();
  TestIdentityIsolation();
  TestPerKeyDialCapQueuesFifo();
  TestGlobalCapReclaimsIdle();
  TestReclaimPicksLeastRecentlyUsed();
  TestIdleEviction();
  TestUnusableAndBroken();
  TestDialFailure();
  TestCancel();
  TestExpireWaiters();
  TestShutdown();
  TestDetach();
  TestAcquireAwaitable();

  std::println("\nAll ConnectionPool tests passed!");
  return 0;
}
