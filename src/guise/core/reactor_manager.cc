// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/core/reactor_manager.h"

#include <pthread.h>
#include <sched.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <latch>

namespace guise {
namespace core {

namespace {

size_t GetCpuCount() {
  unsigned int count = std::thread::hardware_concurrency();
  return count > 0 ? count : 4;
}

void PinThreadToCore([[maybe_unused]] size_t core_id) {
#if defined(__linux__)
  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  CPU_SET(core_id, &cpuset);
  pthread_setaffinity_np(pthread_self(), sizeof(cpu_set_t), &cpuset);
#endif
  // macOS doesn't support thread pinning
}

}  // namespace

ReactorManager::ReactorManager(const ReactorManagerConfig& config)
    : config_(config) {
  size_t num_reactors = config_.num_reactors;
  if (num_reactors == 0) {
    num_reactors = GetCpuCount();
  }

  contexts_.reserve(num_reactors);
  for (size_t i = 0; i < num_reactors; ++i) {
    auto ctx = std::make_unique<ReactorContext>();
    ctx->index = i;
    ctx->reactor = std::make_unique<Reactor>();
    contexts_.push_back(std::move(ctx));
  }
}

ReactorManager::~ReactorManager() {
  Stop();

  // Threads are joined; teardown runs here. Pools fail their waiters
  // before the dialers and loops they depend on go away.
  for (auto& ctx : contexts_) {
    if (ctx->connection_pool) {
      ctx->connection_pool->Shutdown();
    }
    if (ctx->maintenance_timer != 0) {
      ctx->reactor->CancelTimer(ctx->maintenance_timer);
      ctx->maintenance_timer = 0;
    }
  }
  contexts_.clear();
}

bool ReactorManager::Initialize(const ClientConfig& config,
                                const profile::ProfileRegistry* registry) {
  if (initialized_) {
    return true;
  }

  tls_contexts_ = std::make_unique<tls::TlsContextStore>(config.tls);

  // The global connection cap is shared out between reactors
  PoolConfig pool_config = config.pool;
  pool_config.max_total_connections = std::max<size_t>(
      1, config.pool.max_total_connections / contexts_.size());

  const uint64_t ttl_ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(config.dns.cache_ttl)
          .count());
  const uint64_t interval_ms = static_cast<uint64_t>(
      std::max<int64_t>(1, config.pool.maintenance_interval.count()));

  for (auto& ctx : contexts_) {
    if (!ctx->reactor->Initialize()) {
      last_error_ = std::string(ctx->reactor->last_error());
      SPDLOG_ERROR("reactor {}: {}", ctx->index, last_error_);
      return false;
    }

    ctx->dns_resolver = std::make_unique<util::DnsResolver>(
        ctx->reactor->loop(), config.dns.overrides, ttl_ms);

    ctx->dialer = std::make_unique<transport::TransportDialer>(
        ctx->reactor.get(), ctx->dns_resolver.get(), tls_contexts_.get(),
        registry, config.http_version);

    Reactor* reactor = ctx->reactor.get();
    ctx->connection_pool = std::make_unique<pool::ConnectionPool>(
        pool_config, ctx->dialer.get(),
        [reactor] { return reactor->now_ms(); });

    ReactorContext* raw = ctx.get();
    ctx->maintenance_timer = ctx->reactor->AddTimer(
        interval_ms, interval_ms, [this, raw] { RunMaintenance(raw); });
  }

  SPDLOG_DEBUG("reactor manager: {} reactor(s), {} connection(s) each",
               contexts_.size(), pool_config.max_total_connections);
  initialized_ = true;
  return true;
}

void ReactorManager::Start() {
  if (running_.load(std::memory_order_acquire) || !initialized_) {
    return;
  }
  running_.store(true, std::memory_order_release);

  for (auto& ctx : contexts_) {
    ctx->running.store(true, std::memory_order_release);
    ctx->thread = std::make_unique<std::thread>(
        [this, raw_ctx = ctx.get()]() { RunReactor(raw_ctx); });
  }
}

void ReactorManager::Stop() {
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }

  // Queued on the loop first; Run() drains posted work after a stop
  for (auto& ctx : contexts_) {
    ReactorContext* raw = ctx.get();
    raw->reactor->Post([raw] {
      if (raw->connection_pool) {
        raw->connection_pool->Shutdown();
      }
    });
    raw->running.store(false, std::memory_order_release);
    raw->reactor->Stop();
  }

  for (auto& ctx : contexts_) {
    if (ctx->thread && ctx->thread->joinable()) {
      ctx->thread->join();
    }
    ctx->thread.reset();
  }
}

ReactorContext* ReactorManager::GetReactorForKey(const pool::IdentityKey& key) {
  if (contexts_.empty()) {
    return nullptr;
  }
  return contexts_[key.Hash() % contexts_.size()].get();
}

ReactorContext* ReactorManager::GetReactor(size_t index) {
  if (index >= contexts_.size()) {
    return nullptr;
  }
  return contexts_[index].get();
}

void ReactorManager::Post(size_t reactor_index,
                          std::function<void()> callback) {
  if (reactor_index >= contexts_.size()) {
    return;
  }
  contexts_[reactor_index]->reactor->Post(std::move(callback));
}

void ReactorManager::PostAll(std::function<void()> callback) {
  for (auto& ctx : contexts_) {
    ctx->reactor->Post(callback);
  }
}

void ReactorManager::Barrier() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  std::latch done(static_cast<std::ptrdiff_t>(contexts_.size()));
  PostAll([&done] { done.count_down(); });
  done.wait();
}

pool::PoolStats ReactorManager::TotalStats() const {
  pool::PoolStats total;
  for (const auto& ctx : contexts_) {
    if (!ctx->connection_pool) {
      continue;
    }
    pool::PoolStats s = ctx->connection_pool->Stats();
    total.live += s.live;
    total.idle += s.idle;
    total.dialing += s.dialing;
    total.waiting += s.waiting;
    total.keys += s.keys;
    total.dialed += s.dialed;
    total.dials_failed += s.dials_failed;
    total.reused += s.reused;
    total.evicted += s.evicted;
  }
  return total;
}

void ReactorManager::RunReactor(ReactorContext* ctx) {
  if (config_.pin_to_cores) {
    PinThreadToCore(ctx->index % GetCpuCount());
  }
  ctx->reactor->Run();
}

void ReactorManager::RunMaintenance(ReactorContext* ctx) {
  const uint64_t now = ctx->reactor->now_ms();
  size_t evicted = ctx->connection_pool->EvictIdle(now);
  size_t expired = ctx->connection_pool->ExpireWaiters(now);
  if (evicted > 0 || expired > 0) {
    SPDLOG_DEBUG("reactor {}: evicted {} idle, expired {} waiter(s)",
                 ctx->index, evicted, expired);
  }
}

}  // namespace core
}  // namespace guise
