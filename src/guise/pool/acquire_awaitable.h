// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_POOL_ACQUIRE_AWAITABLE_H_
#define GUISE_POOL_ACQUIRE_AWAITABLE_H_

#include <chrono>
#include <utility>

#include "guise/pool/connection_pool.h"
#include "guise/task.h"

namespace guise {
namespace pool {

// co_await AcquireAwaitable(pool, key, budget) -> Result<ConnectionPtr>.
// Resumes inside the pool callback, i.e. on the pool's reactor.
inline CallbackAwaitable<ConnectionPtr> AcquireAwaitable(
    ConnectionPool& pool, IdentityKey key, std::chrono::milliseconds budget) {
  return CallbackAwaitable<ConnectionPtr>(
      [&pool, key = std::move(key),
       budget](CallbackAwaitable<ConnectionPtr>::Callback done) {
        pool.Acquire(key, std::move(done), budget);
      });
}

}  // namespace pool
}  // namespace guise

#endif  // GUISE_POOL_ACQUIRE_AWAITABLE_H_
