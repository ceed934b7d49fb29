// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_POOL_POOLED_CONNECTION_H_
#define GUISE_POOL_POOLED_CONNECTION_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <utility>

#include "guise/pool/identity_key.h"
#include "guise/pool/transport.h"

namespace guise {
namespace pool {

// Pooled transport with pool metadata. Held in the idle list while unused;
// lent out as a unique_ptr, so the borrower has sole access until Release().
struct PooledConnection {
  PooledConnection(IdentityKey k, std::unique_ptr<Transport> t, uint64_t now_ms)
      : key(std::move(k)),
        transport(std::move(t)),
        created_ms(now_ms),
        last_used_ms(now_ms) {}

  ~PooledConnection() {
    if (transport) {
      transport->Close();
    }
  }

  PooledConnection(const PooledConnection&) = delete;
  PooledConnection& operator=(const PooledConnection&) = delete;

  // The identity it was dialed under; never changes
  const IdentityKey key;
  std::unique_ptr<Transport> transport;

  // Timing
  uint64_t created_ms = 0;
  uint64_t last_used_ms = 0;

  // Streams the borrower has open on the connection. A connection is lent
  // to one borrower at a time, so on release this is zero unless an
  // exchange was left unfinished; such connections are closed.
  size_t in_flight_streams = 0;
  size_t reuse_count = 0;

  // Set by the borrower on a protocol error. Released broken connections
  // are closed, never idled.
  void MarkBroken() { broken_ = true; }
  bool broken() const { return broken_; }

  bool IsUsable() const {
    return !broken_ && transport && transport->IsUsable();
  }

  std::string_view alpn() const {
    return transport ? transport->alpn() : std::string_view();
  }

  // Hands the transport to a new owner; the pool forgets it
  std::unique_ptr<Transport> DetachTransport() { return std::move(transport); }

 private:
  bool broken_ = false;
};

using ConnectionPtr = std::unique_ptr<PooledConnection>;

}  // namespace pool
}  // namespace guise

#endif  // GUISE_POOL_POOLED_CONNECTION_H_
