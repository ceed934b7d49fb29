// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_POOL_DIALER_H_
#define GUISE_POOL_DIALER_H_

#include <chrono>
#include <functional>
#include <memory>

#include "guise/error.h"
#include "guise/pool/identity_key.h"
#include "guise/pool/transport.h"

namespace guise {
namespace pool {

struct DialRequest {
  IdentityKey key;

  // Budget for every stage from resolve to the h2 preface
  std::chrono::milliseconds timeout{30000};
};

// Exactly one call per Dial(), possibly before Dial() returns.
// Failures are Error{kDialFailed, stage, ...} or a configuration error.
using DialCallback = std::function<void(Result<std::unique_ptr<Transport>>)>;

// Produces an established transport for an identity key
class Dialer {
 public:
  virtual ~Dialer() = default;

  virtual void Dial(const DialRequest& request, DialCallback callback) = 0;
};

}  // namespace pool
}  // namespace guise

#endif  // GUISE_POOL_DIALER_H_
