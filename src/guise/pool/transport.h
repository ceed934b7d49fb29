// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_POOL_TRANSPORT_H_
#define GUISE_POOL_TRANSPORT_H_

#include <string_view>

namespace guise {
namespace pool {

// An established, authenticated byte stream the pool can hold and lend.
// The pool only asks about health and closes; protocol work belongs to the
// concrete type.
class Transport {
 public:
  virtual ~Transport() = default;

  // False once the peer closed, GOAWAY arrived, or a protocol error hit
  virtual bool IsUsable() const = 0;

  // Idempotent
  virtual void Close() = 0;

  // Negotiated ALPN protocol
  virtual std::string_view alpn() const = 0;

  bool is_http2() const { return alpn() == "h2"; }
};

}  // namespace pool
}  // namespace guise

#endif  // GUISE_POOL_TRANSPORT_H_
