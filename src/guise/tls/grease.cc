// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/tls/grease.h"

#include <openssl/rand.h>

namespace guise {
namespace tls {

GreaseSeed::GreaseSeed() {
  if (RAND_bytes(seed_.data(), seed_.size()) != 1) {
    // RAND_bytes does not fail in BoringSSL; keep a valid seed regardless
    seed_.fill(0);
  }
}

GreaseSeed::GreaseSeed(const std::array<uint8_t, kGreaseSlots>& seed)
    : seed_(seed) {}

uint16_t GreaseSeed::Value(GreaseIndex index) const {
  // Same derivation as BoringSSL: 0x?a?a with the high nibble from the seed
  uint16_t nibble = seed_[static_cast<size_t>(index)] & 0xf0;
  uint16_t byte = nibble | 0x0a;
  return static_cast<uint16_t>((byte << 8) | byte);
}

uint16_t GreaseSeed::ExtensionValue(int nth) const {
  uint16_t first = Value(GreaseIndex::kExtension1);
  if (nth == 0) {
    return first;
  }
  uint16_t second = Value(GreaseIndex::kExtension2);
  if (second == first) {
    second ^= 0x1010;
  }
  return second;
}

}  // namespace tls
}  // namespace guise
