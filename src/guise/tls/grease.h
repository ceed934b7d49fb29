// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_TLS_GREASE_H_
#define GUISE_TLS_GREASE_H_

#include <array>
#include <cstddef>
#include <cstdint>

namespace guise {
namespace tls {

// Slots a ClientHello draws GREASE values for. Indices follow BoringSSL's
// ssl_grease_index_t so both sides agree on which value goes where.
enum class GreaseIndex : uint8_t {
  kCipher = 0,
  kGroup = 1,
  kExtension1 = 2,
  kExtension2 = 3,
  kVersion = 4,
  kTicketExtension = 5,
};

inline constexpr size_t kGreaseSlots = 6;

// True for the sixteen reserved values 0x0a0a, 0x1a1a, ... 0xfafa
constexpr bool IsGreaseValue(uint16_t value) {
  return (value & 0x0f0f) == 0x0a0a && (value >> 8) == (value & 0xff);
}

// Per-connection GREASE randomness. One seed is drawn per connection so
// every handshake re-rolls its GREASE values.
class GreaseSeed {
 public:
  // Random seed from the TLS library's CSPRNG
  GreaseSeed();

  // Fixed seed, for tests and reproducible dumps
  explicit GreaseSeed(const std::array<uint8_t, kGreaseSlots>& seed);

  uint16_t Value(GreaseIndex index) const;

  // The nth GREASE extension of a hello (0 or 1). The two values differ.
  uint16_t ExtensionValue(int nth) const;

  const std::array<uint8_t, kGreaseSlots>& bytes() const { return seed_; }

 private:
  std::array<uint8_t, kGreaseSlots> seed_;
};

}  // namespace tls
}  // namespace guise

#endif  // GUISE_TLS_GREASE_H_
