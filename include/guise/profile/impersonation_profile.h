// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_PROFILE_IMPERSONATION_PROFILE_H_
#define GUISE_PROFILE_IMPERSONATION_PROFILE_H_

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "guise/types.h"

namespace guise {
namespace profile {

// Marks a GREASE slot (RFC 8701) in any TLS id list of a profile.
// The ClientHello builder replaces it with a reserved value per connection.
inline constexpr uint16_t kGreasePlaceholder = 0x0a0a;

// TLS extension code points used by the built-in profiles
namespace ext {
inline constexpr uint16_t kServerName = 0;
inline constexpr uint16_t kStatusRequest = 5;
inline constexpr uint16_t kSupportedGroups = 10;
inline constexpr uint16_t kEcPointFormats = 11;
inline constexpr uint16_t kSignatureAlgorithms = 13;
inline constexpr uint16_t kAlpn = 16;
inline constexpr uint16_t kSignedCertTimestamp = 18;
inline constexpr uint16_t kPadding = 21;
inline constexpr uint16_t kExtendedMasterSecret = 23;
inline constexpr uint16_t kCompressCertificate = 27;
inline constexpr uint16_t kRecordSizeLimit = 28;
inline constexpr uint16_t kDelegatedCredentials = 34;
inline constexpr uint16_t kSessionTicket = 35;
inline constexpr uint16_t kPreSharedKey = 41;
inline constexpr uint16_t kEarlyData = 42;
inline constexpr uint16_t kSupportedVersions = 43;
inline constexpr uint16_t kPskKeyExchangeModes = 45;
inline constexpr uint16_t kKeyShare = 51;
inline constexpr uint16_t kApplicationSettingsOld = 17513;
inline constexpr uint16_t kApplicationSettings = 17613;
inline constexpr uint16_t kEncryptedClientHello = 65037;
inline constexpr uint16_t kRenegotiationInfo = 65281;
}  // namespace ext

// TLS protocol version wire codes
namespace version {
inline constexpr uint16_t kTls10 = 0x0301;
inline constexpr uint16_t kTls11 = 0x0302;
inline constexpr uint16_t kTls12 = 0x0303;
inline constexpr uint16_t kTls13 = 0x0304;
}  // namespace version

// Certificate compression algorithms (RFC 8879)
enum class CertCompression : uint16_t {
  kZlib = 1,
  kBrotli = 2,
  kZstd = 3,
};

struct TlsProfile {
  // Cipher suites in wire order; may contain kGreasePlaceholder
  std::vector<uint16_t> cipher_suites;

  // Extensions in wire order. kGreasePlaceholder marks a GREASE extension,
  // ext::kPreSharedKey marks where PSK goes when resumption is available.
  std::vector<uint16_t> extensions;

  // Per-extension parameters
  std::vector<uint16_t> supported_groups;      // may contain GREASE
  std::vector<uint16_t> key_share_groups;      // may contain GREASE
  std::vector<uint16_t> signature_algorithms;
  std::vector<uint16_t> supported_versions;    // may contain GREASE
  std::vector<uint8_t> psk_modes;              // 1 = psk_dhe_ke
  std::vector<std::string> alpn_protocols;     // ALPN order as sent
  std::vector<CertCompression> cert_compression;
  std::vector<std::string> alps_protocols;
  uint16_t alps_codepoint = ext::kApplicationSettingsOld;
  std::vector<uint16_t> delegated_credentials;  // sigalgs, Firefox only
  uint16_t record_size_limit = 0;               // 0 = not sent
  bool ech_grease = false;

  uint16_t min_version = version::kTls12;
  uint16_t max_version = version::kTls13;

  // Chrome 110+ shuffles extensions per connection. The declared order is
  // then the canonical order and the engine shuffles it.
  bool permute_extensions = false;
};

enum class PseudoHeader : uint8_t {
  kMethod,
  kAuthority,
  kScheme,
  kPath,
};

using PseudoHeaderOrder = std::array<PseudoHeader, 4>;

// "m,a,s,p" style rendering used by the Akamai fingerprint
std::string PseudoHeaderOrderString(const PseudoHeaderOrder& order);

// True if `order` names each pseudo-header exactly once
bool IsValidPseudoHeaderOrder(const PseudoHeaderOrder& order);

// HTTP/2 SETTINGS identifiers (RFC 9113, RFC 8441, RFC 9218)
namespace h2setting {
inline constexpr uint16_t kHeaderTableSize = 0x1;
inline constexpr uint16_t kEnablePush = 0x2;
inline constexpr uint16_t kMaxConcurrentStreams = 0x3;
inline constexpr uint16_t kInitialWindowSize = 0x4;
inline constexpr uint16_t kMaxFrameSize = 0x5;
inline constexpr uint16_t kMaxHeaderListSize = 0x6;
inline constexpr uint16_t kEnableConnectProtocol = 0x8;
inline constexpr uint16_t kNoRfc7540Priorities = 0x9;
}  // namespace h2setting

struct Http2Setting {
  uint16_t id = 0;
  uint32_t value = 0;

  bool operator==(const Http2Setting& other) const = default;
};

enum class PriorityMode {
  kNone,               // no priority information on request streams
  kInHeaders,          // PRIORITY flag + fields inside HEADERS (Chrome)
  kFrameAfterHeaders,  // separate PRIORITY frame right after HEADERS
};

struct StreamPriority {
  uint32_t stream_dependency = 0;
  uint16_t weight = 16;  // 1..256, wire byte is weight - 1
  bool exclusive = false;

  bool operator==(const StreamPriority& other) const = default;
};

struct PriorityFrameSpec {
  int32_t stream_id = 0;
  StreamPriority priority;
};

struct Http2Profile {
  // Emitted exactly in this order; absent ids are not sent
  std::vector<Http2Setting> settings;

  // Stream 0 WINDOW_UPDATE sent after SETTINGS (0 = none)
  uint32_t connection_window_increment = 0;

  PseudoHeaderOrder pseudo_header_order = {
      PseudoHeader::kMethod, PseudoHeader::kAuthority, PseudoHeader::kScheme,
      PseudoHeader::kPath};

  PriorityMode priority_mode = PriorityMode::kNone;
  StreamPriority priority;

  // PRIORITY frames for idle streams sent right after the preface
  std::vector<PriorityFrameSpec> initial_priority_frames;

  bool padded = false;
  uint16_t padding_block = 0;  // pad frame payloads up to a multiple of this
};

struct HeaderProfile {
  // Default request headers, in browser order
  Headers headers;

  // Also present in `headers`; kept for diagnostics and proxy CONNECT
  std::string user_agent;

  // HTTP/1.1 names are written Title-Case (HTTP/2 always lowercases)
  bool http1_title_case = true;
};

// A browser release's wire identity. Immutable once registered.
struct ImpersonationProfile {
  std::string name;
  TlsProfile tls;
  Http2Profile http2;
  HeaderProfile headers;
};

}  // namespace profile
}  // namespace guise

#endif  // GUISE_PROFILE_IMPERSONATION_PROFILE_H_
