// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_HTTP2_H2_PREFACE_H_
#define GUISE_HTTP2_H2_PREFACE_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "guise/profile/impersonation_profile.h"
#include "guise/types.h"

namespace guise {
namespace http2 {

// HTTP/2 frame types this module encodes (RFC 9113 section 6)
inline constexpr uint8_t kFrameSettings = 0x4;
inline constexpr uint8_t kFramePriority = 0x2;
inline constexpr uint8_t kFrameWindowUpdate = 0x8;

inline constexpr size_t kFrameHeaderSize = 9;

// "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n"
inline constexpr std::string_view kClientMagic =
    "PRI * HTTP/2.0\r\n\r\nSM\r\n\r\n";

// What a connection sends and how it shapes its requests, derived from one
// profile. Fixed for the life of the connection.
struct Http2Preface {
  std::vector<profile::Http2Setting> settings;
  uint32_t window_update_increment = 0;
  profile::PseudoHeaderOrder pseudo_header_order{};
  profile::PriorityMode priority_mode = profile::PriorityMode::kNone;
  profile::StreamPriority priority;
  std::vector<profile::PriorityFrameSpec> initial_priority_frames;
  bool padded = false;
  uint16_t padding_block = 0;

  // The four pseudo-headers in profile order
  Headers OrderPseudoHeaders(std::string_view method,
                             std::string_view authority,
                             std::string_view scheme,
                             std::string_view path) const;

  // Value of one SETTINGS id, or `fallback` if the profile omits it
  uint32_t SettingOr(uint16_t id, uint32_t fallback) const;
};

class Http2PrefaceBuilder {
 public:
  static Http2Preface Build(const profile::Http2Profile& profile);
};

// Magic, SETTINGS, WINDOW_UPDATE (if any), then the initial PRIORITY frames
std::vector<uint8_t> EncodeClientPreface(const Http2Preface& preface);

std::vector<uint8_t> EncodeSettingsFrame(
    const std::vector<profile::Http2Setting>& settings);

std::vector<uint8_t> EncodeWindowUpdateFrame(uint32_t stream_id,
                                             uint32_t increment);

std::vector<uint8_t> EncodePriorityFrame(
    const profile::PriorityFrameSpec& frame);

// Akamai HTTP/2 fingerprint text, e.g.
// "1:65536;2:0;4:6291456;6:262144|15663105|0|m,a,s,p"
std::string AkamaiFingerprint(const Http2Preface& preface);

}  // namespace http2
}  // namespace guise

#endif  // GUISE_HTTP2_H2_PREFACE_H_
