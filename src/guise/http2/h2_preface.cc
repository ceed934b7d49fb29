// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/http2/h2_preface.h"

namespace guise {
namespace http2 {

namespace {

void PutU16(std::vector<uint8_t>* out, uint16_t v) {
  out->push_back(static_cast<uint8_t>(v >> 8));
  out->push_back(static_cast<uint8_t>(v));
}

void PutU32(std::vector<uint8_t>* out, uint32_t v) {
  out->push_back(static_cast<uint8_t>(v >> 24));
  out->push_back(static_cast<uint8_t>(v >> 16));
  out->push_back(static_cast<uint8_t>(v >> 8));
  out->push_back(static_cast<uint8_t>(v));
}

void PutFrameHeader(std::vector<uint8_t>* out, uint32_t length, uint8_t type,
                    uint8_t flags, uint32_t stream_id) {
  out->push_back(static_cast<uint8_t>(length >> 16));
  out->push_back(static_cast<uint8_t>(length >> 8));
  out->push_back(static_cast<uint8_t>(length));
  out->push_back(type);
  out->push_back(flags);
  PutU32(out, stream_id & 0x7fffffffu);
}

void Append(std::vector<uint8_t>* out, const std::vector<uint8_t>& bytes) {
  out->insert(out->end(), bytes.begin(), bytes.end());
}

}  // namespace

Headers Http2Preface::OrderPseudoHeaders(std::string_view method,
                                         std::string_view authority,
                                         std::string_view scheme,
                                         std::string_view path) const {
  Headers out;
  out.reserve(4);
  for (profile::PseudoHeader ph : pseudo_header_order) {
    switch (ph) {
      case profile::PseudoHeader::kMethod:
        out.push_back({":method", std::string(method)});
        break;
      case profile::PseudoHeader::kAuthority:
        out.push_back({":authority", std::string(authority)});
        break;
      case profile::PseudoHeader::kScheme:
        out.push_back({":scheme", std::string(scheme)});
        break;
      case profile::PseudoHeader::kPath:
        out.push_back({":path", std::string(path)});
        break;
    }
  }
  return out;
}

uint32_t Http2Preface::SettingOr(uint16_t id, uint32_t fallback) const {
  for (const auto& s : settings) {
    if (s.id == id) return s.value;
  }
  return fallback;
}

Http2Preface Http2PrefaceBuilder::Build(const profile::Http2Profile& profile) {
  Http2Preface preface;
  preface.settings = profile.settings;
  preface.window_update_increment = profile.connection_window_increment;
  preface.pseudo_header_order = profile.pseudo_header_order;
  preface.priority_mode = profile.priority_mode;
  preface.priority = profile.priority;
  preface.initial_priority_frames = profile.initial_priority_frames;
  preface.padded = profile.padded;
  preface.padding_block = profile.padding_block;
  return preface;
}

std::vector<uint8_t> EncodeSettingsFrame(
    const std::vector<profile::Http2Setting>& settings) {
  std::vector<uint8_t> out;
  out.reserve(kFrameHeaderSize + settings.size() * 6);
  PutFrameHeader(&out, static_cast<uint32_t>(settings.size() * 6),
                 kFrameSettings, 0, 0);
  for (const auto& s : settings) {
    PutU16(&out, s.id);
    PutU32(&out, s.value);
  }
  return out;
}

std::vector<uint8_t> EncodeWindowUpdateFrame(uint32_t stream_id,
                                             uint32_t increment) {
  std::vector<uint8_t> out;
  out.reserve(kFrameHeaderSize + 4);
  PutFrameHeader(&out, 4, kFrameWindowUpdate, 0, stream_id);
  PutU32(&out, increment & 0x7fffffffu);
  return out;
}

std::vector<uint8_t> EncodePriorityFrame(
    const profile::PriorityFrameSpec& frame) {
  std::vector<uint8_t> out;
  out.reserve(kFrameHeaderSize + 5);
  PutFrameHeader(&out, 5, kFramePriority, 0,
                 static_cast<uint32_t>(frame.stream_id));

  uint32_t dependency = frame.priority.stream_dependency & 0x7fffffffu;
  if (frame.priority.exclusive) {
    dependency |= 0x80000000u;
  }
  PutU32(&out, dependency);
  // Wire weight is weight - 1
  out.push_back(static_cast<uint8_t>(frame.priority.weight - 1));
  return out;
}

std::vector<uint8_t> EncodeClientPreface(const Http2Preface& preface) {
  std::vector<uint8_t> out(kClientMagic.begin(), kClientMagic.end());
  Append(&out, EncodeSettingsFrame(preface.settings));
  if (preface.window_update_increment != 0) {
    Append(&out, EncodeWindowUpdateFrame(0, preface.window_update_increment));
  }
  for (const auto& frame : preface.initial_priority_frames) {
    Append(&out, EncodePriorityFrame(frame));
  }
  return out;
}

std::string AkamaiFingerprint(const Http2Preface& preface) {
  std::string out;
  for (size_t i = 0; i < preface.settings.size(); ++i) {
    if (i > 0) out += ';';
    out += std::to_string(preface.settings[i].id);
    out += ':';
    out += std::to_string(preface.settings[i].value);
  }

  out += '|';
  out += std::to_string(preface.window_update_increment);

  out += '|';
  if (preface.initial_priority_frames.empty()) {
    out += '0';
  } else {
    // stream:exclusive:dependency:weight
    for (size_t i = 0; i < preface.initial_priority_frames.size(); ++i) {
      const auto& f = preface.initial_priority_frames[i];
      if (i > 0) out += ',';
      out += std::to_string(f.stream_id);
      out += ':';
      out += f.priority.exclusive ? '1' : '0';
      out += ':';
      out += std::to_string(f.priority.stream_dependency);
      out += ':';
      out += std::to_string(f.priority.weight);
    }
  }

  out += '|';
  out += profile::PseudoHeaderOrderString(preface.pseudo_header_order);
  return out;
}

}  // namespace http2
}  // namespace guise
