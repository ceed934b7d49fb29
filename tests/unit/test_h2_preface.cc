// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/http2/h2_preface.h"

#include <cassert>
#include <cstring>
#include <print>
#include <vector>

#include "guise/http2/h2_session.h"
#include "guise/profile/profile_registry.h"

using namespace guise;
using namespace guise::http2;
using namespace guise::profile;

namespace {

Http2Profile BrowserXHttp2() {
  Http2Profile h2;
  h2.settings = {{h2setting::kHeaderTableSize, 100},
                 {h2setting::kMaxConcurrentStreams, 0}};
  return h2;
}

uint32_t ReadU32(const std::vector<uint8_t>& b, size_t at) {
  return (static_cast<uint32_t>(b[at]) << 24) |
         (static_cast<uint32_t>(b[at + 1]) << 16) |
         (static_cast<uint32_t>(b[at + 2]) << 8) | b[at + 3];
}

// Drains everything a fresh session wants to send
std::vector<uint8_t> FirstOutput(const Http2Preface& preface) {
  H2Session session(preface, {});
  bool ok = session.Initialize();
  assert(ok);
  (void)ok;
  auto [data, len] = session.GetPendingData();
  std::vector<uint8_t> out(data, data + len);
  session.DataSent(len);
  return out;
}

}  // namespace

void TestBrowserXSettings() {
  std::print("Testing BrowserX SETTINGS... ");

  Http2Preface preface = Http2PrefaceBuilder::Build(BrowserXHttp2());
  assert(preface.settings.size() == 2);
  assert(preface.settings[0] == (Http2Setting{1, 100}));
  assert(preface.settings[1] == (Http2Setting{3, 0}));
  assert(preface.SettingOr(h2setting::kMaxConcurrentStreams, 7) == 0);
  assert(preface.SettingOr(h2setting::kInitialWindowSize, 65535) == 65535);

  std::println("PASSED");
}

void TestSettingsFrameBytes() {
  std::print("Testing SETTINGS frame encoding... ");

  auto frame = EncodeSettingsFrame(BrowserXHttp2().settings);
  assert(frame.size() == kFrameHeaderSize + 12);

  // length 12, type SETTINGS, no flags, stream 0
  assert(frame[0] == 0 && frame[1] == 0 && frame[2] == 12);
  assert(frame[3] == kFrameSettings);
  assert(frame[4] == 0);
  assert(ReadU32(frame, 5) == 0);

  // (1, 100) then (3, 0), exactly in profile order
  assert(frame[9] == 0 && frame[10] == 1);
  assert(ReadU32(frame, 11) == 100);
  assert(frame[15] == 0 && frame[16] == 3);
  assert(ReadU32(frame, 17) == 0);

  std::println("PASSED");
}

void TestWindowUpdateAndPriorityFrames() {
  std::print("Testing WINDOW_UPDATE and PRIORITY encoding... ");

  auto wu = EncodeWindowUpdateFrame(0, 15663105);
  assert(wu.size() == kFrameHeaderSize + 4);
  assert(wu[3] == kFrameWindowUpdate);
  assert(ReadU32(wu, 9) == 15663105);

  PriorityFrameSpec prio;
  prio.stream_id = 3;
  prio.priority = {0, 201, false};
  auto pri = EncodePriorityFrame(prio);
  assert(pri.size() == kFrameHeaderSize + 5);
  assert(pri[3] == kFramePriority);
  assert(ReadU32(pri, 5) == 3);
  assert(ReadU32(pri, 9) == 0);
  assert(pri[13] == 200);  // weight - 1

  prio.priority.exclusive = true;
  prio.priority.stream_dependency = 5;
  pri = EncodePriorityFrame(prio);
  assert(ReadU32(pri, 9) == (0x80000000u | 5));

  std::println("PASSED");
}

void TestClientPrefaceLayout() {
  std::print("Testing client preface layout... ");

  Http2Profile h2 = BrowserXHttp2();
  h2.connection_window_increment = 15663105;
  auto bytes = EncodeClientPreface(Http2PrefaceBuilder::Build(h2));

  const size_t magic = kClientMagic.size();
  assert(bytes.size() == magic + (kFrameHeaderSize + 12) +
                             (kFrameHeaderSize + 4));
  assert(std::memcmp(bytes.data(), kClientMagic.data(), magic) == 0);
  assert(bytes[magic + 3] == kFrameSettings);
  assert(bytes[magic + kFrameHeaderSize + 12 + 3] == kFrameWindowUpdate);

  std::println("PASSED");
}

void TestSessionFirstOutput() {
  std::print("Testing session first output equals the preface... ");

  Http2Preface browser_x = Http2PrefaceBuilder::Build(BrowserXHttp2());
  assert(FirstOutput(browser_x) == EncodeClientPreface(browser_x));

  auto chrome = ProfileRegistry::Builtin().Lookup("Chrome143");
  assert(chrome);
  Http2Preface chrome_preface =
      Http2PrefaceBuilder::Build(chrome.value()->http2);
  assert(FirstOutput(chrome_preface) == EncodeClientPreface(chrome_preface));

  std::println("PASSED");
}

void TestPseudoHeaderOrder() {
  std::print("Testing pseudo-header ordering... ");

  Http2Profile h2 = BrowserXHttp2();
  h2.pseudo_header_order = {PseudoHeader::kMethod, PseudoHeader::kPath,
                            PseudoHeader::kAuthority, PseudoHeader::kScheme};
  Http2Preface preface = Http2PrefaceBuilder::Build(h2);

  Headers pseudo =
      preface.OrderPseudoHeaders("GET", "example.test", "https", "/x");
  assert(pseudo.size() == 4);
  assert(pseudo[0].name == ":method" && pseudo[0].value == "GET");
  assert(pseudo[1].name == ":path" && pseudo[1].value == "/x");
  assert(pseudo[2].name == ":authority");
  assert(pseudo[3].name == ":scheme");

  std::println("PASSED");
}

void TestAkamaiFingerprint() {
  std::print("Testing Akamai fingerprint... ");

  auto chrome = ProfileRegistry::Builtin().Lookup("Chrome143");
  assert(chrome);
  std::string akamai =
      AkamaiFingerprint(Http2PrefaceBuilder::Build(chrome.value()->http2));
  assert(akamai == "1:65536;2:0;4:6291456;6:262144|15663105|0|m,a,s,p");

  assert(AkamaiFingerprint(Http2PrefaceBuilder::Build(BrowserXHttp2())) ==
         "1:100;3:0|0|0|m,a,s,p");

  std::println("PASSED");
}

int main() {
  std::println("=== HTTP/2 Preface Unit Tests ===");

  TestBrowserXSettings();
  TestSettingsFrameBytes();
  TestWindowUpdateAndPriorityFrames();
  TestClientPrefaceLayout();
  TestSessionFirstOutput();
  TestPseudoHeaderOrder();
  TestAkamaiFingerprint();

  std::println("\nAll HTTP/2 preface tests passed!");
  return 0;
}
