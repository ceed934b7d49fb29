// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/profile/profile_registry.h"

namespace guise {
namespace profile {

namespace {

constexpr uint16_t G = kGreasePlaceholder;

// Chrome cipher suites (identical since Chrome 100)
const std::vector<uint16_t> kChromeCipherSuites = {
    G,
    0x1301,  // TLS_AES_128_GCM_SHA256
    0x1302,  // TLS_AES_256_GCM_SHA384
    0x1303,  // TLS_CHACHA20_POLY1305_SHA256
    0xc02b,  // TLS_ECDHE_ECDSA_WITH_AES_128_GCM_SHA256
    0xc02f,  // TLS_ECDHE_RSA_WITH_AES_128_GCM_SHA256
    0xc02c,  // TLS_ECDHE_ECDSA_WITH_AES_256_GCM_SHA384
    0xc030,  // TLS_ECDHE_RSA_WITH_AES_256_GCM_SHA384
    0xcca9,  // TLS_ECDHE_ECDSA_WITH_CHACHA20_POLY1305_SHA256
    0xcca8,  // TLS_ECDHE_RSA_WITH_CHACHA20_POLY1305_SHA256
    0xc013,  // TLS_ECDHE_RSA_WITH_AES_128_CBC_SHA
    0xc014,  // TLS_ECDHE_RSA_WITH_AES_256_CBC_SHA
    0x009c,  // TLS_RSA_WITH_AES_128_GCM_SHA256
    0x009d,  // TLS_RSA_WITH_AES_256_GCM_SHA384
    0x002f,  // TLS_RSA_WITH_AES_128_CBC_SHA
    0x0035,  // TLS_RSA_WITH_AES_256_CBC_SHA
};

const std::vector<uint16_t> kChromeSignatureAlgorithms = {
    0x0403,  // ecdsa_secp256r1_sha256
    0x0804,  // rsa_pss_rsae_sha256
    0x0401,  // rsa_pkcs1_sha256
    0x0503,  // ecdsa_secp384r1_sha384
    0x0805,  // rsa_pss_rsae_sha384
    0x0501,  // rsa_pkcs1_sha384
    0x0806,  // rsa_pss_rsae_sha512
    0x0601,  // rsa_pkcs1_sha512
};

// Canonical extension order; Chrome permutes the non-GREASE entries
const std::vector<uint16_t> kChromeExtensionsAlpsOld = {
    G,     0,  23, 65281, 10, 11, 35,    16,    5, 13,
    18,    51, 45, 43,    27, 17513, 65037, G,     41,
};

// From a Chrome 143 capture
const std::vector<uint16_t> kChromeExtensionsAlpsNew = {
    G,  11, 23, 45,    18,    35, 65037, 5,  0, 27,
    16, 13, 10, 65281, 17613, 43, 51,    G,  41,
};

Http2Profile ChromeHttp2() {
  Http2Profile h2;
  h2.settings = {
      {h2setting::kHeaderTableSize, 65536},
      {h2setting::kEnablePush, 0},
      {h2setting::kInitialWindowSize, 6291456},
      {h2setting::kMaxHeaderListSize, 262144},
  };
  h2.connection_window_increment = 15663105;
  h2.pseudo_header_order = {PseudoHeader::kMethod, PseudoHeader::kAuthority,
                            PseudoHeader::kScheme, PseudoHeader::kPath};
  h2.priority_mode = PriorityMode::kInHeaders;
  h2.priority = {0, 256, true};
  return h2;
}

HeaderProfile ChromeHeaders(const std::string& sec_ch_ua,
                            const std::string& user_agent) {
  HeaderProfile headers;
  headers.user_agent = user_agent;
  headers.headers = {
      {"sec-ch-ua", sec_ch_ua},
      {"sec-ch-ua-mobile", "?0"},
      {"sec-ch-ua-platform", "\"Windows\""},
      {"upgrade-insecure-requests", "1"},
      {"user-agent", user_agent},
      {"accept",
       "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,"
       "image/webp,image/apng,*/*;q=0.8,application/signed-exchange;v=b3;"
       "q=0.7"},
      {"sec-fetch-site", "none"},
      {"sec-fetch-mode", "navigate"},
      {"sec-fetch-user", "?1"},
      {"sec-fetch-dest", "document"},
      {"accept-encoding", "gzip, deflate, br, zstd"},
      {"accept-language", "en-US,en;q=0.9"},
      {"priority", "u=0, i"},
  };
  return headers;
}

ImpersonationProfile Chromium(std::string name, uint16_t pq_group,
                              bool new_alps_codepoint,
                              const std::string& sec_ch_ua,
                              const std::string& user_agent) {
  ImpersonationProfile p;
  p.name = std::move(name);

  TlsProfile& tls = p.tls;
  tls.cipher_suites = kChromeCipherSuites;
  tls.extensions =
      new_alps_codepoint ? kChromeExtensionsAlpsNew : kChromeExtensionsAlpsOld;
  tls.supported_groups = {G, pq_group, 0x001d, 0x0017, 0x0018};
  tls.key_share_groups = {G, pq_group, 0x001d};
  tls.signature_algorithms = kChromeSignatureAlgorithms;
  tls.supported_versions = {G, version::kTls13, version::kTls12};
  tls.psk_modes = {1};
  tls.alpn_protocols = {"h2", "http/1.1"};
  tls.cert_compression = {CertCompression::kBrotli};
  tls.alps_protocols = {"h2"};
  tls.alps_codepoint = new_alps_codepoint ? ext::kApplicationSettings
                                          : ext::kApplicationSettingsOld;
  tls.ech_grease = true;
  tls.min_version = version::kTls12;
  tls.max_version = version::kTls13;
  tls.permute_extensions = true;

  p.http2 = ChromeHttp2();
  p.headers = ChromeHeaders(sec_ch_ua, user_agent);
  return p;
}

ImpersonationProfile Chrome124() {
  return Chromium(
      "Chrome124", 0x6399, false,
      "\"Chromium\";v=\"124\", \"Google Chrome\";v=\"124\", "
      "\"Not-A.Brand\";v=\"99\"",
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
      "(KHTML, like Gecko) Chrome/124.0.0.0 Safari/537.36");
}

ImpersonationProfile Chrome131() {
  return Chromium(
      "Chrome131", 0x11ec, false,
      "\"Google Chrome\";v=\"131\", \"Chromium\";v=\"131\", "
      "\"Not_A Brand\";v=\"24\"",
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
      "(KHTML, like Gecko) Chrome/131.0.0.0 Safari/537.36");
}

ImpersonationProfile Chrome143() {
  return Chromium(
      "Chrome143", 0x11ec, true,
      "\"Google Chrome\";v=\"143\", \"Chromium\";v=\"143\", "
      "\"Not A(Brand\";v=\"24\"",
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
      "(KHTML, like Gecko) Chrome/143.0.0.0 Safari/537.36");
}

ImpersonationProfile Edge131() {
  return Chromium(
      "Edge131", 0x11ec, false,
      "\"Microsoft Edge\";v=\"131\", \"Chromium\";v=\"131\", "
      "\"Not_A Brand\";v=\"24\"",
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
      "(KHTML, like Gecko) Chrome/131.0.0.0 Safari/537.36 Edg/131.0.0.0");
}

ImpersonationProfile Firefox133() {
  ImpersonationProfile p;
  p.name = "Firefox133";

  TlsProfile& tls = p.tls;
  tls.cipher_suites = {0x1301, 0x1303, 0x1302, 0xc02b, 0xc02f, 0xcca9,
                       0xcca8, 0xc02c, 0xc030, 0xc00a, 0xc009, 0xc013,
                       0xc014, 0x009c, 0x009d, 0x002f, 0x0035};
  tls.extensions = {0,  23, 65281, 10, 11, 35, 16, 5,     34,
                    18, 51, 43,    13, 45, 28, 27, 65037, 41};
  tls.supported_groups = {0x11ec, 0x001d, 0x0017, 0x0018,
                          0x0019, 0x0100, 0x0101};
  tls.key_share_groups = {0x11ec, 0x001d, 0x0017};
  tls.signature_algorithms = {0x0403, 0x0503, 0x0603, 0x0804, 0x0805, 0x0806,
                              0x0401, 0x0501, 0x0601, 0x0203, 0x0201};
  tls.delegated_credentials = {0x0403, 0x0503, 0x0603, 0x0203};
  tls.supported_versions = {version::kTls13, version::kTls12};
  tls.psk_modes = {1};
  tls.alpn_protocols = {"h2", "http/1.1"};
  tls.cert_compression = {CertCompression::kZlib, CertCompression::kBrotli,
                          CertCompression::kZstd};
  tls.record_size_limit = 16385;
  tls.ech_grease = true;
  tls.min_version = version::kTls12;
  tls.max_version = version::kTls13;

  Http2Profile& h2 = p.http2;
  h2.settings = {
      {h2setting::kHeaderTableSize, 65536},
      {h2setting::kEnablePush, 0},
      {h2setting::kInitialWindowSize, 131072},
      {h2setting::kMaxFrameSize, 16384},
  };
  h2.connection_window_increment = 12517377;
  h2.pseudo_header_order = {PseudoHeader::kMethod, PseudoHeader::kPath,
                            PseudoHeader::kAuthority, PseudoHeader::kScheme};
  h2.priority_mode = PriorityMode::kInHeaders;
  h2.priority = {0, 42, false};

  p.headers.user_agent =
      "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:133.0) Gecko/20100101 "
      "Firefox/133.0";
  p.headers.headers = {
      {"user-agent", p.headers.user_agent},
      {"accept",
       "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"},
      {"accept-language", "en-US,en;q=0.5"},
      {"accept-encoding", "gzip, deflate, br, zstd"},
      {"upgrade-insecure-requests", "1"},
      {"sec-fetch-dest", "document"},
      {"sec-fetch-mode", "navigate"},
      {"sec-fetch-site", "none"},
      {"sec-fetch-user", "?1"},
      {"priority", "u=0, i"},
      {"te", "trailers"},
  };
  return p;
}

ImpersonationProfile Safari17_5() {
  ImpersonationProfile p;
  p.name = "Safari17_5";

  TlsProfile& tls = p.tls;
  tls.cipher_suites = {G,      0x1301, 0x1302, 0x1303, 0xc02c, 0xc02b, 0xcca9,
                       0xc030, 0xc02f, 0xcca8, 0xc00a, 0xc009, 0xc014, 0xc013,
                       0x009d, 0x009c, 0x0035, 0x002f, 0xc008, 0xc012, 0x000a};
  tls.extensions = {G,  0,  23, 65281, 10, 11, 16, 5,
                    13, 18, 51, 45,    43, 27, 21, G};
  tls.supported_groups = {G, 0x001d, 0x0017, 0x0018, 0x0019};
  tls.key_share_groups = {G, 0x001d};
  tls.signature_algorithms = {0x0403, 0x0804, 0x0401, 0x0503, 0x0203,
                              0x0805, 0x0501, 0x0806, 0x0601, 0x0201};
  tls.supported_versions = {G, version::kTls13, version::kTls12,
                            version::kTls11, version::kTls10};
  tls.psk_modes = {1};
  tls.alpn_protocols = {"h2", "http/1.1"};
  tls.cert_compression = {CertCompression::kZlib};
  tls.min_version = version::kTls10;
  tls.max_version = version::kTls13;

  Http2Profile& h2 = p.http2;
  h2.settings = {
      {h2setting::kEnablePush, 0},
      {h2setting::kInitialWindowSize, 4194304},
      {h2setting::kMaxConcurrentStreams, 100},
  };
  h2.connection_window_increment = 10485760;
  h2.pseudo_header_order = {PseudoHeader::kMethod, PseudoHeader::kScheme,
                            PseudoHeader::kPath, PseudoHeader::kAuthority};

  p.headers.user_agent =
      "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 "
      "(KHTML, like Gecko) Version/17.5 Safari/605.1.15";
  p.headers.headers = {
      {"accept",
       "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8"},
      {"sec-fetch-site", "none"},
      {"accept-encoding", "gzip, deflate, br"},
      {"sec-fetch-mode", "navigate"},
      {"user-agent", p.headers.user_agent},
      {"accept-language", "en-US,en;q=0.9"},
      {"sec-fetch-dest", "document"},
  };
  return p;
}

ImpersonationProfile OkHttp4Android13() {
  ImpersonationProfile p;
  p.name = "OkHttp4Android13";

  TlsProfile& tls = p.tls;
  tls.cipher_suites = {0x1301, 0x1302, 0x1303, 0xc02b, 0xc02c,
                       0xcca9, 0xc02f, 0xc030, 0xcca8, 0xc013,
                       0xc014, 0x009c, 0x009d, 0x002f, 0x0035};
  tls.extensions = {0, 23, 65281, 10, 11, 35, 16, 5, 13, 51, 45, 43, 21, 41};
  tls.supported_groups = {0x001d, 0x0017, 0x0018};
  tls.key_share_groups = {0x001d};
  tls.signature_algorithms = {0x0403, 0x0804, 0x0401, 0x0503, 0x0805,
                              0x0501, 0x0806, 0x0601, 0x0201};
  tls.supported_versions = {version::kTls13, version::kTls12};
  tls.psk_modes = {1};
  tls.alpn_protocols = {"h2", "http/1.1"};
  tls.min_version = version::kTls12;
  tls.max_version = version::kTls13;

  Http2Profile& h2 = p.http2;
  h2.settings = {
      {h2setting::kInitialWindowSize, 16777216},
  };
  h2.connection_window_increment = 16711681;
  h2.pseudo_header_order = {PseudoHeader::kMethod, PseudoHeader::kPath,
                            PseudoHeader::kAuthority, PseudoHeader::kScheme};

  p.headers.user_agent = "okhttp/4.12.0";
  p.headers.headers = {
      {"accept-encoding", "gzip"},
      {"user-agent", p.headers.user_agent},
  };
  p.headers.http1_title_case = false;
  return p;
}

}  // namespace

std::vector<ImpersonationProfile> BuiltinProfiles() {
  std::vector<ImpersonationProfile> profiles;
  profiles.push_back(Chrome124());
  profiles.push_back(Chrome131());
  profiles.push_back(Chrome143());
  profiles.push_back(Edge131());
  profiles.push_back(Firefox133());
  profiles.push_back(Safari17_5());
  profiles.push_back(OkHttp4Android13());
  return profiles;
}

}  // namespace profile
}  // namespace guise
