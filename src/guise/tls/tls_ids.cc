// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/tls/tls_ids.h"

#include "guise/tls/grease.h"

namespace guise {
namespace tls {

std::string_view CipherSuiteName(uint16_t id) {
  switch (id) {
    // TLS 1.3
    case 0x1301:
      return "TLS_AES_128_GCM_SHA256";
    case 0x1302:
      return "TLS_AES_256_GCM_SHA384";
    case 0x1303:
      return "TLS_CHACHA20_POLY1305_SHA256";
    // TLS 1.2 ECDHE AEAD
    case 0xc02b:
      return "ECDHE-ECDSA-AES128-GCM-SHA256";
    case 0xc02f:
      return "ECDHE-RSA-AES128-GCM-SHA256";
    case 0xc02c:
      return "ECDHE-ECDSA-AES256-GCM-SHA384";
    case 0xc030:
      return "ECDHE-RSA-AES256-GCM-SHA384";
    case 0xcca9:
      return "ECDHE-ECDSA-CHACHA20-POLY1305";
    case 0xcca8:
      return "ECDHE-RSA-CHACHA20-POLY1305";
    // CBC fallbacks
    case 0xc009:
      return "ECDHE-ECDSA-AES128-SHA";
    case 0xc00a:
      return "ECDHE-ECDSA-AES256-SHA";
    case 0xc013:
      return "ECDHE-RSA-AES128-SHA";
    case 0xc014:
      return "ECDHE-RSA-AES256-SHA";
    case 0x009c:
      return "AES128-GCM-SHA256";
    case 0x009d:
      return "AES256-GCM-SHA384";
    case 0x002f:
      return "AES128-SHA";
    case 0x0035:
      return "AES256-SHA";
    // 3DES, still offered by Safari
    case 0xc008:
      return "ECDHE-ECDSA-DES-CBC3-SHA";
    case 0xc012:
      return "ECDHE-RSA-DES-CBC3-SHA";
    case 0x000a:
      return "DES-CBC3-SHA";
    default:
      return "";
  }
}

std::string_view GroupName(uint16_t id) {
  switch (id) {
    case 0x11ec:
      return "X25519MLKEM768";
    case 0x6399:
      return "X25519Kyber768Draft00";
    case 0x001d:
      return "X25519";
    case 0x0017:
      return "P-256";
    case 0x0018:
      return "P-384";
    case 0x0019:
      return "P-521";
    case 0x0100:
      return "ffdhe2048";
    case 0x0101:
      return "ffdhe3072";
    default:
      return "";
  }
}

std::string_view SignatureAlgorithmName(uint16_t id) {
  switch (id) {
    case 0x0403:
      return "ecdsa_secp256r1_sha256";
    case 0x0503:
      return "ecdsa_secp384r1_sha384";
    case 0x0603:
      return "ecdsa_secp521r1_sha512";
    case 0x0804:
      return "rsa_pss_rsae_sha256";
    case 0x0805:
      return "rsa_pss_rsae_sha384";
    case 0x0806:
      return "rsa_pss_rsae_sha512";
    case 0x0401:
      return "rsa_pkcs1_sha256";
    case 0x0501:
      return "rsa_pkcs1_sha384";
    case 0x0601:
      return "rsa_pkcs1_sha512";
    case 0x0203:
      return "ecdsa_sha1";
    case 0x0201:
      return "rsa_pkcs1_sha1";
    default:
      return "";
  }
}

namespace {

template <typename NameFn>
std::string JoinNames(const std::vector<uint16_t>& ids, NameFn name_of,
                      std::vector<uint16_t>* unknown) {
  std::string out;
  out.reserve(ids.size() * 24);
  for (uint16_t id : ids) {
    if (IsGreaseValue(id)) continue;
    std::string_view name = name_of(id);
    if (name.empty()) {
      if (unknown != nullptr) unknown->push_back(id);
      continue;
    }
    if (!out.empty()) out += ':';
    out += name;
  }
  return out;
}

}  // namespace

std::string CipherListString(const std::vector<uint16_t>& ids,
                             std::vector<uint16_t>* unknown) {
  return JoinNames(ids, CipherSuiteName, unknown);
}

std::string GroupListString(const std::vector<uint16_t>& ids,
                            std::vector<uint16_t>* unknown) {
  return JoinNames(ids, GroupName, unknown);
}

std::string SignatureAlgorithmListString(const std::vector<uint16_t>& ids) {
  return JoinNames(ids, SignatureAlgorithmName, nullptr);
}

}  // namespace tls
}  // namespace guise
