// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_TLS_TLS_IDS_H_
#define GUISE_TLS_TLS_IDS_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace guise {
namespace tls {

// Wire ids to the names BoringSSL's string configuration APIs accept.
// Unknown ids map to "".
std::string_view CipherSuiteName(uint16_t id);
std::string_view GroupName(uint16_t id);
std::string_view SignatureAlgorithmName(uint16_t id);

// Colon-joined name lists. GREASE placeholders are skipped (the engine adds
// its own), unknown ids are appended to `unknown` when given.
std::string CipherListString(const std::vector<uint16_t>& ids,
                             std::vector<uint16_t>* unknown = nullptr);
std::string GroupListString(const std::vector<uint16_t>& ids,
                            std::vector<uint16_t>* unknown = nullptr);
std::string SignatureAlgorithmListString(const std::vector<uint16_t>& ids);

}  // namespace tls
}  // namespace guise

#endif  // GUISE_TLS_TLS_IDS_H_
