// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/tls/tls_context.h"

#include <brotli/decode.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <spdlog/spdlog.h>
#include <zlib.h>
#include <zstd.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "guise/tls/grease.h"
#include "guise/tls/tls_ids.h"

namespace guise {
namespace tls {

namespace {

// Certificate decompression callbacks (RFC 8879). Clients only decompress.

int BrotliDecompressCert(SSL* /*ssl*/, CRYPTO_BUFFER** out,
                         size_t uncompressed_len, const uint8_t* in,
                         size_t in_len) {
  // Reused across handshakes on the same thread
  thread_local std::vector<uint8_t> buf;
  buf.resize(uncompressed_len);
  size_t decoded_size = uncompressed_len;

  BrotliDecoderResult result =
      BrotliDecoderDecompress(in_len, in, &decoded_size, buf.data());
  if (result != BROTLI_DECODER_RESULT_SUCCESS ||
      decoded_size != uncompressed_len) {
    return 0;
  }

  *out = CRYPTO_BUFFER_new(buf.data(), decoded_size, nullptr);
  return *out != nullptr ? 1 : 0;
}

int ZlibDecompressCert(SSL* /*ssl*/, CRYPTO_BUFFER** out,
                       size_t uncompressed_len, const uint8_t* in,
                       size_t in_len) {
  thread_local std::vector<uint8_t> buf;
  buf.resize(uncompressed_len);
  uLongf decoded_size = static_cast<uLongf>(uncompressed_len);

  int result = uncompress(buf.data(), &decoded_size, in,
                          static_cast<uLong>(in_len));
  if (result != Z_OK || decoded_size != uncompressed_len) {
    return 0;
  }

  *out = CRYPTO_BUFFER_new(buf.data(), decoded_size, nullptr);
  return *out != nullptr ? 1 : 0;
}

int ZstdDecompressCert(SSL* /*ssl*/, CRYPTO_BUFFER** out,
                       size_t uncompressed_len, const uint8_t* in,
                       size_t in_len) {
  thread_local std::vector<uint8_t> buf;
  buf.resize(uncompressed_len);

  size_t decoded_size =
      ZSTD_decompress(buf.data(), uncompressed_len, in, in_len);
  if (ZSTD_isError(decoded_size) || decoded_size != uncompressed_len) {
    return 0;
  }

  *out = CRYPTO_BUFFER_new(buf.data(), decoded_size, nullptr);
  return *out != nullptr ? 1 : 0;
}

// Called when the server sends NewSessionTicket
int NewSessionCallback(SSL* ssl, SSL_SESSION* session) {
  SSL_CTX* ctx = SSL_get_SSL_CTX(ssl);
  auto* cache = static_cast<TlsSessionCache*>(
      SSL_CTX_get_ex_data(ctx, GetSessionCacheIndex()));
  if (cache == nullptr) {
    return 0;
  }

  auto* key =
      static_cast<const std::string*>(SSL_get_ex_data(ssl, GetSessionKeyIndex()));
  if (key == nullptr || key->empty()) {
    return 0;
  }

  cache->Store(*key, session);
  SPDLOG_TRACE("stored session ticket, lifetime {}s",
               SSL_SESSION_get_timeout(session));

  // 0: the library keeps ownership of the session
  return 0;
}

bool HasExtension(const profile::TlsProfile& tls, uint16_t type) {
  return std::find(tls.extensions.begin(), tls.extensions.end(), type) !=
         tls.extensions.end();
}

// Profile extension order without GREASE: the engine places GREASE itself
std::vector<uint16_t> ExtensionOrder(const profile::TlsProfile& tls) {
  std::vector<uint16_t> out;
  for (uint16_t id : tls.extensions) {
    if (id != profile::kGreasePlaceholder) out.push_back(id);
  }
  return out;
}

std::string DashJoin(const std::vector<uint16_t>& ids) {
  std::string out;
  for (uint16_t id : ids) {
    if (!out.empty()) out += '-';
    out += std::to_string(id);
  }
  return out;
}

std::string JoinIds(const std::vector<uint16_t>& ids) {
  std::string out;
  for (uint16_t id : ids) {
    if (!out.empty()) out += ',';
    out += std::to_string(id);
  }
  return out;
}

std::string LastSslError() {
  uint32_t err = ERR_get_error();
  if (err == 0) return "unknown error";
  char buf[256];
  ERR_error_string_n(err, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

}  // namespace

TlsContext::TlsContext(const profile::ImpersonationProfile& profile,
                       const TlsConfig& config)
    : profile_(profile), config_(config) {
  ctx_.reset(SSL_CTX_new(TLS_method()));
  if (!ctx_) {
    throw std::runtime_error("Failed to create SSL_CTX");
  }

  ConfigureVersions();
  ConfigureCipherSuites();
  ConfigureSupportedGroups();
  ConfigureExtensions();
  ConfigureCertCompression();
  ConfigureSessionCache();
  ConfigureCertificateVerification();

  SPDLOG_DEBUG("TLS context ready for profile {}", profile_.name);
}

TlsContext::~TlsContext() = default;

bool TlsContext::CheckPlan(const ClientHelloPlan& plan,
                           std::string* error) const {
  bool plan_grease = std::any_of(
      plan.extensions.begin(), plan.extensions.end(),
      [](const PlannedExtension& e) { return e.grease; });
  if (plan_grease != grease_enabled_) {
    *error = "plan GREASE does not match context for " + profile_.name;
    return false;
  }
  if (plan.permute_extensions != profile_.tls.permute_extensions) {
    *error = "plan permutation does not match context for " + profile_.name;
    return false;
  }

  // Plan ids must appear in the configured order; absent ones (SNI for IP
  // literals, PSK without a ticket) are simply not sent
  auto next = extension_order_.begin();
  for (const auto& e : plan.extensions) {
    if (e.grease) continue;
    next = std::find(next, extension_order_.end(), e.type);
    if (next == extension_order_.end()) {
      *error = "plan extension order " + plan.ExtensionOrderString() +
               " does not fit context order " + DashJoin(extension_order_);
      return false;
    }
    ++next;
  }
  return true;
}

SSL* TlsContext::CreateSsl(const ClientHelloPlan& plan, std::string* error) {
  if (!CheckPlan(plan, error)) {
    return nullptr;
  }

  SSL* ssl = SSL_new(ctx_.get());
  if (ssl == nullptr) {
    *error = "SSL_new: " + LastSslError();
    return nullptr;
  }

  auto fail = [&](const std::string& what) {
    *error = what + ": " + LastSslError();
    SSL_free(ssl);
    return nullptr;
  };

  if (!plan.server_name.empty() &&
      SSL_set_tlsext_host_name(ssl, plan.server_name.c_str()) != 1) {
    return fail("SNI " + plan.server_name);
  }

  if (!plan.alpn_protocols.empty()) {
    std::vector<uint8_t> wire = plan.AlpnWire();
    // Unlike most of the API, SSL_set_alpn_protos returns 0 on success
    if (SSL_set_alpn_protos(ssl, wire.data(),
                            static_cast<unsigned>(wire.size())) != 0) {
      return fail("ALPN");
    }
  }

  // Application settings (ALPS) for every protocol the profile declares
  if (!plan.alps_protocols.empty()) {
    SSL_set_alps_use_new_codepoint(
        ssl, plan.alps_codepoint == profile::ext::kApplicationSettings ? 1 : 0);
    for (const auto& proto : plan.alps_protocols) {
      if (SSL_add_application_settings(
              ssl, reinterpret_cast<const uint8_t*>(proto.data()),
              proto.size(), nullptr, 0) != 1) {
        return fail("ALPS " + proto);
      }
    }
  }

  // The context's extension order wins over permutation
  if (plan.permute_extensions) {
    SSL_set_permute_extensions(ssl, 1);
  }

  SSL_set_key_shares_limit(ssl, plan.KeyShareCount());

  if (plan.ech_grease) {
    SSL_set_enable_ech_grease(ssl, 1);
  }

  if (plan.record_size_limit != 0) {
    SSL_set_record_size_limit(ssl, plan.record_size_limit);
  }

  SSL_set_connect_state(ssl);
  return ssl;
}

void TlsContext::ConfigureVersions() {
  const auto& tls = profile_.tls;
  if (SSL_CTX_set_min_proto_version(ctx_.get(), tls.min_version) != 1 ||
      SSL_CTX_set_max_proto_version(ctx_.get(), tls.max_version) != 1) {
    throw std::runtime_error("Failed to set TLS version range for " +
                             profile_.name);
  }
}

void TlsContext::ConfigureCipherSuites() {
  std::vector<uint16_t> unknown;
  std::string ciphers = CipherListString(profile_.tls.cipher_suites, &unknown);
  if (!unknown.empty()) {
    throw std::runtime_error("Profile " + profile_.name +
                             " lists cipher suites the engine cannot name: " +
                             JoinIds(unknown));
  }

  // BoringSSL takes TLS 1.2 and 1.3 suites through the same call
  if (SSL_CTX_set_cipher_list(ctx_.get(), ciphers.c_str()) != 1) {
    throw std::runtime_error("Failed to set cipher suites: " + LastSslError());
  }
}

void TlsContext::ConfigureSupportedGroups() {
  std::vector<uint16_t> unknown;
  std::string groups =
      GroupListString(profile_.tls.supported_groups, &unknown);
  if (!unknown.empty()) {
    throw std::runtime_error("Profile " + profile_.name +
                             " lists groups the engine cannot name: " +
                             JoinIds(unknown));
  }

  if (SSL_CTX_set1_groups_list(ctx_.get(), groups.c_str()) != 1) {
    throw std::runtime_error("Failed to set groups '" + groups +
                             "': " + LastSslError());
  }
}

void TlsContext::ConfigureExtensions() {
  const auto& tls = profile_.tls;

  // GREASE (RFC 8701). The engine places it (first and last extension,
  // first in each id list) and draws fresh values per handshake; the
  // ClientHello builder rejects profiles laid out any other way.
  grease_enabled_ = HasExtension(tls, profile::kGreasePlaceholder);
  SSL_CTX_set_grease_enabled(ctx_.get(), grease_enabled_ ? 1 : 0);

  // A fixed order for fingerprints captured in a stable order; permuting
  // profiles leave the order to the engine's per-connection shuffle
  extension_order_ = ExtensionOrder(tls);
  if (tls.permute_extensions) {
    SSL_CTX_set_permute_extensions(ctx_.get(), 1);
  } else {
    std::string order = DashJoin(extension_order_);
    if (SSL_CTX_set_extension_order(ctx_.get(), order.data()) != 1) {
      throw std::runtime_error("Failed to set extension order " + order);
    }
  }

  if (!tls.signature_algorithms.empty() &&
      SSL_CTX_set_verify_algorithm_prefs(ctx_.get(),
                                         tls.signature_algorithms.data(),
                                         tls.signature_algorithms.size()) !=
          1) {
    throw std::runtime_error("Failed to set signature algorithms: " +
                             LastSslError());
  }

  if (HasExtension(tls, profile::ext::kStatusRequest)) {
    SSL_CTX_enable_ocsp_stapling(ctx_.get());
  }
  if (HasExtension(tls, profile::ext::kSignedCertTimestamp)) {
    SSL_CTX_enable_signed_cert_timestamps(ctx_.get());
  }

  if (!tls.delegated_credentials.empty()) {
    std::string algs = SignatureAlgorithmListString(tls.delegated_credentials);
    if (SSL_CTX_set_delegated_credentials(ctx_.get(), algs.c_str()) != 1) {
      throw std::runtime_error("Failed to set delegated credentials " + algs);
    }
  }
}

void TlsContext::ConfigureCertCompression() {
  for (profile::CertCompression alg : profile_.tls.cert_compression) {
    ssl_cert_decompression_func_t decompress = nullptr;
    switch (alg) {
      case profile::CertCompression::kZlib:
        decompress = ZlibDecompressCert;
        break;
      case profile::CertCompression::kBrotli:
        decompress = BrotliDecompressCert;
        break;
      case profile::CertCompression::kZstd:
        decompress = ZstdDecompressCert;
        break;
    }
    // Order of registration is the order advertised
    if (SSL_CTX_add_cert_compression_alg(ctx_.get(),
                                         static_cast<uint16_t>(alg), nullptr,
                                         decompress) != 1) {
      throw std::runtime_error("Failed to add certificate compression alg " +
                               std::to_string(static_cast<uint16_t>(alg)));
    }
  }
}

void TlsContext::ConfigureSessionCache() {
  if (!config_.enable_session_cache) {
    SSL_CTX_set_session_cache_mode(ctx_.get(), SSL_SESS_CACHE_OFF);
    return;
  }

  // External cache only, as Chrome's SSLClientSocketImpl does
  SSL_CTX_set_session_cache_mode(
      ctx_.get(), SSL_SESS_CACHE_CLIENT | SSL_SESS_CACHE_NO_INTERNAL_STORE);

  session_cache_ =
      std::make_unique<TlsSessionCache>(ctx_.get(), config_.session_cache_size);
  SSL_CTX_set_ex_data(ctx_.get(), GetSessionCacheIndex(), session_cache_.get());
  SSL_CTX_sess_set_new_cb(ctx_.get(), NewSessionCallback);

  if (config_.enable_early_data &&
      profile_.tls.max_version >= profile::version::kTls13) {
    SSL_CTX_set_early_data_enabled(ctx_.get(), 1);
  }
}

void TlsContext::ConfigureCertificateVerification() {
  if (!config_.verify_certificates) {
    SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_NONE, nullptr);
    return;
  }

  SSL_CTX_set_verify(ctx_.get(), SSL_VERIFY_PEER, nullptr);
  if (!config_.ca_bundle_path.empty()) {
    if (SSL_CTX_load_verify_locations(
            ctx_.get(), config_.ca_bundle_path.c_str(), nullptr) != 1) {
      throw std::runtime_error("Failed to load CA certificates from: " +
                               config_.ca_bundle_path);
    }
  } else if (SSL_CTX_set_default_verify_paths(ctx_.get()) != 1) {
    throw std::runtime_error("Failed to set default CA paths");
  }
}

// TlsContextStore

TlsContextStore::TlsContextStore(const TlsConfig& config) : config_(config) {}

Result<std::shared_ptr<TlsContext>> TlsContextStore::Get(
    const profile::ImpersonationProfile& profile) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = contexts_.find(profile.name);
  if (it != contexts_.end()) {
    return it->second;
  }

  try {
    auto context = std::make_shared<TlsContext>(profile, config_);
    contexts_.emplace(profile.name, context);
    return context;
  } catch (const std::runtime_error& e) {
    SPDLOG_ERROR("TLS context for {} failed: {}", profile.name, e.what());
    return Error::Internal(e.what());
  }
}

size_t TlsContextStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return contexts_.size();
}

}  // namespace tls
}  // namespace guise
