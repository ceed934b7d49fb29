// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_TLS_TLS_CONTEXT_H_
#define GUISE_TLS_TLS_CONTEXT_H_

#include <openssl/ssl.h>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "guise/config.h"
#include "guise/error.h"
#include "guise/profile/impersonation_profile.h"
#include "guise/tls/client_hello_builder.h"
#include "guise/tls/session_cache.h"

namespace guise {
namespace tls {

struct SslCtxDeleter {
  void operator()(SSL_CTX* ctx) {
    if (ctx != nullptr) {
      SSL_CTX_free(ctx);
    }
  }
};

using SslCtxPtr = std::unique_ptr<SSL_CTX, SslCtxDeleter>;

// SSL_CTX configured with one profile's context-wide fingerprint: cipher
// list, groups, signature algorithms, extension order, certificate
// compression, version range. Per-handshake settings come from a
// ClientHelloPlan in CreateSsl(). Thread-safe for concurrent CreateSsl().
class TlsContext {
 public:
  // Throws std::runtime_error if the engine rejects the profile
  TlsContext(const profile::ImpersonationProfile& profile,
             const TlsConfig& config);
  ~TlsContext();

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;
  TlsContext(TlsContext&&) = delete;
  TlsContext& operator=(TlsContext&&) = delete;

  SSL_CTX* ctx() const { return ctx_.get(); }
  const profile::ImpersonationProfile& profile() const { return profile_; }

  // nullptr when session resumption is disabled
  TlsSessionCache* session_cache() const { return session_cache_.get(); }

  // New SSL with the plan's per-connection settings applied. The plan must
  // fit this context: its extensions in the configured order (minus any
  // the plan leaves out) and GREASE on exactly when the context sends it.
  // Returns nullptr and sets *error on failure.
  SSL* CreateSsl(const ClientHelloPlan& plan, std::string* error);

  // Configured extension order without GREASE
  const std::vector<uint16_t>& extension_order() const {
    return extension_order_;
  }
  bool grease_enabled() const { return grease_enabled_; }

 private:
  bool CheckPlan(const ClientHelloPlan& plan, std::string* error) const;

  void ConfigureVersions();
  void ConfigureCipherSuites();
  void ConfigureSupportedGroups();
  void ConfigureExtensions();
  void ConfigureCertCompression();
  void ConfigureSessionCache();
  void ConfigureCertificateVerification();

  SslCtxPtr ctx_;
  const profile::ImpersonationProfile& profile_;
  TlsConfig config_;
  std::unique_ptr<TlsSessionCache> session_cache_;

  std::vector<uint16_t> extension_order_;
  bool grease_enabled_ = false;
};

// Lazily built TlsContext per profile name, shared by every reactor.
class TlsContextStore {
 public:
  explicit TlsContextStore(const TlsConfig& config);

  TlsContextStore(const TlsContextStore&) = delete;
  TlsContextStore& operator=(const TlsContextStore&) = delete;

  // Fails with kInternal if the engine cannot be configured for the profile.
  // `profile` must outlive the store (registry profiles do).
  Result<std::shared_ptr<TlsContext>> Get(
      const profile::ImpersonationProfile& profile);

  size_t size() const;

 private:
  TlsConfig config_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<TlsContext>, std::less<>> contexts_;
};

}  // namespace tls
}  // namespace guise

#endif  // GUISE_TLS_TLS_CONTEXT_H_
