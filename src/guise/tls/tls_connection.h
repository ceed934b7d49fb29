// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_TLS_TLS_CONNECTION_H_
#define GUISE_TLS_TLS_CONNECTION_H_

#include <openssl/ssl.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "guise/tls/client_hello_builder.h"
#include "guise/tls/tls_context.h"
#include "guise/util/platform.h"

namespace guise {
namespace tls {

struct SslDeleter {
  void operator()(SSL* ssl) {
    if (ssl != nullptr) {
      SSL_free(ssl);
    }
  }
};

using SslPtr = std::unique_ptr<SSL, SslDeleter>;

struct BioDeleter {
  void operator()(BIO* bio) {
    if (bio != nullptr) {
      BIO_free(bio);
    }
  }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

enum class TlsState {
  kInit,
  kHandshaking,
  kConnected,
  kShuttingDown,
  kClosed,
  kError,
};

enum class TlsResult {
  kOk,
  kWantRead,
  kWantWrite,
  kEof,
  kError,
};

// Per-connection TLS client with non-blocking I/O. Runs either directly on
// a socket, or on a memory BIO pair whose network side the owner pumps
// (TLS inside a TLS tunnel to an HTTPS proxy).
class TlsConnection {
 public:
  // `session_key` scopes ticket storage and lookup in the context's cache
  TlsConnection(TlsContext* context, std::string session_key);
  ~TlsConnection();

  TlsConnection(const TlsConnection&) = delete;
  TlsConnection& operator=(const TlsConnection&) = delete;
  TlsConnection(TlsConnection&&) = delete;
  TlsConnection& operator=(TlsConnection&&) = delete;

  // Creates the SSL from `plan` and attaches it to the socket. If the plan
  // offers PSK, the cached session is installed. False on failure with
  // last_error() set.
  bool Attach(const ClientHelloPlan& plan, util::socket_t fd);

  // As Attach(), over a BIO pair. Ciphertext moves through network_bio().
  bool AttachBuffered(const ClientHelloPlan& plan);

  // Returns kOk when complete, kWantRead/kWantWrite when I/O needed
  TlsResult DoHandshake();

  // Returns bytes read, 0 on EOF, -1 on error or would block.
  // *result carries the outcome.
  ssize_t ReadRaw(uint8_t* dest, size_t max_len, TlsResult* result);

  // One SSL_write of at most 16KB. kWantWrite if data remains.
  TlsResult Write(const uint8_t* data, size_t len, size_t* written);

  TlsResult Shutdown();

  TlsState state() const { return state_; }
  bool IsConnected() const { return state_ == TlsState::kConnected; }
  bool HasError() const { return state_ == TlsState::kError; }

  // False once the peer sent close_notify or an error occurred
  bool IsUsable() const;

  const std::string& last_error() const { return last_error_; }

  // Negotiated ALPN protocol, empty if none
  std::string_view AlpnProtocol() const;
  bool IsHttp2() const { return AlpnProtocol() == "h2"; }

  // Only meaningful after the handshake completes
  bool SessionResumed() const;

  // Network side of the BIO pair, nullptr in socket mode
  BIO* network_bio() const { return network_bio_.get(); }

  SSL* ssl() const { return ssl_.get(); }
  const std::string& session_key() const { return session_key_; }

 private:
  bool CreateSsl(const ClientHelloPlan& plan);
  TlsResult HandleSslError(int ssl_ret);
  void SetError(const std::string& msg);

  TlsContext* context_;
  const std::string session_key_;

  SslPtr ssl_;
  BioPtr network_bio_;
  TlsState state_ = TlsState::kInit;
  std::string last_error_;

  mutable std::string alpn_protocol_;
};

}  // namespace tls
}  // namespace guise

#endif  // GUISE_TLS_TLS_CONNECTION_H_
