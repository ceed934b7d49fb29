// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/tls/tls_connection.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

#include <algorithm>

#include "guise/tls/session_cache.h"

namespace guise {
namespace tls {

namespace {

// Bytes the BIO pair buffers in each direction
constexpr size_t kBioPairBufferSize = 64 * 1024;

}  // namespace

TlsConnection::TlsConnection(TlsContext* context, std::string session_key)
    : context_(context), session_key_(std::move(session_key)) {}

TlsConnection::~TlsConnection() = default;

bool TlsConnection::CreateSsl(const ClientHelloPlan& plan) {
  if (state_ != TlsState::kInit) {
    SetError("TLS connection already attached");
    return false;
  }

  std::string error;
  ssl_.reset(context_->CreateSsl(plan, &error));
  if (!ssl_) {
    SetError(error);
    return false;
  }

  // new_session_cb reads the cache key from here
  SSL_set_ex_data(ssl_.get(), GetSessionKeyIndex(),
                  const_cast<std::string*>(&session_key_));

  if (plan.offers_psk) {
    if (TlsSessionCache* cache = context_->session_cache()) {
      SSL_SESSION* cached = cache->Lookup(session_key_);
      if (cached != nullptr) {
        SSL_set_session(ssl_.get(), cached);
        SSL_SESSION_free(cached);  // SSL_set_session took its own reference
      }
    }
  }
  return true;
}

bool TlsConnection::Attach(const ClientHelloPlan& plan, util::socket_t fd) {
  if (!CreateSsl(plan)) {
    return false;
  }
  if (SSL_set_fd(ssl_.get(), fd) != 1) {
    SetError("Failed to set SSL fd");
    return false;
  }
  state_ = TlsState::kHandshaking;
  return true;
}

bool TlsConnection::AttachBuffered(const ClientHelloPlan& plan) {
  if (!CreateSsl(plan)) {
    return false;
  }

  BIO* internal_bio = nullptr;
  BIO* network_bio = nullptr;
  if (BIO_new_bio_pair(&internal_bio, kBioPairBufferSize, &network_bio,
                       kBioPairBufferSize) != 1) {
    SetError("Failed to create BIO pair");
    return false;
  }
  // The SSL takes ownership of the internal side
  SSL_set_bio(ssl_.get(), internal_bio, internal_bio);
  network_bio_.reset(network_bio);

  state_ = TlsState::kHandshaking;
  return true;
}

TlsResult TlsConnection::DoHandshake() {
  if (state_ == TlsState::kConnected) {
    return TlsResult::kOk;
  }
  if (state_ != TlsState::kHandshaking) {
    SetError("Invalid state for handshake");
    return TlsResult::kError;
  }

  ERR_clear_error();
  int ret = SSL_do_handshake(ssl_.get());
  if (ret == 1) {
    state_ = TlsState::kConnected;
    SPDLOG_DEBUG("TLS handshake done, version {} alpn '{}' resumed {}",
                 SSL_get_version(ssl_.get()), AlpnProtocol(),
                 SessionResumed());
    return TlsResult::kOk;
  }
  return HandleSslError(ret);
}

ssize_t TlsConnection::ReadRaw(uint8_t* dest, size_t max_len,
                               TlsResult* result) {
  if (state_ != TlsState::kConnected) {
    *result = TlsResult::kError;
    return -1;
  }

  ERR_clear_error();
  int ret = SSL_read(ssl_.get(), dest, static_cast<int>(max_len));
  if (ret > 0) {
    *result = TlsResult::kOk;
    return ret;
  }

  *result = HandleSslError(ret);
  if (*result == TlsResult::kEof) {
    return 0;
  }
  return -1;
}

TlsResult TlsConnection::Write(const uint8_t* data, size_t len,
                               size_t* written) {
  *written = 0;
  if (state_ != TlsState::kConnected) {
    return TlsResult::kError;
  }

  // One record-sized write per call so large bodies do not hog the loop
  ERR_clear_error();
  int to_write = static_cast<int>(std::min(len, size_t{16384}));
  int ret = SSL_write(ssl_.get(), data, to_write);
  if (ret > 0) {
    *written = static_cast<size_t>(ret);
    return (*written < len) ? TlsResult::kWantWrite : TlsResult::kOk;
  }
  return HandleSslError(ret);
}

TlsResult TlsConnection::Shutdown() {
  if (state_ == TlsState::kClosed) {
    return TlsResult::kOk;
  }
  if (state_ != TlsState::kConnected && state_ != TlsState::kShuttingDown) {
    return TlsResult::kError;
  }

  state_ = TlsState::kShuttingDown;
  ERR_clear_error();

  // Send close_notify only; the peer's reply is not awaited
  int ret = SSL_shutdown(ssl_.get());
  if (ret >= 0) {
    state_ = TlsState::kClosed;
    return TlsResult::kOk;
  }

  TlsResult result = HandleSslError(ret);
  if (result == TlsResult::kEof) {
    state_ = TlsState::kClosed;
    return TlsResult::kOk;
  }
  return result;
}

bool TlsConnection::IsUsable() const {
  if (state_ != TlsState::kConnected) {
    return false;
  }
  return (SSL_get_shutdown(ssl_.get()) & SSL_RECEIVED_SHUTDOWN) == 0;
}

std::string_view TlsConnection::AlpnProtocol() const {
  if (!alpn_protocol_.empty()) {
    return alpn_protocol_;
  }
  if (state_ != TlsState::kConnected) {
    return "";
  }

  const unsigned char* proto = nullptr;
  unsigned int proto_len = 0;
  SSL_get0_alpn_selected(ssl_.get(), &proto, &proto_len);
  if (proto != nullptr && proto_len > 0) {
    alpn_protocol_.assign(reinterpret_cast<const char*>(proto), proto_len);
  }
  return alpn_protocol_;
}

bool TlsConnection::SessionResumed() const {
  if (state_ != TlsState::kConnected) {
    return false;
  }
  return SSL_session_reused(ssl_.get()) != 0;
}

TlsResult TlsConnection::HandleSslError(int ssl_ret) {
  int err = SSL_get_error(ssl_.get(), ssl_ret);

  switch (err) {
    case SSL_ERROR_WANT_READ:
      return TlsResult::kWantRead;

    case SSL_ERROR_WANT_WRITE:
      return TlsResult::kWantWrite;

    case SSL_ERROR_ZERO_RETURN:
      state_ = TlsState::kClosed;
      return TlsResult::kEof;

    case SSL_ERROR_SYSCALL: {
      if (ssl_ret == 0 || errno == 0) {
        SetError("connection closed by peer");
        return TlsResult::kEof;
      }
      SetError("SSL syscall error: " + util::GetLastSocketErrorString());
      return TlsResult::kError;
    }

    case SSL_ERROR_SSL: {
      uint32_t openssl_err = ERR_get_error();
      char err_buf[256];
      ERR_error_string_n(openssl_err, err_buf, sizeof(err_buf));
      SetError(std::string("SSL error: ") + err_buf);
      return TlsResult::kError;
    }

    default:
      SetError("Unknown SSL error " + std::to_string(err));
      return TlsResult::kError;
  }
}

void TlsConnection::SetError(const std::string& msg) {
  state_ = TlsState::kError;
  last_error_ = msg;
}

}  // namespace tls
}  // namespace guise
