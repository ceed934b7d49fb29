// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/error.h"

namespace guise {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kUnknownProfile:
      return "unknown_profile";
    case ErrorCode::kInvalidProfile:
      return "invalid_profile";
    case ErrorCode::kUnsupportedTlsVersion:
      return "unsupported_tls_version";
    case ErrorCode::kDialFailed:
      return "dial_failed";
    case ErrorCode::kPoolExhausted:
      return "pool_exhausted";
    case ErrorCode::kPoolShutdown:
      return "pool_shutdown";
    case ErrorCode::kConnectionBroken:
      return "connection_broken";
    case ErrorCode::kRequestCancelled:
      return "request_cancelled";
    case ErrorCode::kRequestTimeout:
      return "request_timeout";
    case ErrorCode::kInvalidUrl:
      return "invalid_url";
    case ErrorCode::kH2Protocol:
      return "h2_protocol";
    case ErrorCode::kHttp1Protocol:
      return "http1_protocol";
    case ErrorCode::kInternal:
      return "internal";
  }
  return "unknown";
}

std::string_view DialStageName(DialStage stage) {
  switch (stage) {
    case DialStage::kNone:
      return "none";
    case DialStage::kResolve:
      return "resolve";
    case DialStage::kConnect:
      return "connect";
    case DialStage::kProxyConnect:
      return "proxy_connect";
    case DialStage::kTlsHandshake:
      return "tls_handshake";
    case DialStage::kAlpnMismatch:
      return "alpn_mismatch";
    case DialStage::kH2Preface:
      return "h2_preface";
  }
  return "unknown";
}

bool Error::IsRetryableNetwork() const {
  switch (code_) {
    case ErrorCode::kDialFailed:
      return stage_ == DialStage::kResolve || stage_ == DialStage::kConnect ||
             stage_ == DialStage::kProxyConnect ||
             stage_ == DialStage::kTlsHandshake;
    case ErrorCode::kConnectionBroken:
    case ErrorCode::kRequestTimeout:
      return true;
    default:
      return false;
  }
}

std::string Error::ToString() const {
  std::string out(ErrorCodeName(code_));
  if (code_ == ErrorCode::kDialFailed) {
    out += '[';
    out += DialStageName(stage_);
    out += ']';
  }
  if (!message_.empty()) {
    out += ": ";
    out += message_;
  }
  return out;
}

}  // namespace guise
