// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_HTTP2_H2_STREAM_H_
#define GUISE_HTTP2_H2_STREAM_H_

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

#include "guise/types.h"

namespace guise {
namespace http2 {

enum class H2StreamState {
  kOpen,
  kHalfClosedLocal,   // we sent END_STREAM
  kClosed,
};

// A request as handed to the session. Pseudo-header values are ordered by
// the connection's preface; `headers` keep their order as given.
struct H2Request {
  std::string method;
  std::string authority;
  std::string scheme = "https";
  std::string path;
  Headers headers;
  std::string body;
};

struct H2StreamCallbacks {
  // Final (non-1xx) response headers
  std::function<void(int32_t stream_id, int status, const Headers& headers)>
      on_headers;

  std::function<void(int32_t stream_id, const uint8_t* data, size_t len)>
      on_data;

  // END_STREAM received, RST_STREAM, or session teardown. 0 = clean close.
  std::function<void(int32_t stream_id, uint32_t error_code)> on_close;
};

// One request/response exchange on a session.
class H2Stream {
 public:
  H2Stream(int32_t stream_id, H2StreamCallbacks callbacks, std::string body);
  ~H2Stream();

  H2Stream(const H2Stream&) = delete;
  H2Stream& operator=(const H2Stream&) = delete;
  H2Stream(H2Stream&&) = delete;
  H2Stream& operator=(H2Stream&&) = delete;

  int32_t stream_id() const { return stream_id_; }
  H2StreamState state() const { return state_; }
  int status_code() const { return status_code_; }
  const Headers& response_headers() const { return response_headers_; }

  // Header accumulation for the current HEADERS block
  void BeginHeaders();
  void AddHeader(std::string_view name, std::string_view value);
  void OnHeadersComplete();

  void OnDataReceived(const uint8_t* data, size_t len);
  void OnStreamClose(uint32_t error_code);

  // Copies up to `len` request body bytes. Sets *eof once exhausted.
  size_t ReadBody(uint8_t* dest, size_t len, bool* eof);
  bool has_body() const { return !body_.empty(); }

  void MarkLocalClosed() { state_ = H2StreamState::kHalfClosedLocal; }

  // Set once a trailing PRIORITY frame was queued for this stream
  bool priority_sent = false;

 private:
  int32_t stream_id_;
  H2StreamState state_ = H2StreamState::kOpen;
  H2StreamCallbacks callbacks_;

  std::string body_;
  size_t body_offset_ = 0;

  int status_code_ = 0;
  int pending_status_ = 0;
  Headers pending_headers_;
  Headers response_headers_;
};

}  // namespace http2
}  // namespace guise

#endif  // GUISE_HTTP2_H2_STREAM_H_
