// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/http2/h2_stream.h"

#include <algorithm>
#include <charconv>
#include <cstring>

namespace guise {
namespace http2 {

H2Stream::H2Stream(int32_t stream_id, H2StreamCallbacks callbacks,
                   std::string body)
    : stream_id_(stream_id),
      callbacks_(std::move(callbacks)),
      body_(std::move(body)) {}

H2Stream::~H2Stream() = default;

void H2Stream::BeginHeaders() {
  pending_status_ = 0;
  pending_headers_.clear();
}

void H2Stream::AddHeader(std::string_view name, std::string_view value) {
  if (name == ":status") {
    int status = 0;
    std::from_chars(value.data(), value.data() + value.size(), status);
    pending_status_ = status;
    return;
  }
  if (!name.empty() && name[0] == ':') {
    return;
  }
  pending_headers_.push_back({std::string(name), std::string(value)});
}

void H2Stream::OnHeadersComplete() {
  // Trailers carry no :status; fold them into the response headers
  if (pending_status_ == 0) {
    for (auto& h : pending_headers_) {
      response_headers_.push_back(std::move(h));
    }
    pending_headers_.clear();
    return;
  }

  // Interim 1xx responses are dropped
  if (pending_status_ >= 100 && pending_status_ < 200) {
    pending_headers_.clear();
    return;
  }

  status_code_ = pending_status_;
  response_headers_ = std::move(pending_headers_);
  pending_headers_.clear();
  if (callbacks_.on_headers) {
    callbacks_.on_headers(stream_id_, status_code_, response_headers_);
  }
}

void H2Stream::OnDataReceived(const uint8_t* data, size_t len) {
  if (callbacks_.on_data) {
    callbacks_.on_data(stream_id_, data, len);
  }
}

void H2Stream::OnStreamClose(uint32_t error_code) {
  if (state_ == H2StreamState::kClosed) {
    return;
  }
  state_ = H2StreamState::kClosed;
  if (callbacks_.on_close) {
    callbacks_.on_close(stream_id_, error_code);
  }
}

size_t H2Stream::ReadBody(uint8_t* dest, size_t len, bool* eof) {
  size_t n = std::min(len, body_.size() - body_offset_);
  if (n > 0) {
    std::memcpy(dest, body_.data() + body_offset_, n);
    body_offset_ += n;
  }
  *eof = body_offset_ == body_.size();
  return n;
}

}  // namespace http2
}  // namespace guise
