// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/http1/h1_session.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstring>

#include "guise/types.h"

namespace guise {
namespace http1 {

namespace {

constexpr size_t kMaxResponseHeaders = 100;


bool ContainsToken(std::string_view value, std::string_view token) {
  size_t pos = 0;
  while (pos <= value.size()) {
    size_t comma = value.find(',', pos);
    if (comma == std::string_view::npos) comma = value.size();
    std::string_view item = value.substr(pos, comma - pos);
    while (!item.empty() && item.front() == ' ') item.remove_prefix(1);
    while (!item.empty() && item.back() == ' ') item.remove_suffix(1);
    if (EqualsIgnoreCase(item, token)) return true;
    pos = comma + 1;
  }
  return false;
}

}  // namespace

std::string H1Session::TitleCase(std::string_view name) {
  std::string out(name);
  bool upper = true;
  for (char& c : out) {
    if (upper && c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 32);
    } else if (!upper && c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c + 32);
    }
    upper = (c == '-');
  }
  return out;
}

H1Session::H1Session(SessionCallbacks callbacks, bool title_case)
    : callbacks_(std::move(callbacks)), title_case_(title_case) {
  std::memset(&chunked_decoder_, 0, sizeof(chunked_decoder_));
}

H1Session::~H1Session() = default;

int32_t H1Session::SubmitRequest(const http2::H2Request& request,
                                 http2::H2StreamCallbacks stream_callbacks) {
  if (!CanSubmitRequest()) {
    last_error_ = "Cannot submit request while another is in flight";
    return -1;
  }

  current_stream_id_++;
  stream_callbacks_ = std::move(stream_callbacks);
  parse_state_ = ParseState::kParsingHeaders;
  head_request_ = request.method == "HEAD";

  status_code_ = 0;
  content_length_ = 0;
  body_received_ = 0;
  std::memset(&chunked_decoder_, 0, sizeof(chunked_decoder_));
  chunked_decoder_.consume_trailer = 1;
  recv_buffer_.clear();

  BuildRequest(request);
  return current_stream_id_;
}

void H1Session::BuildRequest(const http2::H2Request& request) {
  send_buffer_.clear();
  send_offset_ = 0;

  auto append = [this](std::string_view sv) {
    send_buffer_.insert(send_buffer_.end(), sv.begin(), sv.end());
  };
  auto append_header = [&](std::string_view name, std::string_view value) {
    if (title_case_) {
      append(TitleCase(name));
    } else {
      append(name);
    }
    append(": ");
    append(value);
    append("\r\n");
  };

  // Request line: METHOD PATH HTTP/1.1\r\n
  append(request.method);
  append(" ");
  append(request.path);
  append(" HTTP/1.1\r\n");

  bool has_host = false;
  bool has_connection = false;
  for (const auto& h : request.headers) {
    if (EqualsIgnoreCase(h.name, "host")) has_host = true;
    if (EqualsIgnoreCase(h.name, "connection")) has_connection = true;
  }

  if (!has_host) {
    append_header("host", request.authority);
  }

  // Content-Length keeps its caller-given position but always carries the
  // real body size; the session never sends chunked requests
  bool length_written = false;
  for (const auto& h : request.headers) {
    if (!h.name.empty() && h.name[0] == ':') continue;
    if (EqualsIgnoreCase(h.name, "transfer-encoding")) continue;
    if (EqualsIgnoreCase(h.name, "content-length")) {
      if (length_written) continue;
      append_header(h.name, std::to_string(request.body.size()));
      length_written = true;
      continue;
    }
    append_header(h.name, h.value);
  }

  if (!request.body.empty() && !length_written) {
    append_header("content-length", std::to_string(request.body.size()));
  }

  if (!has_connection) {
    append_header("connection", "keep-alive");
  }

  append("\r\n");
  append(request.body);
}

ssize_t H1Session::Receive(const uint8_t* data, size_t len) {
  if (fatal_error_) {
    return -1;
  }

  if (parse_state_ == ParseState::kIdle) {
    // Nothing in flight; stray bytes poison the connection
    if (len > 0) {
      keep_alive_ = false;
    }
    return static_cast<ssize_t>(len);
  }

  recv_buffer_.insert(recv_buffer_.end(), data, data + len);

  if (parse_state_ == ParseState::kParsingHeaders) {
    int result = ParseHeaders();
    if (result < 0) {
      SetError("Failed to parse HTTP response headers");
      CompleteRequest(kCloseMalformed);
      return -1;
    }
  }

  if (parse_state_ == ParseState::kParsingBody ||
      parse_state_ == ParseState::kParsingChunked ||
      parse_state_ == ParseState::kParsingUntilClose) {
    ParseBody();
  }

  return fatal_error_ ? -1 : static_cast<ssize_t>(len);
}

int H1Session::ParseHeaders() {
  // 1xx interim responses precede the final one
  while (true) {
    int minor_version;
    int status;
    const char* msg;
    size_t msg_len;
    phr_header headers[kMaxResponseHeaders];
    size_t num_headers = kMaxResponseHeaders;

    int pret = phr_parse_response(
        reinterpret_cast<const char*>(recv_buffer_.data()), recv_buffer_.size(),
        &minor_version, &status, &msg, &msg_len, headers, &num_headers, 0);
    if (pret == -2) {
      return 0;
    }
    if (pret == -1) {
      return -1;
    }

    if (status >= 100 && status < 200) {
      recv_buffer_.erase(recv_buffer_.begin(), recv_buffer_.begin() + pret);
      continue;
    }

    status_code_ = status;
    bool chunked = false;
    bool has_length = false;
    keep_alive_ = minor_version >= 1;

    Headers response_headers;
    response_headers.reserve(num_headers);
    for (size_t i = 0; i < num_headers; ++i) {
      std::string_view name(headers[i].name, headers[i].name_len);
      std::string_view value(headers[i].value, headers[i].value_len);
      response_headers.push_back({std::string(name), std::string(value)});

      if (EqualsIgnoreCase(name, "content-length")) {
        auto [ptr, ec] = std::from_chars(value.data(),
                                         value.data() + value.size(),
                                         content_length_);
        if (ec != std::errc() || ptr != value.data() + value.size()) {
          return -1;
        }
        has_length = true;
      } else if (EqualsIgnoreCase(name, "transfer-encoding")) {
        chunked = ContainsToken(value, "chunked");
      } else if (EqualsIgnoreCase(name, "connection")) {
        if (ContainsToken(value, "close")) keep_alive_ = false;
        if (ContainsToken(value, "keep-alive")) keep_alive_ = true;
      }
    }

    recv_buffer_.erase(recv_buffer_.begin(), recv_buffer_.begin() + pret);

    if (stream_callbacks_.on_headers) {
      stream_callbacks_.on_headers(current_stream_id_, status_code_,
                                   response_headers);
    }

    bool no_body = head_request_ || status_code_ == 204 || status_code_ == 304;
    if (no_body) {
      CompleteRequest();
    } else if (chunked) {
      parse_state_ = ParseState::kParsingChunked;
    } else if (has_length) {
      if (content_length_ == 0) {
        CompleteRequest();
      } else {
        parse_state_ = ParseState::kParsingBody;
      }
    } else {
      // Body runs to EOF; the connection cannot be reused
      keep_alive_ = false;
      parse_state_ = ParseState::kParsingUntilClose;
    }
    return 1;
  }
}

void H1Session::ParseBody() {
  if (recv_buffer_.empty()) {
    return;
  }

  if (parse_state_ == ParseState::kParsingBody) {
    size_t remaining = content_length_ - body_received_;
    size_t to_consume = std::min(remaining, recv_buffer_.size());

    if (to_consume > 0 && stream_callbacks_.on_data) {
      stream_callbacks_.on_data(current_stream_id_, recv_buffer_.data(),
                                to_consume);
    }

    body_received_ += to_consume;
    recv_buffer_.erase(recv_buffer_.begin(),
                       recv_buffer_.begin() +
                           static_cast<std::ptrdiff_t>(to_consume));

    if (body_received_ >= content_length_) {
      CompleteRequest();
    }
  } else if (parse_state_ == ParseState::kParsingChunked) {
    // Decoded in place; partial chunk headers live in the decoder state
    size_t buf_len = recv_buffer_.size();
    ssize_t pret = phr_decode_chunked(
        &chunked_decoder_, reinterpret_cast<char*>(recv_buffer_.data()),
        &buf_len);

    if (pret == -1) {
      SetError("Failed to decode chunked response");
      CompleteRequest(kCloseMalformed);
      return;
    }

    if (buf_len > 0 && stream_callbacks_.on_data) {
      stream_callbacks_.on_data(current_stream_id_, recv_buffer_.data(),
                                buf_len);
    }
    body_received_ += buf_len;
    recv_buffer_.clear();

    if (pret >= 0) {
      CompleteRequest();
    }
  } else if (parse_state_ == ParseState::kParsingUntilClose) {
    if (stream_callbacks_.on_data) {
      stream_callbacks_.on_data(current_stream_id_, recv_buffer_.data(),
                                recv_buffer_.size());
    }
    body_received_ += recv_buffer_.size();
    recv_buffer_.clear();
  }
}

void H1Session::OnPeerClosed(uint32_t error_code) {
  keep_alive_ = false;
  if (parse_state_ == ParseState::kParsingUntilClose) {
    CompleteRequest();
  } else if (parse_state_ != ParseState::kIdle) {
    SetError("Connection closed before response completed");
    CompleteRequest(error_code);
  }
}

void H1Session::Abort(uint32_t error_code) {
  if (parse_state_ != ParseState::kIdle) {
    keep_alive_ = false;
    CompleteRequest(error_code);
  }
}

void H1Session::CompleteRequest(uint32_t error_code) {
  // Reset first: on_close may submit the next request
  auto callbacks = std::move(stream_callbacks_);
  stream_callbacks_ = {};
  parse_state_ = ParseState::kIdle;

  SPDLOG_TRACE("h1 request {} complete: status={} body={} error={}",
               current_stream_id_, status_code_, body_received_, error_code);
  if (callbacks.on_close) {
    callbacks.on_close(current_stream_id_, error_code);
  }
}

std::pair<const uint8_t*, size_t> H1Session::GetPendingData() {
  if (send_offset_ >= send_buffer_.size()) {
    return {nullptr, 0};
  }
  return {send_buffer_.data() + send_offset_,
          send_buffer_.size() - send_offset_};
}

void H1Session::DataSent(size_t len) {
  send_offset_ += len;
  if (send_offset_ >= send_buffer_.size()) {
    send_buffer_.clear();
    send_offset_ = 0;
  }
}

bool H1Session::WantsWrite() const { return send_offset_ < send_buffer_.size(); }

bool H1Session::CanSubmitRequest() const {
  return !fatal_error_ && keep_alive_ && parse_state_ == ParseState::kIdle;
}

void H1Session::SetError(const std::string& msg) {
  fatal_error_ = true;
  keep_alive_ = false;
  last_error_ = msg;
  if (callbacks_.on_error) {
    callbacks_.on_error(-1, msg);
  }
}

}  // namespace http1
}  // namespace guise
