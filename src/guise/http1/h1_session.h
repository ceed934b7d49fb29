// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_HTTP1_H1_SESSION_H_
#define GUISE_HTTP1_H1_SESSION_H_

#include <picohttpparser.h>
#include <sys/types.h>

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "guise/http2/h2_stream.h"  // H2Request, H2StreamCallbacks

namespace guise {
namespace http1 {

// Codes H1Session passes to on_close
inline constexpr uint32_t kCloseNoError = 0;
inline constexpr uint32_t kCloseMalformed = 1;  // unparsable or truncated
inline constexpr uint32_t kCloseCancelled = 2;  // Abort() by the owner

// HTTP/1.1 session - request serialization and response parsing.
// No multiplexing - one request at a time.
class H1Session {
 public:
  struct SessionCallbacks {
    std::function<void(int error_code, const std::string& msg)> on_error;
  };

  // `title_case` writes header names as Title-Case ("Accept-Language")
  H1Session(SessionCallbacks callbacks, bool title_case);
  ~H1Session();

  H1Session(const H1Session&) = delete;
  H1Session& operator=(const H1Session&) = delete;
  H1Session(H1Session&&) = delete;
  H1Session& operator=(H1Session&&) = delete;

  // Headers are written in the order given. Host is put first and
  // Connection: keep-alive last when the caller did not supply them.
  // Returns the stream id (a per-session counter), -1 on error.
  int32_t SubmitRequest(const http2::H2Request& request,
                        http2::H2StreamCallbacks stream_callbacks);

  // Feed received data. Returns bytes consumed, or -1 on error.
  ssize_t Receive(const uint8_t* data, size_t len);

  // The peer closed the transport. Completes a read-until-close body,
  // fails any other request in flight with `error_code`.
  void OnPeerClosed(uint32_t error_code = kCloseMalformed);

  // Fails the request in flight, if any, with `error_code`
  void Abort(uint32_t error_code);

  std::pair<const uint8_t*, size_t> GetPendingData();
  void DataSent(size_t len);

  bool WantsWrite() const;
  bool CanSubmitRequest() const;
  bool InFlight() const { return parse_state_ != ParseState::kIdle; }

  // False once the server asked to close or framed the body by EOF
  bool KeepAlive() const { return keep_alive_; }
  bool IsAlive() const { return !fatal_error_; }
  const std::string& last_error() const { return last_error_; }

  // "accept-language" -> "Accept-Language"
  static std::string TitleCase(std::string_view name);

 private:
  enum class ParseState {
    kIdle,             // No request in flight
    kParsingHeaders,   // Waiting for headers to complete
    kParsingBody,      // Reading body with Content-Length
    kParsingChunked,   // Reading chunked body
    kParsingUntilClose,
  };

  void BuildRequest(const http2::H2Request& request);

  // Returns 1 when headers completed, 0 if incomplete, -1 on error
  int ParseHeaders();
  void ParseBody();
  void CompleteRequest(uint32_t error_code = kCloseNoError);
  void SetError(const std::string& msg);

  SessionCallbacks callbacks_;
  bool title_case_;

  int32_t current_stream_id_ = 0;
  http2::H2StreamCallbacks stream_callbacks_;
  ParseState parse_state_ = ParseState::kIdle;
  bool head_request_ = false;

  int status_code_ = 0;
  size_t content_length_ = 0;
  size_t body_received_ = 0;
  bool keep_alive_ = true;

  phr_chunked_decoder chunked_decoder_;

  std::vector<uint8_t> recv_buffer_;

  std::vector<uint8_t> send_buffer_;
  size_t send_offset_ = 0;

  bool fatal_error_ = false;
  std::string last_error_;
};

}  // namespace http1
}  // namespace guise

#endif  // GUISE_HTTP1_H1_SESSION_H_
