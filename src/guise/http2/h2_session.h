// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_HTTP2_H2_SESSION_H_
#define GUISE_HTTP2_H2_SESSION_H_

#include <nghttp2/nghttp2.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "guise/http2/h2_preface.h"
#include "guise/http2/h2_stream.h"

namespace guise {
namespace http2 {

struct NgSessionDeleter {
  void operator()(nghttp2_session* session) {
    if (session != nullptr) {
      nghttp2_session_del(session);
    }
  }
};

using NgSessionPtr = std::unique_ptr<nghttp2_session, NgSessionDeleter>;

struct H2SessionCallbacks {
  // Fatal session error
  std::function<void(int error_code, const std::string& msg)> on_error;

  std::function<void(int32_t last_stream_id, uint32_t error_code)> on_goaway;
};

// nghttp2 client session shaped by an Http2Preface: SETTINGS in profile
// order, the stream-0 WINDOW_UPDATE, initial PRIORITY frames, pseudo-header
// order, per-stream priority and padding.
class H2Session {
 public:
  H2Session(Http2Preface preface, H2SessionCallbacks callbacks);
  ~H2Session();

  H2Session(const H2Session&) = delete;
  H2Session& operator=(const H2Session&) = delete;
  H2Session(H2Session&&) = delete;
  H2Session& operator=(H2Session&&) = delete;

  // Creates the nghttp2 session and queues the preface.
  // The bytes are available via GetPendingData().
  bool Initialize();

  // Returns stream ID on success, -1 on error
  int32_t SubmitRequest(const H2Request& request,
                        H2StreamCallbacks stream_callbacks);

  // RST_STREAM for a local cancel. The stream's on_close fires with
  // `error_code` once nghttp2 closes it.
  bool ResetStream(int32_t stream_id, uint32_t error_code = NGHTTP2_CANCEL);

  // Feed decrypted bytes. Returns bytes consumed, or -1 on error.
  ssize_t Receive(const uint8_t* data, size_t len);

  // Data is valid until the next GetPendingData() or DataSent()
  std::pair<const uint8_t*, size_t> GetPendingData();
  void DataSent(size_t len);
  bool WantsWrite() const;

  // False after GOAWAY or a fatal error
  bool CanSubmitRequest() const;

  // Fails every open stream with `error_code`. Used on transport loss.
  void FailAllStreams(uint32_t error_code);

  H2Stream* GetStream(int32_t stream_id);
  size_t ActiveStreamCount() const { return streams_.size(); }

  bool IsAlive() const { return !fatal_error_ && !goaway_received_; }
  const std::string& last_error() const { return last_error_; }

  const Http2Preface& preface() const { return preface_; }

  // Akamai fingerprint of what this session sends
  std::string Akamai() const { return AkamaiFingerprint(preface_); }

 private:
  static int OnFrameRecvCallback(nghttp2_session* session,
                                 const nghttp2_frame* frame, void* user_data);
  static int OnFrameSendCallback(nghttp2_session* session,
                                 const nghttp2_frame* frame, void* user_data);
  static int OnDataChunkRecvCallback(nghttp2_session* session, uint8_t flags,
                                     int32_t stream_id, const uint8_t* data,
                                     size_t len, void* user_data);
  static int OnStreamCloseCallback(nghttp2_session* session, int32_t stream_id,
                                   uint32_t error_code, void* user_data);
  static int OnHeaderCallback(nghttp2_session* session,
                              const nghttp2_frame* frame, const uint8_t* name,
                              size_t namelen, const uint8_t* value,
                              size_t valuelen, uint8_t flags, void* user_data);
  static int OnBeginHeadersCallback(nghttp2_session* session,
                                    const nghttp2_frame* frame,
                                    void* user_data);
  static ssize_t SelectPaddingCallback(nghttp2_session* session,
                                       const nghttp2_frame* frame,
                                       size_t max_payloadlen, void* user_data);
  static ssize_t ReadBodyCallback(nghttp2_session* session, int32_t stream_id,
                                  uint8_t* buf, size_t length,
                                  uint32_t* data_flags,
                                  nghttp2_data_source* source,
                                  void* user_data);

  int HandleFrameRecv(const nghttp2_frame* frame);
  int HandleFrameSend(const nghttp2_frame* frame);
  int HandleDataChunkRecv(int32_t stream_id, const uint8_t* data, size_t len);
  int HandleStreamClose(int32_t stream_id, uint32_t error_code);
  int HandleHeader(const nghttp2_frame* frame, const uint8_t* name,
                   size_t namelen, const uint8_t* value, size_t valuelen);
  int HandleBeginHeaders(const nghttp2_frame* frame);
  ssize_t HandleSelectPadding(const nghttp2_frame* frame,
                              size_t max_payloadlen);

  void SubmitSettings();
  void SubmitWindowUpdate();
  void SubmitInitialPriorities();

  std::vector<nghttp2_nv> BuildHeaderNvArray(const H2Request& request,
                                             Headers* storage);

  void SetError(const std::string& msg);

  NgSessionPtr session_;
  Http2Preface preface_;
  H2SessionCallbacks callbacks_;

  std::unordered_map<int32_t, std::unique_ptr<H2Stream>> streams_;

  std::vector<uint8_t> send_buffer_;
  size_t send_offset_ = 0;

  bool fatal_error_ = false;
  bool goaway_received_ = false;
  std::string last_error_;
};

}  // namespace http2
}  // namespace guise

#endif  // GUISE_HTTP2_H2_SESSION_H_
