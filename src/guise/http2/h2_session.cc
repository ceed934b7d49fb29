// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/http2/h2_session.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace guise {
namespace http2 {

namespace {

// Once this much has been sent, the buffer is compacted
constexpr size_t kCompactThreshold = 64 * 1024;

nghttp2_nv MakeNv(const std::string& name, const std::string& value) {
  nghttp2_nv nv;
  nv.name = reinterpret_cast<uint8_t*>(const_cast<char*>(name.data()));
  nv.namelen = name.size();
  nv.value = reinterpret_cast<uint8_t*>(const_cast<char*>(value.data()));
  nv.valuelen = value.size();
  nv.flags = NGHTTP2_NV_FLAG_NONE;  // nghttp2 copies both
  return nv;
}

// Connection-specific fields are illegal in HTTP/2 (RFC 9113 8.2.2)
bool IsConnectionSpecific(std::string_view name) {
  return name == "connection" || name == "keep-alive" ||
         name == "proxy-connection" || name == "transfer-encoding" ||
         name == "upgrade" || name == "host";
}

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return out;
}

nghttp2_priority_spec ToPrioritySpec(const profile::StreamPriority& p) {
  nghttp2_priority_spec prio;
  nghttp2_priority_spec_init(&prio, static_cast<int32_t>(p.stream_dependency),
                             p.weight, p.exclusive ? 1 : 0);
  return prio;
}

}  // namespace

H2Session::H2Session(Http2Preface preface, H2SessionCallbacks callbacks)
    : preface_(std::move(preface)), callbacks_(std::move(callbacks)) {}

H2Session::~H2Session() = default;

bool H2Session::Initialize() {
  nghttp2_session_callbacks* callbacks;
  if (nghttp2_session_callbacks_new(&callbacks) != 0) {
    SetError("Failed to create nghttp2 callbacks");
    return false;
  }

  nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks,
                                                       OnFrameRecvCallback);
  nghttp2_session_callbacks_set_on_frame_send_callback(callbacks,
                                                       OnFrameSendCallback);
  nghttp2_session_callbacks_set_on_data_chunk_recv_callback(
      callbacks, OnDataChunkRecvCallback);
  nghttp2_session_callbacks_set_on_stream_close_callback(callbacks,
                                                         OnStreamCloseCallback);
  nghttp2_session_callbacks_set_on_header_callback(callbacks, OnHeaderCallback);
  nghttp2_session_callbacks_set_on_begin_headers_callback(
      callbacks, OnBeginHeadersCallback);
  if (preface_.padded && preface_.padding_block > 0) {
    nghttp2_session_callbacks_set_select_padding_callback(
        callbacks, SelectPaddingCallback);
  }

  nghttp2_session* session_raw;
  int rv = nghttp2_session_client_new(&session_raw, callbacks, this);
  nghttp2_session_callbacks_del(callbacks);
  if (rv != 0) {
    SetError(std::string("Failed to create nghttp2 session: ") +
             nghttp2_strerror(rv));
    return false;
  }
  session_.reset(session_raw);

  SubmitSettings();
  SubmitWindowUpdate();
  SubmitInitialPriorities();

  return !fatal_error_;
}

int32_t H2Session::SubmitRequest(const H2Request& request,
                                 H2StreamCallbacks stream_callbacks) {
  if (!session_ || !CanSubmitRequest()) {
    return -1;
  }

  Headers storage;
  std::vector<nghttp2_nv> nva = BuildHeaderNvArray(request, &storage);

  nghttp2_priority_spec prio;
  const nghttp2_priority_spec* pri_spec = nullptr;
  if (preface_.priority_mode == profile::PriorityMode::kInHeaders) {
    prio = ToPrioritySpec(preface_.priority);
    pri_spec = &prio;
  }

  nghttp2_data_provider data_prd;
  const nghttp2_data_provider* data_prd_ptr = nullptr;
  if (!request.body.empty()) {
    data_prd.source.ptr = nullptr;
    data_prd.read_callback = ReadBodyCallback;
    data_prd_ptr = &data_prd;
  }

  int32_t stream_id = nghttp2_submit_request(
      session_.get(), pri_spec, nva.data(), nva.size(), data_prd_ptr, nullptr);
  if (stream_id < 0) {
    last_error_ = std::string("Failed to submit request: ") +
                  nghttp2_strerror(stream_id);
    return -1;
  }

  auto stream = std::make_unique<H2Stream>(
      stream_id, std::move(stream_callbacks), request.body);
  if (request.body.empty()) {
    stream->MarkLocalClosed();
  }
  streams_[stream_id] = std::move(stream);

  SPDLOG_TRACE("h2 stream {} submitted: {} {}", stream_id, request.method,
               request.path);
  return stream_id;
}

bool H2Session::ResetStream(int32_t stream_id, uint32_t error_code) {
  if (!session_ || streams_.find(stream_id) == streams_.end()) {
    return false;
  }
  int rv = nghttp2_submit_rst_stream(session_.get(), NGHTTP2_FLAG_NONE,
                                     stream_id, error_code);
  if (rv != 0) {
    last_error_ = std::string("Failed to reset stream: ") + nghttp2_strerror(rv);
    return false;
  }
  return true;
}

ssize_t H2Session::Receive(const uint8_t* data, size_t len) {
  if (!session_ || fatal_error_) {
    return -1;
  }

  ssize_t rv = nghttp2_session_mem_recv(session_.get(), data, len);
  if (rv < 0) {
    SetError(std::string("nghttp2_session_mem_recv failed: ") +
             nghttp2_strerror(static_cast<int>(rv)));
    return -1;
  }
  return rv;
}

std::pair<const uint8_t*, size_t> H2Session::GetPendingData() {
  if (session_ && !fatal_error_) {
    while (nghttp2_session_want_write(session_.get()) != 0) {
      const uint8_t* data;
      ssize_t len = nghttp2_session_mem_send(session_.get(), &data);
      if (len < 0) {
        SetError(std::string("nghttp2_session_mem_send failed: ") +
                 nghttp2_strerror(static_cast<int>(len)));
        break;
      }
      if (len == 0) {
        break;
      }
      send_buffer_.insert(send_buffer_.end(), data, data + len);
    }
  }

  return {send_buffer_.data() + send_offset_,
          send_buffer_.size() - send_offset_};
}

void H2Session::DataSent(size_t len) {
  send_offset_ += len;
  if (send_offset_ >= send_buffer_.size()) {
    send_buffer_.clear();
    send_offset_ = 0;
  } else if (send_offset_ >= kCompactThreshold) {
    send_buffer_.erase(send_buffer_.begin(),
                       send_buffer_.begin() +
                           static_cast<std::ptrdiff_t>(send_offset_));
    send_offset_ = 0;
  }
}

bool H2Session::WantsWrite() const {
  if (!session_ || fatal_error_) {
    return false;
  }
  return send_offset_ < send_buffer_.size() ||
         nghttp2_session_want_write(session_.get()) != 0;
}

bool H2Session::CanSubmitRequest() const {
  if (!session_ || fatal_error_ || goaway_received_) {
    return false;
  }
  return nghttp2_session_check_request_allowed(session_.get()) != 0;
}

void H2Session::FailAllStreams(uint32_t error_code) {
  // on_close may reenter; detach the map first
  auto streams = std::move(streams_);
  streams_.clear();
  for (auto& [id, stream] : streams) {
    stream->OnStreamClose(error_code);
  }
}

H2Stream* H2Session::GetStream(int32_t stream_id) {
  auto it = streams_.find(stream_id);
  if (it == streams_.end()) {
    return nullptr;
  }
  return it->second.get();
}

// Static callbacks

int H2Session::OnFrameRecvCallback(nghttp2_session* /*session*/,
                                   const nghttp2_frame* frame,
                                   void* user_data) {
  return static_cast<H2Session*>(user_data)->HandleFrameRecv(frame);
}

int H2Session::OnFrameSendCallback(nghttp2_session* /*session*/,
                                   const nghttp2_frame* frame,
                                   void* user_data) {
  return static_cast<H2Session*>(user_data)->HandleFrameSend(frame);
}

int H2Session::OnDataChunkRecvCallback(nghttp2_session* /*session*/,
                                       uint8_t /*flags*/, int32_t stream_id,
                                       const uint8_t* data, size_t len,
                                       void* user_data) {
  return static_cast<H2Session*>(user_data)->HandleDataChunkRecv(stream_id,
                                                                 data, len);
}

int H2Session::OnStreamCloseCallback(nghttp2_session* /*session*/,
                                     int32_t stream_id, uint32_t error_code,
                                     void* user_data) {
  return static_cast<H2Session*>(user_data)->HandleStreamClose(stream_id,
                                                               error_code);
}

int H2Session::OnHeaderCallback(nghttp2_session* /*session*/,
                                const nghttp2_frame* frame, const uint8_t* name,
                                size_t namelen, const uint8_t* value,
                                size_t valuelen, uint8_t /*flags*/,
                                void* user_data) {
  return static_cast<H2Session*>(user_data)->HandleHeader(frame, name, namelen,
                                                          value, valuelen);
}

int H2Session::OnBeginHeadersCallback(nghttp2_session* /*session*/,
                                      const nghttp2_frame* frame,
                                      void* user_data) {
  return static_cast<H2Session*>(user_data)->HandleBeginHeaders(frame);
}

ssize_t H2Session::SelectPaddingCallback(nghttp2_session* /*session*/,
                                         const nghttp2_frame* frame,
                                         size_t max_payloadlen,
                                         void* user_data) {
  return static_cast<H2Session*>(user_data)->HandleSelectPadding(
      frame, max_payloadlen);
}

ssize_t H2Session::ReadBodyCallback(nghttp2_session* /*session*/,
                                    int32_t stream_id, uint8_t* buf,
                                    size_t length, uint32_t* data_flags,
                                    nghttp2_data_source* /*source*/,
                                    void* user_data) {
  auto* self = static_cast<H2Session*>(user_data);
  H2Stream* stream = self->GetStream(stream_id);
  if (stream == nullptr) {
    return NGHTTP2_ERR_TEMPORAL_CALLBACK_FAILURE;
  }

  bool eof = false;
  size_t n = stream->ReadBody(buf, length, &eof);
  if (eof) {
    *data_flags |= NGHTTP2_DATA_FLAG_EOF;
    stream->MarkLocalClosed();
  }
  return static_cast<ssize_t>(n);
}

// Instance handlers

int H2Session::HandleFrameRecv(const nghttp2_frame* frame) {
  switch (frame->hd.type) {
    case NGHTTP2_HEADERS:
      if (frame->hd.flags & NGHTTP2_FLAG_END_HEADERS) {
        if (H2Stream* stream = GetStream(frame->hd.stream_id)) {
          stream->OnHeadersComplete();
        }
      }
      break;

    case NGHTTP2_GOAWAY:
      goaway_received_ = true;
      SPDLOG_DEBUG("h2 GOAWAY last_stream_id={} error={}",
                   frame->goaway.last_stream_id, frame->goaway.error_code);
      if (callbacks_.on_goaway) {
        callbacks_.on_goaway(frame->goaway.last_stream_id,
                             frame->goaway.error_code);
      }
      break;

    default:
      break;
  }
  return 0;
}

int H2Session::HandleFrameSend(const nghttp2_frame* frame) {
  if (frame->hd.type != NGHTTP2_HEADERS ||
      preface_.priority_mode != profile::PriorityMode::kFrameAfterHeaders) {
    return 0;
  }

  H2Stream* stream = GetStream(frame->hd.stream_id);
  if (stream == nullptr || stream->priority_sent) {
    return 0;
  }
  stream->priority_sent = true;

  // Queued now, so it leaves right behind the HEADERS frame
  nghttp2_priority_spec prio = ToPrioritySpec(preface_.priority);
  int rv = nghttp2_submit_priority(session_.get(), NGHTTP2_FLAG_NONE,
                                   frame->hd.stream_id, &prio);
  if (rv != 0) {
    SPDLOG_WARN("PRIORITY for stream {} not queued: {}", frame->hd.stream_id,
                nghttp2_strerror(rv));
  }
  return 0;
}

int H2Session::HandleDataChunkRecv(int32_t stream_id, const uint8_t* data,
                                   size_t len) {
  if (H2Stream* stream = GetStream(stream_id)) {
    stream->OnDataReceived(data, len);
  }
  return 0;
}

int H2Session::HandleStreamClose(int32_t stream_id, uint32_t error_code) {
  auto it = streams_.find(stream_id);
  if (it != streams_.end()) {
    std::unique_ptr<H2Stream> stream = std::move(it->second);
    streams_.erase(it);
    stream->OnStreamClose(error_code);
  }
  return 0;
}

int H2Session::HandleHeader(const nghttp2_frame* frame, const uint8_t* name,
                            size_t namelen, const uint8_t* value,
                            size_t valuelen) {
  if (frame->hd.type != NGHTTP2_HEADERS) {
    return 0;
  }
  if (H2Stream* stream = GetStream(frame->hd.stream_id)) {
    stream->AddHeader(
        std::string_view(reinterpret_cast<const char*>(name), namelen),
        std::string_view(reinterpret_cast<const char*>(value), valuelen));
  }
  return 0;
}

int H2Session::HandleBeginHeaders(const nghttp2_frame* frame) {
  if (frame->hd.type != NGHTTP2_HEADERS) {
    return 0;
  }
  if (H2Stream* stream = GetStream(frame->hd.stream_id)) {
    stream->BeginHeaders();
  }
  return 0;
}

ssize_t H2Session::HandleSelectPadding(const nghttp2_frame* frame,
                                       size_t max_payloadlen) {
  size_t block = preface_.padding_block;
  size_t length = frame->hd.length;
  size_t padded = ((length + block - 1) / block) * block;
  return static_cast<ssize_t>(std::min(std::max(padded, length), max_payloadlen));
}

void H2Session::SubmitSettings() {
  std::vector<nghttp2_settings_entry> iv;
  iv.reserve(preface_.settings.size());
  for (const auto& s : preface_.settings) {
    iv.push_back({s.id, s.value});
  }

  int rv = nghttp2_submit_settings(session_.get(), NGHTTP2_FLAG_NONE, iv.data(),
                                   iv.size());
  if (rv != 0) {
    SetError(std::string("Failed to submit SETTINGS: ") + nghttp2_strerror(rv));
  }
}

void H2Session::SubmitWindowUpdate() {
  if (preface_.window_update_increment == 0) {
    return;
  }
  int rv = nghttp2_submit_window_update(
      session_.get(), NGHTTP2_FLAG_NONE, 0,
      static_cast<int32_t>(preface_.window_update_increment));
  if (rv != 0) {
    SetError(std::string("Failed to submit WINDOW_UPDATE: ") +
             nghttp2_strerror(rv));
  }
}

void H2Session::SubmitInitialPriorities() {
  for (const auto& frame : preface_.initial_priority_frames) {
    nghttp2_priority_spec prio = ToPrioritySpec(frame.priority);
    int rv = nghttp2_submit_priority(session_.get(), NGHTTP2_FLAG_NONE,
                                     frame.stream_id, &prio);
    if (rv != 0) {
      SetError(std::string("Failed to submit PRIORITY: ") +
               nghttp2_strerror(rv));
      return;
    }
  }
}

std::vector<nghttp2_nv> H2Session::BuildHeaderNvArray(const H2Request& request,
                                                      Headers* storage) {
  *storage = preface_.OrderPseudoHeaders(request.method, request.authority,
                                         request.scheme, request.path);
  storage->reserve(storage->size() + request.headers.size());
  for (const auto& h : request.headers) {
    std::string name = ToLower(h.name);
    if (IsConnectionSpecific(name) || (!name.empty() && name[0] == ':')) {
      continue;
    }
    storage->push_back({std::move(name), h.value});
  }

  // Built after storage stops growing so the pointers stay valid
  std::vector<nghttp2_nv> nva;
  nva.reserve(storage->size());
  for (const auto& h : *storage) {
    nva.push_back(MakeNv(h.name, h.value));
  }
  return nva;
}

void H2Session::SetError(const std::string& msg) {
  fatal_error_ = true;
  last_error_ = msg;
  if (callbacks_.on_error) {
    callbacks_.on_error(-1, msg);
  }
}

}  // namespace http2
}  // namespace guise
