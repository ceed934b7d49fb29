// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/util/content_decoder.h"

#include <brotli/decode.h>
#include <zlib.h>
#include <zstd.h>

#include <algorithm>
#include <cctype>
#include <memory>

namespace guise {
namespace util {

namespace {

constexpr size_t kChunkSize = 64 * 1024;

std::string_view Trim(std::string_view value) {
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() &&
         std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

bool Grow(std::vector<uint8_t>* output, size_t used, std::string* error) {
  if (used + kChunkSize > kMaxDecodedSize) {
    *error = "Decoded size exceeds limit";
    return false;
  }
  output->resize(used + kChunkSize);
  return true;
}

// window_bits: 16 + MAX_WBITS for gzip, MAX_WBITS for zlib, -MAX_WBITS raw
bool Inflate(int window_bits, const uint8_t* data, size_t len,
             std::vector<uint8_t>* output, std::string* error) {
  z_stream strm = {};
  if (inflateInit2(&strm, window_bits) != Z_OK) {
    *error = "Failed to initialize zlib";
    return false;
  }

  strm.next_in = const_cast<Bytef*>(data);
  strm.avail_in = static_cast<uInt>(len);

  size_t used = 0;
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    if (!Grow(output, used, error)) {
      inflateEnd(&strm);
      return false;
    }
    strm.next_out = output->data() + used;
    strm.avail_out = static_cast<uInt>(kChunkSize);

    ret = inflate(&strm, Z_NO_FLUSH);
    used += kChunkSize - strm.avail_out;

    if (ret == Z_BUF_ERROR && strm.avail_in == 0) {
      *error = "Truncated compressed body";
      inflateEnd(&strm);
      return false;
    }
    if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
      *error = std::string("inflate failed: ") +
               (strm.msg != nullptr ? strm.msg : "unknown error");
      inflateEnd(&strm);
      return false;
    }
  }

  inflateEnd(&strm);
  output->resize(used);
  return true;
}

struct BrotliDeleter {
  void operator()(BrotliDecoderState* state) {
    BrotliDecoderDestroyInstance(state);
  }
};

bool DecodeBrotli(const uint8_t* data, size_t len,
                  std::vector<uint8_t>* output, std::string* error) {
  std::unique_ptr<BrotliDecoderState, BrotliDeleter> state(
      BrotliDecoderCreateInstance(nullptr, nullptr, nullptr));
  if (!state) {
    *error = "Failed to create Brotli decoder";
    return false;
  }

  size_t available_in = len;
  const uint8_t* next_in = data;
  size_t used = 0;

  BrotliDecoderResult result = BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT;
  while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
    if (!Grow(output, used, error)) {
      return false;
    }
    size_t available_out = kChunkSize;
    uint8_t* next_out = output->data() + used;
    result = BrotliDecoderDecompressStream(state.get(), &available_in, &next_in,
                                           &available_out, &next_out, nullptr);
    used += kChunkSize - available_out;
  }

  if (result != BROTLI_DECODER_RESULT_SUCCESS) {
    *error = result == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT
                 ? "Truncated Brotli body"
                 : "Brotli decompression failed";
    return false;
  }
  output->resize(used);
  return true;
}

struct ZstdDeleter {
  void operator()(ZSTD_DCtx* ctx) { ZSTD_freeDCtx(ctx); }
};

bool DecodeZstd(const uint8_t* data, size_t len, std::vector<uint8_t>* output,
                std::string* error) {
  std::unique_ptr<ZSTD_DCtx, ZstdDeleter> ctx(ZSTD_createDCtx());
  if (!ctx) {
    *error = "Failed to create Zstd decoder";
    return false;
  }

  ZSTD_inBuffer in = {data, len, 0};
  size_t used = 0;
  size_t ret = 1;
  // Frames may be concatenated; stop once input is consumed and the last
  // frame is complete
  while (in.pos < in.size || ret != 0) {
    if (!Grow(output, used, error)) {
      return false;
    }
    ZSTD_outBuffer out = {output->data() + used, kChunkSize, 0};
    ret = ZSTD_decompressStream(ctx.get(), &out, &in);
    used += out.pos;
    if (ZSTD_isError(ret)) {
      *error = std::string("Zstd decompression failed: ") +
               ZSTD_getErrorName(ret);
      return false;
    }
    if (in.pos == in.size && ret != 0 && out.pos < kChunkSize) {
      *error = "Truncated Zstd body";
      return false;
    }
  }

  output->resize(used);
  return true;
}

}  // namespace

ContentEncoding ParseContentEncoding(std::string_view value) {
  value = Trim(value);
  std::string normalized;
  normalized.reserve(value.size());
  for (char c : value) {
    normalized += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }

  if (normalized.empty() || normalized == "identity") {
    return ContentEncoding::kIdentity;
  }
  if (normalized == "br") return ContentEncoding::kBrotli;
  if (normalized == "gzip" || normalized == "x-gzip") {
    return ContentEncoding::kGzip;
  }
  if (normalized == "deflate") return ContentEncoding::kDeflate;
  if (normalized == "zstd") return ContentEncoding::kZstd;
  return ContentEncoding::kUnknown;
}

const char* ContentEncodingToString(ContentEncoding encoding) {
  switch (encoding) {
    case ContentEncoding::kIdentity:
      return "identity";
    case ContentEncoding::kGzip:
      return "gzip";
    case ContentEncoding::kDeflate:
      return "deflate";
    case ContentEncoding::kBrotli:
      return "br";
    case ContentEncoding::kZstd:
      return "zstd";
    case ContentEncoding::kUnknown:
      return "unknown";
  }
  return "unknown";
}

bool Decode(ContentEncoding encoding, const uint8_t* data, size_t len,
            std::vector<uint8_t>* output, std::string* error) {
  output->clear();
  switch (encoding) {
    case ContentEncoding::kIdentity:
      output->assign(data, data + len);
      return true;

    case ContentEncoding::kGzip:
      return Inflate(16 + MAX_WBITS, data, len, output, error);

    case ContentEncoding::kDeflate:
      // "deflate" is zlib-wrapped per RFC 9110; some servers send it raw.
      // A zlib header has (CMF * 256 + FLG) % 31 == 0.
      if (len >= 2 && (data[0] & 0x0f) == 8 &&
          ((data[0] << 8) | data[1]) % 31 == 0) {
        return Inflate(MAX_WBITS, data, len, output, error);
      }
      return Inflate(-MAX_WBITS, data, len, output, error);

    case ContentEncoding::kBrotli:
      return DecodeBrotli(data, len, output, error);

    case ContentEncoding::kZstd:
      return DecodeZstd(data, len, output, error);

    case ContentEncoding::kUnknown:
      break;
  }
  *error = "Unsupported content encoding";
  return false;
}

bool DecodeBody(std::string_view content_encoding, std::vector<uint8_t>* body,
                std::string* error) {
  if (body->empty()) {
    return true;
  }

  std::vector<std::string_view> codings;
  size_t pos = 0;
  while (pos <= content_encoding.size()) {
    size_t comma = content_encoding.find(',', pos);
    if (comma == std::string_view::npos) comma = content_encoding.size();
    std::string_view token = Trim(content_encoding.substr(pos, comma - pos));
    if (!token.empty()) codings.push_back(token);
    pos = comma + 1;
  }

  std::vector<uint8_t> decoded;
  for (auto it = codings.rbegin(); it != codings.rend(); ++it) {
    ContentEncoding encoding = ParseContentEncoding(*it);
    if (encoding == ContentEncoding::kIdentity) {
      continue;
    }
    if (!Decode(encoding, body->data(), body->size(), &decoded, error)) {
      return false;
    }
    body->swap(decoded);
  }
  return true;
}

}  // namespace util
}  // namespace guise
