// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

// Response body decoding for the Content-Encoding values browsers accept.

#ifndef GUISE_UTIL_CONTENT_DECODER_H_
#define GUISE_UTIL_CONTENT_DECODER_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace guise {
namespace util {

enum class ContentEncoding {
  kIdentity,
  kGzip,
  kDeflate,
  kBrotli,
  kZstd,
  kUnknown,
};

// One coding token ("br", "gzip", "x-gzip", "deflate", "zstd", "identity")
ContentEncoding ParseContentEncoding(std::string_view value);

const char* ContentEncodingToString(ContentEncoding encoding);

// Decoded bodies larger than this are rejected
inline constexpr size_t kMaxDecodedSize = 100 * 1024 * 1024;

// Decodes `data` coded with `encoding`. Identity copies the input.
// Returns false with *error set on corrupt input, unknown codings or
// oversized output.
bool Decode(ContentEncoding encoding, const uint8_t* data, size_t len,
            std::vector<uint8_t>* output, std::string* error);

// Undoes a full Content-Encoding header ("gzip, br" was applied gzip
// first, so br is removed first). The body is replaced in place.
bool DecodeBody(std::string_view content_encoding, std::vector<uint8_t>* body,
                std::string* error);

}  // namespace util
}  // namespace guise

#endif  // GUISE_UTIL_CONTENT_DECODER_H_
