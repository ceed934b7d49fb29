// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/util/content_decoder.h"

#include <brotli/encode.h>
#include <zlib.h>
#include <zstd.h>

#include <cassert>
#include <print>
#include <string>
#include <vector>

using namespace guise::util;

namespace {

using Bytes = std::vector<uint8_t>;

Bytes Sample() {
  std::string text;
  for (int i = 0; i < 2000; ++i) {
    text += "<div class=\"row\">" + std::to_string(i) + "</div>\n";
  }
  return Bytes(text.begin(), text.end());
}

// window_bits as for inflateInit2: 16 + MAX_WBITS gzip, MAX_WBITS zlib,
// -MAX_WBITS raw deflate
Bytes Deflate(const Bytes& in, int window_bits) {
  z_stream strm = {};
  int ret = deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits,
                         8, Z_DEFAULT_STRATEGY);
  assert(ret == Z_OK);
  Bytes out(deflateBound(&strm, in.size()) + 32);
  strm.next_in = const_cast<Bytef*>(in.data());
  strm.avail_in = static_cast<uInt>(in.size());
  strm.next_out = out.data();
  strm.avail_out = static_cast<uInt>(out.size());
  ret = deflate(&strm, Z_FINISH);
  assert(ret == Z_STREAM_END);
  out.resize(strm.total_out);
  deflateEnd(&strm);
  return out;
}

Bytes Brotli(const Bytes& in) {
  size_t size = BrotliEncoderMaxCompressedSize(in.size());
  Bytes out(size);
  bool ok = BrotliEncoderCompress(BROTLI_DEFAULT_QUALITY, BROTLI_DEFAULT_WINDOW,
                                  BROTLI_MODE_TEXT, in.size(), in.data(), &size,
                                  out.data());
  assert(ok);
  (void)ok;
  out.resize(size);
  return out;
}

Bytes Zstd(const Bytes& in) {
  Bytes out(ZSTD_compressBound(in.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), in.data(), in.size(), 3);
  assert(!ZSTD_isError(n));
  out.resize(n);
  return out;
}

}  // namespace

void TestParseContentEncoding() {
  std::print("Testing ParseContentEncoding... ");

  assert(ParseContentEncoding("gzip") == ContentEncoding::kGzip);
  assert(ParseContentEncoding(" X-GZIP ") == ContentEncoding::kGzip);
  assert(ParseContentEncoding("br") == ContentEncoding::kBrotli);
  assert(ParseContentEncoding("deflate") == ContentEncoding::kDeflate);
  assert(ParseContentEncoding("zstd") == ContentEncoding::kZstd);
  assert(ParseContentEncoding("") == ContentEncoding::kIdentity);
  assert(ParseContentEncoding("identity") == ContentEncoding::kIdentity);
  assert(ParseContentEncoding("compress") == ContentEncoding::kUnknown);
  assert(std::string(ContentEncodingToString(ContentEncoding::kBrotli)) ==
         "br");

  std::println("PASSED");
}

void TestDecodeEachCoding() {
  std::print("Testing gzip, deflate, br and zstd... ");

  const Bytes plain = Sample();
  Bytes out;
  std::string error;

  Bytes gzip = Deflate(plain, 16 + MAX_WBITS);
  assert(Decode(ContentEncoding::kGzip, gzip.data(), gzip.size(), &out,
                &error));
  assert(out == plain);

  // zlib-wrapped and raw deflate are both accepted
  Bytes zlib = Deflate(plain, MAX_WBITS);
  assert(Decode(ContentEncoding::kDeflate, zlib.data(), zlib.size(), &out,
                &error));
  assert(out == plain);
  Bytes raw = Deflate(plain, -MAX_WBITS);
  assert(Decode(ContentEncoding::kDeflate, raw.data(), raw.size(), &out,
                &error));
  assert(out == plain);

  Bytes br = Brotli(plain);
  assert(Decode(ContentEncoding::kBrotli, br.data(), br.size(), &out, &error));
  assert(out == plain);

  Bytes zst = Zstd(plain);
  assert(Decode(ContentEncoding::kZstd, zst.data(), zst.size(), &out, &error));
  assert(out == plain);

  std::println("PASSED");
}

void TestDecodeBodyStacked() {
  std::print("Testing stacked Content-Encoding... ");

  const Bytes plain = Sample();
  // "gzip, br": gzip applied first, so br comes off first
  Bytes body = Brotli(Deflate(plain, 16 + MAX_WBITS));
  std::string error;
  assert(DecodeBody("gzip, br", &body, &error));
  assert(body == plain);

  Bytes untouched = plain;
  assert(DecodeBody("identity", &untouched, &error));
  assert(untouched == plain);
  assert(DecodeBody("", &untouched, &error));
  assert(untouched == plain);

  Bytes empty;
  assert(DecodeBody("br", &empty, &error));
  assert(empty.empty());

  std::println("PASSED");
}

void TestCorruptInput() {
  std::print("Testing corrupt and truncated input... ");

  const Bytes plain = Sample();
  std::string error;

  Bytes gzip = Deflate(plain, 16 + MAX_WBITS);
  gzip.resize(gzip.size() / 2);
  Bytes body = gzip;
  assert(!DecodeBody("gzip", &body, &error));
  assert(!error.empty());

  Bytes br = Brotli(plain);
  br.resize(br.size() / 2);
  error.clear();
  assert(!DecodeBody("br", &br, &error));
  assert(!error.empty());

  Bytes zst = Zstd(plain);
  zst.resize(zst.size() - 4);
  error.clear();
  assert(!DecodeBody("zstd", &zst, &error));
  assert(!error.empty());

  Bytes unknown = plain;
  error.clear();
  assert(!DecodeBody("compress", &unknown, &error));
  assert(error == "Unsupported content encoding");

  std::println("PASSED");
}

int main() {
  std::println("=== Content Decoder Unit Tests ===\n");

  TestParseContentEncoding();
  TestDecodeEachCoding();
  TestDecodeBodyStacked();
  TestCorruptInput();

  std::println("\nAll content decoder tests passed!");
  return 0;
}
