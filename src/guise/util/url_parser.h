// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_UTIL_URL_PARSER_H_
#define GUISE_UTIL_URL_PARSER_H_

#include <cstdint>
#include <string>
#include <string_view>

namespace guise {
namespace util {

// Parsed URL components
struct ParsedUrl {
  std::string scheme;    // "https", lowercased
  std::string username;  // percent-decoded userinfo
  std::string password;
  std::string host;      // "example.com", IPv6 without brackets
  uint16_t port = 0;     // explicit or scheme default
  std::string path;      // "/api/v1/resource"
  std::string query;     // "foo=bar"
  std::string fragment;  // "section1"

  // Value for :authority / Host (port omitted when it is the default)
  std::string Authority() const;

  // Full path including query (for HTTP request)
  std::string PathWithQuery() const;

  bool IsHttps() const { return scheme == "https"; }
};

// Default port for a scheme, 0 if unknown
uint16_t DefaultPort(std::string_view scheme);

// Parse a URL string
// Returns false if URL is invalid
bool ParseUrl(std::string_view url, ParsedUrl* result);

// True for IPv4 and IPv6 literals (no brackets)
bool IsIpLiteral(std::string_view host);

std::string PercentDecode(std::string_view in);

}  // namespace util
}  // namespace guise

#endif  // GUISE_UTIL_URL_PARSER_H_
