// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/util/url_parser.h"

#include <arpa/inet.h>

#include <algorithm>
#include <charconv>

namespace guise {
namespace util {

namespace {

std::string ToLower(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>((c >= 'A' && c <= 'Z') ? c + 32 : c);
  });
  return out;
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::string PercentDecode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%' && i + 2 < in.size()) {
      int hi = HexValue(in[i + 1]);
      int lo = HexValue(in[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    out.push_back(in[i]);
  }
  return out;
}

uint16_t DefaultPort(std::string_view scheme) {
  if (scheme == "https") return 443;
  if (scheme == "http") return 80;
  if (scheme == "socks4" || scheme == "socks4a" || scheme == "socks5" ||
      scheme == "socks5h") {
    return 1080;
  }
  return 0;
}

bool IsIpLiteral(std::string_view host) {
  std::string h(host);
  unsigned char buf[sizeof(struct in6_addr)];
  return inet_pton(AF_INET, h.c_str(), buf) == 1 ||
         inet_pton(AF_INET6, h.c_str(), buf) == 1;
}

std::string ParsedUrl::Authority() const {
  std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  if (port == DefaultPort(scheme)) {
    return h;
  }
  return h + ":" + std::to_string(port);
}

std::string ParsedUrl::PathWithQuery() const {
  if (query.empty()) {
    return path;
  }
  return path + "?" + query;
}

bool ParseUrl(std::string_view url, ParsedUrl* result) {
  if (result == nullptr) {
    return false;
  }
  *result = ParsedUrl{};

  std::string_view remaining = url;

  // Parse scheme
  auto scheme_end = remaining.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    return false;
  }
  result->scheme = ToLower(remaining.substr(0, scheme_end));
  remaining = remaining.substr(scheme_end + 3);
  result->port = DefaultPort(result->scheme);

  size_t authority_end = remaining.find_first_of("/?#");
  if (authority_end == std::string_view::npos) {
    authority_end = remaining.size();
  }
  std::string_view authority = remaining.substr(0, authority_end);
  remaining = remaining.substr(authority_end);

  // Userinfo
  auto at = authority.rfind('@');
  if (at != std::string_view::npos) {
    std::string_view userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
    auto colon = userinfo.find(':');
    result->username = PercentDecode(userinfo.substr(0, colon));
    if (colon != std::string_view::npos) {
      result->password = PercentDecode(userinfo.substr(colon + 1));
    }
  }

  // Host and port; IPv6 literals are bracketed
  std::string_view host_part = authority;
  std::string_view port_part;
  if (!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if (close == std::string_view::npos) {
      return false;
    }
    host_part = authority.substr(1, close - 1);
    std::string_view rest = authority.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') {
        return false;
      }
      port_part = rest.substr(1);
    }
  } else {
    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos) {
      host_part = authority.substr(0, colon);
      port_part = authority.substr(colon + 1);
    }
  }

  if (!port_part.empty()) {
    unsigned int port = 0;
    auto [ptr, ec] = std::from_chars(port_part.data(),
                                     port_part.data() + port_part.size(), port);
    if (ec != std::errc() || ptr != port_part.data() + port_part.size() ||
        port == 0 || port > 65535) {
      return false;
    }
    result->port = static_cast<uint16_t>(port);
  }
  result->host = ToLower(host_part);

  // Parse path
  if (!remaining.empty() && remaining.front() == '/') {
    auto path_end = remaining.find_first_of("?#");
    result->path = std::string(remaining.substr(0, path_end));
    remaining = path_end == std::string_view::npos ? std::string_view{}
                                                   : remaining.substr(path_end);
  } else {
    result->path = "/";
  }

  // Parse query
  if (!remaining.empty() && remaining.front() == '?') {
    remaining = remaining.substr(1);
    auto query_end = remaining.find('#');
    result->query = std::string(remaining.substr(0, query_end));
    remaining = query_end == std::string_view::npos
                    ? std::string_view{}
                    : remaining.substr(query_end);
  }

  // Parse fragment
  if (!remaining.empty() && remaining.front() == '#') {
    result->fragment = std::string(remaining.substr(1));
  }

  return !result->host.empty() && result->port != 0;
}

}  // namespace util
}  // namespace guise
