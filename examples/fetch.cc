// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

// Example: one blocking request under a chosen profile
//
// Usage: ./fetch <url> [profile] [proxy-url]
//   ./fetch https://tls.peet.ws/api/all Firefox133
//   ./fetch https://httpbin.org/ip Chrome143 socks5h://127.0.0.1:1080

#include <print>
#include <string>

#include "guise/client.h"

using namespace guise;

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::println(stderr, "Usage: {} <url> [profile] [proxy-url]", argv[0]);
    return 1;
  }

  ClientConfig config = ClientConfig::Default();
  if (argc > 2) {
    config.profile = argv[2];
  }
  if (argc > 3) {
    auto proxy = pool::ParseProxyUrl(argv[3]);
    if (!proxy) {
      std::println(stderr, "Error: {}", proxy.error().ToString());
      return 1;
    }
    config.proxy = proxy.value();
  }
  config.log_level = LogLevel::kWarn;

  HttpClient client(config);
  if (!client.IsInitialized()) {
    std::println(stderr, "Error: {}", client.last_error());
    return 1;
  }

  auto result = client.Send(Request{}.SetUrl(argv[1]));
  if (!result) {
    std::println(stderr, "Error: {}", result.error().ToString());
    return 1;
  }

  const Response& response = result.value();
  std::println("Status: {} ({})", response.status_code, response.alpn);
  for (const auto& h : response.headers) {
    std::println("{}: {}", h.name, h.value);
  }
  std::println("");
  std::println("{}", response.body_string());
  return 0;
}
