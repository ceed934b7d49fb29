// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/util/dns_resolver.h"

#include <arpa/inet.h>
#include <netdb.h>

#include <spdlog/spdlog.h>

#include <cstring>

#include "guise/util/url_parser.h"

namespace guise {
namespace util {

struct DnsResolver::Request {
  uv_getaddrinfo_t req;
  DnsResolver* resolver;
  std::shared_ptr<bool> alive;
  std::string hostname;
  DnsCallback callback;
};

DnsResolver::DnsResolver(
    uv_loop_t* loop,
    std::unordered_map<std::string, std::vector<std::string>> overrides,
    uint64_t cache_ttl_ms)
    : loop_(loop),
      cache_ttl_ms_(cache_ttl_ms),
      alive_(std::make_shared<bool>(true)) {
  for (auto& [host, ips] : overrides) {
    std::vector<ResolvedAddress> addrs;
    for (const auto& ip : ips) {
      addrs.push_back({ip, ip.find(':') != std::string::npos});
    }
    overrides_[host] = std::move(addrs);
  }
}

DnsResolver::~DnsResolver() { *alive_ = false; }

void DnsResolver::ResolveAsync(const std::string& hostname,
                               DnsCallback callback) {
  auto override_it = overrides_.find(hostname);
  if (override_it != overrides_.end()) {
    SPDLOG_DEBUG("dns override {} -> {} address(es)", hostname,
                 override_it->second.size());
    callback(override_it->second, "");
    return;
  }

  if (IsIpLiteral(hostname)) {
    callback({{hostname, hostname.find(':') != std::string::npos}}, "");
    return;
  }

  uint64_t now = uv_now(loop_);
  auto cached = cache_.find(hostname);
  if (cached != cache_.end()) {
    if (cached->second.expires_at_ms > now) {
      ++cache_hits_;
      callback(cached->second.addresses, "");
      return;
    }
    cache_.erase(cached);
  }
  ++cache_misses_;

  auto* request = new Request{};
  request->req.data = request;
  request->resolver = this;
  request->alive = alive_;
  request->hostname = hostname;
  request->callback = std::move(callback);

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  int ret = uv_getaddrinfo(loop_, &request->req, OnResolved,
                           request->hostname.c_str(), nullptr, &hints);
  if (ret != 0) {
    DnsCallback cb = std::move(request->callback);
    delete request;
    cb({}, std::string("getaddrinfo: ") + uv_strerror(ret));
  }
}

void DnsResolver::OnResolved(uv_getaddrinfo_t* req, int status,
                             struct addrinfo* res) {
  std::unique_ptr<Request> request(static_cast<Request*>(req->data));

  std::vector<ResolvedAddress> addresses;
  std::string error;
  if (status != 0) {
    error = std::string("getaddrinfo ") + request->hostname + ": " +
            uv_strerror(status);
  } else {
    addresses = ParseAddrinfo(res);
    if (addresses.empty()) {
      error = "no addresses for " + request->hostname;
    }
  }
  uv_freeaddrinfo(res);

  if (*request->alive && error.empty()) {
    request->resolver->Store(request->hostname, addresses);
  }
  if (status == UV_ECANCELED || !*request->alive) {
    return;
  }
  request->callback(addresses, error);
}

std::vector<ResolvedAddress> DnsResolver::ParseAddrinfo(struct addrinfo* res) {
  std::vector<ResolvedAddress> addresses;
  for (addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
    if (addresses.size() >= kMaxAddressesPerEntry) break;

    char buf[INET6_ADDRSTRLEN];
    if (ai->ai_family == AF_INET) {
      auto* sin = reinterpret_cast<sockaddr_in*>(ai->ai_addr);
      if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf)) != nullptr) {
        addresses.push_back({buf, false});
      }
    } else if (ai->ai_family == AF_INET6) {
      auto* sin6 = reinterpret_cast<sockaddr_in6*>(ai->ai_addr);
      if (inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf)) != nullptr) {
        addresses.push_back({buf, true});
      }
    }
  }
  return addresses;
}

void DnsResolver::Store(const std::string& hostname,
                        const std::vector<ResolvedAddress>& addresses) {
  if (cache_ttl_ms_ == 0) return;
  cache_[hostname] = {addresses, uv_now(loop_) + cache_ttl_ms_};
}

}  // namespace util
}  // namespace guise
