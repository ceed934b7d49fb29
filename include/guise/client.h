// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_CLIENT_H_
#define GUISE_CLIENT_H_

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "guise/config.h"
#include "guise/error.h"
#include "guise/pool/identity_key.h"
#include "guise/types.h"

namespace guise {

namespace profile {
class ProfileRegistry;
}

// HTTP request method
enum class Method {
  kGet,
  kPost,
  kPut,
  kDelete,
  kPatch,
  kHead,
  kOptions,
};

std::string_view MethodToString(Method method);

// HTTP request. Unset overrides fall back to the client's defaults.
struct Request {
  Method method = Method::kGet;
  std::string url;
  Headers headers;
  std::vector<uint8_t> body;

  // Acquire + response budget. Zero means ClientConfig::default_timeout.
  std::chrono::milliseconds timeout{0};

  // Identity overrides
  std::optional<std::string> profile;
  std::optional<pool::ProxyDescriptor> proxy;
  bool no_proxy = false;  // go direct even if the client has a proxy
  std::optional<pool::LocalPath> local_path;

  // Header names to send first, in this order
  std::vector<std::string> header_order;

  // Send only the caller's headers, not the profile's defaults
  bool skip_profile_headers = false;

  // Builder methods (chainable)
  Request& SetMethod(Method m);
  Request& SetUrl(std::string_view u);
  Request& SetHeader(std::string_view name, std::string_view value);
  Request& SetBody(const uint8_t* data, size_t len);
  Request& SetBody(std::string_view b);
  Request& SetTimeout(std::chrono::milliseconds t);
  Request& SetProfile(std::string_view id);
  Request& SetProxy(pool::ProxyDescriptor p);
  Request& SetNoProxy();
  Request& SetBindAddress(std::string_view address);
  Request& SetInterface(std::string_view name);
  Request& SetHeaderOrder(std::vector<std::string> order);
};

// HTTP response
struct Response {
  int status_code = 0;
  Headers headers;
  std::vector<uint8_t> body;  // content-encoding already removed

  std::string alpn;  // "h2" or "http/1.1"
  bool connection_reused = false;

  // Computed queries
  bool is_success() const { return status_code >= 200 && status_code < 300; }
  bool is_redirect() const { return status_code >= 300 && status_code < 400; }

  // Case-insensitive; "" if absent
  std::string_view GetHeader(std::string_view name) const;
  bool HasHeader(std::string_view name) const;

  std::string_view body_string() const;
};

// Identifies an in-flight request for Cancel(). 0 is never issued.
using RequestId = uint64_t;

// Invoked exactly once, on a reactor thread, unless the callback ran
// synchronously from SendAsync() for a request that never started.
using ResponseCallback = std::function<void(Response response, Error error)>;

// Browser-impersonating HTTPS client. Each request is sent on a connection
// whose TLS and HTTP/2 fingerprint belongs to the request's profile, through
// the request's proxy and local path. Connections are pooled per identity.
class HttpClient {
 public:
  explicit HttpClient(const ClientConfig& config = ClientConfig::Default());

  // Uses a caller-built registry instead of the built-in profiles
  HttpClient(const ClientConfig& config,
             std::shared_ptr<const profile::ProfileRegistry> registry);

  // Stops the reactors; requests still in flight are dropped
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;
  HttpClient(HttpClient&&) = delete;
  HttpClient& operator=(HttpClient&&) = delete;

  // False if the reactors could not be set up; see last_error()
  bool IsInitialized() const;
  std::string_view last_error() const;

  // Asynchronous request. Configuration errors (bad URL, unknown profile)
  // are reported synchronously and 0 is returned.
  RequestId SendAsync(Request request, ResponseCallback callback);

  // Fails a request with kRequestCancelled. Queued requests leave the pool
  // queue; HTTP/2 streams are reset; HTTP/1.1 connections are closed.
  void Cancel(RequestId id);

  // Blocking request. Must not be called from a callback.
  Result<Response> Send(Request request);

  // Reactor threads start with the client; Run() blocks until Stop()
  void Run();
  void RunOnce();
  void Stop();
  bool IsRunning() const;

  // Waits until every reactor has processed the work queued before the call
  void Barrier();

  ClientStats GetStats() const;

  const ClientConfig& config() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace guise

#endif  // GUISE_CLIENT_H_
