// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/client.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "guise/core/connection.h"
#include "guise/core/reactor_manager.h"
#include "guise/http/default_headers.h"
#include "guise/pool/connection_pool.h"
#include "guise/profile/profile_registry.h"
#include "guise/util/content_decoder.h"
#include "guise/util/logger.h"
#include "guise/util/url_parser.h"

namespace guise {

// ClientConfig factory methods
ClientConfig ClientConfig::Default() { return ClientConfig{}; }

ClientConfig ClientConfig::ForProfile(std::string profile_id) {
  ClientConfig config;
  config.profile = std::move(profile_id);
  return config;
}

std::string_view MethodToString(Method method) {
  switch (method) {
    case Method::kGet:
      return "GET";
    case Method::kPost:
      return "POST";
    case Method::kPut:
      return "PUT";
    case Method::kDelete:
      return "DELETE";
    case Method::kPatch:
      return "PATCH";
    case Method::kHead:
      return "HEAD";
    case Method::kOptions:
      return "OPTIONS";
  }
  return "GET";
}

// Request implementation
Request& Request::SetMethod(Method m) {
  method = m;
  return *this;
}

Request& Request::SetUrl(std::string_view u) {
  url = std::string(u);
  return *this;
}

Request& Request::SetHeader(std::string_view name, std::string_view value) {
  headers.push_back({std::string(name), std::string(value)});
  return *this;
}

Request& Request::SetBody(const uint8_t* data, size_t len) {
  body.assign(data, data + len);
  return *this;
}

Request& Request::SetBody(std::string_view b) {
  body.assign(b.begin(), b.end());
  return *this;
}

Request& Request::SetTimeout(std::chrono::milliseconds t) {
  timeout = t;
  return *this;
}

Request& Request::SetProfile(std::string_view id) {
  profile = std::string(id);
  return *this;
}

Request& Request::SetProxy(pool::ProxyDescriptor p) {
  proxy = std::move(p);
  no_proxy = false;
  return *this;
}

Request& Request::SetNoProxy() {
  proxy.reset();
  no_proxy = true;
  return *this;
}

Request& Request::SetBindAddress(std::string_view address) {
  if (!local_path) local_path.emplace();
  local_path->bind_address = std::string(address);
  return *this;
}

Request& Request::SetInterface(std::string_view name) {
  if (!local_path) local_path.emplace();
  local_path->interface_name = std::string(name);
  return *this;
}

Request& Request::SetHeaderOrder(std::vector<std::string> order) {
  header_order = std::move(order);
  return *this;
}

// Response implementation
std::string_view Response::GetHeader(std::string_view name) const {
  return FindHeader(headers, name);
}

bool Response::HasHeader(std::string_view name) const {
  return std::any_of(headers.begin(), headers.end(), [name](const Header& h) {
    return EqualsIgnoreCase(h.name, name);
  });
}

std::string_view Response::body_string() const {
  return std::string_view(reinterpret_cast<const char*>(body.data()),
                          body.size());
}

// One request, owned by the reactor its identity key hashes to
struct InFlight {
  RequestId id = 0;
  core::ReactorContext* ctx = nullptr;

  pool::IdentityKey key;
  const profile::ImpersonationProfile* profile = nullptr;
  http2::H2Request wire;
  std::chrono::milliseconds timeout{0};
  ResponseCallback callback;

  pool::AcquireTicket ticket = 0;
  pool::ConnectionPtr conn;  // lent while the stream is open
  int32_t stream_id = -1;
  core::TimerId timer = 0;

  Response response;
};

// HttpClient implementation
class HttpClient::Impl {
 public:
  Impl(const ClientConfig& config,
       std::shared_ptr<const profile::ProfileRegistry> registry)
      : config_(config),
        registry_(std::move(registry)),
        reactor_manager_(MakeReactorConfig(config)) {
    logger::Init(config.log_level);

    inflight_.resize(reactor_manager_.NumReactors());
    if (!reactor_manager_.Initialize(config_, registry_.get())) {
      last_error_ = std::string(reactor_manager_.last_error());
      return;
    }
    reactor_manager_.Start();
    initialized_ = true;
    SPDLOG_INFO("guise client started: profile={} reactors={}",
                config_.profile, reactor_manager_.NumReactors());
  }

  ~Impl() {
    Stop();
    reactor_manager_.Stop();
    // Reactor threads are joined; lent connections go before their loops
    for (auto& requests : inflight_) {
      requests.clear();
    }
  }

  bool IsInitialized() const { return initialized_; }
  std::string_view last_error() const { return last_error_; }

  RequestId SendAsync(Request request, ResponseCallback callback) {
    if (!initialized_) {
      Fail(callback, Error::Internal("client not initialized: " + last_error_));
      return 0;
    }

    util::ParsedUrl parsed;
    if (!util::ParseUrl(request.url, &parsed)) {
      Fail(callback, Error::InvalidUrl("failed to parse URL: " + request.url));
      return 0;
    }
    if (!parsed.IsHttps()) {
      Fail(callback, Error::InvalidUrl("only https is supported"));
      return 0;
    }

    std::string profile_id = request.profile.value_or(config_.profile);
    auto profile = registry_->Lookup(profile_id);
    if (!profile) {
      Fail(callback, profile.error());
      return 0;
    }

    std::optional<pool::ProxyDescriptor> proxy =
        request.no_proxy ? std::nullopt
                         : (request.proxy ? request.proxy : config_.proxy);
    std::optional<pool::LocalPath> local_path =
        request.local_path ? request.local_path : config_.local_path;

    auto req = std::make_unique<InFlight>();
    req->id = next_id_.fetch_add(1, std::memory_order_relaxed);
    req->key = pool::MakeIdentityKey(parsed.host, parsed.port, std::move(proxy),
                                     std::move(local_path), profile_id);
    req->profile = profile.value();
    req->timeout = request.timeout.count() > 0 ? request.timeout
                                               : config_.default_timeout;
    req->callback = std::move(callback);
    req->wire = BuildWireRequest(request, parsed, *req->profile);

    core::ReactorContext* ctx = reactor_manager_.GetReactorForKey(req->key);
    req->ctx = ctx;

    const RequestId id = req->id;
    {
      std::lock_guard<std::mutex> lock(owners_mutex_);
      owners_[id] = ctx->index;
    }

    reactor_manager_.Post(ctx->index, [this, req = std::move(req)]() mutable {
      Start(std::move(req));
    });
    return id;
  }

  void Cancel(RequestId id) {
    size_t index = 0;
    {
      std::lock_guard<std::mutex> lock(owners_mutex_);
      auto it = owners_.find(id);
      if (it == owners_.end()) {
        return;
      }
      index = it->second;
    }
    reactor_manager_.Post(index, [this, index, id] {
      Complete(index, id, Error::Cancelled());
    });
  }

  Result<Response> Send(Request request) {
    auto promise = std::make_shared<std::promise<Result<Response>>>();
    auto future = promise->get_future();
    SendAsync(std::move(request), [promise](Response response, Error error) {
      if (error) {
        promise->set_value(Result<Response>(std::move(error)));
      } else {
        promise->set_value(Result<Response>(std::move(response)));
      }
    });
    return future.get();
  }

  void Run() {
    std::unique_lock<std::mutex> lock(run_mutex_);
    running_.store(true, std::memory_order_release);
    // Reactor threads do the work; the caller just waits for Stop()
    run_cv_.wait(lock, [this] {
      return !running_.load(std::memory_order_acquire);
    });
  }

  void RunOnce() {
    // Background threads handle the work; yield to let them run
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  void Stop() {
    {
      std::lock_guard<std::mutex> lock(run_mutex_);
      running_.store(false, std::memory_order_release);
    }
    run_cv_.notify_all();
  }

  bool IsRunning() const { return running_.load(std::memory_order_acquire); }

  void Barrier() { reactor_manager_.Barrier(); }

  ClientStats GetStats() const {
    pool::PoolStats pool = reactor_manager_.TotalStats();
    ClientStats stats;
    stats.live_connections = pool.live;
    stats.idle_connections = pool.idle;
    stats.dialing = pool.dialing;
    stats.waiting = pool.waiting;
    stats.connections_dialed = pool.dialed;
    stats.connections_reused = pool.reused;
    stats.connections_evicted = pool.evicted;
    stats.dials_failed = pool.dials_failed;
    stats.requests_sent = requests_sent_.load(std::memory_order_relaxed);
    stats.requests_completed =
        requests_completed_.load(std::memory_order_relaxed);
    stats.requests_failed = requests_failed_.load(std::memory_order_relaxed);
    return stats;
  }

  const ClientConfig& config() const { return config_; }

 private:
  using RequestMap = std::unordered_map<RequestId, std::unique_ptr<InFlight>>;

  static core::ReactorManagerConfig MakeReactorConfig(
      const ClientConfig& config) {
    core::ReactorManagerConfig rc;
    rc.num_reactors = config.threads.num_workers;
    rc.pin_to_cores = config.threads.pin_to_cores;
    return rc;
  }

  void Fail(const ResponseCallback& callback, Error error) {
    requests_failed_.fetch_add(1, std::memory_order_relaxed);
    if (callback) {
      callback(Response{}, std::move(error));
    }
  }

  http2::H2Request BuildWireRequest(const Request& request,
                                    const util::ParsedUrl& parsed,
                                    const profile::ImpersonationProfile& p) {
    http::headers::MergeOptions options;
    options.apply_profile_headers =
        config_.apply_profile_headers && !request.skip_profile_headers;
    options.header_order = request.header_order;
    options.body_size = request.body.size();

    http2::H2Request wire;
    wire.method = std::string(MethodToString(request.method));
    wire.authority = parsed.Authority();
    wire.path = parsed.PathWithQuery();
    wire.headers = http::headers::Merge(p.headers, request.headers, options);
    wire.body.assign(request.body.begin(), request.body.end());
    return wire;
  }

  InFlight* Find(size_t index, RequestId id) {
    auto& requests = inflight_[index];
    auto it = requests.find(id);
    return it == requests.end() ? nullptr : it->second.get();
  }

  // Runs on the owning reactor
  void Start(std::unique_ptr<InFlight> owned) {
    core::ReactorContext* ctx = owned->ctx;
    const size_t index = ctx->index;
    const RequestId id = owned->id;
    InFlight* req = owned.get();
    inflight_[index].emplace(id, std::move(owned));

    req->timer = ctx->reactor->AddTimer(
        static_cast<uint64_t>(req->timeout.count()), 0,
        [this, index, id] { OnTimeout(index, id); });

    SPDLOG_DEBUG("request {}: {} {}{} via {}", id, req->wire.method,
                 req->wire.authority, req->wire.path, req->key.ToString());

    auto wait_budget = std::min(req->timeout, config_.pool.acquire_timeout);
    pool::AcquireTicket ticket = ctx->connection_pool->Acquire(
        req->key,
        [this, index, id](Result<pool::ConnectionPtr> result) {
          OnAcquired(index, id, std::move(result));
        },
        wait_budget);

    // The callback may already have run and finished the request
    if (InFlight* still = Find(index, id); still != nullptr && !still->conn) {
      still->ticket = ticket;
    }
  }

  void OnAcquired(size_t index, RequestId id,
                  Result<pool::ConnectionPtr> result) {
    InFlight* req = Find(index, id);
    auto* pool = reactor_manager_.GetReactor(index)->connection_pool.get();
    if (req == nullptr) {
      if (result) {
        pool->Release(std::move(result).value());
      }
      return;
    }
    req->ticket = 0;

    if (!result) {
      Complete(index, id, result.error());
      return;
    }

    pool::ConnectionPtr conn = std::move(result).value();
    auto* connection = dynamic_cast<core::Connection*>(conn->transport.get());
    if (connection == nullptr) {
      pool->Release(std::move(conn));
      Complete(index, id, Error::Internal("pool lent a foreign transport"));
      return;
    }

    req->response.alpn = std::string(connection->alpn());
    req->response.connection_reused = conn->reuse_count > 0;

    http2::H2StreamCallbacks callbacks;
    callbacks.on_headers = [this, index, id](int32_t, int status,
                                             const Headers& headers) {
      if (InFlight* r = Find(index, id)) {
        r->response.status_code = status;
        r->response.headers = headers;
      }
    };
    callbacks.on_data = [this, index, id](int32_t, const uint8_t* data,
                                          size_t len) {
      if (InFlight* r = Find(index, id)) {
        r->response.body.insert(r->response.body.end(), data, data + len);
      }
    };
    callbacks.on_close = [this, index, id, connection](int32_t,
                                                       uint32_t error_code) {
      // Mapped now, finished later: the connection is still on the stack
      Error error = connection->StreamError(error_code);
      reactor_manager_.Post(index, [this, index, id, error] {
        OnStreamClosed(index, id, error);
      });
    };

    int32_t stream_id = connection->SendRequest(req->wire, std::move(callbacks));
    if (stream_id < 0) {
      conn->MarkBroken();
      pool->Release(std::move(conn));
      Complete(index, id, Error::Broken("connection cannot take a request"));
      return;
    }

    ++conn->in_flight_streams;
    req->conn = std::move(conn);
    req->stream_id = stream_id;
    requests_sent_.fetch_add(1, std::memory_order_relaxed);
  }

  void OnStreamClosed(size_t index, RequestId id, Error error) {
    InFlight* req = Find(index, id);
    if (req == nullptr || !req->conn) {
      return;
    }
    auto* pool = reactor_manager_.GetReactor(index)->connection_pool.get();

    pool::ConnectionPtr conn = std::move(req->conn);
    --conn->in_flight_streams;
    if (error.code() == ErrorCode::kConnectionBroken) {
      conn->MarkBroken();
    }
    pool->Release(std::move(conn));

    if (!error) {
      std::string decode_error;
      std::string_view encoding = req->response.GetHeader("content-encoding");
      if (!util::DecodeBody(encoding, &req->response.body, &decode_error)) {
        error = Error::Internal("content decoding failed: " + decode_error);
      }
    }
    Complete(index, id, std::move(error));
  }

  void OnTimeout(size_t index, RequestId id) {
    if (InFlight* req = Find(index, id)) {
      req->timer = 0;
      Complete(index, id, Error::Timeout());
    }
  }

  // Removes the request and invokes its callback. A queued acquire leaves
  // the pool queue; an open stream is cancelled and its connection
  // released.
  void Complete(size_t index, RequestId id, Error error) {
    auto& requests = inflight_[index];
    auto it = requests.find(id);
    if (it == requests.end()) {
      return;
    }
    std::unique_ptr<InFlight> req = std::move(it->second);
    requests.erase(it);

    {
      std::lock_guard<std::mutex> lock(owners_mutex_);
      owners_.erase(id);
    }

    core::ReactorContext* ctx = req->ctx;
    if (req->timer != 0) {
      ctx->reactor->CancelTimer(req->timer);
    }
    if (req->ticket != 0) {
      ctx->connection_pool->Cancel(req->ticket);
    }
    if (req->conn) {
      auto* connection =
          static_cast<core::Connection*>(req->conn->transport.get());
      connection->CancelStream(req->stream_id);
      --req->conn->in_flight_streams;
      ctx->connection_pool->Release(std::move(req->conn));
    }

    if (error) {
      SPDLOG_DEBUG("request {} failed: {}", id, error.ToString());
      requests_failed_.fetch_add(1, std::memory_order_relaxed);
      if (req->callback) {
        req->callback(Response{}, std::move(error));
      }
      return;
    }

    requests_completed_.fetch_add(1, std::memory_order_relaxed);
    if (req->callback) {
      req->callback(std::move(req->response), Error{});
    }
  }

  ClientConfig config_;
  std::shared_ptr<const profile::ProfileRegistry> registry_;

  core::ReactorManager reactor_manager_;

  // Index i is only touched from reactor i. Declared after the manager so
  // lent connections close while their reactors still exist.
  std::vector<RequestMap> inflight_;

  bool initialized_ = false;
  std::string last_error_;

  std::mutex owners_mutex_;
  std::unordered_map<RequestId, size_t> owners_;
  std::atomic<RequestId> next_id_{1};

  std::mutex run_mutex_;
  std::condition_variable run_cv_;
  std::atomic<bool> running_{false};

  // Statistics
  std::atomic<size_t> requests_sent_{0};
  std::atomic<size_t> requests_completed_{0};
  std::atomic<size_t> requests_failed_{0};
};

namespace {

// The built-in registry is process-wide; share it without owning it
std::shared_ptr<const profile::ProfileRegistry> BuiltinRegistry() {
  return std::shared_ptr<const profile::ProfileRegistry>(
      std::shared_ptr<void>(), &profile::ProfileRegistry::Builtin());
}

}  // namespace

HttpClient::HttpClient(const ClientConfig& config)
    : impl_(std::make_unique<Impl>(config, BuiltinRegistry())) {}

HttpClient::HttpClient(const ClientConfig& config,
                       std::shared_ptr<const profile::ProfileRegistry> registry)
    : impl_(std::make_unique<Impl>(config, std::move(registry))) {}

HttpClient::~HttpClient() = default;

bool HttpClient::IsInitialized() const { return impl_->IsInitialized(); }

std::string_view HttpClient::last_error() const { return impl_->last_error(); }

RequestId HttpClient::SendAsync(Request request, ResponseCallback callback) {
  return impl_->SendAsync(std::move(request), std::move(callback));
}

void HttpClient::Cancel(RequestId id) { impl_->Cancel(id); }

Result<Response> HttpClient::Send(Request request) {
  return impl_->Send(std::move(request));
}

void HttpClient::Run() { impl_->Run(); }

void HttpClient::RunOnce() { impl_->RunOnce(); }

void HttpClient::Stop() { impl_->Stop(); }

bool HttpClient::IsRunning() const { return impl_->IsRunning(); }

void HttpClient::Barrier() { impl_->Barrier(); }

ClientStats HttpClient::GetStats() const { return impl_->GetStats(); }

const ClientConfig& HttpClient::config() const { return impl_->config(); }

}  // namespace guise
