// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#ifndef GUISE_ASYNC_H_
#define GUISE_ASYNC_H_

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "guise/client.h"
#include "guise/error.h"
#include "guise/task.h"

namespace guise {

// Coroutine front end for HttpClient
//
// Usage:
//   AsyncClient client;
//
//   Task<void> Rotate(AsyncClient& c) {
//     for (const auto& proxy : proxies) {
//       auto result = co_await c.Send(
//           Request{}.SetUrl("https://example.com/").SetProxy(proxy));
//       if (!result) {
//         std::println("{}", result.error().ToString());
//       }
//     }
//   }
//
//   RunAsync(client, Rotate(client));
//
class AsyncClient {
 public:
  explicit AsyncClient(const ClientConfig& config = ClientConfig::Default())
      : client_(std::make_shared<HttpClient>(config)) {}

  // Construct from existing HttpClient (takes ownership)
  explicit AsyncClient(std::unique_ptr<HttpClient> client)
      : client_(std::move(client)) {}

  // Awaitable yielding Result<Response>. Resumes on the RunAsync thread.
  CallbackAwaitable<Response> Send(Request request) {
    return CallbackAwaitable<Response>(
        [client = client_, request = std::move(request)](
            CallbackAwaitable<Response>::Callback done) mutable {
          client->SendAsync(std::move(request),
                            [done = std::move(done)](Response response,
                                                     Error error) {
                              if (error) {
                                done(Result<Response>(std::move(error)));
                              } else {
                                done(Result<Response>(std::move(response)));
                              }
                            });
        },
        queue_.get());
  }

  CallbackAwaitable<Response> Get(std::string url) {
    Request req;
    req.method = Method::kGet;
    req.url = std::move(url);
    return Send(std::move(req));
  }

  CallbackAwaitable<Response> Post(std::string url, std::string_view body) {
    Request req;
    req.method = Method::kPost;
    req.url = std::move(url);
    req.SetBody(body);
    return Send(std::move(req));
  }

  CallbackAwaitable<Response> Head(std::string url) {
    Request req;
    req.method = Method::kHead;
    req.url = std::move(url);
    return Send(std::move(req));
  }

  ClientStats GetStats() const { return client_->GetStats(); }

  // Access underlying client
  HttpClient& client() { return *client_; }
  const HttpClient& client() const { return *client_; }

  ResumeQueue& queue() { return *queue_; }

 private:
  std::shared_ptr<HttpClient> client_;
  std::unique_ptr<ResumeQueue> queue_ = std::make_unique<ResumeQueue>();
};

// Runs `task` on the calling thread until it finishes and returns its
// result. Awaited requests resume here, not on reactor threads.
template <typename T>
T RunAsync(AsyncClient& client, Task<T> task) {
  task.Start();
  client.queue().Drain([&task] { return task.done(); });
  return task.result();
}

}  // namespace guise

#endif  // GUISE_ASYNC_H_
