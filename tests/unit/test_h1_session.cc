// Copyright 2026 Guise Authors
// SPDX-License-Identifier: MIT

#include "guise/http1/h1_session.h"

#include <cassert>
#include <print>
#include <string>

using namespace guise;
using namespace guise::http1;

namespace {

struct Exchange {
  int status = 0;
  Headers headers;
  std::string body;
  bool closed = false;
  uint32_t error_code = 0;

  http2::H2StreamCallbacks Callbacks() {
    http2::H2StreamCallbacks cb;
    cb.on_headers = [this](int32_t, int s, const Headers& h) {
      status = s;
      headers = h;
    };
    cb.on_data = [this](int32_t, const uint8_t* data, size_t len) {
      body.append(reinterpret_cast<const char*>(data), len);
    };
    cb.on_close = [this](int32_t, uint32_t code) {
      closed = true;
      error_code = code;
    };
    return cb;
  }
};

http2::H2Request Get(std::string path = "/") {
  http2::H2Request req;
  req.method = "GET";
  req.authority = "example.com";
  req.path = std::move(path);
  req.headers = {{"user-agent", "BrowserX/1.0"}, {"accept-language", "en"}};
  return req;
}

std::string Sent(H1Session& session) {
  auto [data, len] = session.GetPendingData();
  std::string out(reinterpret_cast<const char*>(data), len);
  session.DataSent(len);
  return out;
}

ssize_t Feed(H1Session& session, std::string_view text) {
  return session.Receive(reinterpret_cast<const uint8_t*>(text.data()),
                         text.size());
}

}  // namespace

void TestRequestSerialization() {
  std::print("Testing request serialization... ");

  H1Session titled({}, true);
  Exchange ex;
  assert(titled.SubmitRequest(Get("/a?b=1"), ex.Callbacks()) == 1);
  assert(titled.WantsWrite());
  assert(Sent(titled) ==
         "GET /a?b=1 HTTP/1.1\r\n"
         "Host: example.com\r\n"
         "User-Agent: BrowserX/1.0\r\n"
         "Accept-Language: en\r\n"
         "Connection: keep-alive\r\n"
         "\r\n");
  assert(!titled.WantsWrite());

  H1Session lower({}, false);
  Exchange ex2;
  http2::H2Request post = Get("/submit");
  post.method = "POST";
  post.headers.push_back({"content-length", "999"});
  post.headers.push_back({"transfer-encoding", "chunked"});
  post.headers.push_back({"connection", "close"});
  post.body = "hello";
  lower.SubmitRequest(post, ex2.Callbacks());
  assert(Sent(lower) ==
         "POST /submit HTTP/1.1\r\n"
         "host: example.com\r\n"
         "user-agent: BrowserX/1.0\r\n"
         "accept-language: en\r\n"
         "content-length: 5\r\n"
         "connection: close\r\n"
         "\r\n"
         "hello");

  assert(H1Session::TitleCase("sec-ch-ua-MOBILE") == "Sec-Ch-Ua-Mobile");

  std::println("PASSED");
}

void TestContentLengthResponse() {
  std::print("Testing Content-Length response... ");

  H1Session session({}, true);
  Exchange ex;
  session.SubmitRequest(Get(), ex.Callbacks());
  Sent(session);
  assert(!session.CanSubmitRequest());
  assert(session.InFlight());

  assert(Feed(session, "HTTP/1.1 100 Continue\r\n\r\nHTTP/1.1 200 OK\r\n"
                       "Content-Length: 10\r\nServer: t\r\n\r\nhello") > 0);
  assert(ex.status == 200);
  assert(FindHeader(ex.headers, "server") == "t");
  assert(!ex.closed);
  Feed(session, "world");
  assert(ex.closed);
  assert(ex.error_code == 0);
  assert(ex.body == "helloworld");

  // Kept alive: the next request goes on the same session
  assert(session.KeepAlive());
  assert(session.CanSubmitRequest());
  Exchange next;
  assert(session.SubmitRequest(Get("/2"), next.Callbacks()) == 2);

  std::println("PASSED");
}

void TestChunkedResponse() {
  std::print("Testing chunked response... ");

  H1Session session({}, true);
  Exchange ex;
  session.SubmitRequest(Get(), ex.Callbacks());
  Sent(session);

  Feed(session, "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWi");
  assert(!ex.closed);
  Feed(session, "ki\r\n5\r\npedia\r\n0\r\n\r\n");
  assert(ex.closed);
  assert(ex.error_code == 0);
  assert(ex.body == "Wikipedia");
  assert(session.CanSubmitRequest());

  std::println("PASSED");
}

void TestBodylessResponses() {
  std::print("Testing responses without a body... ");

  H1Session session({}, true);
  Exchange head;
  http2::H2Request req = Get();
  req.method = "HEAD";
  session.SubmitRequest(req, head.Callbacks());
  Sent(session);
  Feed(session, "HTTP/1.1 200 OK\r\nContent-Length: 500\r\n\r\n");
  assert(head.closed);
  assert(head.body.empty());

  Exchange no_content;
  session.SubmitRequest(Get(), no_content.Callbacks());
  Sent(session);
  Feed(session, "HTTP/1.1 204 No Content\r\n\r\n");
  assert(no_content.closed);
  assert(no_content.status == 204);
  assert(session.CanSubmitRequest());

  std::println("PASSED");
}

void TestReadUntilClose() {
  std::print("Testing body framed by EOF... ");

  H1Session session({}, true);
  Exchange ex;
  session.SubmitRequest(Get(), ex.Callbacks());
  Sent(session);

  Feed(session, "HTTP/1.0 200 OK\r\n\r\npartial ");
  Feed(session, "body");
  assert(!ex.closed);
  assert(!session.KeepAlive());

  session.OnPeerClosed();
  assert(ex.closed);
  assert(ex.error_code == 0);
  assert(ex.body == "partial body");
  assert(!session.CanSubmitRequest());

  std::println("PASSED");
}

void TestConnectionClose() {
  std::print("Testing Connection: close... ");

  H1Session session({}, true);
  Exchange ex;
  session.SubmitRequest(Get(), ex.Callbacks());
  Sent(session);
  Feed(session,
       "HTTP/1.1 200 OK\r\nConnection: close\r\nContent-Length: 0\r\n\r\n");
  assert(ex.closed);
  assert(!session.KeepAlive());
  assert(!session.CanSubmitRequest());

  Exchange rejected;
  assert(session.SubmitRequest(Get(), rejected.Callbacks()) == -1);

  std::println("PASSED");
}

void TestErrors() {
  std::print("Testing malformed and truncated responses... ");

  std::string reported;
  H1Session::SessionCallbacks callbacks;
  callbacks.on_error = [&reported](int, const std::string& msg) {
    reported = msg;
  };
  H1Session session(callbacks, true);
  Exchange ex;
  session.SubmitRequest(Get(), ex.Callbacks());
  Sent(session);
  assert(Feed(session, "NOT HTTP AT ALL\r\n\r\n") == -1);
  assert(ex.closed);
  assert(ex.error_code == kCloseMalformed);
  assert(!session.IsAlive());
  assert(!reported.empty());

  H1Session truncated({}, true);
  Exchange cut;
  truncated.SubmitRequest(Get(), cut.Callbacks());
  Sent(truncated);
  Feed(truncated, "HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\nshort");
  truncated.OnPeerClosed(7);
  assert(cut.closed);
  assert(cut.error_code == 7);

  H1Session aborted({}, true);
  Exchange ab;
  aborted.SubmitRequest(Get(), ab.Callbacks());
  aborted.Abort(kCloseCancelled);
  assert(ab.closed);
  assert(ab.error_code == kCloseCancelled);
  assert(!aborted.KeepAlive());
  assert(!aborted.CanSubmitRequest());

  std::println("PASSED");
}

void TestStrayBytesPoisonIdleSession() {
  std::print("Testing stray bytes on an idle session... ");

  H1Session session({}, true);
  assert(Feed(session, "HTTP/1.1 408 Request Timeout\r\n\r\n") > 0);
  assert(!session.KeepAlive());
  assert(!session.CanSubmitRequest());

  std::println("PASSED");
}

int main() {
  std::println("=== H1Session Unit Tests ===\n");

  TestRequestSerialization();
  TestContentLengthResponse();
  TestChunkedResponse();
  TestBodylessResponses();
  TestReadUntilClose();
  TestConnectionClose();
  TestErrors();
  TestStrayBytesPoisonIdleSession();

  std::println("\nAll H1Session tests passed!");
  return 0;
}
